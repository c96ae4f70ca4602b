#ifndef TRAINER_HPP
#define TRAINER_HPP

#include "backpropagation.hpp"
#include "network.hpp"
#include "training_data.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <map>
#include <utility>

// Drives a training algorithm until the outputs are within a tolerance of
// their targets. Algorithm must provide
// train(Network &, const Eigen::VectorXd &, double, const Eigen::VectorXd &).
// Examples are kept in a std::map, retrain() sweeps them in key order.
template <typename Key, typename Algorithm = Backpropagation>
class Trainer
{
public:
    explicit Trainer(Algorithm algorithm,
                     std::map<Key, TrainingData> examples = {})
        : m_algorithm {std::move(algorithm)}, m_examples {std::move(examples)}
    {
    }

    void add_or_update(const Key &key, TrainingData example)
    {
        m_examples.insert_or_assign(key, std::move(example));
    }

    [[nodiscard]] const std::map<Key, TrainingData> &examples() const noexcept
    {
        return m_examples;
    }

    [[nodiscard]] Algorithm &algorithm() noexcept
    {
        return m_algorithm;
    }

    // Trains on a single example until its largest output error is within
    // tolerance. The error is measured on the forward pass of each step.
    [[nodiscard]] bool train(Network &network,
                             double tolerance,
                             int max_iterations,
                             const TrainingData &example)
    {
        for (int i {0}; i < max_iterations; ++i)
        {
            if (train_step(network, example) <= tolerance)
            {
                return true;
            }
        }
        return false;
    }

    // Sweeps every stored example until a complete sweep has its worst
    // error within tolerance. max_iterations bounds the total number of
    // training steps across all examples, so the last sweep may stop early;
    // an incomplete sweep never counts as converged.
    [[nodiscard]] bool
    retrain(Network &network, double tolerance, int max_iterations)
    {
        if (m_examples.empty())
        {
            return true;
        }

        int iteration {0};
        while (iteration < max_iterations)
        {
            double max_error {0.0};
            bool complete {true};
            for (const auto &[key, example] : m_examples)
            {
                if (iteration >= max_iterations)
                {
                    complete = false;
                    break;
                }
                max_error = std::max(max_error, train_step(network, example));
                ++iteration;
            }

            if (complete && max_error <= tolerance)
            {
                return true;
            }
        }
        return false;
    }

    // Trains on a single example, asking done(network) after every step.
    // The predicate is never consulted before the first step.
    template <typename Predicate>
    [[nodiscard]] bool train_until(Network &network,
                                   int max_iterations,
                                   const TrainingData &example,
                                   Predicate &&done)
    {
        for (int i {0}; i < max_iterations; ++i)
        {
            m_algorithm.train(network,
                              example.inputs,
                              example.reward.value_or(1.0),
                              example.outputs);
            if (done(static_cast<const Network &>(network)))
            {
                return true;
            }
        }
        return false;
    }

private:
    // Returns the largest absolute output error of the forward pass
    double train_step(Network &network, const TrainingData &example)
    {
        m_algorithm.train(network,
                          example.inputs,
                          example.reward.value_or(1.0),
                          example.outputs);
        return (network_outputs(network) - example.outputs)
            .cwiseAbs()
            .maxCoeff();
    }

    Algorithm m_algorithm;
    std::map<Key, TrainingData> m_examples;
};

#endif // TRAINER_HPP
