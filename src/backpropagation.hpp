#ifndef BACKPROPAGATION_HPP
#define BACKPROPAGATION_HPP

#include "network.hpp"

#include <Eigen/Core>

// Online gradient descent with classic momentum. The reward scales the output
// error: 1 is plain backpropagation, 0 leaves the network unchanged apart from
// the momentum carried over, a negative reward reverses every update.
struct Backpropagation
{
    double learning_rate {0.1};
    double momentum {0.0};
    // Scales the learning rate by g / (g + adaptive_softness), g being the
    // norm of the output gradients. The effective rate stays below
    // learning_rate and grows with the error. adaptive_softness must be
    // strictly positive.
    bool use_adaptive_learning_rate {false};
    double adaptive_softness {0.05};

    // Forward pass followed by backpropagate()
    void train(Network &network,
               const Eigen::VectorXd &input_values,
               double reward,
               const Eigen::VectorXd &expected_output_values) const;

    void train(Network &network,
               const Eigen::VectorXd &input_values,
               const Eigen::VectorXd &expected_output_values) const;

    // Assumes the network has just been fired with the matching inputs
    void backpropagate(Network &network,
                       double reward,
                       const Eigen::VectorXd &expected_output_values) const;

    void backpropagate(Network &network,
                       const Eigen::VectorXd &expected_output_values) const;

    [[nodiscard]] double
    effective_learning_rate(const Network &network) const;
};

#endif // BACKPROPAGATION_HPP
