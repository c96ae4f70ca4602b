#include "trainer.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

[[nodiscard]] TrainingData make_example(std::vector<double> inputs,
                                        std::vector<double> outputs,
                                        std::optional<double> reward = {})
{
    return {.inputs = Eigen::Map<const Eigen::VectorXd>(
                inputs.data(), static_cast<Eigen::Index>(inputs.size())),
            .outputs = Eigen::Map<const Eigen::VectorXd>(
                outputs.data(), static_cast<Eigen::Index>(outputs.size())),
            .reward = reward};
}

[[nodiscard]] Network build_seeded(int input_count,
                                   int output_count,
                                   const std::vector<int> &hidden_layer_counts,
                                   unsigned int seed)
{
    auto initializer = make_weight_initializer(WeightInit::xavier_normal, seed);
    return network_build(input_count,
                         output_count,
                         hidden_layer_counts,
                         Activation::hyperbolic_tangent,
                         Activation::sigmoid,
                         initializer);
}

// Records every call instead of training. The network is left untouched so
// its outputs stay at zero.
struct CountingAlgorithm
{
    int calls {0};
    std::vector<double> rewards;

    void train(Network &,
               const Eigen::VectorXd &,
               double reward,
               const Eigen::VectorXd &)
    {
        ++calls;
        rewards.push_back(reward);
    }
};

} // namespace

TEST(Trainer, LearnsXor)
{
    auto network = build_seeded(2, 1, {3}, 1);
    Trainer<std::pair<double, double>> trainer(
        Backpropagation {.learning_rate = 0.2, .momentum = 0.1});

    for (const auto a : {0.0, 1.0})
    {
        for (const auto b : {0.0, 1.0})
        {
            trainer.add_or_update({a, b},
                                  make_example({a, b}, {a != b ? 1.0 : 0.0}));
        }
    }

    // A zero tolerance is never met, so the whole budget is spent
    EXPECT_FALSE(trainer.retrain(network, 0.0, 10000));

    for (const auto &[key, example] : trainer.examples())
    {
        network_fire(network, example.inputs);
        const auto output = network_outputs(network)(0);
        EXPECT_EQ(std::round(output), example.outputs(0))
            << "for " << key.first << " xor " << key.second;
        EXPECT_NEAR(output, example.outputs(0), 0.1);
    }
}

TEST(Trainer, TrainReachesTolerance)
{
    auto network = build_seeded(1, 1, {2}, 4);
    Trainer<int> trainer(Backpropagation {.learning_rate = 0.5,
                                          .momentum = 0.0});
    const auto example = make_example({0.3}, {0.7});

    EXPECT_TRUE(trainer.train(network, 0.01, 20000, example));

    network_fire(network, example.inputs);
    EXPECT_NEAR(network_outputs(network)(0), 0.7, 0.02);
}

TEST(Trainer, TrainGivesUpWhenBudgetIsSpent)
{
    auto network = build_seeded(1, 1, {2}, 4);
    Trainer<int> trainer(Backpropagation {});

    EXPECT_FALSE(trainer.train(network, 0.0, 3, make_example({0.3}, {0.7})));
}

TEST(Trainer, TrainUntilStopsOnFirstSatisfiedCheck)
{
    auto network = build_seeded(2, 1, {}, 2);
    Trainer<int> trainer(Backpropagation {});
    const auto example = make_example({1.0, 0.0}, {1.0});

    int checks {0};
    EXPECT_TRUE(trainer.train_until(network,
                                    100,
                                    example,
                                    [&checks](const Network &)
                                    {
                                        ++checks;
                                        return true;
                                    }));
    EXPECT_EQ(checks, 1);
}

TEST(Trainer, TrainUntilChecksAfterEveryStep)
{
    auto network = build_seeded(2, 1, {}, 2);
    Trainer<int> trainer(Backpropagation {});
    const auto example = make_example({1.0, 0.0}, {1.0});

    int checks {0};
    EXPECT_FALSE(trainer.train_until(network,
                                     25,
                                     example,
                                     [&checks](const Network &)
                                     {
                                         ++checks;
                                         return false;
                                     }));
    EXPECT_EQ(checks, 25);

    checks = 0;
    EXPECT_TRUE(trainer.train_until(network,
                                    25,
                                    example,
                                    [&checks](const Network &)
                                    { return ++checks == 5; }));
    EXPECT_EQ(checks, 5);
}

TEST(Trainer, TrainUntilSeesTrainedNetwork)
{
    auto network = build_seeded(1, 1, {}, 2);
    Trainer<int> trainer(Backpropagation {.learning_rate = 1.0,
                                          .momentum = 0.0});
    const auto example = make_example({1.0}, {0.9});

    EXPECT_TRUE(trainer.train_until(
        network,
        10000,
        example,
        [](const Network &trained)
        { return std::abs(network_outputs(trained)(0) - 0.9) < 0.01; }));
}

TEST(Trainer, RetrainSharesOneBudgetAcrossExamples)
{
    auto network = build_seeded(1, 1, {}, 2);
    Trainer<int, CountingAlgorithm> trainer(CountingAlgorithm {});
    trainer.add_or_update(0, make_example({0.1}, {0.5}));
    trainer.add_or_update(1, make_example({0.2}, {0.5}));
    trainer.add_or_update(2, make_example({0.3}, {0.5}));

    EXPECT_FALSE(trainer.retrain(network, -1.0, 7));
    EXPECT_EQ(trainer.algorithm().calls, 7);
}

TEST(Trainer, RetrainStopsAfterConvergedSweep)
{
    auto network = build_seeded(1, 1, {}, 2);
    Trainer<int, CountingAlgorithm> trainer(CountingAlgorithm {});
    trainer.add_or_update(0, make_example({0.1}, {0.5}));
    trainer.add_or_update(1, make_example({0.2}, {0.5}));
    trainer.add_or_update(2, make_example({0.3}, {0.5}));

    // The outputs stay at zero, every error is 0.5
    EXPECT_TRUE(trainer.retrain(network, 0.5, 100));
    EXPECT_EQ(trainer.algorithm().calls, 3);
}

TEST(Trainer, IncompleteSweepIsNotConverged)
{
    auto network = build_seeded(1, 1, {}, 2);
    Trainer<int, CountingAlgorithm> trainer(CountingAlgorithm {});
    trainer.add_or_update(0, make_example({0.1}, {0.5}));
    trainer.add_or_update(1, make_example({0.2}, {0.5}));
    trainer.add_or_update(2, make_example({0.3}, {0.5}));

    EXPECT_FALSE(trainer.retrain(network, 1.0, 2));
    EXPECT_EQ(trainer.algorithm().calls, 2);
}

TEST(Trainer, RewardIsPassedToAlgorithm)
{
    auto network = build_seeded(1, 1, {}, 2);
    Trainer<int, CountingAlgorithm> trainer(CountingAlgorithm {});
    trainer.add_or_update(0, make_example({0.1}, {0.5}, 0.5));
    trainer.add_or_update(1, make_example({0.2}, {0.5}));

    EXPECT_TRUE(trainer.retrain(network, 1.0, 10));
    EXPECT_EQ(trainer.algorithm().rewards, (std::vector<double> {0.5, 1.0}));
}

TEST(Trainer, AddOrUpdateReplacesExistingKey)
{
    Trainer<std::string> trainer(Backpropagation {});
    trainer.add_or_update("a", make_example({0.0}, {1.0}));
    trainer.add_or_update("b", make_example({1.0}, {0.0}));
    trainer.add_or_update("a", make_example({0.5}, {0.25}));

    ASSERT_EQ(trainer.examples().size(), 2U);
    EXPECT_DOUBLE_EQ(trainer.examples().at("a").inputs(0), 0.5);
    EXPECT_DOUBLE_EQ(trainer.examples().at("a").outputs(0), 0.25);
}

TEST(Trainer, ExamplesGivenAtConstruction)
{
    std::map<int, TrainingData> examples;
    examples.emplace(3, make_example({0.0}, {1.0}));
    examples.emplace(1, make_example({1.0}, {0.0}));
    Trainer<int> trainer(Backpropagation {}, std::move(examples));

    ASSERT_EQ(trainer.examples().size(), 2U);
    EXPECT_EQ(trainer.examples().begin()->first, 1);
}

TEST(Trainer, EmptyRetrainSucceeds)
{
    auto network = build_seeded(2, 1, {}, 2);
    Trainer<int> trainer(Backpropagation {});

    EXPECT_TRUE(trainer.retrain(network, 0.0, 100));
}

TEST(Trainer, ShapeMismatchPropagates)
{
    auto network = build_seeded(2, 1, {}, 2);
    Trainer<int> trainer(Backpropagation {});
    trainer.add_or_update(0, make_example({1.0, 2.0, 3.0}, {1.0}));

    EXPECT_THROW(static_cast<void>(trainer.retrain(network, 0.1, 10)),
                 ShapeMismatch);
    EXPECT_THROW(static_cast<void>(trainer.train(
                     network, 0.1, 10, make_example({1.0, 2.0}, {1.0, 0.0}))),
                 ShapeMismatch);
}
