#include "backpropagation.hpp"

#include <gtest/gtest.h>

namespace
{

constexpr double learning_rate {0.1};
constexpr double actual_output {0.6};
constexpr double target_output {1.0};
constexpr double input_value {1.0};
constexpr double initial_weight_value {0.5};

// Sigmoid derivative at the output value
constexpr double output_derivative {actual_output * (1.0 - actual_output)};

// One input wired to one sigmoid output, with the forward pass already done
[[nodiscard]] Network fired_network()
{
    auto initializer = make_weight_initializer(WeightInit::narrow_random, 1);
    auto network = network_build(1,
                                 1,
                                 {},
                                 Activation::hyperbolic_tangent,
                                 Activation::sigmoid,
                                 initializer);
    network.connections[0].weight = initial_weight_value;
    layer_neuron(network, 0, 0).value = input_value;
    layer_neuron(network, 1, 0).value = actual_output;
    return network;
}

[[nodiscard]] Network build_seeded()
{
    auto initializer = make_weight_initializer(WeightInit::xavier_normal, 3);
    return network_build(3,
                         2,
                         {4, 3},
                         Activation::hyperbolic_tangent,
                         Activation::sigmoid,
                         initializer);
}

class RewardScaling : public ::testing::TestWithParam<double>
{
};

} // namespace

TEST_P(RewardScaling, ScalesOutputGradient)
{
    const auto reward = GetParam();
    auto network = fired_network();
    const Backpropagation backpropagation {.learning_rate = learning_rate,
                                           .momentum = 0.0};

    backpropagation.backpropagate(
        network, reward, Eigen::VectorXd::Constant(1, target_output));

    const auto expected_gradient =
        output_derivative * (target_output - actual_output) * reward;
    EXPECT_NEAR(layer_neuron(network, 1, 0).gradient, expected_gradient, 1e-12);
}

TEST_P(RewardScaling, UpdatesWeightWithScaledGradient)
{
    const auto reward = GetParam();
    auto network = fired_network();
    const Backpropagation backpropagation {.learning_rate = learning_rate,
                                           .momentum = 0.0};

    backpropagation.backpropagate(
        network, reward, Eigen::VectorXd::Constant(1, target_output));

    const auto expected_delta = learning_rate * output_derivative *
                                (target_output - actual_output) * reward *
                                input_value;
    EXPECT_NEAR(network.connections[0].weight,
                initial_weight_value + expected_delta,
                1e-9);
    EXPECT_NEAR(network.connections[0].previous_weight_delta,
                expected_delta,
                1e-9);
}

INSTANTIATE_TEST_SUITE_P(Backpropagation,
                         RewardScaling,
                         ::testing::Values(1.0, 5.0, -2.0, 0.0));

TEST(BackpropagationReward, ZeroRewardLeavesParametersUnchanged)
{
    auto network = build_seeded();
    const auto before = network;
    const Backpropagation backpropagation {.learning_rate = 0.5,
                                           .momentum = 0.9};

    backpropagation.train(network,
                          Eigen::Vector3d {0.2, -0.4, 0.9},
                          0.0,
                          Eigen::Vector2d {1.0, 0.0});

    for (std::size_t c {0}; c < network.connections.size(); ++c)
    {
        EXPECT_EQ(network.connections[c].weight, before.connections[c].weight);
    }
    for (std::size_t n {0}; n < network.neurons.size(); ++n)
    {
        EXPECT_EQ(network.neurons[n].bias, before.neurons[n].bias);
    }
}

TEST(BackpropagationReward, NegativeRewardInvertsEveryDelta)
{
    auto rewarded = build_seeded();
    auto punished = rewarded;
    const Backpropagation backpropagation {.learning_rate = 0.3,
                                           .momentum = 0.0};
    const Eigen::Vector3d input {0.7, 0.1, -0.5};
    const Eigen::Vector2d target {0.0, 1.0};

    backpropagation.train(rewarded, input, 1.0, target);
    backpropagation.train(punished, input, -1.0, target);

    for (std::size_t c {0}; c < rewarded.connections.size(); ++c)
    {
        EXPECT_DOUBLE_EQ(punished.connections[c].previous_weight_delta,
                         -rewarded.connections[c].previous_weight_delta);
    }
    for (std::size_t n {0}; n < rewarded.neurons.size(); ++n)
    {
        EXPECT_DOUBLE_EQ(punished.neurons[n].previous_bias_delta,
                         -rewarded.neurons[n].previous_bias_delta);
    }
}

TEST(BackpropagationReward, UnitRewardIsPlainBackpropagation)
{
    auto plain = build_seeded();
    auto rewarded = plain;
    const Backpropagation backpropagation {.learning_rate = 0.3,
                                           .momentum = 0.2};
    const Eigen::Vector3d input {0.7, 0.1, -0.5};
    const Eigen::Vector2d target {0.0, 1.0};

    for (int i {0}; i < 3; ++i)
    {
        backpropagation.train(plain, input, target);
        backpropagation.train(rewarded, input, 1.0, target);
    }

    for (std::size_t c {0}; c < plain.connections.size(); ++c)
    {
        EXPECT_EQ(rewarded.connections[c].weight, plain.connections[c].weight);
    }
}
