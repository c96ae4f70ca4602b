#ifndef NETWORK_HPP
#define NETWORK_HPP

#include "activation.hpp"
#include "weight_init.hpp"

#include <Eigen/Core>

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

// A vector length does not match the layer it is applied to
class ShapeMismatch : public std::invalid_argument
{
public:
    ShapeMismatch(const std::string &what,
                  std::size_t expected,
                  std::size_t actual);

    [[nodiscard]] std::size_t expected() const noexcept
    {
        return m_expected;
    }

    [[nodiscard]] std::size_t actual() const noexcept
    {
        return m_actual;
    }

private:
    std::size_t m_expected;
    std::size_t m_actual;
};

inline constexpr double initial_bias {0.01};

struct Neuron
{
    Activation activation;
    double bias;
    double previous_bias_delta;
    double value;
    double gradient;
    // Indices into Network::connections. inputs[i] comes from position i of
    // the preceding layer, outputs[j] goes to position j of the following
    // layer. Input neurons have no inputs, output neurons have no outputs.
    std::vector<std::size_t> inputs;
    std::vector<std::size_t> outputs;
};

struct Connection
{
    std::size_t input_node;
    std::size_t output_node;
    double weight;
    double previous_weight_delta;
};

// Neurons are stored layer after layer: inputs, hidden layers from the input
// side to the output side, then outputs. Connections are stored grouped by
// source neuron in neuron order, each group ordered by target position. This
// is the traversal order used by the text encoding.
struct Network
{
    std::vector<Neuron> neurons;
    std::vector<Connection> connections;
    // Layer l occupies neurons [layer_offsets[l], layer_offsets[l + 1])
    std::vector<std::size_t> layer_offsets;
};

[[nodiscard]] Network
network_build(int input_count,
              int output_count,
              const std::vector<int> &hidden_layer_counts,
              Activation activation,
              Activation output_activation,
              WeightInitializer &weight_initializer);

// Uses shared_weight_initializer()
[[nodiscard]] Network
network_build(int input_count,
              int output_count,
              const std::vector<int> &hidden_layer_counts,
              Activation activation = Activation::hyperbolic_tangent,
              Activation output_activation = Activation::sigmoid);

// Input values are stored as they are, the activation attached to input
// neurons is never applied
void network_fire(Network &network, const Eigen::VectorXd &input_values);

void network_feed_forward(Network &network);

[[nodiscard]] std::size_t network_layer_count(const Network &network) noexcept;

[[nodiscard]] std::size_t network_layer_size(const Network &network,
                                             std::size_t layer) noexcept;

[[nodiscard]] inline std::size_t network_input_count(const Network &network)
{
    return network_layer_size(network, 0);
}

[[nodiscard]] inline std::size_t network_output_count(const Network &network)
{
    return network_layer_size(network, network_layer_count(network) - 1);
}

[[nodiscard]] std::vector<int>
network_hidden_layer_sizes(const Network &network);

[[nodiscard]] Neuron &
layer_neuron(Network &network, std::size_t layer, std::size_t position);

[[nodiscard]] const Neuron &
layer_neuron(const Network &network, std::size_t layer, std::size_t position);

[[nodiscard]] Eigen::VectorXd network_outputs(const Network &network);

#endif // NETWORK_HPP
