#include "network.hpp"

#include <cassert>

namespace
{

[[nodiscard]] std::string shape_mismatch_message(const std::string &what,
                                                 std::size_t expected,
                                                 std::size_t actual)
{
    return what + ": expected " + std::to_string(expected) +
           " values, got " + std::to_string(actual);
}

inline void
add_layer(Network &network, int neuron_count, Activation activation)
{
    for (int i {0}; i < neuron_count; ++i)
    {
        network.neurons.push_back({.activation = activation,
                                   .bias = initial_bias,
                                   .previous_bias_delta = 0.0,
                                   .value = 0.0,
                                   .gradient = 0.0,
                                   .inputs = {},
                                   .outputs = {}});
    }
    network.layer_offsets.push_back(network.neurons.size());
}

// Fully connects layer - 1 to layer. Sources are visited in order, so the
// k-th input of every target neuron comes from source position k.
inline void connect_layer(Network &network,
                          std::size_t layer,
                          WeightInitializer &weight_initializer)
{
    const auto source_begin = network.layer_offsets[layer - 1];
    const auto target_begin = network.layer_offsets[layer];
    const auto source_size = target_begin - source_begin;
    const auto target_size = network.layer_offsets[layer + 1] - target_begin;
    const auto fan_in = static_cast<int>(source_size);
    const auto fan_out = static_cast<int>(target_size);

    for (std::size_t j {0}; j < target_size; ++j)
    {
        network.neurons[target_begin + j].inputs.reserve(source_size);
    }

    for (std::size_t i {0}; i < source_size; ++i)
    {
        auto &source = network.neurons[source_begin + i];
        source.outputs.reserve(target_size);

        for (std::size_t j {0}; j < target_size; ++j)
        {
            const auto index = network.connections.size();
            network.connections.push_back(
                {.input_node = source_begin + i,
                 .output_node = target_begin + j,
                 .weight = initial_weight(weight_initializer, fan_in, fan_out),
                 .previous_weight_delta = 0.0});

            source.outputs.push_back(index);
            network.neurons[target_begin + j].inputs.push_back(index);
        }
    }
}

inline void neuron_fire(Network &network, Neuron &neuron)
{
    if (neuron.inputs.empty())
    {
        return;
    }

    auto sum = neuron.bias;
    for (const auto index : neuron.inputs)
    {
        const auto &connection = network.connections[index];
        sum += connection.weight * network.neurons[connection.input_node].value;
    }
    neuron.value = activation_invoke(neuron.activation, sum);
}

} // namespace

ShapeMismatch::ShapeMismatch(const std::string &what,
                             std::size_t expected,
                             std::size_t actual)
    : std::invalid_argument(shape_mismatch_message(what, expected, actual)),
      m_expected {expected},
      m_actual {actual}
{
}

Network network_build(int input_count,
                      int output_count,
                      const std::vector<int> &hidden_layer_counts,
                      Activation activation,
                      Activation output_activation,
                      WeightInitializer &weight_initializer)
{
    if (input_count < 1)
    {
        throw std::invalid_argument("Input count must be strictly positive");
    }
    if (output_count < 1)
    {
        throw std::invalid_argument("Output count must be strictly positive");
    }
    for (const auto count : hidden_layer_counts)
    {
        if (count < 1)
        {
            throw std::invalid_argument(
                "Hidden layer sizes must be strictly positive");
        }
    }

    Network network;
    network.layer_offsets.push_back(0);

    // Input neurons carry the hidden activation so that every neuron has one,
    // but it is never applied to them
    add_layer(network, input_count, activation);
    for (const auto count : hidden_layer_counts)
    {
        add_layer(network, count, activation);
    }
    add_layer(network, output_count, output_activation);

    for (std::size_t layer {1}; layer < network_layer_count(network); ++layer)
    {
        connect_layer(network, layer, weight_initializer);
    }

    return network;
}

Network network_build(int input_count,
                      int output_count,
                      const std::vector<int> &hidden_layer_counts,
                      Activation activation,
                      Activation output_activation)
{
    return network_build(input_count,
                         output_count,
                         hidden_layer_counts,
                         activation,
                         output_activation,
                         shared_weight_initializer());
}

void network_fire(Network &network, const Eigen::VectorXd &input_values)
{
    const auto input_count = network_input_count(network);
    const auto value_count = static_cast<std::size_t>(input_values.size());
    if (value_count != input_count)
    {
        throw ShapeMismatch("Input values", input_count, value_count);
    }

    for (std::size_t i {0}; i < input_count; ++i)
    {
        network.neurons[i].value = input_values(static_cast<Eigen::Index>(i));
    }

    network_feed_forward(network);
}

void network_feed_forward(Network &network)
{
    for (auto n = network.layer_offsets[1]; n < network.neurons.size(); ++n)
    {
        neuron_fire(network, network.neurons[n]);
    }
}

std::size_t network_layer_count(const Network &network) noexcept
{
    return network.layer_offsets.size() - 1;
}

std::size_t network_layer_size(const Network &network,
                               std::size_t layer) noexcept
{
    assert(layer + 1 < network.layer_offsets.size());
    return network.layer_offsets[layer + 1] - network.layer_offsets[layer];
}

std::vector<int> network_hidden_layer_sizes(const Network &network)
{
    std::vector<int> sizes;
    for (std::size_t layer {1}; layer + 1 < network_layer_count(network);
         ++layer)
    {
        sizes.push_back(static_cast<int>(network_layer_size(network, layer)));
    }
    return sizes;
}

Neuron &layer_neuron(Network &network, std::size_t layer, std::size_t position)
{
    assert(position < network_layer_size(network, layer));
    return network.neurons[network.layer_offsets[layer] + position];
}

const Neuron &
layer_neuron(const Network &network, std::size_t layer, std::size_t position)
{
    assert(position < network_layer_size(network, layer));
    return network.neurons[network.layer_offsets[layer] + position];
}

Eigen::VectorXd network_outputs(const Network &network)
{
    const auto output_layer = network_layer_count(network) - 1;
    const auto output_count = network_output_count(network);

    Eigen::VectorXd outputs(static_cast<Eigen::Index>(output_count));
    for (std::size_t o {0}; o < output_count; ++o)
    {
        outputs(static_cast<Eigen::Index>(o)) =
            layer_neuron(network, output_layer, o).value;
    }
    return outputs;
}
