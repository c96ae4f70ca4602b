#include "backpropagation.hpp"

namespace
{

inline void check_expected_size(const Network &network,
                                const Eigen::VectorXd &expected_output_values)
{
    const auto output_count = network_output_count(network);
    const auto value_count =
        static_cast<std::size_t>(expected_output_values.size());
    if (value_count != output_count)
    {
        throw ShapeMismatch(
            "Expected output values", output_count, value_count);
    }
}

inline void
update_output_gradients(Network &network,
                        double reward,
                        const Eigen::VectorXd &expected_output_values)
{
    const auto output_layer = network_layer_count(network) - 1;
    for (std::size_t o {0}; o < network_output_count(network); ++o)
    {
        auto &output = layer_neuron(network, output_layer, o);
        const auto target =
            expected_output_values(static_cast<Eigen::Index>(o));
        output.gradient =
            activation_derivative(output.activation, output.value) *
            (target - output.value) * reward;
    }
}

// Reverse layer order: the gradients of the following layer must be final
// before a layer reads them
inline void update_hidden_gradients(Network &network)
{
    for (auto layer = network_layer_count(network) - 2; layer > 0; --layer)
    {
        for (std::size_t h {0}; h < network_layer_size(network, layer); ++h)
        {
            auto &hidden = layer_neuron(network, layer, h);

            double downstream {0.0};
            for (const auto index : hidden.outputs)
            {
                const auto &connection = network.connections[index];
                downstream += network.neurons[connection.output_node].gradient *
                              connection.weight;
            }

            hidden.gradient =
                activation_derivative(hidden.activation, hidden.value) *
                downstream;
        }
    }
}

// The momentum term reads the delta of the previous step before it is
// overwritten
inline void
update_weights(Network &network, double learning_rate, double momentum)
{
    for (auto &connection : network.connections)
    {
        const auto delta = learning_rate *
                           network.neurons[connection.output_node].gradient *
                           network.neurons[connection.input_node].value;
        connection.weight +=
            delta + momentum * connection.previous_weight_delta;
        connection.previous_weight_delta = delta;
    }
}

// Hidden neurons first, then outputs. Input neurons keep their bias.
inline void
update_biases(Network &network, double learning_rate, double momentum)
{
    for (auto n = network.layer_offsets[1]; n < network.neurons.size(); ++n)
    {
        auto &neuron = network.neurons[n];
        const auto delta = learning_rate * neuron.gradient;
        neuron.bias += delta + momentum * neuron.previous_bias_delta;
        neuron.previous_bias_delta = delta;
    }
}

} // namespace

void Backpropagation::train(Network &network,
                            const Eigen::VectorXd &input_values,
                            double reward,
                            const Eigen::VectorXd &expected_output_values) const
{
    check_expected_size(network, expected_output_values);

    network_fire(network, input_values);

    backpropagate(network, reward, expected_output_values);
}

void Backpropagation::train(Network &network,
                            const Eigen::VectorXd &input_values,
                            const Eigen::VectorXd &expected_output_values) const
{
    train(network, input_values, 1.0, expected_output_values);
}

void Backpropagation::backpropagate(
    Network &network,
    double reward,
    const Eigen::VectorXd &expected_output_values) const
{
    check_expected_size(network, expected_output_values);

    update_output_gradients(network, reward, expected_output_values);
    update_hidden_gradients(network);

    const auto rate = effective_learning_rate(network);
    update_weights(network, rate, momentum);
    update_biases(network, rate, momentum);
}

void Backpropagation::backpropagate(
    Network &network, const Eigen::VectorXd &expected_output_values) const
{
    backpropagate(network, 1.0, expected_output_values);
}

double Backpropagation::effective_learning_rate(const Network &network) const
{
    if (!use_adaptive_learning_rate)
    {
        return learning_rate;
    }

    const auto output_layer = network_layer_count(network) - 1;
    const auto output_count = network_output_count(network);
    Eigen::VectorXd gradients(static_cast<Eigen::Index>(output_count));
    for (std::size_t o {0}; o < output_count; ++o)
    {
        gradients(static_cast<Eigen::Index>(o)) =
            layer_neuron(network, output_layer, o).gradient;
    }

    const auto magnitude = gradients.norm();
    return learning_rate * magnitude / (magnitude + adaptive_softness);
}
