#include "serialization.hpp"

#include <array>
#include <charconv>
#include <fstream>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace
{

constexpr char delimiter {','};
constexpr char section_delimiter {';'};

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    constexpr std::string_view whitespace {" \t\r\n"};
    const auto first = text.find_first_not_of(whitespace);
    if (first == std::string_view::npos)
    {
        return {};
    }
    const auto last = text.find_last_not_of(whitespace);
    return text.substr(first, last - first + 1);
}

[[nodiscard]] std::vector<std::string_view> split(std::string_view text,
                                                  char separator)
{
    std::vector<std::string_view> fields;
    std::size_t begin {0};
    for (;;)
    {
        const auto end = text.find(separator, begin);
        if (end == std::string_view::npos)
        {
            fields.push_back(text.substr(begin));
            return fields;
        }
        fields.push_back(text.substr(begin, end - begin));
        begin = end + 1;
    }
}

template <typename T>
[[nodiscard]] T parse_number(std::string_view text, const char *field)
{
    text = trim(text);
    if (text.empty())
    {
        throw FormatError(std::string("Missing value for ") + field);
    }
    T value {};
    const auto *const last = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), last, value);
    if (ec != std::errc {} || ptr != last)
    {
        throw FormatError("Invalid value \"" + std::string(text) + "\" for " +
                          field);
    }
    return value;
}

template <typename T>
[[nodiscard]] std::vector<T> parse_line(std::string_view line,
                                        const char *field)
{
    std::vector<T> values;
    if (trim(line).empty())
    {
        return values;
    }
    for (const auto text : split(line, delimiter))
    {
        values.push_back(parse_number<T>(text, field));
    }
    return values;
}

[[nodiscard]] Eigen::VectorXd parse_vector(std::string_view text,
                                           const char *field)
{
    const auto values = parse_line<double>(text, field);
    if (values.empty())
    {
        throw FormatError(std::string("Missing values for ") + field);
    }
    return Eigen::Map<const Eigen::VectorXd>(
        values.data(), static_cast<Eigen::Index>(values.size()));
}

// Shortest representation that reads back to the same double
void write_number(std::ostream &stream, double value)
{
    std::array<char, 32> buffer {};
    const auto [ptr, ec] =
        std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    stream.write(buffer.data(), ptr - buffer.data());
}

template <typename Range, typename Projection>
void write_line(std::ostream &stream,
                const Range &range,
                Projection projection)
{
    bool first {true};
    for (const auto &element : range)
    {
        if (!first)
        {
            stream << delimiter;
        }
        write_number(stream, projection(element));
        first = false;
    }
    stream << '\n';
}

void write_vector(std::ostream &stream, const Eigen::VectorXd &values)
{
    for (Eigen::Index i {0}; i < values.size(); ++i)
    {
        if (i > 0)
        {
            stream << delimiter;
        }
        write_number(stream, values(i));
    }
}

[[nodiscard]] std::string read_line(std::istream &stream, const char *field)
{
    std::string line;
    if (!std::getline(stream, line))
    {
        throw FormatError(std::string("Missing line for ") + field);
    }
    return line;
}

[[nodiscard]] std::vector<double> read_sequence(std::istream &stream,
                                                const char *field,
                                                std::size_t expected_count)
{
    auto values = parse_line<double>(read_line(stream, field), field);
    if (values.size() != expected_count)
    {
        throw FormatError(std::string("Expected ") +
                          std::to_string(expected_count) + " values for " +
                          field + ", got " + std::to_string(values.size()));
    }
    return values;
}

} // namespace

void network_serialize(const Network &network, std::ostream &stream)
{
    stream << network_input_count(network) << delimiter
           << network_output_count(network) << '\n';

    const auto hidden_sizes = network_hidden_layer_sizes(network);
    for (std::size_t i {0}; i < hidden_sizes.size(); ++i)
    {
        if (i > 0)
        {
            stream << delimiter;
        }
        stream << hidden_sizes[i];
    }
    stream << '\n';

    write_line(stream,
               network.neurons,
               [](const Neuron &neuron) { return neuron.bias; });
    write_line(stream,
               network.neurons,
               [](const Neuron &neuron) { return neuron.previous_bias_delta; });
    write_line(stream,
               network.connections,
               [](const Connection &connection) { return connection.weight; });
    write_line(stream,
               network.connections,
               [](const Connection &connection)
               { return connection.previous_weight_delta; });
}

void network_save(const Network &network, const std::filesystem::path &path)
{
    std::ofstream file(path);
    if (!file)
    {
        throw std::runtime_error("Failed to open " + path.string() +
                                 " for writing");
    }
    network_serialize(network, file);
    if (!file)
    {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

Network network_deserialize(std::istream &stream,
                            Activation activation,
                            Activation output_activation)
{
    const auto header =
        parse_line<int>(read_line(stream, "node counts"), "node counts");
    if (header.size() != 2)
    {
        throw FormatError(
            "Invalid header line, expected input_count,output_count");
    }

    const auto hidden_sizes = parse_line<int>(
        read_line(stream, "hidden layer sizes"), "hidden layer sizes");

    // Every parameter is overwritten below, the initializer only fills the
    // topology
    auto initializer = make_weight_initializer(WeightInit::narrow_random, 1);
    Network network;
    try
    {
        network = network_build(header[0],
                                header[1],
                                hidden_sizes,
                                activation,
                                output_activation,
                                initializer);
    }
    catch (const std::invalid_argument &e)
    {
        throw FormatError(std::string("Invalid topology: ") + e.what());
    }

    const auto neuron_count = network.neurons.size();
    const auto connection_count = network.connections.size();

    const auto biases = read_sequence(stream, "biases", neuron_count);
    const auto previous_bias_deltas =
        read_sequence(stream, "previous bias deltas", neuron_count);
    const auto weights = read_sequence(stream, "weights", connection_count);
    const auto previous_weight_deltas =
        read_sequence(stream, "previous weight deltas", connection_count);

    for (std::size_t n {0}; n < neuron_count; ++n)
    {
        network.neurons[n].bias = biases[n];
        network.neurons[n].previous_bias_delta = previous_bias_deltas[n];
    }
    for (std::size_t c {0}; c < connection_count; ++c)
    {
        network.connections[c].weight = weights[c];
        network.connections[c].previous_weight_delta =
            previous_weight_deltas[c];
    }

    return network;
}

Network network_load(const std::filesystem::path &path,
                     Activation activation,
                     Activation output_activation)
{
    std::ifstream file(path);
    if (!file)
    {
        throw std::runtime_error("Failed to open " + path.string());
    }
    return network_deserialize(file, activation, output_activation);
}

void training_data_serialize(const std::vector<TrainingData> &examples,
                             std::ostream &stream)
{
    for (const auto &example : examples)
    {
        write_vector(stream, example.inputs);
        stream << section_delimiter;
        write_vector(stream, example.outputs);
        if (example.reward)
        {
            stream << section_delimiter;
            write_number(stream, *example.reward);
        }
        stream << '\n';
    }
}

void training_data_save(const std::vector<TrainingData> &examples,
                        const std::filesystem::path &path)
{
    std::ofstream file(path);
    if (!file)
    {
        throw std::runtime_error("Failed to open " + path.string() +
                                 " for writing");
    }
    training_data_serialize(examples, file);
    if (!file)
    {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

std::vector<TrainingData> training_data_deserialize(std::istream &stream)
{
    std::vector<TrainingData> examples;
    std::string line;
    while (std::getline(stream, line))
    {
        if (trim(line).empty())
        {
            continue;
        }

        const auto sections = split(line, section_delimiter);
        if (sections.size() < 2)
        {
            continue;
        }

        TrainingData example {.inputs = parse_vector(sections[0], "input"),
                              .outputs = parse_vector(sections[1], "output"),
                              .reward = std::nullopt};
        if (sections.size() > 2)
        {
            example.reward = parse_number<double>(sections[2], "reward");
        }
        examples.push_back(std::move(example));
    }
    return examples;
}

std::vector<TrainingData>
training_data_load(const std::filesystem::path &path)
{
    if (!std::filesystem::exists(path))
    {
        return {};
    }

    std::ifstream file(path);
    if (!file)
    {
        throw std::runtime_error("Failed to open " + path.string());
    }
    return training_data_deserialize(file);
}
