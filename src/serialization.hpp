#ifndef SERIALIZATION_HPP
#define SERIALIZATION_HPP

#include "network.hpp"
#include "training_data.hpp"

#include <filesystem>
#include <iosfwd>
#include <stdexcept>
#include <vector>

class FormatError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Six comma-delimited lines:
//   input_count,output_count
//   hidden layer sizes (empty when there are none)
//   biases, in neuron order
//   previous bias deltas, in neuron order
//   weights, in connection order
//   previous weight deltas, in connection order
// Activations are not stored, they are given back when reading.
void network_serialize(const Network &network, std::ostream &stream);

void network_save(const Network &network, const std::filesystem::path &path);

[[nodiscard]] Network
network_deserialize(std::istream &stream,
                    Activation activation = Activation::hyperbolic_tangent,
                    Activation output_activation = Activation::sigmoid);

[[nodiscard]] Network
network_load(const std::filesystem::path &path,
             Activation activation = Activation::hyperbolic_tangent,
             Activation output_activation = Activation::sigmoid);

// One example per line, "inputs;outputs" or "inputs;outputs;reward", values
// separated by commas
void training_data_serialize(const std::vector<TrainingData> &examples,
                             std::ostream &stream);

void training_data_save(const std::vector<TrainingData> &examples,
                        const std::filesystem::path &path);

// Blank lines and lines without a ';' are skipped
[[nodiscard]] std::vector<TrainingData>
training_data_deserialize(std::istream &stream);

// A missing file gives an empty list
[[nodiscard]] std::vector<TrainingData>
training_data_load(const std::filesystem::path &path);

#endif // SERIALIZATION_HPP
