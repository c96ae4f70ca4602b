#include "backpropagation.hpp"
#include "network.hpp"
#include "serialization.hpp"
#include "trainer.hpp"

// NOTE: clipp uses std::result_of, but it is removed in C++20. GCC did not
// remove it yet, so just define it for MSVC.
#ifdef _MSC_VER
namespace std
{
template <class>
struct result_of;
template <class F, class... ArgTypes>
struct result_of<F(ArgTypes...)> : std::invoke_result<F, ArgTypes...>
{
};
} // namespace std
#endif
#include "clipp.h"

#include <cassert>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include <cstdlib>

namespace
{

struct Parameters
{
    std::string data_file_name;
    std::string output_file_name;
    std::string input_file_name;
    std::vector<int> hidden_layer_sizes;
    double learning_rate;
    double momentum;
    bool adaptive_learning_rate;
    double tolerance;
    int max_iterations;
    std::optional<unsigned int> seed;
    std::string weight_init;
    std::string activation;
    std::string output_activation;
};

void print_error(const clipp::parsing_result &result,
                 const std::vector<std::string> &unmatched,
                 const clipp::group &cli,
                 const std::string &executable_name)
{
    if (!unmatched.empty())
    {
        std::cerr << "Unmatched extra arguments:";
        for (const auto &arg : unmatched)
        {
            std::cerr << " \"" << arg << '\"';
        }
        std::cerr << '\n';
    }

    for (const auto &arg : result.missing())
    {
        if (!arg.param()->label().empty())
        {
            std::cerr << "Missing parameter \"" << arg.param()->label()
                      << "\" after index " << arg.after_index() << '\n';
        }
    }

    for (const auto &arg : result)
    {
        if (arg.any_error())
        {
            std::cerr << "Error at argument " << arg.index() << " \""
                      << arg.arg() << "\"\n";
        }
    }

    std::cerr << "Usage:\n" << clipp::usage_lines(cli, executable_name) << '\n';
}

[[noreturn]] void fail(const std::string &message)
{
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
}

[[nodiscard]] Parameters parse_command_line(int argc, char *argv[])
{
    Parameters params {.data_file_name = {},
                       .output_file_name = {},
                       .input_file_name = {},
                       .hidden_layer_sizes = {},
                       .learning_rate = 0.2,
                       .momentum = 0.1,
                       .adaptive_learning_rate = false,
                       .tolerance = 0.05,
                       .max_iterations = 100000,
                       .seed = std::nullopt,
                       .weight_init = "xavier-normal",
                       .activation = "tanh",
                       .output_activation = "sigmoid"};

    bool show_help {false};
    unsigned int seed {0};
    std::vector<std::string> unmatched;

    const auto cli =
        (clipp::option("-h", "--help")
             .set(show_help)
             .doc("Show this message and exit") |
         ((clipp::required("-d", "--data") &
           clipp::value(
               clipp::match::prefix_not("-"), "data", params.data_file_name))
              .doc("Training examples, one \"inputs;outputs[;reward]\" line "
                   "per example"),
          (clipp::option("-o", "--save") &
           clipp::value(clipp::match::prefix_not("-"),
                        "save",
                        params.output_file_name))
              .doc("Where to save the trained network"),
          (clipp::option("-i", "--load") &
           clipp::value(
               clipp::match::prefix_not("-"), "load", params.input_file_name))
              .doc("Continue training a saved network instead of building "
                   "a new one (--arch and --init are then ignored)"),
          (clipp::option("-a", "--arch") &
           clipp::values(clipp::match::integers(),
                         "hidden_layer_sizes",
                         params.hidden_layer_sizes))
              .doc("Sizes of the hidden layers (the input and output sizes "
                   "are taken from the training examples)"),
          (clipp::option("-l", "--learning-rate") &
           clipp::value(
               clipp::match::numbers(), "learning_rate", params.learning_rate))
              .doc("Learning rate (default: " +
                   std::to_string(params.learning_rate) + ")"),
          (clipp::option("-m", "--momentum") &
           clipp::value(clipp::match::numbers(), "momentum", params.momentum))
              .doc("Momentum (default: " + std::to_string(params.momentum) +
                   ")"),
          clipp::option("--adaptive")
              .set(params.adaptive_learning_rate)
              .doc("Scale the learning rate with the output error"),
          (clipp::option("-t", "--tolerance") &
           clipp::value(
               clipp::match::numbers(), "tolerance", params.tolerance))
              .doc("Largest accepted output error (default: " +
                   std::to_string(params.tolerance) + ")"),
          (clipp::option("-n", "--max-iterations") &
           clipp::value(clipp::match::integers(),
                        "max_iterations",
                        params.max_iterations))
              .doc("Total number of training steps allowed (default: " +
                   std::to_string(params.max_iterations) + ")"),
          (clipp::option("-s", "--seed") &
           clipp::value(clipp::match::integers(), "seed", seed)
               .call([&] { params.seed = seed; }))
              .doc("Seed of the weight initialization (default: random)"),
          (clipp::option("--init") &
           clipp::value(
               clipp::match::prefix_not("-"), "init", params.weight_init))
              .doc("Weight initialization: xavier-normal, xavier-uniform or "
                   "narrow-random (default: " +
                   params.weight_init + ")"),
          (clipp::option("--activation") &
           clipp::value(clipp::match::prefix_not("-"),
                        "activation",
                        params.activation))
              .doc("Activation of the hidden layers: tanh, sigmoid or relu "
                   "(default: " +
                   params.activation + ")"),
          (clipp::option("--output-activation") &
           clipp::value(clipp::match::prefix_not("-"),
                        "output_activation",
                        params.output_activation))
              .doc("Activation of the output layer (default: " +
                   params.output_activation + ")"),
          clipp::any_other(unmatched)));

    assert(cli.flags_are_prefix_free());
    assert(cli.common_flag_prefix() == "-");

    const auto result = clipp::parse(argc, argv, cli);

    if (result.any_error() || !unmatched.empty())
    {
        print_error(result,
                    unmatched,
                    cli,
                    std::filesystem::path(argv[0]).filename().string());
        std::exit(EXIT_FAILURE);
    }

    if (show_help)
    {
        std::cout << clipp::make_man_page(
                         cli,
                         std::filesystem::path(argv[0]).filename().string())
                  << '\n';
        std::exit(EXIT_SUCCESS);
    }

    for (const auto size : params.hidden_layer_sizes)
    {
        if (size <= 0)
        {
            fail("Error on hidden layer size of " + std::to_string(size) +
                 ": must be strictly positive");
        }
    }
    if (params.max_iterations <= 0)
    {
        fail("Error on maximum number of iterations of " +
             std::to_string(params.max_iterations) +
             ": must be strictly positive");
    }
    if (params.tolerance < 0.0)
    {
        fail("Error on tolerance of " + std::to_string(params.tolerance) +
             ": must be positive");
    }
    if (!weight_init_from_name(params.weight_init))
    {
        fail("Unknown weight initialization \"" + params.weight_init + '\"');
    }
    if (!activation_from_name(params.activation))
    {
        fail("Unknown activation \"" + params.activation + '\"');
    }
    if (!activation_from_name(params.output_activation))
    {
        fail("Unknown activation \"" + params.output_activation + '\"');
    }

    return params;
}

[[nodiscard]] Network make_network(const Parameters &params,
                                   const TrainingData &first_example)
{
    const auto activation = *activation_from_name(params.activation);
    const auto output_activation =
        *activation_from_name(params.output_activation);

    if (!params.input_file_name.empty())
    {
        std::cout << "Loading network from "
                  << std::quoted(params.input_file_name) << '\n';
        return network_load(
            params.input_file_name, activation, output_activation);
    }

    const auto input_count = static_cast<int>(first_example.inputs.size());
    const auto output_count = static_cast<int>(first_example.outputs.size());
    const auto scheme = *weight_init_from_name(params.weight_init);

    if (params.seed)
    {
        auto initializer = make_weight_initializer(scheme, *params.seed);
        return network_build(input_count,
                             output_count,
                             params.hidden_layer_sizes,
                             activation,
                             output_activation,
                             initializer);
    }

    std::random_device rd;
    auto initializer = make_weight_initializer(scheme, rd());
    return network_build(input_count,
                         output_count,
                         params.hidden_layer_sizes,
                         activation,
                         output_activation,
                         initializer);
}

void print_vector(const Eigen::VectorXd &values)
{
    for (Eigen::Index i {0}; i < values.size(); ++i)
    {
        std::cout << (i > 0 ? "," : "") << values(i);
    }
}

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto params = parse_command_line(argc, argv);

        const auto examples = training_data_load(params.data_file_name);
        if (examples.empty())
        {
            std::cerr << "No training examples in "
                      << std::quoted(params.data_file_name) << '\n';
            return EXIT_FAILURE;
        }

        auto network = make_network(params, examples.front());

        std::cout << "Training data: " << std::quoted(params.data_file_name)
                  << " (" << examples.size() << " examples)\n"
                  << "Network layout: " << network_input_count(network);
        for (const auto size : network_hidden_layer_sizes(network))
        {
            std::cout << ' ' << size;
        }
        std::cout << ' ' << network_output_count(network) << '\n'
                  << "Activations: " << params.activation << ", "
                  << params.output_activation << '\n'
                  << "Learning rate: " << params.learning_rate
                  << (params.adaptive_learning_rate ? " (adaptive)\n" : "\n")
                  << "Momentum: " << params.momentum << '\n'
                  << "Tolerance: " << params.tolerance << '\n'
                  << "Maximum iterations: " << params.max_iterations << '\n'
                  << std::string(72, '-') << '\n';

        Trainer<std::size_t> trainer(
            Backpropagation {.learning_rate = params.learning_rate,
                             .momentum = params.momentum,
                             .use_adaptive_learning_rate =
                                 params.adaptive_learning_rate});
        for (std::size_t i {0}; i < examples.size(); ++i)
        {
            trainer.add_or_update(i, examples[i]);
        }

        const auto converged =
            trainer.retrain(network, params.tolerance, params.max_iterations);
        std::cout << (converged ? "Converged within tolerance\n"
                                : "Iteration budget exhausted\n");

        for (const auto &[index, example] : trainer.examples())
        {
            network_fire(network, example.inputs);
            std::cout << '#' << index << ": ";
            print_vector(example.inputs);
            std::cout << " -> ";
            print_vector(network_outputs(network));
            std::cout << " (expected ";
            print_vector(example.outputs);
            std::cout << ")\n";
        }

        if (!params.output_file_name.empty())
        {
            std::cout << "Saving network to "
                      << std::quoted(params.output_file_name) << '\n';
            network_save(network, params.output_file_name);
        }

        return EXIT_SUCCESS;
    }
    catch (const std::exception &e)
    {
        std::cerr << e.what() << '\n';
        return EXIT_FAILURE;
    }
    catch (...)
    {
        std::cerr << "Unknown exception thrown\n";
        return EXIT_FAILURE;
    }
}
