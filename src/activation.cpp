#include "activation.hpp"

#include <algorithm>
#include <cmath>

namespace
{

[[nodiscard]] inline double sigmoid(double x) noexcept
{
    return 1.0 / (1.0 + std::exp(-x));
}

[[nodiscard]] inline double sigmoid_derivative(double y) noexcept
{
    return y * (1.0 - y);
}

[[nodiscard]] inline double hyperbolic_tangent(double x) noexcept
{
    return std::tanh(x);
}

// 1 - tanh^2, factored
[[nodiscard]] inline double hyperbolic_tangent_derivative(double y) noexcept
{
    return (1.0 - y) * (1.0 + y);
}

[[nodiscard]] inline double rectified_linear(double x) noexcept
{
    return std::max(0.0, x);
}

[[nodiscard]] inline double rectified_linear_derivative(double y) noexcept
{
    return y > 0.0 ? 1.0 : 0.0;
}

} // namespace

double activation_invoke(Activation activation, double x) noexcept
{
    switch (activation)
    {
    case Activation::sigmoid: return sigmoid(x);
    case Activation::hyperbolic_tangent: return hyperbolic_tangent(x);
    case Activation::rectified_linear: return rectified_linear(x);
    }
    return x;
}

double activation_derivative(Activation activation, double y) noexcept
{
    switch (activation)
    {
    case Activation::sigmoid: return sigmoid_derivative(y);
    case Activation::hyperbolic_tangent:
        return hyperbolic_tangent_derivative(y);
    case Activation::rectified_linear: return rectified_linear_derivative(y);
    }
    return 1.0;
}

std::string_view activation_name(Activation activation) noexcept
{
    switch (activation)
    {
    case Activation::sigmoid: return "sigmoid";
    case Activation::hyperbolic_tangent: return "tanh";
    case Activation::rectified_linear: return "relu";
    }
    return "unknown";
}

std::optional<Activation> activation_from_name(std::string_view name) noexcept
{
    for (const auto activation : {Activation::sigmoid,
                                  Activation::hyperbolic_tangent,
                                  Activation::rectified_linear})
    {
        if (activation_name(activation) == name)
        {
            return activation;
        }
    }
    return std::nullopt;
}
