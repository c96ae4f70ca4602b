#ifndef ACTIVATION_HPP
#define ACTIVATION_HPP

#include <optional>
#include <string_view>

enum struct Activation
{
    sigmoid,
    hyperbolic_tangent,
    rectified_linear
};

[[nodiscard]] double activation_invoke(Activation activation,
                                       double x) noexcept;

// The argument is the activation output y = f(x), not x itself
[[nodiscard]] double activation_derivative(Activation activation,
                                           double y) noexcept;

[[nodiscard]] std::string_view activation_name(Activation activation) noexcept;

[[nodiscard]] std::optional<Activation>
activation_from_name(std::string_view name) noexcept;

#endif // ACTIVATION_HPP
