#include "weight_init.hpp"

#include <cmath>
#include <numbers>

namespace
{

[[nodiscard]] inline double uniform_unit(std::minstd_rand &rng)
{
    std::uniform_real_distribution<double> distribution(0.0, 1.0);
    return distribution(rng);
}

// Uniform in [0.49, 0.51), independent of the layer sizes
[[nodiscard]] inline double narrow_random_weight(std::minstd_rand &rng)
{
    return 0.49 + uniform_unit(rng) * 0.02;
}

[[nodiscard]] inline double
xavier_normal_weight(std::minstd_rand &rng, int fan_in, int fan_out)
{
    const auto std_dev =
        std::sqrt(2.0 / static_cast<double>(fan_in + fan_out));

    // Box-Muller transform, both samples taken in (0, 1]
    const auto u1 = 1.0 - uniform_unit(rng);
    const auto u2 = 1.0 - uniform_unit(rng);
    const auto standard_normal = std::sqrt(-2.0 * std::log(u1)) *
                                 std::sin(2.0 * std::numbers::pi * u2);

    return standard_normal * std_dev;
}

[[nodiscard]] inline double
xavier_uniform_weight(std::minstd_rand &rng, int fan_in, int fan_out)
{
    const auto limit = std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    std::uniform_real_distribution<double> distribution(-limit, limit);
    return distribution(rng);
}

} // namespace

WeightInitializer make_weight_initializer(WeightInit scheme,
                                          std::minstd_rand::result_type seed)
{
    return {.scheme = scheme, .rng = std::minstd_rand(seed)};
}

WeightInitializer &shared_weight_initializer()
{
    static WeightInitializer initializer = []
    {
        std::random_device rd;
        return make_weight_initializer(WeightInit::xavier_normal, rd());
    }();
    return initializer;
}

double initial_weight(WeightInitializer &initializer, int fan_in, int fan_out)
{
    switch (initializer.scheme)
    {
    case WeightInit::narrow_random:
        return narrow_random_weight(initializer.rng);
    case WeightInit::xavier_normal:
        return xavier_normal_weight(initializer.rng, fan_in, fan_out);
    case WeightInit::xavier_uniform:
        return xavier_uniform_weight(initializer.rng, fan_in, fan_out);
    }
    return 0.0;
}

std::string_view weight_init_name(WeightInit scheme) noexcept
{
    switch (scheme)
    {
    case WeightInit::narrow_random: return "narrow-random";
    case WeightInit::xavier_normal: return "xavier-normal";
    case WeightInit::xavier_uniform: return "xavier-uniform";
    }
    return "unknown";
}

std::optional<WeightInit> weight_init_from_name(std::string_view name) noexcept
{
    for (const auto scheme : {WeightInit::narrow_random,
                              WeightInit::xavier_normal,
                              WeightInit::xavier_uniform})
    {
        if (weight_init_name(scheme) == name)
        {
            return scheme;
        }
    }
    return std::nullopt;
}
