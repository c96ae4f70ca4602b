#ifndef WEIGHT_INIT_HPP
#define WEIGHT_INIT_HPP

#include <optional>
#include <random>
#include <string_view>

enum struct WeightInit
{
    narrow_random,
    xavier_normal,
    xavier_uniform
};

// Each initializer owns its engine, so two initializers built from the same
// seed produce the same sequence of weights
struct WeightInitializer
{
    WeightInit scheme;
    std::minstd_rand rng;
};

[[nodiscard]] WeightInitializer
make_weight_initializer(WeightInit scheme, std::minstd_rand::result_type seed);

// Process-wide Xavier normal initializer seeded from std::random_device. Not
// reproducible, and not safe to use from several threads at once
[[nodiscard]] WeightInitializer &shared_weight_initializer();

[[nodiscard]] double
initial_weight(WeightInitializer &initializer, int fan_in, int fan_out);

[[nodiscard]] std::string_view weight_init_name(WeightInit scheme) noexcept;

[[nodiscard]] std::optional<WeightInit>
weight_init_from_name(std::string_view name) noexcept;

#endif // WEIGHT_INIT_HPP
