#ifndef TRAINING_DATA_HPP
#define TRAINING_DATA_HPP

#include <Eigen/Core>

#include <optional>

struct TrainingData
{
    Eigen::VectorXd inputs;
    Eigen::VectorXd outputs;
    // Scales the output error when set, plain training otherwise
    std::optional<double> reward;
};

#endif // TRAINING_DATA_HPP
