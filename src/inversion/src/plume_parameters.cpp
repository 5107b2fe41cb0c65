/**
 * @file plume_parameters.cpp
 * @brief Implementation of plume parameter set
 */

#include "plume_parameters.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace plumeinv {

PlumeParameters::PlumeParameters(
    double emission_rate_kg_s,
    double source_height,
    double wind_speed,
    StabilityClass stability_class,
    double source_x,
    double source_y
)
    : log_q_(std::log(std::max(emission_rate_kg_s, MIN_EMISSION_RATE)))
    , source_x_(source_x)
    , source_y_(source_y)
    , source_height_(source_height)
    , wind_speed_(wind_speed)
    , stability_class_(stability_class)
{
}

double PlumeParameters::emission_rate_kg_s() const {
    return std::exp(log_q_);
}

void PlumeParameters::set_emission_rate_kg_s(double value) {
    log_q_ = std::log(std::max(value, MIN_EMISSION_RATE));
}

double PlumeParameters::effective_wind_speed() const {
    return std::max(wind_speed_, MIN_WIND_SPEED);
}

Eigen::Vector3d PlumeParameters::free_parameters() const {
    return Eigen::Vector3d(log_q_, source_x_, source_y_);
}

void PlumeParameters::set_free_parameters(const Eigen::VectorXd& vec) {
    if (vec.size() != N_FREE) {
        throw std::invalid_argument("Free parameter vector size mismatch");
    }

    log_q_ = vec(LOG_Q);
    source_x_ = vec(SOURCE_X);
    source_y_ = vec(SOURCE_Y);
}

} // namespace plumeinv
