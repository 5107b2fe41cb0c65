/**
 * @file wind_field.cpp
 * @brief Implementation of the synthetic wind field
 */

#include "wind_field.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <random>
#include <stdexcept>

namespace plumeinv {

namespace {

constexpr double PI = 3.14159265358979323846;

double round_to(double value, int decimals) {
    const double factor = std::pow(10.0, decimals);
    return std::round(value * factor) / factor;
}

} // namespace

SyntheticWindField::SyntheticWindField(double default_speed, double default_direction)
    : default_speed_(default_speed)
    , default_direction_(default_direction)
{
    if (!std::isfinite(default_speed) || default_speed < 0.0) {
        throw std::invalid_argument("default_speed must be finite and non-negative");
    }
    if (!std::isfinite(default_direction)) {
        throw std::invalid_argument("default_direction must be finite");
    }
}

WindData SyntheticWindField::get_wind(double latitude, double longitude) const {
    // Per-location seed
    const double key = std::abs(latitude * 1000.0 + longitude * 100.0);
    const std::uint64_t seed = static_cast<std::uint64_t>(std::fmod(key, 2147483648.0));
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed));

    std::uniform_real_distribution<double> speed_jitter(-SPEED_VARIATION, SPEED_VARIATION);
    std::uniform_real_distribution<double> dir_jitter(-DIRECTION_VARIATION, DIRECTION_VARIATION);

    const double speed = std::max(default_speed_ + speed_jitter(rng), MIN_SPEED);

    double direction = std::fmod(default_direction_ + dir_jitter(rng), 360.0);
    if (direction < 0.0) {
        direction += 360.0;
    }

    const double dir_rad = direction * PI / 180.0;

    WindData wind;
    wind.speed_ms = round_to(speed, 2);
    wind.direction_deg = round_to(direction, 1);
    wind.u_component = round_to(-speed * std::sin(dir_rad), 3);  // Eastward
    wind.v_component = round_to(-speed * std::cos(dir_rad), 3);  // Northward
    wind.stability_class = stability_from_wind_speed(speed);
    wind.source = "synthetic";

    return wind;
}

std::vector<WindData> SyntheticWindField::get_wind_field_grid(
    double lat_min, double lat_max,
    double lon_min, double lon_max,
    size_t grid_size
) const {
    if (grid_size < 2) {
        throw std::invalid_argument("grid_size must be at least 2");
    }

    std::vector<WindData> winds;
    winds.reserve(grid_size * grid_size);

    const double dlat = (lat_max - lat_min) / static_cast<double>(grid_size - 1);
    const double dlon = (lon_max - lon_min) / static_cast<double>(grid_size - 1);

    for (size_t i = 0; i < grid_size; ++i) {
        for (size_t j = 0; j < grid_size; ++j) {
            winds.push_back(get_wind(lat_min + i * dlat, lon_min + j * dlon));
        }
    }

    return winds;
}

StabilityClass stability_from_wind_speed(double speed_ms) {
    if (speed_ms < 2.0) {
        return StabilityClass::B;
    } else if (speed_ms < 4.0) {
        return StabilityClass::C;
    } else if (speed_ms < 6.0) {
        return StabilityClass::D;
    }
    return StabilityClass::E;
}

} // namespace plumeinv
