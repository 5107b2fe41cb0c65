/**
 * @file stability_class.hpp
 * @brief Pasquill-Gifford atmospheric stability classes
 *
 * Each class maps to a fixed set of power-law coefficients giving the
 * lateral and vertical plume spread as a function of downwind distance:
 * σ_y(x) = a * x^b,  σ_z(x) = c * x^d  (x in km, σ in m after ×1000)
 */

#ifndef STABILITY_CLASS_HPP
#define STABILITY_CLASS_HPP

#include <cmath>
#include <string>

namespace plumeinv {

/**
 * @brief Pasquill-Gifford stability class (A = very unstable ... F = stable)
 */
enum class StabilityClass {
    A,
    B,
    C,
    D,  ///< Neutral
    E,
    F
};

/**
 * @brief Power-law dispersion coefficients for one stability class
 */
struct DispersionCoefficients {
    double a;  ///< σ_y multiplier
    double b;  ///< σ_y exponent
    double c;  ///< σ_z multiplier
    double d;  ///< σ_z exponent
};

/// Minimum downwind distance fed to the power law (km)
constexpr double MIN_DISPERSION_DISTANCE_KM = 0.01;

/**
 * @brief Parse a class label
 * @param label "A".."F", case-insensitive
 * @return Stability class; unknown labels fall back to D
 */
StabilityClass parse_stability_class(const std::string& label);

/**
 * @brief Single-letter label of a stability class
 */
std::string to_string(StabilityClass cls);

/**
 * @brief Coefficient set of a stability class
 */
const DispersionCoefficients& dispersion_coefficients(StabilityClass cls);

/**
 * @brief Lateral spread σ_y (m)
 * @param coeffs Class coefficients
 * @param x_km Downwind distance (km), clamped to MIN_DISPERSION_DISTANCE_KM
 */
template <typename Scalar>
Scalar sigma_y(const DispersionCoefficients& coeffs, Scalar x_km) {
    using std::pow;
    if (x_km < MIN_DISPERSION_DISTANCE_KM) {
        x_km = Scalar(MIN_DISPERSION_DISTANCE_KM);
    }
    return coeffs.a * pow(x_km, coeffs.b) * 1000.0;
}

/**
 * @brief Vertical spread σ_z (m)
 * @param coeffs Class coefficients
 * @param x_km Downwind distance (km), clamped to MIN_DISPERSION_DISTANCE_KM
 */
template <typename Scalar>
Scalar sigma_z(const DispersionCoefficients& coeffs, Scalar x_km) {
    using std::pow;
    if (x_km < MIN_DISPERSION_DISTANCE_KM) {
        x_km = Scalar(MIN_DISPERSION_DISTANCE_KM);
    }
    return coeffs.c * pow(x_km, coeffs.d) * 1000.0;
}

} // namespace plumeinv

#endif // STABILITY_CLASS_HPP
