/**
 * @file synthetic_observation.hpp
 * @brief Reproducible noisy observations for self-validating the inversion
 *
 * Places receptors downwind of a source at the origin, evaluates the
 * forward model at the true emission rate and adds Gaussian noise scaled
 * to the peak concentration.
 */

#ifndef SYNTHETIC_OBSERVATION_HPP
#define SYNTHETIC_OBSERVATION_HPP

#include <Eigen/Dense>
#include <cstdint>
#include "stability_class.hpp"

namespace plumeinv {

/**
 * @brief Physical scenario of a synthetic observation
 */
struct SyntheticScenario {
    double true_Q_kg_s = 0.014;     ///< True emission rate (kg/s), ~50 kg/hr
    double wind_speed = 3.0;        ///< Wind speed (m/s)
    double source_height = 5.0;     ///< Source height (m)
    StabilityClass stability_class = StabilityClass::D;
    size_t n_receptors = 200;       ///< Number of receptors
    double domain_m = 3000.0;       ///< Downwind extent (m)
    double noise_level = 0.05;      ///< Noise std as a fraction of peak concentration
};

/**
 * @brief Synthetic observation: receptor geometry, noisy and clean values
 */
struct SyntheticObservation {
    Eigen::VectorXd receptor_x;               ///< Downwind positions (m)
    Eigen::VectorXd receptor_y;               ///< Crosswind positions (m)
    Eigen::VectorXd receptor_z;               ///< Heights (m), all zero
    Eigen::VectorXd observed_concentrations;  ///< Noisy, non-negative (kg/m³)
    Eigen::VectorXd true_concentrations;      ///< Noise-free (kg/m³)
    double true_Q_kg_s = 0.0;
    double true_Q_kg_hr = 0.0;
    double wind_speed = 0.0;
    double source_height = 0.0;
    StabilityClass stability_class = StabilityClass::D;
};

/// Near-field cut: receptors start this far downwind (m)
constexpr double MIN_RECEPTOR_DISTANCE_M = 100.0;

/**
 * @brief Deterministic seed derived from the scenario's numeric fields
 *
 * Identical scenarios give identical seeds; changing any field changes it.
 */
std::uint64_t derive_seed(const SyntheticScenario& scenario);

/**
 * @brief Generate a synthetic observation
 * @param scenario Physical scenario
 * @return Observation suitable as input to PlumeInverter::invert
 * @throws std::invalid_argument on an invalid scenario
 */
SyntheticObservation create_synthetic_observation(const SyntheticScenario& scenario);

} // namespace plumeinv

#endif // SYNTHETIC_OBSERVATION_HPP
