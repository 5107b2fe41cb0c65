/**
 * @file synthetic_observation.cpp
 * @brief Implementation of the synthetic-observation generator
 */

#include "synthetic_observation.hpp"
#include "gaussian_plume_model.hpp"
#include <algorithm>
#include <cstring>
#include <random>
#include <stdexcept>

namespace plumeinv {

namespace {

// SplitMix64 finalizer
std::uint64_t mix64(std::uint64_t x) {
    x += 0x9E3779B97F4A7C15ULL;
    x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ULL;
    x = (x ^ (x >> 27)) * 0x94D049BB133111EBULL;
    return x ^ (x >> 31);
}

std::uint64_t combine(std::uint64_t seed, std::uint64_t value) {
    return mix64(seed ^ (value + 0x9E3779B97F4A7C15ULL + (seed << 6) + (seed >> 2)));
}

std::uint64_t bits_of(double value) {
    if (value == 0.0) {
        value = 0.0;  // Fold -0.0 into +0.0
    }
    std::uint64_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    return bits;
}

} // namespace

std::uint64_t derive_seed(const SyntheticScenario& scenario) {
    std::uint64_t seed = 0x6D657468616E65ULL;
    seed = combine(seed, bits_of(scenario.true_Q_kg_s));
    seed = combine(seed, bits_of(scenario.wind_speed));
    seed = combine(seed, bits_of(scenario.source_height));
    seed = combine(seed, static_cast<std::uint64_t>(scenario.stability_class));
    seed = combine(seed, static_cast<std::uint64_t>(scenario.n_receptors));
    seed = combine(seed, bits_of(scenario.domain_m));
    seed = combine(seed, bits_of(scenario.noise_level));
    return seed;
}

SyntheticObservation create_synthetic_observation(const SyntheticScenario& scenario) {
    if (scenario.n_receptors == 0) {
        throw std::invalid_argument("n_receptors must be positive");
    }
    if (!(scenario.domain_m > MIN_RECEPTOR_DISTANCE_M)) {
        throw std::invalid_argument("domain_m must exceed the 100 m near-field cut");
    }
    if (!(scenario.noise_level >= 0.0)) {
        throw std::invalid_argument("noise_level must be non-negative");
    }
    if (!(scenario.true_Q_kg_s > 0.0)) {
        throw std::invalid_argument("true_Q_kg_s must be positive");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(scenario.n_receptors);
    std::mt19937_64 rng(derive_seed(scenario));

    // Receptor layout: downwind band, ground level
    std::uniform_real_distribution<double> x_dist(MIN_RECEPTOR_DISTANCE_M, scenario.domain_m);
    std::uniform_real_distribution<double> y_dist(-scenario.domain_m / 3.0, scenario.domain_m / 3.0);

    SyntheticObservation obs;
    obs.receptor_x.resize(n);
    obs.receptor_y.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        obs.receptor_x(i) = x_dist(rng);
    }
    for (Eigen::Index i = 0; i < n; ++i) {
        obs.receptor_y(i) = y_dist(rng);
    }
    obs.receptor_z = Eigen::VectorXd::Zero(n);

    // Ground truth, source at the origin
    const PlumeParameters truth(
        scenario.true_Q_kg_s,
        scenario.source_height,
        scenario.wind_speed,
        scenario.stability_class
    );
    const GaussianPlumeModel true_model(truth);
    obs.true_concentrations = true_model.evaluate(
        obs.receptor_x, obs.receptor_y, obs.receptor_z, scenario.wind_speed
    );

    // Additive noise relative to the peak, clipped at zero
    const double noise_std = scenario.noise_level * obs.true_concentrations.maxCoeff();
    obs.observed_concentrations.resize(n);
    if (noise_std > 0.0) {
        std::normal_distribution<double> noise(0.0, noise_std);
        for (Eigen::Index i = 0; i < n; ++i) {
            obs.observed_concentrations(i) =
                std::max(obs.true_concentrations(i) + noise(rng), 0.0);
        }
    } else {
        obs.observed_concentrations = obs.true_concentrations.cwiseMax(0.0);
    }

    obs.true_Q_kg_s = scenario.true_Q_kg_s;
    obs.true_Q_kg_hr = scenario.true_Q_kg_s * SECONDS_PER_HOUR;
    obs.wind_speed = scenario.wind_speed;
    obs.source_height = scenario.source_height;
    obs.stability_class = scenario.stability_class;

    return obs;
}

} // namespace plumeinv
