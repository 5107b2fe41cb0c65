/**
 * @file plume_parameters.hpp
 * @brief Parameter set of the Gaussian plume model
 *
 * Holds the optimizable source parameters (emission rate in log space,
 * horizontal source offset) alongside the fixed conditions of one
 * inversion (source height, wind speed, stability class).
 */

#ifndef PLUME_PARAMETERS_HPP
#define PLUME_PARAMETERS_HPP

#include <Eigen/Dense>
#include "stability_class.hpp"

namespace plumeinv {

/// Seconds per hour (kg/s ↔ kg/hr)
constexpr double SECONDS_PER_HOUR = 3600.0;

/**
 * @brief Plume parameters
 *
 * The free parameter vector is [log_Q, source_x, source_y].
 * Q = exp(log_Q) is positive for every finite log_Q, so no gradient
 * step can produce a zero or negative emission rate.
 */
class PlumeParameters {
public:
    /// Number of free parameters
    static constexpr Eigen::Index N_FREE = 3;

    /// Indices into the free parameter vector
    static constexpr Eigen::Index LOG_Q = 0;
    static constexpr Eigen::Index SOURCE_X = 1;
    static constexpr Eigen::Index SOURCE_Y = 2;

    /**
     * @brief Constructor
     * @param emission_rate_kg_s Emission rate Q (kg/s), floored at MIN_EMISSION_RATE
     * @param source_height Effective source height H (m)
     * @param wind_speed Wind speed u (m/s)
     * @param stability_class Pasquill-Gifford class
     * @param source_x Source x offset (m)
     * @param source_y Source y offset (m)
     */
    PlumeParameters(
        double emission_rate_kg_s = 0.01,
        double source_height = 5.0,
        double wind_speed = 3.0,
        StabilityClass stability_class = StabilityClass::D,
        double source_x = 0.0,
        double source_y = 0.0
    );

    /**
     * @brief Emission rate (kg/s), always positive
     */
    double emission_rate_kg_s() const;

    /**
     * @brief Emission rate (kg/hr)
     */
    double emission_rate_kg_hr() const { return emission_rate_kg_s() * SECONDS_PER_HOUR; }

    double log_emission_rate() const { return log_q_; }
    void set_log_emission_rate(double value) { log_q_ = value; }

    /**
     * @brief Set emission rate (kg/s), floored at MIN_EMISSION_RATE
     */
    void set_emission_rate_kg_s(double value);

    double source_x() const { return source_x_; }
    double source_y() const { return source_y_; }
    void set_source_offset(double x, double y) {
        source_x_ = x;
        source_y_ = y;
    }

    double source_height() const { return source_height_; }
    double wind_speed() const { return wind_speed_; }

    /**
     * @brief Wind speed as used by the model: max(u, MIN_WIND_SPEED)
     */
    double effective_wind_speed() const;

    StabilityClass stability_class() const { return stability_class_; }
    const DispersionCoefficients& coefficients() const {
        return dispersion_coefficients(stability_class_);
    }

    /**
     * @brief Free parameters as a vector [log_Q, source_x, source_y]
     */
    Eigen::Vector3d free_parameters() const;

    /**
     * @brief Set free parameters from a vector
     * @param vec Vector of size N_FREE
     */
    void set_free_parameters(const Eigen::VectorXd& vec);

    static constexpr double MIN_EMISSION_RATE = 1e-8;  // kg/s, floor before log
    static constexpr double MIN_WIND_SPEED = 0.5;      // m/s

private:
    double log_q_;           ///< log(Q), Q in kg/s
    double source_x_;        ///< Source x offset (m)
    double source_y_;        ///< Source y offset (m)
    double source_height_;   ///< H (m)
    double wind_speed_;      ///< u (m/s), unclamped
    StabilityClass stability_class_;
};

} // namespace plumeinv

#endif // PLUME_PARAMETERS_HPP
