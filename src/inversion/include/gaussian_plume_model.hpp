/**
 * @file gaussian_plume_model.hpp
 * @brief Differentiable Gaussian plume forward model
 *
 * Ground-level (or arbitrary height) concentration downwind of a
 * continuous point source:
 *
 * C(x,y,z) = Q / (2π u σ_y σ_z) × exp(-y²/(2σ_y²))
 *            × [exp(-(z-H)²/(2σ_z²)) + exp(-(z+H)²/(2σ_z²))]
 *
 * The second vertical term is the ground reflection. The result is
 * multiplied by a smooth downwind mask sigmoid(10·dx) so the field is
 * differentiable everywhere, including upwind of the source.
 *
 * Coordinates are wind-aligned: x downwind, y crosswind, z vertical (m).
 */

#ifndef GAUSSIAN_PLUME_MODEL_HPP
#define GAUSSIAN_PLUME_MODEL_HPP

#include <Eigen/Dense>
#include <cmath>
#include "plume_parameters.hpp"
#include "stability_class.hpp"

namespace plumeinv {

/**
 * @brief Concentration field sampled on a regular 2D grid
 */
struct ConcentrationGrid {
    Eigen::MatrixXd x;              ///< Downwind coordinate (m), row i = x_i
    Eigen::MatrixXd y;              ///< Crosswind coordinate (m), column j = y_j
    Eigen::MatrixXd concentration;  ///< Concentration (kg/m³)
};

/**
 * @brief Gaussian plume model
 *
 * Pure function of its current parameters. The emission rate is stored and
 * optimized as log(Q).
 */
class GaussianPlumeModel {
public:
    /**
     * @brief Constructor
     * @param params Initial plume parameters
     */
    explicit GaussianPlumeModel(const PlumeParameters& params = PlumeParameters());

    /**
     * @brief Concentration at receptor locations
     * @param receptor_x Receptor x positions (m)
     * @param receptor_y Receptor y positions (m)
     * @param receptor_z Receptor z positions (m), typically 0
     * @param wind_speed Wind speed (m/s), clamped to 0.5
     * @return Concentration at each receptor (kg/m³)
     */
    Eigen::VectorXd evaluate(
        const Eigen::VectorXd& receptor_x,
        const Eigen::VectorXd& receptor_y,
        const Eigen::VectorXd& receptor_z,
        double wind_speed
    ) const;

    /**
     * @brief Concentration at receptor locations using the parameters' wind speed
     */
    Eigen::VectorXd evaluate(
        const Eigen::VectorXd& receptor_x,
        const Eigen::VectorXd& receptor_y,
        const Eigen::VectorXd& receptor_z
    ) const;

    /**
     * @brief Sample the ground-level field on a grid for visualization
     * @param grid_size Points per axis (>= 2)
     * @param domain_m Domain size (m); x spans [-0.2·domain, domain],
     *                 y spans [-domain/2, domain/2]
     * @param wind_speed Wind speed (m/s)
     * @param z Sampling height (m)
     */
    ConcentrationGrid concentration_grid(
        size_t grid_size = 100,
        double domain_m = 5000.0,
        double wind_speed = 3.0,
        double z = 0.0
    ) const;

    /**
     * @brief Lateral spread σ_y (m) for this model's stability class
     * @param x_km Downwind distance (km)
     */
    double sigma_y(double x_km) const;

    /**
     * @brief Vertical spread σ_z (m) for this model's stability class
     * @param x_km Downwind distance (km)
     */
    double sigma_z(double x_km) const;

    const PlumeParameters& parameters() const { return params_; }
    PlumeParameters& parameters() { return params_; }

    /**
     * @brief Single-receptor plume equation, generic over the scalar type
     *
     * Instantiated with double for evaluation and with an AutoDiff scalar
     * for gradients with respect to (log_Q, source_x, source_y).
     *
     * @param log_q log of emission rate (kg/s)
     * @param source_x Source x offset (m)
     * @param source_y Source y offset (m)
     * @param source_height H (m)
     * @param wind_speed Effective wind speed (m/s), already clamped
     * @param coeffs Dispersion coefficients
     * @param rx Receptor x (m)
     * @param ry Receptor y (m)
     * @param rz Receptor z (m)
     */
    template <typename Scalar>
    static Scalar concentration(
        const Scalar& log_q,
        const Scalar& source_x,
        const Scalar& source_y,
        double source_height,
        double wind_speed,
        const DispersionCoefficients& coeffs,
        double rx,
        double ry,
        double rz
    );

    /**
     * @brief Smooth downwind mask sigmoid(10·dx)
     *
     * Overflow-free form: far upwind the mask underflows to exactly zero
     * instead of producing inf/inf.
     */
    template <typename Scalar>
    static Scalar downwind_mask(const Scalar& dx);

    static constexpr double DOWNWIND_MASK_SHARPNESS = 10.0;  // 1/m

private:
    PlumeParameters params_;

    static constexpr double PI = 3.14159265358979323846;
};

template <typename Scalar>
Scalar GaussianPlumeModel::downwind_mask(const Scalar& dx) {
    using std::exp;

    const Scalar z = dx * DOWNWIND_MASK_SHARPNESS;
    if (z >= 0.0) {
        const Scalar e = exp(-z);
        return 1.0 / (1.0 + e);
    }
    const Scalar e = exp(z);
    return e / (1.0 + e);
}

template <typename Scalar>
Scalar GaussianPlumeModel::concentration(
    const Scalar& log_q,
    const Scalar& source_x,
    const Scalar& source_y,
    double source_height,
    double wind_speed,
    const DispersionCoefficients& coeffs,
    double rx,
    double ry,
    double rz
) {
    using std::abs;
    using std::exp;

    const Scalar q = exp(log_q);

    const Scalar dx = rx - source_x;   // downwind
    const Scalar dy = ry - source_y;   // crosswind
    const double dz = rz;              // height above ground

    const Scalar x_km = abs(dx) / 1000.0;
    const Scalar sy = plumeinv::sigma_y(coeffs, x_km);
    const Scalar sz = plumeinv::sigma_z(coeffs, x_km);

    const Scalar two_sy2 = 2.0 * (sy * sy);
    const Scalar two_sz2 = 2.0 * (sz * sz);

    const Scalar dy2 = dy * dy;
    const Scalar lateral = exp(-dy2 / two_sy2);

    const double below = (dz - source_height) * (dz - source_height);
    const double above = (dz + source_height) * (dz + source_height);
    const Scalar direct = exp(-below / two_sz2);
    const Scalar reflected = exp(-above / two_sz2);
    const Scalar vertical = direct + reflected;

    const Scalar denom = (2.0 * PI * wind_speed) * (sy * sz);
    const Scalar peak = q / denom;

    const Scalar c = peak * lateral;
    const Scalar cv = c * vertical;
    return cv * downwind_mask(dx);
}

} // namespace plumeinv

#endif // GAUSSIAN_PLUME_MODEL_HPP
