/**
 * @file gaussian_plume_model.cpp
 * @brief Implementation of the Gaussian plume forward model
 */

#include "gaussian_plume_model.hpp"
#include <algorithm>
#include <stdexcept>

namespace plumeinv {

GaussianPlumeModel::GaussianPlumeModel(const PlumeParameters& params)
    : params_(params)
{
}

Eigen::VectorXd GaussianPlumeModel::evaluate(
    const Eigen::VectorXd& receptor_x,
    const Eigen::VectorXd& receptor_y,
    const Eigen::VectorXd& receptor_z,
    double wind_speed
) const {
    const Eigen::Index n = receptor_x.size();
    if (receptor_y.size() != n || receptor_z.size() != n) {
        throw std::invalid_argument("Receptor coordinate arrays must have equal length");
    }

    const double u = std::max(wind_speed, PlumeParameters::MIN_WIND_SPEED);
    const double log_q = params_.log_emission_rate();
    const double sx = params_.source_x();
    const double sy = params_.source_y();
    const double h = params_.source_height();
    const DispersionCoefficients& coeffs = params_.coefficients();

    Eigen::VectorXd conc(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        conc(i) = concentration<double>(
            log_q, sx, sy, h, u, coeffs,
            receptor_x(i), receptor_y(i), receptor_z(i)
        );
    }

    return conc;
}

Eigen::VectorXd GaussianPlumeModel::evaluate(
    const Eigen::VectorXd& receptor_x,
    const Eigen::VectorXd& receptor_y,
    const Eigen::VectorXd& receptor_z
) const {
    return evaluate(receptor_x, receptor_y, receptor_z, params_.wind_speed());
}

ConcentrationGrid GaussianPlumeModel::concentration_grid(
    size_t grid_size,
    double domain_m,
    double wind_speed,
    double z
) const {
    if (grid_size < 2) {
        throw std::invalid_argument("grid_size must be at least 2");
    }
    if (!(domain_m > 0.0)) {
        throw std::invalid_argument("domain_m must be positive");
    }

    const Eigen::Index n = static_cast<Eigen::Index>(grid_size);
    const Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(n, -0.2 * domain_m, domain_m);
    const Eigen::VectorXd y = Eigen::VectorXd::LinSpaced(n, -0.5 * domain_m, 0.5 * domain_m);

    // Flatten the grid row-major (x outer, y inner) and evaluate in one pass
    Eigen::VectorXd flat_x(n * n);
    Eigen::VectorXd flat_y(n * n);
    for (Eigen::Index i = 0; i < n; ++i) {
        flat_x.segment(i * n, n).setConstant(x(i));
        flat_y.segment(i * n, n) = y;
    }
    const Eigen::VectorXd flat_z = Eigen::VectorXd::Constant(n * n, z);

    const Eigen::VectorXd flat_c = evaluate(flat_x, flat_y, flat_z, wind_speed);

    ConcentrationGrid grid;
    grid.x.resize(n, n);
    grid.y.resize(n, n);
    grid.concentration.resize(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            grid.x(i, j) = x(i);
            grid.y(i, j) = y(j);
            grid.concentration(i, j) = flat_c(i * n + j);
        }
    }

    return grid;
}

double GaussianPlumeModel::sigma_y(double x_km) const {
    return plumeinv::sigma_y(params_.coefficients(), x_km);
}

double GaussianPlumeModel::sigma_z(double x_km) const {
    return plumeinv::sigma_z(params_.coefficients(), x_km);
}

} // namespace plumeinv
