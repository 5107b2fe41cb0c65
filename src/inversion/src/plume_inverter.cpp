/**
 * @file plume_inverter.cpp
 * @brief Implementation of the plume inverse solver
 */

#include "plume_inverter.hpp"
#include <unsupported/Eigen/AutoDiff>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace plumeinv {

namespace {

/// Scalar carrying derivatives w.r.t. [log_Q, source_x, source_y]
using ADScalar = Eigen::AutoDiffScalar<Eigen::Vector3d>;

void check_receptor_set(
    const Eigen::VectorXd& observed,
    const Eigen::VectorXd& receptor_x,
    const Eigen::VectorXd& receptor_y,
    const Eigen::VectorXd& receptor_z
) {
    const Eigen::Index n = observed.size();
    if (receptor_x.size() != n || receptor_y.size() != n || receptor_z.size() != n) {
        throw std::invalid_argument(
            "observed_concentrations and receptor coordinate arrays must have equal length");
    }
    if (n == 0) {
        throw std::invalid_argument("Receptor set is empty");
    }
}

} // namespace

PlumeInverter::PlumeInverter()
    : PlumeInverter(Config())
{
}

PlumeInverter::PlumeInverter(const Config& config)
    : config_(config)
{
    if (!(config.learning_rate > 0.0)) {
        throw std::invalid_argument("learning_rate must be positive");
    }
    if (config.max_iterations == 0) {
        throw std::invalid_argument("max_iterations must be positive");
    }
    if (config.convergence_tol < 0.0) {
        throw std::invalid_argument("convergence_tol must be non-negative");
    }
    if (config.absolute_loss_tol < 0.0) {
        throw std::invalid_argument("absolute_loss_tol must be non-negative");
    }
    if (!(config.lr_factor > 0.0 && config.lr_factor < 1.0)) {
        throw std::invalid_argument("lr_factor must be in (0, 1)");
    }
    if (config.min_learning_rate < 0.0 || config.min_learning_rate > config.learning_rate) {
        throw std::invalid_argument("min_learning_rate must be in [0, learning_rate]");
    }
    if (!(config.max_log_std_error > 0.0)) {
        throw std::invalid_argument("max_log_std_error must be positive");
    }
    if (!(config.fallback_ci_fraction > 0.0 && config.fallback_ci_fraction < 1.0)) {
        throw std::invalid_argument("fallback_ci_fraction must be in (0, 1)");
    }
}

InversionResult PlumeInverter::invert(
    const Eigen::VectorXd& observed_concentrations,
    const Eigen::VectorXd& receptor_x,
    const Eigen::VectorXd& receptor_y,
    const Eigen::VectorXd& receptor_z,
    double wind_speed,
    double initial_Q,
    double source_height,
    std::optional<double> true_Q_kg_hr
) const {
    auto start = std::chrono::high_resolution_clock::now();

    check_receptor_set(observed_concentrations, receptor_x, receptor_y, receptor_z);

    InversionResult result;

    // 1. Scale observations to O(1); raw values can be ~1e-10 and the
    //    squared misfit would underflow
    const double max_obs = observed_concentrations.maxCoeff();
    const double scale = (std::isfinite(max_obs) && max_obs >= MIN_SCALE) ? max_obs : 1.0;
    const Eigen::VectorXd scaled_obs = observed_concentrations / scale;

    // 2. Starting point
    double start_q = initial_Q;
    if (config_.adaptive_initialization) {
        const std::optional<double> adaptive = estimate_initial_emission_rate(
            observed_concentrations, receptor_x, wind_speed, config_.stability_class
        );
        if (adaptive && *adaptive > 0.0) {
            start_q = *adaptive;
            result.adaptive_initialization = true;
        }
    }

    PlumeParameters params(start_q, source_height, wind_speed, config_.stability_class);
    result.initial_Q_kg_s = params.emission_rate_kg_s();

    // 3. Optimization loop
    AdamOptimizer::Config adam_config;
    adam_config.learning_rate = config_.learning_rate;
    AdamOptimizer optimizer(adam_config);

    PlateauScheduler::Config schedule_config;
    schedule_config.factor = config_.lr_factor;
    schedule_config.patience = config_.lr_patience;
    schedule_config.threshold = config_.lr_threshold;
    schedule_config.min_learning_rate = config_.min_learning_rate;
    PlateauScheduler scheduler(schedule_config);

    if (config_.record_history) {
        result.loss_history.reserve(config_.max_iterations);
        result.emission_rate_history.reserve(config_.max_iterations);
    }

    Eigen::VectorXd theta = params.free_parameters();
    double prev_loss = std::numeric_limits<double>::quiet_NaN();

    for (size_t iter = 1; iter <= config_.max_iterations; ++iter) {
        const auto [loss, grad] = loss_and_gradient(
            params, scaled_obs, scale, receptor_x, receptor_y, receptor_z
        );

        // A non-finite misfit leaves the last finite iterate in place
        if (!std::isfinite(loss) || !grad.allFinite()) {
            break;
        }

        optimizer.step(theta, grad);
        params.set_free_parameters(theta);
        scheduler.step(loss, optimizer);

        result.final_loss = loss;
        result.n_iterations = iter;
        if (config_.record_history) {
            result.loss_history.push_back(loss);
            result.emission_rate_history.push_back(params.emission_rate_kg_s());
        }

        // 4. Convergence, only after warm-up
        if (iter > 1 && iter >= config_.min_iterations &&
            has_converged(prev_loss, loss)) {
            result.converged = true;
            break;
        }

        prev_loss = loss;
    }

    result.final_learning_rate = optimizer.learning_rate();
    result.lr_reductions = scheduler.reduction_count();

    // 5. Confidence interval from curvature in log(Q)
    const double curvature = log_rate_curvature(
        params, scaled_obs, scale, receptor_x, receptor_y, receptor_z
    );
    result.confidence_interval = confidence_interval(
        params.log_emission_rate(), curvature,
        result.ci_fallback, result.ci_std_error_capped
    );

    // 6./7. Estimates and validation metric
    result.estimated_Q_kg_s = params.emission_rate_kg_s();
    result.estimated_Q_kg_hr = params.emission_rate_kg_hr();
    result.estimated_source_x = params.source_x();
    result.estimated_source_y = params.source_y();

    result.true_Q_kg_hr = true_Q_kg_hr;
    if (true_Q_kg_hr && *true_Q_kg_hr > 0.0) {
        result.error_pct =
            100.0 * std::abs(result.estimated_Q_kg_hr - *true_Q_kg_hr) / *true_Q_kg_hr;
    }

    auto end = std::chrono::high_resolution_clock::now();
    result.elapsed_ms =
        std::chrono::duration<double, std::milli>(end - start).count();

    return result;
}

bool PlumeInverter::has_converged(double previous_loss, double loss) const {
    // A noise-free fit drives the loss toward zero geometrically; its
    // relative change never settles, so an absolute floor ends it
    if (loss < config_.absolute_loss_tol) {
        return true;
    }
    const double rel_change =
        std::abs(previous_loss - loss) / std::max(previous_loss, MIN_LOSS_DENOMINATOR);
    return rel_change < config_.convergence_tol;
}

InversionResult PlumeInverter::invert(
    const SyntheticObservation& observation,
    double initial_Q
) const {
    if (observation.stability_class != config_.stability_class) {
        throw std::invalid_argument(
            "Observation stability class " + to_string(observation.stability_class) +
            " does not match inverter class " + to_string(config_.stability_class));
    }

    return invert(
        observation.observed_concentrations,
        observation.receptor_x,
        observation.receptor_y,
        observation.receptor_z,
        observation.wind_speed,
        initial_Q,
        observation.source_height,
        observation.true_Q_kg_hr
    );
}

std::optional<double> PlumeInverter::estimate_initial_emission_rate(
    const Eigen::VectorXd& observed_concentrations,
    const Eigen::VectorXd& receptor_x,
    double wind_speed,
    StabilityClass stability_class
) {
    if (observed_concentrations.size() == 0 ||
        receptor_x.size() != observed_concentrations.size()) {
        return std::nullopt;
    }

    Eigen::Index i_peak = 0;
    const double c_peak = observed_concentrations.maxCoeff(&i_peak);

    const double distance = std::max(receptor_x(i_peak), MIN_PEAK_DISTANCE_M);
    const double x_km = distance / 1000.0;

    const DispersionCoefficients& coeffs = dispersion_coefficients(stability_class);
    const double sy = sigma_y(coeffs, x_km);
    const double sz = sigma_z(coeffs, x_km);
    const double u = std::max(wind_speed, PlumeParameters::MIN_WIND_SPEED);

    // On-axis, ground level: C_peak ≈ Q / (2π u σ_y σ_z)
    const double q = c_peak * 2.0 * 3.14159265358979323846 * u * sy * sz;
    if (!std::isfinite(q)) {
        return std::nullopt;
    }

    return std::clamp(q, MIN_INITIAL_Q, MAX_INITIAL_Q);
}

std::pair<double, Eigen::Vector3d> PlumeInverter::loss_and_gradient(
    const PlumeParameters& params,
    const Eigen::VectorXd& scaled_observations,
    double scale,
    const Eigen::VectorXd& receptor_x,
    const Eigen::VectorXd& receptor_y,
    const Eigen::VectorXd& receptor_z
) {
    const Eigen::Index n = scaled_observations.size();

    // Seed one derivative direction per free parameter
    const ADScalar log_q(params.log_emission_rate(), PlumeParameters::N_FREE, PlumeParameters::LOG_Q);
    const ADScalar source_x(params.source_x(), PlumeParameters::N_FREE, PlumeParameters::SOURCE_X);
    const ADScalar source_y(params.source_y(), PlumeParameters::N_FREE, PlumeParameters::SOURCE_Y);

    const double u = params.effective_wind_speed();
    const double h = params.source_height();
    const DispersionCoefficients& coeffs = params.coefficients();

    double sum_sq = 0.0;
    Eigen::Vector3d grad = Eigen::Vector3d::Zero();

    for (Eigen::Index i = 0; i < n; ++i) {
        const ADScalar c = GaussianPlumeModel::concentration<ADScalar>(
            log_q, source_x, source_y, h, u, coeffs,
            receptor_x(i), receptor_y(i), receptor_z(i)
        );

        const double residual = c.value() / scale - scaled_observations(i);
        sum_sq += residual * residual;
        grad += (2.0 * residual / scale) * c.derivatives();
    }

    return {sum_sq / n, grad / static_cast<double>(n)};
}

double PlumeInverter::log_rate_curvature(
    const PlumeParameters& params,
    const Eigen::VectorXd& scaled_observations,
    double scale,
    const Eigen::VectorXd& receptor_x,
    const Eigen::VectorXd& receptor_y,
    const Eigen::VectorXd& receptor_z
) {
    const GaussianPlumeModel model(params);
    const Eigen::VectorXd predicted =
        model.evaluate(receptor_x, receptor_y, receptor_z) / scale;
    const Eigen::VectorXd residual = predicted - scaled_observations;

    return (2.0 * predicted.cwiseAbs2() + 2.0 * residual.cwiseProduct(predicted)).mean();
}

std::pair<double, double> PlumeInverter::confidence_interval(
    double log_q,
    double curvature,
    bool& used_fallback,
    bool& std_error_capped
) const {
    const double q_kg_hr = std::exp(log_q) * SECONDS_PER_HOUR;
    std_error_capped = false;

    if (std::isfinite(curvature) && curvature > 0.0) {
        // Cap SE so exp() below cannot overflow
        const double raw_se = 1.0 / std::sqrt(curvature);
        std_error_capped = !(raw_se <= config_.max_log_std_error);
        const double se = std_error_capped ? config_.max_log_std_error : raw_se;
        const double low = std::exp(log_q - Z_95 * se) * SECONDS_PER_HOUR;
        const double high = std::exp(log_q + Z_95 * se) * SECONDS_PER_HOUR;

        if (std::isfinite(low) && std::isfinite(high) && low <= q_kg_hr && q_kg_hr <= high) {
            used_fallback = false;
            return {low, high};
        }
    }

    used_fallback = true;
    std_error_capped = false;
    return {
        q_kg_hr * (1.0 - config_.fallback_ci_fraction),
        q_kg_hr * (1.0 + config_.fallback_ci_fraction)
    };
}

} // namespace plumeinv
