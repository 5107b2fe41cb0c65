/**
 * @file plume_inverter.hpp
 * @brief Gradient-based inversion of the Gaussian plume model
 *
 * Recovers the emission rate Q (and, as a side parameter, the horizontal
 * source offset) from noisy concentrations at known receptors by
 * minimizing the mean squared misfit with Adam. Gradients come from
 * forward-mode automatic differentiation of the plume equation; the 95%
 * confidence interval on Q comes from the loss curvature in log(Q).
 */

#ifndef PLUME_INVERTER_HPP
#define PLUME_INVERTER_HPP

#include <Eigen/Dense>
#include <optional>
#include <utility>
#include <vector>

#include "adam_optimizer.hpp"
#include "gaussian_plume_model.hpp"
#include "plume_parameters.hpp"
#include "stability_class.hpp"
#include "synthetic_observation.hpp"

namespace plumeinv {

/**
 * @brief Outcome of one inversion
 */
struct InversionResult {
    double estimated_Q_kg_hr = 0.0;
    double estimated_Q_kg_s = 0.0;
    double estimated_source_x = 0.0;  ///< m; not validated against a known offset
    double estimated_source_y = 0.0;  ///< m
    std::optional<double> true_Q_kg_hr;  ///< Known rate, validation runs only
    std::optional<double> error_pct;     ///< 100·|Q_est - Q_true| / Q_true
    std::pair<double, double> confidence_interval{0.0, 0.0};  ///< 95% CI on Q (kg/hr)
    double final_loss = 0.0;
    size_t n_iterations = 0;
    bool converged = false;

    // Diagnostics
    double initial_Q_kg_s = 0.0;          ///< Starting point actually used
    bool adaptive_initialization = false;  ///< Starting point came from the peak receptor
    bool ci_fallback = false;              ///< CI is the ±fraction heuristic
    bool ci_std_error_capped = false;      ///< SE of log(Q) hit max_log_std_error
    double final_learning_rate = 0.0;
    size_t lr_reductions = 0;
    std::vector<double> loss_history;           ///< Loss per iteration
    std::vector<double> emission_rate_history;  ///< Q (kg/s) after each step
    double elapsed_ms = 0.0;
};

/**
 * @brief Inverse solver for the emission rate of a point source
 *
 * invert() is const and keeps all per-call state (model, optimizer,
 * scheduler) local, so one inverter may serve concurrent callers.
 */
class PlumeInverter {
public:
    /**
     * @brief Solver settings
     */
    struct Config {
        double learning_rate = 0.1;
        size_t max_iterations = 2000;
        double convergence_tol = 1e-6;      ///< On relative change between consecutive losses
        double absolute_loss_tol = 1e-6;    ///< Scaled loss below this counts as converged
        size_t min_iterations = 300;        ///< Warm-up before convergence is checked
        StabilityClass stability_class = StabilityClass::D;

        // Learning-rate schedule
        size_t lr_patience = 50;
        double lr_factor = 0.5;
        double lr_threshold = 1e-4;
        double min_learning_rate = 1e-4;

        // Confidence interval
        double max_log_std_error = 5.0;     ///< Cap on SE of log(Q) before exponentiating
        double fallback_ci_fraction = 0.3;  ///< ±fraction when the curvature is unusable

        bool adaptive_initialization = true;
        bool record_history = true;
    };

    PlumeInverter();

    /**
     * @brief Constructor
     * @param config Solver settings
     * @throws std::invalid_argument on invalid settings
     */
    explicit PlumeInverter(const Config& config);

    /**
     * @brief Estimate the emission rate from observations
     * @param observed_concentrations Observed concentration per receptor (kg/m³)
     * @param receptor_x Receptor x positions (m)
     * @param receptor_y Receptor y positions (m)
     * @param receptor_z Receptor z positions (m)
     * @param wind_speed Wind speed (m/s)
     * @param initial_Q Caller's initial guess (kg/s)
     * @param source_height Source height (m)
     * @param true_Q_kg_hr True rate for validation (kg/hr), optional
     * @return Best-effort result; numerical degeneracies never throw
     * @throws std::invalid_argument on mismatched or empty arrays
     */
    InversionResult invert(
        const Eigen::VectorXd& observed_concentrations,
        const Eigen::VectorXd& receptor_x,
        const Eigen::VectorXd& receptor_y,
        const Eigen::VectorXd& receptor_z,
        double wind_speed = 3.0,
        double initial_Q = 0.01,
        double source_height = 5.0,
        std::optional<double> true_Q_kg_hr = std::nullopt
    ) const;

    /**
     * @brief Invert a synthetic observation (true rate attached)
     * @throws std::invalid_argument if the observation was generated under a
     *         different stability class than this inverter's
     */
    InversionResult invert(
        const SyntheticObservation& observation,
        double initial_Q = 0.01
    ) const;

    /**
     * @brief Starting emission rate from the peak receptor
     *
     * Inverts the on-axis, ground-level plume equation
     * C_peak ≈ Q / (2π u σ_y σ_z) at the receptor with the largest
     * observation, its downwind distance floored at 10 m, and clamps the
     * result to [1e-10, 100] kg/s.
     *
     * @return Estimate (kg/s), or nullopt if not computable
     */
    static std::optional<double> estimate_initial_emission_rate(
        const Eigen::VectorXd& observed_concentrations,
        const Eigen::VectorXd& receptor_x,
        double wind_speed,
        StabilityClass stability_class
    );

    /**
     * @brief Mean squared scaled misfit and its gradient
     * @param params Current parameters
     * @param scaled_observations Observations divided by scale
     * @param scale Observation scale factor
     * @return (loss, gradient w.r.t. [log_Q, source_x, source_y])
     */
    static std::pair<double, Eigen::Vector3d> loss_and_gradient(
        const PlumeParameters& params,
        const Eigen::VectorXd& scaled_observations,
        double scale,
        const Eigen::VectorXd& receptor_x,
        const Eigen::VectorXd& receptor_y,
        const Eigen::VectorXd& receptor_z
    );

    /**
     * @brief Second derivative of the loss with respect to log(Q)
     *
     * Concentration is proportional to Q, so dC/dlog(Q) = C and
     * d²L/dlog(Q)² = mean(2·ĉ² + 2·r·ĉ), with ĉ the scaled prediction and
     * r the scaled residual.
     */
    static double log_rate_curvature(
        const PlumeParameters& params,
        const Eigen::VectorXd& scaled_observations,
        double scale,
        const Eigen::VectorXd& receptor_x,
        const Eigen::VectorXd& receptor_y,
        const Eigen::VectorXd& receptor_z
    );

    /**
     * @brief 95% confidence interval on Q (kg/hr)
     * @param log_q Estimated log(Q)
     * @param curvature d²L/dlog(Q)²
     * @param used_fallback Set to true when the heuristic interval is returned
     * @param std_error_capped Set to true when the curvature-based SE was
     *        clamped to max_log_std_error (interval width is then the cap's)
     */
    std::pair<double, double> confidence_interval(
        double log_q,
        double curvature,
        bool& used_fallback,
        bool& std_error_capped
    ) const;

    /**
     * @brief Convergence test between consecutive iterations
     *
     * True when the scaled loss is below absolute_loss_tol, or when
     * |L_prev - L| / L_prev is below convergence_tol.
     */
    bool has_converged(double previous_loss, double loss) const;

    const Config& config() const { return config_; }

    static constexpr double MIN_SCALE = 1e-15;         ///< Below this max, use unit scale
    static constexpr double MIN_PEAK_DISTANCE_M = 10.0;
    static constexpr double MIN_INITIAL_Q = 1e-10;     // kg/s
    static constexpr double MAX_INITIAL_Q = 100.0;     // kg/s
    static constexpr double Z_95 = 1.96;
    static constexpr double MIN_LOSS_DENOMINATOR = 1e-300;

private:
    Config config_;
};

} // namespace plumeinv

#endif // PLUME_INVERTER_HPP
