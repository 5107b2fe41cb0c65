/**
 * @file adam_optimizer.hpp
 * @brief First-order moment-based optimizer with plateau learning-rate decay
 *
 * AdamOptimizer implements bias-corrected Adam (Kingma & Ba, 2015).
 * PlateauScheduler halves (by default) the learning rate when the loss
 * stops improving for a patience window.
 */

#ifndef ADAM_OPTIMIZER_HPP
#define ADAM_OPTIMIZER_HPP

#include <Eigen/Dense>
#include <cstddef>

namespace plumeinv {

/**
 * @brief Adam optimizer over a dense parameter vector
 */
class AdamOptimizer {
public:
    /**
     * @brief Optimizer settings
     */
    struct Config {
        double learning_rate = 0.1;  ///< Step size
        double beta1 = 0.9;          ///< First-moment decay
        double beta2 = 0.999;        ///< Second-moment decay
        double epsilon = 1e-8;       ///< Denominator regularizer
    };

    AdamOptimizer();

    /**
     * @brief Constructor
     * @param config Optimizer settings
     */
    explicit AdamOptimizer(const Config& config);

    /**
     * @brief Apply one update in place
     * @param params Parameter vector (updated)
     * @param grad Gradient of the loss at params
     */
    void step(Eigen::VectorXd& params, const Eigen::VectorXd& grad);

    double learning_rate() const { return learning_rate_; }
    void set_learning_rate(double lr) { learning_rate_ = lr; }

    /**
     * @brief Number of steps taken since construction or reset()
     */
    size_t step_count() const { return step_count_; }

    /**
     * @brief Clear moment estimates and restore the configured learning rate
     */
    void reset();

    const Config& config() const { return config_; }

private:
    Config config_;
    double learning_rate_;

    Eigen::VectorXd m_;  ///< First-moment estimate
    Eigen::VectorXd v_;  ///< Second-moment estimate
    size_t step_count_;

    // Running powers beta1^t, beta2^t for bias correction
    double beta1_pow_;
    double beta2_pow_;
};

/**
 * @brief Reduce-on-plateau learning-rate schedule
 */
class PlateauScheduler {
public:
    /**
     * @brief Scheduler settings
     */
    struct Config {
        double factor = 0.5;              ///< Multiplier applied on plateau
        size_t patience = 50;             ///< Bad iterations tolerated before reducing
        double threshold = 1e-4;          ///< Relative improvement that counts as progress
        double min_learning_rate = 1e-4;  ///< Floor
    };

    PlateauScheduler();

    /**
     * @brief Constructor
     * @param config Scheduler settings
     */
    explicit PlateauScheduler(const Config& config);

    /**
     * @brief Record a loss value and reduce the optimizer's rate if on a plateau
     * @param loss Current loss
     * @param optimizer Optimizer whose learning rate is managed
     * @return True if the learning rate was reduced
     */
    bool step(double loss, AdamOptimizer& optimizer);

    size_t reduction_count() const { return reduction_count_; }
    double best_loss() const { return best_loss_; }

    const Config& config() const { return config_; }

private:
    Config config_;
    double best_loss_;
    size_t bad_iterations_;
    size_t reduction_count_;
};

} // namespace plumeinv

#endif // ADAM_OPTIMIZER_HPP
