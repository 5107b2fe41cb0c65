/**
 * @file adam_optimizer.cpp
 * @brief Implementation of Adam and the plateau scheduler
 */

#include "adam_optimizer.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace plumeinv {

// =======================
// AdamOptimizer
// =======================

AdamOptimizer::AdamOptimizer()
    : AdamOptimizer(Config())
{
}

AdamOptimizer::AdamOptimizer(const Config& config)
    : config_(config)
    , learning_rate_(config.learning_rate)
    , step_count_(0)
    , beta1_pow_(1.0)
    , beta2_pow_(1.0)
{
    if (!(config.learning_rate > 0.0)) {
        throw std::invalid_argument("learning_rate must be positive");
    }
    if (config.beta1 < 0.0 || config.beta1 >= 1.0) {
        throw std::invalid_argument("beta1 must be in [0, 1)");
    }
    if (config.beta2 < 0.0 || config.beta2 >= 1.0) {
        throw std::invalid_argument("beta2 must be in [0, 1)");
    }
    if (!(config.epsilon > 0.0)) {
        throw std::invalid_argument("epsilon must be positive");
    }
}

void AdamOptimizer::step(Eigen::VectorXd& params, const Eigen::VectorXd& grad) {
    if (params.size() != grad.size()) {
        throw std::invalid_argument("Gradient size does not match parameter size");
    }

    // Moments are sized on the first step
    if (step_count_ == 0) {
        m_ = Eigen::VectorXd::Zero(params.size());
        v_ = Eigen::VectorXd::Zero(params.size());
    } else if (m_.size() != params.size()) {
        throw std::invalid_argument("Parameter dimension changed between steps");
    }

    ++step_count_;
    beta1_pow_ *= config_.beta1;
    beta2_pow_ *= config_.beta2;

    m_ = config_.beta1 * m_ + (1.0 - config_.beta1) * grad;
    v_ = config_.beta2 * v_ + (1.0 - config_.beta2) * grad.cwiseAbs2();

    const Eigen::VectorXd m_hat = m_ / (1.0 - beta1_pow_);
    const Eigen::VectorXd v_hat = v_ / (1.0 - beta2_pow_);

    params.array() -= learning_rate_ * m_hat.array() / (v_hat.array().sqrt() + config_.epsilon);
}

void AdamOptimizer::reset() {
    learning_rate_ = config_.learning_rate;
    m_.resize(0);
    v_.resize(0);
    step_count_ = 0;
    beta1_pow_ = 1.0;
    beta2_pow_ = 1.0;
}

// =======================
// PlateauScheduler
// =======================

PlateauScheduler::PlateauScheduler()
    : PlateauScheduler(Config())
{
}

PlateauScheduler::PlateauScheduler(const Config& config)
    : config_(config)
    , best_loss_(std::numeric_limits<double>::infinity())
    , bad_iterations_(0)
    , reduction_count_(0)
{
    if (!(config.factor > 0.0 && config.factor < 1.0)) {
        throw std::invalid_argument("factor must be in (0, 1)");
    }
    if (config.threshold < 0.0) {
        throw std::invalid_argument("threshold must be non-negative");
    }
    if (config.min_learning_rate < 0.0) {
        throw std::invalid_argument("min_learning_rate must be non-negative");
    }
}

bool PlateauScheduler::step(double loss, AdamOptimizer& optimizer) {
    if (loss < best_loss_ * (1.0 - config_.threshold)) {
        best_loss_ = loss;
        bad_iterations_ = 0;
        return false;
    }

    ++bad_iterations_;
    if (bad_iterations_ <= config_.patience) {
        return false;
    }

    bad_iterations_ = 0;

    const double current = optimizer.learning_rate();
    const double reduced = std::max(current * config_.factor, config_.min_learning_rate);
    if (reduced >= current) {
        return false;  // Already at the floor
    }

    optimizer.set_learning_rate(reduced);
    ++reduction_count_;
    return true;
}

} // namespace plumeinv
