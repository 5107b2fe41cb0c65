/**
 * @file test_gaussian_plume_model.cpp
 * @brief Unit tests for the Gaussian plume forward model
 */

#include "gaussian_plume_model.hpp"
#include "plume_parameters.hpp"
#include <unsupported/Eigen/AutoDiff>
#include <iostream>
#include <cassert>
#include <cmath>
#include <stdexcept>

using namespace plumeinv;

constexpr double PI = 3.14159265358979323846;

void test_parameters() {
    std::cout << "Test: Log-space emission rate... ";

    PlumeParameters params(0.05, 5.0, 3.0, StabilityClass::D);
    assert(std::abs(params.emission_rate_kg_s() - 0.05) < 1e-12);
    assert(std::abs(params.emission_rate_kg_hr() - 180.0) < 1e-9);
    assert(std::abs(params.log_emission_rate() - std::log(0.05)) < 1e-12);

    // Zero or negative rates are floored before the log
    PlumeParameters zero(0.0);
    assert(zero.emission_rate_kg_s() > 0.0);
    assert(std::isfinite(zero.log_emission_rate()));

    PlumeParameters negative(-1.0);
    assert(negative.emission_rate_kg_s() > 0.0);

    // Any finite log value maps to a positive rate
    params.set_log_emission_rate(-300.0);
    assert(params.emission_rate_kg_s() > 0.0);

    Eigen::VectorXd theta(3);
    theta << std::log(2.0), 10.0, -5.0;
    params.set_free_parameters(theta);
    assert(std::abs(params.emission_rate_kg_s() - 2.0) < 1e-12);
    assert(params.source_x() == 10.0);
    assert(params.source_y() == -5.0);
    assert(params.free_parameters().isApprox(Eigen::Vector3d(std::log(2.0), 10.0, -5.0)));

    bool threw = false;
    try {
        params.set_free_parameters(Eigen::VectorXd::Zero(2));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_centerline_value() {
    std::cout << "Test: Centerline ground concentration... ";

    const double q = 0.05;
    const double u = 3.0;
    const double h = 5.0;
    GaussianPlumeModel model(PlumeParameters(q, h, u, StabilityClass::D));

    Eigen::VectorXd rx(1), ry(1), rz(1);
    rx << 1000.0;
    ry << 0.0;
    rz << 0.0;

    const Eigen::VectorXd c = model.evaluate(rx, ry, rz, u);

    // Ground receptor: both vertical terms equal
    const double sy = 80.0;
    const double sz = 60.0;
    const double expected = q / (2.0 * PI * u * sy * sz) * 2.0 * std::exp(-h * h / (2.0 * sz * sz));

    assert(std::abs(c(0) - expected) / expected < 1e-9);

    std::cout << "PASSED\n";
}

void test_linear_in_emission_rate() {
    std::cout << "Test: Concentration proportional to Q... ";

    Eigen::VectorXd rx(4), ry(4), rz(4);
    rx << 200.0, 800.0, 1500.0, 2500.0;
    ry << 0.0, 50.0, -120.0, 300.0;
    rz << 0.0, 0.0, 2.0, 10.0;

    GaussianPlumeModel low(PlumeParameters(0.01, 5.0, 3.0, StabilityClass::C));
    GaussianPlumeModel high(PlumeParameters(0.04, 5.0, 3.0, StabilityClass::C));

    const Eigen::VectorXd c_low = low.evaluate(rx, ry, rz, 3.0);
    const Eigen::VectorXd c_high = high.evaluate(rx, ry, rz, 3.0);

    for (Eigen::Index i = 0; i < rx.size(); ++i) {
        assert(c_low(i) > 0.0);
        assert(std::abs(c_high(i) / c_low(i) - 4.0) < 1e-9);
    }

    std::cout << "PASSED\n";
}

void test_ground_reflection() {
    std::cout << "Test: Ground reflection term... ";

    // With source at ground level the two vertical terms coincide, so the
    // ground concentration is twice the unreflected value
    const double u = 3.0;
    GaussianPlumeModel model(PlumeParameters(0.05, 0.0, u, StabilityClass::D));

    Eigen::VectorXd rx(1), ry(1), rz(1);
    rx << 500.0;
    ry << 0.0;
    rz << 0.0;

    const double c = model.evaluate(rx, ry, rz, u)(0);
    const double sy = model.sigma_y(0.5);
    const double sz = model.sigma_z(0.5);
    const double single = 0.05 / (2.0 * PI * u * sy * sz);

    assert(std::abs(c / single - 2.0) < 1e-6);

    std::cout << "PASSED\n";
}

void test_upwind_decay() {
    std::cout << "Test: Smooth upwind decay... ";

    GaussianPlumeModel model(PlumeParameters(0.05, 5.0, 3.0, StabilityClass::D));

    const int n = 401;
    Eigen::VectorXd rx = Eigen::VectorXd::LinSpaced(n, -5000.0, 5.0);
    Eigen::VectorXd ry = Eigen::VectorXd::Zero(n);
    Eigen::VectorXd rz = Eigen::VectorXd::Zero(n);

    const Eigen::VectorXd c = model.evaluate(rx, ry, rz, 3.0);

    for (int i = 0; i < n; ++i) {
        assert(std::isfinite(c(i)));
        assert(c(i) >= 0.0);
    }

    // Far upwind the field vanishes
    assert(c(0) < 1e-30);

    // Moving toward the source the masked field does not decrease
    for (int i = 1; i < n; ++i) {
        assert(c(i) >= c(i - 1));
    }

    // Half the mask at the source itself
    assert(std::abs(GaussianPlumeModel::downwind_mask(0.0) - 0.5) < 1e-15);
    assert(GaussianPlumeModel::downwind_mask(-1e6) == 0.0);
    assert(GaussianPlumeModel::downwind_mask(1e6) == 1.0);

    std::cout << "PASSED\n";
}

void test_low_wind_clamp() {
    std::cout << "Test: Wind speed clamp... ";

    GaussianPlumeModel model(PlumeParameters(0.05, 5.0, 3.0, StabilityClass::D));

    Eigen::VectorXd rx(1), ry(1), rz(1);
    rx << 1000.0;
    ry << 0.0;
    rz << 0.0;

    const double at_zero = model.evaluate(rx, ry, rz, 0.0)(0);
    const double at_floor = model.evaluate(rx, ry, rz, 0.5)(0);
    assert(std::isfinite(at_zero));
    assert(at_zero == at_floor);

    std::cout << "PASSED\n";
}

void test_mismatched_receptors() {
    std::cout << "Test: Mismatched receptor arrays... ";

    GaussianPlumeModel model;
    bool threw = false;
    try {
        model.evaluate(Eigen::VectorXd::Zero(3), Eigen::VectorXd::Zero(2), Eigen::VectorXd::Zero(3), 3.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_autodiff_gradient() {
    std::cout << "Test: Autodiff gradient vs finite difference... ";

    using ADScalar = Eigen::AutoDiffScalar<Eigen::Vector3d>;

    const DispersionCoefficients& coeffs = dispersion_coefficients(StabilityClass::B);
    const double u = 4.0;
    const double h = 8.0;
    const double theta[3] = {std::log(0.02), 15.0, -30.0};
    const double rx = 700.0, ry = 40.0, rz = 1.5;

    const ADScalar log_q(theta[0], 3, 0);
    const ADScalar sx(theta[1], 3, 1);
    const ADScalar sy(theta[2], 3, 2);

    const ADScalar c = GaussianPlumeModel::concentration<ADScalar>(
        log_q, sx, sy, h, u, coeffs, rx, ry, rz
    );

    const double value = GaussianPlumeModel::concentration<double>(
        theta[0], theta[1], theta[2], h, u, coeffs, rx, ry, rz
    );
    assert(std::abs(c.value() - value) <= 1e-12 * std::abs(value));

    // dC/dlog(Q) = C exactly
    assert(std::abs(c.derivatives()(0) - value) / value < 1e-12);

    const double steps[3] = {1e-6, 1e-3, 1e-3};
    for (int k = 0; k < 3; ++k) {
        double plus[3] = {theta[0], theta[1], theta[2]};
        double minus[3] = {theta[0], theta[1], theta[2]};
        plus[k] += steps[k];
        minus[k] -= steps[k];

        const double c_plus = GaussianPlumeModel::concentration<double>(
            plus[0], plus[1], plus[2], h, u, coeffs, rx, ry, rz);
        const double c_minus = GaussianPlumeModel::concentration<double>(
            minus[0], minus[1], minus[2], h, u, coeffs, rx, ry, rz);
        const double fd = (c_plus - c_minus) / (2.0 * steps[k]);

        const double scale = std::max(std::abs(fd), 1e-6 * value);
        assert(std::abs(c.derivatives()(k) - fd) / scale < 1e-5);
    }

    std::cout << "PASSED\n";
}

void test_concentration_grid() {
    std::cout << "Test: Concentration grid... ";

    GaussianPlumeModel model(PlumeParameters(0.05, 5.0, 3.0, StabilityClass::D));
    const ConcentrationGrid grid = model.concentration_grid(21, 2000.0, 3.0);

    assert(grid.x.rows() == 21 && grid.x.cols() == 21);
    assert(grid.concentration.rows() == 21 && grid.concentration.cols() == 21);
    assert(std::abs(grid.x(0, 0) + 400.0) < 1e-9);
    assert(std::abs(grid.x(20, 0) - 2000.0) < 1e-9);
    assert(std::abs(grid.y(0, 0) + 1000.0) < 1e-9);
    assert(std::abs(grid.y(0, 20) - 1000.0) < 1e-9);
    assert(grid.concentration.allFinite());
    assert(grid.concentration.minCoeff() >= 0.0);

    // Peak lies downwind on the centerline column
    Eigen::Index i_max = 0, j_max = 0;
    grid.concentration.maxCoeff(&i_max, &j_max);
    assert(grid.x(i_max, j_max) > 0.0);
    assert(j_max == 10);

    // Each grid cell matches a direct evaluation
    Eigen::VectorXd rx(1), ry(1), rz(1);
    rx << grid.x(15, 7);
    ry << grid.y(15, 7);
    rz << 0.0;
    assert(std::abs(model.evaluate(rx, ry, rz, 3.0)(0) - grid.concentration(15, 7)) < 1e-20);

    bool threw = false;
    try {
        model.concentration_grid(1);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Gaussian Plume Model Tests ===\n";

    try {
        test_parameters();
        test_centerline_value();
        test_linear_in_emission_rate();
        test_ground_reflection();
        test_upwind_decay();
        test_low_wind_clamp();
        test_mismatched_receptors();
        test_autodiff_gradient();
        test_concentration_grid();

        std::cout << "\nAll tests PASSED\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
