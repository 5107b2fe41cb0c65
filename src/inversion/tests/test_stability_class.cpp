/**
 * @file test_stability_class.cpp
 * @brief Unit tests for Pasquill-Gifford stability classes
 */

#include "stability_class.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <vector>

using namespace plumeinv;

void test_parse() {
    std::cout << "Test: Stability class parsing... ";

    assert(parse_stability_class("A") == StabilityClass::A);
    assert(parse_stability_class("b") == StabilityClass::B);
    assert(parse_stability_class(" F ") == StabilityClass::F);
    assert(parse_stability_class("e") == StabilityClass::E);

    // Unknown labels fall back to neutral
    assert(parse_stability_class("") == StabilityClass::D);
    assert(parse_stability_class("G") == StabilityClass::D);
    assert(parse_stability_class("stable") == StabilityClass::D);

    for (auto cls : {StabilityClass::A, StabilityClass::B, StabilityClass::C,
                     StabilityClass::D, StabilityClass::E, StabilityClass::F}) {
        assert(parse_stability_class(to_string(cls)) == cls);
    }

    std::cout << "PASSED\n";
}

void test_coefficients() {
    std::cout << "Test: Dispersion coefficient table... ";

    const auto& a = dispersion_coefficients(StabilityClass::A);
    assert(std::abs(a.a - 0.22) < 1e-12);
    assert(std::abs(a.c - 0.20) < 1e-12);

    const auto& d = dispersion_coefficients(StabilityClass::D);
    assert(std::abs(d.a - 0.08) < 1e-12);
    assert(std::abs(d.c - 0.06) < 1e-12);

    const auto& f = dispersion_coefficients(StabilityClass::F);
    assert(std::abs(f.a - 0.04) < 1e-12);
    assert(std::abs(f.c - 0.016) < 1e-12);

    std::cout << "PASSED\n";
}

void test_monotonic_dispersion() {
    std::cout << "Test: Monotonic dispersion with distance... ";

    const std::vector<double> distances = {1e-4, 0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 2.0, 5.0, 20.0};

    for (auto cls : {StabilityClass::A, StabilityClass::B, StabilityClass::C,
                     StabilityClass::D, StabilityClass::E, StabilityClass::F}) {
        const auto& coeffs = dispersion_coefficients(cls);
        for (size_t i = 1; i < distances.size(); ++i) {
            assert(sigma_y(coeffs, distances[i - 1]) <= sigma_y(coeffs, distances[i]));
            assert(sigma_z(coeffs, distances[i - 1]) <= sigma_z(coeffs, distances[i]));
        }
    }

    std::cout << "PASSED\n";
}

void test_near_field_clamp() {
    std::cout << "Test: Near-field distance clamp... ";

    const auto& coeffs = dispersion_coefficients(StabilityClass::D);
    const double at_min = sigma_y(coeffs, MIN_DISPERSION_DISTANCE_KM);

    assert(sigma_y(coeffs, 0.0) == at_min);
    assert(sigma_y(coeffs, 1e-9) == at_min);
    assert(sigma_z(coeffs, 0.0) == sigma_z(coeffs, MIN_DISPERSION_DISTANCE_KM));
    assert(at_min > 0.0);

    // 1 km, class D: σ_y = 0.08 * 1 * 1000 m
    assert(std::abs(sigma_y(coeffs, 1.0) - 80.0) < 1e-9);
    assert(std::abs(sigma_z(coeffs, 1.0) - 60.0) < 1e-9);

    std::cout << "PASSED\n";
}

void test_stability_ordering() {
    std::cout << "Test: Unstable classes spread faster... ";

    const double x_km = 1.0;
    double prev_y = 1e30;
    double prev_z = 1e30;
    for (auto cls : {StabilityClass::A, StabilityClass::B, StabilityClass::C,
                     StabilityClass::D, StabilityClass::E, StabilityClass::F}) {
        const auto& coeffs = dispersion_coefficients(cls);
        assert(sigma_y(coeffs, x_km) < prev_y);
        assert(sigma_z(coeffs, x_km) < prev_z);
        prev_y = sigma_y(coeffs, x_km);
        prev_z = sigma_z(coeffs, x_km);
    }

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Stability Class Tests ===\n";

    try {
        test_parse();
        test_coefficients();
        test_monotonic_dispersion();
        test_near_field_clamp();
        test_stability_ordering();

        std::cout << "\nAll tests PASSED\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
