/**
 * @file test_wind_field.cpp
 * @brief Unit tests for the synthetic wind field
 */

#include "wind_field.hpp"
#include <iostream>
#include <cassert>
#include <cmath>
#include <stdexcept>

using namespace plumeinv;

void test_stability_from_speed() {
    std::cout << "Test: Stability class from wind speed... ";

    assert(stability_from_wind_speed(0.5) == StabilityClass::B);
    assert(stability_from_wind_speed(1.99) == StabilityClass::B);
    assert(stability_from_wind_speed(2.0) == StabilityClass::C);
    assert(stability_from_wind_speed(3.9) == StabilityClass::C);
    assert(stability_from_wind_speed(4.0) == StabilityClass::D);
    assert(stability_from_wind_speed(5.99) == StabilityClass::D);
    assert(stability_from_wind_speed(6.0) == StabilityClass::E);
    assert(stability_from_wind_speed(25.0) == StabilityClass::E);

    std::cout << "PASSED\n";
}

void test_deterministic_per_location() {
    std::cout << "Test: Same location, same wind... ";

    SyntheticWindField field;
    const WindData a = field.get_wind(31.85, -102.37);
    const WindData b = field.get_wind(31.85, -102.37);

    assert(a.speed_ms == b.speed_ms);
    assert(a.direction_deg == b.direction_deg);
    assert(a.u_component == b.u_component);
    assert(a.v_component == b.v_component);
    assert(a.stability_class == b.stability_class);
    assert(a.source == "synthetic");

    // A separate instance with the same defaults agrees
    SyntheticWindField other;
    assert(other.get_wind(31.85, -102.37).speed_ms == a.speed_ms);

    std::cout << "PASSED\n";
}

void test_variation_bounds() {
    std::cout << "Test: Wind variation bounds... ";

    SyntheticWindField field(3.0, 270.0);
    bool any_different = false;
    const double first_speed = field.get_wind(30.0, -100.0).speed_ms;

    for (int i = 0; i < 50; ++i) {
        for (int j = 0; j < 10; ++j) {
            const WindData w = field.get_wind(25.0 + 0.37 * i, -110.0 + 1.3 * j);

            assert(w.speed_ms >= 2.0 - 0.005 && w.speed_ms <= 4.0 + 0.005);
            assert(w.direction_deg >= 240.0 - 0.05 && w.direction_deg <= 300.0 + 0.05);

            // Components consistent with speed (rounded to 3 decimals)
            const double speed = std::hypot(w.u_component, w.v_component);
            assert(std::abs(speed - w.speed_ms) < 0.01);

            // Wind from the west blows eastward
            assert(w.u_component > 0.0);

            if (w.speed_ms != first_speed) {
                any_different = true;
            }
        }
    }
    assert(any_different);

    std::cout << "PASSED\n";
}

void test_speed_floor_and_wrap() {
    std::cout << "Test: Speed floor and direction wrap... ";

    // Mean speed below the jitter range: floored at 0.5 m/s
    SyntheticWindField calm(0.2, 350.0);
    for (int i = 0; i < 100; ++i) {
        const WindData w = calm.get_wind(10.0 + i, 20.0);
        assert(w.speed_ms >= SyntheticWindField::MIN_SPEED);
        assert(w.stability_class == StabilityClass::B);
        assert(w.direction_deg >= 0.0 && w.direction_deg <= 360.0);
    }

    bool threw = false;
    try {
        SyntheticWindField bad(-1.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    std::cout << "PASSED\n";
}

void test_wind_grid() {
    std::cout << "Test: Wind field grid... ";

    SyntheticWindField field;
    const auto grid = field.get_wind_field_grid(30.0, 32.0, -103.0, -101.0, 5);

    assert(grid.size() == 25);
    const WindData corner = field.get_wind(32.0, -101.0);
    assert(grid.back().speed_ms == corner.speed_ms);
    assert(grid.front().speed_ms == field.get_wind(30.0, -103.0).speed_ms);

    std::cout << "PASSED\n";
}

void test_polymorphic_provider() {
    std::cout << "Test: Provider through base interface... ";

    SyntheticWindField field;
    const WindProvider& provider = field;
    assert(provider.name() == "synthetic");
    assert(provider.get_wind(1.0, 2.0).speed_ms == field.get_wind(1.0, 2.0).speed_ms);

    std::cout << "PASSED\n";
}

int main() {
    std::cout << "=== Wind Field Tests ===\n";

    try {
        test_stability_from_speed();
        test_deterministic_per_location();
        test_variation_bounds();
        test_speed_floor_and_wrap();
        test_wind_grid();
        test_polymorphic_provider();

        std::cout << "\nAll tests PASSED\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\nTest FAILED: " << e.what() << "\n";
        return 1;
    }
}
