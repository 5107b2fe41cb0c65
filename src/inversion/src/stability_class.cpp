/**
 * @file stability_class.cpp
 * @brief Pasquill-Gifford coefficient table and label parsing
 */

#include "stability_class.hpp"
#include <array>
#include <cctype>

namespace plumeinv {

namespace {

// Indexed by StabilityClass. Exponent is 0.894 on both axes for every class.
const std::array<DispersionCoefficients, 6> PG_COEFFICIENTS = {{
    {0.22, 0.894, 0.20, 0.894},   // A: very unstable
    {0.16, 0.894, 0.12, 0.894},   // B: unstable
    {0.11, 0.894, 0.08, 0.894},   // C: slightly unstable
    {0.08, 0.894, 0.06, 0.894},   // D: neutral
    {0.06, 0.894, 0.03, 0.894},   // E: slightly stable
    {0.04, 0.894, 0.016, 0.894},  // F: stable
}};

} // namespace

StabilityClass parse_stability_class(const std::string& label) {
    // Strip surrounding whitespace
    size_t begin = 0;
    size_t end = label.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(label[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1]))) {
        --end;
    }

    if (end - begin != 1) {
        return StabilityClass::D;
    }

    switch (std::toupper(static_cast<unsigned char>(label[begin]))) {
        case 'A': return StabilityClass::A;
        case 'B': return StabilityClass::B;
        case 'C': return StabilityClass::C;
        case 'D': return StabilityClass::D;
        case 'E': return StabilityClass::E;
        case 'F': return StabilityClass::F;
        default:  return StabilityClass::D;
    }
}

std::string to_string(StabilityClass cls) {
    switch (cls) {
        case StabilityClass::A: return "A";
        case StabilityClass::B: return "B";
        case StabilityClass::C: return "C";
        case StabilityClass::D: return "D";
        case StabilityClass::E: return "E";
        case StabilityClass::F: return "F";
    }
    return "D";
}

const DispersionCoefficients& dispersion_coefficients(StabilityClass cls) {
    return PG_COEFFICIENTS[static_cast<size_t>(cls)];
}

} // namespace plumeinv
