/**
 * @file main.cpp
 * @brief Demo entry point for the plume inversion engine
 */

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include "emission_audit.hpp"
#include "plume_inverter.hpp"
#include "synthetic_observation.hpp"
#include "wind_field.hpp"

namespace {

void print_result(const plumeinv::InversionResult& result) {
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Estimated Q:  " << result.estimated_Q_kg_hr << " kg/hr\n";
    if (result.true_Q_kg_hr) {
        std::cout << "  True Q:       " << *result.true_Q_kg_hr << " kg/hr\n";
    }
    if (result.error_pct) {
        std::cout << "  Error:        " << *result.error_pct << " %\n";
    }
    std::cout << "  95% CI:       [" << result.confidence_interval.first << ", "
              << result.confidence_interval.second << "] kg/hr"
              << (result.ci_fallback ? " (fallback)" : "") << "\n";
    std::cout << "  Iterations:   " << result.n_iterations
              << (result.converged ? " (converged)" : " (not converged)") << "\n";
    std::cout << std::scientific << std::setprecision(3);
    std::cout << "  Final loss:   " << result.final_loss << "\n";
    std::cout << "  Final lr:     " << result.final_learning_rate
              << " after " << result.lr_reductions << " reductions\n";
    std::cout << std::fixed << std::setprecision(1);
    std::cout << "  Time:         " << result.elapsed_ms << " ms\n";
}

} // namespace

int main() {
    std::cout << "PlumeInv Methane Emission Inversion\n";
    std::cout << "Version 0.1.0\n";
    std::cout << "===================================\n\n";

    try {
        // Noise-free reference scenario: 0.05 kg/s = 180 kg/hr
        plumeinv::SyntheticScenario scenario;
        scenario.true_Q_kg_s = 0.05;
        scenario.wind_speed = 3.0;
        scenario.source_height = 5.0;
        scenario.stability_class = plumeinv::StabilityClass::D;
        scenario.n_receptors = 200;
        scenario.domain_m = 3000.0;
        scenario.noise_level = 0.0;

        std::cout << "Reference scenario: Q = 180 kg/hr, u = 3 m/s, class D, "
                  << scenario.n_receptors << " receptors, no noise\n";

        const plumeinv::SyntheticObservation obs =
            plumeinv::create_synthetic_observation(scenario);
        const plumeinv::PlumeInverter inverter;
        print_result(inverter.invert(obs));

        // Demo audit over a handful of facilities
        const std::vector<plumeinv::AttributedEmission> emissions = {
            {"FAC-001", 31.85, -102.37, 420.0},
            {"FAC-002", 32.10, -101.95, 95.0},
            {"FAC-003", 40.72, -80.11, 1250.0},
            {"FAC-004", 36.20, -98.70, 35.0},
            {"FAC-005", 29.75, -95.05, 610.0},
        };

        const plumeinv::SyntheticWindField wind;
        std::cout << "\nAudit of " << emissions.size() << " facilities (wind: "
                  << wind.name() << ", noise 5%)\n\n";

        const auto records = plumeinv::run_inversion_audit(emissions, wind);

        std::cout << std::left << std::setw(10) << "Facility"
                  << std::right << std::setw(8) << "Wind"
                  << std::setw(6) << "Class"
                  << std::setw(12) << "Claimed"
                  << std::setw(12) << "Estimated"
                  << std::setw(24) << "95% CI"
                  << std::setw(8) << "Error"
                  << std::setw(6) << "Conv" << "\n";
        std::cout << std::string(86, '-') << "\n";

        std::cout << std::fixed;
        for (const auto& record : records) {
            std::cout << std::left << std::setw(10) << record.facility_id << std::right
                      << std::setprecision(2) << std::setw(8) << record.wind.speed_ms
                      << std::setw(6) << plumeinv::to_string(record.wind.stability_class)
                      << std::setprecision(1) << std::setw(12) << record.claimed_rate_kg_hr;

            if (!record.result) {
                std::cout << "  FAILED: " << record.error << "\n";
                continue;
            }

            const auto& r = *record.result;
            std::ostringstream ci;
            ci << std::fixed << std::setprecision(1)
               << "[" << r.confidence_interval.first << ", " << r.confidence_interval.second << "]";

            std::cout << std::setw(12) << r.estimated_Q_kg_hr
                      << std::setw(24) << ci.str()
                      << std::setw(7) << r.error_pct.value_or(0.0) << "%"
                      << std::setw(6) << (r.converged ? "yes" : "no") << "\n";
        }

        const plumeinv::AuditSummary summary = plumeinv::summarize_audit(records);
        std::cout << "\n" << summary.succeeded << "/" << summary.total << " succeeded, "
                  << summary.converged << " converged";
        if (summary.mean_error_pct) {
            std::cout << ", mean error " << std::setprecision(1)
                      << *summary.mean_error_pct << " %";
        }
        std::cout << "\n";

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
