/**
 * @file emission_audit.cpp
 * @brief Implementation of the batch inversion audit
 */

#include "emission_audit.hpp"
#include "synthetic_observation.hpp"
#include <stdexcept>
#include <utility>

namespace plumeinv {

std::vector<AuditRecord> run_inversion_audit(
    const std::vector<AttributedEmission>& emissions,
    const WindProvider& wind_provider,
    const PlumeInverter::Config& inverter_config,
    const AuditConfig& audit_config
) {
    std::vector<AuditRecord> records;
    records.reserve(emissions.size());

    for (const auto& emission : emissions) {
        AuditRecord record;
        record.facility_id = emission.facility_id;
        record.claimed_rate_kg_hr = emission.claimed_rate_kg_hr;

        try {
            record.wind = wind_provider.get_wind(emission.latitude, emission.longitude);

            SyntheticScenario scenario;
            scenario.true_Q_kg_s = emission.claimed_rate_kg_hr / SECONDS_PER_HOUR;
            scenario.wind_speed = record.wind.speed_ms;
            scenario.source_height = audit_config.source_height;
            scenario.stability_class = record.wind.stability_class;
            scenario.n_receptors = audit_config.n_receptors;
            scenario.domain_m = audit_config.domain_m;
            scenario.noise_level = audit_config.noise_level;

            const SyntheticObservation obs = create_synthetic_observation(scenario);

            PlumeInverter::Config config = inverter_config;
            config.stability_class = record.wind.stability_class;
            const PlumeInverter inverter(config);

            record.result = inverter.invert(obs, audit_config.initial_Q);

        } catch (const std::exception& e) {
            record.result.reset();
            record.error = e.what();
        }

        records.push_back(std::move(record));
    }

    return records;
}

AuditSummary summarize_audit(const std::vector<AuditRecord>& records) {
    AuditSummary summary;
    summary.total = records.size();

    double error_sum = 0.0;
    size_t error_count = 0;

    for (const auto& record : records) {
        if (!record.result) {
            continue;
        }
        ++summary.succeeded;
        if (record.result->converged) {
            ++summary.converged;
        }
        if (record.result->error_pct) {
            error_sum += *record.result->error_pct;
            ++error_count;
        }
    }

    if (error_count > 0) {
        summary.mean_error_pct = error_sum / static_cast<double>(error_count);
    }

    return summary;
}

} // namespace plumeinv
