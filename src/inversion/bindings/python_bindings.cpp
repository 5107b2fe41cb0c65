/**
 * @file python_bindings.cpp
 * @brief pybind11 Python bindings for PlumeInv
 *
 * Exposes the plume forward model, the inverse solver and the synthetic
 * observation generator to Python for use by the pipeline and notebooks.
 */

#include <pybind11/pybind11.h>
#include <pybind11/eigen.h>
#include <pybind11/stl.h>

#include "emission_audit.hpp"
#include "gaussian_plume_model.hpp"
#include "plume_inverter.hpp"
#include "plume_parameters.hpp"
#include "stability_class.hpp"
#include "synthetic_observation.hpp"
#include "wind_field.hpp"

namespace py = pybind11;
using namespace plumeinv;

PYBIND11_MODULE(plumeinv, m) {
    m.doc() = "PlumeInv Gaussian plume inversion Python Bindings";

    // ============================
    // StabilityClass
    // ============================
    py::enum_<StabilityClass>(m, "StabilityClass")
        .value("A", StabilityClass::A)
        .value("B", StabilityClass::B)
        .value("C", StabilityClass::C)
        .value("D", StabilityClass::D)
        .value("E", StabilityClass::E)
        .value("F", StabilityClass::F);

    m.def("parse_stability_class", &parse_stability_class,
          py::arg("label"),
          "Parse a class label, unknown labels fall back to D");

    m.def("stability_from_wind_speed", &stability_from_wind_speed,
          py::arg("speed_ms"),
          "Simplified stability class from wind speed");

    // ============================
    // PlumeParameters
    // ============================
    py::class_<PlumeParameters>(m, "PlumeParameters")
        .def(py::init<double, double, double, StabilityClass, double, double>(),
             py::arg("emission_rate_kg_s") = 0.01,
             py::arg("source_height") = 5.0,
             py::arg("wind_speed") = 3.0,
             py::arg("stability_class") = StabilityClass::D,
             py::arg("source_x") = 0.0,
             py::arg("source_y") = 0.0,
             "Create plume parameters")

        .def_property_readonly("emission_rate_kg_s", &PlumeParameters::emission_rate_kg_s)
        .def_property_readonly("emission_rate_kg_hr", &PlumeParameters::emission_rate_kg_hr)
        .def_property_readonly("log_emission_rate", &PlumeParameters::log_emission_rate)
        .def_property_readonly("source_x", &PlumeParameters::source_x)
        .def_property_readonly("source_y", &PlumeParameters::source_y)
        .def_property_readonly("source_height", &PlumeParameters::source_height)
        .def_property_readonly("wind_speed", &PlumeParameters::wind_speed)
        .def_property_readonly("stability_class", &PlumeParameters::stability_class)

        .def("free_parameters", &PlumeParameters::free_parameters,
             "Get [log_Q, source_x, source_y]");

    // ============================
    // GaussianPlumeModel
    // ============================
    py::class_<ConcentrationGrid>(m, "ConcentrationGrid")
        .def_readonly("x", &ConcentrationGrid::x)
        .def_readonly("y", &ConcentrationGrid::y)
        .def_readonly("concentration", &ConcentrationGrid::concentration);

    py::class_<GaussianPlumeModel>(m, "GaussianPlumeModel")
        .def(py::init<const PlumeParameters&>(),
             py::arg("params") = PlumeParameters(),
             "Create Gaussian plume model")

        .def("evaluate",
             py::overload_cast<const Eigen::VectorXd&, const Eigen::VectorXd&,
                               const Eigen::VectorXd&, double>(
                 &GaussianPlumeModel::evaluate, py::const_),
             py::arg("receptor_x"), py::arg("receptor_y"), py::arg("receptor_z"),
             py::arg("wind_speed"),
             "Concentration at receptor locations (kg/m³)")

        .def("concentration_grid", &GaussianPlumeModel::concentration_grid,
             py::arg("grid_size") = 100,
             py::arg("domain_m") = 5000.0,
             py::arg("wind_speed") = 3.0,
             py::arg("z") = 0.0,
             "Sample the field on a regular grid")

        .def("sigma_y", &GaussianPlumeModel::sigma_y, py::arg("x_km"))
        .def("sigma_z", &GaussianPlumeModel::sigma_z, py::arg("x_km"))

        .def_property_readonly("parameters",
             py::overload_cast<>(&GaussianPlumeModel::parameters, py::const_));

    // ============================
    // Synthetic observations
    // ============================
    py::class_<SyntheticScenario>(m, "SyntheticScenario")
        .def(py::init<>())
        .def_readwrite("true_Q_kg_s", &SyntheticScenario::true_Q_kg_s)
        .def_readwrite("wind_speed", &SyntheticScenario::wind_speed)
        .def_readwrite("source_height", &SyntheticScenario::source_height)
        .def_readwrite("stability_class", &SyntheticScenario::stability_class)
        .def_readwrite("n_receptors", &SyntheticScenario::n_receptors)
        .def_readwrite("domain_m", &SyntheticScenario::domain_m)
        .def_readwrite("noise_level", &SyntheticScenario::noise_level);

    py::class_<SyntheticObservation>(m, "SyntheticObservation")
        .def_readonly("receptor_x", &SyntheticObservation::receptor_x)
        .def_readonly("receptor_y", &SyntheticObservation::receptor_y)
        .def_readonly("receptor_z", &SyntheticObservation::receptor_z)
        .def_readonly("observed_concentrations", &SyntheticObservation::observed_concentrations)
        .def_readonly("true_concentrations", &SyntheticObservation::true_concentrations)
        .def_readonly("true_Q_kg_s", &SyntheticObservation::true_Q_kg_s)
        .def_readonly("true_Q_kg_hr", &SyntheticObservation::true_Q_kg_hr)
        .def_readonly("wind_speed", &SyntheticObservation::wind_speed)
        .def_readonly("source_height", &SyntheticObservation::source_height)
        .def_readonly("stability_class", &SyntheticObservation::stability_class);

    m.def("create_synthetic_observation", &create_synthetic_observation,
          py::arg("scenario"),
          "Generate a reproducible noisy observation");

    // ============================
    // PlumeInverter
    // ============================
    py::class_<InversionResult>(m, "InversionResult")
        .def_readonly("estimated_Q_kg_hr", &InversionResult::estimated_Q_kg_hr)
        .def_readonly("estimated_Q_kg_s", &InversionResult::estimated_Q_kg_s)
        .def_readonly("estimated_source_x", &InversionResult::estimated_source_x)
        .def_readonly("estimated_source_y", &InversionResult::estimated_source_y)
        .def_readonly("true_Q_kg_hr", &InversionResult::true_Q_kg_hr)
        .def_readonly("error_pct", &InversionResult::error_pct)
        .def_readonly("confidence_interval", &InversionResult::confidence_interval)
        .def_readonly("final_loss", &InversionResult::final_loss)
        .def_readonly("n_iterations", &InversionResult::n_iterations)
        .def_readonly("converged", &InversionResult::converged)
        .def_readonly("initial_Q_kg_s", &InversionResult::initial_Q_kg_s)
        .def_readonly("adaptive_initialization", &InversionResult::adaptive_initialization)
        .def_readonly("ci_fallback", &InversionResult::ci_fallback)
        .def_readonly("ci_std_error_capped", &InversionResult::ci_std_error_capped)
        .def_readonly("final_learning_rate", &InversionResult::final_learning_rate)
        .def_readonly("lr_reductions", &InversionResult::lr_reductions)
        .def_readonly("loss_history", &InversionResult::loss_history)
        .def_readonly("emission_rate_history", &InversionResult::emission_rate_history)
        .def_readonly("elapsed_ms", &InversionResult::elapsed_ms);

    py::class_<PlumeInverter::Config>(m, "InverterConfig")
        .def(py::init<>())
        .def_readwrite("learning_rate", &PlumeInverter::Config::learning_rate)
        .def_readwrite("max_iterations", &PlumeInverter::Config::max_iterations)
        .def_readwrite("convergence_tol", &PlumeInverter::Config::convergence_tol)
        .def_readwrite("absolute_loss_tol", &PlumeInverter::Config::absolute_loss_tol)
        .def_readwrite("min_iterations", &PlumeInverter::Config::min_iterations)
        .def_readwrite("stability_class", &PlumeInverter::Config::stability_class)
        .def_readwrite("lr_patience", &PlumeInverter::Config::lr_patience)
        .def_readwrite("lr_factor", &PlumeInverter::Config::lr_factor)
        .def_readwrite("lr_threshold", &PlumeInverter::Config::lr_threshold)
        .def_readwrite("min_learning_rate", &PlumeInverter::Config::min_learning_rate)
        .def_readwrite("max_log_std_error", &PlumeInverter::Config::max_log_std_error)
        .def_readwrite("fallback_ci_fraction", &PlumeInverter::Config::fallback_ci_fraction)
        .def_readwrite("adaptive_initialization", &PlumeInverter::Config::adaptive_initialization)
        .def_readwrite("record_history", &PlumeInverter::Config::record_history);

    py::class_<PlumeInverter>(m, "PlumeInverter")
        .def(py::init<>())
        .def(py::init<const PlumeInverter::Config&>(),
             py::arg("config"),
             "Create inverter with custom settings")

        .def("invert",
             py::overload_cast<const Eigen::VectorXd&, const Eigen::VectorXd&,
                               const Eigen::VectorXd&, const Eigen::VectorXd&,
                               double, double, double, std::optional<double>>(
                 &PlumeInverter::invert, py::const_),
             py::arg("observed_concentrations"),
             py::arg("receptor_x"),
             py::arg("receptor_y"),
             py::arg("receptor_z"),
             py::arg("wind_speed") = 3.0,
             py::arg("initial_Q") = 0.01,
             py::arg("source_height") = 5.0,
             py::arg("true_Q_kg_hr") = py::none(),
             py::call_guard<py::gil_scoped_release>(),
             "Estimate the emission rate from observations")

        .def("invert_synthetic",
             py::overload_cast<const SyntheticObservation&, double>(
                 &PlumeInverter::invert, py::const_),
             py::arg("observation"),
             py::arg("initial_Q") = 0.01,
             py::call_guard<py::gil_scoped_release>(),
             "Invert a synthetic observation")

        .def_property_readonly("config", &PlumeInverter::config);

    // ============================
    // Wind
    // ============================
    py::class_<WindData>(m, "WindData")
        .def(py::init<>())
        .def_readwrite("speed_ms", &WindData::speed_ms)
        .def_readwrite("direction_deg", &WindData::direction_deg)
        .def_readwrite("u_component", &WindData::u_component)
        .def_readwrite("v_component", &WindData::v_component)
        .def_readwrite("stability_class", &WindData::stability_class)
        .def_readwrite("source", &WindData::source);

    py::class_<WindProvider, std::shared_ptr<WindProvider>>(m, "WindProvider")
        .def("get_wind", &WindProvider::get_wind,
             py::arg("latitude"), py::arg("longitude"))
        .def("name", &WindProvider::name,
             "Get provider name");

    py::class_<SyntheticWindField, WindProvider, std::shared_ptr<SyntheticWindField>>(m, "SyntheticWindField")
        .def(py::init<double, double>(),
             py::arg("default_speed") = 3.0,
             py::arg("default_direction") = 270.0,
             "Create synthetic wind field")
        .def("get_wind_field_grid", &SyntheticWindField::get_wind_field_grid,
             py::arg("lat_min"), py::arg("lat_max"),
             py::arg("lon_min"), py::arg("lon_max"),
             py::arg("grid_size") = 10);

    // ============================
    // Audit
    // ============================
    py::class_<AttributedEmission>(m, "AttributedEmission")
        .def(py::init<>())
        .def_readwrite("facility_id", &AttributedEmission::facility_id)
        .def_readwrite("latitude", &AttributedEmission::latitude)
        .def_readwrite("longitude", &AttributedEmission::longitude)
        .def_readwrite("claimed_rate_kg_hr", &AttributedEmission::claimed_rate_kg_hr);

    py::class_<AuditRecord>(m, "AuditRecord")
        .def_readonly("facility_id", &AuditRecord::facility_id)
        .def_readonly("claimed_rate_kg_hr", &AuditRecord::claimed_rate_kg_hr)
        .def_readonly("wind", &AuditRecord::wind)
        .def_readonly("result", &AuditRecord::result)
        .def_readonly("error", &AuditRecord::error);

    m.def("run_inversion_audit",
          [](const std::vector<AttributedEmission>& emissions,
             const WindProvider& wind_provider,
             const PlumeInverter::Config& config) {
              return run_inversion_audit(emissions, wind_provider, config);
          },
          py::arg("emissions"),
          py::arg("wind_provider"),
          py::arg("config") = PlumeInverter::Config(),
          "Run one inversion per attributed emission");
}
