/**
 * @file wind_field.hpp
 * @brief Wind conditions at a source location
 *
 * Provides interface for wind-data providers and a deterministic
 * synthetic field for demo and validation runs.
 */

#ifndef WIND_FIELD_HPP
#define WIND_FIELD_HPP

#include <string>
#include <vector>
#include "stability_class.hpp"

namespace plumeinv {

/**
 * @brief Wind conditions at one location
 */
struct WindData {
    double speed_ms = 0.0;          ///< Wind speed (m/s)
    double direction_deg = 0.0;     ///< Direction wind comes FROM (deg from N)
    double u_component = 0.0;       ///< Eastward component (m/s)
    double v_component = 0.0;       ///< Northward component (m/s)
    StabilityClass stability_class = StabilityClass::D;
    std::string source;             ///< "synthetic", "era5", ...
};

/**
 * @brief Abstract base class for wind-data providers
 */
class WindProvider {
public:
    virtual ~WindProvider() = default;

    /**
     * @brief Wind conditions at a location
     * @param latitude Latitude (deg)
     * @param longitude Longitude (deg)
     */
    virtual WindData get_wind(double latitude, double longitude) const = 0;

    /**
     * @brief Get provider name
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Constant wind with small, location-seeded variation
 *
 * speed = default ± U(1) floored at 0.5 m/s,
 * direction = default ± U(30) mod 360.
 * The same location always yields the same wind.
 */
class SyntheticWindField : public WindProvider {
public:
    /**
     * @brief Constructor
     * @param default_speed Mean wind speed (m/s)
     * @param default_direction Mean direction wind comes from (deg)
     */
    SyntheticWindField(
        double default_speed = 3.0,
        double default_direction = 270.0
    );

    WindData get_wind(double latitude, double longitude) const override;

    std::string name() const override { return "synthetic"; }

    /**
     * @brief Sample the field on a regular lat/lon grid, row-major in latitude
     */
    std::vector<WindData> get_wind_field_grid(
        double lat_min, double lat_max,
        double lon_min, double lon_max,
        size_t grid_size = 10
    ) const;

    double default_speed() const { return default_speed_; }
    double default_direction() const { return default_direction_; }

    static constexpr double MIN_SPEED = 0.5;           // m/s
    static constexpr double SPEED_VARIATION = 1.0;     // m/s
    static constexpr double DIRECTION_VARIATION = 30.0;  // deg

private:
    double default_speed_;
    double default_direction_;
};

/**
 * @brief Simplified stability class from wind speed
 *
 * Light winds are unstable, strong winds stable:
 * < 2 m/s → B, < 4 → C, < 6 → D, otherwise E.
 */
StabilityClass stability_from_wind_speed(double speed_ms);

} // namespace plumeinv

#endif // WIND_FIELD_HPP
