#pragma once

#include "parcelkit/types.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace parcelkit {

    // Substring every supported coordinate-system name must contain.
    inline constexpr const char *CGCS2000_MARKER = "2000国家大地坐标系";

    inline constexpr int BAND3_MIN = 25;
    inline constexpr int BAND3_MAX = 45;
    inline constexpr int BAND6_MIN = 13;
    inline constexpr int BAND6_MAX = 23;

    inline constexpr double CHINA_MERIDIAN_MIN = 75.0;
    inline constexpr double CHINA_MERIDIAN_MAX = 135.0;

    // Band number encoded in the millions digit of the easting of the first usable point
    // (first ring of the first parcel). nullopt when no point carries a positive band.
    std::optional<int> derive_band(const ParsedDocument &doc);

    // 3 for bands in [25,45], 6 for bands in [13,23], 0 otherwise.
    int degree_for_band(int band);

    bool band_matches_degree(int degree, int band);

    // Number inside the last "(...)" of the coordinate-system name, if any.
    std::optional<double> custom_central_meridian(std::string_view name);

    // band*3 for 3-degree bands, band*6-3 for 6-degree bands. Throws CrsError for an invalid pair.
    double standard_central_meridian(int degree, int band);

    bool is_standard_meridian(double central);

    // CGCS2000 Gauss-Kruger EPSG code; the zone-prefixed family applies when the band came from geometry.
    int epsg_code(int band, bool has_band);

    std::string projection_name(int degree, int band, double central, bool has_band, bool standard);

    std::string cgcs2000_wkt(const std::string &name, double central, int band, bool has_band);

    // Reconciles the declared banding with the geometry and derives the full projection definition.
    CoordinateSystem build_coordinate_system(const ParsedDocument &doc);

} // namespace parcelkit
