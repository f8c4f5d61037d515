#include "parcelkit/crs.hpp"

#include "parcelkit/errors.hpp"
#include "parcelkit/logging.hpp"
#include "parcelkit/text.hpp"

#include <fmt/format.h>

#include <cmath>

namespace parcelkit {

    namespace {
        std::string expected_range(int degree) {
            if (degree == 3)
                return fmt::format("[{},{}]", BAND3_MIN, BAND3_MAX);
            return fmt::format("[{},{}]", BAND6_MIN, BAND6_MAX);
        }

        const std::string &attribute(const Attributes &attrs, const char *key) {
            static const std::string empty;
            auto it = attrs.find(key);
            return it != attrs.end() ? it->second : empty;
        }
    } // namespace

    std::optional<int> derive_band(const ParsedDocument &doc) {
        if (doc.parcels.empty() || doc.parcels.front().rings.empty())
            return std::nullopt;

        for (const auto &pt : doc.parcels.front().rings.front()) {
            if (pt.y == 0.0)
                continue;
            auto candidate = static_cast<int>(std::floor(pt.y / 1'000'000.0));
            if (candidate > 0)
                return candidate;
        }
        return std::nullopt;
    }

    int degree_for_band(int band) {
        if (band >= BAND3_MIN && band <= BAND3_MAX)
            return 3;
        if (band >= BAND6_MIN && band <= BAND6_MAX)
            return 6;
        return 0;
    }

    bool band_matches_degree(int degree, int band) { return degree != 0 && degree_for_band(band) == degree; }

    std::optional<double> custom_central_meridian(std::string_view name) {
        auto open = name.rfind('(');
        auto close = name.rfind(')');
        if (open == std::string_view::npos || close == std::string_view::npos || close <= open + 1)
            return std::nullopt;

        std::string digits;
        for (char c : trim(name.substr(open + 1, close - open - 1))) {
            if ((c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.')
                digits += c;
        }
        if (digits.empty())
            return std::nullopt;
        return parse_double(digits);
    }

    double standard_central_meridian(int degree, int band) {
        if (!band_matches_degree(degree, band)) {
            if (degree != 3 && degree != 6)
                throw CrsError("only 3-degree and 6-degree banding is supported");
            throw CrsError(fmt::format("{}-degree band must be within {}, got {}", degree, expected_range(degree), band));
        }
        if (degree == 3)
            return band * 3.0;
        return band * 6.0 - 3.0;
    }

    bool is_standard_meridian(double central) { return std::abs(std::fmod(central, 3.0)) < 1e-8; }

    int epsg_code(int band, bool has_band) {
        if (band >= BAND6_MIN && band <= BAND6_MAX)
            return (has_band ? 4491 : 4502) + (band - BAND6_MIN);
        if (band >= BAND3_MIN && band <= BAND3_MAX)
            return (has_band ? 4513 : 4534) + (band - BAND3_MIN);
        return 0;
    }

    std::string projection_name(int degree, int band, double central, bool has_band, bool standard) {
        std::string prefix = degree == 3 ? "CGCS2000_3_Degree_GK_" : "CGCS2000_GK_";
        if (has_band)
            return fmt::format("{}Zone_{}", prefix, band);
        if (standard)
            return fmt::format("{}CM_{}E", prefix, static_cast<int>(std::lround(central)));
        return fmt::format("{}CM_{:.1f}E", prefix, central);
    }

    std::string cgcs2000_wkt(const std::string &name, double central, int band, bool has_band) {
        double false_easting = has_band ? band * 1'000'000.0 + 500'000.0 : 500'000.0;
        return fmt::format("PROJCS[\"{}\","
                           "GEOGCS[\"GCS_China_Geodetic_Coordinate_System_2000\","
                           "DATUM[\"D_China_2000\",SPHEROID[\"CGCS2000\",6378137.0,298.257222101]],"
                           "PRIMEM[\"Greenwich\",0.0],"
                           "UNIT[\"Degree\",0.0174532925199433]],"
                           "PROJECTION[\"Gauss_Kruger\"],"
                           "PARAMETER[\"False_Easting\",{:.1f}],"
                           "PARAMETER[\"False_Northing\",0.0],"
                           "PARAMETER[\"Central_Meridian\",{:.1f}],"
                           "PARAMETER[\"Scale_Factor\",1.0],"
                           "PARAMETER[\"Latitude_Of_Origin\",0.0],"
                           "UNIT[\"Meter\",1.0]]",
                           name, false_easting, central);
    }

    CoordinateSystem build_coordinate_system(const ParsedDocument &doc) {
        if (doc.parcels.empty())
            throw CrsError("document contains no parcels");
        if (doc.file_attributes.empty())
            throw CrsError("document has no file attributes");

        std::string coord_name(trim(attribute(doc.file_attributes, ATTR_COORD_SYSTEM)));
        if (coord_name.empty())
            throw CrsError("coordinate system name is empty");
        if (coord_name.find(CGCS2000_MARKER) == std::string::npos)
            throw CrsError(fmt::format("coordinate system must be \"{}\", got \"{}\"", CGCS2000_MARKER, coord_name));

        const auto &degree_text = attribute(doc.file_attributes, ATTR_DEGREE);
        auto declared_degree = parse_int(degree_text);
        if (!declared_degree)
            throw CrsError(fmt::format("invalid degree banding \"{}\"", degree_text));
        if (*declared_degree != 3 && *declared_degree != 6)
            throw CrsError(fmt::format("degree banding must be 3 or 6, got {}", *declared_degree));

        const auto &band_text = attribute(doc.file_attributes, ATTR_BAND);
        auto declared_band = parse_int(band_text);
        if (!declared_band)
            throw CrsError(fmt::format("invalid band number \"{}\"", band_text));

        auto geometry_band = derive_band(doc);
        bool has_band = geometry_band.has_value();

        int degree = *declared_degree;
        int band = *declared_band;
        if (geometry_band && *geometry_band != *declared_band) {
            logger()->debug("declared band {} disagrees with geometry band {}, using geometry", *declared_band,
                            *geometry_band);
            band = *geometry_band;
            degree = degree_for_band(band);
        }

        if (!band_matches_degree(degree, band)) {
            throw CrsError(fmt::format("{}-degree band must be within {}, got {}", *declared_degree,
                                       expected_range(*declared_degree), band));
        }

        auto custom = custom_central_meridian(coord_name);
        double central = custom ? *custom : standard_central_meridian(degree, band);

        if (central < CHINA_MERIDIAN_MIN || central > CHINA_MERIDIAN_MAX) {
            throw CrsError(fmt::format("central meridian {:.6f} is outside [{}, {}]", central, CHINA_MERIDIAN_MIN,
                                       CHINA_MERIDIAN_MAX));
        }

        bool standard = is_standard_meridian(central);

        CoordinateSystem cs;
        cs.degree = degree;
        cs.band = band;
        cs.central_meridian = central;
        cs.epsg = standard ? epsg_code(band, has_band) : 0;
        cs.is_custom_meridian = custom.has_value();
        cs.name = projection_name(degree, band, central, has_band, standard);
        cs.wkt = cgcs2000_wkt(cs.name, central, band, has_band);

        logger()->debug("coordinate system {} (degree {}, band {}, central meridian {}, EPSG {})", cs.name, degree,
                        band, central, cs.epsg);
        return cs;
    }

} // namespace parcelkit
