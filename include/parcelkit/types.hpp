#pragma once

#include <array>
#include <string>
#include <unordered_map>
#include <vector>

namespace parcelkit {

    // Largest tolerance accepted for deduplication and closure checks (map units).
    inline constexpr double MAX_TOLERANCE = 0.0001;

    // Section markers of the cadastral text export
    inline constexpr const char *SECTION_ATTRIBUTES = "[属性描述]";
    inline constexpr const char *SECTION_COORDINATES = "[地块坐标]";

    // File level attribute keys
    inline constexpr const char *ATTR_COORD_SYSTEM = "坐标系";
    inline constexpr const char *ATTR_PROJECTION = "投影类型";
    inline constexpr const char *ATTR_DEGREE = "几度分带";
    inline constexpr const char *ATTR_BAND = "带号";
    inline constexpr const char *ATTR_PRECISION = "精度";

    inline constexpr std::array<const char *, 4> REQUIRED_FILE_ATTRIBUTES = {ATTR_COORD_SYSTEM, ATTR_PROJECTION,
                                                                             ATTR_DEGREE, ATTR_BAND};

    // Parcel attribute keys, in the positional order of a parcel header line
    inline constexpr const char *KEY_BP_COUNT = "bp_cnt";
    inline constexpr const char *KEY_AREA = "area";
    inline constexpr const char *KEY_PID = "pid";
    inline constexpr const char *KEY_PNAME = "pname";
    inline constexpr const char *KEY_GTYPE = "gtype";
    inline constexpr const char *KEY_SHEET = "sheet";
    inline constexpr const char *KEY_USAGE = "usage";
    inline constexpr const char *KEY_CODE = "code";

    inline constexpr std::array<const char *, 8> PARCEL_ATTRIBUTE_KEYS = {
        KEY_BP_COUNT, KEY_AREA, KEY_PID, KEY_PNAME, KEY_GTYPE, KEY_SHEET, KEY_USAGE, KEY_CODE};

    using Attributes = std::unordered_map<std::string, std::string>;

    // Survey point. id and ring_id come straight from the coordinate record; x is northing, y is easting.
    struct Point {
        int id = 0;
        int ring_id = 0;
        double x = 0.0;
        double y = 0.0;
    };

    using Ring = std::vector<Point>;

    struct Parcel {
        Attributes attributes;
        std::vector<Ring> rings;
    };

    struct ParsedDocument {
        std::vector<Parcel> parcels;
        Attributes file_attributes;
    };

    struct CoordinateSystem {
        std::string name;
        int degree = 0;
        int band = 0;
        double central_meridian = 0.0;
        int epsg = 0; // 0 when no standard code exists
        bool is_custom_meridian = false;
        std::string wkt;
    };

    struct GeometryOptions {
        double precision = 0.0; // <= 0 lets the pipeline fall back to the document's precision attribute
        bool deduplicate = true;
        bool auto_close = true;
    };

    struct Feature {
        std::string wkt;
        Attributes attributes;
    };

    struct PreprocessResult {
        std::string crs;
        int epsg = 0;
        std::vector<Feature> features;
    };

} // namespace parcelkit
