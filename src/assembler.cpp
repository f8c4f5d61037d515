#include "parcelkit/assembler.hpp"

#include "parcelkit/crs.hpp"
#include "parcelkit/errors.hpp"
#include "parcelkit/geometry.hpp"
#include "parcelkit/logging.hpp"
#include "parcelkit/parser.hpp"

#include <fmt/format.h>

#include <iterator>
#include <utility>

namespace parcelkit {

    namespace {
        std::string parcel_id(const Parcel &parcel) {
            auto it = parcel.attributes.find(KEY_PID);
            return it != parcel.attributes.end() ? it->second : std::string();
        }
    } // namespace

    std::string build_ring_wkt(const Ring &ring, int decimal_places) {
        std::string out;
        out.reserve(ring.size() * static_cast<std::size_t>(decimal_places * 2 + 20) + 2);
        out += '(';
        for (std::size_t i = 0; i < ring.size(); ++i) {
            if (i > 0)
                out += ", ";
            fmt::format_to(std::back_inserter(out), "{:.{}f} {:.{}f}", ring[i].y, decimal_places, ring[i].x,
                           decimal_places);
        }
        out += ')';
        return out;
    }

    std::string build_polygon_wkt(const Parcel &parcel, int decimal_places) {
        if (parcel.rings.empty())
            throw GeometryBuildError(parcel_id(parcel), "parcel has no rings");

        std::string out = "POLYGON (";
        for (std::size_t i = 0; i < parcel.rings.size(); ++i) {
            const auto &ring = parcel.rings[i];
            if (ring.size() < MIN_RING_POINTS) {
                throw GeometryBuildError(parcel_id(parcel),
                                         fmt::format("ring {} has {} points, at least {} are required", i + 1,
                                                     ring.size(), MIN_RING_POINTS));
            }
            if (ring.front().id != ring.back().id)
                throw GeometryBuildError(parcel_id(parcel), fmt::format("ring {} is not closed", i + 1));

            if (i > 0)
                out += ", ";
            out += build_ring_wkt(ring, decimal_places);
        }
        out += ')';
        return out;
    }

    double resolve_precision(const ParsedDocument &doc, const GeometryOptions &opts) {
        if (opts.precision > 0.0)
            return normalize_precision(opts.precision);
        auto it = doc.file_attributes.find(ATTR_PRECISION);
        if (it == doc.file_attributes.end())
            return MAX_TOLERANCE;
        return parse_precision(it->second);
    }

    PreprocessResult preprocess(ParsedDocument doc, GeometryOptions opts) {
        if (doc.parcels.empty())
            throw Error("document contains no parcels");

        opts.precision = resolve_precision(doc, opts);
        int places = decimal_places(opts.precision);

        process_geometry(doc, opts);
        auto cs = build_coordinate_system(doc);

        PreprocessResult result;
        result.features.reserve(doc.parcels.size());
        for (auto &parcel : doc.parcels) {
            Feature feature;
            feature.wkt = build_polygon_wkt(parcel, places);
            feature.attributes = std::move(parcel.attributes);
            result.features.push_back(std::move(feature));
        }

        if (cs.epsg > 0) {
            result.epsg = cs.epsg;
            result.crs = "EPSG:" + std::to_string(cs.epsg);
        } else {
            result.crs = cs.wkt;
        }

        logger()->debug("assembled {} features, crs {}", result.features.size(),
                        result.epsg > 0 ? result.crs : cs.name);
        return result;
    }

    PreprocessResult convert(std::string_view text, const GeometryOptions &opts) { return preprocess(parse(text), opts); }

} // namespace parcelkit
