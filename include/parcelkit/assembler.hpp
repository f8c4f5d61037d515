#pragma once

#include "parcelkit/types.hpp"

#include <string>
#include <string_view>

namespace parcelkit {

    inline constexpr std::size_t MIN_RING_POINTS = 4;

    // "(y1 x1, y2 x2, ...)", easting first.
    std::string build_ring_wkt(const Ring &ring, int decimal_places);

    // "POLYGON (ring1, ring2, ...)". Throws GeometryBuildError when the parcel has no rings, or a ring has
    // fewer than four points or does not end on its first point id.
    std::string build_polygon_wkt(const Parcel &parcel, int decimal_places);

    // Precision priority: opts.precision (> 0), then the document precision attribute, then MAX_TOLERANCE.
    double resolve_precision(const ParsedDocument &doc, const GeometryOptions &opts);

    // Geometry processing, coordinate system derivation and WKT assembly for one document.
    PreprocessResult preprocess(ParsedDocument doc, GeometryOptions opts);

    // parse() followed by preprocess().
    PreprocessResult convert(std::string_view text, const GeometryOptions &opts = {});

} // namespace parcelkit
