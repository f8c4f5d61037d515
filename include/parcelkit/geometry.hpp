#pragma once

#include "parcelkit/types.hpp"

#include <string_view>

namespace parcelkit {

    // Falls back to MAX_TOLERANCE for p <= 0 or p > MAX_TOLERANCE.
    double normalize_precision(double p);

    // Precision from a document attribute value; empty or unparsable text yields MAX_TOLERANCE.
    double parse_precision(std::string_view text);

    // Decimal places used when rendering coordinates, always within [4, 6].
    int decimal_places(double precision);

    // 10^d with d = ceil(-log10(precision)), never coarser than the MAX_TOLERANCE grid.
    double grid_scale(double precision);

    bool points_equal(const Point &a, const Point &b, double tolerance);

    namespace detail {
        // Keeps the first point of every 3x3 neighbourhood of grid cells, in ring order.
        Ring deduplicate_ring(const Ring &ring, double scale);
    } // namespace detail

    // Deduplicate (optional), auto-close (optional), then order by point id with the closing point kept last.
    Ring process_ring(Ring ring, const GeometryOptions &opts);

    // Applies process_ring to every ring of every parcel in place.
    void process_geometry(ParsedDocument &doc, const GeometryOptions &opts);

} // namespace parcelkit
