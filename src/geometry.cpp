#include "parcelkit/geometry.hpp"

#include "parcelkit/logging.hpp"
#include "parcelkit/text.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <optional>
#include <unordered_set>
#include <utility>

namespace parcelkit {

    namespace {
        struct GridKey {
            std::int64_t x;
            std::int64_t y;

            bool operator==(const GridKey &other) const { return x == other.x && y == other.y; }
        };

        struct GridKeyHash {
            std::size_t operator()(const GridKey &k) const noexcept {
                auto h = static_cast<std::uint64_t>(k.x) * 0x9E3779B97F4A7C15ULL;
                h ^= static_cast<std::uint64_t>(k.y) + 0x9E3779B97F4A7C15ULL + (h << 6) + (h >> 2);
                return static_cast<std::size_t>(h);
            }
        };

        int ceil_neg_log10(double p) { return static_cast<int>(std::ceil(-std::log10(p))); }

        // A trailing point at the location of the first one. A point that only shares the first id is kept.
        bool has_closing_point(const Ring &ring, double precision) {
            if (ring.size() < 2)
                return false;
            return points_equal(ring.front(), ring.back(), precision);
        }
    } // namespace

    double normalize_precision(double p) {
        if (!(p > 0.0) || p > MAX_TOLERANCE)
            return MAX_TOLERANCE;
        return p;
    }

    double parse_precision(std::string_view text) {
        auto value = parse_double(text);
        if (!value)
            return MAX_TOLERANCE;
        return normalize_precision(*value);
    }

    int decimal_places(double precision) {
        int dec = ceil_neg_log10(normalize_precision(precision));
        return std::clamp(dec, 4, 6);
    }

    double grid_scale(double precision) {
        int dec = ceil_neg_log10(normalize_precision(precision));
        int min_dec = ceil_neg_log10(MAX_TOLERANCE);
        return std::pow(10.0, std::max(dec, min_dec));
    }

    bool points_equal(const Point &a, const Point &b, double tolerance) {
        return std::abs(a.x - b.x) <= tolerance && std::abs(a.y - b.y) <= tolerance;
    }

    namespace detail {
        Ring deduplicate_ring(const Ring &ring, double scale) {
            Ring result;
            result.reserve(ring.size());
            std::unordered_set<GridKey, GridKeyHash> occupied;
            occupied.reserve(ring.size());

            for (const auto &pt : ring) {
                GridKey cell{static_cast<std::int64_t>(std::llround(pt.x * scale)),
                             static_cast<std::int64_t>(std::llround(pt.y * scale))};

                bool taken = false;
                for (std::int64_t dx = -1; dx <= 1 && !taken; ++dx) {
                    for (std::int64_t dy = -1; dy <= 1 && !taken; ++dy) {
                        taken = occupied.count(GridKey{cell.x + dx, cell.y + dy}) > 0;
                    }
                }
                if (taken)
                    continue;

                occupied.insert(cell);
                result.push_back(pt);
            }
            return result;
        }
    } // namespace detail

    Ring process_ring(Ring ring, const GeometryOptions &opts) {
        if (ring.empty())
            return ring;

        double precision = normalize_precision(opts.precision);
        if (opts.deduplicate)
            ring = detail::deduplicate_ring(ring, grid_scale(precision));

        // the closing point is set aside so that ordering by id never moves it
        std::size_t original_size = ring.size();
        std::optional<Point> closing;
        if (has_closing_point(ring, precision)) {
            closing = ring.back();
            ring.pop_back();
        }

        std::stable_sort(ring.begin(), ring.end(), [](const Point &a, const Point &b) { return a.id < b.id; });

        if (opts.auto_close && original_size > 1) {
            ring.push_back(ring.front());
        } else if (closing) {
            ring.push_back(*closing);
        }
        return ring;
    }

    void process_geometry(ParsedDocument &doc, const GeometryOptions &opts) {
        std::size_t rings = 0;
        for (auto &parcel : doc.parcels) {
            for (auto &ring : parcel.rings) {
                ring = process_ring(std::move(ring), opts);
                ++rings;
            }
        }
        logger()->debug("processed {} rings (precision {}, dedup {}, auto-close {})", rings,
                        normalize_precision(opts.precision), opts.deduplicate, opts.auto_close);
    }

} // namespace parcelkit
