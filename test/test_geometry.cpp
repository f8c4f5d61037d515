#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "parcelkit/geometry.hpp"
#include "parcelkit/parser.hpp"

#include <cmath>

using namespace parcelkit;
using fixtures::pt;

namespace {
    std::vector<int> ids(const Ring &ring) {
        std::vector<int> out;
        for (const auto &p : ring)
            out.push_back(p.id);
        return out;
    }

    bool same_points(const Ring &a, const Ring &b) {
        if (a.size() != b.size())
            return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (a[i].id != b[i].id || a[i].ring_id != b[i].ring_id || a[i].x != b[i].x || a[i].y != b[i].y)
                return false;
        }
        return true;
    }
} // namespace

TEST_CASE("Geometry - Precision handling") {
    SUBCASE("Normalization") {
        CHECK(normalize_precision(0.0) == MAX_TOLERANCE);
        CHECK(normalize_precision(-1.0) == MAX_TOLERANCE);
        CHECK(normalize_precision(0.01) == MAX_TOLERANCE);
        CHECK(normalize_precision(std::nan("")) == MAX_TOLERANCE);
        CHECK(normalize_precision(0.00001) == doctest::Approx(0.00001));
    }

    SUBCASE("Attribute values") {
        CHECK(parse_precision("0.000001") == doctest::Approx(0.000001));
        CHECK(parse_precision("") == MAX_TOLERANCE);
        CHECK(parse_precision("high") == MAX_TOLERANCE);
        CHECK(parse_precision("0.5") == MAX_TOLERANCE);
    }

    SUBCASE("Decimal places stay within [4, 6]") {
        CHECK(decimal_places(0.0001) == 4);
        CHECK(decimal_places(0.00005) == 5);
        CHECK(decimal_places(0.00001) == 5);
        CHECK(decimal_places(0.000001) == 6);
        CHECK(decimal_places(1e-9) == 6);
        CHECK(decimal_places(0.01) == 4);
        CHECK(decimal_places(0.0) == 4);
    }

    SUBCASE("Grid scale") {
        CHECK(grid_scale(0.0001) == doctest::Approx(1e4));
        CHECK(grid_scale(0.00005) == doctest::Approx(1e5));
        CHECK(grid_scale(1.0) == doctest::Approx(1e4));
    }

    SUBCASE("Point equality") {
        CHECK(points_equal(pt(1, 1.0, 2.0), pt(2, 1.00005, 2.0), 0.0001));
        CHECK_FALSE(points_equal(pt(1, 1.0, 2.0), pt(2, 1.0, 2.001), 0.0001));
    }
}

TEST_CASE("Geometry - Deduplication") {
    GeometryOptions opts;
    opts.precision = 0.0001;

    SUBCASE("Points within one cell collapse to the first") {
        Ring ring{pt(1, 100.00001, 200.00001), pt(2, 100.00003, 200.00002), pt(3, 150.0, 250.0)};
        auto deduped = detail::deduplicate_ring(ring, grid_scale(opts.precision));
        REQUIRE(deduped.size() == 2);
        CHECK(deduped[0].id == 1);
        CHECK(deduped[1].id == 3);
    }

    SUBCASE("Neighbouring cells also count as duplicates") {
        Ring ring{pt(1, 0.0, 0.0), pt(2, 0.0001, 0.0001), pt(3, 0.0003, 0.0)};
        auto deduped = detail::deduplicate_ring(ring, grid_scale(opts.precision));
        CHECK(ids(deduped) == std::vector<int>{1, 3});
    }

    SUBCASE("Survivors are separated by more than the tolerance") {
        Ring ring;
        for (int i = 0; i < 40; ++i)
            ring.push_back(pt(i + 1, 10.0 + (i % 7) * 0.00007, 20.0 + (i % 5) * 0.00013));
        auto deduped = detail::deduplicate_ring(ring, grid_scale(opts.precision));
        REQUIRE(!deduped.empty());
        for (std::size_t i = 0; i < deduped.size(); ++i) {
            for (std::size_t j = i + 1; j < deduped.size(); ++j)
                CHECK_FALSE(points_equal(deduped[i], deduped[j], opts.precision));
        }
    }

    SUBCASE("Processing drops duplicates before closing") {
        // three corners repeated within tolerance, then explicitly closed
        Ring ring{pt(1, 0, 0),          pt(2, 10, 0), pt(2, 10.00002, 0.00001), pt(3, 10, 10),
                  pt(3, 10.00001, 10), pt(4, 0, 10), pt(1, 0, 0)};
        auto out = process_ring(ring, opts);
        CHECK(ids(out) == std::vector<int>{1, 2, 3, 4, 1});
    }

    SUBCASE("Disabled deduplication keeps every point") {
        GeometryOptions keep = opts;
        keep.deduplicate = false;
        keep.auto_close = false;
        Ring ring{pt(1, 0, 0), pt(2, 0, 0), pt(3, 5, 5)};
        CHECK(process_ring(ring, keep).size() == 3);
    }
}

TEST_CASE("Geometry - Closing and ordering") {
    GeometryOptions opts;

    SUBCASE("Open ring is closed on the smallest id") {
        Ring ring{pt(1, 0, 0), pt(3, 10, 10), pt(2, 10, 0), pt(4, 0, 10)};
        auto out = process_ring(ring, opts);
        CHECK(ids(out) == std::vector<int>{1, 2, 3, 4, 1});
        CHECK(out.back().x == doctest::Approx(0.0));
        CHECK(out.back().y == doctest::Approx(0.0));
    }

    SUBCASE("Ring starting on a larger id still ends on its first id") {
        Ring ring{pt(2, 10, 0), pt(1, 0, 0), pt(3, 10, 10)};
        auto out = process_ring(ring, opts);
        CHECK(ids(out) == std::vector<int>{1, 2, 3, 1});
        CHECK(out.front().id == out.back().id);
    }

    SUBCASE("Closing point stays last when auto close is off") {
        GeometryOptions no_close = opts;
        no_close.auto_close = false;
        no_close.deduplicate = false;
        Ring ring{pt(3, 10, 10), pt(1, 0, 0), pt(2, 10, 0), pt(3, 10, 10)};
        auto out = process_ring(ring, no_close);
        CHECK(ids(out) == std::vector<int>{1, 2, 3, 3});
    }

    SUBCASE("Unclosed ring is only sorted when auto close is off") {
        GeometryOptions no_close = opts;
        no_close.auto_close = false;
        Ring ring{pt(3, 10, 10), pt(1, 0, 0), pt(2, 10, 0)};
        CHECK(ids(process_ring(ring, no_close)) == std::vector<int>{1, 2, 3});
    }

    SUBCASE("Point sharing the first id at another location is kept") {
        Ring ring{pt(1, 0, 0), pt(2, 10, 0), pt(3, 10, 10), pt(4, 0, 10), pt(1, 5, 5)};
        auto out = process_ring(ring, opts);
        REQUIRE(out.size() == 6);
        CHECK(ids(out) == std::vector<int>{1, 1, 2, 3, 4, 1});
        CHECK(out[1].x == doctest::Approx(5.0));
        CHECK(out[1].y == doctest::Approx(5.0));
        CHECK(out.back().x == doctest::Approx(0.0));
        CHECK(out.back().y == doctest::Approx(0.0));
        CHECK(same_points(process_ring(out, opts), out));
    }

    SUBCASE("Equal ids keep their relative order") {
        Ring ring{pt(2, 1, 1), pt(1, 0, 0), pt(2, 5, 5), pt(3, 9, 9)};
        auto out = process_ring(ring, opts);
        REQUIRE(out.size() == 5);
        CHECK(out[1].x == doctest::Approx(1.0));
        CHECK(out[2].x == doctest::Approx(5.0));
    }

    SUBCASE("Degenerate rings") {
        CHECK(process_ring({}, opts).empty());
        auto single = process_ring(Ring{pt(1, 0, 0)}, opts);
        CHECK(single.size() == 1);
    }

    SUBCASE("Processing twice changes nothing") {
        Ring ring{pt(4, 0, 10), pt(2, 10, 0), pt(2, 10.00001, 0), pt(1, 0, 0), pt(3, 10, 10)};
        auto once = process_ring(ring, opts);
        auto twice = process_ring(once, opts);
        CHECK(same_points(once, twice));
    }
}

TEST_CASE("Geometry - Whole document") {
    auto doc = parse(fixtures::sample_document());
    process_geometry(doc, GeometryOptions{});
    const auto &ring = doc.parcels.at(0).rings.at(0);
    CHECK(ids(ring) == std::vector<int>{1, 2, 3, 4, 1});
}
