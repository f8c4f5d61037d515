#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "parcelkit/assembler.hpp"
#include "parcelkit/errors.hpp"
#include "parcelkit/parser.hpp"

using namespace parcelkit;
using fixtures::pt;

namespace {
    Parcel square_parcel(const std::string &pid) {
        Parcel parcel;
        parcel.attributes[KEY_PID] = pid;
        parcel.rings.push_back(Ring{pt(1, 3400000.0, 39500000.0), pt(2, 3400000.0, 39500100.0),
                                    pt(3, 3400100.0, 39500100.0), pt(1, 3400000.0, 39500000.0)});
        return parcel;
    }
} // namespace

TEST_CASE("Assembler - Ring and polygon text") {
    SUBCASE("Easting is written before northing") {
        Ring ring{pt(1, 1.5, 2.25)};
        CHECK(build_ring_wkt(ring, 4) == "(2.2500 1.5000)");
        CHECK(build_ring_wkt(ring, 6) == "(2.250000 1.500000)");
    }

    SUBCASE("Single ring polygon") {
        CHECK(build_polygon_wkt(square_parcel("A"), 4) ==
              "POLYGON ((39500000.0000 3400000.0000, 39500100.0000 3400000.0000, "
              "39500100.0000 3400100.0000, 39500000.0000 3400000.0000))");
    }

    SUBCASE("Rings are separated by a comma") {
        auto parcel = square_parcel("A");
        parcel.rings.push_back(Ring{pt(5, 10, 10), pt(6, 10, 20), pt(7, 20, 20), pt(5, 10, 10)});
        auto wkt = build_polygon_wkt(parcel, 4);
        CHECK(wkt.find("3400000.0000), (10.0000 10.0000") != std::string::npos);
        CHECK(wkt.substr(wkt.size() - 2) == "))");
    }
}

TEST_CASE("Assembler - Invalid parcels") {
    SUBCASE("No rings") {
        Parcel parcel;
        parcel.attributes[KEY_PID] = "EMPTY";
        try {
            build_polygon_wkt(parcel, 4);
            FAIL("expected GeometryBuildError");
        } catch (const GeometryBuildError &e) {
            CHECK(e.parcel_id() == "EMPTY");
            CHECK(std::string(e.what()).find("EMPTY") != std::string::npos);
        }
    }

    SUBCASE("Too few points") {
        auto parcel = square_parcel("SHORT");
        parcel.rings[0].erase(parcel.rings[0].begin() + 1);
        CHECK_THROWS_WITH_AS(build_polygon_wkt(parcel, 4), doctest::Contains("SHORT"), GeometryBuildError);
    }

    SUBCASE("Ring not closed") {
        auto parcel = square_parcel("OPEN");
        parcel.rings[0].back().id = 9;
        CHECK_THROWS_WITH_AS(build_polygon_wkt(parcel, 4), doctest::Contains("not closed"), GeometryBuildError);
    }

    SUBCASE("Parcel with too few points fails the whole document") {
        auto text = fixtures::file_header() + "[地块坐标]\n3,1,TRI,,,,,,@\nJ1,1,3400000,39500000\nJ2,1,3400000,39500100\n";
        CHECK_THROWS_AS(convert(text), GeometryBuildError);
    }
}

TEST_CASE("Assembler - Precision resolution") {
    auto doc = parse(fixtures::sample_document());

    SUBCASE("Explicit option wins") {
        GeometryOptions opts;
        opts.precision = 0.000001;
        CHECK(resolve_precision(doc, opts) == doctest::Approx(0.000001));
    }

    SUBCASE("Document attribute is the fallback") {
        doc.file_attributes[ATTR_PRECISION] = "0.00001";
        CHECK(resolve_precision(doc, GeometryOptions{}) == doctest::Approx(0.00001));
    }

    SUBCASE("Missing or unusable attribute gives the maximum tolerance") {
        doc.file_attributes.erase(ATTR_PRECISION);
        CHECK(resolve_precision(doc, GeometryOptions{}) == MAX_TOLERANCE);
        doc.file_attributes[ATTR_PRECISION] = "n/a";
        CHECK(resolve_precision(doc, GeometryOptions{}) == MAX_TOLERANCE);
    }
}

TEST_CASE("Assembler - Preprocess") {
    SUBCASE("Standard zone produces an EPSG reference") {
        auto result = convert(fixtures::sample_document());
        CHECK(result.crs == "EPSG:4527");
        CHECK(result.epsg == 4527);
        REQUIRE(result.features.size() == 1);
        const auto &feature = result.features[0];
        CHECK(feature.wkt == "POLYGON ((39500000.0000 3400000.0000, 39500100.0000 3400000.0000, "
                             "39500100.0000 3400100.0000, 39500000.0000 3400100.0000, "
                             "39500000.0000 3400000.0000))");
        CHECK(feature.attributes.at(KEY_PID) == "KD001");
        CHECK(feature.attributes.at(KEY_USAGE) == "旱地");
    }

    SUBCASE("Custom meridian produces a WKT reference") {
        auto text = fixtures::file_header("2000国家大地坐标系(114.3)", "3", "38") +
                    "[地块坐标]\n,@\nJ1,1,0,38500000\nJ2,1,0,38500010\nJ3,1,10,38500010\n";
        auto result = convert(text);
        CHECK(result.epsg == 0);
        CHECK(result.crs.rfind("PROJCS[", 0) == 0);
        CHECK(result.crs.find("114.3") != std::string::npos);
    }

    SUBCASE("Precision option controls the decimal places") {
        GeometryOptions opts;
        opts.precision = 0.000001;
        auto result = convert(fixtures::sample_document(), opts);
        CHECK(result.features.at(0).wkt.find("39500000.000000 3400000.000000") != std::string::npos);
    }

    SUBCASE("Auto close can be disabled") {
        auto text = fixtures::file_header() +
                    "[地块坐标]\n,@\nJ1,1,0,39500000\nJ2,1,0,39500010\nJ3,1,10,39500010\nJ4,1,10,39500000\n";
        GeometryOptions opts;
        opts.auto_close = false;
        CHECK_THROWS_AS(convert(text, opts), GeometryBuildError);
        CHECK_NOTHROW(convert(text));
    }

    SUBCASE("Empty parcel header before a valid parcel") {
        auto text = fixtures::file_header() + "[地块坐标]\n0,0,EMPTY,,,,,,@\n" +
                    fixtures::sample_document().substr(fixtures::sample_document().find("5,1200.5"));
        auto result = convert(text);
        CHECK(result.crs == "EPSG:4527");
        REQUIRE(result.features.size() == 1);
        CHECK(result.features[0].attributes.at(KEY_PID) == "KD001");
    }

    SUBCASE("Document without parcels") {
        CHECK_THROWS_AS(convert(fixtures::file_header() + "[地块坐标]\n"), Error);
    }
}
