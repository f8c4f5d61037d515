#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "fixtures.hpp"
#include "parcelkit/assembler.hpp"
#include "parcelkit/writer.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

using namespace parcelkit;

TEST_CASE("Writer - JSON shape") {
    auto result = convert(fixtures::sample_document());

    SUBCASE("Standard result carries the EPSG code") {
        auto j = to_json(result).as_object();
        CHECK(j.at("crs").as_string() == "EPSG:4527");
        CHECK(j.at("epsg").as_int64() == 4527);
        const auto &features = j.at("features").as_array();
        REQUIRE(features.size() == 1);
        const auto &feature = features[0].as_object();
        CHECK(feature.at("wkt").as_string().starts_with("POLYGON (("));
        const auto &attrs = feature.at("attributes").as_object();
        CHECK(attrs.at("pid").as_string() == "KD001");
        CHECK(attrs.at("pname").as_string() == "地块一");
        CHECK(attrs.size() == PARCEL_ATTRIBUTE_KEYS.size());
    }

    SUBCASE("EPSG is omitted for a custom projection") {
        PreprocessResult custom;
        custom.crs = "PROJCS[\"CGCS2000_3_Degree_GK_CM_114.3E\"]";
        auto j = to_json(custom).as_object();
        CHECK(j.at("crs").as_string() == custom.crs);
        CHECK_FALSE(j.contains("epsg"));
        CHECK(j.at("features").as_array().empty());
    }
}

TEST_CASE("Writer - Write and read back") {
    auto result = convert(fixtures::sample_document());
    const std::filesystem::path test_file = "/tmp/parcelkit_test_output.json";

    SUBCASE("File content parses to the same document") {
        write_result(result, test_file);
        CHECK(std::filesystem::exists(test_file));

        std::ifstream ifs(test_file);
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        auto loaded = boost::json::parse(buffer.str());
        CHECK(loaded == to_json(result));

        std::filesystem::remove(test_file);
    }

    SUBCASE("Write to invalid path throws") {
        CHECK_THROWS_AS(write_result(result, "/nonexistent/dir/out.json"), std::runtime_error);
    }

    SUBCASE("Summary") {
        std::ostringstream os;
        os << result;
        CHECK(os.str().find("CRS: EPSG:4527") != std::string::npos);
        CHECK(os.str().find("POLYGON KD001") != std::string::npos);
    }
}
