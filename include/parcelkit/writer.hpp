#pragma once

#include "parcelkit/types.hpp"

#include <boost/json.hpp>

#include <filesystem>
#include <iosfwd>

namespace parcelkit {

    boost::json::value to_json(Feature const &feature);

    // {"crs": ..., "epsg": ... (omitted when 0), "features": [{"wkt": ..., "attributes": {...}}]}
    boost::json::value to_json(PreprocessResult const &result);

    void write_result(PreprocessResult const &result, std::filesystem::path const &out_path);

    std::ostream &operator<<(std::ostream &os, PreprocessResult const &result);

} // namespace parcelkit
