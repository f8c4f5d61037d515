#include "parcelkit/writer.hpp"

#include <fstream>
#include <ostream>
#include <stdexcept>

namespace parcelkit {

    boost::json::value to_json(Feature const &feature) {
        boost::json::object j;
        j["wkt"] = feature.wkt;
        boost::json::object attrs;
        for (auto const &kv : feature.attributes)
            attrs[kv.first] = kv.second;
        j["attributes"] = std::move(attrs);
        return j;
    }

    boost::json::value to_json(PreprocessResult const &result) {
        boost::json::object j;
        j["crs"] = result.crs;
        if (result.epsg > 0)
            j["epsg"] = result.epsg;

        boost::json::array features;
        for (auto const &f : result.features)
            features.push_back(to_json(f));
        j["features"] = std::move(features);
        return j;
    }

    void write_result(PreprocessResult const &result, std::filesystem::path const &out_path) {
        auto j = to_json(result);
        std::ofstream ofs(out_path);
        if (!ofs)
            throw std::runtime_error("Cannot open for write: " + out_path.string());
        ofs << boost::json::serialize(j) << "\n";
        if (!ofs)
            throw std::runtime_error("Failed writing: " + out_path.string());
    }

    std::ostream &operator<<(std::ostream &os, PreprocessResult const &result) {
        os << "CRS: " << (result.epsg > 0 ? result.crs : std::string("custom WKT")) << "\n";
        os << "FEATURES: " << result.features.size() << "\n";
        for (auto const &f : result.features) {
            auto it = f.attributes.find(KEY_PID);
            os << "  POLYGON " << (it != f.attributes.end() ? it->second : std::string()) << "\n";
            if (!f.attributes.empty())
                os << "    PROPS:" << f.attributes.size() << "\n";
        }
        return os;
    }

} // namespace parcelkit
