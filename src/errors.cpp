#include "parcelkit/errors.hpp"

#include <utility>

namespace parcelkit {

    namespace {
        std::string join(const std::vector<std::string> &items, const char *sep) {
            std::string out;
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (i > 0)
                    out += sep;
                out += items[i];
            }
            return out;
        }
    } // namespace

    SyntaxError::SyntaxError(std::size_t line, std::string code, const std::string &detail)
        : ParseError("line " + std::to_string(line) + ": " + code + ": " + detail), line_(line),
          code_(std::move(code)) {}

    MissingParcelHeaderError::MissingParcelHeaderError(std::size_t line)
        : SyntaxError(line, CODE_MISSING_PARCEL_HEADER,
                      "coordinate record found in [地块坐标] before any parcel header line ending in ',@'") {}

    MissingSectionError::MissingSectionError(std::string section)
        : ParseError("document is missing the " + section + " section"), section_(std::move(section)) {}

    MissingAttributesError::MissingAttributesError(std::vector<std::string> keys)
        : ParseError("[属性描述] is missing required attributes: " + join(keys, ", ")), keys_(std::move(keys)) {}

    GeometryBuildError::GeometryBuildError(std::string parcel_id, const std::string &detail)
        : Error("parcel '" + parcel_id + "': " + detail), parcel_id_(std::move(parcel_id)) {}

} // namespace parcelkit
