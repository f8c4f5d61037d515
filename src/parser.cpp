#include "parcelkit/parser.hpp"

#include "parcelkit/errors.hpp"
#include "parcelkit/logging.hpp"
#include "parcelkit/text.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace parcelkit {

    namespace {
        std::vector<std::string_view> split(std::string_view s, char sep) {
            std::vector<std::string_view> parts;
            std::size_t start = 0;
            while (true) {
                auto pos = s.find(sep, start);
                if (pos == std::string_view::npos) {
                    parts.push_back(s.substr(start));
                    break;
                }
                parts.push_back(s.substr(start, pos - start));
                start = pos + 1;
            }
            return parts;
        }
    } // namespace

    namespace detail {
        ParcelBuilder::ParcelBuilder(Attributes attributes) : attributes_(std::move(attributes)) {}

        void ParcelBuilder::add_point(const Point &pt) { rings_[pt.ring_id].push_back(pt); }

        Parcel ParcelBuilder::finish() && {
            Parcel parcel;
            parcel.attributes = std::move(attributes_);
            for (auto &[ring_id, points] : rings_) {
                if (points.empty())
                    continue;
                parcel.rings.push_back(std::move(points));
            }
            rings_.clear();
            return parcel;
        }

        Attributes parse_parcel_header(std::string_view line) {
            Attributes attrs;
            attrs.reserve(PARCEL_ATTRIBUTE_KEYS.size());

            auto core = trim(line);
            if (core.size() >= 2 && core.substr(core.size() - 2) == ",@")
                core.remove_suffix(2);
            core = trim(core);

            if (core.empty()) {
                for (auto key : PARCEL_ATTRIBUTE_KEYS)
                    attrs[key] = "";
                return attrs;
            }

            auto parts = split(core, ',');
            for (std::size_t i = 0; i < PARCEL_ATTRIBUTE_KEYS.size(); ++i) {
                attrs[PARCEL_ATTRIBUTE_KEYS[i]] = i < parts.size() ? std::string(trim(parts[i])) : std::string();
            }
            return attrs;
        }

        Point parse_coordinate(std::string_view line, std::size_t line_no) {
            auto parts = split(line, ',');
            if (parts.size() < 4)
                throw SyntaxError(line_no, CODE_INVALID_POINT_FORMAT, "coordinate record has fewer than 4 fields");

            Point pt;
            pt.id = extract_first_int(parts[0]);

            auto ring_id = parse_int(parts[1]);
            if (!ring_id)
                throw SyntaxError(line_no, CODE_INVALID_POINT_FORMAT, "invalid ring id: " + std::string(parts[1]));
            pt.ring_id = *ring_id;

            auto x = parse_double(parts[2]);
            if (!x)
                throw SyntaxError(line_no, CODE_INVALID_POINT_FORMAT, "invalid X coordinate: " + std::string(parts[2]));
            pt.x = *x;

            auto y = parse_double(parts[3]);
            if (!y)
                throw SyntaxError(line_no, CODE_INVALID_POINT_FORMAT, "invalid Y coordinate: " + std::string(parts[3]));
            pt.y = *y;

            return pt;
        }
    } // namespace detail

    namespace {
        enum class ParseState { Initial, Attributes, Coordinates };

        constexpr std::string_view MISWRITTEN_KEY = "产生";
        constexpr std::string_view CANONICAL_KEY = "生产";

        std::string canonical_key(std::string key) {
            std::size_t pos = 0;
            while ((pos = key.find(MISWRITTEN_KEY, pos)) != std::string::npos) {
                key.replace(pos, MISWRITTEN_KEY.size(), CANONICAL_KEY);
                pos += CANONICAL_KEY.size();
            }
            return key;
        }

        bool ends_with_parcel_marker(std::string_view line) {
            return line.size() >= 2 && line.substr(line.size() - 2) == ",@";
        }

        class ParseContext {
          public:
            void process_line(std::string_view line, std::size_t line_no) {
                switch (state_) {
                case ParseState::Initial:
                    if (line == SECTION_ATTRIBUTES)
                        state_ = ParseState::Attributes;
                    break;
                case ParseState::Attributes:
                    process_attribute_line(line);
                    break;
                case ParseState::Coordinates:
                    process_coordinate_line(line, line_no);
                    break;
                }
            }

            ParsedDocument finish() {
                finalize_parcel();

                if (state_ == ParseState::Initial)
                    throw MissingSectionError(SECTION_ATTRIBUTES);
                if (state_ == ParseState::Attributes)
                    throw MissingSectionError(SECTION_COORDINATES);

                std::vector<std::string> missing;
                for (auto key : REQUIRED_FILE_ATTRIBUTES) {
                    if (attrs_.find(key) == attrs_.end())
                        missing.emplace_back(key);
                }
                if (!missing.empty())
                    throw MissingAttributesError(std::move(missing));

                ParsedDocument doc;
                doc.parcels = std::move(parcels_);
                doc.file_attributes = std::move(attrs_);
                return doc;
            }

          private:
            void process_attribute_line(std::string_view line) {
                if (line == SECTION_COORDINATES) {
                    state_ = ParseState::Coordinates;
                    return;
                }
                // a repeated file header keeps the attributes collected so far
                if (line == SECTION_ATTRIBUTES)
                    return;

                auto eq = line.find('=');
                if (eq == std::string_view::npos)
                    return;

                std::string key(trim(line.substr(0, eq)));
                std::string value = fold_full_width(trim(line.substr(eq + 1)));

                std::string canonical = canonical_key(key);
                if (canonical != key) {
                    if (attrs_.find(canonical) != attrs_.end()) {
                        logger()->debug("ignoring miswritten attribute '{}', '{}' already present", key, canonical);
                        return;
                    }
                    logger()->debug("attribute key '{}' corrected to '{}'", key, canonical);
                    key = std::move(canonical);
                }
                attrs_[key] = std::move(value);
            }

            void process_coordinate_line(std::string_view line, std::size_t line_no) {
                if (line == SECTION_ATTRIBUTES || line == SECTION_COORDINATES)
                    return;
                // repeated "key=value" header lines never contain a comma
                if (line.find('=') != std::string_view::npos && line.find(',') == std::string_view::npos)
                    return;

                if (ends_with_parcel_marker(line)) {
                    finalize_parcel();
                    current_.emplace(detail::parse_parcel_header(line));
                    return;
                }

                if (!current_)
                    throw MissingParcelHeaderError(line_no);
                current_->add_point(detail::parse_coordinate(line, line_no));
            }

            // a header without any coordinate record yields no parcel
            void finalize_parcel() {
                if (!current_)
                    return;
                if (current_->empty()) {
                    logger()->debug("dropping parcel header without coordinates");
                } else {
                    parcels_.push_back(std::move(*current_).finish());
                }
                current_.reset();
            }

            ParseState state_ = ParseState::Initial;
            Attributes attrs_;
            std::vector<Parcel> parcels_;
            std::optional<detail::ParcelBuilder> current_;
        };
    } // namespace

    ParsedDocument parse(std::string_view text) {
        ParseContext ctx;

        std::size_t line_no = 0;
        std::size_t start = 0;
        while (start < text.size()) {
            auto end = text.find('\n', start);
            if (end == std::string_view::npos)
                end = text.size();
            auto line = trim(text.substr(start, end - start));
            start = end + 1;
            ++line_no;

            if (line.empty())
                continue;
            ctx.process_line(line, line_no);
        }

        auto doc = ctx.finish();
        logger()->debug("parsed {} parcels, {} file attributes", doc.parcels.size(), doc.file_attributes.size());
        return doc;
    }

    std::ostream &operator<<(std::ostream &os, ParsedDocument const &doc) {
        os << "PARCELS: " << doc.parcels.size() << "\n";
        os << "FILE ATTRIBUTES: " << doc.file_attributes.size() << "\n";
        for (auto const &parcel : doc.parcels) {
            auto it = parcel.attributes.find(KEY_PID);
            os << "  PARCEL " << (it != parcel.attributes.end() ? it->second : std::string()) << "\n";
            for (auto const &ring : parcel.rings)
                os << "    RING " << (ring.empty() ? 0 : ring.front().ring_id) << ": " << ring.size() << " points\n";
        }
        return os;
    }

} // namespace parcelkit
