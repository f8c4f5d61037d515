#pragma once

#include "parcelkit/types.hpp"

#include <cstddef>
#include <iosfwd>
#include <map>
#include <string_view>

namespace parcelkit {

    namespace detail {
        // Collects the points of one parcel grouped by ring id until the next parcel header.
        class ParcelBuilder {
          public:
            explicit ParcelBuilder(Attributes attributes);

            void add_point(const Point &pt);
            bool empty() const noexcept { return rings_.empty(); }

            // Rings ordered by ring id, empty groups dropped. No geometric correction is applied.
            Parcel finish() &&;

          private:
            Attributes attributes_;
            std::map<int, Ring> rings_;
        };

        // Positional split of a "...,@" header line into the eight parcel attribute keys.
        Attributes parse_parcel_header(std::string_view line);

        // "prefix+digits,ringId,x,y[,...]". Throws SyntaxError tagged with line_no.
        Point parse_coordinate(std::string_view line, std::size_t line_no);
    } // namespace detail

    // Parses a decoded cadastral export into parcels with raw rings plus file level attributes.
    //
    // Throws SyntaxError / MissingParcelHeaderError on the first malformed line, MissingSectionError when
    // either section marker never appears, and MissingAttributesError listing every absent required key.
    ParsedDocument parse(std::string_view text);

    std::ostream &operator<<(std::ostream &os, ParsedDocument const &doc);

} // namespace parcelkit
