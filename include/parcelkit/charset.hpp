#pragma once

#include <string>
#include <string_view>

namespace parcelkit {

    inline constexpr const char *ENCODING_UTF8 = "utf-8";
    inline constexpr const char *ENCODING_UTF8_BOM = "utf-8-sig";
    inline constexpr const char *ENCODING_UTF16_LE = "utf-16-le";
    inline constexpr const char *ENCODING_UTF16_BE = "utf-16-be";
    inline constexpr const char *ENCODING_GB18030 = "gb18030";
    inline constexpr const char *ENCODING_UNKNOWN = "unknown";

    struct DecodeResult {
        std::string text;     // UTF-8
        std::string encoding; // one of the ENCODING_* labels
        std::string warning;  // empty when the decode was clean
    };

    namespace detail {
        // Quality of a byte sequence read as UTF-16 in one byte order. Ratios are per code unit.
        struct Utf16Evaluation {
            bool valid_structure = false;
            double printable_ratio = 0.0;
            double control_ratio = 0.0;
            double weird_ratio = 0.0; // noncharacters and lone surrogates
            double ascii_ratio = 0.0;
            double cjk_ratio = 0.0;
            double composite_score = 0.0;
        };

        Utf16Evaluation evaluate_utf16(std::string_view bytes, bool little_endian);

        // ENCODING_UTF16_LE / ENCODING_UTF16_BE for BOM-less UTF-16, or an empty string when the bytes do not
        // look like UTF-16 or a strict GB18030 reading explains them better.
        std::string guess_utf16(std::string_view bytes);
    } // namespace detail

    // Detects the encoding from BOM, UTF-8 validity (a truncated final sequence is tolerated), BOM-less UTF-16
    // heuristics or a strict GB18030 decode, in that order.
    std::string detect_encoding(std::string_view bytes);

    // Converts a raw export to UTF-8. Undecodable input is returned with U+FFFD substitutions and a warning.
    // Throws DecodeError for a BOM-declared UTF-16 payload with an odd byte count.
    DecodeResult decode(std::string_view bytes);

} // namespace parcelkit
