#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace parcelkit {

    namespace detail {
        inline constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;

        // Decodes one UTF-8 sequence starting at pos. On success advances pos and returns true.
        // On a malformed sequence pos is left untouched and false is returned.
        bool next_code_point(std::string_view s, std::size_t &pos, char32_t &cp);

        void append_utf8(std::string &out, char32_t cp);

        // Half-width counterpart of a full-width code point, or cp itself.
        char32_t fold_code_point(char32_t cp);
    } // namespace detail

    // Folds full-width forms (U+3000, U+FF01..U+FF5E) and common CJK punctuation to ASCII.
    std::string fold_full_width(std::string_view s);

    // Trims ASCII white space and the ideographic space U+3000 from both ends.
    std::string_view trim(std::string_view s);

    // First run of ASCII digits in s as an integer, 0 when there is none or it overflows.
    int extract_first_int(std::string_view s);

    // Whole-field numeric parsing. Surrounding white space and a leading '+' are accepted.
    std::optional<int> parse_int(std::string_view s);
    std::optional<double> parse_double(std::string_view s);

    bool is_valid_utf8(std::string_view s);
    // Like is_valid_utf8, but the input may stop in the middle of its last sequence.
    bool is_valid_utf8_prefix(std::string_view s);

    // Replaces every malformed byte with U+FFFD. replaced receives the number of substitutions.
    std::string sanitize_utf8(std::string_view s, std::size_t &replaced);

} // namespace parcelkit
