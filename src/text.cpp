#include "parcelkit/text.hpp"

#include <boost/locale/utf.hpp>

#include <charconv>
#include <iterator>

namespace parcelkit {

    namespace utf = boost::locale::utf;

    namespace detail {
        bool next_code_point(std::string_view s, std::size_t &pos, char32_t &cp) {
            if (pos >= s.size())
                return false;

            const char *p = s.data() + pos;
            utf::code_point c = utf::utf_traits<char>::decode(p, s.data() + s.size());
            if (c == utf::illegal || c == utf::incomplete)
                return false;

            cp = static_cast<char32_t>(c);
            pos = static_cast<std::size_t>(p - s.data());
            return true;
        }

        void append_utf8(std::string &out, char32_t cp) {
            utf::utf_traits<char>::encode(static_cast<utf::code_point>(cp), std::back_inserter(out));
        }

        char32_t fold_code_point(char32_t cp) {
            if (cp == 0x3000)
                return U' ';
            if (cp >= 0xFF01 && cp <= 0xFF5E)
                return cp - 0xFEE0;
            switch (cp) {
            case U'“':
            case U'”':
                return U'"';
            case U'‘':
            case U'’':
                return U'\'';
            default:
                return cp;
            }
        }
    } // namespace detail

    std::string fold_full_width(std::string_view s) {
        std::string out;
        out.reserve(s.size());
        std::size_t pos = 0;
        while (pos < s.size()) {
            char32_t cp;
            if (!detail::next_code_point(s, pos, cp)) {
                out += s[pos++];
                continue;
            }
            detail::append_utf8(out, detail::fold_code_point(cp));
        }
        return out;
    }

    std::string_view trim(std::string_view s) {
        static constexpr std::string_view ideographic_space = "\xE3\x80\x80";
        auto is_ascii_space = [](char c) {
            return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
        };

        bool changed = true;
        while (changed && !s.empty()) {
            changed = false;
            if (is_ascii_space(s.front())) {
                s.remove_prefix(1);
                changed = true;
            } else if (s.substr(0, ideographic_space.size()) == ideographic_space) {
                s.remove_prefix(ideographic_space.size());
                changed = true;
            }
        }
        changed = true;
        while (changed && !s.empty()) {
            changed = false;
            if (is_ascii_space(s.back())) {
                s.remove_suffix(1);
                changed = true;
            } else if (s.size() >= ideographic_space.size() &&
                       s.substr(s.size() - ideographic_space.size()) == ideographic_space) {
                s.remove_suffix(ideographic_space.size());
                changed = true;
            }
        }
        return s;
    }

    int extract_first_int(std::string_view s) {
        auto is_digit = [](char c) { return c >= '0' && c <= '9'; };
        std::size_t begin = 0;
        while (begin < s.size() && !is_digit(s[begin]))
            ++begin;
        if (begin == s.size())
            return 0;
        std::size_t end = begin;
        while (end < s.size() && is_digit(s[end]))
            ++end;

        int value = 0;
        auto [ptr, ec] = std::from_chars(s.data() + begin, s.data() + end, value);
        if (ec != std::errc{})
            return 0;
        return value;
    }

    namespace {
        std::string_view strip_plus(std::string_view s) {
            s = trim(s);
            if (s.size() > 1 && s.front() == '+' && s[1] != '-')
                s.remove_prefix(1);
            return s;
        }
    } // namespace

    std::optional<int> parse_int(std::string_view s) {
        s = strip_plus(s);
        if (s.empty())
            return std::nullopt;
        int value = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size())
            return std::nullopt;
        return value;
    }

    std::optional<double> parse_double(std::string_view s) {
        s = strip_plus(s);
        if (s.empty())
            return std::nullopt;
        double value = 0.0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc{} || ptr != s.data() + s.size())
            return std::nullopt;
        return value;
    }

    bool is_valid_utf8(std::string_view s) {
        std::size_t pos = 0;
        char32_t cp;
        while (pos < s.size()) {
            if (!detail::next_code_point(s, pos, cp))
                return false;
        }
        return true;
    }

    bool is_valid_utf8_prefix(std::string_view s) {
        const char *p = s.data();
        const char *end = s.data() + s.size();
        while (p != end) {
            utf::code_point c = utf::utf_traits<char>::decode(p, end);
            if (c == utf::incomplete)
                return true;
            if (c == utf::illegal)
                return false;
        }
        return true;
    }

    std::string sanitize_utf8(std::string_view s, std::size_t &replaced) {
        std::string out;
        out.reserve(s.size());
        replaced = 0;
        std::size_t pos = 0;
        while (pos < s.size()) {
            std::size_t start = pos;
            char32_t cp;
            if (detail::next_code_point(s, pos, cp)) {
                out.append(s.substr(start, pos - start));
            } else {
                detail::append_utf8(out, detail::REPLACEMENT_CHAR);
                ++replaced;
                ++pos;
            }
        }
        return out;
    }

} // namespace parcelkit
