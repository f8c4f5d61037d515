#include "parcelkit/charset.hpp"

#include "parcelkit/errors.hpp"
#include "parcelkit/text.hpp"

#include <boost/locale/encoding.hpp>
#include <boost/locale/encoding_utf.hpp>

#include <optional>

namespace parcelkit {

    namespace {
        constexpr std::string_view BOM_UTF8 = "\xEF\xBB\xBF";
        constexpr std::string_view BOM_UTF16_LE = "\xFF\xFE";
        constexpr std::string_view BOM_UTF16_BE = "\xFE\xFF";

        // zero byte share on one parity that marks an ASCII-heavy UTF-16 stream
        constexpr double ZERO_RATIO_HIGH = 0.30;
        constexpr double ZERO_RATIO_LOW = 0.05;

        constexpr double MIN_PRINTABLE_RATIO = 0.80;
        constexpr double MAX_CONTROL_RATIO = 0.05;
        constexpr double MAX_WEIRD_RATIO = 0.02;
        constexpr double MIN_COMPOSITE_SCORE = 0.90;

        bool starts_with(std::string_view s, std::string_view prefix) { return s.substr(0, prefix.size()) == prefix; }

        unsigned char byte_at(std::string_view s, std::size_t i) { return static_cast<unsigned char>(s[i]); }

        bool is_cjk_high_byte(unsigned char b) { return b >= 0x4E && b <= 0x9F; }

        std::optional<std::string> strict_gb18030(std::string_view bytes) {
            try {
                return boost::locale::conv::to_utf<char>(bytes.data(), bytes.data() + bytes.size(), "GB18030",
                                                         boost::locale::conv::stop);
            } catch (const boost::locale::conv::conversion_error &) {
                return std::nullopt;
            }
        }

        std::u16string to_units(std::string_view payload, bool little_endian) {
            std::u16string units;
            units.reserve(payload.size() / 2);
            for (std::size_t i = 0; i + 1 < payload.size(); i += 2) {
                unsigned lo = byte_at(payload, little_endian ? i : i + 1);
                unsigned hi = byte_at(payload, little_endian ? i + 1 : i);
                units.push_back(static_cast<char16_t>((hi << 8) | lo));
            }
            return units;
        }

        std::string decode_utf16(std::string_view payload, bool little_endian) {
            auto units = to_units(payload, little_endian);
            return boost::locale::conv::utf_to_utf<char>(units.data(), units.data() + units.size());
        }
    } // namespace

    namespace detail {
        Utf16Evaluation evaluate_utf16(std::string_view bytes, bool little_endian) {
            Utf16Evaluation ev;
            auto units = to_units(bytes, little_endian);
            if (units.empty())
                return ev;

            std::size_t total = units.size();
            std::size_t printable = 0, control = 0, weird = 0, ascii = 0, cjk = 0;
            std::size_t lone_surrogates = 0, suspicious = 0;

            for (std::size_t i = 0; i < total; ++i) {
                char16_t u = units[i];
                if (u >= 0xD800 && u <= 0xDBFF) {
                    if (i + 1 < total && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF) {
                        ++i;
                        ++printable;
                        continue;
                    }
                    ++lone_surrogates;
                } else if (u >= 0xDC00 && u <= 0xDFFF) {
                    ++lone_surrogates;
                }

                // GB18030 four-byte forms read as UTF-16 leave 0x30 in the low byte
                auto high = static_cast<unsigned char>(u >> 8);
                auto low = static_cast<unsigned char>(u & 0xFF);
                if (high != 0 && !is_cjk_high_byte(high) && high < 0xE0 && low == 0x30)
                    ++suspicious;

                if (u == 0x09 || u == 0x0A || u == 0x0D) {
                    ++printable;
                } else if (u < 0x20) {
                    ++control;
                } else if (u <= 0x7F) {
                    ++printable;
                    ++ascii;
                } else if ((u >= 0x4E00 && u <= 0x9FFF) || (u >= 0x3400 && u <= 0x4DBF)) {
                    ++printable;
                    ++cjk;
                } else if (u == 0xFFFE || u == 0xFFFF || (u >= 0xFDD0 && u <= 0xFDEF)) {
                    ++weird;
                } else {
                    ++printable;
                }
            }

            if (lone_surrogates > total / 100)
                return ev;

            auto ratio = [total](std::size_t n) { return static_cast<double>(n) / static_cast<double>(total); };
            ev.valid_structure = true;
            ev.printable_ratio = ratio(printable);
            ev.control_ratio = ratio(control);
            ev.weird_ratio = ratio(weird + lone_surrogates);
            ev.ascii_ratio = ratio(ascii);
            ev.cjk_ratio = ratio(cjk);
            ev.composite_score = ev.printable_ratio * 0.7 + (ev.cjk_ratio + ev.ascii_ratio) * 0.3;
            if (total < 16 && suspicious > total / 4)
                ev.valid_structure = false;
            return ev;
        }

        std::string guess_utf16(std::string_view bytes) {
            if (bytes.size() < 4)
                return {};

            std::size_t even_zeros = 0, odd_zeros = 0;
            for (std::size_t i = 0; i < bytes.size(); ++i) {
                if (byte_at(bytes, i) == 0)
                    ++(i % 2 == 0 ? even_zeros : odd_zeros);
            }
            auto half = static_cast<double>(bytes.size() / 2);
            double even_ratio = even_zeros / half;
            double odd_ratio = odd_zeros / half;
            bool le_zero_pattern = odd_ratio > ZERO_RATIO_HIGH && even_ratio < ZERO_RATIO_LOW;
            bool be_zero_pattern = even_ratio > ZERO_RATIO_HIGH && odd_ratio < ZERO_RATIO_LOW;

            bool le = le_zero_pattern;
            bool be = be_zero_pattern;
            bool even_length = bytes.size() % 2 == 0;

            // pure CJK text has no zero bytes, but its high bytes cluster in 0x4E..0x9F
            if (!le && !be && even_length) {
                std::size_t le_high = 0, be_high = 0;
                for (std::size_t i = 0; i + 1 < bytes.size(); i += 2) {
                    if (is_cjk_high_byte(byte_at(bytes, i + 1)))
                        ++le_high;
                    if (is_cjk_high_byte(byte_at(bytes, i)))
                        ++be_high;
                }
                double le_high_ratio = le_high / half;
                double be_high_ratio = be_high / half;
                if (le_high_ratio >= 0.75 && be_high_ratio < 0.60)
                    le = true;
                if (be_high_ratio >= 0.75 && le_high_ratio < 0.60)
                    be = true;
            }

            bool forced = false;
            if (!le && !be && even_length && bytes.size() >= 8) {
                forced = true;
                le = be = true;
            }
            if (!le && !be)
                return {};

            bool no_zeros = even_zeros + odd_zeros == 0;
            auto acceptable = [&](const Utf16Evaluation &ev) {
                if (!ev.valid_structure || ev.printable_ratio < MIN_PRINTABLE_RATIO ||
                    ev.control_ratio > MAX_CONTROL_RATIO || ev.weird_ratio > MAX_WEIRD_RATIO)
                    return false;
                if (forced && ev.ascii_ratio < 0.05 && ev.cjk_ratio < 0.05)
                    return false;
                // short UTF-8 CJK text split into fake code units
                if (forced && bytes.size() < 24 && no_zeros && ev.cjk_ratio > 0.0 && ev.cjk_ratio < 0.60)
                    return false;
                return true;
            };

            auto le_eval = evaluate_utf16(bytes, true);
            auto be_eval = evaluate_utf16(bytes, false);
            bool le_ok = le && acceptable(le_eval);
            bool be_ok = be && acceptable(be_eval);

            // a weak UTF-16 reading is left to the GB18030 check when that decodes cleanly
            bool weak = (le_ok && le_eval.composite_score < MIN_COMPOSITE_SCORE) ||
                        (be_ok && be_eval.composite_score < MIN_COMPOSITE_SCORE);
            if (weak && strict_gb18030(bytes))
                return {};

            if (le_ok && !be_ok)
                return ENCODING_UTF16_LE;
            if (be_ok && !le_ok)
                return ENCODING_UTF16_BE;
            if (!le_ok)
                return {};

            if (le_eval.composite_score > be_eval.composite_score)
                return ENCODING_UTF16_LE;
            if (be_eval.composite_score > le_eval.composite_score)
                return ENCODING_UTF16_BE;
            if (le_zero_pattern)
                return ENCODING_UTF16_LE;
            if (be_zero_pattern)
                return ENCODING_UTF16_BE;
            return {};
        }
    } // namespace detail

    std::string detect_encoding(std::string_view bytes) {
        if (bytes.empty())
            return ENCODING_UTF8;
        if (starts_with(bytes, BOM_UTF8))
            return ENCODING_UTF8_BOM;
        if (starts_with(bytes, BOM_UTF16_LE))
            return ENCODING_UTF16_LE;
        if (starts_with(bytes, BOM_UTF16_BE))
            return ENCODING_UTF16_BE;
        if (is_valid_utf8_prefix(bytes))
            return ENCODING_UTF8;
        if (auto utf16 = detail::guess_utf16(bytes); !utf16.empty())
            return utf16;
        if (strict_gb18030(bytes))
            return ENCODING_GB18030;
        return ENCODING_UNKNOWN;
    }

    DecodeResult decode(std::string_view bytes) {
        DecodeResult result;
        result.encoding = detect_encoding(bytes);

        if (result.encoding == ENCODING_UTF8 || result.encoding == ENCODING_UTF8_BOM) {
            auto payload = result.encoding == ENCODING_UTF8_BOM ? bytes.substr(BOM_UTF8.size()) : bytes;
            std::size_t replaced = 0;
            result.text = sanitize_utf8(payload, replaced);
            if (replaced > 0)
                result.warning = "utf-8 input contained " + std::to_string(replaced) + " invalid bytes, replaced";
        } else if (result.encoding == ENCODING_UTF16_LE || result.encoding == ENCODING_UTF16_BE) {
            bool little_endian = result.encoding == ENCODING_UTF16_LE;
            auto bom = little_endian ? BOM_UTF16_LE : BOM_UTF16_BE;
            auto payload = bytes;
            if (starts_with(bytes, bom)) {
                payload = bytes.substr(bom.size());
                if (payload.size() % 2 != 0)
                    throw DecodeError(result.encoding + " payload has an odd number of bytes");
            } else if (payload.size() % 2 != 0) {
                payload.remove_suffix(1);
                result.warning = result.encoding + " input without BOM ended in half a code unit, dropped";
            }
            result.text = decode_utf16(payload, little_endian);
        } else if (result.encoding == ENCODING_GB18030) {
            result.text = *strict_gb18030(bytes);
        } else {
            std::size_t replaced = 0;
            result.text = sanitize_utf8(bytes, replaced);
            result.warning = "unknown encoding, " + std::to_string(replaced) + " invalid bytes replaced with U+FFFD";
        }
        return result;
    }

} // namespace parcelkit
