#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unicode/unistr.h>
#include <unicode/normalizer2.h>
#include <unicode/utf16.h>

namespace maestro::util {

inline bool is_ascii(std::string_view text) {
    for (unsigned char c : text) {
        if (c >= 0x80) return false;
    }
    return true;
}

/// Transliterate UTF-8 text to plain ASCII.
/// Returns nullopt when the input is already ASCII. Otherwise the text is
/// NFKD-decomposed (é → e + U+0301, ﬁ → fi), ASCII code points are kept,
/// curly quotes and ¡ are substituted, and every other code point is dropped.
/// Malformed UTF-8 decodes to U+FFFD and is dropped too.
inline std::optional<std::string> to_ascii(std::string_view text) {
    if (is_ascii(text)) {
        return std::nullopt;
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* nfkd = icu::Normalizer2::getNFKDInstance(status);
    icu::UnicodeString decomposed;
    if (U_SUCCESS(status) && nfkd) {
        decomposed = nfkd->normalize(source, status);
    }
    if (U_FAILURE(status) || !nfkd) {
        // Fallback: no decomposition, accented letters are dropped whole
        decomposed = source;
    }

    std::string result;
    result.reserve(text.size());
    for (int32_t i = 0; i < decomposed.length();) {
        UChar32 c = decomposed.char32At(i);
        i += U16_LENGTH(c);

        if (c < 0x80) {
            result.push_back(static_cast<char>(c));
            continue;
        }
        switch (c) {
            case 0x2018:  // ‘
            case 0x2019:  // ’
                result.push_back('\'');
                break;
            case 0x201C:  // “
            case 0x201D:  // ”
                result.push_back('"');
                break;
            case 0x00A1:  // ¡
                result.push_back('!');
                break;
            default:
                break;
        }
    }
    return result;
}

} // namespace maestro::util
