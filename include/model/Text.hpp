#pragma once

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace maestro::model {

/**
 * A display string paired with its ASCII and filename-safe forms.
 *
 * - value():     the text as written (UTF-8)
 * - ascii():     value() when it is already ASCII, otherwise a transliteration
 *                or a manual override
 * - file_safe(): ascii() with filesystem-reserved characters replaced; stored
 *                only when it differs from ascii()
 *
 * Concatenation is associative with Text() as identity, and an override on
 * either side carries into the result.
 */
class Text {
public:
    enum class AsciiKind { Same, Derived, Overridden };

    Text() = default;
    Text(std::string value);
    Text(std::string value, std::optional<std::string> ascii_override);

    const std::string& value() const { return value_; }
    const std::string& ascii() const { return ascii_kind_ == AsciiKind::Same ? value_ : ascii_; }
    const std::string& file_safe() const { return file_safe_ ? *file_safe_ : ascii(); }
    std::string sortable_file_safe() const;

    AsciiKind ascii_kind() const { return ascii_kind_; }
    bool has_overridden_ascii() const { return ascii_kind_ == AsciiKind::Overridden; }
    bool has_distinct_file_safe() const { return file_safe_.has_value(); }
    bool empty() const { return value_.empty(); }

    Text& operator+=(const Text& other);

    bool operator==(const Text& other) const = default;

    friend Text operator+(const Text& lhs, Text&& rhs);

private:
    void prepend(const Text& other);

    std::string value_;
    AsciiKind ascii_kind_ = AsciiKind::Same;
    std::string ascii_;  // empty unless ascii_kind_ != Same
    std::optional<std::string> file_safe_;
};

Text operator+(const Text& lhs, const Text& rhs);
Text operator+(Text&& lhs, const Text& rhs);
Text operator+(const Text& lhs, Text&& rhs);
Text operator+(Text&& lhs, Text&& rhs);

inline const Text COMMA_SEPARATOR{", "};

// Joins with ", ". An empty list yields Text().
Text comma_separated(std::span<const Text> items);

// True when text contains none of < > : " / \ | ? * ~
bool is_file_safe(std::string_view text);
std::string make_file_safe(std::string_view text);

// Splits a leading "a ", "an " or "the " (any case) from the rest.
// Returns {article, rest} with the article's original casing.
std::optional<std::pair<std::string_view, std::string_view>> split_article(std::string_view text);

}  // namespace maestro::model
