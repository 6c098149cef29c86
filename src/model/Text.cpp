#include "model/Text.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <cctype>

namespace maestro::model {

namespace {

constexpr std::string_view UNSAFE_CHARS = "<>:\"/\\|?*~";

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::optional<std::string> file_safe_of(const std::string& ascii) {
    if (is_file_safe(ascii)) {
        return std::nullopt;
    }
    return make_file_safe(ascii);
}

}  // namespace

Text::Text(std::string value) : value_(std::move(value)) {
    if (auto derived = util::to_ascii(value_)) {
        ascii_kind_ = AsciiKind::Derived;
        ascii_ = std::move(*derived);
    }
    file_safe_ = file_safe_of(ascii());
}

Text::Text(std::string value, std::optional<std::string> ascii_override) : Text(std::move(value)) {
    if (!ascii_override) {
        return;
    }
    ascii_kind_ = AsciiKind::Overridden;
    if (auto derived = util::to_ascii(*ascii_override)) {
        ascii_ = std::move(*derived);
    } else {
        ascii_ = std::move(*ascii_override);
    }
    file_safe_ = file_safe_of(ascii_);
}

std::string Text::sortable_file_safe() const {
    const std::string& safe = file_safe();
    if (auto split = split_article(safe)) {
        std::string result(split->second);
        result += ", ";
        result += split->first;
        return result;
    }
    return safe;
}

Text& Text::operator+=(const Text& other) {
    if (&other == this) {
        Text copy(other);
        return *this += copy;
    }

    std::optional<std::string> joined_file_safe;
    if (file_safe_ || other.file_safe_) {
        joined_file_safe = file_safe();
        *joined_file_safe += other.file_safe();
    }

    if (ascii_kind_ != AsciiKind::Same || other.ascii_kind_ != AsciiKind::Same) {
        std::string joined_ascii = ascii();
        joined_ascii += other.ascii();
        ascii_ = std::move(joined_ascii);
        ascii_kind_ = (has_overridden_ascii() || other.has_overridden_ascii())
            ? AsciiKind::Overridden : AsciiKind::Derived;
    }

    value_ += other.value_;
    file_safe_ = std::move(joined_file_safe);
    return *this;
}

void Text::prepend(const Text& other) {
    std::optional<std::string> joined_file_safe;
    if (file_safe_ || other.file_safe_) {
        joined_file_safe = other.file_safe() + file_safe();
    }

    if (ascii_kind_ != AsciiKind::Same || other.ascii_kind_ != AsciiKind::Same) {
        std::string joined_ascii = other.ascii() + ascii();
        ascii_ = std::move(joined_ascii);
        ascii_kind_ = (has_overridden_ascii() || other.has_overridden_ascii())
            ? AsciiKind::Overridden : AsciiKind::Derived;
    }

    value_.insert(0, other.value_);
    file_safe_ = std::move(joined_file_safe);
}

Text operator+(const Text& lhs, const Text& rhs) {
    Text result(lhs);
    result += rhs;
    return result;
}

Text operator+(Text&& lhs, const Text& rhs) {
    lhs += rhs;
    return std::move(lhs);
}

Text operator+(const Text& lhs, Text&& rhs) {
    if (&lhs == &rhs) {
        return lhs + static_cast<const Text&>(rhs);
    }
    rhs.prepend(lhs);
    return std::move(rhs);
}

Text operator+(Text&& lhs, Text&& rhs) {
    lhs += rhs;
    return std::move(lhs);
}

Text comma_separated(std::span<const Text> items) {
    if (items.size() == 1) {
        return items.front();
    }
    Text result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) result += COMMA_SEPARATOR;
        result += items[i];
    }
    return result;
}

bool is_file_safe(std::string_view text) {
    return text.find_first_of(UNSAFE_CHARS) == std::string_view::npos;
}

std::string make_file_safe(std::string_view text) {
    std::string result;
    result.reserve(text.size() + 4);
    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        switch (c) {
            case '<': result += '['; break;
            case '>': result += ']'; break;
            case ':':
                if (i + 1 < text.size() && text[i + 1] == ' ') {
                    result += " -";
                } else {
                    result += '-';
                }
                break;
            case '"': result += '\''; break;
            case '/':
            case '|':
            case '~': result += '-'; break;
            case '\\':
            case '*': result += '_'; break;
            case '?': break;
            default: result += c; break;
        }
    }
    return result;
}

std::optional<std::pair<std::string_view, std::string_view>> split_article(std::string_view text) {
    auto space = text.find(' ');
    if (space == std::string_view::npos) {
        return std::nullopt;
    }
    std::string_view article = text.substr(0, space);
    if (iequals(article, "the") || iequals(article, "a") || iequals(article, "an")) {
        return std::make_pair(article, text.substr(space + 1));
    }
    return std::nullopt;
}

}  // namespace maestro::model
