#include "grader_harness/text_normalizer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <vector>

#include <nlohmann/json.hpp>

#include "grader_harness/strings.hpp"

namespace {

using nlohmann::json;

struct Replacement {
    std::string_view from;
    std::string_view to;
};

constexpr std::string_view kByteOrderMark = "\xEF\xBB\xBF";

constexpr std::array kPunctuationFolds = {
    Replacement{"\xE2\x80\x98", "'"},  // U+2018
    Replacement{"\xE2\x80\x99", "'"},  // U+2019
    Replacement{"\xE2\x80\x9C", "\""}, // U+201C
    Replacement{"\xE2\x80\x9D", "\""}, // U+201D
    Replacement{"\xE2\x80\x93", "-"},  // U+2013
    Replacement{"\xE2\x80\x94", "-"},  // U+2014
};

constexpr std::array kSpaceFolds = {
    Replacement{"\xC2\xA0", " "},      // no-break space
    Replacement{"\xE2\x80\x82", " "},  // en space
    Replacement{"\xE2\x80\x83", " "},  // em space
    Replacement{"\xE2\x80\x89", " "},  // thin space
    Replacement{"\xE2\x80\x8A", " "},  // hair space
    Replacement{"\xE2\x80\xAF", " "},  // narrow no-break space
    Replacement{"\xE2\x81\x9F", " "},  // medium mathematical space
    Replacement{"\xE3\x80\x80", " "},  // ideographic space
    Replacement{"\t", " "},
};

void replace_all(std::string& text, std::string_view from, std::string_view to) {
    if (from.empty()) {
        return;
    }
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

int hex_value(char ch) {
    if (ch >= '0' && ch <= '9') return ch - '0';
    if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
    return -1;
}

// Reads \uXXXX at \p pos; returns the code unit or -1.
long read_escape(std::string_view input, std::size_t pos) {
    if (pos + 6 > input.size() || input[pos] != '\\' || input[pos + 1] != 'u') {
        return -1;
    }
    long value = 0;
    for (std::size_t i = pos + 2; i < pos + 6; ++i) {
        const int digit = hex_value(input[i]);
        if (digit < 0) {
            return -1;
        }
        value = value * 16 + digit;
    }
    return value;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

void canonicalize(json& value, bool sort_arrays) {
    if (value.is_object()) {
        for (auto& item : value.items()) {
            canonicalize(item.value(), sort_arrays);
        }
    } else if (value.is_array()) {
        for (auto& element : value) {
            canonicalize(element, sort_arrays);
        }
        if (sort_arrays) {
            std::vector<std::pair<std::string, json>> keyed;
            keyed.reserve(value.size());
            for (auto& element : value) {
                keyed.emplace_back(element.dump(-1, ' ', false, json::error_handler_t::replace),
                                   std::move(element));
            }
            std::stable_sort(keyed.begin(), keyed.end(),
                             [](const auto& lhs, const auto& rhs) { return lhs.first < rhs.first; });
            json sorted = json::array();
            for (auto& [key, element] : keyed) {
                sorted.push_back(std::move(element));
            }
            value = std::move(sorted);
        }
    }
}

bool looks_like_json(std::string_view text) {
    const auto first = text.find_first_not_of(grader::harness::strings::kWhitespace);
    return first != std::string_view::npos && (text[first] == '{' || text[first] == '[');
}

std::string trim_line(std::string_view line) {
    const auto begin = line.find_first_not_of(' ');
    if (begin == std::string_view::npos) {
        return {};
    }
    const auto end = line.find_last_not_of(' ');
    return std::string{line.substr(begin, end - begin + 1)};
}

std::string collapse_spaces(std::string_view line) {
    std::string out;
    out.reserve(line.size());
    bool previous_space = false;
    for (char ch : line) {
        if (ch == ' ') {
            if (!previous_space) {
                out.push_back(ch);
            }
            previous_space = true;
        } else {
            out.push_back(ch);
            previous_space = false;
        }
    }
    return out;
}

std::string excerpt(std::string_view text, std::size_t start, std::size_t length) {
    if (start >= text.size()) {
        return {};
    }
    return std::string{text.substr(start, std::min(length, text.size() - start))};
}

}  // namespace

namespace grader::harness {

std::string unescape_unicode(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size()) {
        const long unit = read_escape(input, pos);
        if (unit < 0) {
            out.push_back(input[pos]);
            ++pos;
            continue;
        }
        pos += 6;
        std::uint32_t cp = static_cast<std::uint32_t>(unit);
        if (cp >= 0xD800 && cp <= 0xDBFF) {
            const long low = read_escape(input, pos);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (static_cast<std::uint32_t>(low) - 0xDC00);
                pos += 6;
            } else {
                cp = 0xFFFD;
            }
        } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
            cp = 0xFFFD;
        }
        append_utf8(out, cp);
    }
    return out;
}

std::optional<std::string> canonical_json(std::string_view input, bool sort_arrays) {
    auto parsed = json::parse(input.begin(), input.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    canonicalize(parsed, sort_arrays);
    return parsed.dump(-1, ' ', false, json::error_handler_t::replace);
}

std::string normalize_text(std::string_view input, const NormalizeOptions& options) {
    if (strings::is_blank(input)) {
        return {};
    }

    std::string text{input};
    replace_all(text, kByteOrderMark, "");
    text = unescape_unicode(text);
    for (const auto& fold : kPunctuationFolds) {
        replace_all(text, fold.from, fold.to);
    }

    if (looks_like_json(text)) {
        if (auto canonical = canonical_json(text, options.sort_arrays)) {
            text = std::move(*canonical);
        }
    }

    replace_all(text, "\r\n", "\n");
    replace_all(text, "\r", "\n");
    for (const auto& fold : kSpaceFolds) {
        replace_all(text, fold.from, fold.to);
    }
    // Remaining ASCII control whitespace behaves like a space.
    std::replace(text.begin(), text.end(), '\f', ' ');
    std::replace(text.begin(), text.end(), '\v', ' ');

    std::string joined;
    joined.reserve(text.size());
    std::size_t blank_run = 0;
    bool first_line = true;
    for (const auto& raw_line : strings::split(text, '\n')) {
        const auto line = collapse_spaces(trim_line(raw_line));
        if (line.empty()) {
            ++blank_run;
            if (blank_run > 1) {
                continue;
            }
        } else {
            blank_run = 0;
        }
        if (!first_line) {
            joined.push_back('\n');
        }
        joined.append(line);
        first_line = false;
    }

    auto result = strings::trim_copy(joined);
    if (options.case_insensitive) {
        result = strings::to_lower_copy(result);
    }
    return result;
}

std::string strip_aggressive(std::string_view input) {
    std::string out;
    out.reserve(input.size());
    for (char ch : input) {
        if (std::isspace(static_cast<unsigned char>(ch))) {
            continue;
        }
        if (ch == ',' || ch == '.' || ch == ':' || ch == ';') {
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

bool is_valid_utf8(std::string_view input) noexcept {
    std::size_t i = 0;
    while (i < input.size()) {
        const auto lead = static_cast<unsigned char>(input[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= input.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(input[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }
        if ((extra == 1 && cp < 0x80) || (extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

FirstDifference first_difference(std::string_view expected, std::string_view actual, std::size_t context) {
    FirstDifference diff;
    const auto shorter = std::min(expected.size(), actual.size());
    std::size_t index = 0;
    while (index < shorter && expected[index] == actual[index]) {
        ++index;
    }
    if (index == shorter && expected.size() == actual.size()) {
        return diff;
    }

    diff.index = static_cast<long long>(index);
    const auto start = index > context ? index - context : 0;
    diff.expected_excerpt = excerpt(expected, start, context * 2);
    diff.actual_excerpt = excerpt(actual, start, context * 2);
    return diff;
}

}  // namespace grader::harness
