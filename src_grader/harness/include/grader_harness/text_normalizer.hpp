#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace grader::harness {

struct NormalizeOptions {
    bool case_insensitive{true};
    /// Sort array elements while canonicalising embedded JSON.
    bool sort_arrays{false};
};

/**
 * \brief Canonical form used by every text comparison.
 *
 * Applied in order: byte-order marks removed, literal \\uXXXX escapes decoded,
 * smart quotes and dashes folded to ASCII, JSON-looking text (first
 * non-blank character `{` or `[`) re-serialised compactly with sorted keys,
 * line endings unified to LF, Unicode space variants and tabs folded to a
 * plain space, every line trimmed, space runs collapsed, blank-line runs
 * capped at one empty line, outer whitespace trimmed, ASCII case folded when
 * requested. Blank input yields an empty string.
 */
[[nodiscard]] std::string normalize_text(std::string_view input, const NormalizeOptions& options = {});

/// Removes all whitespace and the punctuation characters `, . : ;`.
[[nodiscard]] std::string strip_aggressive(std::string_view input);

/// Decodes literal \\uXXXX sequences (surrogate pairs included) into UTF-8.
[[nodiscard]] std::string unescape_unicode(std::string_view input);

/**
 * Compact JSON with object keys sorted, optionally with array elements
 * sorted by their own canonical form. nullopt when \p input does not parse.
 */
[[nodiscard]] std::optional<std::string> canonical_json(std::string_view input, bool sort_arrays);

[[nodiscard]] bool is_valid_utf8(std::string_view input) noexcept;

struct FirstDifference {
    /// -1 when both strings are equal.
    long long index{-1};
    std::string expected_excerpt;
    std::string actual_excerpt;
};

/**
 * Position of the first diverging character. When one string is a strict
 * prefix of the other the index is the shorter length. Excerpts cover
 * \p context characters on either side of the index.
 */
[[nodiscard]] FirstDifference first_difference(std::string_view expected,
                                               std::string_view actual,
                                               std::size_t context = 24);

}  // namespace grader::harness
