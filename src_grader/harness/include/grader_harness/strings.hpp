#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace grader::harness::strings {

inline constexpr std::string_view kWhitespace = " \t\n\r\f\v";

[[nodiscard]] std::string trim_copy(std::string_view input);
[[nodiscard]] std::string to_lower_copy(std::string_view input);
[[nodiscard]] std::string to_upper_copy(std::string_view input);

[[nodiscard]] bool is_blank(std::string_view input);
[[nodiscard]] bool iequals(std::string_view a, std::string_view b);
[[nodiscard]] bool istarts_with(std::string_view text, std::string_view prefix);

/// Splits on \p delimiter keeping empty fields.
[[nodiscard]] std::vector<std::string> split(std::string_view input, char delimiter);

/// Parses a whole string as a non-negative decimal integer.
[[nodiscard]] std::optional<long long> parse_integer(std::string_view input);

}  // namespace grader::harness::strings
