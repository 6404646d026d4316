#pragma once

#include <filesystem>
#include <string_view>
#include <vector>

#include "grader_harness/suite_orchestrator.hpp"

namespace grader::harness {

/**
 * \brief Loads grading suites from line-oriented `.suite` files.
 *
 * A file starts with a header block, followed by one block per test case.
 * Blocks are separated by a line containing three dashes (`---`). Within a
 * block, entries take the form `key=value` with surrounding whitespace
 * ignored; lines starting with `#` and empty lines are skipped.
 *
 * Header keys:
 *   - `suite`: Suite name (required).
 *   - `protocol`: `HTTP` (default) or `TCP`.
 *
 * Case keys:
 *   - `case`: Case name (required).
 *   - `mark`: Points awarded when every graded assertion passes (default 0).
 *   - `question`: Question code used for captures. Falls back to the case name.
 *   - `step`: One step, columns separated by `|`:
 *     `id|stage|action|target|value|http_method|status_code|byte_size|data_type`.
 *     Only the first three columns are required. Inside a column `\|`, `\n`,
 *     `\t` and `\\` are unescaped.
 *   - `meta.<key>`: Metadata attached to the preceding step.
 *
 * Example:
 * \code{.txt}
 * suite=books
 * protocol=HTTP
 * ---
 * case=TC01
 * mark=2
 * step=S-START-1|1|SERVER_START
 * step=S-PROXY-1|1|ENABLE_PROXY
 * step=C-START-1|1|CLIENT_START
 * step=C-IN-1|1|CLIENT_INPUT||1
 * step=OC-OUT-1|1|COMPARE_TEXT|Book: Dune
 * step=OS-METHOD-1|1|COMPARE_TEXT|GET||GET
 * meta.ValidationType=HTTP_METHOD
 * \endcode
 *
 * Any problem throws ConfigurationError naming file and line: HeaderMissing,
 * NoTestCases, StepParseError, UnsupportedAction or SuiteLoadFailed.
 */
class SuiteLoader {
public:
    SuiteLoader() = default;

    [[nodiscard]] SuiteDefinition load(const std::filesystem::path& file) const;

    /// A directory yields every `*.suite` file below it, in path order; a file yields itself.
    [[nodiscard]] std::vector<SuiteDefinition> load_directory(const std::filesystem::path& root) const;
};

/// Splits one `step=` value on unescaped `|` and unescapes each column.
[[nodiscard]] std::vector<std::string> split_step_columns(std::string_view raw);

}  // namespace grader::harness
