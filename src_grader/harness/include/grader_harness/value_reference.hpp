#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

#include "capture_store.hpp"

namespace grader::harness {

struct LiteralValue {
    std::string text;
};

struct CaptureReference {
    CaptureKey key;
};

struct FileReference {
    std::filesystem::path path;
};

/**
 * \brief Where an expected or actual value comes from.
 *
 * Resolved exactly once from the raw step text; comparators only switch on
 * the alternative and never re-sniff the string.
 */
using ValueReference = std::variant<LiteralValue, CaptureReference, FileReference>;

/// Placeholder suite authors put in cells they leave unconstrained.
inline constexpr std::string_view kMissingPlaceholder = "-";

/**
 * Classifies \p raw:
 *  - `memory://scope/question/stage`            capture lookup
 *  - first non-blank character `{` or `[`       literal JSON, even when path-like
 *  - absolute path, backslash, or existing file file lookup
 *  - anything else                              literal text
 */
[[nodiscard]] ValueReference make_reference(std::string_view raw);

/// Human readable origin, e.g. "client output of TC01 stage 2". Never a memory:// URI.
[[nodiscard]] std::string describe_reference(const ValueReference& reference);

/// True for captures in the clients/servers scopes.
[[nodiscard]] bool is_console_reference(const ValueReference& reference);

struct ResolvedValue {
    bool found{false};
    std::string text;
};

/// Reads the referenced value; literals are always found.
[[nodiscard]] ResolvedValue resolve_reference(const ValueReference& reference, const CaptureStore& store);

}  // namespace grader::harness
