#pragma once

#include <string>
#include <string_view>

namespace tessera::vision {

struct ResponseCleanerOptions {
  std::string role_marker{"assistant"};
  std::string prompt;  // lines repeating the prompt are dropped
  std::string image_placeholder{"<image>"};
};

/// Strips chat-template residue from a decoded generation.
///
/// Rules, applied in order:
///  1. If raw contains the role marker, keep only the text after its last occurrence.
///  2. Drop leading whitespace, ':' and '>' characters and leading <...> tags.
///  3. Drop lines that repeat the prompt (case-insensitive), role lines
///     ("user", "system", "user: ..."), image placeholder lines and lines that
///     look like file paths.
///  4. Trim. If nothing is left, return raw trimmed instead.
///
/// The line filters are heuristics: a legitimate line that happens to look
/// like a path or a role header is removed as well.
[[nodiscard]] std::string clean_response(std::string_view raw,
                                         const ResponseCleanerOptions& options);

/// Whitespace-trimmed copy.
[[nodiscard]] std::string trim_copy(std::string_view value);

}  // namespace tessera::vision
