#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace tessera::core {

/// Error codes; used with std::expected for recoverable failures.
enum class ErrorCode {
  None = 0,
  // Input validation, rejected before any resource use.
  InvalidImageDimensions,
  EmptyBatch,
  InvalidCap,
  InvalidConfig,
  // Per-item, isolated to one ItemResult.
  FileNotFound,
  PermissionDenied,
  InvalidImage,
  OutOfMemory,
  InferenceFailed,
  Unexpected,
  // Resource lifecycle.
  ResourceLoadFailed,
  // Batch-fatal.
  TotalBatchFailure,
};

/// Error code plus a human-readable description (offending path, original cause).
struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/// "<code>: <message>" for logs and event payloads.
[[nodiscard]] std::string describe(const Error& error);

/// Programming defect (e.g. tile count disagreeing with the plan). Never
/// converted into a per-item error.
class InternalConsistencyError : public std::logic_error {
 public:
  using std::logic_error::logic_error;
};

}  // namespace tessera::core
