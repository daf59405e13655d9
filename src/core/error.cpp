#include <tessera/core/error.hpp>

namespace tessera::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::InvalidImageDimensions:
      return "InvalidImageDimensions";
    case ErrorCode::EmptyBatch:
      return "EmptyBatch";
    case ErrorCode::InvalidCap:
      return "InvalidCap";
    case ErrorCode::InvalidConfig:
      return "InvalidConfig";
    case ErrorCode::FileNotFound:
      return "FileNotFound";
    case ErrorCode::PermissionDenied:
      return "PermissionDenied";
    case ErrorCode::InvalidImage:
      return "InvalidImage";
    case ErrorCode::OutOfMemory:
      return "OutOfMemory";
    case ErrorCode::InferenceFailed:
      return "InferenceFailed";
    case ErrorCode::Unexpected:
      return "Unexpected";
    case ErrorCode::ResourceLoadFailed:
      return "ResourceLoadFailed";
    case ErrorCode::TotalBatchFailure:
      return "TotalBatchFailure";
  }
  return "Unknown";
}

std::string describe(const Error& error) {
  std::string out(to_string(error.code));
  if (!error.message.empty()) {
    out += ": ";
    out += error.message;
  }
  return out;
}

}  // namespace tessera::core
