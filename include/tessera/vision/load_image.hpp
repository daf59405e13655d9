#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/frame.hpp>
#include <expected>
#include <string>
#include <vector>

namespace tessera::vision {

/// Load an image file into a Frame (BGR8, or Grayscale8 for single-channel files).
/// FileNotFound if the path does not exist, PermissionDenied if it cannot be
/// opened for reading, InvalidImage if it is not a decodable image.
[[nodiscard]] std::expected<tessera::core::Frame, tessera::core::Error>
load_image(const std::string& path);

/// Regular files directly under directory whose extension matches ext
/// (with or without the leading dot, case-insensitive), sorted by path.
/// Filesystem errors propagate as std::filesystem::filesystem_error.
[[nodiscard]] std::vector<std::string> list_images(const std::string& directory,
                                                   const std::string& ext);

}  // namespace tessera::vision
