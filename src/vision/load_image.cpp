#include <tessera/vision/load_image.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace tessera::vision {

namespace fs = std::filesystem;

namespace {

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

}  // namespace

std::expected<tessera::core::Frame, tessera::core::Error> load_image(
    const std::string& path) {
  using tessera::core::Error;
  using tessera::core::ErrorCode;

  std::error_code ec;
  const bool exists = fs::exists(path, ec);
  if (ec == std::errc::permission_denied) {
    return std::unexpected(Error{ErrorCode::PermissionDenied,
                                 "permission denied accessing file: " + path});
  }
  if (!exists) {
    return std::unexpected(Error{ErrorCode::FileNotFound, "image file not found: " + path});
  }
  if (fs::is_directory(path, ec)) {
    return std::unexpected(Error{ErrorCode::InvalidImage, "path is a directory: " + path});
  }
  {
    std::ifstream probe(path, std::ios::binary);
    if (!probe) {
      return std::unexpected(Error{ErrorCode::PermissionDenied,
                                   "permission denied accessing file: " + path});
    }
  }

  cv::Mat mat;
  try {
    mat = cv::imread(path);
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::InvalidImage,
                                 "invalid image format or data for " + path + ": " + e.what()});
  }
  if (mat.empty()) {
    return std::unexpected(Error{ErrorCode::InvalidImage,
                                 "invalid image format or data for " + path});
  }

  tessera::core::PixelFormat format = tessera::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = tessera::core::PixelFormat::Grayscale8;

  return detail::mat_to_frame(mat, format);
}

std::vector<std::string> list_images(const std::string& directory, const std::string& ext) {
  std::string wanted = to_lower_copy(ext);
  if (!wanted.empty() && wanted.front() != '.') {
    wanted.insert(wanted.begin(), '.');
  }

  std::vector<std::string> out;
  for (const auto& entry : fs::directory_iterator(directory)) {
    if (!entry.is_regular_file()) continue;
    if (to_lower_copy(entry.path().extension().string()) != wanted) continue;
    out.push_back(entry.path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace tessera::vision
