#include <tessera/vision/tile_normalizer.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <cstring>
#include <stdexcept>
#include <vector>

namespace tessera::vision {

namespace {

using tessera::core::Error;
using tessera::core::ErrorCode;
using tessera::core::PixelFormat;

/// cvtColor code to RGB, or -1 when the input already is RGB8.
int to_rgb_code(PixelFormat format) {
  switch (format) {
    case PixelFormat::BGR8:
      return cv::COLOR_BGR2RGB;
    case PixelFormat::BGRA8:
      return cv::COLOR_BGRA2RGB;
    case PixelFormat::RGBA8:
      return cv::COLOR_RGBA2RGB;
    case PixelFormat::Grayscale8:
      return cv::COLOR_GRAY2RGB;
    case PixelFormat::RGB8:
    case PixelFormat::Unknown:
    default:
      return -1;
  }
}

}  // namespace

TileNormalizer::TileNormalizer(NormalizationConfig config) : config_(config) {
  if (config_.edge == 0) {
    throw std::invalid_argument("TileNormalizer: edge must be > 0");
  }
  for (const float s : config_.std) {
    if (s <= 0.f) {
      throw std::invalid_argument("TileNormalizer: std must be positive");
    }
  }
}

std::expected<tessera::core::Tensor, Error> TileNormalizer::normalize(
    const tessera::core::Frame& tile) const {
  if (tile.empty()) {
    return std::unexpected(Error{ErrorCode::InvalidImage, "empty tile"});
  }
  auto mat_in = detail::frame_to_mat(tile);
  if (!mat_in) {
    return std::unexpected(Error{ErrorCode::InvalidImage, "unsupported tile format"});
  }

  cv::Mat rgb;
  const int code = to_rgb_code(tile.format());
  if (code >= 0) {
    cv::cvtColor(*mat_in, rgb, code);
  } else {
    rgb = *mat_in;
  }

  const int edge = static_cast<int>(config_.edge);
  cv::Mat sized;
  if (rgb.cols != edge || rgb.rows != edge) {
    cv::resize(rgb, sized, cv::Size(edge, edge), 0, 0, cv::INTER_CUBIC);
  } else {
    sized = rgb;
  }

  cv::Mat scaled;
  sized.convertTo(scaled, CV_32FC3, 1.0 / 255.0);

  std::vector<cv::Mat> planes;
  cv::split(scaled, planes);
  cv::Mat chw(3 * edge, edge, CV_32FC1);
  for (int c = 0; c < 3; ++c) {
    const double inv_std = 1.0 / config_.std[static_cast<std::size_t>(c)];
    const double shift = -config_.mean[static_cast<std::size_t>(c)] * inv_std;
    cv::Mat plane = chw.rowRange(c * edge, (c + 1) * edge);
    planes[static_cast<std::size_t>(c)].convertTo(plane, CV_32F, inv_std, shift);
  }

  const std::vector<std::int64_t> shape{3, edge, edge};
  if (config_.dtype == tessera::core::TensorDType::Float16) {
    cv::Mat half;
    chw.convertTo(half, CV_16F);
    return detail::mat_to_tensor(half, shape);
  }
  return detail::mat_to_tensor(chw, shape);
}

std::expected<tessera::core::Tensor, Error> TileNormalizer::normalize_batch(
    std::span<const tessera::core::Frame> tiles) const {
  std::vector<tessera::core::Tensor> tensors;
  tensors.reserve(tiles.size());
  for (const auto& tile : tiles) {
    auto tensor = normalize(tile);
    if (!tensor) {
      return std::unexpected(tensor.error());
    }
    tensors.push_back(std::move(*tensor));
  }
  return tessera::core::stack(tensors);
}

std::vector<float> tensor_to_floats(const tessera::core::Tensor& tensor) {
  const std::size_t n = tensor.element_count();
  std::vector<float> out(n);
  if (n == 0) return out;
  if (tensor.dtype() == tessera::core::TensorDType::Float32) {
    std::memcpy(out.data(), tensor.data().data(), n * sizeof(float));
    return out;
  }
  const cv::Mat half(1, static_cast<int>(n), CV_16FC1,
                     const_cast<std::byte*>(tensor.data().data()));
  cv::Mat widened(1, static_cast<int>(n), CV_32FC1, out.data());
  half.convertTo(widened, CV_32F);
  return out;
}

}  // namespace tessera::vision
