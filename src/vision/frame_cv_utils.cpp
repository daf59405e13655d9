#include "frame_cv_utils.hpp"
#include <tessera/core/frame.hpp>
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace tessera::vision::detail {

namespace tc = tessera::core;

std::optional<cv::Mat> frame_to_mat(const tc::Frame& frame) {
  if (frame.empty() || !frame.is_consistent()) return std::nullopt;

  const int w = static_cast<int>(frame.width());
  const int h = static_cast<int>(frame.height());
  auto* data = const_cast<std::byte*>(frame.data().data());

  switch (frame.format()) {
    case tc::PixelFormat::Grayscale8:
      return cv::Mat(h, w, CV_8UC1, data);
    case tc::PixelFormat::RGB8:
    case tc::PixelFormat::BGR8:
      return cv::Mat(h, w, CV_8UC3, data);
    case tc::PixelFormat::RGBA8:
    case tc::PixelFormat::BGRA8:
      return cv::Mat(h, w, CV_8UC4, data);
    case tc::PixelFormat::Unknown:
    default:
      return std::nullopt;
  }
}

tc::Frame mat_to_frame(const cv::Mat& mat, tc::PixelFormat format) {
  if (mat.empty()) return tc::Frame();

  // ROIs and other non-continuous views are compacted first.
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const std::uint32_t w = static_cast<std::uint32_t>(packed.cols);
  const std::uint32_t h = static_cast<std::uint32_t>(packed.rows);
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return tc::Frame(w, h, format, std::move(buffer));
}

tc::Tensor mat_to_tensor(const cv::Mat& mat, std::vector<std::int64_t> shape) {
  const cv::Mat packed = mat.isContinuous() ? mat : mat.clone();
  const tc::TensorDType dtype =
      packed.depth() == CV_16F ? tc::TensorDType::Float16 : tc::TensorDType::Float32;
  const std::size_t len = packed.total() * packed.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), packed.ptr(), len);
  return tc::Tensor(std::move(shape), dtype, std::move(buffer));
}

}  // namespace tessera::vision::detail
