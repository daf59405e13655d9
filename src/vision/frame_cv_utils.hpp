#pragma once

#include <tessera/core/frame.hpp>
#include <tessera/core/tensor.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>
#include <vector>

namespace tessera::vision::detail {

/// Convert Frame to cv::Mat (non-owning view). Returns nullopt if the format is
/// unsupported or the buffer is too small for the declared shape.
std::optional<cv::Mat> frame_to_mat(const tessera::core::Frame& frame);

/// Convert cv::Mat (8-bit, 1/3/4 channels) to Frame (copy).
tessera::core::Frame mat_to_frame(const cv::Mat& mat,
                                  tessera::core::PixelFormat format);

/// Copy a single-channel CV_32F / CV_16F mat into a Tensor of the given shape.
tessera::core::Tensor mat_to_tensor(const cv::Mat& mat,
                                    std::vector<std::int64_t> shape);

}  // namespace tessera::vision::detail
