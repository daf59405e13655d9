#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/frame.hpp>
#include <tessera/core/tensor.hpp>
#include <array>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace tessera::vision {

/// ImageNet statistics, RGB order.
inline constexpr std::array<float, 3> kImageNetMean{0.485f, 0.456f, 0.406f};
inline constexpr std::array<float, 3> kImageNetStd{0.229f, 0.224f, 0.225f};

struct NormalizationConfig {
  std::uint32_t edge{448};
  std::array<float, 3> mean{kImageNetMean};
  std::array<float, 3> std{kImageNetStd};
  tessera::core::TensorDType dtype{tessera::core::TensorDType::Float16};
};

/// Tile -> CHW tensor for the vision encoder: RGB conversion, bicubic resample
/// to edge x edge, scale to [0, 1], per-channel (x - mean) / std.
class TileNormalizer {
 public:
  explicit TileNormalizer(NormalizationConfig config);

  /// [3, edge, edge] tensor in config().dtype. InvalidImage for empty or
  /// unsupported frames.
  [[nodiscard]] std::expected<tessera::core::Tensor, tessera::core::Error> normalize(
      const tessera::core::Frame& tile) const;

  /// Normalizes every tile in order and stacks them: [N, 3, edge, edge].
  [[nodiscard]] std::expected<tessera::core::Tensor, tessera::core::Error>
  normalize_batch(std::span<const tessera::core::Frame> tiles) const;

  [[nodiscard]] const NormalizationConfig& config() const noexcept { return config_; }

 private:
  NormalizationConfig config_;
};

/// Element values of a Float16/Float32 tensor widened to float (flat order).
[[nodiscard]] std::vector<float> tensor_to_floats(const tessera::core::Tensor& tensor);

}  // namespace tessera::vision
