#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/frame.hpp>
#include <tessera/vision/aspect_ratio_planner.hpp>
#include <expected>
#include <vector>

namespace tessera::vision {

/// Cuts an image into the square tiles described by a TilePlan.
///
/// The image is stretched (bicubic, aspect not preserved) to the plan's target
/// size and split row-major into tile_edge squares. When the plan asks for a
/// thumbnail, the original image resized to tile_edge x tile_edge is appended.
class Tiler {
 public:
  Tiler() = default;

  /// Returns InvalidImage if the frame cannot be viewed as a raster.
  /// Throws core::InternalConsistencyError if the tile count disagrees with
  /// plan.expected_tiles().
  [[nodiscard]] std::expected<std::vector<tessera::core::Frame>, tessera::core::Error>
  tile(const tessera::core::Frame& image, const TilePlan& plan) const;
};

}  // namespace tessera::vision
