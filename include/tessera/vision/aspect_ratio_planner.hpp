#pragma once

#include <tessera/core/error.hpp>
#include <cstdint>
#include <expected>
#include <vector>

namespace tessera::vision {

/// Tiling parameters shared by planner, tiler and normalizer.
struct TilingConfig {
  std::uint32_t min_tiles{1};
  std::uint32_t max_tiles{12};
  std::uint32_t tile_edge{448};
  bool use_thumbnail{true};
};

/// Grid shape: columns x rows tiles.
struct AspectRatioCandidate {
  std::uint32_t columns{1};
  std::uint32_t rows{1};

  [[nodiscard]] std::uint32_t tile_count() const noexcept { return columns * rows; }
  [[nodiscard]] double aspect() const noexcept {
    return static_cast<double>(columns) / static_cast<double>(rows);
  }

  friend bool operator==(const AspectRatioCandidate&,
                         const AspectRatioCandidate&) = default;
};

/// Chosen grid for one image plus the stretch-resize target in pixels.
struct TilePlan {
  AspectRatioCandidate grid;
  std::uint32_t tile_edge{0};
  std::uint32_t target_width{0};
  std::uint32_t target_height{0};
  bool thumbnail{false};  // true iff thumbnails are enabled and the grid has > 1 tile

  [[nodiscard]] std::uint32_t grid_tiles() const noexcept { return grid.tile_count(); }
  /// Tiles the Tiler must produce: grid tiles plus the optional thumbnail.
  [[nodiscard]] std::uint32_t expected_tiles() const noexcept {
    return grid_tiles() + (thumbnail ? 1u : 0u);
  }

  friend bool operator==(const TilePlan&, const TilePlan&) = default;
};

/// Picks the tile grid whose aspect ratio is closest to the image's.
///
/// The candidate table (every columns x rows with min_tiles <= c*r <= max_tiles)
/// is built once in the constructor, ordered by tile count, then columns, then
/// rows. On an exact tie in aspect difference, a later candidate replaces the
/// current best when the image area exceeds half of the candidate grid's pixel
/// area (0.5 * tile_edge^2 * c * r); the last such candidate wins.
class AspectRatioPlanner {
 public:
  /// Throws std::invalid_argument if min_tiles < 1, max_tiles < min_tiles or
  /// tile_edge == 0.
  explicit AspectRatioPlanner(TilingConfig config);

  /// Plan for an image of width x height. InvalidImageDimensions if either is <= 0.
  [[nodiscard]] std::expected<TilePlan, tessera::core::Error> plan(
      std::int64_t width, std::int64_t height) const;

  [[nodiscard]] const std::vector<AspectRatioCandidate>& candidates() const noexcept {
    return candidates_;
  }
  [[nodiscard]] const TilingConfig& config() const noexcept { return config_; }

 private:
  TilingConfig config_;
  std::vector<AspectRatioCandidate> candidates_;
};

}  // namespace tessera::vision
