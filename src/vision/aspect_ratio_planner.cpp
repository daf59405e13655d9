#include <tessera/vision/aspect_ratio_planner.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>
#include <tuple>

namespace tessera::vision {

namespace {

std::vector<AspectRatioCandidate> build_candidates(const TilingConfig& config) {
  std::vector<AspectRatioCandidate> out;
  for (std::uint32_t c = 1; c <= config.max_tiles; ++c) {
    for (std::uint32_t r = 1; r <= config.max_tiles / c; ++r) {
      const std::uint32_t n = c * r;
      if (n >= config.min_tiles && n <= config.max_tiles) {
        out.push_back({c, r});
      }
    }
  }
  std::sort(out.begin(), out.end(),
            [](const AspectRatioCandidate& a, const AspectRatioCandidate& b) {
              return std::make_tuple(a.tile_count(), a.columns, a.rows) <
                     std::make_tuple(b.tile_count(), b.columns, b.rows);
            });
  return out;
}

}  // namespace

AspectRatioPlanner::AspectRatioPlanner(TilingConfig config) : config_(config) {
  if (config_.min_tiles < 1) {
    throw std::invalid_argument("AspectRatioPlanner: min_tiles must be >= 1");
  }
  if (config_.max_tiles < config_.min_tiles) {
    throw std::invalid_argument("AspectRatioPlanner: max_tiles (" +
                                std::to_string(config_.max_tiles) +
                                ") is below min_tiles (" +
                                std::to_string(config_.min_tiles) + ")");
  }
  if (config_.tile_edge == 0) {
    throw std::invalid_argument("AspectRatioPlanner: tile_edge must be > 0");
  }
  candidates_ = build_candidates(config_);
}

std::expected<TilePlan, tessera::core::Error> AspectRatioPlanner::plan(
    std::int64_t width, std::int64_t height) const {
  if (width <= 0 || height <= 0) {
    return std::unexpected(tessera::core::Error{
        tessera::core::ErrorCode::InvalidImageDimensions,
        "image dimensions must be positive, got " + std::to_string(width) + "x" +
            std::to_string(height)});
  }

  const double image_aspect = static_cast<double>(width) / static_cast<double>(height);
  const double area = static_cast<double>(width) * static_cast<double>(height);
  const double edge = static_cast<double>(config_.tile_edge);

  double best_diff = std::numeric_limits<double>::infinity();
  AspectRatioCandidate best{1, 1};
  for (const auto& candidate : candidates_) {
    const double diff = std::abs(image_aspect - candidate.aspect());
    if (diff < best_diff) {
      best_diff = diff;
      best = candidate;
    } else if (diff == best_diff) {
      if (area > 0.5 * edge * edge * candidate.tile_count()) {
        best = candidate;
      }
    }
  }

  TilePlan plan;
  plan.grid = best;
  plan.tile_edge = config_.tile_edge;
  plan.target_width = best.columns * config_.tile_edge;
  plan.target_height = best.rows * config_.tile_edge;
  plan.thumbnail = config_.use_thumbnail && best.tile_count() > 1;
  return plan;
}

}  // namespace tessera::vision
