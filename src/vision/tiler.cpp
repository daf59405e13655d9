#include <tessera/vision/tiler.hpp>
#include "frame_cv_utils.hpp"
#include <opencv2/imgproc.hpp>
#include <string>

namespace tessera::vision {

std::expected<std::vector<tessera::core::Frame>, tessera::core::Error> Tiler::tile(
    const tessera::core::Frame& image, const TilePlan& plan) const {
  using namespace tessera::core;

  auto mat_in = detail::frame_to_mat(image);
  if (!mat_in) {
    return std::unexpected(Error{ErrorCode::InvalidImage,
                                 "image buffer does not match its dimensions/format"});
  }

  const int edge = static_cast<int>(plan.tile_edge);
  cv::Mat resized;
  if (image.width() == plan.target_width && image.height() == plan.target_height) {
    resized = *mat_in;
  } else {
    cv::resize(*mat_in, resized,
               cv::Size(static_cast<int>(plan.target_width),
                        static_cast<int>(plan.target_height)),
               0, 0, cv::INTER_CUBIC);
  }

  const int columns = static_cast<int>(plan.target_width) / edge;
  const int rows = static_cast<int>(plan.target_height) / edge;

  std::vector<Frame> tiles;
  tiles.reserve(plan.expected_tiles());
  for (int i = 0; i < columns * rows; ++i) {
    const cv::Rect box((i % columns) * edge, (i / columns) * edge, edge, edge);
    tiles.push_back(detail::mat_to_frame(resized(box), image.format()));
  }

  if (plan.thumbnail && tiles.size() != 1) {
    cv::Mat thumb;
    cv::resize(*mat_in, thumb, cv::Size(edge, edge), 0, 0, cv::INTER_CUBIC);
    tiles.push_back(detail::mat_to_frame(thumb, image.format()));
  }

  if (tiles.size() != plan.expected_tiles()) {
    throw InternalConsistencyError(
        "Tiler produced " + std::to_string(tiles.size()) + " tiles, plan expects " +
        std::to_string(plan.expected_tiles()));
  }
  return tiles;
}

}  // namespace tessera::vision
