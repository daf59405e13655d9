#pragma once

#include <tessera/app/inference_resource.hpp>
#include <tessera/core/item_result.hpp>
#include <tessera/vision/aspect_ratio_planner.hpp>
#include <tessera/vision/tile_normalizer.hpp>
#include <tessera/vision/tiler.hpp>
#include <string>

namespace tessera::app {

struct ItemPipelineOptions {
  tessera::vision::TilingConfig tiling;
  std::string prompt{"What is in this image?"};
  bool clean_response{true};
  std::string role_marker{"assistant"};
};

/// One image in, one ItemResult out: load, plan, tile, normalize and stack,
/// generate, optionally clean the response.
///
/// Every failure of a single item is classified into the ItemResult (file
/// errors, invalid image, out of memory, backend failure, anything else as
/// Unexpected). core::InternalConsistencyError is not caught.
class ItemPipeline {
 public:
  /// Throws std::invalid_argument for an invalid tiling config.
  explicit ItemPipeline(ItemPipelineOptions options);

  [[nodiscard]] tessera::core::ItemResult run(const std::string& source,
                                              const ModelHandle& handle,
                                              const std::string& prompt) const;

  /// run() with options().prompt.
  [[nodiscard]] tessera::core::ItemResult run(const std::string& source,
                                              const ModelHandle& handle) const;

  [[nodiscard]] const ItemPipelineOptions& options() const noexcept { return options_; }

 private:
  std::expected<std::string, tessera::core::Error> describe(const std::string& source,
                                                            const ModelHandle& handle,
                                                            const std::string& prompt) const;

  ItemPipelineOptions options_;
  tessera::vision::AspectRatioPlanner planner_;
  tessera::vision::Tiler tiler_;
  tessera::vision::TileNormalizer normalizer_;
};

}  // namespace tessera::app
