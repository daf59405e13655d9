#include <tessera/app/item_pipeline.hpp>
#include <tessera/vision/load_image.hpp>
#include <tessera/vision/response_cleaner.hpp>
#include <chrono>
#include <new>

namespace tessera::app {

namespace {

using tessera::core::Error;
using tessera::core::ErrorCode;

tessera::vision::NormalizationConfig normalization_for(const tessera::vision::TilingConfig& tiling) {
  tessera::vision::NormalizationConfig n;
  n.edge = tiling.tile_edge;
  return n;
}

/// Per-item messages name the offending image.
Error with_source(Error error, const std::string& source) {
  if (error.message.find(source) == std::string::npos) {
    error.message = source + ": " + error.message;
  }
  return error;
}

}  // namespace

ItemPipeline::ItemPipeline(ItemPipelineOptions options)
    : options_(std::move(options)),
      planner_(options_.tiling),
      normalizer_(normalization_for(options_.tiling)) {}

std::expected<std::string, tessera::core::Error> ItemPipeline::describe(
    const std::string& source, const ModelHandle& handle, const std::string& prompt) const {
  auto image = tessera::vision::load_image(source);
  if (!image) return std::unexpected(image.error());

  auto plan = planner_.plan(image->width(), image->height());
  if (!plan) return std::unexpected(plan.error());

  auto tiles = tiler_.tile(*image, *plan);
  if (!tiles) return std::unexpected(tiles.error());

  auto batch = normalizer_.normalize_batch(*tiles);
  if (!batch) return std::unexpected(batch.error());

  auto raw = handle.backend().generate(*batch, prompt);
  if (!raw) return std::unexpected(raw.error());

  if (!options_.clean_response) {
    return std::move(*raw);
  }
  tessera::vision::ResponseCleanerOptions cleaner;
  cleaner.role_marker = options_.role_marker;
  cleaner.prompt = prompt;
  return tessera::vision::clean_response(*raw, cleaner);
}

tessera::core::ItemResult ItemPipeline::run(const std::string& source,
                                            const ModelHandle& handle,
                                            const std::string& prompt) const {
  const auto t0 = std::chrono::steady_clock::now();
  tessera::core::ItemResult result;
  result.source = source;
  try {
    auto text = describe(source, handle, prompt);
    if (text) {
      result.outcome = std::move(*text);
    } else {
      result.outcome = std::unexpected(with_source(std::move(text.error()), source));
    }
  } catch (const tessera::core::InternalConsistencyError&) {
    throw;
  } catch (const std::bad_alloc& e) {
    result.outcome = std::unexpected(
        with_source(Error{ErrorCode::OutOfMemory, e.what()}, source));
  } catch (const std::exception& e) {
    result.outcome = std::unexpected(
        with_source(Error{ErrorCode::Unexpected, e.what()}, source));
  }
  result.elapsed_ms = std::chrono::duration<double, std::milli>(
                          std::chrono::steady_clock::now() - t0).count();
  return result;
}

tessera::core::ItemResult ItemPipeline::run(const std::string& source,
                                            const ModelHandle& handle) const {
  return run(source, handle, options_.prompt);
}

}  // namespace tessera::app
