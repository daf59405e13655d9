#include <tessera/app/batch_orchestrator.hpp>
#include <tessera/core/logging.hpp>
#include <algorithm>

namespace tessera::app {

namespace {

using tessera::core::Error;
using tessera::core::ErrorCode;

constexpr std::size_t kPreviewChars = 100;

std::string preview(const std::string& text) {
  if (text.size() <= kPreviewChars) return text;
  return text.substr(0, kPreviewChars) + "...";
}

}  // namespace

BatchOrchestrator::BatchOrchestrator(InferenceResource& resource, const ItemPipeline& pipeline)
    : resource_(resource), pipeline_(pipeline) {}

std::expected<std::size_t, tessera::core::Error> BatchOrchestrator::validate(
    std::span<const std::string> items, std::int64_t cap) {
  if (items.empty()) {
    return std::unexpected(Error{ErrorCode::EmptyBatch, "no images to process"});
  }
  if (cap <= 0) {
    return std::unexpected(Error{ErrorCode::InvalidCap,
                                 "max images must be positive, got " + std::to_string(cap)});
  }
  return std::min(static_cast<std::size_t>(cap), items.size());
}

tessera::core::ItemResult BatchOrchestrator::process(const std::string& source,
                                                     const ModelHandle& handle) {
  auto logger = tessera::core::get_logger();
  auto result = pipeline_.run(source, handle);
  if (result.ok()) {
    logger->info("Success: {} ({:.2f}s): {}", source, result.elapsed_ms / 1000.0,
                 preview(*result.outcome));
    return result;
  }

  const Error& error = result.outcome.error();
  logger->error("Failed: {}", tessera::core::describe(error));
  if (error.code == ErrorCode::OutOfMemory) {
    logger->warn("Out of memory on {}; releasing cached model memory", source);
    auto cleared = resource_.clear_cache();
    if (!cleared) {
      logger->error("Cache release failed: {}", tessera::core::describe(cleared.error()));
    }
  }
  return result;
}

std::expected<tessera::core::BatchSummary, tessera::core::Error> BatchOrchestrator::run(
    std::span<const std::string> items, std::int64_t cap, BatchObserver* observer) {
  auto attempted = validate(items, cap);
  if (!attempted) {
    return std::unexpected(attempted.error());
  }

  auto logger = tessera::core::get_logger();
  tessera::core::BatchSummary summary;
  summary.total_discovered = items.size();
  summary.total_attempted = *attempted;
  summary.results.reserve(*attempted);
  logger->info("Processing {} of {} images", *attempted, items.size());

  for (std::size_t i = 0; i < *attempted; ++i) {
    const std::string& source = items[i];
    const std::size_t index = i + 1;
    logger->info("Processing image {}/{}: {}", index, *attempted, source);
    if (observer) observer->on_item_start(index, *attempted, source);

    auto handle = resource_.acquire();
    if (!handle) {
      return std::unexpected(handle.error());
    }

    auto result = process(source, **handle);
    if (result.ok()) {
      ++summary.success_count;
    } else {
      ++summary.failure_count;
    }
    if (observer) observer->on_item_result(index, result);
    summary.results.push_back(std::move(result));
  }

  logger->info("Batch complete: {} successful, {} failed, {} attempted of {} found",
               summary.success_count, summary.failure_count, summary.total_attempted,
               summary.total_discovered);

  if (summary.success_count == 0) {
    return std::unexpected(Error{ErrorCode::TotalBatchFailure,
                                 "all " + std::to_string(summary.total_attempted) +
                                     " attempted images failed"});
  }
  return summary;
}

std::expected<tessera::core::ItemResult, tessera::core::Error> BatchOrchestrator::run_single(
    const std::string& source) {
  auto handle = resource_.acquire();
  if (!handle) {
    return std::unexpected(handle.error());
  }
  tessera::core::get_logger()->info("Processing image: {}", source);
  return process(source, **handle);
}

}  // namespace tessera::app
