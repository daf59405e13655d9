#pragma once

#include <tessera/app/inference_resource.hpp>
#include <tessera/app/item_pipeline.hpp>
#include <tessera/core/error.hpp>
#include <tessera/core/item_result.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>

namespace tessera::app {

/// Progress hooks for a batch run. Indices are 1-based. Called on the thread
/// that runs the batch, in item order.
class BatchObserver {
 public:
  virtual ~BatchObserver() = default;
  virtual void on_item_start(std::size_t /*index*/, std::size_t /*total*/,
                             const std::string& /*source*/) {}
  virtual void on_item_result(std::size_t /*index*/, const tessera::core::ItemResult& /*result*/) {}
};

/// Runs a capped, ordered batch of images through the item pipeline, one at a
/// time, against the shared model.
///
/// Per-item failures are collected and never stop the batch; a model that
/// cannot be loaded does. After an out-of-memory item the model's cached
/// memory is released before the next item.
class BatchOrchestrator {
 public:
  BatchOrchestrator(InferenceResource& resource, const ItemPipeline& pipeline);

  /// Number of items a run would attempt: min(cap, items.size()).
  /// EmptyBatch for no items, InvalidCap for cap <= 0.
  [[nodiscard]] static std::expected<std::size_t, tessera::core::Error> validate(
      std::span<const std::string> items, std::int64_t cap);

  /// Validation errors, ResourceLoadFailed, or TotalBatchFailure when no
  /// attempted item succeeded; otherwise the summary.
  [[nodiscard]] std::expected<tessera::core::BatchSummary, tessera::core::Error> run(
      std::span<const std::string> items,
      std::int64_t cap,
      BatchObserver* observer = nullptr);

  /// One item. The item's own failure is inside the ItemResult; only resource
  /// errors are returned as errors.
  [[nodiscard]] std::expected<tessera::core::ItemResult, tessera::core::Error> run_single(
      const std::string& source);

 private:
  tessera::core::ItemResult process(const std::string& source, const ModelHandle& handle);

  InferenceResource& resource_;
  const ItemPipeline& pipeline_;
};

}  // namespace tessera::app
