#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/tensor.hpp>
#include <expected>
#include <string>

namespace tessera::vision {

/// Abstract vision-language backend: (tile batch, prompt) -> generated text.
/// Implement generate(); optionally override validate_input, warmup,
/// release_cached_memory.
///
/// Input contract: tiles is a stacked [N, 3, E, E] tensor produced by
/// TileNormalizer::normalize_batch. Implementations report allocation failures
/// as ErrorCode::OutOfMemory so callers can run OOM recovery.
///
/// One instance is shared by every holder of a ModelHandle: generate and
/// release_cached_memory may be called concurrently and must be thread-safe.
class IGenerationBackend {
 public:
  virtual ~IGenerationBackend() = default;

  /// Blocking generation call. Must be implemented.
  [[nodiscard]] virtual std::expected<std::string, tessera::core::Error> generate(
      const tessera::core::Tensor& tiles, const std::string& prompt) = 0;

  /// Optional: validate the tile batch before generate. Default: rank 4, 3 channels.
  [[nodiscard]] virtual std::expected<void, tessera::core::Error> validate_input(
      const tessera::core::Tensor& tiles) const;

  /// Optional: warmup run after construction. Default: no-op.
  virtual void warmup() {}

  /// Optional: free cached working memory (scratch buffers, allocator arenas)
  /// without unloading the model. Default: nothing to free.
  [[nodiscard]] virtual std::expected<void, tessera::core::Error> release_cached_memory() {
    return {};
  }
};

}  // namespace tessera::vision
