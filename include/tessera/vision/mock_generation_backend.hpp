#pragma once

#include <tessera/vision/generation_backend.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace tessera::vision {

/// Mock backend that returns a configurable description (for tests/demo).
/// Failures can be scripted per call index to exercise error classification.
/// Thread-safe; call indices follow the order calls take the lock.
class MockGenerationBackend : public IGenerationBackend {
 public:
  MockGenerationBackend() = default;
  explicit MockGenerationBackend(std::string response);

  /// Text returned by every successful generate() call.
  void set_response(std::string response);

  /// Make the call with this zero-based index fail with the given error.
  void fail_on_call(std::size_t call_index, tessera::core::Error error);

  /// Make release_cached_memory() fail (to test that recovery failures are not fatal).
  void set_cache_clear_failure(bool fail);

  [[nodiscard]] std::expected<std::string, tessera::core::Error> generate(
      const tessera::core::Tensor& tiles, const std::string& prompt) override;

  [[nodiscard]] std::expected<void, tessera::core::Error> release_cached_memory() override;

  [[nodiscard]] std::size_t call_count() const;
  [[nodiscard]] std::size_t cache_clear_count() const;
  [[nodiscard]] std::string last_prompt() const;
  [[nodiscard]] std::vector<std::int64_t> last_batch_shape() const;

 private:
  mutable std::mutex mutex_;
  std::string response_{"A synthetic description of the image."};
  std::map<std::size_t, tessera::core::Error> failures_;
  bool fail_cache_clear_{false};
  std::size_t calls_{0};
  std::size_t cache_clears_{0};
  std::string last_prompt_;
  std::vector<std::int64_t> last_shape_;
};

}  // namespace tessera::vision
