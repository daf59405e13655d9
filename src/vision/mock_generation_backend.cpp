#include <tessera/vision/mock_generation_backend.hpp>

namespace tessera::vision {

MockGenerationBackend::MockGenerationBackend(std::string response)
    : response_(std::move(response)) {}

void MockGenerationBackend::set_response(std::string response) {
  std::lock_guard lock(mutex_);
  response_ = std::move(response);
}

void MockGenerationBackend::fail_on_call(std::size_t call_index,
                                         tessera::core::Error error) {
  std::lock_guard lock(mutex_);
  failures_[call_index] = std::move(error);
}

void MockGenerationBackend::set_cache_clear_failure(bool fail) {
  std::lock_guard lock(mutex_);
  fail_cache_clear_ = fail;
}

std::expected<std::string, tessera::core::Error> MockGenerationBackend::generate(
    const tessera::core::Tensor& tiles, const std::string& prompt) {
  std::lock_guard lock(mutex_);
  const std::size_t index = calls_++;
  last_prompt_ = prompt;
  last_shape_ = tiles.shape();

  auto valid = validate_input(tiles);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (auto it = failures_.find(index); it != failures_.end()) {
    return std::unexpected(it->second);
  }
  return response_;
}

std::expected<void, tessera::core::Error> MockGenerationBackend::release_cached_memory() {
  std::lock_guard lock(mutex_);
  ++cache_clears_;
  if (fail_cache_clear_) {
    return std::unexpected(tessera::core::Error{tessera::core::ErrorCode::Unexpected,
                                                "mock cache clear failure"});
  }
  return {};
}

std::size_t MockGenerationBackend::call_count() const {
  std::lock_guard lock(mutex_);
  return calls_;
}

std::size_t MockGenerationBackend::cache_clear_count() const {
  std::lock_guard lock(mutex_);
  return cache_clears_;
}

std::string MockGenerationBackend::last_prompt() const {
  std::lock_guard lock(mutex_);
  return last_prompt_;
}

std::vector<std::int64_t> MockGenerationBackend::last_batch_shape() const {
  std::lock_guard lock(mutex_);
  return last_shape_;
}

}  // namespace tessera::vision
