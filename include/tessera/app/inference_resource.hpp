#pragma once

#include <tessera/core/error.hpp>
#include <tessera/vision/generation_backend.hpp>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace tessera::app {

enum class ResourceState {
  Unloaded,
  Loading,
  Ready,
};

[[nodiscard]] std::string_view to_string(ResourceState state) noexcept;

/// Constructs a backend for a model identifier. May return an error or throw;
/// both become ResourceLoadFailed.
using ModelLoader = std::function<
    std::expected<std::unique_ptr<tessera::vision::IGenerationBackend>, tessera::core::Error>(
        const std::string& model_id)>;

/// A ready backend plus its identity. Shared: items in flight keep the backend
/// alive across release() and reload().
class ModelHandle {
 public:
  /// Constructor key; only InferenceResource can make one.
  class Key {
    friend class InferenceResource;
    Key() = default;
  };

  ModelHandle(Key,
              std::string model_id,
              std::unique_ptr<tessera::vision::IGenerationBackend> backend,
              std::uint64_t instance_id)
      : model_id_(std::move(model_id)), backend_(std::move(backend)), instance_id_(instance_id) {}

  [[nodiscard]] const std::string& model_id() const noexcept { return model_id_; }
  [[nodiscard]] std::uint64_t instance_id() const noexcept { return instance_id_; }
  [[nodiscard]] tessera::vision::IGenerationBackend& backend() const noexcept { return *backend_; }

 private:
  std::string model_id_;
  std::unique_ptr<tessera::vision::IGenerationBackend> backend_;
  std::uint64_t instance_id_{0};
};

/// Owns the lifecycle of the one loaded model.
///
/// Unloaded -> Loading -> Ready on the first acquire(); a failed load returns
/// to Unloaded (not cached, the next acquire retries). Loads are single-flight:
/// the loader runs outside the lock, concurrent acquirers wait on a condition
/// variable and observe the outcome of the attempt they waited on, even if
/// later attempts have started or finished since. Thread-safe.
class InferenceResource {
 public:
  InferenceResource(std::string model_id, ModelLoader loader);

  InferenceResource(const InferenceResource&) = delete;
  InferenceResource& operator=(const InferenceResource&) = delete;

  /// Ready handle, loading it first if needed. ResourceLoadFailed on failure.
  [[nodiscard]] std::expected<std::shared_ptr<ModelHandle>, tessera::core::Error> acquire();

  /// Drop the current handle and load again, optionally under a new model id.
  /// Waits for an in-flight load to finish first.
  [[nodiscard]] std::expected<std::shared_ptr<ModelHandle>, tessera::core::Error> reload(
      std::optional<std::string> new_model_id = std::nullopt);

  /// Drop the handle and return to Unloaded. Memory is freed once in-flight
  /// users release their handles.
  void release();

  /// Ask the ready backend to free cached working memory. Never changes state;
  /// a no-op when nothing is loaded.
  [[nodiscard]] std::expected<void, tessera::core::Error> clear_cache();

  [[nodiscard]] ResourceState state() const;
  [[nodiscard]] std::string model_id() const;
  /// Number of successful loads so far.
  [[nodiscard]] std::uint64_t load_count() const;

 private:
  /// One load attempt; waiters keep it alive until they have read the outcome.
  struct LoadAttempt {
    bool done{false};
    std::optional<tessera::core::Error> error;
  };

  std::expected<std::shared_ptr<ModelHandle>, tessera::core::Error> acquire_locked(
      std::unique_lock<std::mutex>& lock);

  ModelLoader loader_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  ResourceState state_{ResourceState::Unloaded};
  std::string model_id_;
  std::shared_ptr<ModelHandle> handle_;
  std::uint64_t attempt_{0};
  std::shared_ptr<LoadAttempt> loading_;
  std::uint64_t load_count_{0};
};

}  // namespace tessera::app
