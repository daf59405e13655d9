#include <tessera/app/inference_resource.hpp>
#include <tessera/core/logging.hpp>
#include <chrono>
#include <stdexcept>

namespace tessera::app {

namespace {

using tessera::core::Error;
using tessera::core::ErrorCode;

/// Runs the loader, turning exceptions and null backends into errors.
std::expected<std::unique_ptr<tessera::vision::IGenerationBackend>, Error> run_loader(
    const ModelLoader& loader, const std::string& model_id) {
  try {
    auto backend = loader(model_id);
    if (backend && !*backend) {
      return std::unexpected(Error{ErrorCode::ResourceLoadFailed, "loader returned no backend"});
    }
    return backend;
  } catch (const std::exception& e) {
    return std::unexpected(Error{ErrorCode::ResourceLoadFailed, e.what()});
  }
}

}  // namespace

std::string_view to_string(ResourceState state) noexcept {
  switch (state) {
    case ResourceState::Unloaded:
      return "unloaded";
    case ResourceState::Loading:
      return "loading";
    case ResourceState::Ready:
      return "ready";
  }
  return "unknown";
}

InferenceResource::InferenceResource(std::string model_id, ModelLoader loader)
    : loader_(std::move(loader)), model_id_(std::move(model_id)) {
  if (!loader_) {
    throw std::invalid_argument("InferenceResource: loader must be set");
  }
}

std::expected<std::shared_ptr<ModelHandle>, tessera::core::Error> InferenceResource::acquire() {
  std::unique_lock lock(mutex_);
  return acquire_locked(lock);
}

std::expected<std::shared_ptr<ModelHandle>, tessera::core::Error>
InferenceResource::acquire_locked(std::unique_lock<std::mutex>& lock) {
  for (;;) {
    if (state_ == ResourceState::Ready) {
      return handle_;
    }
    if (state_ == ResourceState::Loading) {
      const std::shared_ptr<LoadAttempt> pending = loading_;
      cv_.wait(lock, [&] { return pending->done; });
      if (pending->error) {
        return std::unexpected(*pending->error);
      }
      continue;
    }

    const std::uint64_t attempt = ++attempt_;
    auto current = std::make_shared<LoadAttempt>();
    loading_ = current;
    state_ = ResourceState::Loading;
    const std::string model_id = model_id_;
    auto logger = tessera::core::get_logger();
    logger->info("Loading model '{}'", model_id);
    const auto t0 = std::chrono::steady_clock::now();

    lock.unlock();
    auto loaded = run_loader(loader_, model_id);
    lock.lock();

    const double seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    current->done = true;
    loading_.reset();
    if (!loaded) {
      current->error = Error{ErrorCode::ResourceLoadFailed,
                             "failed to load model '" + model_id + "': " + loaded.error().message};
      state_ = ResourceState::Unloaded;
      logger->error("{}", current->error->message);
      cv_.notify_all();
      return std::unexpected(*current->error);
    }

    handle_ = std::make_shared<ModelHandle>(ModelHandle::Key{}, model_id, std::move(*loaded),
                                            attempt);
    ++load_count_;
    state_ = ResourceState::Ready;
    logger->info("Model '{}' loaded in {:.2f}s", model_id, seconds);
    cv_.notify_all();
    return handle_;
  }
}

std::expected<std::shared_ptr<ModelHandle>, tessera::core::Error> InferenceResource::reload(
    std::optional<std::string> new_model_id) {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return state_ != ResourceState::Loading; });
  if (new_model_id) {
    model_id_ = std::move(*new_model_id);
  }
  handle_.reset();
  state_ = ResourceState::Unloaded;
  tessera::core::get_logger()->info("Reloading model '{}'", model_id_);
  return acquire_locked(lock);
}

void InferenceResource::release() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return state_ != ResourceState::Loading; });
  if (handle_) {
    tessera::core::get_logger()->info("Releasing model '{}'", model_id_);
  }
  handle_.reset();
  state_ = ResourceState::Unloaded;
}

std::expected<void, tessera::core::Error> InferenceResource::clear_cache() {
  std::shared_ptr<ModelHandle> handle;
  {
    std::lock_guard lock(mutex_);
    if (state_ != ResourceState::Ready) {
      return {};
    }
    handle = handle_;
  }
  return handle->backend().release_cached_memory();
}

ResourceState InferenceResource::state() const {
  std::lock_guard lock(mutex_);
  return state_;
}

std::string InferenceResource::model_id() const {
  std::lock_guard lock(mutex_);
  return model_id_;
}

std::uint64_t InferenceResource::load_count() const {
  std::lock_guard lock(mutex_);
  return load_count_;
}

}  // namespace tessera::app
