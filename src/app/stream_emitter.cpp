#include <tessera/app/stream_emitter.hpp>
#include <tessera/core/logging.hpp>
#include <tessera/vision/load_image.hpp>
#include <filesystem>
#include <system_error>
#include <type_traits>
#include <vector>

namespace tessera::app {

namespace {

using nlohmann::json;
using tessera::core::Error;
using tessera::core::ErrorCode;
namespace ev = tessera::core;

json result_json(std::size_t index, const ev::ItemResult& result) {
  json j{{"index", index},
         {"image_path", result.source},
         {"status", std::string(ev::to_string(result.status()))},
         {"elapsed_ms", result.elapsed_ms}};
  if (result.ok()) {
    j["description"] = *result.outcome;
  } else {
    j["error"] = result.outcome.error().message;
    j["error_code"] = std::string(ev::to_string(result.outcome.error().code));
  }
  return j;
}

/// Counts results for the terminal complete event and forwards hooks as events.
class EventObserver : public BatchObserver {
 public:
  explicit EventObserver(const EventSink& sink) : sink_(sink) {}

  void on_item_start(std::size_t index, std::size_t total, const std::string& source) override {
    sink_(ev::StartEvent{index, total, source});
  }

  void on_item_result(std::size_t index, const ev::ItemResult& result) override {
    ++processed_;
    if (result.ok()) ++successful_;
    sink_(ev::ResultEvent{index, result});
  }

  [[nodiscard]] ev::CompleteEvent complete() const {
    return ev::CompleteEvent{processed_, successful_, processed_ - successful_};
  }

 private:
  const EventSink& sink_;
  std::size_t processed_{0};
  std::size_t successful_{0};
};

Error unexpected_error(const std::exception& e) {
  return Error{ErrorCode::Unexpected, e.what()};
}

Error listing_error(const std::filesystem::filesystem_error& e) {
  if (e.code() == std::errc::no_such_file_or_directory) {
    return Error{ErrorCode::FileNotFound, e.what()};
  }
  if (e.code() == std::errc::permission_denied) {
    return Error{ErrorCode::PermissionDenied, e.what()};
  }
  return Error{ErrorCode::Unexpected, e.what()};
}

}  // namespace

json to_json(const tessera::core::StreamEvent& event) {
  json j = std::visit(
      [](const auto& e) -> json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ev::MetadataEvent>) {
          return json{{"total_found", e.total_found},
                      {"to_process", e.to_process},
                      {"successful", e.successful},
                      {"failed", e.failed}};
        } else if constexpr (std::is_same_v<T, ev::StartEvent>) {
          return json{{"index", e.index}, {"total", e.total}, {"image_path", e.source}};
        } else if constexpr (std::is_same_v<T, ev::ProcessingEvent>) {
          return json{{"image_path", e.source}};
        } else if constexpr (std::is_same_v<T, ev::ResultEvent>) {
          return result_json(e.index, e.result);
        } else if constexpr (std::is_same_v<T, ev::CompleteEvent>) {
          return json{{"processed", e.processed},
                      {"successful", e.successful},
                      {"failed", e.failed}};
        } else {
          json out{{"message", e.error.message},
                   {"error_code", std::string(ev::to_string(e.error.code))}};
          if (e.source) out["image_path"] = *e.source;
          return out;
        }
      },
      event);
  j["type"] = std::string(ev::event_type(event));
  return j;
}

void NdjsonEventWriter::write(const tessera::core::StreamEvent& event) {
  // Paths and generated text are raw bytes; invalid UTF-8 becomes U+FFFD.
  out_ << to_json(event).dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
  out_.flush();
}

EventSink NdjsonEventWriter::sink() {
  return [this](const tessera::core::StreamEvent& event) { write(event); };
}

StreamEmitter::StreamEmitter(BatchOrchestrator& orchestrator) : orchestrator_(orchestrator) {}

void StreamEmitter::stream_single(const std::string& source, const EventSink& sink) {
  try {
    sink(ev::StartEvent{1, 1, source});
    sink(ev::ProcessingEvent{source});
    auto result = orchestrator_.run_single(source);
    if (!result) {
      sink(ev::ErrorEvent{result.error(), source});
      return;
    }
    if (result->ok()) {
      sink(ev::ResultEvent{1, *result});
      sink(ev::CompleteEvent{1, 1, 0});
    } else {
      sink(ev::ErrorEvent{result->outcome.error(), source});
      sink(ev::CompleteEvent{1, 0, 1});
    }
  } catch (const tessera::core::InternalConsistencyError&) {
    throw;
  } catch (const std::exception& e) {
    tessera::core::get_logger()->error("Stream failed: {}", e.what());
    sink(ev::ErrorEvent{unexpected_error(e), source});
  }
}

void StreamEmitter::stream_batch(std::span<const std::string> items, std::int64_t cap,
                                 const EventSink& sink) {
  auto attempted = BatchOrchestrator::validate(items, cap);
  if (!attempted) {
    sink(ev::ErrorEvent{attempted.error(), std::nullopt});
    return;
  }

  try {
    sink(ev::MetadataEvent{items.size(), *attempted, 0, 0});
    EventObserver observer(sink);
    auto summary = orchestrator_.run(items, cap, &observer);
    if (!summary && summary.error().code != ErrorCode::TotalBatchFailure) {
      sink(ev::ErrorEvent{summary.error(), std::nullopt});
      return;
    }
    sink(observer.complete());
  } catch (const tessera::core::InternalConsistencyError&) {
    throw;
  } catch (const std::exception& e) {
    tessera::core::get_logger()->error("Stream failed: {}", e.what());
    sink(ev::ErrorEvent{unexpected_error(e), std::nullopt});
  }
}

void StreamEmitter::stream_folder(const std::string& directory, const std::string& ext,
                                  std::int64_t cap, const EventSink& sink) {
  std::vector<std::string> items;
  try {
    items = tessera::vision::list_images(directory, ext);
  } catch (const std::filesystem::filesystem_error& e) {
    tessera::core::get_logger()->error("Cannot list {}: {}", directory, e.what());
    sink(ev::ErrorEvent{listing_error(e), std::nullopt});
    return;
  }
  stream_batch(items, cap, sink);
}

}  // namespace tessera::app
