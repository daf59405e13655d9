#pragma once

#include <tessera/app/batch_orchestrator.hpp>
#include <tessera/core/stream_event.hpp>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <functional>
#include <ostream>
#include <span>
#include <string>

namespace tessera::app {

/// Receives events as they happen. Invoked on the thread that runs the stream.
using EventSink = std::function<void(const tessera::core::StreamEvent&)>;

/// JSON object for one event, with a "type" field naming the event.
[[nodiscard]] nlohmann::json to_json(const tessera::core::StreamEvent& event);

/// Writes one JSON object per line and flushes after each. Bytes that are not
/// valid UTF-8 are written as U+FFFD.
class NdjsonEventWriter {
 public:
  explicit NdjsonEventWriter(std::ostream& out) : out_(out) {}

  void write(const tessera::core::StreamEvent& event);

  /// Sink bound to this writer; the writer must outlive it.
  [[nodiscard]] EventSink sink();

 private:
  std::ostream& out_;
};

/// Turns single-image and batch runs into incremental event sequences.
///
/// Single image: start, processing, then result (or error), then complete.
/// Batch: metadata, per item start and result, then complete with tallies,
/// also when every item failed. Validation failures, model load failures and
/// exceptions outside per-item handling end the stream with one error event.
class StreamEmitter {
 public:
  explicit StreamEmitter(BatchOrchestrator& orchestrator);

  void stream_single(const std::string& source, const EventSink& sink);

  void stream_batch(std::span<const std::string> items, std::int64_t cap, const EventSink& sink);

  /// Lists directory for files with extension ext, then streams them as a batch.
  void stream_folder(const std::string& directory,
                     const std::string& ext,
                     std::int64_t cap,
                     const EventSink& sink);

 private:
  BatchOrchestrator& orchestrator_;
};

}  // namespace tessera::app
