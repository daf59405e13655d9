#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/item_result.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace tessera::core {

/// Batch header, emitted once before any item. Counts so far are zero.
struct MetadataEvent {
  std::size_t total_found{0};
  std::size_t to_process{0};
  std::size_t successful{0};
  std::size_t failed{0};
};

/// An item is about to be processed. index is 1-based.
struct StartEvent {
  std::size_t index{1};
  std::size_t total{1};
  std::string source;
};

/// Single-item flow: inference is running.
struct ProcessingEvent {
  std::string source;
};

/// Per-item outcome (success or embedded per-item error).
struct ResultEvent {
  std::size_t index{1};
  ItemResult result;
};

/// Terminal event with final tallies.
struct CompleteEvent {
  std::size_t processed{0};
  std::size_t successful{0};
  std::size_t failed{0};
};

/// Failure outside per-item handling (terminal), or a single item's failure in
/// the single-item flow (followed by complete).
struct ErrorEvent {
  Error error;
  std::optional<std::string> source;
};

using StreamEvent = std::variant<MetadataEvent,
                                 StartEvent,
                                 ProcessingEvent,
                                 ResultEvent,
                                 CompleteEvent,
                                 ErrorEvent>;

/// Wire tag of an event: metadata, start, processing, result, complete, error.
[[nodiscard]] std::string_view event_type(const StreamEvent& event) noexcept;

}  // namespace tessera::core
