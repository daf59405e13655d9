#pragma once

#include <tessera/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace tessera::core {

enum class ItemStatus : std::uint8_t {
  Success,
  Error,
};

[[nodiscard]] std::string_view to_string(ItemStatus status) noexcept;

/// Outcome of describing one image: the description on success, the classified
/// error otherwise.
struct ItemResult {
  std::string source;  // image path as given by the caller
  std::expected<std::string, Error> outcome;
  double elapsed_ms{0.0};

  [[nodiscard]] bool ok() const noexcept { return outcome.has_value(); }
  [[nodiscard]] ItemStatus status() const noexcept {
    return ok() ? ItemStatus::Success : ItemStatus::Error;
  }
};

/// Aggregate of a capped, ordered batch.
/// Invariants: success_count + failure_count == total_attempted,
/// total_attempted == min(cap, total_discovered), results in input order.
struct BatchSummary {
  std::size_t total_discovered{0};
  std::size_t total_attempted{0};
  std::size_t success_count{0};
  std::size_t failure_count{0};
  std::vector<ItemResult> results;
};

}  // namespace tessera::core
