#include <tessera/core/item_result.hpp>

namespace tessera::core {

std::string_view to_string(ItemStatus status) noexcept {
  return status == ItemStatus::Success ? "success" : "error";
}

}  // namespace tessera::core
