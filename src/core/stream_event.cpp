#include <tessera/core/stream_event.hpp>

namespace tessera::core {

namespace {

struct TypeTag {
  std::string_view operator()(const MetadataEvent&) const noexcept { return "metadata"; }
  std::string_view operator()(const StartEvent&) const noexcept { return "start"; }
  std::string_view operator()(const ProcessingEvent&) const noexcept { return "processing"; }
  std::string_view operator()(const ResultEvent&) const noexcept { return "result"; }
  std::string_view operator()(const CompleteEvent&) const noexcept { return "complete"; }
  std::string_view operator()(const ErrorEvent&) const noexcept { return "error"; }
};

}  // namespace

std::string_view event_type(const StreamEvent& event) noexcept {
  return std::visit(TypeTag{}, event);
}

}  // namespace tessera::core
