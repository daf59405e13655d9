#include <tessera/vision/generation_backend.hpp>
#include <string>

namespace tessera::vision {

std::expected<void, tessera::core::Error> IGenerationBackend::validate_input(
    const tessera::core::Tensor& tiles) const {
  const auto& shape = tiles.shape();
  if (tiles.empty() || shape.size() != 4u || shape[0] < 1 || shape[1] != 3) {
    return std::unexpected(tessera::core::Error{
        tessera::core::ErrorCode::InvalidImage,
        "expected a [N, 3, E, E] tile batch, got rank " + std::to_string(shape.size())});
  }
  if (tiles.size_bytes() < tiles.element_count() * tessera::core::element_size(tiles.dtype())) {
    return std::unexpected(tessera::core::Error{tessera::core::ErrorCode::InvalidImage,
                                                "tile batch buffer is truncated"});
  }
  return {};
}

}  // namespace tessera::vision
