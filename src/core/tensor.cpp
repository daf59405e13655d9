#include <tessera/core/tensor.hpp>
#include <cstring>
#include <string>

namespace tessera::core {

std::size_t element_size(TensorDType dtype) noexcept {
  switch (dtype) {
    case TensorDType::Float16:
      return 2;
    case TensorDType::Float32:
    default:
      return 4;
  }
}

std::size_t Tensor::element_count() const noexcept {
  if (shape_.empty()) return 0;
  std::size_t n = 1;
  for (const auto d : shape_) {
    n *= d > 0 ? static_cast<std::size_t>(d) : 0;
  }
  return n;
}

std::expected<Tensor, Error> stack(std::span<const Tensor> tensors) {
  if (tensors.empty()) {
    return std::unexpected(Error{ErrorCode::InvalidImage, "no tensors to stack"});
  }
  const Tensor& first = tensors.front();
  const std::size_t item_bytes = first.size_bytes();
  for (std::size_t i = 1; i < tensors.size(); ++i) {
    if (tensors[i].shape() != first.shape() || tensors[i].dtype() != first.dtype() ||
        tensors[i].size_bytes() != item_bytes) {
      return std::unexpected(Error{ErrorCode::InvalidImage,
                                   "tensor " + std::to_string(i) +
                                       " does not match the shape of tensor 0"});
    }
  }

  std::vector<std::int64_t> shape;
  shape.reserve(first.shape().size() + 1);
  shape.push_back(static_cast<std::int64_t>(tensors.size()));
  shape.insert(shape.end(), first.shape().begin(), first.shape().end());

  std::vector<std::byte> buffer(item_bytes * tensors.size());
  for (std::size_t i = 0; i < tensors.size(); ++i) {
    std::memcpy(buffer.data() + i * item_bytes, tensors[i].data().data(), item_bytes);
  }
  return Tensor(std::move(shape), first.dtype(), std::move(buffer));
}

}  // namespace tessera::core
