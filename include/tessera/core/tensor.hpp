#pragma once

#include <tessera/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

namespace tessera::core {

/// Element type of a Tensor. Float16 is IEEE 754 half precision (raw bits).
enum class TensorDType : std::uint8_t {
  Float32,
  Float16,
};

[[nodiscard]] std::size_t element_size(TensorDType dtype) noexcept;

/// Dense row-major numeric array with an owned byte buffer, e.g. one CHW tile
/// ([3, E, E]) or a stacked tile batch ([N, 3, E, E]).
class Tensor {
 public:
  Tensor() = default;

  Tensor(std::vector<std::int64_t> shape,
         TensorDType dtype,
         std::vector<std::byte> buffer)
      : shape_(std::move(shape)), dtype_(dtype), buffer_(std::move(buffer)) {}

  [[nodiscard]] const std::vector<std::int64_t>& shape() const noexcept {
    return shape_;
  }
  [[nodiscard]] TensorDType dtype() const noexcept { return dtype_; }

  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// Product of the shape dimensions (0 for a rank-0 default tensor).
  [[nodiscard]] std::size_t element_count() const noexcept;

 private:
  std::vector<std::int64_t> shape_;
  TensorDType dtype_{TensorDType::Float32};
  std::vector<std::byte> buffer_;
};

/// Stack equally shaped tensors along a new leading axis, preserving order.
/// Fails with InvalidImage if the list is empty or shapes/dtypes differ.
[[nodiscard]] std::expected<Tensor, Error> stack(std::span<const Tensor> tensors);

}  // namespace tessera::core
