#pragma once

#include <tessera/core/error.hpp>
#include <tessera/core/tensor.hpp>
#include <tessera/vision/generation_backend.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace tessera::vision {

/// Options for the ONNX Runtime vision-language backend.
struct OnnxGenerationOptions {
  bool use_cuda{false};
  int cuda_device_id{0};
  std::uint32_t max_new_tokens{64};
  int intra_op_threads{1};
  /// Prompt template; "{prompt}" is replaced by the instruction.
  std::string chat_template{
      "<|im_start|>user\n<image>\n{prompt}<|im_end|>\n<|im_start|>assistant\n"};
  std::string end_of_turn_token{"<|im_end|>"};
};

/// ONNX Runtime backend: encoder/decoder pair plus vocabulary, implements
/// IGenerationBackend.
///
/// Model directory layout:
/// - vision_encoder.onnx: input [N, 3, E, E] (float16 or float32), output
///   [N, S, D] image token states.
/// - text_decoder.onnx: inputs input_ids [1, T] (int64) and
///   encoder_hidden_states [1, N*S, D]; output logits [1, T, V].
/// - vocab.txt: one token per line (see Tokenizer).
///
/// Decoding is greedy without a KV cache: every step reruns the decoder over the
/// whole sequence. The returned text is the full decoded sequence (prompt
/// included, special tokens skipped); callers strip the echo with
/// clean_response.
///
/// generate, warmup and release_cached_memory are serialized on one mutex, so a
/// shared instance may be called from several threads.
///
/// Throws std::runtime_error (or Ort::Exception) from the constructor when the
/// directory is incomplete or the models do not have the expected signature.
class OnnxGenerationBackend : public IGenerationBackend {
 public:
  explicit OnnxGenerationBackend(std::string model_dir, OnnxGenerationOptions options = {});

  ~OnnxGenerationBackend() override;

  OnnxGenerationBackend(const OnnxGenerationBackend&) = delete;
  OnnxGenerationBackend& operator=(const OnnxGenerationBackend&) = delete;

  [[nodiscard]] std::expected<std::string, tessera::core::Error> generate(
      const tessera::core::Tensor& tiles, const std::string& prompt) override;

  [[nodiscard]] std::expected<void, tessera::core::Error> validate_input(
      const tessera::core::Tensor& tiles) const override;

  void warmup() override;

  [[nodiscard]] std::expected<void, tessera::core::Error> release_cached_memory() override;

  /// Tile edge the encoder expects (0 if the model leaves it dynamic).
  [[nodiscard]] std::int64_t tile_edge() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace tessera::vision
