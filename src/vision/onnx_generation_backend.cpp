#include <tessera/vision/onnx_generation_backend.hpp>
#include <tessera/core/logging.hpp>
#include <tessera/vision/tile_normalizer.hpp>
#include <tessera/vision/tokenizer.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <new>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace tessera::vision {

namespace {

using tessera::core::Error;
using tessera::core::ErrorCode;

constexpr const char* kEncoderFile = "vision_encoder.onnx";
constexpr const char* kDecoderFile = "text_decoder.onnx";
constexpr const char* kVocabFile = "vocab.txt";

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

std::size_t OrtElementSize(ONNXTensorElementDataType type) {
  switch (type) {
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
      return sizeof(float);
    case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16:
      return 2;
    default:
      return 0;
  }
}

std::size_t ShapeProduct(const std::vector<int64_t>& shape) {
  std::size_t n = 1;
  for (const auto d : shape) n *= static_cast<std::size_t>(std::max<int64_t>(d, 0));
  return n;
}

/// ORT reports allocator exhaustion (host or device) only through the message text.
bool IsAllocationFailure(std::string_view what) {
  std::string lower(what);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  for (std::string_view needle :
       {"out of memory", "failed to allocate", "alloc_failed", "cudaerrormemoryallocation"}) {
    if (lower.find(needle) != std::string::npos) return true;
  }
  return false;
}

Error ClassifyOrtError(const Ort::Exception& e) {
  if (IsAllocationFailure(e.what())) {
    return Error{ErrorCode::OutOfMemory, e.what()};
  }
  return Error{ErrorCode::InferenceFailed, e.what()};
}

std::string ApplyTemplate(std::string tmpl, const std::string& prompt) {
  constexpr std::string_view kSlot = "{prompt}";
  const auto pos = tmpl.find(kSlot);
  if (pos == std::string::npos) {
    return tmpl + prompt;
  }
  tmpl.replace(pos, kSlot.size(), prompt);
  return tmpl;
}

}  // namespace

struct OnnxGenerationBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "tessera"};
  Ort::SessionOptions session_options;
  Ort::Session encoder{nullptr};
  Ort::Session decoder{nullptr};

  std::string encoder_input_name;
  std::string encoder_output_name;
  ONNXTensorElementDataType encoder_input_type{ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT};
  std::int64_t tile_edge{0};

  std::array<std::string, 2> decoder_input_names;  // {input_ids, encoder_hidden_states}
  std::string decoder_output_name;

  std::unique_ptr<Tokenizer> tokenizer;
  std::optional<std::int64_t> eos_id;

  OnnxGenerationOptions options;

  // Guards the scratch buffers and the shrink flag; runs are serialized.
  std::mutex run_mutex;

  // Scratch for dtype conversion of the encoder input and the decoder ids.
  std::vector<float> float_scratch;
  std::vector<std::uint16_t> half_scratch;  // IEEE half bits
  std::vector<std::int64_t> ids_scratch;
  bool shrink_arena_next_run{false};

  explicit Impl(OnnxGenerationOptions opts) : options(std::move(opts)) {
    session_options.SetIntraOpNumThreads(options.intra_op_threads);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
    if (options.use_cuda) {
      OrtCUDAProviderOptions cuda_options{};
      cuda_options.device_id = options.cuda_device_id;
      session_options.AppendExecutionProvider_CUDA(cuda_options);
    }
  }

  Ort::RunOptions MakeRunOptions() {
    Ort::RunOptions run_options;
    if (shrink_arena_next_run) {
      std::string devices = "cpu:0";
      if (options.use_cuda) {
        devices += ";gpu:" + std::to_string(options.cuda_device_id);
      }
      run_options.AddConfigEntry("memory.enable_memory_arena_shrinkage", devices.c_str());
      shrink_arena_next_run = false;
    }
    return run_options;
  }

  /// Encoder input in the element type the encoder declares. Throws Ort::Exception.
  Ort::Value MakeEncoderInput(const tessera::core::Tensor& tiles) {
    Ort::MemoryInfo mem_info = CpuMemoryInfo();
    const auto& shape = tiles.shape();
    const std::size_t count = tiles.element_count();

    if (encoder_input_type == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT) {
      if (tiles.dtype() == tessera::core::TensorDType::Float32) {
        return Ort::Value::CreateTensor(
            mem_info, const_cast<std::byte*>(tiles.data().data()), tiles.size_bytes(),
            shape.data(), shape.size(), ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT);
      }
      float_scratch = tensor_to_floats(tiles);
      return Ort::Value::CreateTensor<float>(mem_info, float_scratch.data(),
                                             float_scratch.size(), shape.data(),
                                             shape.size());
    }

    if (tiles.dtype() == tessera::core::TensorDType::Float16) {
      return Ort::Value::CreateTensor(
          mem_info, const_cast<std::byte*>(tiles.data().data()), tiles.size_bytes(),
          shape.data(), shape.size(), ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16);
    }
    half_scratch.resize(count);
    const cv::Mat src(1, static_cast<int>(count), CV_32F,
                      const_cast<std::byte*>(tiles.data().data()));
    cv::Mat dst(1, static_cast<int>(count), CV_16F, half_scratch.data());
    src.convertTo(dst, CV_16F);
    return Ort::Value::CreateTensor(mem_info, half_scratch.data(),
                                    half_scratch.size() * sizeof(std::uint16_t),
                                    shape.data(), shape.size(),
                                    ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16);
  }

  /// Runs the encoder; output [N, S, D].
  Ort::Value RunEncoder(const tessera::core::Tensor& tiles) {
    Ort::Value input = MakeEncoderInput(tiles);
    const char* input_names[] = {encoder_input_name.c_str()};
    const char* output_names[] = {encoder_output_name.c_str()};
    Ort::RunOptions run_options = MakeRunOptions();
    auto outputs = encoder.Run(run_options, input_names, &input, 1, output_names, 1);
    if (outputs.empty()) {
      throw std::runtime_error("vision encoder returned no output");
    }
    return std::move(outputs.front());
  }

  /// Argmax over the last position of logits [1, T, V].
  std::int64_t NextToken(Ort::Value& logits) {
    const auto info = logits.GetTensorTypeAndShapeInfo();
    const auto shape = info.GetShape();
    if (shape.size() != 3u || shape[2] <= 0 || shape[1] <= 0) {
      throw std::runtime_error("text decoder logits must be [1, T, V]");
    }
    const int vocab = static_cast<int>(shape[2]);
    const std::size_t offset = static_cast<std::size_t>(shape[1] - 1) * static_cast<std::size_t>(vocab);

    cv::Mat row;
    switch (info.GetElementType()) {
      case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT:
        row = cv::Mat(1, vocab, CV_32F, logits.GetTensorMutableData<float>() + offset);
        break;
      case ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16: {
        cv::Mat half(1, vocab, CV_16F,
                     logits.GetTensorMutableData<std::uint16_t>() + offset);
        half.convertTo(row, CV_32F);
        break;
      }
      default:
        throw std::runtime_error("text decoder logits must be float or float16");
    }
    cv::Point max_loc;
    cv::minMaxLoc(row, nullptr, nullptr, nullptr, &max_loc);
    return static_cast<std::int64_t>(max_loc.x);
  }
};

OnnxGenerationBackend::OnnxGenerationBackend(std::string model_dir,
                                             OnnxGenerationOptions options)
    : impl_(std::make_unique<Impl>(std::move(options))) {
  namespace fs = std::filesystem;
  const fs::path dir(model_dir);
  for (const char* name : {kEncoderFile, kDecoderFile, kVocabFile}) {
    if (!fs::is_regular_file(dir / name)) {
      throw std::runtime_error("OnnxGenerationBackend: missing " + (dir / name).string());
    }
  }

  const std::string encoder_path = (dir / kEncoderFile).string();
  const std::string decoder_path = (dir / kDecoderFile).string();
  impl_->encoder = Ort::Session(impl_->env, encoder_path.c_str(), impl_->session_options);
  impl_->decoder = Ort::Session(impl_->env, decoder_path.c_str(), impl_->session_options);
  impl_->tokenizer = std::make_unique<Tokenizer>(Tokenizer::from_file((dir / kVocabFile).string()));
  impl_->eos_id = impl_->tokenizer->token_id(impl_->options.end_of_turn_token);
  if (!impl_->eos_id) {
    core::get_logger()->warn("OnnxGenerationBackend: end-of-turn token '{}' not in vocabulary; "
                             "decoding stops at max_new_tokens",
                             impl_->options.end_of_turn_token);
  }

  Ort::AllocatorWithDefaultOptions allocator;

  if (impl_->encoder.GetInputCount() != 1u || impl_->encoder.GetOutputCount() == 0u) {
    throw std::runtime_error("OnnxGenerationBackend: vision encoder must have one input and an output");
  }
  impl_->encoder_input_name = impl_->encoder.GetInputNameAllocated(0, allocator).get();
  impl_->encoder_output_name = impl_->encoder.GetOutputNameAllocated(0, allocator).get();

  Ort::TypeInfo input_type = impl_->encoder.GetInputTypeInfo(0);
  const auto shape_info = input_type.GetTensorTypeAndShapeInfo();
  impl_->encoder_input_type = shape_info.GetElementType();
  if (OrtElementSize(impl_->encoder_input_type) == 0) {
    throw std::runtime_error("OnnxGenerationBackend: vision encoder input must be float or float16");
  }
  const std::vector<int64_t> dims = shape_info.GetShape();
  if (dims.size() != 4u || (dims[1] > 0 && dims[1] != 3)) {
    throw std::runtime_error("OnnxGenerationBackend: expected encoder input [N,3,E,E]");
  }
  impl_->tile_edge = dims[2] > 0 ? dims[2] : 0;

  if (impl_->decoder.GetInputCount() != 2u || impl_->decoder.GetOutputCount() == 0u) {
    throw std::runtime_error("OnnxGenerationBackend: text decoder must have two inputs and an output");
  }
  std::array<std::string, 2> names{impl_->decoder.GetInputNameAllocated(0, allocator).get(),
                                   impl_->decoder.GetInputNameAllocated(1, allocator).get()};
  // input_ids is the int64 input; the other one takes the image states.
  const auto first_type =
      impl_->decoder.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetElementType();
  if (first_type == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64) {
    impl_->decoder_input_names = names;
  } else {
    impl_->decoder_input_names = {names[1], names[0]};
  }
  impl_->decoder_output_name = impl_->decoder.GetOutputNameAllocated(0, allocator).get();
}

OnnxGenerationBackend::~OnnxGenerationBackend() = default;

std::int64_t OnnxGenerationBackend::tile_edge() const noexcept {
  return impl_->tile_edge;
}

std::expected<void, tessera::core::Error>
OnnxGenerationBackend::validate_input(const tessera::core::Tensor& tiles) const {
  auto base = IGenerationBackend::validate_input(tiles);
  if (!base) {
    return base;
  }
  const auto& shape = tiles.shape();
  if (impl_->tile_edge > 0 && (shape[2] != impl_->tile_edge || shape[3] != impl_->tile_edge)) {
    return std::unexpected(Error{ErrorCode::InvalidImage,
                                 "tile edge does not match the vision encoder input (" +
                                     std::to_string(impl_->tile_edge) + ")"});
  }
  return {};
}

std::expected<std::string, tessera::core::Error>
OnnxGenerationBackend::generate(const tessera::core::Tensor& tiles, const std::string& prompt) {
  auto valid = validate_input(tiles);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::lock_guard lock(impl_->run_mutex);
  try {
    Ort::Value image_states = impl_->RunEncoder(tiles);
    const auto states_info = image_states.GetTensorTypeAndShapeInfo();
    const auto states_shape = states_info.GetShape();
    const auto states_type = states_info.GetElementType();
    if (states_shape.size() != 3u || OrtElementSize(states_type) == 0) {
      return std::unexpected(Error{ErrorCode::InferenceFailed,
                                   "vision encoder output must be float [N, S, D]"});
    }
    // [N, S, D] -> [1, N*S, D]: all tiles become one image-token sequence.
    const std::array<int64_t, 3> flat_shape{1, states_shape[0] * states_shape[1], states_shape[2]};
    const std::size_t states_bytes = ShapeProduct(states_shape) * OrtElementSize(states_type);
    Ort::MemoryInfo mem_info = CpuMemoryInfo();

    impl_->ids_scratch = impl_->tokenizer->encode(ApplyTemplate(impl_->options.chat_template, prompt));
    if (impl_->ids_scratch.empty()) {
      return std::unexpected(Error{ErrorCode::InferenceFailed, "prompt encodes to no tokens"});
    }

    const char* input_names[] = {impl_->decoder_input_names[0].c_str(),
                                 impl_->decoder_input_names[1].c_str()};
    const char* output_names[] = {impl_->decoder_output_name.c_str()};

    for (std::uint32_t step = 0; step < impl_->options.max_new_tokens; ++step) {
      auto& ids = impl_->ids_scratch;
      const std::array<int64_t, 2> ids_shape{1, static_cast<int64_t>(ids.size())};
      std::array<Ort::Value, 2> inputs{
          Ort::Value::CreateTensor<int64_t>(mem_info, ids.data(), ids.size(),
                                            ids_shape.data(), ids_shape.size()),
          Ort::Value::CreateTensor(mem_info, image_states.GetTensorMutableData<std::uint8_t>(),
                                   states_bytes, flat_shape.data(), flat_shape.size(),
                                   states_type)};
      Ort::RunOptions run_options = impl_->MakeRunOptions();
      auto outputs = impl_->decoder.Run(run_options, input_names, inputs.data(), inputs.size(),
                                        output_names, 1);
      if (outputs.empty()) {
        return std::unexpected(Error{ErrorCode::InferenceFailed, "text decoder returned no logits"});
      }
      const std::int64_t next = impl_->NextToken(outputs.front());
      ids.push_back(next);
      if (impl_->eos_id && next == *impl_->eos_id) {
        break;
      }
    }
    return impl_->tokenizer->decode(impl_->ids_scratch, /*skip_special=*/true);
  } catch (const Ort::Exception& e) {
    return std::unexpected(ClassifyOrtError(e));
  } catch (const std::bad_alloc& e) {
    return std::unexpected(Error{ErrorCode::OutOfMemory, e.what()});
  } catch (const cv::Exception& e) {
    return std::unexpected(Error{ErrorCode::InferenceFailed, e.what()});
  } catch (const std::runtime_error& e) {
    return std::unexpected(Error{ErrorCode::InferenceFailed, e.what()});
  }
}

void OnnxGenerationBackend::warmup() {
  const std::int64_t edge = impl_->tile_edge > 0 ? impl_->tile_edge : 448;
  const std::vector<int64_t> shape{1, 3, edge, edge};
  const auto dtype = impl_->encoder_input_type == ONNX_TENSOR_ELEMENT_DATA_TYPE_FLOAT16
                         ? tessera::core::TensorDType::Float16
                         : tessera::core::TensorDType::Float32;
  std::vector<std::byte> buffer(ShapeProduct(shape) * tessera::core::element_size(dtype),
                                std::byte{0});
  const tessera::core::Tensor zeros(shape, dtype, std::move(buffer));
  std::lock_guard lock(impl_->run_mutex);
  try {
    (void)impl_->RunEncoder(zeros);
  } catch (const Ort::Exception& e) {
    core::get_logger()->warn("OnnxGenerationBackend: warmup failed: {}", e.what());
  }
}

std::expected<void, tessera::core::Error> OnnxGenerationBackend::release_cached_memory() {
  std::lock_guard lock(impl_->run_mutex);
  std::vector<float>().swap(impl_->float_scratch);
  std::vector<std::uint16_t>().swap(impl_->half_scratch);
  std::vector<std::int64_t>().swap(impl_->ids_scratch);
  impl_->shrink_arena_next_run = true;
  return {};
}

}  // namespace tessera::vision
