// Unit tests for OnnxGenerationBackend.
// The directory checks run without a model. The rest need an exported model directory
// (vision_encoder.onnx, text_decoder.onnx, vocab.txt): set TESSERA_TEST_ONNX_MODEL_DIR to it.
// They are skipped when the variable is unset or the directory is incomplete.
#include <tessera/core/error.hpp>
#include <tessera/core/tensor.hpp>
#include <tessera/vision/onnx_generation_backend.hpp>
#include <tessera/vision/tile_normalizer.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace tv = tessera::vision;
namespace tc = tessera::core;
namespace fs = std::filesystem;

static std::string get_test_model_dir() {
  const char* env = std::getenv("TESSERA_TEST_ONNX_MODEL_DIR");
  if (env && env[0] != '\0' && fs::exists(fs::path(env) / "vision_encoder.onnx") &&
      fs::exists(fs::path(env) / "text_decoder.onnx") && fs::exists(fs::path(env) / "vocab.txt")) {
    return env;
  }
  return "";
}

static tc::Tensor zero_batch(std::int64_t n, std::int64_t edge) {
  std::vector<std::byte> buf(static_cast<std::size_t>(n * 3 * edge * edge) * 2, std::byte{0});
  return tc::Tensor({n, 3, edge, edge}, tc::TensorDType::Float16, std::move(buf));
}

// --- Tests that run without a model ---

TEST(OnnxGenerationBackend, ConstructorThrowsWhenDirectoryMissing) {
  EXPECT_THROW(tv::OnnxGenerationBackend("nonexistent_tessera_model_dir_12345"),
               std::runtime_error);
}

TEST(OnnxGenerationBackend, ConstructorNamesMissingFile) {
  const fs::path dir = fs::temp_directory_path() / ("tessera_onnx_" + std::to_string(::getpid()));
  fs::create_directories(dir);
  std::ofstream(dir / "vocab.txt") << "<unk>\n";
  try {
    tv::OnnxGenerationBackend backend(dir.string());
    ADD_FAILURE() << "expected std::runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("vision_encoder.onnx"), std::string::npos);
  }
  std::error_code ec;
  fs::remove_all(dir, ec);
}

// --- Tests that require a real model (skip if TESSERA_TEST_ONNX_MODEL_DIR not set) ---

TEST(OnnxGenerationBackend, ValidateInputRejectsWrongEdge) {
  const std::string dir = get_test_model_dir();
  if (dir.empty()) {
    GTEST_SKIP() << "Set TESSERA_TEST_ONNX_MODEL_DIR to run (exported model directory)";
  }
  tv::OnnxGenerationBackend backend(dir);
  if (backend.tile_edge() <= 0) {
    GTEST_SKIP() << "encoder input edge is dynamic";
  }
  auto result = backend.validate_input(zero_batch(1, backend.tile_edge() + 1));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code, tc::ErrorCode::InvalidImage);
}

TEST(OnnxGenerationBackend, GenerateReturnsText) {
  const std::string dir = get_test_model_dir();
  if (dir.empty()) {
    GTEST_SKIP() << "Set TESSERA_TEST_ONNX_MODEL_DIR to run (exported model directory)";
  }
  tv::OnnxGenerationOptions options;
  options.max_new_tokens = 4;
  tv::OnnxGenerationBackend backend(dir, options);
  backend.warmup();
  const std::int64_t edge = backend.tile_edge() > 0 ? backend.tile_edge() : 448;
  auto text = backend.generate(zero_batch(1, edge), "What is in this image?");
  ASSERT_TRUE(text.has_value()) << tc::describe(text.error());
  EXPECT_FALSE(text->empty());
  EXPECT_TRUE(backend.release_cached_memory().has_value());
}
