#pragma once

#include <tessera/core/error.hpp>
#include <tessera/vision/aspect_ratio_planner.hpp>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace tessera::app {

/// Generation backend type: mock (synthetic) or onnx (real model).
enum class GenerationBackendType {
  Mock,
  Onnx,
};

/// Execution device for the onnx backend.
enum class Device {
  Cpu,
  Cuda,
};

/// Service configuration: model, tiling, prompt, batch limits.
struct ServiceConfig {
  std::string model_path;  // model directory for the onnx backend
  std::string model_id{"tessera-vlm"};
  GenerationBackendType backend_type{GenerationBackendType::Mock};
  Device device{Device::Cpu};

  std::uint32_t min_tiles{1};
  std::uint32_t max_tiles{12};
  std::uint32_t tile_edge{448};
  bool use_thumbnail{true};

  std::string prompt{"What is in this image?"};
  std::uint32_t max_new_tokens{64};
  bool clean_response{true};
  std::string role_marker{"assistant"};

  std::int64_t max_images{7};
  std::string extension{"jpg"};
  std::string image_dir;
  std::string log_level{"info"};
};

/// Load config from a simple key=value file (one per line, '#' comments) on
/// top of default_config(). A missing file yields the defaults; a value that
/// does not parse yields InvalidConfig. Unknown keys are ignored.
[[nodiscard]] std::expected<ServiceConfig, tessera::core::Error> load_config(
    const std::string& path);

/// Default config when no file is provided.
ServiceConfig default_config();

/// Overrides from TESSERA_MODEL_PATH, TESSERA_IMAGE_DIR and TESSERA_LOG_LEVEL
/// when they are set and non-empty.
void apply_env_overrides(ServiceConfig& config);

/// InvalidConfig for non-positive tile counts, edge, cap or token budget, or
/// min_tiles > max_tiles.
[[nodiscard]] std::expected<void, tessera::core::Error> validate_config(
    const ServiceConfig& config);

/// Tiling section of the config.
[[nodiscard]] tessera::vision::TilingConfig tiling_config(const ServiceConfig& config);

[[nodiscard]] std::string_view to_string(GenerationBackendType type) noexcept;
[[nodiscard]] std::string_view to_string(Device device) noexcept;

}  // namespace tessera::app
