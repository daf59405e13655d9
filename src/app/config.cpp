#include <tessera/app/config.hpp>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <string_view>

namespace tessera::app {

namespace {

using tessera::core::Error;
using tessera::core::ErrorCode;

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

Error bad_value(const std::string& key, const std::string& value) {
  return Error{ErrorCode::InvalidConfig, "invalid value for " + key + ": '" + value + "'"};
}

template <typename T>
std::expected<T, Error> parse_number(const std::string& key, const std::string& value) {
  T out{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  if (ec != std::errc{} || ptr != last) {
    return std::unexpected(bad_value(key, value));
  }
  return out;
}

std::expected<bool, Error> parse_bool(const std::string& key, const std::string& value) {
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  return std::unexpected(bad_value(key, value));
}

/// Assigns a parsed value to field, or returns the parse error.
template <typename T, typename Parsed>
std::expected<void, Error> assign(T& field, std::expected<Parsed, Error> parsed) {
  if (!parsed) return std::unexpected(parsed.error());
  field = static_cast<T>(*parsed);
  return {};
}

std::expected<void, Error> apply_key(ServiceConfig& c, const std::string& key,
                                     const std::string& value) {
  if (key == "model_path") c.model_path = value;
  else if (key == "model_id") c.model_id = value;
  else if (key == "backend_type") {
    if (value == "onnx") c.backend_type = GenerationBackendType::Onnx;
    else if (value == "mock") c.backend_type = GenerationBackendType::Mock;
    else return std::unexpected(bad_value(key, value));
  }
  else if (key == "device") {
    if (value == "cuda") c.device = Device::Cuda;
    else if (value == "cpu") c.device = Device::Cpu;
    else return std::unexpected(bad_value(key, value));
  }
  else if (key == "min_tiles") return assign(c.min_tiles, parse_number<std::uint32_t>(key, value));
  else if (key == "max_tiles") return assign(c.max_tiles, parse_number<std::uint32_t>(key, value));
  else if (key == "tile_edge") return assign(c.tile_edge, parse_number<std::uint32_t>(key, value));
  else if (key == "use_thumbnail") return assign(c.use_thumbnail, parse_bool(key, value));
  else if (key == "prompt") c.prompt = value;
  else if (key == "max_new_tokens") return assign(c.max_new_tokens, parse_number<std::uint32_t>(key, value));
  else if (key == "clean_response") return assign(c.clean_response, parse_bool(key, value));
  else if (key == "role_marker") c.role_marker = value;
  else if (key == "max_images") return assign(c.max_images, parse_number<std::int64_t>(key, value));
  else if (key == "extension") c.extension = value;
  else if (key == "image_dir") c.image_dir = value;
  else if (key == "log_level") c.log_level = value;
  return {};
}

}  // namespace

ServiceConfig default_config() {
  ServiceConfig c;
  c.model_path = "";
  c.model_id = "tessera-vlm";
  c.backend_type = GenerationBackendType::Mock;
  c.device = Device::Cpu;
  c.min_tiles = 1;
  c.max_tiles = 12;
  c.tile_edge = 448;
  c.use_thumbnail = true;
  c.prompt = "What is in this image?";
  c.max_new_tokens = 64;
  c.max_images = 7;
  c.extension = "jpg";
  return c;
}

std::expected<ServiceConfig, tessera::core::Error> load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;
    auto applied = apply_key(c, key, value);
    if (!applied) {
      return std::unexpected(applied.error());
    }
  }
  return c;
}

void apply_env_overrides(ServiceConfig& config) {
  const auto env = [](const char* name) -> std::string {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
  };
  if (auto v = env("TESSERA_MODEL_PATH"); !v.empty()) config.model_path = v;
  if (auto v = env("TESSERA_IMAGE_DIR"); !v.empty()) config.image_dir = v;
  if (auto v = env("TESSERA_LOG_LEVEL"); !v.empty()) config.log_level = v;
}

std::expected<void, tessera::core::Error> validate_config(const ServiceConfig& config) {
  const auto invalid = [](std::string message) {
    return std::unexpected(Error{ErrorCode::InvalidConfig, std::move(message)});
  };
  if (config.min_tiles == 0) return invalid("min_tiles must be positive");
  if (config.max_tiles == 0) return invalid("max_tiles must be positive");
  if (config.min_tiles > config.max_tiles) {
    return invalid("min_tiles (" + std::to_string(config.min_tiles) + ") exceeds max_tiles (" +
                   std::to_string(config.max_tiles) + ")");
  }
  if (config.tile_edge == 0) return invalid("tile_edge must be positive");
  if (config.max_images <= 0) return invalid("max_images must be positive");
  if (config.max_new_tokens == 0) return invalid("max_new_tokens must be positive");
  if (config.backend_type == GenerationBackendType::Onnx && config.model_path.empty()) {
    return invalid("backend_type=onnx requires model_path");
  }
  return {};
}

tessera::vision::TilingConfig tiling_config(const ServiceConfig& config) {
  tessera::vision::TilingConfig t;
  t.min_tiles = config.min_tiles;
  t.max_tiles = config.max_tiles;
  t.tile_edge = config.tile_edge;
  t.use_thumbnail = config.use_thumbnail;
  return t;
}

std::string_view to_string(GenerationBackendType type) noexcept {
  switch (type) {
    case GenerationBackendType::Mock:
      return "mock";
    case GenerationBackendType::Onnx:
      return "onnx";
  }
  return "unknown";
}

std::string_view to_string(Device device) noexcept {
  switch (device) {
    case Device::Cpu:
      return "cpu";
    case Device::Cuda:
      return "cuda";
  }
  return "unknown";
}

}  // namespace tessera::app
