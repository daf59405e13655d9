/**
 * tessera-cli: describe image(s) with a vision-language model; print text or NDJSON events.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/tessera_cli [--config path] [--input image | --folder dir] [--stream]
 */

#include <tessera/app/batch_orchestrator.hpp>
#include <tessera/app/config.hpp>
#include <tessera/app/inference_resource.hpp>
#include <tessera/app/item_pipeline.hpp>
#include <tessera/app/stream_emitter.hpp>
#include <tessera/core/error.hpp>
#include <tessera/core/logging.hpp>
#include <tessera/vision/load_image.hpp>
#include <tessera/vision/mock_generation_backend.hpp>
#ifdef TESSERA_HAS_ONNXRUNTIME
#include <tessera/vision/onnx_generation_backend.hpp>
#endif

#include <cstdint>
#include <expected>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace {

tessera::app::ModelLoader make_loader(const tessera::app::ServiceConfig &cfg) {
  using tessera::vision::IGenerationBackend;

#ifdef TESSERA_HAS_ONNXRUNTIME
  if (cfg.backend_type == tessera::app::GenerationBackendType::Onnx) {
    tessera::vision::OnnxGenerationOptions options;
    options.use_cuda = cfg.device == tessera::app::Device::Cuda;
    options.max_new_tokens = cfg.max_new_tokens;
    return [options](const std::string &model_dir)
               -> std::expected<std::unique_ptr<IGenerationBackend>, tessera::core::Error> {
      auto onnx = std::make_unique<tessera::vision::OnnxGenerationBackend>(model_dir, options);
      onnx->warmup();
      return onnx;
    };
  }
#endif
  return [](const std::string &)
             -> std::expected<std::unique_ptr<IGenerationBackend>, tessera::core::Error> {
    return std::make_unique<tessera::vision::MockGenerationBackend>();
  };
}

/// Prints each item as it finishes.
class PrintObserver : public tessera::app::BatchObserver {
 public:
  void on_item_result(std::size_t index, const tessera::core::ItemResult &result) override {
    std::cout << "[" << index << "] " << result.source << "\n";
    if (result.ok()) {
      std::cout << "  " << *result.outcome << "\n";
    } else {
      std::cout << "  error: " << tessera::core::describe(result.outcome.error()) << "\n";
    }
  }
};

void print_usage() {
  std::cout << "Usage: tessera_cli [options] [--input <image> | --folder <dir>]\n"
            << "  --config <path>     Service config (key=value file); default: built-in (mock)\n"
            << "  --backend <type>    Override backend: mock | onnx (default from config)\n"
            << "  --model <dir>       Override model directory (required for --backend onnx)\n"
            << "  --prompt <text>     Instruction sent with each image\n"
            << "  --input <image>     Describe one image\n"
            << "  --folder <dir>      Describe the images in a directory (sorted by name)\n"
            << "  --ext <ext>         Image extension for --folder (default from config: jpg)\n"
            << "  --max-images <n>    Cap on images per batch (default from config: 7)\n"
            << "  --stream            Emit NDJSON events on stdout instead of text\n"
            << "  --log-level <lvl>   trace | debug | info | warn | error | off\n"
            << "\nWithout --input or --folder, image_dir from config or TESSERA_IMAGE_DIR is used.\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string input_path;
  std::string folder_path;
  std::string backend_override;
  std::string model_override;
  std::string prompt_override;
  std::string ext_override;
  std::string max_images_override;
  std::string log_level_override;
  bool stream = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--input" && i + 1 < argc) {
      input_path = argv[++i];
    } else if (arg == "--folder" && i + 1 < argc) {
      folder_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--prompt" && i + 1 < argc) {
      prompt_override = argv[++i];
    } else if (arg == "--ext" && i + 1 < argc) {
      ext_override = argv[++i];
    } else if (arg == "--max-images" && i + 1 < argc) {
      max_images_override = argv[++i];
    } else if (arg == "--log-level" && i + 1 < argc) {
      log_level_override = argv[++i];
    } else if (arg == "--stream") {
      stream = true;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }
  if (!input_path.empty() && !folder_path.empty()) {
    std::cerr << "Use either --input or --folder, not both\n";
    return 1;
  }

  auto loaded = config_path.empty() ? std::expected<tessera::app::ServiceConfig, tessera::core::Error>(
                                          tessera::app::default_config())
                                    : tessera::app::load_config(config_path);
  if (!loaded) {
    std::cerr << "Config error: " << tessera::core::describe(loaded.error()) << "\n";
    return 1;
  }
  tessera::app::ServiceConfig cfg = std::move(*loaded);
  tessera::app::apply_env_overrides(cfg);

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.backend_type = tessera::app::GenerationBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.backend_type = tessera::app::GenerationBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
#ifndef TESSERA_HAS_ONNXRUNTIME
  if (cfg.backend_type == tessera::app::GenerationBackendType::Onnx) {
    std::cerr << "ONNX backend not available (build with -DTESSERA_USE_ONNXRUNTIME=ON and ONNX Runtime)\n";
    return 1;
  }
#endif
  if (!model_override.empty()) cfg.model_path = model_override;
  if (!prompt_override.empty()) cfg.prompt = prompt_override;
  if (!ext_override.empty()) cfg.extension = ext_override;
  if (!log_level_override.empty()) cfg.log_level = log_level_override;
  if (!max_images_override.empty()) {
    try {
      cfg.max_images = std::stoll(max_images_override);
    } catch (const std::exception &) {
      std::cerr << "Invalid --max-images " << max_images_override << "\n";
      return 1;
    }
  }

  if (!tessera::core::set_log_level(cfg.log_level)) {
    std::cerr << "Unknown log level " << cfg.log_level << "\n";
    return 1;
  }
  if (auto valid = tessera::app::validate_config(cfg); !valid) {
    std::cerr << "Config error: " << tessera::core::describe(valid.error()) << "\n";
    return 1;
  }
  if (input_path.empty() && folder_path.empty()) {
    if (cfg.image_dir.empty()) {
      std::cerr << "No input: pass --input or --folder, or set image_dir / TESSERA_IMAGE_DIR\n";
      return 1;
    }
    folder_path = cfg.image_dir;
  }

  tessera::app::ItemPipelineOptions pipeline_options;
  pipeline_options.tiling = tessera::app::tiling_config(cfg);
  pipeline_options.prompt = cfg.prompt;
  pipeline_options.clean_response = cfg.clean_response;
  pipeline_options.role_marker = cfg.role_marker;
  const tessera::app::ItemPipeline pipeline(pipeline_options);

  const std::string model_id =
      cfg.backend_type == tessera::app::GenerationBackendType::Onnx ? cfg.model_path : cfg.model_id;
  tessera::app::InferenceResource resource(model_id, make_loader(cfg));
  tessera::app::BatchOrchestrator orchestrator(resource, pipeline);

  if (stream) {
    tessera::app::NdjsonEventWriter writer(std::cout);
    bool failed = false;
    const tessera::app::EventSink sink = [&](const tessera::core::StreamEvent &event) {
      writer.write(event);
      if (std::holds_alternative<tessera::core::ErrorEvent>(event)) failed = true;
      if (const auto *done = std::get_if<tessera::core::CompleteEvent>(&event)) {
        if (done->successful == 0) failed = true;
      }
    };
    tessera::app::StreamEmitter emitter(orchestrator);
    if (!input_path.empty()) {
      emitter.stream_single(input_path, sink);
    } else {
      emitter.stream_folder(folder_path, cfg.extension, cfg.max_images, sink);
    }
    return failed ? 1 : 0;
  }

  if (!input_path.empty()) {
    auto result = orchestrator.run_single(input_path);
    if (!result) {
      std::cerr << "Error: " << tessera::core::describe(result.error()) << "\n";
      return 1;
    }
    if (!result->ok()) {
      std::cerr << "Error: " << tessera::core::describe(result->outcome.error()) << "\n";
      return 1;
    }
    std::cout << *result->outcome << "\n";
    return 0;
  }

  std::vector<std::string> images;
  try {
    images = tessera::vision::list_images(folder_path, cfg.extension);
  } catch (const std::filesystem::filesystem_error &e) {
    std::cerr << "Cannot list " << folder_path << ": " << e.what() << "\n";
    return 1;
  }

  PrintObserver observer;
  auto summary = orchestrator.run(images, cfg.max_images, &observer);
  if (!summary) {
    std::cerr << "Error: " << tessera::core::describe(summary.error()) << "\n";
    return 1;
  }
  std::cout << "found=" << summary->total_discovered << " attempted=" << summary->total_attempted
            << " successful=" << summary->success_count << " failed=" << summary->failure_count
            << "\n";
  return 0;
}
