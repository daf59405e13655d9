#include <tessera/app/batch_orchestrator.hpp>
#include <tessera/app/config.hpp>
#include <tessera/app/inference_resource.hpp>
#include <tessera/app/item_pipeline.hpp>
#include <tessera/app/stream_emitter.hpp>
#include <tessera/core/stream_event.hpp>
#include <tessera/vision/mock_generation_backend.hpp>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

using namespace tessera::core;
using namespace tessera::vision;
using namespace tessera::app;
namespace fs = std::filesystem;

// What an unstripped chat model returns: the turn it was given, then its answer.
constexpr const char* kRawResponse =
    "user\n<image>\nWhat is in this image?\nassistant\nA striped test card.";

class FullPipeline : public ::testing::Test {
 protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("tessera_full_" + std::to_string(::getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(root_);
    fs::create_directories(root_ / "images");
    std::ofstream(root_ / "service.conf") << "backend_type = mock\n"
                                             "model_id = test-vlm\n"
                                             "min_tiles = 1\n"
                                             "max_tiles = 6\n"
                                             "tile_edge = 32\n"
                                             "max_images = 7\n"
                                             "extension = png\n"
                                             "image_dir = "
                                          << (root_ / "images").string() << "\n";
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  void write_image(const std::string& name, int w, int h) {
    cv::Mat mat(h, w, CV_8UC3);
    for (int y = 0; y < h; ++y) {
      mat.row(y).setTo(cv::Scalar(y % 2 ? 255 : 0, 128, 64));
    }
    ASSERT_TRUE(cv::imwrite((root_ / "images" / name).string(), mat));
  }

  ModelLoader mock_loader() {
    return [this](const std::string&) -> std::expected<std::unique_ptr<IGenerationBackend>, Error> {
      auto mock = std::make_unique<MockGenerationBackend>(kRawResponse);
      mock_ = mock.get();
      return mock;
    };
  }

  static ItemPipelineOptions pipeline_options(const ServiceConfig& cfg) {
    ItemPipelineOptions options;
    options.tiling = tiling_config(cfg);
    options.prompt = cfg.prompt;
    options.clean_response = cfg.clean_response;
    options.role_marker = cfg.role_marker;
    return options;
  }

  fs::path root_;
  MockGenerationBackend* mock_{nullptr};
};

}  // namespace

TEST_F(FullPipeline, FolderStreamFromConfig) {
  auto cfg = load_config((root_ / "service.conf").string());
  ASSERT_TRUE(cfg.has_value()) << describe(cfg.error());
  ASSERT_TRUE(validate_config(*cfg).has_value());
  EXPECT_EQ(cfg->tile_edge, 32u);

  // Nine matching files: eight real images of varied shapes plus one corrupt one.
  const int sizes[][2] = {{64, 48}, {100, 30}, {30, 100}, {32, 32},
                          {200, 100}, {17, 9}, {64, 64}, {90, 60}};
  int i = 0;
  for (const auto& s : sizes) write_image("img_" + std::to_string(i++) + ".png", s[0], s[1]);
  std::ofstream(root_ / "images" / "img_2b.png") << "not an image";
  std::ofstream(root_ / "images" / "notes.txt") << "ignored";

  InferenceResource resource(cfg->model_id, mock_loader());
  const ItemPipeline pipeline(pipeline_options(*cfg));
  BatchOrchestrator orchestrator(resource, pipeline);
  StreamEmitter emitter(orchestrator);

  std::ostringstream out;
  NdjsonEventWriter writer(out);
  emitter.stream_folder(cfg->image_dir, cfg->extension, cfg->max_images, writer.sink());

  std::istringstream lines(out.str());
  std::vector<nlohmann::json> events;
  for (std::string line; std::getline(lines, line);) events.push_back(nlohmann::json::parse(line));

  // metadata, 7 x (start, result), complete
  ASSERT_EQ(events.size(), 16u);
  EXPECT_EQ(events.front()["type"], "metadata");
  EXPECT_EQ(events.front()["total_found"], 9);
  EXPECT_EQ(events.front()["to_process"], 7);

  // Sorted listing puts img_2b.png fourth: metadata, then start/result pairs.
  const auto& corrupt = events[8];
  EXPECT_EQ(corrupt["type"], "result");
  EXPECT_EQ(corrupt["status"], "error");
  EXPECT_EQ(corrupt["error_code"], "InvalidImage");
  EXPECT_EQ(fs::path(corrupt["image_path"].get<std::string>()).filename().string(), "img_2b.png");

  const auto& first = events[2];
  EXPECT_EQ(first["status"], "success");
  EXPECT_EQ(first["description"], "A striped test card.");

  const auto& done = events.back();
  EXPECT_EQ(done["type"], "complete");
  EXPECT_EQ(done["processed"], 7);
  EXPECT_EQ(done["successful"], 6);
  EXPECT_EQ(done["failed"], 1);

  ASSERT_NE(mock_, nullptr);
  EXPECT_EQ(mock_->call_count(), 6u);
  EXPECT_EQ(mock_->last_prompt(), "What is in this image?");
  EXPECT_EQ(resource.load_count(), 1u);
}

TEST_F(FullPipeline, RawResponseWhenCleaningDisabled) {
  auto cfg = load_config((root_ / "service.conf").string());
  ASSERT_TRUE(cfg.has_value());
  cfg->clean_response = false;
  write_image("only.png", 40, 40);

  InferenceResource resource(cfg->model_id, mock_loader());
  const ItemPipeline pipeline(pipeline_options(*cfg));
  BatchOrchestrator orchestrator(resource, pipeline);

  auto result = orchestrator.run_single((root_ / "images" / "only.png").string());
  ASSERT_TRUE(result.has_value());
  ASSERT_TRUE(result->ok());
  EXPECT_EQ(*result->outcome, kRawResponse);
}

TEST_F(FullPipeline, ReloadBetweenBatches) {
  auto cfg = load_config((root_ / "service.conf").string());
  ASSERT_TRUE(cfg.has_value());
  write_image("a.png", 48, 32);
  write_image("b.png", 32, 48);

  std::vector<std::string> loaded_ids;
  InferenceResource resource(
      cfg->model_id,
      [&](const std::string& id) -> std::expected<std::unique_ptr<IGenerationBackend>, Error> {
        loaded_ids.push_back(id);
        return std::make_unique<MockGenerationBackend>("Described by " + id + ".");
      });
  const ItemPipeline pipeline(pipeline_options(*cfg));
  BatchOrchestrator orchestrator(resource, pipeline);

  const std::vector<std::string> items{(root_ / "images" / "a.png").string(),
                                       (root_ / "images" / "b.png").string()};
  auto first = orchestrator.run(items, cfg->max_images);
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first->results[0].outcome, "Described by test-vlm.");

  ASSERT_TRUE(resource.reload("test-vlm-v2").has_value());
  auto second = orchestrator.run(items, 1);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->total_attempted, 1u);
  EXPECT_EQ(*second->results[0].outcome, "Described by test-vlm-v2.");
  EXPECT_EQ(loaded_ids, (std::vector<std::string>{"test-vlm", "test-vlm-v2"}));
}
