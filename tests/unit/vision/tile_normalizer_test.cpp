#include <tessera/vision/aspect_ratio_planner.hpp>
#include <tessera/vision/tile_normalizer.hpp>
#include <tessera/vision/tiler.hpp>
#include <gtest/gtest.h>
#include <array>
#include <stdexcept>
#include <vector>

namespace tv = tessera::vision;
namespace tc = tessera::core;

namespace {

tc::Frame solid(std::uint32_t w, std::uint32_t h, tc::PixelFormat format,
                std::vector<std::uint8_t> value) {
  std::vector<std::byte> buf;
  buf.reserve(static_cast<std::size_t>(w) * h * value.size());
  for (std::size_t i = 0; i < static_cast<std::size_t>(w) * h; ++i) {
    for (auto v : value) buf.push_back(std::byte{v});
  }
  return tc::Frame(w, h, format, std::move(buf));
}

tv::NormalizationConfig config(std::uint32_t edge, tc::TensorDType dtype) {
  tv::NormalizationConfig c;
  c.edge = edge;
  c.dtype = dtype;
  return c;
}

}  // namespace

TEST(TileNormalizer, SolidRedMatchesImageNetFormula) {
  tv::TileNormalizer normalizer(config(16, tc::TensorDType::Float32));
  // BGR8 red.
  auto tensor = normalizer.normalize(solid(32, 32, tc::PixelFormat::BGR8, {0, 0, 255}));
  ASSERT_TRUE(tensor.has_value());
  EXPECT_EQ(tensor->shape(), (std::vector<std::int64_t>{3, 16, 16}));
  EXPECT_EQ(tensor->dtype(), tc::TensorDType::Float32);

  const auto values = tv::tensor_to_floats(*tensor);
  const std::size_t plane = 16 * 16;
  ASSERT_EQ(values.size(), 3 * plane);
  EXPECT_NEAR(values[0], (1.f - 0.485f) / 0.229f, 1e-4);
  EXPECT_NEAR(values[plane], (0.f - 0.456f) / 0.224f, 1e-4);
  EXPECT_NEAR(values[2 * plane], (0.f - 0.406f) / 0.225f, 1e-4);
  EXPECT_NEAR(values[plane - 1], values[0], 1e-5);
}

TEST(TileNormalizer, HalfPrecisionOutput) {
  tv::TileNormalizer normalizer(config(8, tc::TensorDType::Float16));
  auto tensor = normalizer.normalize(solid(8, 8, tc::PixelFormat::RGB8, {128, 128, 128}));
  ASSERT_TRUE(tensor.has_value());
  EXPECT_EQ(tensor->dtype(), tc::TensorDType::Float16);
  EXPECT_EQ(tensor->size_bytes(), 3u * 8 * 8 * 2);
  const auto values = tv::tensor_to_floats(*tensor);
  EXPECT_NEAR(values[0], (128.f / 255.f - 0.485f) / 0.229f, 1e-2);
  EXPECT_NEAR(values[64], (128.f / 255.f - 0.456f) / 0.224f, 1e-2);
  EXPECT_NEAR(values[128], (128.f / 255.f - 0.406f) / 0.225f, 1e-2);
}

TEST(TileNormalizer, GrayscaleReplicatesChannels) {
  tv::TileNormalizer normalizer(config(8, tc::TensorDType::Float32));
  auto tensor = normalizer.normalize(solid(8, 8, tc::PixelFormat::Grayscale8, {255}));
  ASSERT_TRUE(tensor.has_value());
  const auto values = tv::tensor_to_floats(*tensor);
  EXPECT_NEAR(values[0], (1.f - 0.485f) / 0.229f, 1e-4);
  EXPECT_NEAR(values[64], (1.f - 0.456f) / 0.224f, 1e-4);
  EXPECT_NEAR(values[128], (1.f - 0.406f) / 0.225f, 1e-4);
}

TEST(TileNormalizer, BatchStacksInOrder) {
  tv::TileNormalizer normalizer(config(8, tc::TensorDType::Float32));
  std::vector<tc::Frame> tiles{solid(8, 8, tc::PixelFormat::RGB8, {0, 0, 0}),
                               solid(8, 8, tc::PixelFormat::RGB8, {255, 255, 255}),
                               solid(8, 8, tc::PixelFormat::RGB8, {0, 0, 0})};
  auto batch = normalizer.normalize_batch(tiles);
  ASSERT_TRUE(batch.has_value());
  EXPECT_EQ(batch->shape(), (std::vector<std::int64_t>{3, 3, 8, 8}));
  const auto values = tv::tensor_to_floats(*batch);
  const std::size_t tile = 3 * 8 * 8;
  EXPECT_NEAR(values[0], -0.485f / 0.229f, 1e-4);
  EXPECT_NEAR(values[tile], (1.f - 0.485f) / 0.229f, 1e-4);
  EXPECT_NEAR(values[2 * tile], -0.485f / 0.229f, 1e-4);
}

TEST(TileNormalizer, RejectsEmptyTile) {
  tv::TileNormalizer normalizer(config(8, tc::TensorDType::Float16));
  auto tensor = normalizer.normalize(tc::Frame{});
  ASSERT_FALSE(tensor.has_value());
  EXPECT_EQ(tensor.error().code, tc::ErrorCode::InvalidImage);

  std::vector<tc::Frame> tiles{solid(8, 8, tc::PixelFormat::RGB8, {1, 2, 3}), tc::Frame{}};
  auto batch = normalizer.normalize_batch(tiles);
  ASSERT_FALSE(batch.has_value());
  EXPECT_EQ(batch.error().code, tc::ErrorCode::InvalidImage);
}

TEST(TileNormalizer, RejectsInvalidConfig) {
  EXPECT_THROW(tv::TileNormalizer(config(0, tc::TensorDType::Float16)), std::invalid_argument);
  auto c = config(8, tc::TensorDType::Float16);
  c.std = {0.229f, 0.f, 0.225f};
  EXPECT_THROW(tv::TileNormalizer{c}, std::invalid_argument);
}

TEST(TileNormalizer, DenormalizedTilesRecoverSolidColour) {
  // BGR8 pixel; the tensor is RGB.
  const std::uint8_t b = 30, g = 120, r = 200;
  const tc::Frame image = solid(900, 450, tc::PixelFormat::BGR8, {b, g, r});
  const std::array<float, 3> rgb{r, g, b};

  tv::TilingConfig tiling;
  tiling.max_tiles = 6;
  tiling.tile_edge = 32;
  tv::AspectRatioPlanner planner(tiling);
  auto plan = planner.plan(image.width(), image.height());
  ASSERT_TRUE(plan.has_value());
  ASSERT_TRUE(plan->thumbnail);
  auto tiles = tv::Tiler{}.tile(image, *plan);
  ASSERT_TRUE(tiles.has_value());
  ASSERT_EQ(tiles->size(), plan->expected_tiles());

  for (const auto dtype : {tc::TensorDType::Float32, tc::TensorDType::Float16}) {
    tv::TileNormalizer normalizer(config(32, dtype));
    const auto& cfg = normalizer.config();
    for (std::size_t t = 0; t < tiles->size(); ++t) {
      auto tensor = normalizer.normalize((*tiles)[t]);
      ASSERT_TRUE(tensor.has_value());
      const auto values = tv::tensor_to_floats(*tensor);
      const std::size_t plane = 32 * 32;
      ASSERT_EQ(values.size(), 3 * plane);
      for (std::size_t c = 0; c < 3; ++c) {
        double sum = 0.0;
        for (std::size_t i = 0; i < plane; ++i) {
          sum += (values[c * plane + i] * cfg.std[c] + cfg.mean[c]) * 255.0;
        }
        EXPECT_NEAR(sum / plane, rgb[c], 1.0) << "tile " << t << " channel " << c;
      }
    }
  }
}
