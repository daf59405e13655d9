#include <tessera/core/error.hpp>
#include <tessera/core/item_result.hpp>
#include <tessera/core/logging.hpp>
#include <tessera/core/stream_event.hpp>
#include <gtest/gtest.h>

namespace tc = tessera::core;

TEST(Error, DescribeIncludesCodeAndMessage) {
  tc::Error e{tc::ErrorCode::FileNotFound, "image file not found: /tmp/x.jpg"};
  EXPECT_EQ(tc::describe(e), "FileNotFound: image file not found: /tmp/x.jpg");
  EXPECT_EQ(tc::describe(tc::Error{tc::ErrorCode::EmptyBatch, ""}), "EmptyBatch");
}

TEST(Error, CodeNames) {
  EXPECT_EQ(tc::to_string(tc::ErrorCode::OutOfMemory), "OutOfMemory");
  EXPECT_EQ(tc::to_string(tc::ErrorCode::TotalBatchFailure), "TotalBatchFailure");
  EXPECT_EQ(tc::to_string(tc::ErrorCode::ResourceLoadFailed), "ResourceLoadFailed");
}

TEST(Error, InternalConsistencyErrorIsLogicError) {
  EXPECT_THROW(throw tc::InternalConsistencyError("tile count"), std::logic_error);
}

TEST(ItemResult, StatusFollowsOutcome) {
  tc::ItemResult ok{"a.jpg", std::string("a cat"), 1.0};
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(ok.status(), tc::ItemStatus::Success);
  EXPECT_EQ(tc::to_string(ok.status()), "success");

  tc::ItemResult failed{"b.jpg", std::unexpected(tc::Error{tc::ErrorCode::InvalidImage, "bad"}),
                        0.5};
  EXPECT_FALSE(failed.ok());
  EXPECT_EQ(tc::to_string(failed.status()), "error");
}

TEST(StreamEvent, TypeTags) {
  EXPECT_EQ(tc::event_type(tc::MetadataEvent{}), "metadata");
  EXPECT_EQ(tc::event_type(tc::StartEvent{}), "start");
  EXPECT_EQ(tc::event_type(tc::ProcessingEvent{}), "processing");
  EXPECT_EQ(tc::event_type(tc::ResultEvent{}), "result");
  EXPECT_EQ(tc::event_type(tc::CompleteEvent{}), "complete");
  EXPECT_EQ(tc::event_type(tc::ErrorEvent{}), "error");
}

TEST(Logging, SetLevel) {
  EXPECT_TRUE(tc::set_log_level("debug"));
  EXPECT_EQ(tc::get_logger()->level(), spdlog::level::debug);
  EXPECT_TRUE(tc::set_log_level("off"));
  EXPECT_FALSE(tc::set_log_level("verbose"));
  EXPECT_EQ(tc::get_logger()->level(), spdlog::level::off);
  EXPECT_TRUE(tc::set_log_level("info"));
}
