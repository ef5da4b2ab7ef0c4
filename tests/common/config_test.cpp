/**
 * @file config_test.cpp
 * @brief Unit tests for option validation and Status
 */

#include <gtest/gtest.h>

#include <string>

#include "common/config.hpp"
#include "tessera/engine.hpp"
#include "tessera/status.hpp"

namespace tessera {
namespace {

TEST(ConfigTest, DefaultsAreValid) {
  EngineOptions options;
  EXPECT_TRUE(validate_options(options).ok());
  EXPECT_EQ(options.worker_count, config::kDefaultWorkerCount);
  EXPECT_EQ(options.abort_storm_threshold, config::kDefaultAbortStormThreshold);
}

TEST(ConfigTest, ZeroWorkers) {
  EngineOptions options;
  options.worker_count = 0;

  Status status = validate_options(options);
  EXPECT_EQ(status.code(), StatusCode::kInvalidArgument);
  EXPECT_NE(status.message().find("worker_count"), std::string_view::npos);
}

TEST(ConfigTest, TooManyWorkers) {
  EngineOptions options;
  options.worker_count = config::kMaxWorkers + 1;
  EXPECT_EQ(validate_options(options).code(), StatusCode::kInvalidArgument);

  options.worker_count = config::kMaxWorkers;
  EXPECT_TRUE(validate_options(options).ok());
}

TEST(ConfigTest, ZeroAbortStormThreshold) {
  EngineOptions options;
  options.abort_storm_threshold = 0;
  EXPECT_EQ(validate_options(options).code(), StatusCode::kInvalidArgument);
}

TEST(StatusTest, ToString) {
  EXPECT_EQ(Status::Ok().to_string(), "OK");
  EXPECT_EQ(Status::Internal().to_string(), "Internal");
  EXPECT_EQ(Status::InvalidArgument("bad").to_string(), "InvalidArgument: bad");
  EXPECT_EQ(Status::ResourceExhausted("threads").to_string(), "ResourceExhausted: threads");
}

TEST(StatusTest, Queries) {
  Status ok;
  EXPECT_TRUE(ok.ok());
  EXPECT_TRUE(static_cast<bool>(ok));
  EXPECT_FALSE(ok.is_error());

  Status internal = Status::Internal("broken");
  EXPECT_TRUE(internal.is_error());
  EXPECT_TRUE(internal.is_internal());
  EXPECT_EQ(internal.code(), StatusCode::kInternal);
  EXPECT_EQ(internal.message(), "broken");
}

}  // namespace
}  // namespace tessera
