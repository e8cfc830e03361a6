#include "util/flags.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(Flags, DefaultsAreValid) {
  std::string error_msg;
  EXPECT_TRUE(util::ValidateFlags(&error_msg)) << error_msg;
}

// NOLINTNEXTLINE
TEST(Flags, RejectsNegativeValues) {
  gflags::FlagSaver saver;
  std::string error_msg;
  FLAGS_max_concurrent_jobs = -1;
  EXPECT_FALSE(util::ValidateFlags(&error_msg));
  EXPECT_THAT(error_msg, HasSubstr("--max_concurrent_jobs"));

  FLAGS_max_concurrent_jobs = 10;
  FLAGS_max_history = -1;
  EXPECT_FALSE(util::ValidateFlags(&error_msg));
  EXPECT_THAT(error_msg, HasSubstr("--max_history"));

  FLAGS_max_history = 0;
  EXPECT_TRUE(util::ValidateFlags(&error_msg));
  FLAGS_max_security_events = -5;
  EXPECT_FALSE(util::ValidateFlags(&error_msg));
  EXPECT_THAT(error_msg, HasSubstr("got -5"));
}

// NOLINTNEXTLINE
TEST(Flags, RejectsZeroLimits) {
  gflags::FlagSaver saver;
  std::string error_msg;
  FLAGS_default_timeout_ms = 0;
  EXPECT_FALSE(util::ValidateFlags(&error_msg));
  EXPECT_THAT(error_msg, HasSubstr("--default_timeout_ms"));
}

}  // namespace
