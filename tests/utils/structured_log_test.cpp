/**
 * @file structured_log_test.cpp
 * @brief Unit tests for StructuredLog line rendering
 */

#include "utils/structured_log.h"

#include <gtest/gtest.h>

using namespace rvfstore::utils;

namespace {

class StructuredLogTest : public ::testing::Test {
 protected:
  void SetUp() override { saved_ = StructuredLog::GetFormat(); }
  void TearDown() override { StructuredLog::SetFormat(saved_); }

  LogFormat saved_ = LogFormat::JSON;
};

}  // namespace

TEST_F(StructuredLogTest, JsonKeepsFieldOrder) {
  StructuredLog::SetFormat(LogFormat::JSON);
  std::string line = StructuredLog()
                         .Event("migration")
                         .Field("source", "memory.db")
                         .Field("kv", static_cast<uint64_t>(3))
                         .Field("dry_run", false)
                         .Message("done")
                         .Build();
  EXPECT_EQ(line, R"({"event":"migration","message":"done","source":"memory.db","kv":3,"dry_run":false})");
}

TEST_F(StructuredLogTest, JsonEscapesStrings) {
  StructuredLog::SetFormat(LogFormat::JSON);
  std::string line = StructuredLog().Event("corrupt_segment").Field("reason", "bad \"crc\"\n").Build();
  EXPECT_EQ(line, R"({"event":"corrupt_segment","reason":"bad \"crc\"\n"})");
}

TEST_F(StructuredLogTest, TextQuotesOnlyWhenNeeded) {
  StructuredLog::SetFormat(LogFormat::TEXT);
  std::string line = StructuredLog()
                         .Event("storage_error")
                         .Field("filepath", "/tmp/store.rvf")
                         .Field("error", "rename failed: No space")
                         .Field("attempt", static_cast<int64_t>(-1))
                         .Build();
  EXPECT_EQ(line, R"(event=storage_error filepath=/tmp/store.rvf error="rename failed: No space" attempt=-1)");
}

TEST_F(StructuredLogTest, RepeatedFieldOverwrites) {
  StructuredLog::SetFormat(LogFormat::TEXT);
  std::string line = StructuredLog().Field("status", "in-progress").Field("status", "complete").Build();
  EXPECT_EQ(line, "status=complete");
}
