#pragma once

#include <gtest/gtest.h>

#include <filesystem>
#include <string>

namespace attic::test {

// Test fixture base class for tests that need temporary directories
class TempDirTest : public ::testing::Test {
 protected:
  void SetUp() override;
  void TearDown() override;

  // Binary-safe file under temp_dir_
  std::filesystem::path writeFile(const std::string& name, const std::string& content);

  std::filesystem::path temp_dir_;
};

// Generate random string for testing
std::string randomString(size_t length);

std::string readFile(const std::filesystem::path& path);

// Assertion helpers
#define EXPECT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define ASSERT_OK(result)                                                                          \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    ASSERT_TRUE(r.has_value()) << "Expected success but got error: " << r.error().message();     \
  } while (0)

#define EXPECT_ERROR(result, expected_code)                                                        \
  do {                                                                                             \
    auto&& r = (result);                                                                           \
    EXPECT_FALSE(r.has_value()) << "Expected error but got success";                              \
    if (!r.has_value()) {                                                                          \
      EXPECT_EQ(r.error().code(), expected_code);                                                  \
    }                                                                                              \
  } while (0)

}  // namespace attic::test
