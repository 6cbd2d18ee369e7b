#include <gtest/gtest.h>

#include "attic/archive/cleanup_manager.hpp"
#include "test_helpers.hpp"

namespace attic::archive {

class CleanupManagerTest : public test::TempDirTest {};

TEST_F(CleanupManagerTest, RemoveIsIdempotent) {
  CleanupManager cleanup;
  auto path = writeFile("staged.jpg", "x");
  EXPECT_OK(cleanup.remove(path));
  EXPECT_FALSE(std::filesystem::exists(path));
  EXPECT_OK(cleanup.remove(path));
  EXPECT_OK(cleanup.remove(""));
}

TEST_F(CleanupManagerTest, RemoveAllHandlesDuplicatePaths) {
  CleanupManager cleanup;
  auto a = writeFile("a.png", "a");
  auto b = writeFile("b.jpg", "b");
  auto a_again = temp_dir_ / "." / "a.png";

  EXPECT_EQ(cleanup.removeAll({a, b, a_again}), 0u);
  EXPECT_FALSE(std::filesystem::exists(a));
  EXPECT_FALSE(std::filesystem::exists(b));
}

TEST_F(CleanupManagerTest, RemoveAllReportsFailures) {
  CleanupManager cleanup;
  // A non-empty directory cannot be removed as a file
  auto dir = temp_dir_ / "busy";
  std::filesystem::create_directories(dir / "child");
  EXPECT_EQ(cleanup.removeAll({dir}), 1u);
  EXPECT_TRUE(std::filesystem::exists(dir));
}

}  // namespace attic::archive
