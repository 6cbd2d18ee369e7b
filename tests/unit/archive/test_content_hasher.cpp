#include <gtest/gtest.h>

#include "attic/archive/content_hasher.hpp"
#include "test_helpers.hpp"

namespace attic::archive {

class ContentHasherTest : public test::TempDirTest {};

TEST_F(ContentHasherTest, KnownDigests) {
  auto empty = ContentHasher::computeHash(writeFile("empty.bin", ""));
  ASSERT_OK(empty);
  EXPECT_EQ(*empty, "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

  auto abc = ContentHasher::computeHash(writeFile("abc.txt", "abc"));
  ASSERT_OK(abc);
  EXPECT_EQ(*abc, "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_F(ContentHasherTest, SameBytesSameHashAcrossChunks) {
  std::string content(ContentHasher::kChunkSize * 2 + 17, '\0');
  for (std::size_t i = 0; i < content.size(); ++i) {
    content[i] = static_cast<char>(i * 31);
  }
  auto first = ContentHasher::computeHash(writeFile("one.bin", content));
  auto second = ContentHasher::computeHash(writeFile("renamed-copy.dat", content));
  ASSERT_OK(first);
  ASSERT_OK(second);
  EXPECT_EQ(*first, *second);
  EXPECT_TRUE(ContentHasher::isValidHash(*first));

  content.back() ^= 1;
  auto changed = ContentHasher::computeHash(writeFile("changed.bin", content));
  ASSERT_OK(changed);
  EXPECT_NE(*changed, *first);
}

TEST_F(ContentHasherTest, MissingFileFails) {
  EXPECT_FALSE(ContentHasher::computeHash(temp_dir_ / "missing").has_value());
}

TEST(ContentHasherFormat, ValidatesHexDigest) {
  EXPECT_TRUE(ContentHasher::isValidHash(std::string(64, 'a')));
  EXPECT_FALSE(ContentHasher::isValidHash(std::string(64, 'A')));
  EXPECT_FALSE(ContentHasher::isValidHash(std::string(63, 'a')));
  EXPECT_FALSE(ContentHasher::isValidHash(std::string(64, 'g')));
  EXPECT_FALSE(ContentHasher::isValidHash(""));
}

}  // namespace attic::archive
