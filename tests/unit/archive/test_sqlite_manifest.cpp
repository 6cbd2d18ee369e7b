#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

#include "attic/archive/sqlite_manifest.hpp"
#include "test_helpers.hpp"

namespace attic::archive {

namespace {

ArchiveRecord makeRecord(const std::string& hash, const std::string& filename,
                         std::vector<std::string> tags, std::uint64_t size = 100,
                         const std::string& media_type = "images") {
  ArchiveRecord record;
  record.content_hash = hash;
  record.sha256 = hash;
  record.message_id = "msg-" + filename;
  record.channel_id = "chan";
  record.attachment_ids = {"att-" + filename};
  record.filename = filename;
  record.size = size;
  record.media_type = media_type;
  record.visibility = "public";
  record.tags = std::move(tags);
  record.compression = {size, size};
  record.created_at = std::chrono::system_clock::now();
  return record;
}

std::string hashOf(char c) {
  return std::string(64, c);
}

}  // namespace

class SqliteManifestTest : public test::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    manifest_ = std::make_unique<SqliteManifest>(temp_dir_ / "db" / "manifest.db");
    ASSERT_OK(manifest_->initialize());
  }

  std::unique_ptr<SqliteManifest> manifest_;
};

TEST_F(SqliteManifestTest, LookupMissingReturnsEmpty) {
  auto found = manifest_->lookup(hashOf('a'));
  ASSERT_OK(found);
  EXPECT_FALSE(found->has_value());
}

TEST_F(SqliteManifestTest, RecordThenLookupRoundTrips) {
  auto record = makeRecord(hashOf('a'), "cat.png", {"pets", "cute"});
  record.tenant = "acme";
  record.compression = {5000, 1200};

  auto result = manifest_->record(record);
  ASSERT_OK(result);
  EXPECT_TRUE(result->inserted);

  auto found = manifest_->lookup(hashOf('a'));
  ASSERT_OK(found);
  ASSERT_TRUE(found->has_value());
  const auto& stored = **found;
  EXPECT_EQ(stored.message_id, "msg-cat.png");
  EXPECT_EQ(stored.attachment_ids, (std::vector<std::string>{"att-cat.png"}));
  EXPECT_EQ(stored.tenant, std::optional<std::string>("acme"));
  EXPECT_FALSE(stored.workspace.has_value());
  EXPECT_EQ(stored.tags, (std::vector<std::string>{"pets", "cute"}));
  EXPECT_EQ(stored.compression.original_size, 5000u);
  EXPECT_EQ(stored.compression.final_size, 1200u);
}

TEST_F(SqliteManifestTest, SecondRecordForSameHashKeepsFirst) {
  ASSERT_OK(manifest_->record(makeRecord(hashOf('b'), "first.png", {})));

  auto again = manifest_->record(makeRecord(hashOf('b'), "second.png", {}));
  ASSERT_OK(again);
  EXPECT_FALSE(again->inserted);
  EXPECT_EQ(again->record.filename, "first.png");

  auto stats = manifest_->stats();
  ASSERT_OK(stats);
  EXPECT_EQ(stats->records, 1u);
}

TEST_F(SqliteManifestTest, ConcurrentRecordsInsertOnce) {
  std::vector<std::future<Result<RecordResult>>> futures;
  for (int i = 0; i < 8; ++i) {
    futures.push_back(std::async(std::launch::async, [this, i]() {
      SqliteManifest other(manifest_->path());
      return other.record(makeRecord(hashOf('c'), "racer-" + std::to_string(i) + ".png", {}));
    }));
  }

  int inserted = 0;
  std::string winner;
  for (auto& future : futures) {
    auto result = future.get();
    ASSERT_OK(result);
    if (result->inserted) {
      ++inserted;
      winner = result->record.filename;
    }
  }
  EXPECT_EQ(inserted, 1);

  auto found = manifest_->lookup(hashOf('c'));
  ASSERT_OK(found);
  ASSERT_TRUE(found->has_value());
  EXPECT_EQ((*found)->filename, winner);
}

TEST_F(SqliteManifestTest, UpdateTagsNormalizes) {
  ASSERT_OK(manifest_->record(makeRecord(hashOf('d'), "doc.pdf", {"old"})));

  auto updated = manifest_->updateTags(hashOf('d'), {" Work ", "work", "Q3,plan", ""});
  ASSERT_OK(updated);
  EXPECT_EQ(updated->tags, (std::vector<std::string>{"work", "q3plan"}));

  EXPECT_ERROR(manifest_->updateTags(hashOf('e'), {"x"}), ErrorCode::kNotFound);
}

TEST_F(SqliteManifestTest, SearchMatchesSubstringNewestFirst) {
  auto older = makeRecord(hashOf('1'), "older.png", {"holiday-2023"});
  older.created_at -= std::chrono::hours(24);
  ASSERT_OK(manifest_->record(older));
  ASSERT_OK(manifest_->record(makeRecord(hashOf('2'), "newer.png", {"holiday-2024"})));
  ASSERT_OK(manifest_->record(makeRecord(hashOf('3'), "work.png", {"work"})));

  auto results = manifest_->searchTag("holiday", 10, 0);
  ASSERT_OK(results);
  ASSERT_EQ(results->size(), 2u);
  EXPECT_EQ((*results)[0].filename, "newer.png");
  EXPECT_EQ((*results)[1].filename, "older.png");

  auto paged = manifest_->searchTag("holiday", 1, 1);
  ASSERT_OK(paged);
  ASSERT_EQ(paged->size(), 1u);
  EXPECT_EQ((*paged)[0].filename, "older.png");
}

TEST_F(SqliteManifestTest, SearchTreatsWildcardsLiterally) {
  ASSERT_OK(manifest_->record(makeRecord(hashOf('4'), "a.png", {"100%"})));
  ASSERT_OK(manifest_->record(makeRecord(hashOf('5'), "b.png", {"1000"})));

  auto results = manifest_->searchTag("0%", 10, 0);
  ASSERT_OK(results);
  ASSERT_EQ(results->size(), 1u);
  EXPECT_EQ((*results)[0].filename, "a.png");

  auto underscore = manifest_->searchTag("_", 10, 0);
  ASSERT_OK(underscore);
  EXPECT_TRUE(underscore->empty());
}

TEST_F(SqliteManifestTest, StatsGroupByMediaType) {
  ASSERT_OK(manifest_->record(makeRecord(hashOf('6'), "a.png", {}, 100, "images")));
  ASSERT_OK(manifest_->record(makeRecord(hashOf('7'), "b.png", {}, 200, "images")));
  ASSERT_OK(manifest_->record(makeRecord(hashOf('8'), "c.mp4", {}, 1000, "videos")));

  auto stats = manifest_->stats();
  ASSERT_OK(stats);
  EXPECT_EQ(stats->records, 3u);
  EXPECT_EQ(stats->total_bytes, 1300u);
  EXPECT_EQ(stats->by_media_type.at("images"), 2u);
  EXPECT_EQ(stats->by_media_type.at("videos"), 1u);
}

}  // namespace attic::archive
