#include <gtest/gtest.h>

#include <algorithm>

#include "attic/archive/archiver.hpp"
#include "attic/archive/content_hasher.hpp"
#include "attic/archive/route_table.hpp"
#include "attic/archive/sqlite_manifest.hpp"
#include "fakes.hpp"
#include "test_helpers.hpp"

namespace attic::archive {

namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

constexpr const char* kRoutes = R"(
routes:
  images:
    public:
      channel_id: "c-img"
      webhook_url: https://hooks.example.test/w/img/tok
    private:
      channel_id: "c-img-p"
      thread_id: "t-9"
      webhook_url: https://hooks.example.test/w/imgp/tok
  videos:
    public:
      channel_id: "c-vid"
  docs:
    public:
      channel_id: "c-doc"
)";

}  // namespace

class ArchiverTest : public test::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();

    auto table = RouteTable::parse(kRoutes);
    ASSERT_OK(table);
    routes_ = std::make_shared<RouteTable>(std::move(*table));

    manifest_ = std::make_shared<SqliteManifest>(temp_dir_ / "manifest.db");
    ASSERT_OK(manifest_->initialize());

    codec_ = std::make_shared<test::LinearImageCodec>(150 * 1024);
    uploader_ = std::make_shared<test::RecordingUploader>();

    options_.enabled = true;
    options_.bot_token = "bot-token";
  }

  std::unique_ptr<Archiver> makeArchiver(std::shared_ptr<Uploader> uploader = nullptr) {
    ArchiverServices services;
    services.policy = std::make_shared<PolicyEngine>(config::PolicySettings{}, nullptr);
    services.router = std::make_shared<ChannelRouter>(routes_);
    services.limits = std::make_shared<SizeLimitDetector>(env_);
    services.compressor = std::make_shared<Compressor>(codec_, temp_dir_ / "staging");
    services.manifest = manifest_;
    services.uploader = uploader ? std::move(uploader) : uploader_;
    services.rehydrator = std::make_shared<Rehydrator>("https://chat.example.test/api", http_.factory());
    services.cleanup = std::make_shared<CleanupManager>();
    return std::make_unique<Archiver>(options_, std::move(services));
  }

  std::size_t stagingFiles() const {
    auto staging = temp_dir_ / "staging";
    if (!std::filesystem::exists(staging)) {
      return 0;
    }
    return static_cast<std::size_t>(std::distance(std::filesystem::directory_iterator(staging),
                                                  std::filesystem::directory_iterator()));
  }

  std::uint64_t recordCount() {
    auto stats = manifest_->stats();
    EXPECT_TRUE(stats.has_value());
    return stats ? stats->records : 0;
  }

  util::MapEnvironment env_;
  ArchiverOptions options_;
  std::shared_ptr<RouteTable> routes_;
  std::shared_ptr<SqliteManifest> manifest_;
  std::shared_ptr<test::LinearImageCodec> codec_;
  std::shared_ptr<test::RecordingUploader> uploader_;
  test::FakeHttp http_;
};

TEST_F(ArchiverTest, SmallFileUploadsOnceThenHitsCache) {
  auto archiver = makeArchiver();
  const std::string bytes = "small png bytes";
  auto first_path = writeFile("first.png", bytes);

  ArchiveMeta meta;
  meta.tags = {"Demo", "demo", " cats "};
  auto first = archiver->archiveFile(first_path, meta);
  ASSERT_OK(first);
  EXPECT_FALSE(first->cache_hit);
  EXPECT_FALSE(first->quality.has_value());
  EXPECT_EQ(first->record.channel_id, "c-img");
  EXPECT_EQ(first->record.filename, "first.png");
  EXPECT_EQ(first->record.media_type, "images");
  EXPECT_EQ(first->record.tags, (std::vector<std::string>{"demo", "cats"}));
  EXPECT_EQ(first->record.size, bytes.size());
  EXPECT_EQ(first->record.attachment_ids, (std::vector<std::string>{"a1"}));
  ASSERT_EQ(uploader_->calls.size(), 1u);
  EXPECT_FALSE(uploader_->calls[0].use_fallback);
  EXPECT_EQ(uploader_->calls[0].credentials.bot_token, "bot-token");
  EXPECT_FALSE(std::filesystem::exists(first_path));

  auto expected_hash = ContentHasher::computeHash(writeFile("probe.bin", bytes));
  ASSERT_OK(expected_hash);
  EXPECT_EQ(first->record.content_hash, *expected_hash);

  // Same bytes under another name: no second upload
  auto second_path = writeFile("copy-of-first.png", bytes);
  auto second = archiver->archiveFile(second_path, ArchiveMeta{});
  ASSERT_OK(second);
  EXPECT_TRUE(second->cache_hit);
  EXPECT_EQ(second->record.message_id, first->record.message_id);
  EXPECT_EQ(second->record.filename, "first.png");
  EXPECT_EQ(uploader_->calls.size(), 1u);
  EXPECT_FALSE(std::filesystem::exists(second_path));
  EXPECT_EQ(recordCount(), 1u);
}

TEST_F(ArchiverTest, KeepOriginalLeavesSourceInPlace) {
  auto archiver = makeArchiver();
  auto path = writeFile("keep.pdf", "%PDF-1.7");
  ArchiveMeta meta;
  meta.keep_original = true;
  ASSERT_OK(archiver->archiveFile(path, meta));
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ArchiverTest, OversizedImageIsReencodedUnderLimit) {
  auto archiver = makeArchiver();
  auto path = writeFile("huge.png", std::string(15 * kMiB, 'p'));

  auto outcome = archiver->archiveFile(path, ArchiveMeta{});
  ASSERT_OK(outcome);
  ASSERT_TRUE(outcome->quality.has_value());
  EXPECT_EQ(*outcome->quality, 65);
  EXPECT_EQ(outcome->record.filename, "huge.jpg");
  EXPECT_EQ(outcome->record.compression.original_size, 15 * kMiB);
  EXPECT_LE(outcome->record.compression.final_size, 10 * kMiB);
  EXPECT_EQ(outcome->record.size, outcome->record.compression.final_size);

  ASSERT_EQ(uploader_->calls.size(), 1u);
  EXPECT_EQ(uploader_->calls[0].request.filename, "huge.jpg");
  EXPECT_LE(uploader_->calls[0].size_on_disk, 10 * kMiB);

  // Intermediate and original are both gone
  EXPECT_EQ(stagingFiles(), 0u);
  EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ArchiverTest, PerTargetLimitDrivesCompression) {
  env_.set("ARCHIVER_LIMIT_C_IMG_BOT", std::to_string(8 * kMiB));
  auto archiver = makeArchiver();
  auto path = writeFile("huge.png", std::string(15 * kMiB, 'p'));

  auto outcome = archiver->archiveFile(path, ArchiveMeta{});
  ASSERT_OK(outcome);
  // 150 KiB * 50 = 7.3 MiB is the first fit under 8 MiB
  EXPECT_EQ(*outcome->quality, 50);
}

TEST_F(ArchiverTest, DeniedFileReportsEveryReasonAndUploadsNothing) {
  auto archiver = makeArchiver();
  ArchiveMeta meta;
  meta.size_limit = 1024;
  auto path = writeFile("setup.exe", std::string(4096, 'x'));

  auto outcome = archiver->archiveFile(path, meta);
  ASSERT_FALSE(outcome.has_value());
  EXPECT_EQ(outcome.error().code(), ErrorCode::kPolicyDenied);
  const auto& reasons = outcome.error().details();
  ASSERT_EQ(reasons.size(), 2u);
  EXPECT_TRUE(std::any_of(reasons.begin(), reasons.end(),
                          [](const std::string& r) { return r.find(".exe") != std::string::npos; }));
  EXPECT_TRUE(std::any_of(reasons.begin(), reasons.end(),
                          [](const std::string& r) { return r.find("exceeds") != std::string::npos; }));

  EXPECT_TRUE(uploader_->calls.empty());
  EXPECT_EQ(recordCount(), 0u);
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ArchiverTest, DisabledArchiverDoesNothing) {
  options_.enabled = false;
  auto archiver = makeArchiver();
  auto path = writeFile("a.png", "x");
  EXPECT_ERROR(archiver->archiveFile(path, ArchiveMeta{}), ErrorCode::kArchiverDisabled);
  EXPECT_TRUE(uploader_->calls.empty());
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ArchiverTest, MissingRouteIsConfigError) {
  auto archiver = makeArchiver();
  EXPECT_ERROR(archiver->archiveFile(writeFile("song.mp3", "ID3"), ArchiveMeta{}),
               ErrorCode::kConfigError);
  EXPECT_TRUE(uploader_->calls.empty());
}

TEST_F(ArchiverTest, OversizedVideoIsUncompressible) {
  auto archiver = makeArchiver();
  auto path = writeFile("clip.mp4", std::string(11 * kMiB, 'v'));
  EXPECT_ERROR(archiver->archiveFile(path, ArchiveMeta{}), ErrorCode::kSizeLimitUncompressible);
  EXPECT_TRUE(uploader_->calls.empty());
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ArchiverTest, FailedUploadRecordsNothingAndCleansIntermediate) {
  uploader_->fail = true;
  auto archiver = makeArchiver();
  auto path = writeFile("huge.png", std::string(15 * kMiB, 'p'));

  EXPECT_ERROR(archiver->archiveFile(path, ArchiveMeta{}), ErrorCode::kUploadFailure);
  EXPECT_EQ(uploader_->calls.size(), 1u);
  EXPECT_EQ(recordCount(), 0u);
  EXPECT_EQ(stagingFiles(), 0u);
  EXPECT_TRUE(std::filesystem::exists(path));
}

TEST_F(ArchiverTest, NoCredentialsIsConfigError) {
  options_.bot_token.clear();
  options_.allow_fallback = false;
  auto archiver = makeArchiver();
  EXPECT_ERROR(archiver->archiveFile(writeFile("a.png", "x"), ArchiveMeta{}),
               ErrorCode::kConfigError);
  EXPECT_TRUE(uploader_->calls.empty());
}

TEST_F(ArchiverTest, WebhookFallbackUsesRouteWebhookAndWebhookLimit) {
  options_.bot_token.clear();
  options_.allow_fallback = true;
  env_.set("ARCHIVER_WEBHOOK_LIMIT_BYTES", std::to_string(8 * kMiB));
  auto archiver = makeArchiver();
  auto path = writeFile("huge.png", std::string(15 * kMiB, 'p'));

  auto outcome = archiver->archiveFile(path, ArchiveMeta{});
  ASSERT_OK(outcome);
  EXPECT_EQ(*outcome->quality, 50);
  ASSERT_EQ(uploader_->calls.size(), 1u);
  EXPECT_TRUE(uploader_->calls[0].use_fallback);
  EXPECT_EQ(uploader_->calls[0].credentials.webhook_url, "https://hooks.example.test/w/img/tok");
}

TEST_F(ArchiverTest, RehydrateReturnsFreshUrl) {
  auto archiver = makeArchiver();
  auto outcome = archiver->archiveFile(writeFile("cat.png", "meow"), ArchiveMeta{});
  ASSERT_OK(outcome);

  http_.enqueue(200, test::providerMessageJson(outcome->record.message_id, "c-img", "a1",
                                               "cat.png", 4, "https://cdn.example.test/cat?ex=2"));
  auto link = archiver->rehydrate(outcome->record.content_hash);
  ASSERT_OK(link);
  EXPECT_EQ(link->url, "https://cdn.example.test/cat?ex=2");
  EXPECT_EQ(link->filename, "cat.png");
  EXPECT_EQ(link->content_hash, outcome->record.content_hash);

  auto requests = http_.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url,
            "https://chat.example.test/api/channels/c-img/messages/" + outcome->record.message_id);
}

TEST_F(ArchiverTest, WebhookArchiveRehydratesThroughTheSameWebhookAndThread) {
  options_.bot_token.clear();
  options_.allow_fallback = true;
  options_.default_webhook = "https://hooks.example.test/w/default/tok2";
  auto archiver =
      makeArchiver(std::make_shared<ChatUploader>("https://chat.example.test/api", http_.factory()));

  http_.enqueue(200, test::providerMessageJson("m-1", "t-9", "a-1", "cat.png", 4));
  ArchiveMeta meta;
  meta.visibility = "private";
  auto outcome = archiver->archiveFile(writeFile("cat.png", "meow"), meta);
  ASSERT_OK(outcome);
  EXPECT_EQ(outcome->record.channel_id, "t-9");

  http_.enqueue(200, test::providerMessageJson("m-1", "t-9", "a-1", "cat.png", 4,
                                               "https://cdn.example.test/cat?ex=3"));
  auto link = archiver->rehydrate(outcome->record.content_hash);
  ASSERT_OK(link);
  EXPECT_EQ(link->url, "https://cdn.example.test/cat?ex=3");

  auto requests = http_.requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].url, "https://hooks.example.test/w/imgp/tok?wait=true&thread_id=t-9");
  EXPECT_EQ(requests[1].method, "GET");
  EXPECT_EQ(requests[1].url, "https://hooks.example.test/w/imgp/tok/messages/m-1?thread_id=t-9");
}

TEST_F(ArchiverTest, WebhookRehydrationFallsBackToDefaultWebhook) {
  options_.bot_token.clear();
  options_.allow_fallback = true;
  options_.default_webhook = "https://hooks.example.test/w/default/tok2";
  auto archiver =
      makeArchiver(std::make_shared<ChatUploader>("https://chat.example.test/api", http_.factory()));

  http_.enqueue(200, test::providerMessageJson("m-2", "c-doc", "a-2", "notes.pdf", 3));
  auto outcome = archiver->archiveFile(writeFile("notes.pdf", "pdf"), ArchiveMeta{});
  ASSERT_OK(outcome);

  http_.enqueue(200, test::providerMessageJson("m-2", "c-doc", "a-2", "notes.pdf", 3));
  ASSERT_OK(archiver->rehydrate(outcome->record.content_hash));

  auto requests = http_.requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].url, "https://hooks.example.test/w/default/tok2?wait=true");
  EXPECT_EQ(requests[1].url, "https://hooks.example.test/w/default/tok2/messages/m-2");
}

TEST_F(ArchiverTest, RehydrateUnknownHashIsNotFound) {
  auto archiver = makeArchiver();
  EXPECT_ERROR(archiver->rehydrate(std::string(64, 'f')), ErrorCode::kNotFound);
  EXPECT_EQ(http_.requestCount(), 0u);
}

TEST_F(ArchiverTest, TagsAndSearchGoThroughManifest) {
  auto archiver = makeArchiver();
  auto outcome = archiver->archiveFile(writeFile("dog.png", "woof"), ArchiveMeta{});
  ASSERT_OK(outcome);

  auto updated = archiver->updateTags(outcome->record.content_hash, {"Pets", "dogs"});
  ASSERT_OK(updated);
  EXPECT_EQ(updated->tags, (std::vector<std::string>{"pets", "dogs"}));

  auto results = archiver->searchTag("dog", 10, 0);
  ASSERT_OK(results);
  ASSERT_EQ(results->size(), 1u);
  EXPECT_EQ((*results)[0].filename, "dog.png");
}

TEST(ArchiverConstruction, RequiresEveryCollaborator) {
  EXPECT_THROW(Archiver archiver(ArchiverOptions{}, ArchiverServices{}), std::invalid_argument);
}

}  // namespace attic::archive
