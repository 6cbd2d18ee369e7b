#include <gtest/gtest.h>

#include <algorithm>

#include <nlohmann/json.hpp>

#include "attic/archive/uploader.hpp"
#include "fakes.hpp"
#include "test_helpers.hpp"

namespace attic::archive {

namespace {

constexpr const char* kApiBase = "https://chat.example.test/api/v10/";

bool hasHeader(const test::RecordedRequest& request, const std::string& prefix) {
  return std::any_of(request.headers.begin(), request.headers.end(),
                     [&](const std::string& h) { return h.rfind(prefix, 0) == 0; });
}

}  // namespace

class ChatUploaderTest : public test::TempDirTest {
 protected:
  void SetUp() override {
    TempDirTest::SetUp();
    file_ = writeFile("photo.jpg", "jpegbytes");
    request_ = UploadRequest{file_, "photo.jpg"};
    destination_.channel_id = "100";
    bot_.bot_token = "secret-token";
  }

  ChatUploader uploader() { return ChatUploader(kApiBase, http_.factory()); }

  test::FakeHttp http_;
  std::filesystem::path file_;
  UploadRequest request_;
  RouteDecision destination_;
  Credentials bot_;
};

TEST_F(ChatUploaderTest, BotUploadPostsToChannelMessages) {
  http_.enqueue(200, test::providerMessageJson("m1", "100", "a1", "photo.jpg", 9));

  auto receipt = uploader().upload(request_, destination_, bot_, false);
  ASSERT_OK(receipt);
  EXPECT_EQ(receipt->message_id, "m1");
  EXPECT_EQ(receipt->channel_id, "100");
  ASSERT_EQ(receipt->attachments.size(), 1u);
  EXPECT_EQ(receipt->attachments[0].id, "a1");

  auto requests = http_.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url, "https://chat.example.test/api/v10/channels/100/messages");
  EXPECT_TRUE(hasHeader(requests[0], "Authorization: Bot secret-token"));

  const auto& fields = requests[0].fields;
  ASSERT_EQ(fields.size(), 2u);
  EXPECT_EQ(fields[0].name, "payload_json");
  auto payload = nlohmann::json::parse(fields[0].value);
  EXPECT_EQ(payload["attachments"][0]["filename"], "photo.jpg");
  EXPECT_EQ(fields[1].name, "files[0]");
  EXPECT_EQ(fields[1].file_path, std::optional<std::filesystem::path>(file_));
  EXPECT_EQ(fields[1].filename, "photo.jpg");
}

TEST_F(ChatUploaderTest, ThreadTakesPrecedenceOverChannel) {
  destination_.thread_id = "200";
  http_.enqueue(200, test::providerMessageJson("m2", "200", "a2", "photo.jpg", 9));

  auto receipt = uploader().upload(request_, destination_, bot_, false);
  ASSERT_OK(receipt);
  EXPECT_EQ(receipt->channel_id, "200");
  EXPECT_EQ(http_.requests()[0].url, "https://chat.example.test/api/v10/channels/200/messages");
}

TEST_F(ChatUploaderTest, WebhookFallbackWaitsForMessage) {
  destination_.thread_id = "200";
  destination_.webhook_url = "https://hooks.example.test/w/1/tok";
  http_.enqueue(200, test::providerMessageJson("m3", "200", "a3", "photo.jpg", 9));

  auto receipt = uploader().upload(request_, destination_, Credentials{}, true);
  ASSERT_OK(receipt);

  auto requests = http_.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].url, "https://hooks.example.test/w/1/tok?wait=true&thread_id=200");
  EXPECT_FALSE(hasHeader(requests[0], "Authorization"));
}

TEST_F(ChatUploaderTest, FallbackUsesCredentialWebhookWhenRouteHasNone) {
  Credentials creds;
  creds.webhook_url = "https://hooks.example.test/w/2/tok";
  http_.enqueue(200, test::providerMessageJson("m4", "100", "a4", "photo.jpg", 9));

  ASSERT_OK(uploader().upload(request_, destination_, creds, true));
  EXPECT_EQ(http_.requests()[0].url, "https://hooks.example.test/w/2/tok?wait=true");
}

TEST_F(ChatUploaderTest, MissingCredentialsAreConfigErrors) {
  EXPECT_ERROR(uploader().upload(request_, destination_, Credentials{}, true),
               ErrorCode::kConfigError);
  EXPECT_ERROR(uploader().upload(request_, destination_, Credentials{}, false),
               ErrorCode::kConfigError);
  EXPECT_EQ(http_.requestCount(), 0u);
}

TEST_F(ChatUploaderTest, ProviderAndTransportFailuresAreUploadFailures) {
  http_.enqueue(413, R"({"message": "Request entity too large", "code": 40005})");
  auto rejected = uploader().upload(request_, destination_, bot_, false);
  ASSERT_FALSE(rejected.has_value());
  EXPECT_EQ(rejected.error().code(), ErrorCode::kUploadFailure);
  EXPECT_NE(rejected.error().message().find("413"), std::string::npos);

  http_.enqueueError(ErrorCode::kNetworkError, "connection reset");
  EXPECT_ERROR(uploader().upload(request_, destination_, bot_, false), ErrorCode::kUploadFailure);

  http_.enqueue(200, "not json");
  EXPECT_ERROR(uploader().upload(request_, destination_, bot_, false), ErrorCode::kUploadFailure);

  http_.enqueue(200, R"({"id": "m5", "channel_id": "100", "attachments": []})");
  EXPECT_ERROR(uploader().upload(request_, destination_, bot_, false), ErrorCode::kUploadFailure);
}

TEST_F(ChatUploaderTest, AsyncUploadResolves) {
  http_.enqueue(200, test::providerMessageJson("m6", "100", "a6", "photo.jpg", 9));
  ChatUploader chat = uploader();
  auto future = chat.uploadAsync(request_, destination_, bot_, false);
  auto receipt = future.get();
  ASSERT_OK(receipt);
  EXPECT_EQ(receipt->message_id, "m6");
}

}  // namespace attic::archive
