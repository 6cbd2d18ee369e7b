#include <gtest/gtest.h>

#include "attic/util/multipart.hpp"
#include "test_helpers.hpp"

namespace attic::util {

namespace {

std::string formBody(const std::string& boundary) {
  std::string body;
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"meta\"\r\n\r\n";
  body += R"({"tags": ["demo"]})";
  body += "\r\n--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"file\"; filename=\"photo.png\"\r\n";
  body += "Content-Type: image/png\r\n\r\n";
  body += std::string("\x89PNG\r\n\x00\x01", 8);
  body += "\r\n--" + boundary + "--\r\n";
  return body;
}

}  // namespace

TEST(MultipartTest, ExtractsBoundary) {
  auto boundary = multipartBoundary("multipart/form-data; boundary=----abc123");
  ASSERT_OK(boundary);
  EXPECT_EQ(*boundary, "----abc123");

  auto quoted = multipartBoundary("Multipart/Form-Data; boundary=\"x y\"");
  ASSERT_OK(quoted);
  EXPECT_EQ(*quoted, "x y");
}

TEST(MultipartTest, RejectsOtherContentTypes) {
  EXPECT_ERROR(multipartBoundary("application/json"), ErrorCode::kInvalidArgument);
  EXPECT_ERROR(multipartBoundary("multipart/form-data"), ErrorCode::kInvalidArgument);
}

TEST(MultipartTest, ParsesFieldsAndBinaryFile) {
  auto parts = parseMultipart(formBody("BOUNDARY"), "BOUNDARY");
  ASSERT_OK(parts);
  ASSERT_EQ(parts->size(), 2u);

  const FormPart* meta = findPart(*parts, "meta");
  ASSERT_NE(meta, nullptr);
  EXPECT_FALSE(meta->filename.has_value());
  EXPECT_EQ(meta->body, R"({"tags": ["demo"]})");

  const FormPart* file = findPart(*parts, "file");
  ASSERT_NE(file, nullptr);
  ASSERT_TRUE(file->filename.has_value());
  EXPECT_EQ(*file->filename, "photo.png");
  EXPECT_EQ(file->content_type, "image/png");
  EXPECT_EQ(file->body, std::string("\x89PNG\r\n\x00\x01", 8));

  EXPECT_EQ(findPart(*parts, "missing"), nullptr);
}

TEST(MultipartTest, RejectsTruncatedBody) {
  std::string body = formBody("B");
  body.resize(body.size() / 2);
  EXPECT_ERROR(parseMultipart(body, "B"), ErrorCode::kParseError);
  EXPECT_ERROR(parseMultipart("no delimiter here", "B"), ErrorCode::kParseError);
}

}  // namespace attic::util
