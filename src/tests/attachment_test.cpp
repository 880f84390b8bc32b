#include <gtest/gtest.h>
#include <filesystem>
#include "store/attachment.hpp"
#include "test_utils.hpp"

using namespace biowiki::store;

class AttachmentTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path page_dir;

  void SetUp() override {
    quiet_logging();
    test_dir = make_test_dir("attachment_test");
    page_dir = test_dir / "WebHome";
    std::filesystem::create_directories(page_dir);
  }

  void TearDown() override {
    if (std::filesystem::exists(test_dir)) {
      std::filesystem::remove_all(test_dir);
    }
  }

  static AttachmentData upload(const std::string& name, const std::string& encoded) {
    return AttachmentData{name, encoded};
  }
};

// ---- BASE64 ----

TEST_F(AttachmentTest, DecodesPaddedBase64) {
  EXPECT_EQ(decode_base64(""), "");
  EXPECT_EQ(decode_base64("Zg=="), "f");
  EXPECT_EQ(decode_base64("Zm8="), "fo");
  EXPECT_EQ(decode_base64("Zm9v"), "foo");
  EXPECT_EQ(decode_base64("aGVsbG8gd29ybGQ="), "hello world");
}

TEST_F(AttachmentTest, DecodesBinaryBytes) {
  // 0x89 'P' 'N' 'G' 0x00 0xff
  std::string expected("\x89PNG\x00\xff", 6);
  EXPECT_EQ(decode_base64("iVBORwD/"), expected);
}

TEST_F(AttachmentTest, RejectsMalformedBase64) {
  try {
    decode_base64("abc");
    FAIL() << "Expected AttachmentError";
  } catch (const AttachmentError& e) {
    EXPECT_EQ(e.kind(), AttachmentErrorKind::BASE64_ERROR);
  }
  EXPECT_THROW(decode_base64("!!!!"), AttachmentError);
  EXPECT_THROW(decode_base64("Zm9v Zg=="), AttachmentError);
}

TEST_F(AttachmentTest, RejectsMisplacedPadding) {
  for (const std::string encoded : {"====", "Q===", "QQ=A", "AB=C", "Zg==Zm9v"}) {
    try {
      decode_base64(encoded);
      FAIL() << "Expected AttachmentError for " << encoded;
    } catch (const AttachmentError& e) {
      EXPECT_EQ(e.kind(), AttachmentErrorKind::BASE64_ERROR) << encoded;
    }
  }
}

TEST_F(AttachmentTest, SaveWithMisplacedPaddingWritesNothing) {
  AttachmentStore attachments(page_dir);
  EXPECT_THROW(attachments.save(upload("photo.png", "QQ=A")), AttachmentError);
  EXPECT_FALSE(std::filesystem::exists(page_dir / ATTACHMENTS_DIRECTORY / "photo.png"));
}

// ---- FILE NAMES ----

TEST_F(AttachmentTest, UploadNameValidation) {
  EXPECT_TRUE(is_valid_upload_name("photo.png"));
  EXPECT_TRUE(is_valid_upload_name("data_1.csv"));

  EXPECT_FALSE(is_valid_upload_name("noext"));
  EXPECT_FALSE(is_valid_upload_name(".png"));
  EXPECT_FALSE(is_valid_upload_name("photo."));
  EXPECT_FALSE(is_valid_upload_name("archive.tar.gz"));
  EXPECT_FALSE(is_valid_upload_name("../evil.png"));
  EXPECT_FALSE(is_valid_upload_name("my photo.png"));
  EXPECT_FALSE(is_valid_upload_name(""));
}

TEST_F(AttachmentTest, StoredNameValidation) {
  EXPECT_TRUE(is_valid_stored_name("photo.png"));
  EXPECT_TRUE(is_valid_stored_name("archive.tar.gz"));
  EXPECT_TRUE(is_valid_stored_name("my photo.png"));

  EXPECT_FALSE(is_valid_stored_name("noext"));
  EXPECT_FALSE(is_valid_stored_name("../evil.png"));
  EXPECT_FALSE(is_valid_stored_name(""));
}

TEST_F(AttachmentTest, ParseUploadBody) {
  auto incoming = AttachmentData::parse(R"({"file_name": "photo.png", "encoded_data": "Zm9v"})");
  EXPECT_EQ(incoming.file_name, "photo.png");
  EXPECT_EQ(incoming.encoded_data, "Zm9v");
  EXPECT_TRUE(incoming.is_file_name_valid());
  EXPECT_EQ(incoming.data(), "foo");
}

TEST_F(AttachmentTest, ParseRejectsBadBodies) {
  for (const std::string body : {"not json", "{}", R"({"file_name": "a.png"})", R"({"file_name": 1, "encoded_data": ""})"}) {
    try {
      AttachmentData::parse(body);
      FAIL() << "Expected AttachmentError for " << body;
    } catch (const AttachmentError& e) {
      EXPECT_EQ(e.kind(), AttachmentErrorKind::JSON_ERROR) << body;
    }
  }
}

// ---- MIME TYPES ----

TEST_F(AttachmentTest, MimeTypeFromExtension) {
  const std::vector<std::pair<std::string, std::string>> cases = {
    {"a.png", "image/png"},
    {"a.PNG", "image/png"},
    {"a.jpg", "image/jpeg"},
    {"a.jpeg", "image/jpeg"},
    {"a.JPEG", "image/jpeg"},
    {"a.gif", "application/octet-stream"},
    {"a.txt", "application/octet-stream"}
  };

  for (const auto& [name, mime] : cases) {
    write_file(test_dir / name, "x");
    EXPECT_EQ(Attachment::open(test_dir / name).mime_type(), mime) << name;
  }
}

// ---- ATTACHMENT STORE ----

TEST_F(AttachmentTest, ListWithoutDirectoryIsEmpty) {
  AttachmentStore attachments(page_dir);
  EXPECT_TRUE(attachments.list().empty());
  EXPECT_FALSE(std::filesystem::exists(page_dir / ATTACHMENTS_DIRECTORY));
}

TEST_F(AttachmentTest, SaveOpenRoundTrip) {
  AttachmentStore attachments(page_dir);
  attachments.save(upload("photo.png", "iVBORwD/"));

  auto stubs = attachments.list();
  ASSERT_EQ(stubs.size(), 1u);
  EXPECT_EQ(stubs[0].file_name, "photo.png");

  Attachment attachment = attachments.open("photo.png");
  EXPECT_EQ(attachment.data(), std::string("\x89PNG\x00\xff", 6));
  EXPECT_EQ(attachment.mime_type(), "image/png");
  EXPECT_EQ(attachment.file_name(), "photo.png");
}

TEST_F(AttachmentTest, SaveOverwritesExistingFile) {
  AttachmentStore attachments(page_dir);
  attachments.save(upload("notes.txt", "Zm9v"));
  attachments.save(upload("notes.txt", "YmFy"));

  EXPECT_EQ(attachments.list().size(), 1u);
  EXPECT_EQ(attachments.open("notes.txt").data(), "bar");
}

TEST_F(AttachmentTest, SaveWithBadBase64WritesNothing) {
  AttachmentStore attachments(page_dir);
  EXPECT_THROW(attachments.save(upload("photo.png", "abc")), AttachmentError);
  EXPECT_FALSE(std::filesystem::exists(page_dir / ATTACHMENTS_DIRECTORY / "photo.png"));
}

TEST_F(AttachmentTest, ListSkipsFilesWithoutExtension) {
  std::filesystem::create_directories(page_dir / ATTACHMENTS_DIRECTORY);
  write_file(page_dir / ATTACHMENTS_DIRECTORY / "README", "x");
  write_file(page_dir / ATTACHMENTS_DIRECTORY / "image.jpg", "x");
  std::filesystem::create_directories(page_dir / ATTACHMENTS_DIRECTORY / "sub.dir");

  AttachmentStore attachments(page_dir);
  auto stubs = attachments.list();
  ASSERT_EQ(stubs.size(), 1u);
  EXPECT_EQ(stubs[0].file_name, "image.jpg");
}

TEST_F(AttachmentTest, OpenMissingOrInvalid) {
  AttachmentStore attachments(page_dir);
  for (const std::string name : {"missing.png", "noext", "../page.json"}) {
    try {
      attachments.open(name);
      FAIL() << "Expected AttachmentError for " << name;
    } catch (const AttachmentError& e) {
      EXPECT_EQ(e.kind(), AttachmentErrorKind::NOT_FOUND) << name;
    }
  }
}

TEST_F(AttachmentTest, StubSerializesFileName) {
  nlohmann::json j = AttachmentStub{"photo.png"};
  EXPECT_EQ(j, nlohmann::json::parse(R"({"file_name": "photo.png"})"));
}
