#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "store/store_error.hpp"

namespace biowiki {
namespace store {

constexpr const char* ATTACHMENTS_DIRECTORY = "attachments";

constexpr const char* MIME_OCTET_STREAM = "application/octet-stream";
constexpr const char* MIME_IMAGE_PNG = "image/png";
constexpr const char* MIME_IMAGE_JPEG = "image/jpeg";

struct AttachmentStub {
  std::string file_name;
};

void to_json(nlohmann::json& j, const AttachmentStub& stub);


// Upload payload: a file name plus its base64 encoded bytes
struct AttachmentData {
  std::string file_name;
  std::string encoded_data;

  // Parses the request body, throws AttachmentError(JSON_ERROR)
  static AttachmentData parse(const std::string& body);

  // Decoded bytes, throws AttachmentError(BASE64_ERROR)
  std::string data() const;

  // Strict check used before accepting an upload
  bool is_file_name_valid() const;
};


// ---- FILE NAME VALIDATION ----
// Names accepted from clients: word characters, a dot, word characters
bool is_valid_upload_name(const std::string& file_name);
// Names accepted for files already on disk: any stem, a dot, any extension
bool is_valid_stored_name(const std::string& file_name);

// Standard base64 with padding; throws AttachmentError(BASE64_ERROR)
std::string decode_base64(const std::string& encoded);


class Attachment {
public:
  // Fails with NOT_FOUND when nothing exists at path
  static Attachment open(const std::filesystem::path& path);

  // Reads the whole file into memory
  std::string data() const;
  // Content type derived from the file extension only
  std::string mime_type() const;

  const std::filesystem::path& path() const { return path_; }
  std::string file_name() const { return path_.filename().string(); }

private:
  explicit Attachment(const std::filesystem::path& path) : path_(path) {}

  std::filesystem::path path_;
};


// Attachments of a single page, kept under <page>/attachments/
class AttachmentStore {
public:
  // ---- CONSTRUCTOR ----
  explicit AttachmentStore(const std::filesystem::path& page_dir);


  // ---- OPERATIONS ----
  // Empty when the attachments directory does not exist
  std::vector<AttachmentStub> list() const;
  Attachment open(const std::string& file_name) const;
  // Decodes the payload and writes or overwrites the file.
  // The file name must have been validated by the caller.
  void save(const AttachmentData& incoming) const;

private:
  // ---- PARAMETERS ----
  std::filesystem::path directory_;
};

} // namespace store
} // namespace biowiki
