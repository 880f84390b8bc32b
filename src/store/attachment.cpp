#include "store/attachment.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace store {

void to_json(nlohmann::json& j, const AttachmentStub& stub) {
  j = nlohmann::json{{"file_name", stub.file_name}};
}


//==============================================
// UPLOAD PAYLOAD
//==============================================

AttachmentData AttachmentData::parse(const std::string& body) {
  try {
    auto j = nlohmann::json::parse(body);
    AttachmentData data;
    data.file_name = j.at("file_name").get<std::string>();
    data.encoded_data = j.at("encoded_data").get<std::string>();
    return data;
  } catch (const nlohmann::json::exception& e) {
    throw AttachmentError(AttachmentErrorKind::JSON_ERROR, e.what());
  }
}

std::string AttachmentData::data() const {
  return decode_base64(encoded_data);
}

bool AttachmentData::is_file_name_valid() const {
  return is_valid_upload_name(file_name);
}


//==============================================
// FILE NAME VALIDATION
//==============================================

bool is_valid_upload_name(const std::string& file_name) {
  static const std::regex UPLOAD_NAME_RE(R"(^\w+\.\w+$)");
  return std::regex_match(file_name, UPLOAD_NAME_RE);
}

bool is_valid_stored_name(const std::string& file_name) {
  static const std::regex STORED_NAME_RE(R"(^.+\..+$)");
  return file_name.find('/') == std::string::npos
      && std::regex_match(file_name, STORED_NAME_RE);
}

std::string decode_base64(const std::string& encoded) {
  if (encoded.empty()) {
    return std::string();
  }
  if (encoded.size() % 4 != 0) {
    throw AttachmentError(AttachmentErrorKind::BASE64_ERROR, "invalid length " + std::to_string(encoded.size()));
  }

  // '=' may only appear as one or two final characters
  const size_t data_end = encoded.find_last_not_of('=') + 1;
  const size_t padding = encoded.size() - data_end;
  if (padding > 2) {
    throw AttachmentError(AttachmentErrorKind::BASE64_ERROR, "invalid padding");
  }
  for (size_t i = 0; i < data_end; ++i) {
    const unsigned char c = static_cast<unsigned char>(encoded[i]);
    if (!std::isalnum(c) && c != '+' && c != '/') {
      throw AttachmentError(AttachmentErrorKind::BASE64_ERROR, "invalid symbol at " + std::to_string(i));
    }
  }

  std::string decoded(encoded.size() / 4 * 3, '\0');
  int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
  if (len < 0) {
    throw AttachmentError(AttachmentErrorKind::BASE64_ERROR, "invalid symbol");
  }

  // EVP_DecodeBlock counts the padding as zero bytes
  decoded.resize(static_cast<size_t>(len) - padding);
  return decoded;
}


//==============================================
// ATTACHMENT
//==============================================

Attachment Attachment::open(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    throw AttachmentError(AttachmentErrorKind::NOT_FOUND, path.filename().string());
  }
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw AttachmentError(AttachmentErrorKind::NOT_FOUND, path.filename().string() + " is not a file");
  }
  return Attachment(path);
}

std::string Attachment::data() const {
  std::ifstream file(path_, std::ios::binary);
  if (!file) {
    throw AttachmentError(AttachmentErrorKind::IO_ERROR, "failed to open " + path_.string());
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw AttachmentError(AttachmentErrorKind::IO_ERROR, "failed to read " + path_.string());
  }
  return buffer.str();
}

std::string Attachment::mime_type() const {
  std::string ext = path_.extension().string();
  if (ext.size() < 2) {
    return MIME_OCTET_STREAM;
  }
  ext.erase(0, 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (ext == "png") {
    return MIME_IMAGE_PNG;
  }
  if (ext == "jpg" || ext == "jpeg") {
    return MIME_IMAGE_JPEG;
  }
  return MIME_OCTET_STREAM;
}


//==============================================
// ATTACHMENT STORE
//==============================================

AttachmentStore::AttachmentStore(const std::filesystem::path& page_dir)
  : directory_(page_dir / ATTACHMENTS_DIRECTORY) {
}

std::vector<AttachmentStub> AttachmentStore::list() const {
  std::vector<AttachmentStub> stubs;

  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec)) {
    return stubs;
  }

  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    throw AttachmentError(AttachmentErrorKind::IO_ERROR, ec.message());
  }

  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec)) {
      continue;
    }
    std::string name = entry.path().filename().string();
    if (is_valid_stored_name(name)) {
      stubs.push_back(AttachmentStub{name});
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Attachment store: Listed " << stubs.size() << " attachments in " << directory_.string();
  return stubs;
}

Attachment AttachmentStore::open(const std::string& file_name) const {
  if (!is_valid_stored_name(file_name)) {
    throw AttachmentError(AttachmentErrorKind::NOT_FOUND, file_name);
  }
  return Attachment::open(directory_ / file_name);
}

void AttachmentStore::save(const AttachmentData& incoming) const {
  std::string bytes = incoming.data();

  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec)) {
    std::filesystem::create_directory(directory_, ec);
    if (ec) {
      throw AttachmentError(AttachmentErrorKind::IO_ERROR, "failed to create " + directory_.string() + ": " + ec.message());
    }
  }

  std::filesystem::path target = directory_ / incoming.file_name;
  std::ofstream file(target, std::ios::binary | std::ios::trunc);
  if (!file) {
    throw AttachmentError(AttachmentErrorKind::IO_ERROR, "failed to create " + target.string());
  }
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    throw AttachmentError(AttachmentErrorKind::IO_ERROR, "failed to write " + target.string());
  }

  BOOST_LOG_TRIVIAL(info) << "Attachment store: Saved " << bytes.size() << " bytes to " << target.string();
}

} // namespace store
} // namespace biowiki
