#include "store/page.hpp"
#include <fstream>
#include <sstream>
#include <utility>
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace store {

namespace {

bool is_valid_utf8(const std::string& s) {
  size_t i = 0;
  while (i < s.size()) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    size_t extra;
    if (c < 0x80) {
      extra = 0;
    } else if ((c & 0xE0) == 0xC0 && c >= 0xC2) {
      extra = 1;
    } else if ((c & 0xF0) == 0xE0) {
      extra = 2;
    } else if ((c & 0xF8) == 0xF0 && c <= 0xF4) {
      extra = 3;
    } else {
      return false;
    }
    if (extra > 0 && i + extra >= s.size()) {
      return false;
    }
    // Second byte range rules out overlongs, surrogates and code points past U+10FFFF
    if (extra > 0) {
      unsigned char next = static_cast<unsigned char>(s[i + 1]);
      unsigned char low = 0x80;
      unsigned char high = 0xBF;
      if (c == 0xE0) {
        low = 0xA0;
      } else if (c == 0xED) {
        high = 0x9F;
      } else if (c == 0xF0) {
        low = 0x90;
      } else if (c == 0xF4) {
        high = 0x8F;
      }
      if (next < low || next > high) {
        return false;
      }
    }
    for (size_t k = 1; k <= extra; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
        return false;
      }
    }
    i += extra + 1;
  }
  return true;
}

PageErrorKind kind_for(const std::error_code& ec) {
  return ec == std::errc::no_such_file_or_directory ? PageErrorKind::NOT_FOUND : PageErrorKind::IO_ERROR;
}

} // namespace


//==============================================
// SERIALIZATION
//==============================================

void to_json(nlohmann::json& j, const PageDetail& detail) {
  j = nlohmann::json{
    {"name", detail.name},
    {"title", detail.title},
    {"content", detail.content},
    {"parent", detail.parent}
  };
}

void from_json(const nlohmann::json& j, PageDetail& detail) {
  j.at("name").get_to(detail.name);
  j.at("title").get_to(detail.title);
  j.at("content").get_to(detail.content);
  detail.parent = j.value("parent", std::string());
}

void to_json(nlohmann::json& j, const PageStub& stub) {
  j = nlohmann::json{{"name", stub.name}};
}

void to_json(nlohmann::json& j, const VersionStub& stub) {
  j = nlohmann::json{{"hash", stub.hash}};
}

PageDetail PageDetail::parse(const std::string& data) {
  try {
    return nlohmann::json::parse(data).get<PageDetail>();
  } catch (const nlohmann::json::exception& e) {
    throw PageError(PageErrorKind::JSON_ERROR, e.what());
  }
}

std::string PageDetail::serialize() const {
  try {
    return nlohmann::json(*this).dump(2);
  } catch (const nlohmann::json::exception& e) {
    throw PageError(PageErrorKind::JSON_ERROR, e.what());
  }
}

bool is_valid_name(const std::string& name) {
  return !name.empty() && name != "." && name != ".."
      && name.find('/') == std::string::npos
      && name.find('\\') == std::string::npos;
}


//==============================================
// CONSTRUCTION
//==============================================

Page::Page(const std::filesystem::path& directory, PageDetail detail)
  : directory_(directory)
  , detail_(std::move(detail)) {
}

Page Page::open(const std::filesystem::path& directory) {
  std::error_code ec;
  if (!std::filesystem::exists(directory, ec)) {
    throw PageError(PageErrorKind::NOT_FOUND, directory.string());
  }
  if (!std::filesystem::is_directory(directory, ec)) {
    throw PageError(PageErrorKind::NOT_DIRECTORY, directory.string());
  }

  std::filesystem::path file_name = directory.filename();
  if (file_name.empty()) {
    throw PageError(PageErrorKind::INVALID_PATH, directory.string());
  }
  std::string expected_name = file_name.string();
  if (!is_valid_utf8(expected_name)) {
    throw PageError(PageErrorKind::UTF8_ERROR);
  }

  std::filesystem::path detail_path = directory / PAGE_FILENAME;
  std::ifstream file(detail_path, std::ios::binary);
  if (!file) {
    if (!std::filesystem::exists(detail_path, ec)) {
      throw PageError(PageErrorKind::NOT_FOUND, detail_path.string());
    }
    throw PageError(PageErrorKind::IO_ERROR, "failed to open " + detail_path.string());
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    throw PageError(PageErrorKind::IO_ERROR, "failed to read " + detail_path.string());
  }

  PageDetail detail = PageDetail::parse(buffer.str());
  if (detail.name != expected_name) {
    BOOST_LOG_TRIVIAL(warning) << "Page: Stored name '" << detail.name
                               << "' does not match directory '" << expected_name << "'";
    throw PageError(PageErrorKind::NAME_MISMATCH, detail.name + " != " + expected_name);
  }

  return Page(directory, std::move(detail));
}


//==============================================
// PERSISTENCE
//==============================================

void Page::create() const {
  std::error_code ec;
  if (std::filesystem::exists(directory_, ec)) {
    throw PageError(PageErrorKind::OVERWRITE_ERROR, directory_.string());
  }
  std::filesystem::create_directory(directory_, ec);
  if (ec) {
    throw PageError(kind_for(ec), "failed to create " + directory_.string() + ": " + ec.message());
  }
  BOOST_LOG_TRIVIAL(info) << "Page: Created page directory " << directory_.string();
  write();
}

void Page::update() const {
  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec)) {
    throw PageError(PageErrorKind::NOT_FOUND, directory_.string());
  }
  write();
}

void Page::write() const {
  const std::string data = detail_.serialize();

  // write main file
  std::filesystem::path target = page_path();
  std::filesystem::path temp_path = target;
  temp_path += ".tmp";
  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw PageError(PageErrorKind::IO_ERROR, "failed to create " + temp_path.string());
    }
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    file.close();
    if (!file) {
      throw PageError(PageErrorKind::IO_ERROR, "failed to write " + temp_path.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    throw PageError(kind_for(ec), "failed to replace " + target.string() + ": " + ec.message());
  }

  // write version file
  try {
    std::string hash = versions().store(data);
    BOOST_LOG_TRIVIAL(debug) << "Page: " << detail_.name << " is at version " << hash;
  } catch (const StoreError& e) {
    throw PageError(PageErrorKind::IO_ERROR, e.what());
  }
}

std::filesystem::path Page::page_path() const {
  return directory_ / PAGE_FILENAME;
}

ContentStore Page::versions() const {
  return ContentStore(directory_ / VERSIONS_DIRECTORY, VERSION_EXTENSION);
}

AttachmentStore Page::attachments() const {
  return AttachmentStore(directory_);
}


//==============================================
// VERSIONS
//==============================================

std::vector<VersionStub> Page::list_versions() const {
  std::vector<VersionStub> stubs;
  try {
    for (auto& hash : versions().keys()) {
      stubs.push_back(VersionStub{std::move(hash)});
    }
  } catch (const StoreError& e) {
    throw PageError(PageErrorKind::IO_ERROR, e.what());
  }
  return stubs;
}

PageDetail Page::get_version(const std::string& hash) const {
  std::optional<std::string> data;
  try {
    data = versions().get(hash);
  } catch (const StoreError& e) {
    throw PageError(PageErrorKind::IO_ERROR, e.what());
  }
  if (!data) {
    throw PageError(PageErrorKind::NOT_FOUND, "version " + hash);
  }
  return PageDetail::parse(*data);
}


//==============================================
// ATTACHMENTS
//==============================================

std::vector<AttachmentStub> Page::list_attachments() const {
  return attachments().list();
}

Attachment Page::get_attachment(const std::string& file_name) const {
  return attachments().open(file_name);
}

void Page::save_attachment(const AttachmentData& incoming) const {
  attachments().save(incoming);
}

} // namespace store
} // namespace biowiki
