#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "store/store_error.hpp"
#include "store/attachment.hpp"
#include "store/content_store.hpp"

namespace biowiki {
namespace store {

constexpr const char* PAGE_FILENAME = "page.json";
constexpr const char* VERSIONS_DIRECTORY = "versions";
constexpr const char* VERSION_EXTENSION = ".json";

// The versionable unit of a page
struct PageDetail {
  std::string name;
  std::string title;
  std::string content;
  std::string parent;

  // Throws PageError(JSON_ERROR)
  static PageDetail parse(const std::string& data);
  // Pretty printed JSON; these exact bytes are what gets hashed
  std::string serialize() const;

  bool operator==(const PageDetail& other) const {
    return name == other.name && title == other.title
        && content == other.content && parent == other.parent;
  }
  bool operator!=(const PageDetail& other) const { return !(*this == other); }
};

void to_json(nlohmann::json& j, const PageDetail& detail);
void from_json(const nlohmann::json& j, PageDetail& detail);

struct PageStub {
  std::string name;
};

struct VersionStub {
  std::string hash;
};

void to_json(nlohmann::json& j, const PageStub& stub);
void to_json(nlohmann::json& j, const VersionStub& stub);

// True for a single, non-empty path component other than "." and ".."
bool is_valid_name(const std::string& name);


class Page {
public:
  // ---- CONSTRUCTION ----
  // Binds a detail to a directory without touching the filesystem
  Page(const std::filesystem::path& directory, PageDetail detail);

  // Loads an existing page. The directory name must equal the stored name,
  // otherwise PageError(NAME_MISMATCH).
  static Page open(const std::filesystem::path& directory);


  // ---- PERSISTENCE ----
  // OVERWRITE_ERROR if the page directory already exists
  void create() const;
  // NOT_FOUND if the page directory does not exist
  void update() const;


  // ---- VERSIONS ----
  std::vector<VersionStub> list_versions() const;
  PageDetail get_version(const std::string& hash) const;


  // ---- ATTACHMENTS ----
  std::vector<AttachmentStub> list_attachments() const;
  Attachment get_attachment(const std::string& file_name) const;
  void save_attachment(const AttachmentData& incoming) const;


  // ---- GETTERS ----
  const std::filesystem::path& directory() const { return directory_; }
  const PageDetail& detail() const { return detail_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path directory_;
  PageDetail detail_;


  // ---- WRITE SUPPORT ----
  // Overwrites page.json and appends a version if the content is new
  void write() const;
  std::filesystem::path page_path() const;
  ContentStore versions() const;
  AttachmentStore attachments() const;
};

} // namespace store
} // namespace biowiki
