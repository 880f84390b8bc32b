#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "store/store_error.hpp"
#include "store/page.hpp"

namespace biowiki {
namespace store {

struct WebStub {
  std::string name;
};

void to_json(nlohmann::json& j, const WebStub& stub);


// A named directory of pages
class Web {
public:
  Web(const std::string& name, const std::filesystem::path& directory);

  // Immediate subdirectories of the web directory
  std::vector<PageStub> list_pages() const;
  // Opens web_dir/name, see Page::open
  Page open_page(const std::string& name) const;
  // Binds detail to web_dir/detail.name; call create() to persist
  Page new_page(const PageDetail& detail) const;

  const std::string& name() const { return name_; }
  const std::filesystem::path& directory() const { return directory_; }

private:
  std::string name_;
  std::filesystem::path directory_;
};


// Every web under the wiki root directory
class WebCollection {
public:
  // ---- CONSTRUCTOR ----
  explicit WebCollection(const std::filesystem::path& root);


  // ---- OPERATIONS ----
  // Throws WebError(IO_ERROR) when the root cannot be read
  std::vector<WebStub> list() const;
  // A web exists iff root/name is a directory
  std::optional<Web> get(const std::string& name) const;
  // OVERWRITE_ERROR if root/name exists in any form
  Web create(const std::string& name) const;

  const std::filesystem::path& root() const { return root_; }

private:
  // ---- PARAMETERS ----
  std::filesystem::path root_;
};

} // namespace store
} // namespace biowiki
