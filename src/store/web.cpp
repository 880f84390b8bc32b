#include "store/web.hpp"
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace store {

namespace {

// Names of the immediate subdirectories of path
std::vector<std::string> list_directories(const std::filesystem::path& path, std::error_code& ec) {
  std::vector<std::string> names;
  std::filesystem::directory_iterator it(path, ec);
  if (ec) {
    return names;
  }
  for (const auto& entry : it) {
    std::error_code entry_ec;
    if (entry.is_directory(entry_ec)) {
      names.push_back(entry.path().filename().string());
    }
  }
  return names;
}

} // namespace

void to_json(nlohmann::json& j, const WebStub& stub) {
  j = nlohmann::json{{"name", stub.name}};
}


//==============================================
// WEB
//==============================================

Web::Web(const std::string& name, const std::filesystem::path& directory)
  : name_(name)
  , directory_(directory) {
}

std::vector<PageStub> Web::list_pages() const {
  std::error_code ec;
  std::vector<std::string> names = list_directories(directory_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Web: Failed to list pages of " << name_ << ": " << ec.message();
    throw WebError(WebErrorKind::IO_ERROR, ec.message());
  }

  std::vector<PageStub> stubs;
  stubs.reserve(names.size());
  for (auto& name : names) {
    stubs.push_back(PageStub{std::move(name)});
  }
  return stubs;
}

Page Web::open_page(const std::string& name) const {
  if (!is_valid_name(name)) {
    throw PageError(PageErrorKind::NOT_FOUND, name);
  }
  return Page::open(directory_ / name);
}

Page Web::new_page(const PageDetail& detail) const {
  return Page(directory_ / detail.name, detail);
}


//==============================================
// WEB COLLECTION
//==============================================

WebCollection::WebCollection(const std::filesystem::path& root) : root_(root) {
  BOOST_LOG_TRIVIAL(info) << "Web collection: Serving webs from " << root_.string();
}

std::vector<WebStub> WebCollection::list() const {
  std::error_code ec;
  std::vector<std::string> names = list_directories(root_, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Web collection: Failed to read root " << root_.string() << ": " << ec.message();
    throw WebError(WebErrorKind::IO_ERROR, ec.message());
  }

  std::vector<WebStub> stubs;
  stubs.reserve(names.size());
  for (auto& name : names) {
    stubs.push_back(WebStub{std::move(name)});
  }
  return stubs;
}

std::optional<Web> WebCollection::get(const std::string& name) const {
  if (!is_valid_name(name)) {
    return std::nullopt;
  }
  std::filesystem::path path = root_ / name;
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    return std::nullopt;
  }
  return Web(name, path);
}

Web WebCollection::create(const std::string& name) const {
  if (!is_valid_name(name)) {
    throw WebError(WebErrorKind::INVALID_NAME, name);
  }

  std::filesystem::path path = root_ / name;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    throw WebError(WebErrorKind::OVERWRITE_ERROR, name);
  }

  std::filesystem::create_directory(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Web collection: Failed to create web " << name << ": " << ec.message();
    throw WebError(WebErrorKind::IO_ERROR, ec.message());
  }

  BOOST_LOG_TRIVIAL(info) << "Web collection: Created web " << name;
  return Web(name, path);
}

} // namespace store
} // namespace biowiki
