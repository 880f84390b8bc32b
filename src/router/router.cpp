#include "router/router.hpp"
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace router {

namespace {

const char* const ROOT_PATH        = "/";
const char* const WEBS_PATH        = "/webs";
const char* const PAGES_PATH       = "/webs/:web_name/pages";
const char* const PAGE_PATH        = "/webs/:web_name/pages/:page_name";
const char* const ATTACHMENTS_PATH = "/webs/:web_name/pages/:page_name/attachments";
const char* const ATTACHMENT_PATH  = "/webs/:web_name/pages/:page_name/attachments/:attachment_name";
const char* const VERSIONS_PATH    = "/webs/:web_name/pages/:page_name/versions";
const char* const VERSION_PATH     = "/webs/:web_name/pages/:page_name/versions/:version_hash";

std::string take(PathParams& params, const char* name) {
  auto it = params.find(name);
  if (it == params.end()) {
    return std::string();
  }
  std::string value = std::move(it->second);
  params.erase(it);
  return value;
}

} // namespace

const char* to_string(RouteType type) {
  switch (type) {
    case RouteType::ROOT: return "Root";
    case RouteType::LIST_WEBS: return "ListWebs";
    case RouteType::CREATE_WEB: return "CreateWeb";
    case RouteType::LIST_PAGES: return "ListPages";
    case RouteType::CREATE_PAGE: return "CreatePage";
    case RouteType::SHOW_PAGE: return "ShowPage";
    case RouteType::UPDATE_PAGE: return "UpdatePage";
    case RouteType::LIST_ATTACHMENTS: return "ListAttachments";
    case RouteType::CREATE_ATTACHMENT: return "CreateAttachment";
    case RouteType::SERVE_ATTACHMENT: return "ServeAttachment";
    case RouteType::LIST_PAGE_VERSIONS: return "ListPageVersions";
    case RouteType::SHOW_PAGE_VERSION: return "ShowPageVersion";
    case RouteType::INVALID: return "Invalid";
    default: return "Unknown";
  }
}

Router::Router() {
  rules_ = {
    {"GET",  PathPattern(ROOT_PATH),        RouteType::ROOT},
    {"GET",  PathPattern(WEBS_PATH),        RouteType::LIST_WEBS},
    {"GET",  PathPattern(ATTACHMENT_PATH),  RouteType::SERVE_ATTACHMENT},
    {"GET",  PathPattern(ATTACHMENTS_PATH), RouteType::LIST_ATTACHMENTS},
    {"GET",  PathPattern(VERSION_PATH),     RouteType::SHOW_PAGE_VERSION},
    {"GET",  PathPattern(VERSIONS_PATH),    RouteType::LIST_PAGE_VERSIONS},
    {"GET",  PathPattern(PAGE_PATH),        RouteType::SHOW_PAGE},
    {"GET",  PathPattern(PAGES_PATH),       RouteType::LIST_PAGES},
    {"POST", PathPattern(WEBS_PATH),        RouteType::CREATE_WEB},
    {"POST", PathPattern(ATTACHMENTS_PATH), RouteType::CREATE_ATTACHMENT},
    {"POST", PathPattern(PAGES_PATH),       RouteType::CREATE_PAGE},
    {"PUT",  PathPattern(PAGE_PATH),        RouteType::UPDATE_PAGE},
  };
  BOOST_LOG_TRIVIAL(debug) << "Router: Compiled " << rules_.size() << " routes";
}

Route Router::route(const std::string& method, const std::string& path) const {
  for (const auto& rule : rules_) {
    if (rule.method != method) {
      continue;
    }
    auto params = rule.pattern.match(path);
    if (!params) {
      continue;
    }

    Route route;
    route.type = rule.type;
    route.web_name = take(*params, "web_name");
    route.page_name = take(*params, "page_name");
    route.attachment_name = take(*params, "attachment_name");
    route.version_hash = take(*params, "version_hash");
    return route;
  }

  BOOST_LOG_TRIVIAL(debug) << "Router: No route for " << method << " " << path;
  return Route{};
}

} // namespace router
} // namespace biowiki
