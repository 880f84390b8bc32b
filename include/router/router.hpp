#ifndef BIOWIKI_ROUTER_HPP
#define BIOWIKI_ROUTER_HPP

#include <string>
#include <vector>
#include "router/path_pattern.hpp"

namespace biowiki {
namespace router {

enum class RouteType {
  ROOT,
  LIST_WEBS,
  CREATE_WEB,
  LIST_PAGES,
  CREATE_PAGE,
  SHOW_PAGE,
  UPDATE_PAGE,
  LIST_ATTACHMENTS,
  CREATE_ATTACHMENT,
  SERVE_ATTACHMENT,
  LIST_PAGE_VERSIONS,
  SHOW_PAGE_VERSION,
  INVALID
};

const char* to_string(RouteType type);

// A classified request. Only the fields the route type names are set.
struct Route {
  RouteType type = RouteType::INVALID;
  std::string web_name;
  std::string page_name;
  std::string attachment_name;
  std::string version_hash;
};


// Maps method + path to a Route. Rules are compiled once in the
// constructor; route() has no side effects and may be shared by threads.
class Router {
public:
  Router();

  Route route(const std::string& method, const std::string& path) const;

private:
  struct Rule {
    std::string method;
    PathPattern pattern;
    RouteType type;
  };

  // Evaluated in order, first match wins
  std::vector<Rule> rules_;
};

} // namespace router
} // namespace biowiki

#endif // BIOWIKI_ROUTER_HPP
