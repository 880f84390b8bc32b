#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <boost/beast/http/status.hpp>
#include "router/router.hpp"
#include "store/web.hpp"

namespace biowiki {
namespace server {

constexpr const char* CONTENT_TYPE_JSON = "application/json";
constexpr const char* HOME_LOCATION = "/webs/Home/pages/WebHome";

struct Response {
  boost::beast::http::status status = boost::beast::http::status::ok;
  std::string content_type;
  std::string body;
  // Set for redirects only
  std::string location;
};


// Runs one classified request against the web collection.
//
// Locking: a collection mutex guards listing, creating and resolving webs.
// Each web has its own mutex that is held for the whole page, attachment
// or version operation, so writers in one web never interleave while
// unrelated webs proceed in parallel.
class RequestHandler {
public:
  // ---- CONSTRUCTOR ----
  explicit RequestHandler(store::WebCollection& webs);


  // ---- REQUEST PROCESSING ----
  // target may carry a query string, it is ignored
  Response handle(const std::string& method, const std::string& target, const std::string& body);

private:
  // A resolved web together with the lock that guards it
  struct LockedWeb {
    std::optional<store::Web> web;
    std::unique_lock<std::mutex> lock;
  };

  // ---- PARAMETERS ----
  store::WebCollection& webs_;
  const router::Router router_;
  std::mutex webs_mutex_;
  std::map<std::string, std::unique_ptr<std::mutex>> web_mutexes_;


  // ---- LOCKING ----
  LockedWeb lock_web(const std::string& name);


  // ---- ROUTE HANDLERS ----
  Response dispatch(const router::Route& route, const std::string& body);
  Response list_webs();
  Response create_web(const std::string& body);
  Response list_pages(const router::Route& route);
  Response create_page(const router::Route& route, const std::string& body);
  Response show_page(const router::Route& route);
  Response update_page(const router::Route& route, const std::string& body);
  Response list_attachments(const router::Route& route);
  Response create_attachment(const router::Route& route, const std::string& body);
  Response serve_attachment(const router::Route& route);
  Response list_page_versions(const router::Route& route);
  Response show_page_version(const router::Route& route);
};


// ---- ERROR MAPPING ----
boost::beast::http::status status_for(store::WebErrorKind kind);
boost::beast::http::status status_for(store::PageErrorKind kind);
boost::beast::http::status status_for(store::AttachmentErrorKind kind);

} // namespace server
} // namespace biowiki
