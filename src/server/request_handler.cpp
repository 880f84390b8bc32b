#include "server/request_handler.hpp"
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>

namespace biowiki {
namespace server {

namespace http = boost::beast::http;

namespace {

Response empty_response(http::status status) {
  Response response;
  response.status = status;
  return response;
}

Response json_response(const nlohmann::json& j) {
  Response response;
  response.content_type = CONTENT_TYPE_JSON;
  response.body = j.dump();
  return response;
}

} // namespace


//==============================================
// ERROR MAPPING
//==============================================

http::status status_for(store::WebErrorKind kind) {
  switch (kind) {
    case store::WebErrorKind::NOT_FOUND: return http::status::not_found;
    case store::WebErrorKind::INVALID_NAME:
    case store::WebErrorKind::OVERWRITE_ERROR: return http::status::bad_request;
    default: return http::status::internal_server_error;
  }
}

http::status status_for(store::PageErrorKind kind) {
  switch (kind) {
    case store::PageErrorKind::NOT_FOUND:
    case store::PageErrorKind::NOT_DIRECTORY:
    case store::PageErrorKind::INVALID_PATH: return http::status::not_found;
    case store::PageErrorKind::NAME_MISMATCH:
    case store::PageErrorKind::OVERWRITE_ERROR: return http::status::bad_request;
    default: return http::status::internal_server_error;
  }
}

http::status status_for(store::AttachmentErrorKind kind) {
  switch (kind) {
    case store::AttachmentErrorKind::NOT_FOUND: return http::status::not_found;
    case store::AttachmentErrorKind::JSON_ERROR:
    case store::AttachmentErrorKind::BASE64_ERROR: return http::status::bad_request;
    default: return http::status::internal_server_error;
  }
}


//==============================================
// CONSTRUCTOR
//==============================================

RequestHandler::RequestHandler(store::WebCollection& webs) : webs_(webs) {
  BOOST_LOG_TRIVIAL(info) << "Request handler: Ready for " << webs_.root().string();
}


//==============================================
// REQUEST PROCESSING
//==============================================

Response RequestHandler::handle(const std::string& method, const std::string& target, const std::string& body) {
  std::string path = target.substr(0, target.find('?'));
  router::Route route = router_.route(method, path);
  BOOST_LOG_TRIVIAL(debug) << "Request handler: " << method << " " << path << " -> " << router::to_string(route.type);

  try {
    return dispatch(route, body);
  } catch (const store::WebError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: " << e.what();
    return empty_response(status_for(e.kind()));
  } catch (const store::PageError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: " << e.what();
    return empty_response(status_for(e.kind()));
  } catch (const store::AttachmentError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: " << e.what();
    return empty_response(status_for(e.kind()));
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Request handler: Unexpected failure on " << method << " " << path << ": " << e.what();
    return empty_response(http::status::internal_server_error);
  }
}

Response RequestHandler::dispatch(const router::Route& route, const std::string& body) {
  switch (route.type) {
    case router::RouteType::ROOT: {
      Response response = empty_response(http::status::found);
      response.location = HOME_LOCATION;
      return response;
    }
    case router::RouteType::LIST_WEBS: return list_webs();
    case router::RouteType::CREATE_WEB: return create_web(body);
    case router::RouteType::LIST_PAGES: return list_pages(route);
    case router::RouteType::CREATE_PAGE: return create_page(route, body);
    case router::RouteType::SHOW_PAGE: return show_page(route);
    case router::RouteType::UPDATE_PAGE: return update_page(route, body);
    case router::RouteType::LIST_ATTACHMENTS: return list_attachments(route);
    case router::RouteType::CREATE_ATTACHMENT: return create_attachment(route, body);
    case router::RouteType::SERVE_ATTACHMENT: return serve_attachment(route);
    case router::RouteType::LIST_PAGE_VERSIONS: return list_page_versions(route);
    case router::RouteType::SHOW_PAGE_VERSION: return show_page_version(route);
    case router::RouteType::INVALID:
    default:
      return empty_response(http::status::not_found);
  }
}


//==============================================
// LOCKING
//==============================================

RequestHandler::LockedWeb RequestHandler::lock_web(const std::string& name) {
  LockedWeb locked;
  std::mutex* web_mutex = nullptr;
  {
    std::lock_guard<std::mutex> webs_lock(webs_mutex_);
    locked.web = webs_.get(name);
    if (!locked.web) {
      return locked;
    }
    auto& slot = web_mutexes_[name];
    if (!slot) {
      slot = std::make_unique<std::mutex>();
    }
    web_mutex = slot.get();
  }
  // Webs are never deleted so the mutex outlives the collection lock
  locked.lock = std::unique_lock<std::mutex>(*web_mutex);
  return locked;
}


//==============================================
// WEB ROUTES
//==============================================

Response RequestHandler::list_webs() {
  std::lock_guard<std::mutex> webs_lock(webs_mutex_);
  return json_response(webs_.list());
}

Response RequestHandler::create_web(const std::string& body) {
  std::string name;
  try {
    name = nlohmann::json::parse(body).at("name").get<std::string>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Malformed web body: " << e.what();
    return empty_response(http::status::bad_request);
  }

  std::lock_guard<std::mutex> webs_lock(webs_mutex_);
  webs_.create(name);
  return empty_response(http::status::created);
}


//==============================================
// PAGE ROUTES
//==============================================

Response RequestHandler::list_pages(const router::Route& route) {
  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  return json_response(locked.web->list_pages());
}

Response RequestHandler::create_page(const router::Route& route, const std::string& body) {
  store::PageDetail detail;
  try {
    detail = store::PageDetail::parse(body);
  } catch (const store::PageError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Malformed page body: " << e.what();
    return empty_response(http::status::bad_request);
  }
  if (!store::is_valid_name(detail.name)) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Invalid page name: " << detail.name;
    return empty_response(http::status::bad_request);
  }

  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  locked.web->new_page(detail).create();
  return empty_response(http::status::created);
}

Response RequestHandler::show_page(const router::Route& route) {
  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  store::Page page = locked.web->open_page(route.page_name);
  return json_response(page.detail());
}

Response RequestHandler::update_page(const router::Route& route, const std::string& body) {
  store::PageDetail detail;
  try {
    detail = store::PageDetail::parse(body);
  } catch (const store::PageError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Malformed page body: " << e.what();
    return empty_response(http::status::bad_request);
  }
  if (detail.name != route.page_name) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Page name " << detail.name
                               << " does not match path " << route.page_name;
    return empty_response(http::status::bad_request);
  }

  if (!store::is_valid_name(detail.name)) {
    return empty_response(http::status::not_found);
  }

  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  locked.web->new_page(detail).update();
  return empty_response(http::status::ok);
}


//==============================================
// ATTACHMENT ROUTES
//==============================================

Response RequestHandler::list_attachments(const router::Route& route) {
  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  store::Page page = locked.web->open_page(route.page_name);
  return json_response(page.list_attachments());
}

Response RequestHandler::create_attachment(const router::Route& route, const std::string& body) {
  store::AttachmentData incoming;
  try {
    incoming = store::AttachmentData::parse(body);
  } catch (const store::AttachmentError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Malformed attachment body: " << e.what();
    return empty_response(http::status::bad_request);
  }
  if (!incoming.is_file_name_valid()) {
    BOOST_LOG_TRIVIAL(warning) << "Request handler: Rejected attachment file name: " << incoming.file_name;
    return empty_response(http::status::bad_request);
  }

  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  store::Page page = locked.web->open_page(route.page_name);
  page.save_attachment(incoming);
  return empty_response(http::status::created);
}

Response RequestHandler::serve_attachment(const router::Route& route) {
  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  store::Page page = locked.web->open_page(route.page_name);
  store::Attachment attachment = page.get_attachment(route.attachment_name);

  Response response;
  response.content_type = attachment.mime_type();
  response.body = attachment.data();
  return response;
}


//==============================================
// VERSION ROUTES
//==============================================

Response RequestHandler::list_page_versions(const router::Route& route) {
  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  store::Page page = locked.web->open_page(route.page_name);
  return json_response(page.list_versions());
}

Response RequestHandler::show_page_version(const router::Route& route) {
  LockedWeb locked = lock_web(route.web_name);
  if (!locked.web) {
    return empty_response(http::status::not_found);
  }
  store::Page page = locked.web->open_page(route.page_name);
  return json_response(page.get_version(route.version_hash));
}

} // namespace server
} // namespace biowiki
