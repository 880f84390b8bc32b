#ifndef BIOWIKI_STORE_ERROR_HPP
#define BIOWIKI_STORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace biowiki {
namespace store {

// ---- WEB ERRORS ----
enum class WebErrorKind {
  NOT_FOUND,
  INVALID_NAME,
  OVERWRITE_ERROR,
  IO_ERROR
};

inline const char* to_string(WebErrorKind kind) {
  switch (kind) {
    case WebErrorKind::NOT_FOUND: return "WebError::NotFound";
    case WebErrorKind::INVALID_NAME: return "WebError::InvalidName";
    case WebErrorKind::OVERWRITE_ERROR: return "WebError::OverwriteError";
    case WebErrorKind::IO_ERROR: return "WebError::IoError";
    default: return "WebError::Unknown";
  }
}


// ---- PAGE ERRORS ----
enum class PageErrorKind {
  NOT_FOUND,
  NOT_DIRECTORY,
  INVALID_PATH,
  UTF8_ERROR,
  NAME_MISMATCH,
  IO_ERROR,
  JSON_ERROR,
  OVERWRITE_ERROR
};

inline const char* to_string(PageErrorKind kind) {
  switch (kind) {
    case PageErrorKind::NOT_FOUND: return "PageError::NotFound";
    case PageErrorKind::NOT_DIRECTORY: return "PageError::NotDirectory";
    case PageErrorKind::INVALID_PATH: return "PageError::InvalidPath";
    case PageErrorKind::UTF8_ERROR: return "PageError::Utf8Error";
    case PageErrorKind::NAME_MISMATCH: return "PageError::NameMismatch";
    case PageErrorKind::IO_ERROR: return "PageError::IoError";
    case PageErrorKind::JSON_ERROR: return "PageError::JsonError";
    case PageErrorKind::OVERWRITE_ERROR: return "PageError::OverwriteError";
    default: return "PageError::Unknown";
  }
}


// ---- ATTACHMENT ERRORS ----
enum class AttachmentErrorKind {
  NOT_FOUND,
  IO_ERROR,
  JSON_ERROR,
  BASE64_ERROR
};

inline const char* to_string(AttachmentErrorKind kind) {
  switch (kind) {
    case AttachmentErrorKind::NOT_FOUND: return "AttachmentError::NotFound";
    case AttachmentErrorKind::IO_ERROR: return "AttachmentError::IoError";
    case AttachmentErrorKind::JSON_ERROR: return "AttachmentError::JsonError";
    case AttachmentErrorKind::BASE64_ERROR: return "AttachmentError::Base64Error";
    default: return "AttachmentError::Unknown";
  }
}


// Base for every failure raised by the store layer
class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Carries the component specific kind so callers can switch on it
template <typename Kind>
class KindedError : public StoreError {
public:
  KindedError(Kind kind, const std::string& detail)
    : StoreError(detail.empty() ? std::string(to_string(kind))
                                : std::string(to_string(kind)) + "(" + detail + ")")
    , kind_(kind) {}

  Kind kind() const { return kind_; }

private:
  Kind kind_;
};

class WebError : public KindedError<WebErrorKind> {
public:
  explicit WebError(WebErrorKind kind, const std::string& detail = "")
    : KindedError(kind, detail) {}
};

class PageError : public KindedError<PageErrorKind> {
public:
  explicit PageError(PageErrorKind kind, const std::string& detail = "")
    : KindedError(kind, detail) {}
};

class AttachmentError : public KindedError<AttachmentErrorKind> {
public:
  explicit AttachmentError(AttachmentErrorKind kind, const std::string& detail = "")
    : KindedError(kind, detail) {}
};

} // namespace store
} // namespace biowiki

#endif // BIOWIKI_STORE_ERROR_HPP
