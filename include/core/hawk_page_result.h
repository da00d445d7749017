#pragma once

#include <string>
#include <utility>

namespace hawk {

// Outcome of one call across the browser-driver boundary
enum class PageStatus {
  OK,
  DETACHED_FRAME,     // Frame was detached while the query ran
  NAVIGATION_RACE,    // Execution context destroyed by a navigation
  PAGE_CLOSED,        // Page or browser is gone
  TIMEOUT,            // Driver call timed out
  ELEMENT_NOT_FOUND,  // Selector matched nothing (attribute/text reads)
  EVALUATION_FAILED,  // Script threw or returned something unserializable
  NOT_SUPPORTED,      // Driver lacks the capability
  INTERNAL_ERROR,
  UNKNOWN
};

inline const char* PageStatusToCode(PageStatus status) {
  switch (status) {
    case PageStatus::OK: return "ok";
    case PageStatus::DETACHED_FRAME: return "detached_frame";
    case PageStatus::NAVIGATION_RACE: return "navigation_race";
    case PageStatus::PAGE_CLOSED: return "page_closed";
    case PageStatus::TIMEOUT: return "timeout";
    case PageStatus::ELEMENT_NOT_FOUND: return "element_not_found";
    case PageStatus::EVALUATION_FAILED: return "evaluation_failed";
    case PageStatus::NOT_SUPPORTED: return "not_supported";
    case PageStatus::INTERNAL_ERROR: return "internal_error";
    default: return "unknown";
  }
}

inline const char* PageStatusToMessage(PageStatus status) {
  switch (status) {
    case PageStatus::OK: return "Page call completed";
    case PageStatus::DETACHED_FRAME: return "Frame was detached";
    case PageStatus::NAVIGATION_RACE: return "Page navigated during the call";
    case PageStatus::PAGE_CLOSED: return "Page is closed";
    case PageStatus::TIMEOUT: return "Page call timed out";
    case PageStatus::ELEMENT_NOT_FOUND: return "Element not found";
    case PageStatus::EVALUATION_FAILED: return "Script evaluation failed";
    case PageStatus::NOT_SUPPORTED: return "Operation not supported by driver";
    case PageStatus::INTERNAL_ERROR: return "Internal error";
    default: return "Unknown error";
  }
}

// Value plus status for every BrowserPage call
template <typename T>
struct PageResult {
  bool success = false;
  PageStatus status = PageStatus::UNKNOWN;
  T value{};
  std::string message;

  static PageResult Ok(T v) {
    PageResult r;
    r.success = true;
    r.status = PageStatus::OK;
    r.value = std::move(v);
    return r;
  }

  static PageResult Failure(PageStatus status, const std::string& msg = "") {
    PageResult r;
    r.success = false;
    r.status = status;
    r.message = msg.empty() ? PageStatusToMessage(status) : msg;
    return r;
  }
};

}  // namespace hawk
