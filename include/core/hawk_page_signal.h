#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "hawk_browser_page.h"

namespace hawk {

// What to read from a page, in the order it is read
struct SignalQuery {
  std::vector<std::string> presence_selectors;    // presence only
  std::vector<std::string> visibility_selectors;  // presence + visibility
  bool read_body_text = true;
};

/**
 * PageSignal - snapshot of one page state.
 *
 * Built fresh for every check. Capture stops at the first failing driver
 * call; the parts read before it stay valid and `capture_status` carries the
 * failure so the detector can fail open on whatever was not read.
 */
struct PageSignal {
  std::string title;
  std::string url;
  std::map<std::string, bool> marker_presence;
  std::map<std::string, bool> marker_visible;
  std::string body_text;

  bool title_captured = false;
  bool url_captured = false;
  bool body_captured = false;
  PageStatus capture_status = PageStatus::OK;
  std::string capture_error;

  bool complete() const { return capture_status == PageStatus::OK; }

  // nullopt when the selector was never read
  std::optional<bool> Present(const std::string& selector) const;
  std::optional<bool> Visible(const std::string& selector) const;
};

PageSignal CapturePageSignal(BrowserPage& page, const SignalQuery& query);

}  // namespace hawk
