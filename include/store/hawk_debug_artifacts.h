#pragma once

#include <string>
#include "hawk_browser_page.h"

namespace hawk {

/**
 * DebugArtifactRecorder - screenshot + HTML of the first challenge of a run
 *
 * Files are <dir>/<label>_<YYYYmmdd_HHMMSS>.png and .html. Later calls do
 * nothing once a capture produced at least one file.
 */
class DebugArtifactRecorder {
public:
  DebugArtifactRecorder(const std::string& dir, bool enabled);

  // true when this call saved something
  bool CaptureOnce(BrowserPage& page, const std::string& label);

  bool captured() const { return captured_; }
  const std::string& last_screenshot() const { return last_screenshot_; }
  const std::string& last_html() const { return last_html_; }

private:
  std::string dir_;
  bool enabled_;
  bool captured_ = false;
  std::string last_screenshot_;
  std::string last_html_;
};

}  // namespace hawk
