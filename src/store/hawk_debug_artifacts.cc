#include "hawk_debug_artifacts.h"
#include "hawk_file_utils.h"
#include "hawk_time_source.h"
#include "logger.h"

namespace hawk {

DebugArtifactRecorder::DebugArtifactRecorder(const std::string& dir, bool enabled)
    : dir_(dir.empty() ? "." : dir), enabled_(enabled) {}

bool DebugArtifactRecorder::CaptureOnce(BrowserPage& page, const std::string& label) {
  if (!enabled_ || captured_) {
    return false;
  }
  if (!CreateDirectoryIfNeeded(dir_)) {
    LOG_WARN("DebugArtifacts", "Cannot create artifact directory " + dir_);
    return false;
  }

  std::string base = JoinPath(dir_, label + "_" + LocalTimestampCompact());

  std::string screenshot = base + ".png";
  PageResult<bool> shot = page.Screenshot(screenshot);
  if (shot.success) {
    last_screenshot_ = screenshot;
  } else {
    LOG_DEBUG("DebugArtifacts", "Screenshot failed: " + shot.message);
  }

  PageResult<std::string> content = page.Content();
  if (content.success) {
    std::string html = base + ".html";
    if (WriteFileAtomic(html, content.value)) {
      last_html_ = html;
    } else {
      LOG_DEBUG("DebugArtifacts", "Writing " + html + " failed");
    }
  } else {
    LOG_DEBUG("DebugArtifacts", "Page content unavailable: " + content.message);
  }

  captured_ = !last_screenshot_.empty() || !last_html_.empty();
  if (captured_) {
    LOG_INFO("DebugArtifacts", "Saved challenge artifacts to " + base + ".*");
  }
  return captured_;
}

}  // namespace hawk
