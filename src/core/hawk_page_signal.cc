#include "hawk_page_signal.h"
#include "logger.h"

namespace hawk {

namespace {

void MarkFailed(PageSignal& signal, PageStatus status, const std::string& what,
                const std::string& message) {
  signal.capture_status = status;
  signal.capture_error = what + ": " + message;
  LOG_DEBUG("PageSignal", "Capture stopped at " + signal.capture_error);
}

}  // namespace

std::optional<bool> PageSignal::Present(const std::string& selector) const {
  auto it = marker_presence.find(selector);
  if (it == marker_presence.end()) return std::nullopt;
  return it->second;
}

std::optional<bool> PageSignal::Visible(const std::string& selector) const {
  auto it = marker_visible.find(selector);
  if (it == marker_visible.end()) return std::nullopt;
  return it->second;
}

PageSignal CapturePageSignal(BrowserPage& page, const SignalQuery& query) {
  PageSignal signal;

  auto title = page.Title();
  if (!title.success) {
    MarkFailed(signal, title.status, "title", title.message);
    return signal;
  }
  signal.title = title.value;
  signal.title_captured = true;

  auto url = page.Url();
  if (!url.success) {
    MarkFailed(signal, url.status, "url", url.message);
    return signal;
  }
  signal.url = url.value;
  signal.url_captured = true;

  for (const auto& selector : query.presence_selectors) {
    auto present = page.QuerySelector(selector);
    if (!present.success) {
      MarkFailed(signal, present.status, selector, present.message);
      return signal;
    }
    signal.marker_presence[selector] = present.value;
  }

  for (const auto& selector : query.visibility_selectors) {
    auto present = page.QuerySelector(selector);
    if (!present.success) {
      MarkFailed(signal, present.status, selector, present.message);
      return signal;
    }
    signal.marker_presence[selector] = present.value;
    if (!present.value) {
      signal.marker_visible[selector] = false;
      continue;
    }
    auto visible = page.IsVisible(selector);
    if (!visible.success) {
      MarkFailed(signal, visible.status, selector, visible.message);
      return signal;
    }
    signal.marker_visible[selector] = visible.value;
  }

  if (query.read_body_text) {
    auto body = page.InnerText("body");
    if (body.success) {
      signal.body_text = body.value;
    } else if (body.status != PageStatus::ELEMENT_NOT_FOUND) {
      MarkFailed(signal, body.status, "body", body.message);
      return signal;
    }
    signal.body_captured = true;
  }

  return signal;
}

}  // namespace hawk
