#pragma once

#include <optional>
#include <string>
#include "hawk_browser_page.h"
#include "hawk_extractor_chain.h"
#include "hawk_widget_params.h"

namespace hawk {

// Sitekey from a widget iframe src: query k/sitekey, or Cloudflare's /0x... path segment
std::optional<std::string> SitekeyFromIframeSrc(const std::string& src);

// Regex scan of raw page HTML
std::optional<WidgetParams> SitekeyFromPageSource(const std::string& html);

/**
 * SitekeyExtractor - finds the widget parameters a token solver needs
 *
 * Order: render-hook capture, DOM data-* attributes, widget iframe src,
 * regex over page source. Each step tolerates driver failures by declining.
 */
class SitekeyExtractor {
public:
  SitekeyExtractor();

  std::optional<WidgetParams> Extract(BrowserPage& page) const;

private:
  ExtractorChain<BrowserPage*, WidgetParams> chain_;
};

}  // namespace hawk
