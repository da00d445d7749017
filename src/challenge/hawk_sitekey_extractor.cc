#include "hawk_sitekey_extractor.h"
#include "hawk_render_hook.h"
#include "hawk_string_utils.h"
#include "hawk_url_utils.h"
#include "logger.h"
#include <regex>
#include <vector>

namespace hawk {

namespace {

struct AttributeSource {
  const char* selector;
  WidgetKind kind;
};

struct SourcePattern {
  const char* pattern;
  WidgetKind kind;
};

std::string Attribute(BrowserPage& page, const std::string& selector, const char* name) {
  PageResult<std::string> value = page.GetAttribute(selector, name);
  return value.success ? Trim(value.value) : std::string();
}

bool Present(BrowserPage& page, const std::string& selector) {
  PageResult<bool> present = page.QuerySelector(selector);
  return present.success && present.value;
}

std::optional<WidgetParams> FromDomAttributes(BrowserPage& page) {
  static const AttributeSource kSources[] = {
    {".cf-turnstile[data-sitekey]", WidgetKind::TURNSTILE},
    {".h-captcha[data-sitekey]", WidgetKind::HCAPTCHA},
    {".g-recaptcha[data-sitekey]", WidgetKind::RECAPTCHA_V2},
    {"[data-sitekey]", WidgetKind::UNKNOWN}
  };

  for (const auto& source : kSources) {
    std::string sitekey = Attribute(page, source.selector, "data-sitekey");
    if (sitekey.empty()) continue;

    WidgetParams params;
    params.sitekey = sitekey;
    params.kind = source.kind;
    if (params.kind == WidgetKind::UNKNOWN) {
      if (Present(page, "iframe[src*='hcaptcha.com']")) {
        params.kind = WidgetKind::HCAPTCHA;
      } else if (Present(page, "iframe[src*='recaptcha']")) {
        params.kind = WidgetKind::RECAPTCHA_V2;
      } else {
        params.kind = WidgetKind::TURNSTILE;
      }
    }
    params.action = Attribute(page, source.selector, "data-action");
    params.cdata = Attribute(page, source.selector, "data-cdata");
    params.callback = Attribute(page, source.selector, "data-callback");
    params.source = "dom_attribute";
    return params;
  }
  return std::nullopt;
}

std::optional<WidgetParams> FromIframes(BrowserPage& page) {
  static const AttributeSource kFrames[] = {
    {"iframe[src*='challenges.cloudflare.com']", WidgetKind::TURNSTILE},
    {"iframe[src*='hcaptcha.com']", WidgetKind::HCAPTCHA},
    {"iframe[src*='recaptcha']", WidgetKind::RECAPTCHA_V2}
  };

  for (const auto& frame : kFrames) {
    std::string src = Attribute(page, frame.selector, "src");
    if (src.empty()) continue;
    std::optional<std::string> sitekey = SitekeyFromIframeSrc(src);
    if (!sitekey) continue;

    WidgetParams params;
    params.kind = frame.kind;
    params.sitekey = *sitekey;
    params.source = "iframe_src";
    return params;
  }
  return std::nullopt;
}

}  // namespace

std::optional<std::string> SitekeyFromIframeSrc(const std::string& src) {
  for (const char* name : {"k", "sitekey"}) {
    std::optional<std::string> value = GetQueryParam(src, name);
    if (value && !Trim(*value).empty()) {
      return Trim(*value);
    }
  }
  // hCaptcha and Turnstile frames may carry parameters in the fragment
  ParsedUrl parsed = ParseUrl(src);
  for (const auto& [key, value] : ParseQuery(parsed.fragment)) {
    if ((key == "sitekey" || key == "k") && !Trim(value).empty()) {
      return Trim(value);
    }
  }
  static const std::regex kCloudflarePath("/(0x[A-Za-z0-9_-]+)");
  std::smatch match;
  if (std::regex_search(src, match, kCloudflarePath)) {
    return match[1].str();
  }
  return std::nullopt;
}

std::optional<WidgetParams> SitekeyFromPageSource(const std::string& html) {
  static const std::vector<SourcePattern> kPatterns = {
    {R"(cf-turnstile[^>]*data-sitekey=["']([^"']+)["'])", WidgetKind::TURNSTILE},
    {R"(h-captcha[^>]*data-sitekey=["']([^"']+)["'])", WidgetKind::HCAPTCHA},
    {R"(g-recaptcha[^>]*data-sitekey=["']([^"']+)["'])", WidgetKind::RECAPTCHA_V2},
    {R"(turnstileSiteKey["']?\s*[:=]\s*["']([^"']+)["'])", WidgetKind::TURNSTILE},
    {R"(challenges\.cloudflare\.com/[^"'\s]*?/(0x[A-Za-z0-9_-]+))", WidgetKind::TURNSTILE},
    {R"(data-sitekey=["']([^"']+)["'])", WidgetKind::UNKNOWN},
    {R"(sitekey['":\s]+['"]([^'"]+)['"])", WidgetKind::UNKNOWN}
  };

  for (const auto& entry : kPatterns) {
    std::regex pattern(entry.pattern, std::regex::icase);
    std::smatch match;
    if (!std::regex_search(html, match, pattern)) continue;

    std::string sitekey = Trim(match[1].str());
    if (sitekey.empty()) continue;

    WidgetParams params;
    params.sitekey = sitekey;
    params.kind = entry.kind;
    if (params.kind == WidgetKind::UNKNOWN) {
      std::string lower = ToLower(html);
      if (Contains(lower, "hcaptcha.com")) {
        params.kind = WidgetKind::HCAPTCHA;
      } else if (Contains(lower, "recaptcha")) {
        params.kind = WidgetKind::RECAPTCHA_V2;
      } else {
        params.kind = WidgetKind::TURNSTILE;
      }
    }
    params.source = "page_source";
    return params;
  }
  return std::nullopt;
}

SitekeyExtractor::SitekeyExtractor() {
  chain_
    .Add("render_hook", [](BrowserPage* const& page) {
      return ReadCapturedRenderParams(*page);
    })
    .Add("dom_attribute", [](BrowserPage* const& page) {
      return FromDomAttributes(*page);
    })
    .Add("iframe_src", [](BrowserPage* const& page) {
      return FromIframes(*page);
    })
    .Add("page_source", [](BrowserPage* const& page) -> std::optional<WidgetParams> {
      PageResult<std::string> content = page->Content();
      if (!content.success) return std::nullopt;
      return SitekeyFromPageSource(content.value);
    });
}

std::optional<WidgetParams> SitekeyExtractor::Extract(BrowserPage& page) const {
  BrowserPage* handle = &page;
  auto match = chain_.Run(handle);
  if (!match) {
    LOG_DEBUG("SitekeyExtractor", "No sitekey found");
    return std::nullopt;
  }
  LOG_INFO("SitekeyExtractor", std::string("Found ") + WidgetKindToString(match->value.kind) +
           " sitekey " + Truncate(match->value.sitekey, 16) + " via " + match->source);
  return match->value;
}

}  // namespace hawk
