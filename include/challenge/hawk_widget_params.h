#pragma once

#include <string>

namespace hawk {

enum class WidgetKind {
  TURNSTILE,
  HCAPTCHA,
  RECAPTCHA_V2,
  UNKNOWN
};

inline const char* WidgetKindToString(WidgetKind kind) {
  switch (kind) {
    case WidgetKind::TURNSTILE: return "turnstile";
    case WidgetKind::HCAPTCHA: return "hcaptcha";
    case WidgetKind::RECAPTCHA_V2: return "recaptcha_v2";
    default: return "unknown";
  }
}

inline WidgetKind ParseWidgetKind(const std::string& value) {
  if (value == "turnstile") return WidgetKind::TURNSTILE;
  if (value == "hcaptcha") return WidgetKind::HCAPTCHA;
  if (value == "recaptcha_v2" || value == "recaptcha") return WidgetKind::RECAPTCHA_V2;
  return WidgetKind::UNKNOWN;
}

// Hidden field the widget writes its token into
inline const char* ResponseFieldName(WidgetKind kind) {
  switch (kind) {
    case WidgetKind::HCAPTCHA: return "h-captcha-response";
    case WidgetKind::RECAPTCHA_V2: return "g-recaptcha-response";
    default: return "cf-turnstile-response";
  }
}

// Parameters a solver needs to mint a token for one widget
struct WidgetParams {
  WidgetKind kind = WidgetKind::UNKNOWN;
  std::string sitekey;
  std::string action;
  std::string cdata;
  std::string page_data;   // Cloudflare chlPageData; set on challenge pages
  std::string callback;    // global function name or captured callback key
  std::string source;      // extractor that found it
};

}  // namespace hawk
