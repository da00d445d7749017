#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hawk_page_result.h"

namespace hawk {

// Cookie as handed to the browser context
struct CookieData {
  std::string name;
  std::string value;
  std::string domain;
  std::string path = "/";
  double expires = -1;   // Unix seconds, -1 for session cookies
  bool http_only = false;
  bool secure = false;
  std::string same_site = "Lax";
};

/**
 * BrowserPage - the slice of a page driver the resilience core needs.
 *
 * Every call may fail with a transient driver error (detached frame,
 * navigation race, closed page); callers must treat a failed result as
 * "unknown", never as "absent".
 */
class BrowserPage {
public:
  virtual ~BrowserPage() = default;

  virtual PageResult<std::string> Title() = 0;
  virtual PageResult<std::string> Url() = 0;

  // True when at least one element matches
  virtual PageResult<bool> QuerySelector(const std::string& selector) = 0;

  // Attribute of the first match; ELEMENT_NOT_FOUND when nothing matches,
  // empty value when the element lacks the attribute
  virtual PageResult<std::string> GetAttribute(const std::string& selector,
                                               const std::string& name) = 0;

  virtual PageResult<bool> IsVisible(const std::string& selector) = 0;
  virtual PageResult<std::string> InnerText(const std::string& selector) = 0;

  // Runs script as a function expression called with args
  virtual PageResult<nlohmann::json> Evaluate(const std::string& script,
                                              const nlohmann::json& args) = 0;

  // Script runs before any page script on every subsequent document
  virtual PageResult<bool> AddInitScript(const std::string& script) = 0;

  virtual PageResult<bool> Reload() = 0;
  virtual PageResult<bool> Screenshot(const std::string& path) = 0;
  virtual PageResult<std::string> Content() = 0;
};

class BrowserContextHandle {
public:
  virtual ~BrowserContextHandle() = default;

  virtual PageResult<bool> AddCookies(const std::vector<CookieData>& cookies) = 0;
};

}  // namespace hawk
