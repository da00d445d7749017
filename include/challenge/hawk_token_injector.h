#pragma once

#include <string>
#include "hawk_browser_page.h"
#include "hawk_widget_params.h"

namespace hawk {

struct InjectionResult {
  bool success = false;
  std::string method;     // "response_field", "callback", "synthetic_field"
  bool submitted = false; // owning form was submitted
  std::string message;
};

/**
 * Hand a solved token to the page. Tries, in order:
 * 1. the widget's named response field (textarea or input)
 * 2. the render callback captured by the render hook, or a data-callback global
 * 3. a hidden input created in the nearest form (or body)
 * The field paths dispatch input/change events and submit the form when it
 * has a submit control.
 */
InjectionResult InjectToken(BrowserPage& page, const WidgetParams& params,
                            const std::string& token);

}  // namespace hawk
