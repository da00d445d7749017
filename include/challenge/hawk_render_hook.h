#pragma once

#include <optional>
#include "hawk_browser_page.h"
#include "hawk_widget_params.h"

namespace hawk {

// Init script that records the arguments of turnstile/hcaptcha/grecaptcha
// render() calls on window.__hawkCaptured. Function callbacks are kept on
// window.__hawkCallbacks under the widget kind.
const char* RenderHookScript();

PageResult<bool> InstallRenderHook(BrowserPage& page);

// Parameters of the last intercepted render call, nullopt when none carried a sitekey
std::optional<WidgetParams> ReadCapturedRenderParams(BrowserPage& page);

}  // namespace hawk
