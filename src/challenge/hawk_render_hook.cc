#include "hawk_render_hook.h"
#include "hawk_string_utils.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

namespace {

const char kRenderHookScript[] = R"JS(
(() => {
  if (window.__hawkRenderHookInstalled) return;
  window.__hawkRenderHookInstalled = true;
  window.__hawkCallbacks = window.__hawkCallbacks || {};

  const record = (kind, params) => {
    try {
      params = params || {};
      let callback = null;
      if (typeof params.callback === 'function') {
        window.__hawkCallbacks[kind] = params.callback;
        callback = kind;
      } else if (typeof params.callback === 'string') {
        callback = params.callback;
      }
      window.__hawkCaptured = {
        kind: kind,
        sitekey: params.sitekey || params.siteKey || null,
        action: params.action || null,
        cData: params.cData || params.cdata || null,
        chlPageData: params.chlPageData || null,
        callback: callback
      };
    } catch (e) {}
  };

  const wrap = (kind, api) => {
    if (!api || (typeof api !== 'object' && typeof api !== 'function')) return api;
    if (api.__hawkWrapped) return api;
    const hook = (fn) => function (container, params) {
      record(kind, params);
      return fn.apply(this, arguments);
    };
    let render = typeof api.render === 'function' ? hook(api.render) : api.render;
    try {
      Object.defineProperty(api, 'render', {
        configurable: true,
        enumerable: true,
        get() { return render; },
        set(fn) { render = typeof fn === 'function' ? hook(fn) : fn; }
      });
      Object.defineProperty(api, '__hawkWrapped', { value: true });
    } catch (e) {}
    return api;
  };

  const trap = (name, kind) => {
    let current = wrap(kind, window[name]);
    try {
      Object.defineProperty(window, name, {
        configurable: true,
        get() { return current; },
        set(value) { current = wrap(kind, value); }
      });
    } catch (e) {}
  };

  trap('turnstile', 'turnstile');
  trap('hcaptcha', 'hcaptcha');
  trap('grecaptcha', 'recaptcha_v2');
})();
)JS";

const char kReadCapturedScript[] = "() => window.__hawkCaptured || null";

std::string StringOr(const json& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_string()) return "";
  return Trim(it->get<std::string>());
}

}  // namespace

const char* RenderHookScript() {
  return kRenderHookScript;
}

PageResult<bool> InstallRenderHook(BrowserPage& page) {
  PageResult<bool> result = page.AddInitScript(kRenderHookScript);
  if (!result.success) {
    LOG_WARN("RenderHook", std::string("Could not install render hook: ") +
             PageStatusToCode(result.status));
  }
  return result;
}

std::optional<WidgetParams> ReadCapturedRenderParams(BrowserPage& page) {
  PageResult<json> captured = page.Evaluate(kReadCapturedScript, json::object());
  if (!captured.success || !captured.value.is_object()) {
    return std::nullopt;
  }

  WidgetParams params;
  params.sitekey = StringOr(captured.value, "sitekey");
  if (params.sitekey.empty()) {
    return std::nullopt;
  }
  params.kind = ParseWidgetKind(StringOr(captured.value, "kind"));
  params.action = StringOr(captured.value, "action");
  params.cdata = StringOr(captured.value, "cData");
  params.page_data = StringOr(captured.value, "chlPageData");
  params.callback = StringOr(captured.value, "callback");
  params.source = "render_hook";
  return params;
}

}  // namespace hawk
