#include "hawk_token_injector.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

namespace {

const char kInjectScript[] = R"JS(
(args) => {
  const { token, fields, callback, kind } = args;
  const fire = (el) => {
    el.dispatchEvent(new Event('input', { bubbles: true }));
    el.dispatchEvent(new Event('change', { bubbles: true }));
  };
  const submitForm = (el) => {
    const form = (el && el.closest && el.closest('form')) ||
                 document.querySelector("form#challenge-form, form[action*='challenge']");
    if (!form) return false;
    const submit = form.querySelector("button[type='submit'], input[type='submit'], button:not([type])");
    if (!submit) return false;
    if (typeof form.requestSubmit === 'function') {
      form.requestSubmit(submit);
    } else {
      submit.click();
    }
    return true;
  };

  let filled = null;
  for (const name of fields) {
    const nodes = document.querySelectorAll(`textarea[name="${name}"], input[name="${name}"]`);
    for (const el of nodes) {
      el.value = token;
      if (el.tagName === 'TEXTAREA') el.innerHTML = token;
      fire(el);
      filled = filled || el;
    }
  }
  if (filled) {
    return { method: 'response_field', submitted: submitForm(filled) };
  }

  const captured = window.__hawkCallbacks && window.__hawkCallbacks[kind];
  if (typeof captured === 'function') {
    captured(token);
    return { method: 'callback', submitted: false };
  }
  const names = [];
  if (callback) names.push(callback);
  for (const el of document.querySelectorAll('[data-callback]')) {
    const cb = el.getAttribute('data-callback');
    if (cb) names.push(cb);
  }
  for (const name of names) {
    if (typeof window[name] === 'function') {
      window[name](token);
      return { method: 'callback', submitted: false };
    }
  }

  const anchor = document.querySelector('.cf-turnstile, .h-captcha, .g-recaptcha, [data-sitekey]');
  const form = (anchor && anchor.closest && anchor.closest('form')) ||
               document.querySelector('form') || document.body;
  if (!form) return { method: '', submitted: false };
  const input = document.createElement('input');
  input.type = 'hidden';
  input.name = fields[0];
  input.value = token;
  form.appendChild(input);
  fire(input);
  return { method: 'synthetic_field', submitted: submitForm(input) };
}
)JS";

}  // namespace

InjectionResult InjectToken(BrowserPage& page, const WidgetParams& params,
                            const std::string& token) {
  InjectionResult result;
  if (token.empty()) {
    result.message = "empty token";
    return result;
  }

  json fields = json::array({ResponseFieldName(params.kind)});
  // hCaptcha pages commonly read the reCAPTCHA field name as well
  if (params.kind == WidgetKind::HCAPTCHA) {
    fields.push_back("g-recaptcha-response");
  }

  json args = {
    {"token", token},
    {"fields", fields},
    {"callback", params.callback},
    {"kind", WidgetKindToString(params.kind)}
  };

  PageResult<json> evaluated = page.Evaluate(kInjectScript, args);
  if (!evaluated.success) {
    result.message = std::string("evaluate failed: ") + PageStatusToCode(evaluated.status);
    LOG_WARN("TokenInjector", "Token injection failed: " + evaluated.message);
    return result;
  }

  const json& outcome = evaluated.value;
  if (!outcome.is_object() || !outcome.contains("method") || !outcome["method"].is_string() ||
      outcome["method"].get<std::string>().empty()) {
    result.message = "no injection target on page";
    LOG_WARN("TokenInjector", result.message);
    return result;
  }

  result.success = true;
  result.method = outcome["method"].get<std::string>();
  result.submitted = outcome.contains("submitted") && outcome["submitted"].is_boolean() &&
                     outcome["submitted"].get<bool>();
  LOG_INFO("TokenInjector", "Token injected via " + result.method +
           (result.submitted ? " (form submitted)" : ""));
  return result;
}

}  // namespace hawk
