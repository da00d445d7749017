#include "hawk_challenge_detector.h"
#include "hawk_string_utils.h"
#include "logger.h"
#include <utility>

namespace hawk {

DetectorProfile BuiltinDetectorProfile(const std::string& name) {
  DetectorProfile profile;
  std::string key = ToLower(Trim(name));

  if (key == "glassdoor") {
    profile.name = "glassdoor";
    profile.content_markers = {
      "div[data-test='jobDescription']",
      "section[data-test='jobDetailsSection']",
      "span[data-test='detailSalary']",
      "div[data-test='detailSalary']"
    };
  } else if (key == "indeed") {
    profile.name = "indeed";
    profile.content_markers = {
      "#jobDescriptionText",
      "div.jobsearch-JobComponent",
      "div#jobsearch-ViewjobPaneWrapper",
      "div.jobsearch-JobInfoHeader-title-container"
    };
  } else if (key == "linkedin") {
    profile.name = "linkedin";
    profile.content_markers = {
      "div.job-card-container",
      "li.jobs-search-results__list-item",
      "div.jobs-search-results__list-item"
    };
    // Auth-wall and checkpoint pages block as hard as a captcha
    profile.extra_url_markers = {"checkpoint/challenge", "/authwall"};
    profile.extra_presence_markers = {
      {"div#captcha-internal", "selector:captcha-internal"},
      {"div#recaptcha-element", "selector:recaptcha-element"},
      {"div.authwall-join-form", "selector:authwall-join-form"},
      {"div.authwall-join-form__title", "selector:authwall-join-form"}
    };
    profile.extra_body_markers = {
      "sign in to linkedin",
      "join linkedin",
      "security verification",
      "authwall"
    };
  } else if (!key.empty() && key != "generic") {
    LOG_WARN("ChallengeDetector", "Unknown detector profile '" + name + "', using generic");
  }

  return profile;
}

bool IsInterstitial(const ChallengeVerdict& verdict) {
  return verdict.blocked &&
         (StartsWith(verdict.reason, "title:") || StartsWith(verdict.reason, "url:"));
}

ChallengeDetector::ChallengeDetector(DetectorProfile profile)
    : profile_(std::move(profile)) {
  // Already lowercase
  challenge_titles_ = {
    "just a moment...",
    "attention required! | cloudflare",
    "please wait...",
    "checking your browser"
  };

  url_markers_ = {
    "__cf_chl",
    "/cdn-cgi/",
    "challenges.cloudflare.com",
    "cf-challenge"
  };
  for (const auto& marker : profile_.extra_url_markers) {
    url_markers_.push_back(ToLower(marker));
  }

  presence_markers_ = {
    {"#cf-challenge-running", "selector:#cf-challenge-running"},
    {"form#challenge-form", "selector:form#challenge-form"},
    {"iframe[src*='challenges.cloudflare.com']", "selector:cloudflare-iframe"}
  };
  presence_markers_.insert(presence_markers_.end(),
                           profile_.extra_presence_markers.begin(),
                           profile_.extra_presence_markers.end());

  // Generic enough to match hidden template nodes, so they must be visible
  visibility_markers_ = {
    {"iframe[src*='hcaptcha.com']", "selector:hcaptcha-iframe"},
    {"iframe[src*='recaptcha']", "selector:recaptcha-iframe"},
    {".cf-turnstile", "selector:cf-turnstile"},
    {"[data-sitekey]", "selector:data-sitekey"}
  };

  body_markers_ = {
    "verify you are human",
    "additional verification required",
    "please verify you're a human",
    "checking your browser before accessing"
  };
  for (const auto& marker : profile_.extra_body_markers) {
    body_markers_.push_back(ToLower(marker));
  }

  query_.presence_selectors = profile_.content_markers;
  for (const auto& marker : presence_markers_) {
    query_.presence_selectors.push_back(marker.selector);
  }
  for (const auto& marker : visibility_markers_) {
    query_.visibility_selectors.push_back(marker.selector);
  }
  query_.read_body_text = true;
}

ChallengeVerdict ChallengeDetector::Classify(const PageSignal& signal) const {
  // Only a stopped capture leaves parts unread; a complete snapshot treats
  // missing selector entries as absent
  const bool stopped = !signal.complete();

  if (stopped && !signal.title_captured) {
    return ChallengeVerdict::Clear();
  }
  std::string title = ToLower(signal.title);
  for (const auto& marker : challenge_titles_) {
    if (Contains(title, marker)) {
      return ChallengeVerdict::Blocked("title:" + marker);
    }
  }

  if (stopped && !signal.url_captured) {
    return ChallengeVerdict::Clear();
  }
  std::string url = ToLower(signal.url);
  for (const auto& marker : url_markers_) {
    if (Contains(url, marker)) {
      return ChallengeVerdict::Blocked("url:" + marker);
    }
  }

  for (const auto& selector : profile_.content_markers) {
    std::optional<bool> present = signal.Present(selector);
    if (!present && stopped) {
      return ChallengeVerdict::Clear();
    }
    if (present.value_or(false)) {
      LOG_DEBUG("ChallengeDetector", "Content marker present: " + selector);
      return ChallengeVerdict::Clear();
    }
  }

  for (const auto& marker : presence_markers_) {
    std::optional<bool> present = signal.Present(marker.selector);
    if (!present && stopped) {
      return ChallengeVerdict::Clear();
    }
    if (present.value_or(false)) {
      return ChallengeVerdict::Blocked(marker.reason);
    }
  }

  for (const auto& marker : visibility_markers_) {
    std::optional<bool> visible = signal.Visible(marker.selector);
    if (!visible && stopped) {
      return ChallengeVerdict::Clear();
    }
    if (visible.value_or(false)) {
      return ChallengeVerdict::Blocked(marker.reason);
    }
  }

  if (stopped && !signal.body_captured) {
    return ChallengeVerdict::Clear();
  }
  std::string body = ToLower(signal.body_text);
  for (const auto& marker : body_markers_) {
    if (Contains(body, marker)) {
      return ChallengeVerdict::Blocked("body:" + marker);
    }
  }

  return ChallengeVerdict::Clear();
}

ChallengeVerdict ChallengeDetector::ClassifyPage(BrowserPage& page) const {
  PageSignal signal = CapturePageSignal(page, query_);
  if (!signal.complete()) {
    LOG_DEBUG("ChallengeDetector", "Partial snapshot (" + signal.capture_error +
              "), failing open past it");
  }
  return Classify(signal);
}

}  // namespace hawk
