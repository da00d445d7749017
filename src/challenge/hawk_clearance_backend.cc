#include "hawk_clearance_backend.h"
#include <utility>
#include "hawk_string_utils.h"
#include "logger.h"

namespace hawk {

ClearanceBackend::ClearanceBackend(std::unique_ptr<ClearanceClient> client)
    : client_(std::move(client)) {}

bool ClearanceBackend::IsViable(const SolveRequest& request) {
  if (!client_ || !request.page || !request.context || request.page_url.empty()) {
    return false;
  }
  if (!IsInterstitial(request.verdict) && !request.fallback_to_full_challenge) {
    return false;
  }
  return client_->IsAvailable();
}

SolveOutcome ClearanceBackend::Resolve(SolveRequest& request) {
  SolveOutcome outcome;
  outcome.backend = Name();

  LOG_INFO("ClearanceBackend", "Requesting clearance for " + Truncate(request.page_url, 80));
  ClearanceResult result = client_->Solve(request.page_url, request.proxy_url);
  outcome.attempted = true;

  if (!result.success) {
    outcome.reason = "solve_error:" + result.error;
    outcome.error = ErrorKind::SOLVE;
    LOG_WARN("ClearanceBackend", "Clearance failed: " + result.error);
    return outcome;
  }
  if (result.cookies.empty()) {
    outcome.reason = "solve_error:no cookies returned";
    outcome.error = ErrorKind::SOLVE;
    LOG_WARN("ClearanceBackend", "Clearance service returned no usable cookies");
    return outcome;
  }

  PageResult<bool> added = request.context->AddCookies(result.cookies);
  if (!added.success) {
    outcome.reason = "injection_failed";
    outcome.error = ErrorKind::INJECTION;
    LOG_WARN("ClearanceBackend", "Failed to add clearance cookies: " + added.message);
    return outcome;
  }

  PageResult<bool> reloaded = request.page->Reload();
  if (!reloaded.success) {
    outcome.reason = "reload_failed";
    outcome.error = ErrorKind::NAVIGATION;
    LOG_WARN("ClearanceBackend", "Reload after clearance failed: " + reloaded.message);
    return outcome;
  }

  LOG_INFO("ClearanceBackend", "Injected " + std::to_string(result.cookies.size()) +
           " clearance cookies and reloaded");
  outcome.ok = true;
  outcome.reason = "cleared";
  outcome.user_agent = result.user_agent;
  return outcome;
}

}  // namespace hawk
