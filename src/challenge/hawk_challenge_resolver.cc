#include "hawk_challenge_resolver.h"
#include <utility>
#include "logger.h"

namespace hawk {

ChallengeResolver::ChallengeResolver(const CaptchaConfig& config,
                                     const ChallengeDetector* detector,
                                     std::vector<std::unique_ptr<SolverBackend>> backends,
                                     RunFlags* flags, TimeSource time)
    : config_(config),
      detector_(detector),
      backends_(std::move(backends)),
      flags_(flags),
      time_(std::move(time)) {}

SolverBackend* ChallengeResolver::FindBackend(BackendKind kind) const {
  for (const auto& backend : backends_) {
    if (backend->Kind() == kind) return backend.get();
  }
  return nullptr;
}

bool ChallengeResolver::WaitForAutoClear(BrowserPage& page) {
  if (config_.auto_clear_wait_seconds <= 0 || !detector_) {
    return false;
  }

  LOG_INFO("ChallengeResolver", "Waiting up to " + std::to_string(config_.auto_clear_wait_seconds) +
           "s for the challenge to clear on its own");
  for (int waited = 0; waited < config_.auto_clear_wait_seconds; ++waited) {
    time_.sleep(std::chrono::seconds(1));
    if (!detector_->ClassifyPage(page).blocked) {
      LOG_INFO("ChallengeResolver", "Challenge cleared after " + std::to_string(waited + 1) + "s");
      return true;
    }
  }
  return false;
}

SolveOutcome ChallengeResolver::ApplyPolicy(SolveRequest& request) {
  SolverBackend* manual = FindBackend(BackendKind::MANUAL);
  SolverBackend* skip = FindBackend(BackendKind::SKIP);

  switch (config_.on_detect) {
    case ChallengePolicy::PAUSE:
      if (manual && manual->IsViable(request)) {
        return manual->Resolve(request);
      }
      LOG_WARN("ChallengeResolver", "Input is not interactive; falling back to skip");
      break;

    case ChallengePolicy::ABORT: {
      SolveOutcome outcome;
      outcome.backend = "policy";
      outcome.reason = "policy_abort";
      outcome.action = PolicyAction::ABORT;
      outcome.error = ErrorKind::ABORT;
      return outcome;
    }

    case ChallengePolicy::SKIP:
    default:
      break;
  }

  if (skip && skip->IsViable(request)) {
    return skip->Resolve(request);
  }

  SolveOutcome outcome;
  outcome.backend = "policy";
  outcome.reason = "policy_skip";
  outcome.action = PolicyAction::SKIP;
  return outcome;
}

void ChallengeResolver::ApplyAction(SolveOutcome* outcome) {
  if (!flags_) return;

  if (outcome->action == PolicyAction::SKIP) {
    flags_->skip_optional_fetches = true;
    flags_->skip_episodes++;
    int limit = config_.max_skip_episodes_before_abort;
    if (limit > 0 && flags_->skip_episodes >= limit) {
      LOG_WARN("ChallengeResolver", "Skip episode " + std::to_string(flags_->skip_episodes) +
               " reached the limit of " + std::to_string(limit) + "; aborting run");
      outcome->action = PolicyAction::ABORT;
      outcome->reason = "skip_escalated_to_abort";
      outcome->error = ErrorKind::ABORT;
    }
  }

  if (outcome->action == PolicyAction::ABORT) {
    flags_->abort_requested = true;
  }
}

PolicyAction ChallengeResolver::EngageSkip(const std::string& reason) {
  SolveOutcome outcome;
  outcome.reason = reason;
  outcome.action = PolicyAction::SKIP;
  ApplyAction(&outcome);
  return outcome.action;
}

SolveOutcome ChallengeResolver::Resolve(const PageSignal& signal, const ChallengeVerdict& verdict,
                                        BrowserPage& page, const ResolveContext& context) {
  SolveRequest request;
  request.page = &page;
  request.context = context.browser_context;
  request.verdict = verdict;
  request.page_url = context.url.empty() ? signal.url : context.url;
  request.query = context.query;
  request.proxy_url = context.proxy_url;

  if (WaitForAutoClear(page)) {
    SolveOutcome outcome;
    outcome.ok = true;
    outcome.reason = "auto_cleared";
    outcome.backend = "auto_clear";
    return outcome;
  }

  if (FindBackend(BackendKind::TOKEN_SOLVER)) {
    request.widget = extractor_.Extract(page);
    if (!request.widget) {
      LOG_INFO("ChallengeResolver", "No supported captcha widget found (" + verdict.reason + ")");
    }
  }

  bool attempted = false;
  double cost = 0.0;
  SolveOutcome last_auto;

  for (const auto& backend : backends_) {
    if (backend->Kind() != BackendKind::TOKEN_SOLVER &&
        backend->Kind() != BackendKind::CHALLENGE_SOLVER) {
      continue;
    }
    if (!backend->IsViable(request)) {
      LOG_DEBUG("ChallengeResolver", backend->Name() + " not viable for " + verdict.reason);
      continue;
    }

    SolveOutcome outcome = backend->Resolve(request);
    attempted = attempted || outcome.attempted;
    cost += outcome.estimated_cost_usd;

    if (outcome.ok) {
      outcome.attempted = attempted;
      outcome.estimated_cost_usd = cost;
      LOG_INFO("ChallengeResolver", "Challenge resolved by " + outcome.backend);
      return outcome;
    }
    if (outcome.fallback_to_full_challenge) {
      request.fallback_to_full_challenge = true;
    }
    last_auto = outcome;
  }

  SolveOutcome outcome = ApplyPolicy(request);
  outcome.attempted = attempted;
  outcome.estimated_cost_usd = cost;
  outcome.fallback_to_full_challenge = request.fallback_to_full_challenge;
  if (outcome.error == ErrorKind::NONE) {
    outcome.error = last_auto.error;
  }
  ApplyAction(&outcome);

  LOG_INFO("ChallengeResolver", "Challenge not resolved automatically; action=" +
           std::string(PolicyActionToString(outcome.action)) + " reason=" + outcome.reason);
  return outcome;
}

}  // namespace hawk
