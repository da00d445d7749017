#include "hawk_skip_backend.h"
#include "logger.h"

namespace hawk {

SkipBackend::SkipBackend(RunFlags* flags) : flags_(flags) {}

bool SkipBackend::IsViable(const SolveRequest& request) {
  (void)request;
  return flags_ != nullptr;
}

SolveOutcome SkipBackend::Resolve(SolveRequest& request) {
  SolveOutcome outcome;
  outcome.backend = Name();
  outcome.action = PolicyAction::SKIP;
  outcome.reason = "policy_skip";

  if (!flags_->skip_optional_fetches) {
    LOG_WARN("SkipBackend", "Skipping remaining detail fetches for this run (" +
             request.verdict.reason + ")");
  }
  flags_->skip_optional_fetches = true;
  return outcome;
}

}  // namespace hawk
