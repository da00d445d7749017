#include "hawk_solver_backend.h"
#include <utility>
#include "hawk_clearance_backend.h"
#include "hawk_manual_backend.h"
#include "hawk_skip_backend.h"
#include "hawk_token_backend.h"
#include "logger.h"

namespace hawk {

const char* BackendKindToString(BackendKind kind) {
  switch (kind) {
    case BackendKind::TOKEN_SOLVER: return "token_solver";
    case BackendKind::CHALLENGE_SOLVER: return "challenge_solver";
    case BackendKind::MANUAL: return "manual";
    case BackendKind::SKIP: return "skip";
    default: return "unknown";
  }
}

const char* PolicyActionToString(PolicyAction action) {
  switch (action) {
    case PolicyAction::NONE: return "none";
    case PolicyAction::RETRY: return "retry";
    case PolicyAction::SKIP: return "skip";
    case PolicyAction::ABORT: return "abort";
    default: return "unknown";
  }
}

std::vector<std::unique_ptr<SolverBackend>> BuildSolverBackends(const HawkConfig& config,
                                                                HttpTransport* transport,
                                                                OperatorPrompt* prompt,
                                                                RunFlags* flags,
                                                                const TimeSource& time) {
  std::vector<std::unique_ptr<SolverBackend>> backends;

  if (config.captcha.enabled) {
    std::unique_ptr<TokenSolverClient> client = CreateTokenSolverClient(config.captcha, transport);
    if (client) {
      LOG_DEBUG("SolverBackends", "Creating token solver backend (" + client->Name() + ")");
      backends.push_back(std::make_unique<TokenSolverBackend>(config.captcha, std::move(client),
                                                              time));
    }
  }

  if (config.clearance.enabled) {
    LOG_DEBUG("SolverBackends", "Creating clearance backend (" + config.clearance.url + ")");
    backends.push_back(std::make_unique<ClearanceBackend>(
        std::make_unique<ClearanceClient>(config.clearance, transport)));
  }

  LOG_DEBUG("SolverBackends", "Creating manual and skip backends");
  backends.push_back(std::make_unique<ManualBackend>(prompt));
  backends.push_back(std::make_unique<SkipBackend>(flags));

  std::string names;
  for (const auto& backend : backends) {
    if (!names.empty()) names += ", ";
    names += backend->Name();
  }
  LOG_INFO("SolverBackends", "Challenge backends: " + names);
  return backends;
}

}  // namespace hawk
