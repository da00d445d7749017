#include "hawk_manual_backend.h"
#include <iostream>
#include <unistd.h>
#include "hawk_string_utils.h"
#include "logger.h"

namespace hawk {

bool ConsoleOperatorPrompt::IsInteractive() const {
  return isatty(STDIN_FILENO) != 0;
}

PolicyAction ConsoleOperatorPrompt::Ask(const ChallengeVerdict& verdict, const std::string& url) {
  std::cout << "\nChallenge detected (" << verdict.reason << ") at " << Truncate(url, 100) << "\n"
            << "Choose how to proceed:\n"
            << "  1) Solve manually (pause and resume)\n"
            << "  2) Abort run (save collected data)\n"
            << "  3) Skip remaining detail fetches (continue without them)\n";

  std::string choice;
  while (true) {
    std::cout << "Enter 1, 2, or 3: " << std::flush;
    if (!std::getline(std::cin, choice)) {
      LOG_WARN("OperatorPrompt", "stdin closed while waiting for a choice; skipping");
      return PolicyAction::SKIP;
    }
    choice = Trim(choice);
    if (choice == "1") {
      std::cout << "\nSolve the challenge in the browser window, then press ENTER to continue."
                << std::endl;
      std::string ignored;
      if (!std::getline(std::cin, ignored)) {
        LOG_WARN("OperatorPrompt", "stdin closed while paused; resuming");
      }
      return PolicyAction::RETRY;
    }
    if (choice == "2") return PolicyAction::ABORT;
    if (choice == "3") return PolicyAction::SKIP;
    std::cout << "Invalid choice. Please enter 1, 2, or 3." << std::endl;
  }
}

ManualBackend::ManualBackend(OperatorPrompt* prompt) : prompt_(prompt) {}

bool ManualBackend::IsViable(const SolveRequest& request) {
  (void)request;
  return prompt_ != nullptr && prompt_->IsInteractive();
}

SolveOutcome ManualBackend::Resolve(SolveRequest& request) {
  SolveOutcome outcome;
  outcome.backend = Name();

  LOG_INFO("ManualBackend", "Pausing for operator (" + request.verdict.reason + ")");
  outcome.action = prompt_->Ask(request.verdict, request.page_url);

  switch (outcome.action) {
    case PolicyAction::RETRY:
      outcome.reason = "operator_resumed";
      break;
    case PolicyAction::ABORT:
      outcome.reason = "operator_abort";
      outcome.error = ErrorKind::ABORT;
      break;
    case PolicyAction::SKIP:
      outcome.reason = "operator_skip";
      break;
    default:
      outcome.action = PolicyAction::SKIP;
      outcome.reason = "operator_skip";
      break;
  }
  LOG_INFO("ManualBackend", "Operator chose " + std::string(PolicyActionToString(outcome.action)));
  return outcome;
}

}  // namespace hawk
