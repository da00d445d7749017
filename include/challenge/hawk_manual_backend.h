#pragma once

#include <string>
#include "hawk_solver_backend.h"

namespace hawk {

/**
 * OperatorPrompt - asks a human what to do about a blocked page
 */
class OperatorPrompt {
public:
  virtual ~OperatorPrompt() = default;

  virtual bool IsInteractive() const = 0;

  // RETRY after the operator solved it in the browser, SKIP or ABORT
  virtual PolicyAction Ask(const ChallengeVerdict& verdict, const std::string& url) = 0;
};

// stdin/stdout prompt; interactive only when stdin is a terminal
class ConsoleOperatorPrompt : public OperatorPrompt {
public:
  bool IsInteractive() const override;
  PolicyAction Ask(const ChallengeVerdict& verdict, const std::string& url) override;
};

class ManualBackend : public SolverBackend {
public:
  explicit ManualBackend(OperatorPrompt* prompt);

  BackendKind Kind() const override { return BackendKind::MANUAL; }
  std::string Name() const override { return "manual"; }
  bool IsViable(const SolveRequest& request) override;
  SolveOutcome Resolve(SolveRequest& request) override;

private:
  OperatorPrompt* prompt_;
};

}  // namespace hawk
