#pragma once

#include "hawk_solver_backend.h"

namespace hawk {

// Turns on run-wide skip mode; collection continues without optional fetches
class SkipBackend : public SolverBackend {
public:
  explicit SkipBackend(RunFlags* flags);

  BackendKind Kind() const override { return BackendKind::SKIP; }
  std::string Name() const override { return "skip"; }
  bool IsViable(const SolveRequest& request) override;
  SolveOutcome Resolve(SolveRequest& request) override;

private:
  RunFlags* flags_;
};

}  // namespace hawk
