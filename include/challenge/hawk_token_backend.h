#pragma once

#include <memory>
#include "hawk_solver_backend.h"
#include "hawk_solver_client.h"

namespace hawk {

/**
 * TokenSolverBackend - solves a widget through a token API and injects the token
 *
 * Every attempt submits a fresh task; a token is used at most once. Between
 * attempts the backend sleeps min(5 * 2^(attempt-1), 30) seconds plus up to
 * 1.5 seconds of jitter.
 */
class TokenSolverBackend : public SolverBackend {
public:
  TokenSolverBackend(const CaptchaConfig& config, std::unique_ptr<TokenSolverClient> client,
                     TimeSource time = TimeSource::Default());

  BackendKind Kind() const override { return BackendKind::TOKEN_SOLVER; }
  std::string Name() const override;
  bool IsViable(const SolveRequest& request) override;
  SolveOutcome Resolve(SolveRequest& request) override;

  bool configured() const { return client_ != nullptr; }

private:
  // Polls until READY, FAILED or the solve timeout; token or error set on return
  bool AwaitToken(const std::string& task_id, std::string* token, std::string* error);
  std::chrono::milliseconds RetryDelay(int attempt) const;

  CaptchaConfig config_;
  std::unique_ptr<TokenSolverClient> client_;
  TimeSource time_;
};

}  // namespace hawk
