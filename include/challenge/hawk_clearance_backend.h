#pragma once

#include <memory>
#include "hawk_clearance_client.h"
#include "hawk_solver_backend.h"

namespace hawk {

/**
 * ClearanceBackend - whole-page challenges through a clearance service
 *
 * Viable for interstitial verdicts, or when a token attempt flagged the
 * widget as a full challenge in disguise. The returned cookies go into the
 * browser context and the page is reloaded; the cookies are bound to the
 * returned user agent, which the caller should adopt on relaunch.
 */
class ClearanceBackend : public SolverBackend {
public:
  explicit ClearanceBackend(std::unique_ptr<ClearanceClient> client);

  BackendKind Kind() const override { return BackendKind::CHALLENGE_SOLVER; }
  std::string Name() const override { return "clearance"; }
  bool IsViable(const SolveRequest& request) override;
  SolveOutcome Resolve(SolveRequest& request) override;

private:
  std::unique_ptr<ClearanceClient> client_;
};

}  // namespace hawk
