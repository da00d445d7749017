#pragma once

#include <memory>
#include <string>
#include <vector>
#include "hawk_challenge_detector.h"
#include "hawk_sitekey_extractor.h"
#include "hawk_solver_backend.h"

namespace hawk {

// Run-side context of one blocked page
struct ResolveContext {
  BrowserContextHandle* browser_context = nullptr;
  std::string url;          // falls back to the signal's url
  std::string query;
  std::string proxy_url;
};

/**
 * ChallengeResolver - one resolve attempt per challenge episode
 *
 * 1. Optional auto-clear wait for challenges that resolve themselves
 * 2. Automatic backends in order (token solver, then clearance service);
 *    a token attempt that flags a disguised full challenge makes the
 *    clearance backend viable for the same episode
 * 3. Policy fallback from captcha.on_detect: pause (manual when
 *    interactive, else skip), skip or abort
 *
 * Skip outcomes engage run-wide skip mode and count skip episodes; with
 * captcha.max_skip_episodes_before_abort > 0, reaching the count escalates
 * the outcome to abort.
 */
class ChallengeResolver {
public:
  ChallengeResolver(const CaptchaConfig& config, const ChallengeDetector* detector,
                    std::vector<std::unique_ptr<SolverBackend>> backends, RunFlags* flags,
                    TimeSource time = TimeSource::Default());

  SolveOutcome Resolve(const PageSignal& signal, const ChallengeVerdict& verdict,
                       BrowserPage& page, const ResolveContext& context);

  // Skip mode for an episode that ran out of rounds; ABORT once escalated
  PolicyAction EngageSkip(const std::string& reason);

  const std::vector<std::unique_ptr<SolverBackend>>& backends() const { return backends_; }

private:
  bool WaitForAutoClear(BrowserPage& page);
  SolverBackend* FindBackend(BackendKind kind) const;
  SolveOutcome ApplyPolicy(SolveRequest& request);
  void ApplyAction(SolveOutcome* outcome);

  CaptchaConfig config_;
  const ChallengeDetector* detector_;
  std::vector<std::unique_ptr<SolverBackend>> backends_;
  SitekeyExtractor extractor_;
  RunFlags* flags_;
  TimeSource time_;
};

}  // namespace hawk
