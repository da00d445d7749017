#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "hawk_browser_page.h"
#include "hawk_challenge_detector.h"
#include "hawk_config.h"
#include "hawk_errors.h"
#include "hawk_http_client.h"
#include "hawk_run_flags.h"
#include "hawk_time_source.h"
#include "hawk_widget_params.h"

namespace hawk {

class OperatorPrompt;

enum class BackendKind {
  TOKEN_SOLVER,       // third-party widget token API
  CHALLENGE_SOLVER,   // third-party whole-page clearance service
  MANUAL,             // operator pause
  SKIP                // stop optional fetches for the run
};

const char* BackendKindToString(BackendKind kind);

// What the caller should do once the episode's resolve attempt is over
enum class PolicyAction {
  NONE,    // nothing beyond re-checking the page
  RETRY,   // operator resumed; re-check and continue
  SKIP,    // skip mode engaged
  ABORT    // stop the run
};

const char* PolicyActionToString(PolicyAction action);

/**
 * SolveOutcome - structured result of one resolve attempt
 *
 * `attempted` is true as soon as a billable external solve call was made,
 * whether or not it succeeded.
 */
struct SolveOutcome {
  bool ok = false;
  std::string reason;
  bool attempted = false;
  ErrorKind error = ErrorKind::NONE;
  std::string backend;
  PolicyAction action = PolicyAction::NONE;
  bool fallback_to_full_challenge = false;
  std::string user_agent;           // set by the clearance backend
  double estimated_cost_usd = 0.0;
};

/**
 * SolveRequest - everything a backend may consult for one blocked page
 */
struct SolveRequest {
  BrowserPage* page = nullptr;
  BrowserContextHandle* context = nullptr;   // may be null; clearance then declines
  ChallengeVerdict verdict;
  std::string page_url;
  std::string query;
  std::string proxy_url;                     // current proxy, handed to clearance services
  std::optional<WidgetParams> widget;        // filled once by the resolver
  bool fallback_to_full_challenge = false;   // a token attempt flagged a disguised full challenge
};

/**
 * SolverBackend - one way of getting past a challenge
 *
 * Backends are built once per run from configuration and consulted in the
 * order BuildSolverBackends returns them.
 */
class SolverBackend {
public:
  virtual ~SolverBackend() = default;

  virtual BackendKind Kind() const = 0;
  virtual std::string Name() const = 0;

  // Cheap check; never makes a billable call
  virtual bool IsViable(const SolveRequest& request) = 0;

  virtual SolveOutcome Resolve(SolveRequest& request) = 0;
};

/**
 * Build the configured backends, automatic ones first:
 * token solver (captcha.enabled with an API key), clearance service
 * (flaresolverr.enabled), manual, skip. The manual and skip backends are
 * always present; the resolver's policy decides when they run.
 *
 * @param transport HTTP transport shared by the service clients; must outlive the backends
 * @param prompt operator prompt for the manual backend; must outlive the backends
 * @param flags run flags the skip backend sets; must outlive the backends
 */
std::vector<std::unique_ptr<SolverBackend>> BuildSolverBackends(const HawkConfig& config,
                                                                HttpTransport* transport,
                                                                OperatorPrompt* prompt,
                                                                RunFlags* flags,
                                                                const TimeSource& time);

}  // namespace hawk
