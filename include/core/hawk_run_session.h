#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hawk_backoff_controller.h"
#include "hawk_challenge_detector.h"
#include "hawk_challenge_event_log.h"
#include "hawk_challenge_resolver.h"
#include "hawk_checkpoint_writer.h"
#include "hawk_config.h"
#include "hawk_debug_artifacts.h"
#include "hawk_dedupe_store.h"
#include "hawk_fetch_cache.h"
#include "hawk_job_posting.h"
#include "hawk_proxy_session_manager.h"
#include "hawk_run_flags.h"
#include "hawk_run_metrics.h"

namespace hawk {

class OperatorPrompt;

// How a challenge episode ended
enum class EpisodeResult {
  CLEAR,              // page was not blocked
  RESOLVED,           // blocked, then verified clear
  SKIP,               // skip mode engaged; keep collecting without optional fetches
  ABORT,              // stop the run
  RELAUNCH_REQUIRED   // proxy rotated; relaunch the browser with CurrentProxy()
};

const char* EpisodeResultToString(EpisodeResult result);

struct NavigationOutcome {
  bool ok = false;
  int attempts = 0;
  ErrorKind error = ErrorKind::NONE;
  std::string message;
  bool relaunch_required = false;   // rotate_on_failure replaced the proxy session
};

/**
 * RunSession - all mutable state of one collection run
 *
 * Owns the detector, resolver, backoff counter, proxy sessions, dedupe
 * store, metrics, checkpoint writer, challenge log and debug artifacts.
 * Nothing here is process-global, so runs can coexist in one process.
 * Single-threaded: the collector drives one page at a time.
 */
class RunSession {
public:
  /**
   * @param transport HTTP transport for solver services; must outlive the session
   * @param prompt operator prompt for the pause policy; must outlive the session
   */
  RunSession(const HawkConfig& config, HttpTransport* transport, OperatorPrompt* prompt,
             TimeSource time = TimeSource::Default());

  RunSession(const RunSession&) = delete;
  RunSession& operator=(const RunSession&) = delete;

  // Proxy for the next browser launch (the query's session under query scope)
  std::optional<ProxyDescriptor> BeginQuery(const std::string& query);
  const std::optional<ProxyDescriptor>& CurrentProxy() const { return current_proxy_; }

  // Installs the render hook on a fresh page when enabled
  PageResult<bool> PreparePage(BrowserPage& page);

  /**
   * Classify the page and, when blocked, run one challenge episode:
   * log the event, capture artifacts on the run's first challenge, resolve,
   * verify, and between rounds wait out the backoff delay. At most
   * captcha.max_episode_rounds resolve rounds per episode.
   *
   * @param context browser context for cookie injection; may be null
   */
  EpisodeResult HandleChallenge(BrowserPage& page, BrowserContextHandle* context,
                                const std::string& url);

  /**
   * Run a navigation, retrying failures with navigation jitter. At most
   * navigation.max_retries attempts; stops at once when abort was requested.
   */
  NavigationOutcome Navigate(const std::function<PageResult<bool>()>& navigate);

  /**
   * Detail fetch through the run's cache: SKIPPED in skip mode and ABORTED
   * after an abort, without calling fetch; otherwise at most one fetch per URL.
   */
  template <typename Value>
  FetchResult<Value> FetchDetail(FetchCache<Value>& cache, const std::string& url,
                                 const typename FetchCache<Value>::FetchFn& fetch) {
    if (flags_.abort_requested) {
      metrics_.Inc("detail_fetches_aborted");
      return FetchResult<Value>::Aborted();
    }
    if (flags_.skip_optional_fetches) {
      metrics_.Inc("detail_fetches_skipped");
      return FetchResult<Value>::Skipped();
    }

    FetchResult<Value> result = cache.GetOrFetch(url, fetch);
    if (result.from_cache) {
      metrics_.Inc("detail_cache_hits");
    } else if (result.terminal()) {
      detail_fetch_count_++;
      metrics_.Inc("detail_fetches");
      metrics_.Inc(std::string("detail_fetches_") + FetchStatusToString(result.status));
    }
    return result;
  }

  // Adds the item, updates counters and writes a checkpoint every interval items
  void OnItemCollected(const JobPosting& item, const std::string& current_query);

  /**
   * Close the run over the collected items: drop items already recorded by
   * earlier runs, append the new ones to the dedupe log, write the final
   * checkpoint and the metrics file. Safe to call after an abort; later
   * calls return the first summary.
   */
  nlohmann::json Finish(const nlohmann::json& extra = nlohmann::json::object());

  const RunFlags& flags() const { return flags_; }
  void RequestAbort();

  const std::vector<JobPosting>& items() const { return items_; }
  const std::vector<JobPosting>& fresh_items() const { return fresh_items_; }
  int detail_fetch_count() const { return detail_fetch_count_; }
  const std::string& user_agent_hint() const { return user_agent_hint_; }

  const ChallengeDetector& detector() const { return detector_; }
  BackoffController& backoff() { return backoff_; }
  ProxySessionManager& proxy() { return proxy_; }
  RunMetrics& metrics() { return metrics_; }
  const ChallengeEventLog& event_log() const { return event_log_; }
  const CheckpointWriter& checkpoint() const { return checkpoint_; }
  const DedupeStore& dedupe() const { return dedupe_; }

private:
  std::string ScopeKey() const;
  ChallengeVerdict Observe(BrowserPage& page, PageSignal* signal);
  void BeginEpisode(BrowserPage& page, const std::string& url, const ChallengeVerdict& verdict);
  void RecordOutcome(const SolveOutcome& outcome, const ChallengeVerdict& verdict,
                     const std::string& url, int round);
  EpisodeResult CloseResolved(const std::string& url);
  EpisodeResult CloseUnresolved(EpisodeResult result, const std::string& url);

  HawkConfig config_;
  TimeSource time_;
  RunFlags flags_;
  ChallengeDetector detector_;
  ChallengeResolver resolver_;
  BackoffController backoff_;
  ProxySessionManager proxy_;
  DedupeStore dedupe_;
  RunMetrics metrics_;
  CheckpointWriter checkpoint_;
  ChallengeEventLog event_log_;
  DebugArtifactRecorder artifacts_;

  std::vector<JobPosting> items_;
  std::vector<JobPosting> fresh_items_;
  std::string current_query_;
  std::optional<ProxyDescriptor> current_proxy_;
  std::string user_agent_hint_;
  int detail_fetch_count_ = 0;
  bool finished_ = false;
  nlohmann::json summary_;
};

}  // namespace hawk
