#include "hawk_run_session.h"
#include <algorithm>
#include <cmath>
#include <utility>
#include "hawk_render_hook.h"
#include "hawk_string_utils.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

namespace {

DetectorProfile BuildDetectorProfile(const DetectorConfig& config) {
  DetectorProfile profile = BuiltinDetectorProfile(config.profile);
  for (const auto& marker : config.extra_content_markers) {
    if (!marker.empty()) {
      profile.content_markers.push_back(marker);
    }
  }
  return profile;
}

}  // namespace

const char* EpisodeResultToString(EpisodeResult result) {
  switch (result) {
    case EpisodeResult::CLEAR: return "clear";
    case EpisodeResult::RESOLVED: return "resolved";
    case EpisodeResult::SKIP: return "skip";
    case EpisodeResult::ABORT: return "abort";
    case EpisodeResult::RELAUNCH_REQUIRED: return "relaunch_required";
    default: return "unknown";
  }
}

RunSession::RunSession(const HawkConfig& config, HttpTransport* transport,
                       OperatorPrompt* prompt, TimeSource time)
    : config_(config),
      time_(std::move(time)),
      detector_(BuildDetectorProfile(config.detector)),
      resolver_(config.captcha, &detector_,
                BuildSolverBackends(config, transport, prompt, &flags_, time_), &flags_, time_),
      backoff_(config.backoff, time_),
      proxy_(config.proxy, time_),
      dedupe_(config.output.dedupe_path),
      metrics_(config.board, time_),
      checkpoint_(config.checkpoint.path, config.checkpoint.interval),
      event_log_(config.output.challenge_log_path),
      artifacts_(config.output.artifact_dir, config.output.debug_artifacts) {
  LOG_INFO("RunSession", "Run " + metrics_.run_id() + " started (board=" + config_.board +
           ", policy=" + ChallengePolicyToString(config_.captcha.on_detect) +
           ", proxy=" + (proxy_.enabled() ? "on" : "off") + ")");
}

std::string RunSession::ScopeKey() const {
  if (config_.proxy.session_scope == SessionScope::QUERY && !current_query_.empty()) {
    return current_query_;
  }
  return "run";
}

std::optional<ProxyDescriptor> RunSession::BeginQuery(const std::string& query) {
  current_query_ = query;
  metrics_.Inc("queries");
  if (proxy_.enabled()) {
    current_proxy_ = proxy_.GetProxyFor(ScopeKey());
  }
  return current_proxy_;
}

PageResult<bool> RunSession::PreparePage(BrowserPage& page) {
  if (!config_.captcha.install_render_hook) {
    return PageResult<bool>::Ok(false);
  }
  PageResult<bool> installed = InstallRenderHook(page);
  if (!installed.success) {
    LOG_WARN("RunSession", "Render hook not installed: " + installed.message);
  }
  return installed;
}

void RunSession::RequestAbort() {
  if (!flags_.abort_requested) {
    LOG_WARN("RunSession", "Abort requested");
  }
  flags_.abort_requested = true;
}

ChallengeVerdict RunSession::Observe(BrowserPage& page, PageSignal* signal) {
  *signal = CapturePageSignal(page, detector_.signal_query());
  if (!signal->complete()) {
    metrics_.Inc("detection_errors");
    LOG_DEBUG("RunSession", "Page read incomplete (" +
              std::string(PageStatusToCode(signal->capture_status)) + "); failing open");
  }
  return detector_.Classify(*signal);
}

void RunSession::BeginEpisode(BrowserPage& page, const std::string& url,
                              const ChallengeVerdict& verdict) {
  LOG_WARN("RunSession", "Challenge detected (" + verdict.reason + ") at " + Truncate(url, 100));
  metrics_.Inc("challenges_detected");

  ChallengeEvent event;
  event.query = current_query_;
  event.sequence_number = static_cast<int>(items_.size()) + 1;
  event.detail_fetch_count = detail_fetch_count_;
  event.url = url;
  event.reason = verdict.reason;
  if (!event_log_.Append(event)) {
    metrics_.Inc("challenge_log_write_failures");
  }

  metrics_.RecordEvent("challenge_detected", {
    {"url", url},
    {"reason", verdict.reason},
    {"query", current_query_},
    {"detailFetchCount", detail_fetch_count_}
  });

  if (artifacts_.CaptureOnce(page, "challenge")) {
    metrics_.Inc("debug_artifacts_saved");
  }
}

void RunSession::RecordOutcome(const SolveOutcome& outcome, const ChallengeVerdict& verdict,
                               const std::string& url, int round) {
  if (outcome.attempted) metrics_.Inc("solve_attempts");
  if (outcome.estimated_cost_usd > 0) {
    metrics_.Inc("solve_cost_microusd",
                 static_cast<int64_t>(std::llround(outcome.estimated_cost_usd * 1e6)));
  }
  if (outcome.ok) metrics_.Inc("challenges_solved");
  if (outcome.error == ErrorKind::SOLVE) metrics_.Inc("solve_failures");
  if (outcome.error == ErrorKind::INJECTION) metrics_.Inc("injection_failures");
  if (!outcome.user_agent.empty()) user_agent_hint_ = outcome.user_agent;

  metrics_.RecordEvent("challenge_resolve", {
    {"url", url},
    {"reason", verdict.reason},
    {"round", round},
    {"backend", outcome.backend.empty() ? json() : json(outcome.backend)},
    {"ok", outcome.ok},
    {"result", outcome.reason},
    {"attempted", outcome.attempted},
    {"action", PolicyActionToString(outcome.action)},
    {"error", outcome.error == ErrorKind::NONE ? json() : json(ErrorKindToString(outcome.error))}
  });
}

EpisodeResult RunSession::CloseResolved(const std::string& url) {
  backoff_.OnClear();
  proxy_.RecordChallenge(true);
  metrics_.Inc("challenges_resolved");
  metrics_.RecordEvent("challenge_cleared", {{"url", url}});
  LOG_INFO("RunSession", "Challenge cleared at " + Truncate(url, 100));
  return EpisodeResult::RESOLVED;
}

EpisodeResult RunSession::CloseUnresolved(EpisodeResult result, const std::string& url) {
  metrics_.Inc("challenges_unresolved");
  metrics_.RecordEvent("challenge_unresolved", {
    {"url", url},
    {"result", EpisodeResultToString(result)}
  });

  if (result == EpisodeResult::ABORT) {
    metrics_.Inc("aborts");
    flags_.abort_requested = true;
    if (!checkpoint_.WriteCheckpoint(items_, current_query_)) {
      LOG_ERROR("RunSession", "Checkpoint on abort failed");
    }
    return result;
  }

  if (result == EpisodeResult::SKIP) {
    metrics_.Inc("skip_episodes");
  }

  if (proxy_.enabled() && proxy_.RecordChallenge(false)) {
    current_proxy_ = proxy_.PerformRotation(ScopeKey());
    if (current_proxy_) {
      metrics_.Inc("proxy_rotations");
      metrics_.RecordEvent("proxy_rotated", {
        {"reason", "consecutive_challenges"},
        {"bucket", current_proxy_->bucket},
        {"server", current_proxy_->server}
      });
      backoff_.OnClear();
      return EpisodeResult::RELAUNCH_REQUIRED;
    }
  }
  return result;
}

EpisodeResult RunSession::HandleChallenge(BrowserPage& page, BrowserContextHandle* context,
                                          const std::string& url) {
  if (flags_.abort_requested) {
    return EpisodeResult::ABORT;
  }

  PageSignal signal;
  ChallengeVerdict verdict = Observe(page, &signal);
  if (!verdict.blocked) {
    backoff_.OnClear();
    proxy_.RecordChallenge(true);
    return EpisodeResult::CLEAR;
  }

  std::string page_url = url.empty() ? signal.url : url;
  BeginEpisode(page, page_url, verdict);

  ResolveContext resolve_context;
  resolve_context.browser_context = context;
  resolve_context.url = page_url;
  resolve_context.query = current_query_;
  if (current_proxy_) {
    resolve_context.proxy_url = current_proxy_->ToUrl();
  }

  int max_rounds = std::max(config_.captcha.max_episode_rounds, 1);
  for (int round = 1; round <= max_rounds; ++round) {
    backoff_.OnChallenge();

    SolveOutcome outcome = resolver_.Resolve(signal, verdict, page, resolve_context);
    RecordOutcome(outcome, verdict, page_url, round);

    if (outcome.action == PolicyAction::ABORT) {
      return CloseUnresolved(EpisodeResult::ABORT, page_url);
    }
    if (outcome.action == PolicyAction::SKIP) {
      return CloseUnresolved(EpisodeResult::SKIP, page_url);
    }

    verdict = Observe(page, &signal);
    if (!verdict.blocked) {
      return CloseResolved(page_url);
    }
    LOG_WARN("RunSession", "Still blocked after round " + std::to_string(round) + " (" +
             verdict.reason + ")");

    if (round < max_rounds) {
      backoff_.Wait();
      metrics_.Inc("backoff_waits");
      verdict = Observe(page, &signal);
      if (!verdict.blocked) {
        return CloseResolved(page_url);
      }
    }
  }

  PolicyAction action = resolver_.EngageSkip("episode_rounds_exhausted");
  return CloseUnresolved(action == PolicyAction::ABORT ? EpisodeResult::ABORT
                                                       : EpisodeResult::SKIP,
                         page_url);
}

NavigationOutcome RunSession::Navigate(const std::function<PageResult<bool>()>& navigate) {
  NavigationOutcome outcome;
  int max_attempts = std::max(config_.navigation.max_retries, 1);

  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (flags_.abort_requested) {
      outcome.error = ErrorKind::ABORT;
      outcome.message = "abort requested";
      return outcome;
    }

    outcome.attempts = attempt;
    PageResult<bool> result = navigate();
    if (result.success) {
      outcome.ok = true;
      outcome.error = ErrorKind::NONE;
      outcome.message.clear();
      return outcome;
    }

    outcome.error = ErrorKind::NAVIGATION;
    outcome.message = result.message;
    metrics_.Inc("navigation_failures");
    LOG_WARN("RunSession", "Navigation failed (attempt " + std::to_string(attempt) + "/" +
             std::to_string(max_attempts) + "): " + result.message);

    if (attempt < max_attempts) {
      time_.sleep(RandomJitter(config_.navigation.jitter_min_ms, config_.navigation.jitter_max_ms));
    }
  }

  metrics_.Inc("navigation_gave_up");
  std::optional<ProxyDescriptor> rotated = proxy_.RecordFailure(ScopeKey());
  if (rotated) {
    current_proxy_ = rotated;
    outcome.relaunch_required = true;
    metrics_.Inc("proxy_rotations");
    metrics_.RecordEvent("proxy_rotated", {
      {"reason", "navigation_failure"},
      {"bucket", rotated->bucket},
      {"server", rotated->server}
    });
  }
  return outcome;
}

void RunSession::OnItemCollected(const JobPosting& item, const std::string& current_query) {
  if (!current_query.empty()) {
    current_query_ = current_query;
  }

  JobPosting stored = item;
  if (stored.collected_at.empty()) {
    stored.collected_at = LocalNowIso8601();
  }
  items_.push_back(std::move(stored));

  metrics_.Inc("items_collected");
  if (items_.back().HasSalary()) {
    metrics_.Inc("items_with_salary");
  }
  if (checkpoint_.MaybeWrite(items_, current_query_)) {
    metrics_.Inc("checkpoints_written");
  }
}

json RunSession::Finish(const json& extra) {
  if (finished_) {
    return summary_;
  }
  finished_ = true;

  DedupeSplit split = dedupe_.FilterNew(items_);
  fresh_items_ = split.fresh;
  metrics_.Inc("dedupe_new", static_cast<int64_t>(split.fresh.size()));
  metrics_.Inc("dedupe_duplicates", static_cast<int64_t>(split.duplicates.size()));
  if (!dedupe_.Record(split.fresh)) {
    metrics_.Inc("dedupe_write_failures");
    LOG_ERROR("RunSession", "Dedupe log write failed: " + dedupe_.path());
  }

  if (checkpoint_.WriteCheckpoint(items_, current_query_)) {
    metrics_.Inc("checkpoints_written");
  }

  int64_t with_salary = std::count_if(items_.begin(), items_.end(),
                                      [](const JobPosting& job) { return job.HasSalary(); });
  metrics_.SetGauge("items_total", static_cast<double>(items_.size()));
  metrics_.SetGauge("items_with_salary", static_cast<double>(with_salary));
  metrics_.SetGauge("items_new", static_cast<double>(split.fresh.size()));
  metrics_.SetGauge("detail_fetch_count", detail_fetch_count_);
  metrics_.SetGauge("skip_mode", flags_.skip_optional_fetches ? 1 : 0);
  metrics_.SetGauge("proxy_total_rotations", proxy_.total_rotations());

  json details = extra.is_object() ? extra : json::object();
  details["aborted"] = flags_.abort_requested;
  details["skipMode"] = flags_.skip_optional_fetches;
  details["challengeEvents"] = event_log_.size();
  details["proxy"] = proxy_.StatsJson();

  std::string written = metrics_.WriteJson(config_.output.metrics_path_template, details);
  if (written.empty()) {
    LOG_ERROR("RunSession", "Run metrics could not be written");
  }

  summary_ = metrics_.Finalize(details);
  LOG_INFO("RunSession", "Run " + metrics_.run_id() + " finished: " +
           std::to_string(items_.size()) + " collected, " +
           std::to_string(split.fresh.size()) + " new, " +
           std::to_string(split.duplicates.size()) + " duplicate(s)");
  return summary_;
}

}  // namespace hawk
