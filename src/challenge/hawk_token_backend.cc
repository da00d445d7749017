#include "hawk_token_backend.h"
#include <algorithm>
#include <utility>
#include "hawk_string_utils.h"
#include "hawk_token_injector.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

namespace {

const int kRetryDelayBaseSeconds = 5;
const int kRetryDelayCapSeconds = 30;
const int kRetryJitterMaxMs = 1500;

std::string ReadUserAgent(BrowserPage& page) {
  PageResult<json> result = page.Evaluate("() => navigator.userAgent", json());
  if (result.success && result.value.is_string()) {
    return result.value.get<std::string>();
  }
  return "";
}

// A full-page challenge carrying a widget: the field path cannot clear it
bool IsDisguisedFullChallenge(const SolveRequest& request) {
  return IsInterstitial(request.verdict) ||
         (request.widget && !request.widget->page_data.empty());
}

}  // namespace

TokenSolverBackend::TokenSolverBackend(const CaptchaConfig& config,
                                       std::unique_ptr<TokenSolverClient> client,
                                       TimeSource time)
    : config_(config), client_(std::move(client)), time_(std::move(time)) {}

std::string TokenSolverBackend::Name() const {
  return client_ ? "token:" + client_->Name() : "token";
}

bool TokenSolverBackend::IsViable(const SolveRequest& request) {
  return client_ != nullptr && request.page != nullptr && request.widget.has_value() &&
         !request.widget->sitekey.empty();
}

std::chrono::milliseconds TokenSolverBackend::RetryDelay(int attempt) const {
  int exponent = std::min(std::max(attempt - 1, 0), 10);
  int seconds = std::min(kRetryDelayBaseSeconds * (1 << exponent), kRetryDelayCapSeconds);
  return std::chrono::seconds(seconds) + RandomJitter(0, kRetryJitterMaxMs);
}

bool TokenSolverBackend::AwaitToken(const std::string& task_id, std::string* token,
                                    std::string* error) {
  auto deadline = time_.now() + std::chrono::seconds(std::max(config_.solve_timeout_seconds, 1));
  auto interval = std::chrono::seconds(std::max(config_.poll_interval_seconds, 1));

  while (time_.now() < deadline) {
    TaskPoll poll = client_->PollTask(task_id);
    if (poll.state == TaskState::READY) {
      *token = Trim(poll.token);
      if (token->empty()) {
        *error = client_->Name() + " returned empty token";
        return false;
      }
      return true;
    }
    if (poll.state == TaskState::FAILED) {
      *error = poll.error.empty() ? client_->Name() + " task failed" : poll.error;
      return false;
    }
    time_.sleep(interval);
  }

  *error = client_->Name() + " timed out waiting for solution";
  return false;
}

SolveOutcome TokenSolverBackend::Resolve(SolveRequest& request) {
  SolveOutcome outcome;
  outcome.backend = Name();

  if (!client_) {
    outcome.reason = "solver_not_configured";
    outcome.error = ErrorKind::SOLVE;
    return outcome;
  }
  if (!request.widget || request.widget->sitekey.empty()) {
    outcome.reason = "no_sitekey_found";
    return outcome;
  }

  const WidgetParams& widget = *request.widget;
  TokenTask task;
  task.widget = widget;
  task.page_url = request.page_url;
  task.user_agent = ReadUserAgent(*request.page);

  int max_attempts = std::max(config_.max_solve_attempts, 1);
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    LOG_INFO("TokenSolver", "Attempting " + std::string(WidgetKindToString(widget.kind)) +
             " solve " + std::to_string(attempt) + "/" + std::to_string(max_attempts) +
             " (url=" + Truncate(request.page_url, 80) + ")");

    TaskSubmission submission = client_->CreateTask(task);
    if (!submission.success) {
      outcome.reason = "solve_error:" + submission.error;
      outcome.error = ErrorKind::SOLVE;
      LOG_WARN("TokenSolver", "Solve failed (attempt " + std::to_string(attempt) + "): " +
               submission.error);
    } else {
      outcome.attempted = true;
      outcome.estimated_cost_usd += config_.estimated_cost_usd_per_solve;

      std::string token;
      std::string error;
      if (!AwaitToken(submission.task_id, &token, &error)) {
        outcome.reason = "solve_error:" + error;
        outcome.error = ErrorKind::SOLVE;
        LOG_WARN("TokenSolver", "Solve failed (attempt " + std::to_string(attempt) + "): " + error);
      } else {
        InjectionResult injected = InjectToken(*request.page, widget, token);
        if (injected.success) {
          LOG_INFO("TokenSolver", "Token injected via " + injected.method +
                   (injected.submitted ? " (form submitted)" : ""));
          outcome.ok = true;
          outcome.reason = "solved";
          outcome.error = ErrorKind::NONE;
          return outcome;
        }

        outcome.reason = "injection_failed";
        outcome.error = ErrorKind::INJECTION;
        LOG_WARN("TokenSolver", "Failed to inject token (attempt " + std::to_string(attempt) +
                 "): " + injected.message);
        if (IsDisguisedFullChallenge(request)) {
          LOG_INFO("TokenSolver", "Widget sits on a full-page challenge; handing over to clearance");
          outcome.fallback_to_full_challenge = true;
          return outcome;
        }
      }
    }

    if (attempt < max_attempts) {
      std::chrono::milliseconds delay = RetryDelay(attempt);
      LOG_INFO("TokenSolver", "Waiting " + std::to_string(delay.count() / 1000) +
               "s before retrying captcha solve");
      time_.sleep(delay);
    }
  }

  LOG_WARN("TokenSolver", "All captcha solve attempts exhausted");
  return outcome;
}

}  // namespace hawk
