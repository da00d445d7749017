#include <gtest/gtest.h>
#include "hawk_challenge_resolver.h"
#include "hawk_clearance_backend.h"
#include "hawk_manual_backend.h"
#include "hawk_skip_backend.h"
#include "hawk_test_fakes.h"
#include "hawk_token_backend.h"

namespace hawk {
namespace {

using json = nlohmann::json;
using testing::FakeBrowserContext;
using testing::FakeBrowserPage;
using testing::FakeHttpTransport;
using testing::FakeTimeSource;
using testing::FakeTokenSolverClient;
using testing::ScriptedOperatorPrompt;

const ChallengeVerdict kWidgetVerdict = ChallengeVerdict::Blocked("selector:cf-turnstile");
const ChallengeVerdict kInterstitial = ChallengeVerdict::Blocked("title:just a moment...");

// Page showing a Turnstile widget; token injection succeeds unless told otherwise
void ShowWidget(FakeBrowserPage& page, bool injection_works = true) {
  page.SetAttribute(".cf-turnstile[data-sitekey]", "data-sitekey", "0x4AAAAAAAWidget");
  page.evaluate_handler = [injection_works](const std::string& script, const json& args) {
    if (script.find("navigator.userAgent") != std::string::npos) {
      return PageResult<json>::Ok("Mozilla/5.0 Test");
    }
    if (args.is_object() && args.contains("token")) {
      json outcome = {{"method", injection_works ? "response_field" : ""}, {"submitted", false}};
      return PageResult<json>::Ok(outcome);
    }
    return PageResult<json>::Ok(json());
  };
}

class ChallengeResolverTest : public ::testing::Test {
protected:
  void SetUp() override {
    config_.captcha.enabled = true;
    config_.captcha.solve_timeout_seconds = 60;
    config_.captcha.poll_interval_seconds = 5;
    config_.clearance.url = "http://fs:8191";
    page_.url = "https://www.indeed.com/jobs?q=rust";
  }

  // Token backend around a fake client the test keeps a handle to
  std::unique_ptr<SolverBackend> TokenBackend() {
    auto client = std::make_unique<FakeTokenSolverClient>();
    token_client_ = client.get();
    return std::make_unique<TokenSolverBackend>(config_.captcha, std::move(client), clock_.source());
  }

  std::unique_ptr<SolverBackend> Clearance() {
    return std::make_unique<ClearanceBackend>(
        std::make_unique<ClearanceClient>(config_.clearance, &http_));
  }

  std::unique_ptr<ChallengeResolver> MakeResolver(bool with_token, bool with_clearance) {
    std::vector<std::unique_ptr<SolverBackend>> backends;
    if (with_token) backends.push_back(TokenBackend());
    if (with_clearance) backends.push_back(Clearance());
    backends.push_back(std::make_unique<ManualBackend>(&prompt_));
    backends.push_back(std::make_unique<SkipBackend>(&flags_));
    return std::make_unique<ChallengeResolver>(config_.captcha, &detector_, std::move(backends),
                                               &flags_, clock_.source());
  }

  SolveOutcome Run(ChallengeResolver& resolver, const ChallengeVerdict& verdict) {
    PageSignal signal;
    signal.url = page_.url;
    ResolveContext context;
    context.browser_context = &browser_context_;
    context.query = "rust";
    return resolver.Resolve(signal, verdict, page_, context);
  }

  HawkConfig config_;
  FakeTimeSource clock_;
  FakeBrowserPage page_;
  FakeBrowserContext browser_context_;
  FakeHttpTransport http_;
  ScriptedOperatorPrompt prompt_;
  RunFlags flags_;
  ChallengeDetector detector_;
  FakeTokenSolverClient* token_client_ = nullptr;
};

TEST_F(ChallengeResolverTest, TokenSolveAndInject) {
  ShowWidget(page_);
  auto resolver = MakeResolver(true, false);
  token_client_->submissions.push_back(FakeTokenSolverClient::Accepted("t-1"));
  token_client_->polls = {FakeTokenSolverClient::Processing(), FakeTokenSolverClient::Ready("TOKEN")};

  SolveOutcome outcome = Run(*resolver, kWidgetVerdict);

  EXPECT_TRUE(outcome.ok);
  EXPECT_EQ(outcome.reason, "solved");
  EXPECT_EQ(outcome.backend, "token:fake");
  EXPECT_TRUE(outcome.attempted);
  EXPECT_DOUBLE_EQ(outcome.estimated_cost_usd, 0.0025);
  EXPECT_EQ(outcome.action, PolicyAction::NONE);
  EXPECT_FALSE(flags_.skip_optional_fetches);

  ASSERT_EQ(token_client_->tasks.size(), 1u);
  EXPECT_EQ(token_client_->tasks[0].widget.sitekey, "0x4AAAAAAAWidget");
  EXPECT_EQ(token_client_->tasks[0].page_url, "https://www.indeed.com/jobs?q=rust");
  EXPECT_EQ(token_client_->tasks[0].user_agent, "Mozilla/5.0 Test");
  EXPECT_EQ(token_client_->poll_count, 2);
  EXPECT_EQ(page_.InjectionCalls(), 1);
  // One poll interval between the two polls
  ASSERT_EQ(clock_.sleeps.size(), 1u);
  EXPECT_EQ(clock_.sleeps[0], Millis(5000));
}

TEST_F(ChallengeResolverTest, NoSitekeyFallsToSkipPolicy) {
  auto resolver = MakeResolver(true, false);
  SolveOutcome outcome = Run(*resolver, kWidgetVerdict);

  EXPECT_FALSE(outcome.ok);
  EXPECT_FALSE(outcome.attempted);
  EXPECT_EQ(outcome.backend, "skip");
  EXPECT_EQ(outcome.reason, "policy_skip");
  EXPECT_EQ(outcome.action, PolicyAction::SKIP);
  EXPECT_TRUE(flags_.skip_optional_fetches);
  EXPECT_EQ(flags_.skip_episodes, 1);
  EXPECT_FALSE(flags_.abort_requested);
  EXPECT_TRUE(token_client_->tasks.empty());
}

TEST_F(ChallengeResolverTest, SolveFailuresRetryWithDelay) {
  ShowWidget(page_);
  config_.captcha.max_solve_attempts = 2;
  auto resolver = MakeResolver(true, false);
  token_client_->submissions = {FakeTokenSolverClient::Rejected("ERROR_ZERO_BALANCE"),
                                FakeTokenSolverClient::Rejected("ERROR_ZERO_BALANCE")};

  SolveOutcome outcome = Run(*resolver, kWidgetVerdict);

  EXPECT_FALSE(outcome.ok);
  EXPECT_FALSE(outcome.attempted);
  EXPECT_EQ(outcome.error, ErrorKind::SOLVE);
  EXPECT_EQ(outcome.action, PolicyAction::SKIP);
  EXPECT_EQ(token_client_->tasks.size(), 2u);
  ASSERT_EQ(clock_.sleeps.size(), 1u);
  EXPECT_GE(clock_.sleeps[0].count(), 5000);
  EXPECT_LE(clock_.sleeps[0].count(), 6500);
}

TEST_F(ChallengeResolverTest, SolveTimeoutCountsAsAttempt) {
  ShowWidget(page_);
  config_.captcha.solve_timeout_seconds = 10;
  auto resolver = MakeResolver(true, false);
  token_client_->submissions.push_back(FakeTokenSolverClient::Accepted("t-1"));
  token_client_->polls = {FakeTokenSolverClient::Processing()};

  SolveOutcome outcome = Run(*resolver, kWidgetVerdict);

  EXPECT_FALSE(outcome.ok);
  EXPECT_TRUE(outcome.attempted);
  EXPECT_DOUBLE_EQ(outcome.estimated_cost_usd, 0.0025);
  EXPECT_EQ(outcome.error, ErrorKind::SOLVE);
  EXPECT_EQ(token_client_->poll_count, 2);
  EXPECT_EQ(page_.InjectionCalls(), 0);
}

TEST_F(ChallengeResolverTest, FailedInjectionOnChallengePageHandsOverToClearance) {
  ShowWidget(page_, false);
  // Render hook saw a challenge-page widget
  page_.evaluate_handler = [base = page_.evaluate_handler](const std::string& script, const json& args) {
    if (script.find("__hawkCaptured") != std::string::npos) {
      return PageResult<json>::Ok({{"kind", "turnstile"}, {"sitekey", "0xChl"}, {"chlPageData", "pd"}});
    }
    return base(script, args);
  };
  config_.clearance.enabled = true;
  auto resolver = MakeResolver(true, true);
  token_client_->submissions.push_back(FakeTokenSolverClient::Accepted("t-1"));
  token_client_->polls = {FakeTokenSolverClient::Ready("TOKEN")};

  http_.QueueJson({{"status", "ok"}});
  http_.QueueJson({{"status", "ok"}, {"solution", {
    {"userAgent", "Mozilla/5.0 Clearance"},
    {"cookies", json::array({{{"name", "cf_clearance"}, {"value", "v"}, {"domain", ".indeed.com"}}})}
  }}});

  SolveOutcome outcome = Run(*resolver, kWidgetVerdict);

  EXPECT_TRUE(outcome.ok);
  EXPECT_EQ(outcome.backend, "clearance");
  EXPECT_EQ(outcome.reason, "cleared");
  EXPECT_EQ(outcome.user_agent, "Mozilla/5.0 Clearance");
  EXPECT_TRUE(outcome.attempted);
  EXPECT_DOUBLE_EQ(outcome.estimated_cost_usd, 0.0025);
  ASSERT_EQ(browser_context_.cookies.size(), 1u);
  EXPECT_EQ(browser_context_.cookies[0].name, "cf_clearance");
  EXPECT_EQ(page_.reload_count, 1);
  // Only one token attempt before handing over
  EXPECT_EQ(token_client_->tasks.size(), 1u);
}

TEST_F(ChallengeResolverTest, ClearanceSkipsWidgetOnlyChallenges) {
  config_.clearance.enabled = true;
  auto resolver = MakeResolver(false, true);
  SolveOutcome outcome = Run(*resolver, kWidgetVerdict);
  EXPECT_EQ(outcome.action, PolicyAction::SKIP);
  EXPECT_TRUE(http_.requests.empty());
}

TEST_F(ChallengeResolverTest, ClearanceWithoutCookiesFails) {
  config_.clearance.enabled = true;
  auto resolver = MakeResolver(false, true);
  http_.QueueJson({{"status", "ok"}});
  http_.QueueJson({{"status", "ok"}, {"solution", {{"cookies", json::array()}}}});

  SolveOutcome outcome = Run(*resolver, kInterstitial);
  EXPECT_FALSE(outcome.ok);
  EXPECT_TRUE(outcome.attempted);
  EXPECT_EQ(outcome.error, ErrorKind::SOLVE);
  EXPECT_EQ(page_.reload_count, 0);
}

TEST_F(ChallengeResolverTest, AbortPolicy) {
  config_.captcha.on_detect = ChallengePolicy::ABORT;
  auto resolver = MakeResolver(false, false);
  SolveOutcome outcome = Run(*resolver, kInterstitial);
  EXPECT_EQ(outcome.action, PolicyAction::ABORT);
  EXPECT_EQ(outcome.reason, "policy_abort");
  EXPECT_EQ(outcome.error, ErrorKind::ABORT);
  EXPECT_TRUE(flags_.abort_requested);
  EXPECT_FALSE(flags_.skip_optional_fetches);
}

TEST_F(ChallengeResolverTest, PauseAsksOperator) {
  config_.captcha.on_detect = ChallengePolicy::PAUSE;
  prompt_.answers = {PolicyAction::RETRY, PolicyAction::ABORT};
  auto resolver = MakeResolver(false, false);

  SolveOutcome resumed = Run(*resolver, kInterstitial);
  EXPECT_EQ(resumed.backend, "manual");
  EXPECT_EQ(resumed.action, PolicyAction::RETRY);
  EXPECT_EQ(resumed.reason, "operator_resumed");
  EXPECT_FALSE(flags_.skip_optional_fetches);

  SolveOutcome aborted = Run(*resolver, kInterstitial);
  EXPECT_EQ(aborted.reason, "operator_abort");
  EXPECT_TRUE(flags_.abort_requested);
  EXPECT_EQ(prompt_.asked, 2);
}

TEST_F(ChallengeResolverTest, PauseWithoutTerminalSkips) {
  config_.captcha.on_detect = ChallengePolicy::PAUSE;
  prompt_.interactive = false;
  auto resolver = MakeResolver(false, false);

  SolveOutcome outcome = Run(*resolver, kInterstitial);
  EXPECT_EQ(outcome.action, PolicyAction::SKIP);
  EXPECT_EQ(prompt_.asked, 0);
  EXPECT_TRUE(flags_.skip_optional_fetches);
}

TEST_F(ChallengeResolverTest, RepeatedSkipsEscalateToAbort) {
  config_.captcha.max_skip_episodes_before_abort = 2;
  auto resolver = MakeResolver(false, false);

  EXPECT_EQ(Run(*resolver, kInterstitial).action, PolicyAction::SKIP);
  EXPECT_FALSE(flags_.abort_requested);

  SolveOutcome second = Run(*resolver, kInterstitial);
  EXPECT_EQ(second.action, PolicyAction::ABORT);
  EXPECT_EQ(second.reason, "skip_escalated_to_abort");
  EXPECT_TRUE(flags_.abort_requested);
  EXPECT_EQ(flags_.skip_episodes, 2);
}

TEST_F(ChallengeResolverTest, UnlimitedSkipsNeverAbort) {
  auto resolver = MakeResolver(false, false);
  for (int i = 0; i < 5; ++i) Run(*resolver, kInterstitial);
  EXPECT_EQ(flags_.skip_episodes, 5);
  EXPECT_FALSE(flags_.abort_requested);
  EXPECT_EQ(resolver->EngageSkip("rounds_exhausted"), PolicyAction::SKIP);
}

TEST_F(ChallengeResolverTest, SelfClearingChallengeNeedsNoBackend) {
  config_.captcha.auto_clear_wait_seconds = 5;
  page_.ShowInterstitial();
  int slept = 0;
  TimeSource time;
  time.now = [] { return SteadyTime(); };
  time.sleep = [this, &slept](Millis) {
    if (++slept == 2) page_.ShowContent();
  };

  std::vector<std::unique_ptr<SolverBackend>> backends;
  backends.push_back(std::make_unique<SkipBackend>(&flags_));
  ChallengeResolver resolver(config_.captcha, &detector_, std::move(backends), &flags_, time);

  SolveOutcome outcome = Run(resolver, kInterstitial);
  EXPECT_TRUE(outcome.ok);
  EXPECT_EQ(outcome.reason, "auto_cleared");
  EXPECT_EQ(slept, 2);
  EXPECT_FALSE(flags_.skip_optional_fetches);
}

TEST(SolverBackendsTest, BuildOrderFollowsConfiguration) {
  FakeHttpTransport http;
  ScriptedOperatorPrompt prompt;
  RunFlags flags;
  HawkConfig config;
  config.captcha.enabled = true;
  config.clearance.enabled = true;

  // No API key: token backend left out
  auto without_key = BuildSolverBackends(config, &http, &prompt, &flags, TimeSource::Default());
  ASSERT_EQ(without_key.size(), 3u);
  EXPECT_EQ(without_key[0]->Kind(), BackendKind::CHALLENGE_SOLVER);

  config.captcha.api_key = "key";
  auto all = BuildSolverBackends(config, &http, &prompt, &flags, TimeSource::Default());
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0]->Name(), "token:2captcha");
  EXPECT_EQ(all[1]->Name(), "clearance");
  EXPECT_EQ(all[2]->Kind(), BackendKind::MANUAL);
  EXPECT_EQ(all[3]->Kind(), BackendKind::SKIP);
  EXPECT_STREQ(BackendKindToString(all[0]->Kind()), "token_solver");
}

}  // namespace
}  // namespace hawk
