#pragma once

#include <functional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hawk {

// What to do with a challenge no automatic backend cleared
enum class ChallengePolicy {
  ABORT,   // stop the run
  SKIP,    // stop optional detail fetches for the rest of the run
  PAUSE    // ask the operator (falls back to SKIP without a TTY)
};

enum class TokenProvider {
  TWO_CAPTCHA,
  CAPSOLVER
};

enum class SessionScope {
  RUN,     // one proxy session for the whole run
  QUERY    // one proxy session per search query
};

const char* ChallengePolicyToString(ChallengePolicy policy);
// Unknown values log a warning and give SKIP
ChallengePolicy ParseChallengePolicy(const std::string& value);

const char* TokenProviderToString(TokenProvider provider);
bool ParseTokenProvider(const std::string& value, TokenProvider* provider);

struct BackoffConfig {
  int base_seconds = 60;
  int cap_seconds = 300;
};

struct CaptchaConfig {
  bool enabled = false;                 // automatic token solving
  TokenProvider provider = TokenProvider::TWO_CAPTCHA;
  std::string api_key_env = "CAPTCHA_API_KEY";
  std::string api_key;                  // filled from the environment only
  std::string endpoint;                 // empty = provider default
  int solve_timeout_seconds = 180;
  int poll_interval_seconds = 5;
  int max_solve_attempts = 1;
  ChallengePolicy on_detect = ChallengePolicy::SKIP;
  int auto_clear_wait_seconds = 0;      // wait for self-clearing JS challenges
  int max_episode_rounds = 2;           // resolve rounds per challenge episode
  int max_skip_episodes_before_abort = 0;  // 0 = never escalate
  double estimated_cost_usd_per_solve = 0.0025;
  bool install_render_hook = true;
};

// FlareSolverr-compatible clearance service
struct ClearanceConfig {
  bool enabled = false;
  std::string url = "http://localhost:8191";
  int timeout_seconds = 60;
};

struct ProxyPoolConfig {
  bool enabled = false;
  std::string provider = "http";        // "iproyal" tags usernames itself
  std::string hosts;                    // comma-separated, scheme and port optional
  int port = 0;
  std::string username;
  std::string password;
  std::string username_template;        // may contain {session}
  bool sticky = true;
  SessionScope session_scope = SessionScope::RUN;
  int pool_size = 4;
  int session_ttl_seconds = 1800;       // 0 = sessions never expire
  int rotate_on_challenge_consecutive = 2;  // 0 = never rotate on challenges
  bool rotate_on_failure = false;
};

struct CheckpointConfig {
  int interval = 25;
  std::string path = "output/progress_checkpoint.json";
};

struct NavigationConfig {
  int max_retries = 3;
  int jitter_min_ms = 500;
  int jitter_max_ms = 2000;
};

struct OutputConfig {
  std::string dedupe_path = "output/dedupe_hashes.jsonl";
  std::string metrics_path_template = "output/run_metrics_{timestamp}.json";
  std::string challenge_log_path = "output/captcha_log.json";
  bool debug_artifacts = true;
  std::string artifact_dir = "output";
};

struct LoggingConfig {
  std::string level = "info";
  std::string file;
};

struct DetectorConfig {
  std::string profile = "generic";
  std::vector<std::string> extra_content_markers;
};

struct HawkConfig {
  std::string board = "generic";
  BackoffConfig backoff;
  CaptchaConfig captcha;
  ClearanceConfig clearance;
  ProxyPoolConfig proxy;
  CheckpointConfig checkpoint;
  NavigationConfig navigation;
  OutputConfig output;
  LoggingConfig logging;
  DetectorConfig detector;
};

using EnvLookup = std::function<const char*(const char*)>;

/**
 * Populate config from a parsed JSON document. Keys that are absent keep
 * their current value; a key with the wrong type fails the whole load.
 *
 * @return true on success, false with *error naming the offending key
 */
bool LoadConfigJson(const nlohmann::json& doc, HawkConfig* config, std::string* error);

/**
 * Load configuration from a JSON file.
 *
 * @return true on success, false with *error set (missing file, bad JSON, bad key)
 */
bool LoadConfigFile(const std::string& path, HawkConfig* config, std::string* error);

// Environment overrides (priority: env > file > defaults)
void ApplyEnvironment(HawkConfig* config, const EnvLookup& lookup);
void ApplyEnvironment(HawkConfig* config);

// Clamp values to their legal ranges, logging every adjustment
void SanitizeConfig(HawkConfig* config);

// Sets logger level and log file from config.logging
void ApplyLoggingConfig(const HawkConfig& config);

}  // namespace hawk
