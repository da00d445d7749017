#include "hawk_config.h"
#include "hawk_file_utils.h"
#include "hawk_string_utils.h"
#include "logger.h"
#include <cstdlib>

using json = nlohmann::json;

namespace hawk {

namespace {

bool Fail(std::string* error, const std::string& message) {
  if (error) *error = message;
  return false;
}

bool ReadInt(const json& obj, const char* key, const std::string& path, int* out,
             std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_number_integer()) {
    return Fail(error, path + "." + key + " must be an integer");
  }
  *out = it->get<int>();
  return true;
}

bool ReadDouble(const json& obj, const char* key, const std::string& path, double* out,
                std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_number()) {
    return Fail(error, path + "." + key + " must be a number");
  }
  *out = it->get<double>();
  return true;
}

bool ReadBool(const json& obj, const char* key, const std::string& path, bool* out,
              std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_boolean()) {
    return Fail(error, path + "." + key + " must be a boolean");
  }
  *out = it->get<bool>();
  return true;
}

bool ReadString(const json& obj, const char* key, const std::string& path, std::string* out,
                std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_string()) {
    return Fail(error, path + "." + key + " must be a string");
  }
  *out = it->get<std::string>();
  return true;
}

bool ReadStringList(const json& obj, const char* key, const std::string& path,
                    std::vector<std::string>* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) return true;
  if (!it->is_array()) {
    return Fail(error, path + "." + key + " must be an array of strings");
  }
  std::vector<std::string> values;
  for (const auto& item : *it) {
    if (!item.is_string()) {
      return Fail(error, path + "." + key + " must be an array of strings");
    }
    values.push_back(item.get<std::string>());
  }
  *out = values;
  return true;
}

// Section object or null when absent; error when present but not an object
bool Section(const json& doc, const char* key, const json** out, std::string* error) {
  *out = nullptr;
  auto it = doc.find(key);
  if (it == doc.end() || it->is_null()) return true;
  if (!it->is_object()) {
    return Fail(error, std::string(key) + " must be an object");
  }
  *out = &(*it);
  return true;
}

bool LoadCaptcha(const json& s, CaptchaConfig* c, std::string* error) {
  const std::string p = "captcha";
  std::string on_detect;
  std::string provider;
  if (!ReadBool(s, "enabled", p, &c->enabled, error) ||
      !ReadString(s, "provider", p, &provider, error) ||
      !ReadString(s, "api_key_env", p, &c->api_key_env, error) ||
      !ReadString(s, "endpoint", p, &c->endpoint, error) ||
      !ReadInt(s, "solve_timeout_seconds", p, &c->solve_timeout_seconds, error) ||
      !ReadInt(s, "poll_interval_seconds", p, &c->poll_interval_seconds, error) ||
      !ReadInt(s, "max_solve_attempts", p, &c->max_solve_attempts, error) ||
      !ReadString(s, "on_detect", p, &on_detect, error) ||
      !ReadInt(s, "auto_clear_wait_seconds", p, &c->auto_clear_wait_seconds, error) ||
      !ReadInt(s, "max_episode_rounds", p, &c->max_episode_rounds, error) ||
      !ReadInt(s, "max_skip_episodes_before_abort", p,
               &c->max_skip_episodes_before_abort, error) ||
      !ReadDouble(s, "estimated_cost_usd_per_solve", p,
                  &c->estimated_cost_usd_per_solve, error) ||
      !ReadBool(s, "install_render_hook", p, &c->install_render_hook, error)) {
    return false;
  }
  // auto_solve is accepted as an alias of enabled
  if (!ReadBool(s, "auto_solve", p, &c->enabled, error)) {
    return false;
  }
  if (s.contains("api_key")) {
    LOG_WARN("Config", "captcha.api_key in a config file is ignored; set " +
             c->api_key_env + " instead");
  }
  if (!on_detect.empty()) {
    c->on_detect = ParseChallengePolicy(on_detect);
  }
  if (!provider.empty() && !ParseTokenProvider(provider, &c->provider)) {
    return Fail(error, "captcha.provider must be \"2captcha\" or \"capsolver\"");
  }
  return true;
}

bool LoadProxy(const json& s, ProxyPoolConfig* c, std::string* error) {
  const std::string p = "proxy";
  std::string scope;
  if (!ReadBool(s, "enabled", p, &c->enabled, error) ||
      !ReadString(s, "provider", p, &c->provider, error) ||
      !ReadString(s, "hosts", p, &c->hosts, error) ||
      !ReadInt(s, "port", p, &c->port, error) ||
      !ReadString(s, "username", p, &c->username, error) ||
      !ReadString(s, "password", p, &c->password, error) ||
      !ReadString(s, "username_template", p, &c->username_template, error) ||
      !ReadBool(s, "sticky", p, &c->sticky, error) ||
      !ReadString(s, "session_scope", p, &scope, error) ||
      !ReadInt(s, "pool_size", p, &c->pool_size, error) ||
      !ReadInt(s, "session_ttl_seconds", p, &c->session_ttl_seconds, error) ||
      !ReadInt(s, "rotate_on_challenge_consecutive", p,
               &c->rotate_on_challenge_consecutive, error) ||
      !ReadBool(s, "rotate_on_failure", p, &c->rotate_on_failure, error)) {
    return false;
  }
  if (!scope.empty()) {
    std::string lower = ToLower(Trim(scope));
    if (lower == "run") {
      c->session_scope = SessionScope::RUN;
    } else if (lower == "query") {
      c->session_scope = SessionScope::QUERY;
    } else {
      return Fail(error, "proxy.session_scope must be \"run\" or \"query\"");
    }
  }
  return true;
}

}  // namespace

const char* ChallengePolicyToString(ChallengePolicy policy) {
  switch (policy) {
    case ChallengePolicy::ABORT: return "abort";
    case ChallengePolicy::SKIP: return "skip";
    case ChallengePolicy::PAUSE: return "pause";
    default: return "skip";
  }
}

ChallengePolicy ParseChallengePolicy(const std::string& value) {
  std::string lower = ToLower(Trim(value));
  if (lower == "abort") return ChallengePolicy::ABORT;
  if (lower == "skip") return ChallengePolicy::SKIP;
  if (lower == "pause") return ChallengePolicy::PAUSE;
  LOG_WARN("Config", "Unknown captcha.on_detect '" + value + "', using skip");
  return ChallengePolicy::SKIP;
}

const char* TokenProviderToString(TokenProvider provider) {
  switch (provider) {
    case TokenProvider::TWO_CAPTCHA: return "2captcha";
    case TokenProvider::CAPSOLVER: return "capsolver";
    default: return "2captcha";
  }
}

bool ParseTokenProvider(const std::string& value, TokenProvider* provider) {
  std::string lower = ToLower(Trim(value));
  if (lower == "2captcha" || lower == "twocaptcha") {
    *provider = TokenProvider::TWO_CAPTCHA;
    return true;
  }
  if (lower == "capsolver") {
    *provider = TokenProvider::CAPSOLVER;
    return true;
  }
  return false;
}

bool LoadConfigJson(const json& doc, HawkConfig* config, std::string* error) {
  if (!doc.is_object()) {
    return Fail(error, "config root must be an object");
  }

  if (!ReadString(doc, "board", "root", &config->board, error)) return false;

  const json* s = nullptr;
  if (!Section(doc, "backoff", &s, error)) return false;
  if (s && (!ReadInt(*s, "base_seconds", "backoff", &config->backoff.base_seconds, error) ||
            !ReadInt(*s, "cap_seconds", "backoff", &config->backoff.cap_seconds, error))) {
    return false;
  }

  if (!Section(doc, "captcha", &s, error)) return false;
  if (s && !LoadCaptcha(*s, &config->captcha, error)) return false;

  if (!Section(doc, "flaresolverr", &s, error)) return false;
  if (s && (!ReadBool(*s, "enabled", "flaresolverr", &config->clearance.enabled, error) ||
            !ReadString(*s, "url", "flaresolverr", &config->clearance.url, error) ||
            !ReadInt(*s, "timeout_seconds", "flaresolverr",
                     &config->clearance.timeout_seconds, error))) {
    return false;
  }

  if (!Section(doc, "proxy", &s, error)) return false;
  if (s && !LoadProxy(*s, &config->proxy, error)) return false;

  if (!Section(doc, "checkpoint", &s, error)) return false;
  if (s && (!ReadInt(*s, "interval", "checkpoint", &config->checkpoint.interval, error) ||
            !ReadString(*s, "path", "checkpoint", &config->checkpoint.path, error))) {
    return false;
  }

  if (!Section(doc, "navigation", &s, error)) return false;
  if (s && (!ReadInt(*s, "max_retries", "navigation", &config->navigation.max_retries, error) ||
            !ReadInt(*s, "jitter_min_ms", "navigation",
                     &config->navigation.jitter_min_ms, error) ||
            !ReadInt(*s, "jitter_max_ms", "navigation",
                     &config->navigation.jitter_max_ms, error))) {
    return false;
  }

  if (!Section(doc, "output", &s, error)) return false;
  if (s && (!ReadString(*s, "dedupe_path", "output", &config->output.dedupe_path, error) ||
            !ReadString(*s, "metrics_path_template", "output",
                        &config->output.metrics_path_template, error) ||
            !ReadString(*s, "challenge_log_path", "output",
                        &config->output.challenge_log_path, error) ||
            !ReadBool(*s, "debug_artifacts", "output", &config->output.debug_artifacts, error) ||
            !ReadString(*s, "artifact_dir", "output", &config->output.artifact_dir, error))) {
    return false;
  }

  if (!Section(doc, "logging", &s, error)) return false;
  if (s && (!ReadString(*s, "level", "logging", &config->logging.level, error) ||
            !ReadString(*s, "file", "logging", &config->logging.file, error))) {
    return false;
  }

  if (!Section(doc, "detector", &s, error)) return false;
  if (s && (!ReadString(*s, "profile", "detector", &config->detector.profile, error) ||
            !ReadStringList(*s, "extra_content_markers", "detector",
                            &config->detector.extra_content_markers, error))) {
    return false;
  }

  return true;
}

bool LoadConfigFile(const std::string& path, HawkConfig* config, std::string* error) {
  std::string content;
  if (!ReadFileToString(path, &content)) {
    return Fail(error, "cannot read config file: " + path);
  }

  json doc;
  try {
    doc = json::parse(content);
  } catch (const json::parse_error& e) {
    return Fail(error, "invalid JSON in " + path + ": " + e.what());
  }

  if (!LoadConfigJson(doc, config, error)) {
    return false;
  }
  LOG_INFO("Config", "Loaded configuration from " + path);
  return true;
}

void ApplyEnvironment(HawkConfig* config, const EnvLookup& lookup) {
  auto env = [&lookup](const char* name) -> std::string {
    const char* value = lookup(name);
    return value ? Trim(value) : std::string();
  };

  std::string key_env = config->captcha.api_key_env.empty() ? "CAPTCHA_API_KEY"
                                                           : config->captcha.api_key_env;
  config->captcha.api_key = env(key_env.c_str());

  std::string provider = env("CAPTCHA_PROVIDER");
  if (!provider.empty() && !ParseTokenProvider(provider, &config->captcha.provider)) {
    LOG_WARN("Config", "Ignoring unknown CAPTCHA_PROVIDER '" + provider + "'");
  }

  std::string host = env("PROXY_HOST");
  if (!host.empty()) config->proxy.hosts = host;
  std::string port = env("PROXY_PORT");
  if (!port.empty()) {
    char* end = nullptr;
    long parsed = std::strtol(port.c_str(), &end, 10);
    if (end && *end == '\0' && parsed > 0 && parsed < 65536) {
      config->proxy.port = static_cast<int>(parsed);
    } else {
      LOG_WARN("Config", "Ignoring invalid PROXY_PORT '" + port + "'");
    }
  }
  std::string user = env("PROXY_USER");
  if (!user.empty()) config->proxy.username = user;
  std::string pass = env("PROXY_PASS");
  if (!pass.empty()) config->proxy.password = pass;

  std::string flaresolverr = env("FLARESOLVERR_URL");
  if (!flaresolverr.empty()) config->clearance.url = flaresolverr;

  std::string level = env("HAWK_LOG_LEVEL");
  if (!level.empty()) config->logging.level = level;
}

void ApplyEnvironment(HawkConfig* config) {
  ApplyEnvironment(config, [](const char* name) { return std::getenv(name); });
}

void SanitizeConfig(HawkConfig* config) {
  if (config->backoff.base_seconds < 0) {
    LOG_WARN("Config", "backoff.base_seconds < 0, using 0");
    config->backoff.base_seconds = 0;
  }
  if (config->backoff.cap_seconds < config->backoff.base_seconds) {
    LOG_WARN("Config", "backoff.cap_seconds below base, using base");
    config->backoff.cap_seconds = config->backoff.base_seconds;
  }

  CaptchaConfig& captcha = config->captcha;
  if (captcha.poll_interval_seconds < 1) {
    LOG_WARN("Config", "captcha.poll_interval_seconds < 1, using 1");
    captcha.poll_interval_seconds = 1;
  }
  if (captcha.max_solve_attempts < 1) {
    LOG_WARN("Config", "captcha.max_solve_attempts < 1, using 1");
    captcha.max_solve_attempts = 1;
  }
  if (captcha.solve_timeout_seconds < 1) {
    LOG_WARN("Config", "captcha.solve_timeout_seconds < 1, using 1");
    captcha.solve_timeout_seconds = 1;
  }
  if (captcha.max_episode_rounds < 1) {
    captcha.max_episode_rounds = 1;
  }
  if (captcha.auto_clear_wait_seconds < 0) captcha.auto_clear_wait_seconds = 0;
  if (captcha.max_skip_episodes_before_abort < 0) captcha.max_skip_episodes_before_abort = 0;

  if (config->proxy.pool_size < 1) {
    LOG_WARN("Config", "proxy.pool_size < 1, using 1");
    config->proxy.pool_size = 1;
  }
  if (config->proxy.session_ttl_seconds < 0) config->proxy.session_ttl_seconds = 0;
  if (config->proxy.rotate_on_challenge_consecutive < 0) {
    config->proxy.rotate_on_challenge_consecutive = 0;
  }

  if (config->navigation.max_retries < 0) config->navigation.max_retries = 0;
  if (config->navigation.jitter_min_ms < 0) config->navigation.jitter_min_ms = 0;
  if (config->navigation.jitter_max_ms < config->navigation.jitter_min_ms) {
    config->navigation.jitter_max_ms = config->navigation.jitter_min_ms;
  }
  if (config->clearance.timeout_seconds < 1) config->clearance.timeout_seconds = 1;
}

void ApplyLoggingConfig(const HawkConfig& config) {
  if (config.logging.file.empty()) {
    HawkLogger::Logger::Init();
  } else {
    if (!EnsureParentDirectory(config.logging.file)) {
      LOG_WARN("Config", "Cannot create directory for log file " + config.logging.file);
    }
    if (!HawkLogger::Logger::Init(config.logging.file)) {
      LOG_WARN("Config", "Log file unavailable: " + config.logging.file);
    }
  }
  HawkLogger::Logger::AddSecret(config.captcha.api_key);
  HawkLogger::Logger::AddSecret(config.proxy.password);
  HawkLogger::Logger::SetLevel(
      HawkLogger::Logger::ParseLevel(config.logging.level, HawkLogger::INFO));
}

}  // namespace hawk
