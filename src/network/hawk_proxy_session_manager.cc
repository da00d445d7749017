#include "hawk_proxy_session_manager.h"
#include "hawk_hash.h"
#include "hawk_string_utils.h"
#include "hawk_url_utils.h"
#include "logger.h"
#include <utility>

namespace hawk {

namespace {

bool LooksSessionTagged(const std::string& username) {
  std::string lower = ToLower(username);
  return Contains(lower, "-session-") || Contains(lower, "_session_") ||
         Contains(lower, "-sessid-") || Contains(lower, "_sessid_");
}

bool HasPort(const std::string& authority) {
  size_t colon = authority.rfind(':');
  size_t bracket = authority.rfind(']');
  return colon != std::string::npos && (bracket == std::string::npos || colon > bracket);
}

}  // namespace

std::string ProxyDescriptor::ToUrl() const {
  if (username.empty() && password.empty()) {
    return server;
  }
  ParsedUrl parsed = ParseUrl(server);
  std::string scheme = parsed.scheme.empty() ? "http" : parsed.scheme;
  std::string authority = parsed.scheme.empty() ? parsed.path : parsed.authority;
  return scheme + "://" + UrlEncode(username) + ":" + UrlEncode(password) + "@" + authority;
}

std::vector<ProxyEndpoint> ParseProxyEndpoints(const std::string& hosts, int port,
                                               const std::string& user,
                                               const std::string& password) {
  std::vector<ProxyEndpoint> endpoints;
  if (Trim(hosts).empty() || port <= 0 || Trim(user).empty() || Trim(password).empty()) {
    return endpoints;
  }

  for (const auto& host : SplitAndTrim(hosts, ',')) {
    std::string scheme = "http";
    std::string authority = host;
    size_t sep = host.find("://");
    if (sep != std::string::npos) {
      scheme = ToLower(host.substr(0, sep));
      authority = host.substr(sep + 3);
      size_t slash = authority.find('/');
      if (slash != std::string::npos) authority = authority.substr(0, slash);
    }
    if (authority.empty()) continue;
    if (!HasPort(authority)) {
      authority += ":" + std::to_string(port);
    }
    endpoints.push_back({scheme + "://" + authority, Trim(user), Trim(password)});
  }
  return endpoints;
}

ProxySessionManager::ProxySessionManager(const ProxyPoolConfig& config, TimeSource time)
    : config_(config), time_(std::move(time)) {
  if (config_.pool_size < 1) config_.pool_size = 1;

  if (config_.enabled) {
    endpoints_ = ParseProxyEndpoints(config_.hosts, config_.port,
                                     config_.username, config_.password);
    if (endpoints_.empty()) {
      LOG_WARN("ProxySessionManager",
               "Proxy enabled but misconfigured (need hosts, port, user and password); "
               "continuing without proxy");
    } else {
      enabled_ = true;
      LOG_INFO("ProxySessionManager", "Proxy enabled with " +
               std::to_string(endpoints_.size()) + " endpoint(s), provider=" +
               config_.provider + ", pool_size=" + std::to_string(config_.pool_size));
    }
  }
}

std::string ProxySessionManager::EffectiveKey(const std::string& scope_key) const {
  if (config_.session_scope == SessionScope::RUN) {
    return "run";
  }
  return scope_key.empty() ? "query" : scope_key;
}

int ProxySessionManager::BucketFor(const std::string& scope_key) const {
  return StableBucket(EffectiveKey(scope_key), config_.pool_size);
}

ProxySession ProxySessionManager::NewSession(int rotation_count) const {
  ProxySession session;
  session.session_id = GenerateSessionId();
  session.rotation_count = rotation_count;
  if (config_.session_ttl_seconds > 0) {
    session.expires_at = time_.now() + std::chrono::seconds(config_.session_ttl_seconds);
  }
  return session;
}

const ProxySession* ProxySessionManager::GetOrCreateSession(int bucket) {
  if (!config_.sticky) {
    return nullptr;
  }

  auto it = sessions_.find(bucket);
  if (it != sessions_.end()) {
    const ProxySession& existing = it->second;
    if (!existing.expires_at || time_.now() < *existing.expires_at) {
      return &existing;
    }
    LOG_INFO("ProxySessionManager", "Session for bucket " + std::to_string(bucket) +
             " expired, starting a new one");
    // An expired session is replaced, not rotated: keep its rotation count
    int rotations = existing.rotation_count;
    it->second = NewSession(rotations);
    return &it->second;
  }

  auto inserted = sessions_.emplace(bucket, NewSession(0));
  return &inserted.first->second;
}

std::string ProxySessionManager::BuildUsername(const ProxyEndpoint& endpoint,
                                               const std::string& session_id) const {
  std::string base = Trim(endpoint.username);
  std::string tmpl = Trim(config_.username_template);

  // {session} may also be written straight into the username
  if (tmpl.empty() && Contains(base, "{session}")) {
    tmpl = base;
    base.clear();
  }

  if (!tmpl.empty() && !session_id.empty()) {
    return ReplaceAll(tmpl, "{session}", session_id);
  }

  if (ToLower(Trim(config_.provider)) == "iproyal" && !session_id.empty() && !base.empty() &&
      !LooksSessionTagged(base)) {
    return base + "-session-" + session_id;
  }

  return base;
}

ProxyDescriptor ProxySessionManager::Describe(int bucket, const ProxySession* session) const {
  const ProxyEndpoint& endpoint = endpoints_[static_cast<size_t>(bucket) % endpoints_.size()];
  ProxyDescriptor descriptor;
  descriptor.server = endpoint.server;
  descriptor.session_id = session ? session->session_id : "";
  descriptor.username = BuildUsername(endpoint, descriptor.session_id);
  descriptor.password = endpoint.password;
  descriptor.bucket = bucket;
  return descriptor;
}

std::optional<ProxyDescriptor> ProxySessionManager::GetProxyFor(const std::string& scope_key) {
  if (!enabled_) {
    return std::nullopt;
  }
  int bucket = BucketFor(scope_key);
  return Describe(bucket, GetOrCreateSession(bucket));
}

std::optional<ProxyDescriptor> ProxySessionManager::Rotate(const std::string& scope_key,
                                                           const std::string& reason) {
  if (!enabled_) {
    return std::nullopt;
  }

  int bucket = BucketFor(scope_key);
  auto it = sessions_.find(bucket);
  int rotations = (it != sessions_.end()) ? it->second.rotation_count + 1 : 1;
  std::string previous = (it != sessions_.end()) ? it->second.session_id : "";

  ProxySession session = NewSession(rotations);
  while (session.session_id == previous) {
    session.session_id = GenerateSessionId();
  }
  sessions_[bucket] = session;

  LOG_INFO("ProxySessionManager", "Proxy session rotated (provider=" + config_.provider +
           ", bucket=" + std::to_string(bucket) + ", reason=" + reason +
           ", rotations=" + std::to_string(rotations) + ")");

  return Describe(bucket, config_.sticky ? &sessions_[bucket] : nullptr);
}

bool ProxySessionManager::RecordChallenge(bool solved) {
  if (solved) {
    consecutive_challenges_ = 0;
    needs_rotation_ = false;
    return false;
  }

  consecutive_challenges_++;
  int threshold = config_.rotate_on_challenge_consecutive;
  LOG_INFO("ProxySessionManager", "Challenge recorded (consecutive=" +
           std::to_string(consecutive_challenges_) + ", threshold=" +
           std::to_string(threshold) + ")");

  if (enabled_ && threshold > 0 && consecutive_challenges_ >= threshold) {
    LOG_INFO("ProxySessionManager", "Consecutive challenge threshold reached, rotation needed");
    needs_rotation_ = true;
    return true;
  }
  return false;
}

std::optional<ProxyDescriptor> ProxySessionManager::PerformRotation(const std::string& scope_key) {
  if (!enabled_) {
    return std::nullopt;
  }
  std::optional<ProxyDescriptor> descriptor = Rotate(scope_key, "consecutive_challenges");
  consecutive_challenges_ = 0;
  needs_rotation_ = false;
  total_rotations_++;
  LOG_INFO("ProxySessionManager", "Proxy rotation performed (total_rotations=" +
           std::to_string(total_rotations_) + ")");
  return descriptor;
}

std::optional<ProxyDescriptor> ProxySessionManager::RecordFailure(const std::string& scope_key) {
  if (!enabled_ || !config_.rotate_on_failure) {
    return std::nullopt;
  }
  std::optional<ProxyDescriptor> descriptor = Rotate(scope_key, "failure");
  total_rotations_++;
  return descriptor;
}

nlohmann::json ProxySessionManager::StatsJson() const {
  return {
    {"enabled", enabled_},
    {"endpoints", endpoints_.size()},
    {"sessions", sessions_.size()},
    {"consecutive_challenges", consecutive_challenges_},
    {"rotate_threshold", config_.rotate_on_challenge_consecutive},
    {"needs_rotation", needs_rotation_},
    {"total_rotations", total_rotations_}
  };
}

}  // namespace hawk
