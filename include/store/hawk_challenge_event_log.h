#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace hawk {

// One detected block, resolved or not
struct ChallengeEvent {
  std::string timestamp;
  std::string query;
  int sequence_number = 0;     // index of the item being collected when blocked
  int detail_fetch_count = 0;  // detail fetches made so far this run
  std::string url;
  std::string reason;
};

nlohmann::json ChallengeEventToJson(const ChallengeEvent& event);

/**
 * ChallengeEventLog - this run's challenge events as a JSON array file
 *
 * Every Append rewrites the whole array atomically, so the file always
 * holds every event so far. A failed write is logged and the event stays
 * in memory for the next rewrite.
 */
class ChallengeEventLog {
public:
  explicit ChallengeEventLog(const std::string& path);

  // Timestamp is filled in when empty; false when the file could not be written
  bool Append(ChallengeEvent event);

  const std::vector<ChallengeEvent>& events() const { return events_; }
  size_t size() const { return events_.size(); }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  std::vector<ChallengeEvent> events_;
};

}  // namespace hawk
