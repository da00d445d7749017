#include "hawk_challenge_event_log.h"
#include <utility>
#include "hawk_file_utils.h"
#include "hawk_time_source.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

json ChallengeEventToJson(const ChallengeEvent& event) {
  return json{
    {"timestamp", event.timestamp},
    {"query", event.query},
    {"sequenceNumber", event.sequence_number},
    {"detailFetchCount", event.detail_fetch_count},
    {"url", event.url},
    {"reason", event.reason}
  };
}

ChallengeEventLog::ChallengeEventLog(const std::string& path) : path_(path) {}

bool ChallengeEventLog::Append(ChallengeEvent event) {
  if (event.timestamp.empty()) {
    event.timestamp = LocalNowIso8601();
  }
  events_.push_back(std::move(event));

  if (path_.empty()) {
    return true;
  }

  json doc = json::array();
  for (const auto& e : events_) {
    doc.push_back(ChallengeEventToJson(e));
  }
  if (!WriteFileAtomic(path_, doc.dump(2, ' ', false, json::error_handler_t::replace))) {
    LOG_WARN("ChallengeEventLog", "Challenge log write failed: " + path_);
    return false;
  }
  return true;
}

}  // namespace hawk
