#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "hawk_time_source.h"

namespace hawk {

/**
 * RunMetrics - counters, gauges and structured events for one run
 *
 * The finalized document is what reliability tooling reads:
 *   {board, runId, startedAt, endedAt, durationSeconds, counters, gauges,
 *    events[, extra][, outputPath]}
 */
class RunMetrics {
public:
  explicit RunMetrics(const std::string& board, TimeSource time = TimeSource::Default());

  void Inc(const std::string& key, int64_t amount = 1);
  void SetGauge(const std::string& key, double value);

  // Adds {"t": <utc iso>, "kind": kind} plus every non-null field
  void RecordEvent(const std::string& kind, const nlohmann::json& fields = nlohmann::json::object());

  int64_t Counter(const std::string& key) const;
  const std::vector<nlohmann::json>& events() const { return events_; }
  const std::string& run_id() const { return run_id_; }
  const std::string& board() const { return board_; }

  nlohmann::json Finalize(const nlohmann::json& extra = nlohmann::json()) const;

  /**
   * Render "{timestamp}" in path_template, write the finalized document there
   * atomically and remember the path as outputPath.
   *
   * @return written path, empty on failure
   */
  std::string WriteJson(const std::string& path_template,
                        const nlohmann::json& extra = nlohmann::json());

private:
  std::string board_;
  std::string run_id_;
  std::string started_at_;
  SteadyTime started_;
  TimeSource time_;
  std::map<std::string, int64_t> counters_;
  std::map<std::string, double> gauges_;
  std::vector<nlohmann::json> events_;
  std::string output_path_;
};

}  // namespace hawk
