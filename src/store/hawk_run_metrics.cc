#include "hawk_run_metrics.h"
#include "hawk_file_utils.h"
#include "hawk_hash.h"
#include "logger.h"
#include <cmath>
#include <utility>

using json = nlohmann::json;

namespace hawk {

namespace {

const char kDefaultMetricsTemplate[] = "output/run_metrics_{timestamp}.json";

}  // namespace

RunMetrics::RunMetrics(const std::string& board, TimeSource time)
    : board_(board),
      run_id_(LocalTimestampCompact() + "-" + GenerateSessionId().substr(0, 6)),
      started_at_(UtcNowIso8601()),
      time_(std::move(time)) {
  started_ = time_.now();
}

void RunMetrics::Inc(const std::string& key, int64_t amount) {
  if (key.empty()) return;
  counters_[key] += amount;
}

void RunMetrics::SetGauge(const std::string& key, double value) {
  if (key.empty()) return;
  gauges_[key] = value;
}

void RunMetrics::RecordEvent(const std::string& kind, const json& fields) {
  if (kind.empty()) return;
  json payload = {{"t", UtcNowIso8601()}, {"kind", kind}};
  if (fields.is_object()) {
    for (auto it = fields.begin(); it != fields.end(); ++it) {
      if (!it.value().is_null() && it.key() != "t" && it.key() != "kind") {
        payload[it.key()] = it.value();
      }
    }
  }
  events_.push_back(payload);
}

int64_t RunMetrics::Counter(const std::string& key) const {
  auto it = counters_.find(key);
  return it == counters_.end() ? 0 : it->second;
}

json RunMetrics::Finalize(const json& extra) const {
  double elapsed = std::chrono::duration<double>(time_.now() - started_).count();
  if (elapsed < 0) elapsed = 0;

  json doc = {
    {"board", board_},
    {"runId", run_id_},
    {"startedAt", started_at_},
    {"endedAt", UtcNowIso8601()},
    {"durationSeconds", std::round(elapsed * 1000.0) / 1000.0},
    {"counters", counters_},
    {"gauges", gauges_},
    {"events", events_}
  };
  if (extra.is_object() && !extra.empty()) {
    doc["extra"] = extra;
  }
  if (!output_path_.empty()) {
    doc["outputPath"] = output_path_;
  }
  return doc;
}

std::string RunMetrics::WriteJson(const std::string& path_template, const json& extra) {
  std::string path = RenderTimestampTemplate(path_template.empty() ? kDefaultMetricsTemplate
                                                                   : path_template);
  std::string previous = output_path_;
  output_path_ = path;

  json doc = Finalize(extra);
  if (!WriteFileAtomic(path, doc.dump(2, ' ', false, json::error_handler_t::replace))) {
    LOG_ERROR("RunMetrics", "Failed to write run metrics to " + path);
    output_path_ = previous;
    return "";
  }

  LOG_INFO("RunMetrics", "Run metrics written to " + path);
  return path;
}

}  // namespace hawk
