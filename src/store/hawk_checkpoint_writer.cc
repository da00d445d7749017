#include "hawk_checkpoint_writer.h"
#include "hawk_file_utils.h"
#include "hawk_time_source.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

CheckpointWriter::CheckpointWriter(const std::string& path, int interval)
    : path_(path), interval_(interval) {}

bool CheckpointWriter::MaybeWrite(const std::vector<JobPosting>& items,
                                  const std::string& current_query) {
  if (interval_ <= 0 || items.empty()) {
    return false;
  }
  if (items.size() % static_cast<size_t>(interval_) != 0 ||
      items.size() == last_written_total_) {
    return false;
  }
  return WriteCheckpoint(items, current_query);
}

bool CheckpointWriter::WriteCheckpoint(const std::vector<JobPosting>& items,
                                       const std::string& current_query) {
  size_t with_salary = 0;
  json serialized = json::array();
  for (const auto& job : items) {
    if (job.HasSalary()) with_salary++;
    serialized.push_back(JobPostingToJson(job));
  }

  json doc = {
    {"timestamp", LocalNowIso8601()},
    {"totalCollected", items.size()},
    {"totalWithSalary", with_salary},
    {"currentQuery", current_query},
    {"items", serialized}
  };

  if (!WriteFileAtomic(path_, doc.dump(2, ' ', false, json::error_handler_t::replace))) {
    LOG_WARN("Checkpoint", "Failed to write checkpoint " + path_);
    return false;
  }

  write_count_++;
  last_written_total_ = items.size();
  LOG_INFO("Checkpoint", "Saved " + std::to_string(items.size()) + " item(s) (" +
           std::to_string(with_salary) + " with salary)");
  return true;
}

}  // namespace hawk
