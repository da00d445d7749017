#pragma once

#include <string>
#include <vector>
#include "hawk_job_posting.h"

namespace hawk {

/**
 * CheckpointWriter - periodic full snapshot of collected items
 *
 * Each write replaces the file as a whole (temp file + rename), so a crash
 * leaves either the previous or the new snapshot and loses at most
 * `interval` items.
 */
class CheckpointWriter {
public:
  CheckpointWriter(const std::string& path, int interval);

  // Writes when items.size() is a non-zero multiple of interval not yet written
  bool MaybeWrite(const std::vector<JobPosting>& items, const std::string& current_query);

  // Unconditional snapshot (finalize, abort)
  bool WriteCheckpoint(const std::vector<JobPosting>& items, const std::string& current_query);

  int write_count() const { return write_count_; }
  size_t last_written_total() const { return last_written_total_; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  int interval_;
  int write_count_ = 0;
  size_t last_written_total_ = 0;
};

}  // namespace hawk
