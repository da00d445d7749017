#pragma once

#include <string>
#include <unordered_set>
#include <vector>
#include "hawk_extractor_chain.h"
#include "hawk_job_posting.h"

namespace hawk {

struct DedupeSplit {
  std::vector<JobPosting> fresh;
  std::vector<JobPosting> duplicates;
};

/**
 * StableKeyDeriver - identity of a listing that survives tracking-parameter
 * churn. Steps, first hit wins:
 *   explicit external id, board-specific URL id, generic jobId/job_id
 *   parameter, then source|title|company|location normalized.
 */
class StableKeyDeriver {
public:
  StableKeyDeriver();

  std::string Derive(const JobPosting& job) const;
  // Which step produced the key, for diagnostics
  std::string DeriveSource(const JobPosting& job) const;

private:
  ExtractorChain<JobPosting, std::string> chain_;
};

/**
 * DedupeStore - append-only cross-run hash log (JSON lines)
 *
 * The seen set is rebuilt from the log on construction. The log is only ever
 * appended to; a crash mid-write can at worst leave a truncated last line,
 * which the next load skips.
 */
class DedupeStore {
public:
  explicit DedupeStore(const std::string& path);

  // Splits items; fresh ones (including the first of in-batch repeats) are
  // added to the seen set
  DedupeSplit FilterNew(const std::vector<JobPosting>& items);

  // Appends one line per item; false if the log could not be written
  bool Record(const std::vector<JobPosting>& items);

  std::string HashOf(const JobPosting& job) const;
  bool Seen(const JobPosting& job) const;

  size_t seen_count() const { return seen_.size(); }
  int invalid_lines() const { return invalid_lines_; }
  const std::string& path() const { return path_; }

private:
  void Load();

  std::string path_;
  StableKeyDeriver keys_;
  std::unordered_set<std::string> seen_;
  int invalid_lines_ = 0;
};

}  // namespace hawk
