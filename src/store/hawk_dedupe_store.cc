#include "hawk_dedupe_store.h"
#include "hawk_file_utils.h"
#include "hawk_hash.h"
#include "hawk_string_utils.h"
#include "hawk_url_utils.h"
#include "logger.h"
#include <cctype>
#include <fstream>

using json = nlohmann::json;

namespace hawk {

namespace {

std::string SourceOf(const JobPosting& job) {
  return ToLower(Trim(job.source));
}

std::optional<std::string> FirstParam(const std::string& url,
                                      std::initializer_list<const char*> names) {
  for (const char* name : names) {
    std::optional<std::string> value = GetQueryParam(url, name);
    if (value && !Trim(*value).empty()) {
      return Trim(*value);
    }
  }
  return std::nullopt;
}

// Trailing digits of /jobs/view/<slug-or-id>
std::optional<std::string> LinkedInViewId(const std::string& url) {
  ParsedUrl parsed = ParseUrl(url);
  const std::string marker = "/jobs/view/";
  size_t pos = parsed.path.find(marker);
  if (pos == std::string::npos) return std::nullopt;

  std::string segment = parsed.path.substr(pos + marker.size());
  size_t slash = segment.find('/');
  if (slash != std::string::npos) segment = segment.substr(0, slash);

  size_t end = segment.size();
  size_t start = end;
  while (start > 0 && std::isdigit(static_cast<unsigned char>(segment[start - 1]))) {
    start--;
  }
  if (start == end) return std::nullopt;
  return segment.substr(start, end - start);
}

}  // namespace

StableKeyDeriver::StableKeyDeriver() {
  chain_
    .Add("external_id", [](const JobPosting& job) -> std::optional<std::string> {
      std::string id = Trim(job.external_id);
      if (id.empty()) return std::nullopt;
      return SourceOf(job) + "|" + id;
    })
    .Add("url_id", [](const JobPosting& job) -> std::optional<std::string> {
      if (job.link.empty()) return std::nullopt;
      std::string source = SourceOf(job);
      std::optional<std::string> id;
      if (source == "indeed") {
        id = FirstParam(job.link, {"jk", "vjk"});
      } else if (source == "glassdoor") {
        id = FirstParam(job.link, {"jobListingId", "jl"});
      } else if (source == "linkedin") {
        id = FirstParam(job.link, {"currentJobId"});
        if (!id) id = LinkedInViewId(job.link);
      }
      if (!id) return std::nullopt;
      return source + "|" + *id;
    })
    .Add("generic_url_id", [](const JobPosting& job) -> std::optional<std::string> {
      if (job.link.empty()) return std::nullopt;
      std::optional<std::string> id = FirstParam(job.link, {"jobId", "job_id"});
      if (!id) return std::nullopt;
      return SourceOf(job) + "|" + *id;
    })
    .Add("composite", [](const JobPosting& job) -> std::optional<std::string> {
      return SourceOf(job) + "|" + NormalizeText(job.title) + "|" +
             NormalizeText(job.company) + "|" + NormalizeText(job.location);
    });
}

std::string StableKeyDeriver::Derive(const JobPosting& job) const {
  auto match = chain_.Run(job);
  return match ? match->value : std::string();
}

std::string StableKeyDeriver::DeriveSource(const JobPosting& job) const {
  auto match = chain_.Run(job);
  return match ? match->source : std::string();
}

DedupeStore::DedupeStore(const std::string& path) : path_(path) {
  Load();
}

void DedupeStore::Load() {
  if (!FileExists(path_)) {
    return;
  }

  std::ifstream in(path_);
  if (!in.is_open()) {
    LOG_WARN("DedupeStore", "Failed to read dedupe log: " + path_);
    return;
  }

  std::string line;
  while (std::getline(in, line)) {
    line = Trim(line);
    if (line.empty()) continue;
    try {
      json payload = json::parse(line);
      if (payload.is_object() && payload.contains("hash") && payload["hash"].is_string() &&
          !payload["hash"].get<std::string>().empty()) {
        seen_.insert(payload["hash"].get<std::string>());
      } else {
        invalid_lines_++;
      }
    } catch (const json::parse_error&) {
      invalid_lines_++;
      LOG_WARN("DedupeStore", "Skipping invalid dedupe line");
    }
  }

  LOG_INFO("DedupeStore", "Loaded " + std::to_string(seen_.size()) + " hash(es) from " + path_);
}

std::string DedupeStore::HashOf(const JobPosting& job) const {
  return Sha256Hex(keys_.Derive(job));
}

bool DedupeStore::Seen(const JobPosting& job) const {
  return seen_.count(HashOf(job)) > 0;
}

DedupeSplit DedupeStore::FilterNew(const std::vector<JobPosting>& items) {
  DedupeSplit split;
  for (const auto& job : items) {
    std::string hash = HashOf(job);
    if (seen_.count(hash)) {
      split.duplicates.push_back(job);
      continue;
    }
    seen_.insert(hash);
    split.fresh.push_back(job);
  }
  return split;
}

bool DedupeStore::Record(const std::vector<JobPosting>& items) {
  if (items.empty()) {
    return true;
  }

  std::string lines;
  for (const auto& job : items) {
    std::string hash = HashOf(job);
    json payload = {
      {"hash", hash},
      {"link", job.link.empty() ? json(nullptr) : json(job.link)},
      {"title", job.title},
      {"company", job.company},
      {"location", job.location},
      {"source", job.source},
      {"collectedAt", job.collected_at}
    };
    lines += payload.dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
    seen_.insert(hash);
  }

  if (!AppendToFile(path_, lines)) {
    LOG_WARN("DedupeStore", "Failed to write dedupe log: " + path_);
    return false;
  }
  return true;
}

}  // namespace hawk
