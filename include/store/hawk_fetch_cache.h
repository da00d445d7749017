#pragma once

#include <exception>
#include <functional>
#include <map>
#include <optional>
#include <utility>
#include <string>
#include "hawk_errors.h"
#include "hawk_url_utils.h"
#include "logger.h"

namespace hawk {

enum class FetchStatus {
  FETCHED,   // value produced
  EMPTY,     // page read fine but carried none of the fields
  FAILED,    // fetch gave up after its own retries
  SKIPPED,   // skip mode active, fetch not attempted
  ABORTED    // run abort requested, fetch not attempted or interrupted
};

inline const char* FetchStatusToString(FetchStatus status) {
  switch (status) {
    case FetchStatus::FETCHED: return "fetched";
    case FetchStatus::EMPTY: return "empty";
    case FetchStatus::FAILED: return "failed";
    case FetchStatus::SKIPPED: return "skipped";
    case FetchStatus::ABORTED: return "aborted";
    default: return "unknown";
  }
}

template <typename Value>
struct FetchResult {
  FetchStatus status = FetchStatus::FAILED;
  Value value{};
  ErrorKind error = ErrorKind::NONE;
  std::string message;
  bool from_cache = false;

  bool terminal() const {
    return status == FetchStatus::FETCHED || status == FetchStatus::EMPTY ||
           status == FetchStatus::FAILED;
  }

  static FetchResult Fetched(Value v) {
    FetchResult r;
    r.status = FetchStatus::FETCHED;
    r.value = std::move(v);
    return r;
  }
  static FetchResult Empty() {
    FetchResult r;
    r.status = FetchStatus::EMPTY;
    return r;
  }
  static FetchResult Failed(ErrorKind error, const std::string& msg) {
    FetchResult r;
    r.status = FetchStatus::FAILED;
    r.error = error;
    r.message = msg;
    return r;
  }
  static FetchResult Skipped() {
    FetchResult r;
    r.status = FetchStatus::SKIPPED;
    return r;
  }
  static FetchResult Aborted() {
    FetchResult r;
    r.status = FetchStatus::ABORTED;
    r.error = ErrorKind::ABORT;
    return r;
  }
};

// Optional fields a detail page may add to a listing
struct DetailFields {
  std::optional<std::string> salary;
  std::optional<std::string> job_type;
  std::optional<std::string> company;
  std::optional<std::string> description;
  std::optional<std::string> date_posted;

  bool empty() const {
    return !salary && !job_type && !company && !description && !date_posted;
  }
};

/**
 * FetchCache - per-run memo of expensive per-URL fetches
 *
 * The fetch function runs at most once per normalized URL. FETCHED, EMPTY
 * and FAILED results are terminal and cached; later calls get the cached
 * result back without calling the function. SKIPPED and ABORTED are not
 * terminal and leave the cache untouched. A function that throws is recorded
 * as FAILED. Retries belong inside the fetch function.
 */
template <typename Value>
class FetchCache {
public:
  using Result = FetchResult<Value>;
  using FetchFn = std::function<Result(const std::string& url)>;

  Result GetOrFetch(const std::string& url, const FetchFn& fetch) {
    std::string key = NormalizeUrlForCache(url);

    auto it = entries_.find(key);
    if (it != entries_.end()) {
      hits_++;
      Result cached = it->second;
      cached.from_cache = true;
      return cached;
    }

    misses_++;
    Result result;
    try {
      result = fetch(url);
    } catch (const std::exception& e) {
      LOG_WARN("FetchCache", "Fetch threw for " + key + ": " + e.what());
      result = Result::Failed(ErrorKind::NAVIGATION, e.what());
    } catch (...) {
      LOG_WARN("FetchCache", "Fetch threw a non-standard exception for " + key);
      result = Result::Failed(ErrorKind::NAVIGATION, "unknown exception");
    }

    if (result.terminal()) {
      result.from_cache = false;
      entries_.emplace(key, result);
    }
    return result;
  }

  bool Contains(const std::string& url) const {
    return entries_.count(NormalizeUrlForCache(url)) > 0;
  }

  size_t size() const { return entries_.size(); }
  int hits() const { return hits_; }
  int misses() const { return misses_; }

private:
  std::map<std::string, Result> entries_;
  int hits_ = 0;
  int misses_ = 0;
};

}  // namespace hawk
