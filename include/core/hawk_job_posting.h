#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace hawk {

// One collected listing as it leaves a site collector
struct JobPosting {
  std::string title;
  std::string company;
  std::string location;
  std::string link;
  std::string description;
  std::string salary;
  std::string job_type;
  std::string source;        // board name, e.g. "indeed"
  std::string external_id;   // listing id when the collector knows it
  std::string date_posted;
  std::string collected_at;  // ISO-8601

  bool HasSalary() const { return !salary.empty(); }
};

nlohmann::json JobPostingToJson(const JobPosting& job);

// Missing or non-string fields stay empty
JobPosting JobPostingFromJson(const nlohmann::json& doc);

}  // namespace hawk
