#include "hawk_job_posting.h"

using json = nlohmann::json;

namespace hawk {

namespace {

std::string StringField(const json& doc, const char* key) {
  auto it = doc.find(key);
  if (it == doc.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

}  // namespace

json JobPostingToJson(const JobPosting& job) {
  json doc = {
    {"title", job.title},
    {"company", job.company},
    {"location", job.location},
    {"link", job.link},
    {"description", job.description},
    {"source", job.source},
    {"collected_at", job.collected_at}
  };
  doc["salary"] = job.salary.empty() ? json(nullptr) : json(job.salary);
  doc["job_type"] = job.job_type.empty() ? json(nullptr) : json(job.job_type);
  doc["date_posted"] = job.date_posted.empty() ? json(nullptr) : json(job.date_posted);
  if (!job.external_id.empty()) {
    doc["external_id"] = job.external_id;
  }
  return doc;
}

JobPosting JobPostingFromJson(const json& doc) {
  JobPosting job;
  if (!doc.is_object()) return job;
  job.title = StringField(doc, "title");
  job.company = StringField(doc, "company");
  job.location = StringField(doc, "location");
  job.link = StringField(doc, "link");
  job.description = StringField(doc, "description");
  job.salary = StringField(doc, "salary");
  job.job_type = StringField(doc, "job_type");
  job.source = StringField(doc, "source");
  job.external_id = StringField(doc, "external_id");
  job.date_posted = StringField(doc, "date_posted");
  job.collected_at = StringField(doc, "collected_at");
  return job;
}

}  // namespace hawk
