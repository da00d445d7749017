#include "hawk_capsolver_client.h"
#include "hawk_string_utils.h"
#include "logger.h"

using json = nlohmann::json;

namespace hawk {

namespace {

const int kRequestTimeoutSeconds = 30;

const char* TaskType(WidgetKind kind) {
  switch (kind) {
    case WidgetKind::HCAPTCHA: return "HCaptchaTaskProxyLess";
    case WidgetKind::RECAPTCHA_V2: return "ReCaptchaV2TaskProxyLess";
    default: return "AntiTurnstileTaskProxyLess";
  }
}

int ErrorId(const json& doc) {
  auto it = doc.find("errorId");
  if (it == doc.end() || it->is_null()) return 0;
  if (it->is_number_integer()) return it->get<int>();
  return 1;
}

std::string ErrorDescription(const json& doc) {
  for (const char* key : {"errorDescription", "errorCode"}) {
    auto it = doc.find(key);
    if (it != doc.end() && it->is_string() && !it->get<std::string>().empty()) {
      return it->get<std::string>();
    }
  }
  return "unknown";
}

}  // namespace

CapSolverClient::CapSolverClient(const std::string& api_key, HttpTransport* transport,
                                 const std::string& base_url)
    : api_key_(api_key), transport_(transport), base_url_(base_url) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

bool CapSolverClient::PostJson(const std::string& path, const std::string& body, json* out,
                               std::string* error) {
  HttpResponse response = transport_->PostJson(base_url_ + path, body, kRequestTimeoutSeconds);
  if (!response.success) {
    *error = "capsolver request error: " + response.error;
    return false;
  }
  if (!response.ok()) {
    *error = "capsolver HTTP " + std::to_string(response.status_code) + ": " +
             response.body.substr(0, 200);
    return false;
  }
  try {
    *out = json::parse(response.body);
  } catch (const json::parse_error&) {
    *error = "capsolver invalid JSON: " + response.body.substr(0, 200);
    return false;
  }
  if (!out->is_object()) {
    *error = "capsolver returned unexpected response shape";
    return false;
  }
  return true;
}

TaskSubmission CapSolverClient::CreateTask(const TokenTask& task) {
  TaskSubmission submission;

  json payload = {
    {"clientKey", api_key_},
    {"task", {
      {"type", TaskType(task.widget.kind)},
      {"websiteURL", task.page_url},
      {"websiteKey", task.widget.sitekey}
    }}
  };
  if (task.widget.kind == WidgetKind::TURNSTILE &&
      (!task.widget.action.empty() || !task.widget.cdata.empty())) {
    json metadata = json::object();
    if (!task.widget.action.empty()) metadata["action"] = task.widget.action;
    if (!task.widget.cdata.empty()) metadata["cdata"] = task.widget.cdata;
    payload["task"]["metadata"] = metadata;
  }
  if (!task.user_agent.empty() && task.widget.kind != WidgetKind::TURNSTILE) {
    payload["task"]["userAgent"] = task.user_agent;
  }

  json created;
  if (!PostJson("/createTask", payload.dump(), &created, &submission.error)) {
    return submission;
  }
  if (ErrorId(created) != 0) {
    submission.error = "capsolver createTask error: " + ErrorDescription(created);
    return submission;
  }

  auto it = created.find("taskId");
  if (it == created.end() || !(it->is_string() || it->is_number())) {
    submission.error = "capsolver createTask returned no taskId";
    return submission;
  }
  submission.task_id = it->is_string() ? it->get<std::string>() : it->dump();
  if (submission.task_id.empty()) {
    submission.error = "capsolver createTask returned no taskId";
    return submission;
  }
  submission.success = true;
  return submission;
}

TaskPoll CapSolverClient::PollTask(const std::string& task_id) {
  TaskPoll poll;

  json payload = {{"clientKey", api_key_}, {"taskId", task_id}};
  json result;
  if (!PostJson("/getTaskResult", payload.dump(), &result, &poll.error)) {
    return poll;
  }
  if (ErrorId(result) != 0) {
    poll.error = "capsolver getTaskResult error: " + ErrorDescription(result);
    return poll;
  }

  std::string status;
  auto status_it = result.find("status");
  if (status_it != result.end() && status_it->is_string()) {
    status = ToLower(Trim(status_it->get<std::string>()));
  }

  if (status == "ready") {
    std::string token;
    auto solution = result.find("solution");
    if (solution != result.end() && solution->is_object()) {
      for (const char* key : {"token", "gRecaptchaResponse"}) {
        auto value = solution->find(key);
        if (value != solution->end() && value->is_string() && !value->get<std::string>().empty()) {
          token = Trim(value->get<std::string>());
          break;
        }
      }
    }
    if (token.empty()) {
      poll.error = "capsolver returned empty token";
      return poll;
    }
    poll.state = TaskState::READY;
    poll.token = token;
    return poll;
  }

  if (status.empty()) {
    poll.error = "capsolver unexpected status: empty";
    return poll;
  }
  if (status == "processing" || status == "idle") {
    poll.state = TaskState::PROCESSING;
    return poll;
  }

  poll.error = "capsolver unexpected status: " + status;
  return poll;
}

}  // namespace hawk
