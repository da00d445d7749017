#include "hawk_two_captcha_client.h"
#include "hawk_url_utils.h"
#include "logger.h"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace hawk {

namespace {

const int kRequestTimeoutSeconds = 30;

// 2captcha answers {"status": 1, "request": "..."}; status may arrive as a string
bool StatusIsOne(const json& doc) {
  auto it = doc.find("status");
  if (it == doc.end()) return false;
  if (it->is_number_integer()) return it->get<int>() == 1;
  if (it->is_string()) return it->get<std::string>() == "1";
  return false;
}

std::string RequestField(const json& doc) {
  auto it = doc.find("request");
  if (it == doc.end()) return "";
  if (it->is_string()) return it->get<std::string>();
  return it->dump();
}

}  // namespace

TwoCaptchaClient::TwoCaptchaClient(const std::string& api_key, HttpTransport* transport,
                                   const std::string& base_url)
    : api_key_(api_key), transport_(transport), base_url_(base_url) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

TaskSubmission TwoCaptchaClient::CreateTask(const TokenTask& task) {
  TaskSubmission submission;

  std::vector<std::pair<std::string, std::string>> fields = {{"key", api_key_}};
  switch (task.widget.kind) {
    case WidgetKind::HCAPTCHA:
      fields.emplace_back("method", "hcaptcha");
      fields.emplace_back("sitekey", task.widget.sitekey);
      break;
    case WidgetKind::RECAPTCHA_V2:
      fields.emplace_back("method", "userrecaptcha");
      fields.emplace_back("googlekey", task.widget.sitekey);
      break;
    default:
      fields.emplace_back("method", "turnstile");
      fields.emplace_back("sitekey", task.widget.sitekey);
      if (!task.widget.action.empty()) fields.emplace_back("action", task.widget.action);
      if (!task.widget.cdata.empty()) fields.emplace_back("data", task.widget.cdata);
      if (!task.widget.page_data.empty()) fields.emplace_back("pagedata", task.widget.page_data);
      break;
  }
  fields.emplace_back("pageurl", task.page_url);
  if (!task.user_agent.empty()) fields.emplace_back("userAgent", task.user_agent);
  fields.emplace_back("json", "1");

  HttpResponse response = transport_->PostForm(base_url_ + "/in.php", fields,
                                               kRequestTimeoutSeconds);
  if (!response.ok()) {
    submission.error = "2captcha submit failed: " +
                       (response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                               : response.error);
    return submission;
  }

  json doc;
  try {
    doc = json::parse(response.body);
  } catch (const json::parse_error&) {
    submission.error = "2captcha submit returned invalid JSON: " + response.body.substr(0, 200);
    return submission;
  }

  if (!doc.is_object() || !StatusIsOne(doc)) {
    submission.error = "2captcha submit error: " +
                       (doc.is_object() ? RequestField(doc) : response.body.substr(0, 200));
    return submission;
  }

  submission.task_id = RequestField(doc);
  if (submission.task_id.empty()) {
    submission.error = "2captcha submit returned no request id";
    return submission;
  }
  submission.success = true;
  LOG_DEBUG("TwoCaptcha", "Task submitted: " + submission.task_id);
  return submission;
}

TaskPoll TwoCaptchaClient::PollTask(const std::string& task_id) {
  TaskPoll poll;

  std::string url = base_url_ + "/res.php?" + BuildFormBody({
    {"key", api_key_},
    {"action", "get"},
    {"id", task_id},
    {"json", "1"}
  });

  HttpResponse response = transport_->Get(url, kRequestTimeoutSeconds);
  if (!response.ok()) {
    poll.error = "2captcha poll failed: " +
                 (response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                         : response.error);
    return poll;
  }

  json doc;
  try {
    doc = json::parse(response.body);
  } catch (const json::parse_error&) {
    poll.error = "2captcha poll returned invalid JSON: " + response.body.substr(0, 200);
    return poll;
  }
  if (!doc.is_object()) {
    poll.error = "2captcha poll returned unexpected shape";
    return poll;
  }

  std::string request = RequestField(doc);
  if (StatusIsOne(doc)) {
    if (request.empty()) {
      poll.error = "2captcha returned empty token";
      return poll;
    }
    poll.state = TaskState::READY;
    poll.token = request;
    return poll;
  }

  if (request == "CAPCHA_NOT_READY") {
    poll.state = TaskState::PROCESSING;
    return poll;
  }

  poll.error = "2captcha poll error: " + request;
  return poll;
}

}  // namespace hawk
