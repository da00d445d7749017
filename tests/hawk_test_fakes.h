#pragma once

#include <chrono>
#include <stdlib.h>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "hawk_browser_page.h"
#include "hawk_http_client.h"
#include "hawk_manual_backend.h"
#include "hawk_solver_client.h"
#include "hawk_time_source.h"

namespace hawk {
namespace testing {

using json = nlohmann::json;

/**
 * Scripted page. Selectors not listed in `present` match nothing; a key in
 * `failures` makes the matching call fail with that status:
 *   "title", "url", "query:<sel>", "visible:<sel>", "text:<sel>",
 *   "attr:<sel>", "evaluate", "init_script", "reload", "screenshot", "content"
 */
class FakeBrowserPage : public BrowserPage {
public:
  std::string title = "Jobs";
  std::string url = "https://example.com/jobs";
  std::string body_text = "Senior engineer roles";
  std::string html = "<html><body>Senior engineer roles</body></html>";
  std::map<std::string, bool> present;
  std::map<std::string, bool> visible;
  std::map<std::string, std::string> attributes;   // "<selector>@<name>"
  std::map<std::string, PageStatus> failures;

  std::function<PageResult<json>(const std::string&, const json&)> evaluate_handler;
  std::function<void(FakeBrowserPage&)> on_reload;

  std::vector<std::string> init_scripts;
  std::vector<std::pair<std::string, json>> evaluate_calls;
  std::vector<std::string> screenshots;
  int reload_count = 0;

  void SetAttribute(const std::string& selector, const std::string& name,
                    const std::string& value) {
    present[selector] = true;
    attributes[selector + "@" + name] = value;
  }

  // Turns the page into a Cloudflare interstitial
  void ShowInterstitial() {
    title = "Just a moment...";
    body_text = "Checking your browser before accessing example.com";
  }

  void ShowContent() {
    title = "Jobs";
    body_text = "Senior engineer roles";
    present.clear();
    visible.clear();
  }

  PageResult<std::string> Title() override {
    if (Failing("title")) return Fail<std::string>("title");
    return PageResult<std::string>::Ok(title);
  }

  PageResult<std::string> Url() override {
    if (Failing("url")) return Fail<std::string>("url");
    return PageResult<std::string>::Ok(url);
  }

  PageResult<bool> QuerySelector(const std::string& selector) override {
    if (Failing("query:" + selector)) return Fail<bool>("query:" + selector);
    auto it = present.find(selector);
    return PageResult<bool>::Ok(it != present.end() && it->second);
  }

  PageResult<std::string> GetAttribute(const std::string& selector,
                                       const std::string& name) override {
    if (Failing("attr:" + selector)) return Fail<std::string>("attr:" + selector);
    auto it = attributes.find(selector + "@" + name);
    if (it != attributes.end()) return PageResult<std::string>::Ok(it->second);
    auto found = present.find(selector);
    if (found != present.end() && found->second) return PageResult<std::string>::Ok("");
    return PageResult<std::string>::Failure(PageStatus::ELEMENT_NOT_FOUND);
  }

  PageResult<bool> IsVisible(const std::string& selector) override {
    if (Failing("visible:" + selector)) return Fail<bool>("visible:" + selector);
    auto it = visible.find(selector);
    return PageResult<bool>::Ok(it != visible.end() && it->second);
  }

  PageResult<std::string> InnerText(const std::string& selector) override {
    if (Failing("text:" + selector)) return Fail<std::string>("text:" + selector);
    if (selector == "body") return PageResult<std::string>::Ok(body_text);
    return PageResult<std::string>::Failure(PageStatus::ELEMENT_NOT_FOUND);
  }

  PageResult<json> Evaluate(const std::string& script, const json& args) override {
    evaluate_calls.emplace_back(script, args);
    if (Failing("evaluate")) return Fail<json>("evaluate");
    if (evaluate_handler) return evaluate_handler(script, args);
    return PageResult<json>::Ok(json());
  }

  PageResult<bool> AddInitScript(const std::string& script) override {
    if (Failing("init_script")) return Fail<bool>("init_script");
    init_scripts.push_back(script);
    return PageResult<bool>::Ok(true);
  }

  PageResult<bool> Reload() override {
    if (Failing("reload")) return Fail<bool>("reload");
    reload_count++;
    if (on_reload) on_reload(*this);
    return PageResult<bool>::Ok(true);
  }

  PageResult<bool> Screenshot(const std::string& path) override {
    if (Failing("screenshot")) return Fail<bool>("screenshot");
    std::ofstream out(path, std::ios::binary);
    out << "PNG";
    screenshots.push_back(path);
    return PageResult<bool>::Ok(true);
  }

  PageResult<std::string> Content() override {
    if (Failing("content")) return Fail<std::string>("content");
    return PageResult<std::string>::Ok(html);
  }

  // Number of Evaluate calls that carried a token (injection attempts)
  int InjectionCalls() const {
    int count = 0;
    for (const auto& call : evaluate_calls) {
      if (call.second.is_object() && call.second.contains("token")) count++;
    }
    return count;
  }

private:
  bool Failing(const std::string& key) const { return failures.count(key) > 0; }

  template <typename T>
  PageResult<T> Fail(const std::string& key) const {
    return PageResult<T>::Failure(failures.at(key));
  }
};

class FakeBrowserContext : public BrowserContextHandle {
public:
  std::vector<CookieData> cookies;
  bool fail = false;

  PageResult<bool> AddCookies(const std::vector<CookieData>& added) override {
    if (fail) return PageResult<bool>::Failure(PageStatus::PAGE_CLOSED);
    cookies.insert(cookies.end(), added.begin(), added.end());
    return PageResult<bool>::Ok(true);
  }
};

/**
 * Transport answering from a handler when set, otherwise from a FIFO of
 * queued responses. Every request is recorded.
 */
class FakeHttpTransport : public HttpTransport {
public:
  struct Request {
    std::string method;   // GET, POST_JSON, POST_FORM
    std::string url;
    std::string body;
    std::vector<std::pair<std::string, std::string>> fields;
    int timeout_seconds = 0;

    std::string Field(const std::string& name) const {
      for (const auto& field : fields) {
        if (field.first == name) return field.second;
      }
      return "";
    }
    json BodyJson() const { return json::parse(body); }
  };

  std::function<HttpResponse(const Request&)> handler;
  std::deque<HttpResponse> queued;
  std::vector<Request> requests;

  static HttpResponse Json(const json& body, long status = 200) {
    HttpResponse response;
    response.success = true;
    response.status_code = status;
    response.body = body.dump();
    return response;
  }

  static HttpResponse Unreachable(const std::string& error = "Couldn't connect to server") {
    HttpResponse response;
    response.success = false;
    response.error = error;
    return response;
  }

  void Queue(const HttpResponse& response) { queued.push_back(response); }
  void QueueJson(const json& body, long status = 200) { queued.push_back(Json(body, status)); }

  HttpResponse Get(const std::string& url, int timeout_seconds) override {
    return Answer({"GET", url, "", {}, timeout_seconds});
  }

  HttpResponse PostJson(const std::string& url, const std::string& body,
                        int timeout_seconds) override {
    return Answer({"POST_JSON", url, body, {}, timeout_seconds});
  }

  HttpResponse PostForm(const std::string& url,
                        const std::vector<std::pair<std::string, std::string>>& fields,
                        int timeout_seconds) override {
    return Answer({"POST_FORM", url, "", fields, timeout_seconds});
  }

  int CountTo(const std::string& needle) const {
    int count = 0;
    for (const auto& request : requests) {
      if (request.url.find(needle) != std::string::npos) count++;
    }
    return count;
  }

private:
  HttpResponse Answer(const Request& request) {
    requests.push_back(request);
    if (handler) return handler(request);
    if (queued.empty()) return Unreachable("no response queued");
    HttpResponse response = queued.front();
    queued.pop_front();
    return response;
  }
};

// Manual clock: sleeping advances it instantly
class FakeTimeSource {
public:
  SteadyTime current = SteadyTime(std::chrono::hours(1000));
  std::vector<Millis> sleeps;

  TimeSource source() {
    TimeSource time;
    time.now = [this] { return current; };
    time.sleep = [this](Millis duration) {
      sleeps.push_back(duration);
      current += duration;
    };
    return time;
  }

  void Advance(std::chrono::seconds seconds) { current += seconds; }

  Millis TotalSlept() const {
    Millis total(0);
    for (const auto& sleep : sleeps) total += sleep;
    return total;
  }
};

class ScriptedOperatorPrompt : public OperatorPrompt {
public:
  bool interactive = true;
  std::deque<PolicyAction> answers;
  int asked = 0;
  std::function<void()> on_ask;

  bool IsInteractive() const override { return interactive; }

  PolicyAction Ask(const ChallengeVerdict& verdict, const std::string& url) override {
    (void)verdict;
    (void)url;
    asked++;
    if (on_ask) on_ask();
    if (answers.empty()) return PolicyAction::SKIP;
    PolicyAction answer = answers.front();
    answers.pop_front();
    return answer;
  }
};

// Token API answering from scripted submissions and polls
class FakeTokenSolverClient : public TokenSolverClient {
public:
  std::deque<TaskSubmission> submissions;
  std::deque<TaskPoll> polls;
  std::vector<TokenTask> tasks;
  int poll_count = 0;

  static TaskSubmission Accepted(const std::string& task_id) {
    TaskSubmission submission;
    submission.success = true;
    submission.task_id = task_id;
    return submission;
  }
  static TaskSubmission Rejected(const std::string& error) {
    TaskSubmission submission;
    submission.error = error;
    return submission;
  }
  static TaskPoll Ready(const std::string& token) {
    TaskPoll poll;
    poll.state = TaskState::READY;
    poll.token = token;
    return poll;
  }
  static TaskPoll Processing() {
    TaskPoll poll;
    poll.state = TaskState::PROCESSING;
    return poll;
  }
  static TaskPoll Failed(const std::string& error) {
    TaskPoll poll;
    poll.error = error;
    return poll;
  }

  std::string Name() const override { return "fake"; }

  TaskSubmission CreateTask(const TokenTask& task) override {
    tasks.push_back(task);
    if (submissions.empty()) return Rejected("no submission scripted");
    TaskSubmission next = submissions.front();
    submissions.pop_front();
    return next;
  }

  // The last scripted poll repeats
  TaskPoll PollTask(const std::string& task_id) override {
    (void)task_id;
    poll_count++;
    if (polls.empty()) return Failed("no poll scripted");
    TaskPoll next = polls.front();
    if (polls.size() > 1) polls.pop_front();
    return next;
  }
};

// Scratch directory removed on destruction
class TempDir {
public:
  TempDir() {
    std::string pattern = (std::filesystem::temp_directory_path() / "hawk_test_XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    char* created = mkdtemp(buffer.data());
    path_ = created ? std::string(created) : pattern;
  }

  ~TempDir() {
    std::error_code ignored;
    std::filesystem::remove_all(path_, ignored);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }
  std::string File(const std::string& name) const { return path_ + "/" + name; }

private:
  std::string path_;
};

}  // namespace testing
}  // namespace hawk
