#pragma once

#include <memory>
#include <string>
#include "hawk_config.h"
#include "hawk_http_client.h"
#include "hawk_widget_params.h"

namespace hawk {

struct TokenTask {
  WidgetParams widget;
  std::string page_url;
  std::string user_agent;   // optional
};

struct TaskSubmission {
  bool success = false;
  std::string task_id;
  std::string error;
};

enum class TaskState {
  PROCESSING,
  READY,
  FAILED
};

struct TaskPoll {
  TaskState state = TaskState::FAILED;
  std::string token;
  std::string error;
};

/**
 * TokenSolverClient - create-task / poll-result API of a CAPTCHA solving service
 *
 * Implementations never log the API key or the returned token.
 */
class TokenSolverClient {
public:
  virtual ~TokenSolverClient() = default;

  virtual std::string Name() const = 0;
  virtual TaskSubmission CreateTask(const TokenTask& task) = 0;
  virtual TaskPoll PollTask(const std::string& task_id) = 0;
};

// nullptr when the API key is empty
std::unique_ptr<TokenSolverClient> CreateTokenSolverClient(const CaptchaConfig& config,
                                                           HttpTransport* transport);

}  // namespace hawk
