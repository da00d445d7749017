#pragma once

#include "hawk_solver_client.h"

namespace hawk {

// 2captcha in.php / res.php API
class TwoCaptchaClient : public TokenSolverClient {
public:
  TwoCaptchaClient(const std::string& api_key, HttpTransport* transport,
                   const std::string& base_url = "https://2captcha.com");

  std::string Name() const override { return "2captcha"; }
  TaskSubmission CreateTask(const TokenTask& task) override;
  TaskPoll PollTask(const std::string& task_id) override;

private:
  std::string api_key_;
  HttpTransport* transport_;
  std::string base_url_;
};

}  // namespace hawk
