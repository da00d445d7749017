#pragma once

#include <nlohmann/json.hpp>
#include "hawk_solver_client.h"

namespace hawk {

// CapSolver createTask / getTaskResult API (proxyless task types)
class CapSolverClient : public TokenSolverClient {
public:
  CapSolverClient(const std::string& api_key, HttpTransport* transport,
                  const std::string& base_url = "https://api.capsolver.com");

  std::string Name() const override { return "capsolver"; }
  TaskSubmission CreateTask(const TokenTask& task) override;
  TaskPoll PollTask(const std::string& task_id) override;

private:
  // Parsed JSON object or an error string
  bool PostJson(const std::string& path, const std::string& body, nlohmann::json* out,
                std::string* error);

  std::string api_key_;
  HttpTransport* transport_;
  std::string base_url_;
};

}  // namespace hawk
