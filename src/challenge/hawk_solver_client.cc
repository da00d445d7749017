#include "hawk_solver_client.h"
#include "hawk_capsolver_client.h"
#include "hawk_two_captcha_client.h"
#include "logger.h"

namespace hawk {

std::unique_ptr<TokenSolverClient> CreateTokenSolverClient(const CaptchaConfig& config,
                                                           HttpTransport* transport) {
  if (config.api_key.empty()) {
    LOG_WARN("SolverClient", "No API key in $" + config.api_key_env +
             "; token solving disabled");
    return nullptr;
  }

  switch (config.provider) {
    case TokenProvider::CAPSOLVER:
      LOG_DEBUG("SolverClient", "Creating CapSolver client");
      return config.endpoint.empty()
                 ? std::make_unique<CapSolverClient>(config.api_key, transport)
                 : std::make_unique<CapSolverClient>(config.api_key, transport, config.endpoint);

    case TokenProvider::TWO_CAPTCHA:
    default:
      LOG_DEBUG("SolverClient", "Creating 2captcha client");
      return config.endpoint.empty()
                 ? std::make_unique<TwoCaptchaClient>(config.api_key, transport)
                 : std::make_unique<TwoCaptchaClient>(config.api_key, transport, config.endpoint);
  }
}

}  // namespace hawk
