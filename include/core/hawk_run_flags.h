#pragma once

namespace hawk {

// Run-scoped switches shared by the resolver and the run session
struct RunFlags {
  bool skip_optional_fetches = false;   // detail fetches bypassed for the rest of the run
  bool abort_requested = false;
  int skip_episodes = 0;
};

}  // namespace hawk
