#pragma once

#include <string>
#include <vector>
#include "hawk_page_signal.h"

namespace hawk {

/**
 * Selector marker with the stable reason tag it reports
 */
struct SelectorMarker {
  std::string selector;
  std::string reason;   // e.g. "selector:cf-turnstile"
};

/**
 * DetectorProfile - per-site additions to the fixed challenge signatures
 *
 * content_markers only render on a genuine listing or detail page; any of
 * them being present short-circuits the later marker and body checks.
 */
struct DetectorProfile {
  std::string name = "generic";
  std::vector<std::string> content_markers;
  std::vector<std::string> extra_url_markers;
  std::vector<SelectorMarker> extra_presence_markers;
  std::vector<std::string> extra_body_markers;   // lowercase
};

// "generic", "glassdoor", "indeed", "linkedin"; unknown names give generic
DetectorProfile BuiltinDetectorProfile(const std::string& name);

/**
 * Classification of one page state
 */
struct ChallengeVerdict {
  bool blocked = false;
  std::string reason;   // empty when clear

  static ChallengeVerdict Clear() { return ChallengeVerdict(); }
  static ChallengeVerdict Blocked(const std::string& reason) {
    ChallengeVerdict v;
    v.blocked = true;
    v.reason = reason;
    return v;
  }
};

// Whole-page interstitial (title or URL signature) rather than an embedded widget
bool IsInterstitial(const ChallengeVerdict& verdict);

/**
 * ChallengeDetector - classifies page snapshots as clear or blocked
 *
 * Checks run in a fixed order and the first hit wins:
 * 1. Title substring (known interstitial titles)
 * 2. URL substring (challenge paths)
 * 3. Content-marker allowlist (returns clear)
 * 4. Selector markers, presence-only then visibility-required
 * 5. Body text phrases
 * 6. Clear
 *
 * A snapshot whose capture stopped at some step is classified clear from
 * that step on. In a complete snapshot a selector with no entry counts as
 * absent. Detection errors never block collection.
 */
class ChallengeDetector {
public:
  explicit ChallengeDetector(DetectorProfile profile = DetectorProfile());

  ChallengeVerdict Classify(const PageSignal& signal) const;

  // Capture + Classify
  ChallengeVerdict ClassifyPage(BrowserPage& page) const;

  // Selectors a snapshot must carry for Classify to see every marker
  const SignalQuery& signal_query() const { return query_; }
  const DetectorProfile& profile() const { return profile_; }

private:
  DetectorProfile profile_;
  std::vector<std::string> challenge_titles_;
  std::vector<std::string> url_markers_;
  std::vector<SelectorMarker> presence_markers_;
  std::vector<SelectorMarker> visibility_markers_;
  std::vector<std::string> body_markers_;
  SignalQuery query_;
};

}  // namespace hawk
