#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace hawk {

/**
 * ExtractorChain - ordered list of fallible extractors.
 *
 * Each step either produces a value or declines with nullopt. Run() returns
 * the first produced value together with the name of the step that made it.
 * Used wherever a value has several sources of decreasing reliability
 * (widget sitekeys, listing identity keys).
 */
template <typename Input, typename Output>
class ExtractorChain {
public:
  using Extractor = std::function<std::optional<Output>(const Input&)>;

  struct Match {
    Output value;
    std::string source;
  };

  ExtractorChain& Add(const std::string& name, Extractor extractor) {
    steps_.emplace_back(name, std::move(extractor));
    return *this;
  }

  std::optional<Match> Run(const Input& input) const {
    for (const auto& [name, extractor] : steps_) {
      std::optional<Output> value = extractor(input);
      if (value) {
        return Match{std::move(*value), name};
      }
    }
    return std::nullopt;
  }

  size_t size() const { return steps_.size(); }

private:
  std::vector<std::pair<std::string, Extractor>> steps_;
};

}  // namespace hawk
