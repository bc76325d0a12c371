#pragma once

#include <stdexcept>
#include <string>

namespace metrics {

// Empty required sequence, mismatched lengths, zero-length normalizer or a
// malformed configuration.
struct InvalidInput : std::invalid_argument {
  explicit InvalidInput(const std::string& what)
      : std::invalid_argument(what) {}
};

// The dataset is well formed but the metric is undefined over it.
struct DegenerateDataset : std::domain_error {
  explicit DegenerateDataset(const std::string& what)
      : std::domain_error(what) {}
};

// Ranking input with only one class present.
struct UndefinedCurve : DegenerateDataset {
  explicit UndefinedCurve(const std::string& what)
      : DegenerateDataset(what) {}
};

// Probability model returned a value outside (0, 1].
struct InvalidProbability : std::domain_error {
  explicit InvalidProbability(const std::string& what)
      : std::domain_error(what) {}
};

}  // namespace metrics
