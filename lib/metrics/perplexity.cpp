#include "metrics/perplexity.hpp"

#include <cmath>
#include <sstream>
#include <vector>

namespace metrics {

void check_probability(double p) {
  if (p > 0.0 && p <= 1.0) return;
  std::stringstream ss;
  ss << "perplexity: model returned probability " << p
     << ", expected a value in (0, 1]";
  throw InvalidProbability(ss.str());
}

double perplexity_from_probabilities(const std::vector<double>& probs) {
  if (probs.empty()) {
    throw InvalidInput("perplexity: probability array is empty");
  }
  double nll = 0.0;
  for (double p : probs) {
    check_probability(p);
    nll -= std::log(p);
  }
  return std::exp(nll / static_cast<double>(probs.size()));
}

}  // namespace metrics
