#include "metrics/bleu.hpp"

#include <cmath>
#include <string>
#include <vector>

namespace metrics {

void BleuConfig::validate() const {
  if (max_order < 1) {
    throw InvalidInput("bleu: max_order must be at least 1, got " +
                       std::to_string(max_order));
  }
  if (!weights.empty() && weights.size() != static_cast<size_t>(max_order)) {
    throw InvalidInput("bleu: expected " + std::to_string(max_order) +
                       " weights, got " + std::to_string(weights.size()));
  }
  double weight_sum = 0.0;
  for (double w : weights) {
    if (!std::isfinite(w) || w < 0.0) {
      throw InvalidInput("bleu: weights must be finite and non-negative");
    }
    weight_sum += w;
  }
  if (!weights.empty() && !(weight_sum > 0.0)) {
    throw InvalidInput("bleu: at least one weight must be positive");
  }
  if (smoothing == BleuSmoothing::EpsilonFloor &&
      !(epsilon > 0.0 && epsilon <= 1.0)) {
    throw InvalidInput("bleu: epsilon must lie in (0, 1]");
  }
}

std::vector<double> BleuConfig::effective_weights() const {
  validate();
  if (!weights.empty()) return weights;
  return std::vector<double>(max_order, 1.0 / max_order);
}

BleuStats::BleuStats(int max_order) {
  if (max_order < 1) {
    throw InvalidInput("bleu: max_order must be at least 1, got " +
                       std::to_string(max_order));
  }
  matches.assign(max_order, 0);
  totals.assign(max_order, 0);
}

size_t closest_reference_length(size_t candidate_length,
                                const std::vector<size_t>& reference_lengths) {
  if (reference_lengths.empty()) {
    throw InvalidInput("bleu: reference set is empty");
  }
  auto distance = [candidate_length](size_t len) {
    return len > candidate_length ? len - candidate_length
                                  : candidate_length - len;
  };
  size_t best = reference_lengths[0];
  for (size_t len : reference_lengths) {
    const size_t d = distance(len);
    const size_t best_d = distance(best);
    if (d < best_d || (d == best_d && len < best)) best = len;
  }
  return best;
}

double brevity_penalty(size_t candidate_length, size_t reference_length) {
  if (candidate_length == 0) return 0.0;
  if (candidate_length > reference_length) return 1.0;
  return std::exp(1.0 - static_cast<double>(reference_length) /
                            static_cast<double>(candidate_length));
}

BleuResult compute_bleu(const BleuStats& stats, const BleuConfig& config) {
  const auto weights = config.effective_weights();
  if (stats.max_order() != config.max_order) {
    throw InvalidInput("bleu: statistics collected up to order " +
                       std::to_string(stats.max_order()) +
                       " but config asks for " +
                       std::to_string(config.max_order));
  }
  if (stats.candidate_length == 0) {
    throw DegenerateDataset("bleu: total candidate length is zero");
  }

  BleuResult result;
  result.candidate_length = stats.candidate_length;
  result.reference_length = stats.reference_length;
  result.brevity_penalty =
      brevity_penalty(stats.candidate_length, stats.reference_length);

  const bool smooth = config.smoothing == BleuSmoothing::EpsilonFloor;
  result.precisions.reserve(weights.size());
  for (size_t n = 0; n < weights.size(); ++n) {
    const double total = static_cast<double>(stats.totals[n]);
    double matched = static_cast<double>(stats.matches[n]);
    if (matched == 0.0 && smooth) matched = config.epsilon;
    if (total == 0.0) {
      result.precisions.push_back(smooth ? config.epsilon : 0.0);
    } else {
      result.precisions.push_back(matched / total);
    }
  }

  // log(0) would be -inf; a zero precision on a weighted order makes the
  // geometric mean exactly 0.
  double log_sum = 0.0;
  for (size_t n = 0; n < weights.size(); ++n) {
    if (weights[n] == 0.0) continue;
    if (result.precisions[n] <= 0.0) {
      result.score = 0.0;
      return result;
    }
    log_sum += weights[n] * std::log(result.precisions[n]);
  }
  result.score = result.brevity_penalty * std::exp(log_sum);
  return result;
}

}  // namespace metrics
