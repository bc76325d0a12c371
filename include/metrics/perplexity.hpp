#pragma once

#include <cmath>
#include <cstddef>
#include <functional>
#include <vector>

#include "metrics/errors.hpp"

namespace metrics {

// Probability the caller's model assigns to sequence[position]. The whole
// sequence is passed so the model may condition on the preceding context.
template <typename Token>
using ProbabilityFn =
    std::function<double(const std::vector<Token>& sequence, size_t position)>;

namespace detail {

// Keeps ProbabilityFn parameters out of template deduction so lambdas bind.
template <typename T>
struct non_deduced {
  using type = T;
};

template <typename Token>
using ProbabilityFnArg = typename non_deduced<ProbabilityFn<Token>>::type;

}  // namespace detail

// Throws InvalidProbability unless 0 < p <= 1. NaN is rejected.
void check_probability(double p);

// exp of the mean negative log over precomputed probabilities.
double perplexity_from_probabilities(const std::vector<double>& probs);

/**
 * @brief Mean negative log-likelihood (nats) of a sequence.
 * @throws InvalidInput if the sequence is empty
 * @throws InvalidProbability if the model returns a value outside (0, 1]
 */
template <typename Token>
double sequence_cross_entropy(
    const detail::ProbabilityFnArg<Token>& probability,
    const std::vector<Token>& seq) {
  if (seq.empty()) {
    throw InvalidInput("perplexity: sequence is empty");
  }
  double nll = 0.0;
  for (size_t i = 0; i < seq.size(); ++i) {
    const double p = probability(seq, i);
    check_probability(p);
    nll -= std::log(p);
  }
  return nll / static_cast<double>(seq.size());
}

// Geometric mean of 1/p over the sequence.
template <typename Token>
double sequence_perplexity(
    const detail::ProbabilityFnArg<Token>& probability,
    const std::vector<Token>& seq) {
  return std::exp(sequence_cross_entropy(probability, seq));
}

/**
 * @brief Geometric mean of per-sequence perplexities.
 *
 * Every sequence weighs the same regardless of its length.
 */
template <typename Token>
double corpus_perplexity(
    const detail::ProbabilityFnArg<Token>& probability,
    const std::vector<std::vector<Token>>& seqs) {
  if (seqs.empty()) {
    throw InvalidInput("perplexity: corpus is empty");
  }
  double log_sum = 0.0;
  for (const auto& seq : seqs) {
    log_sum += sequence_cross_entropy(probability, seq);
  }
  return std::exp(log_sum / static_cast<double>(seqs.size()));
}

}  // namespace metrics
