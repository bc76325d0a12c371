#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "metrics/edit_distance.hpp"
#include "metrics/errors.hpp"

namespace metrics {

struct WerResult {
  size_t reference_length = 0;
  size_t hypothesis_length = 0;
  EditOps ops;
  double rate = 0.0;
};

// Edit distance normalised by the reference length.
template <typename Token>
double wer(const std::vector<Token>& reference,
           const std::vector<Token>& hypothesis) {
  if (reference.empty()) {
    throw InvalidInput("wer: reference sequence is empty");
  }
  return static_cast<double>(edit_distance(reference, hypothesis)) /
         static_cast<double>(reference.size());
}

template <typename Token>
WerResult wer_details(const std::vector<Token>& reference,
                      const std::vector<Token>& hypothesis) {
  if (reference.empty()) {
    throw InvalidInput("wer_details: reference sequence is empty");
  }
  WerResult result;
  result.reference_length = reference.size();
  result.hypothesis_length = hypothesis.size();
  result.ops = edit_operations(reference, hypothesis);
  result.rate = static_cast<double>(result.ops.total()) /
                static_cast<double>(reference.size());
  return result;
}

/**
 * @brief Corpus word error rate.
 *
 * Sum of per-pair edit distances over the sum of reference lengths. This is
 * not the mean of per-pair rates: long references weigh more.
 *
 * @throws InvalidInput on mismatched or empty lists, or when every
 *         reference is empty
 */
template <typename Token>
double corpus_wer(const std::vector<std::vector<Token>>& references,
                  const std::vector<std::vector<Token>>& hypotheses) {
  if (references.size() != hypotheses.size()) {
    throw InvalidInput("corpus_wer: " + std::to_string(references.size()) +
                       " references but " +
                       std::to_string(hypotheses.size()) + " hypotheses");
  }
  if (references.empty()) {
    throw InvalidInput("corpus_wer: empty corpus");
  }
  size_t edits = 0;
  size_t words = 0;
  for (size_t i = 0; i < references.size(); ++i) {
    edits += edit_distance(references[i], hypotheses[i]);
    words += references[i].size();
  }
  if (words == 0) {
    throw InvalidInput("corpus_wer: total reference length is zero");
  }
  return static_cast<double>(edits) / static_cast<double>(words);
}

// Corpus totals with the operation breakdown summed over all pairs.
template <typename Token>
WerResult corpus_wer_details(
    const std::vector<std::vector<Token>>& references,
    const std::vector<std::vector<Token>>& hypotheses) {
  if (references.size() != hypotheses.size()) {
    throw InvalidInput("corpus_wer_details: reference/hypothesis count mismatch");
  }
  WerResult result;
  for (size_t i = 0; i < references.size(); ++i) {
    const EditOps ops = edit_operations(references[i], hypotheses[i]);
    result.ops.substitutions += ops.substitutions;
    result.ops.deletions += ops.deletions;
    result.ops.insertions += ops.insertions;
    result.reference_length += references[i].size();
    result.hypothesis_length += hypotheses[i].size();
  }
  if (result.reference_length == 0) {
    throw InvalidInput("corpus_wer_details: total reference length is zero");
  }
  result.rate = static_cast<double>(result.ops.total()) /
                static_cast<double>(result.reference_length);
  return result;
}

// Character error rate: WER with every byte of the string as a token.
double character_error_rate(const std::string& reference,
                            const std::string& hypothesis);

double corpus_character_error_rate(const std::vector<std::string>& references,
                                   const std::vector<std::string>& hypotheses);

}  // namespace metrics
