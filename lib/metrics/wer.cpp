#include "metrics/wer.hpp"

#include <string>
#include <vector>

namespace metrics {

namespace {

std::vector<char> to_chars(const std::string& text) {
  return std::vector<char>(text.begin(), text.end());
}

}  // namespace

double character_error_rate(const std::string& reference,
                            const std::string& hypothesis) {
  if (reference.empty()) {
    throw InvalidInput("character_error_rate: reference string is empty");
  }
  return wer(to_chars(reference), to_chars(hypothesis));
}

double corpus_character_error_rate(const std::vector<std::string>& references,
                                   const std::vector<std::string>& hypotheses) {
  std::vector<std::vector<char>> ref_chars;
  std::vector<std::vector<char>> hyp_chars;
  ref_chars.reserve(references.size());
  hyp_chars.reserve(hypotheses.size());
  for (const auto& r : references) ref_chars.push_back(to_chars(r));
  for (const auto& h : hypotheses) hyp_chars.push_back(to_chars(h));
  return corpus_wer(ref_chars, hyp_chars);
}

}  // namespace metrics
