#include "metrics/bleu.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <string>
#include <vector>

namespace {

using Words = std::vector<std::string>;
using RefSet = std::vector<Words>;

const Words kCatSat = {"the", "cat", "sat", "on", "the", "mat"};
const Words kCatIs = {"the", "cat", "is", "on", "the", "mat"};

metrics::BleuConfig order(int n) {
  metrics::BleuConfig config;
  config.max_order = n;
  return config;
}

}  // namespace

TEST(BrevityPenalty, Cases) {
  EXPECT_DOUBLE_EQ(metrics::brevity_penalty(10, 5), 1.0);
  EXPECT_DOUBLE_EQ(metrics::brevity_penalty(5, 5), 1.0);
  EXPECT_DOUBLE_EQ(metrics::brevity_penalty(5, 10), std::exp(-1.0));
  EXPECT_DOUBLE_EQ(metrics::brevity_penalty(0, 5), 0.0);
}

TEST(ClosestReferenceLength, TiesGoToShorter) {
  EXPECT_EQ(metrics::closest_reference_length(5, {3, 7}), 3u);
  EXPECT_EQ(metrics::closest_reference_length(5, {8, 4}), 4u);
  EXPECT_EQ(metrics::closest_reference_length(5, {9, 5, 2}), 5u);
  EXPECT_THROW(metrics::closest_reference_length(5, {}),
               metrics::InvalidInput);
}

TEST(Bleu, IdenticalCandidateScoresOne) {
  std::vector<Words> candidates = {kCatSat, {"a", "b", "c", "d", "e"}};
  std::vector<RefSet> refs = {{kCatSat}, {{"a", "b", "c", "d", "e"}}};
  EXPECT_DOUBLE_EQ(metrics::corpus_bleu(candidates, refs), 1.0);
}

TEST(Bleu, ZeroFourGramPrecisionClampsToZero) {
  std::vector<Words> candidates = {kCatSat};
  std::vector<RefSet> refs = {{kCatIs}};
  const auto details = metrics::corpus_bleu_details(
      std::vector<metrics::BleuPair<std::string>>{{kCatSat, {kCatIs}}});
  EXPECT_DOUBLE_EQ(metrics::corpus_bleu(candidates, refs), 0.0);
  EXPECT_DOUBLE_EQ(details.score, 0.0);
  EXPECT_FALSE(std::isnan(details.score));
  ASSERT_EQ(details.precisions.size(), 4u);
  EXPECT_DOUBLE_EQ(details.precisions[0], 5.0 / 6.0);
  EXPECT_DOUBLE_EQ(details.precisions[1], 3.0 / 5.0);
  EXPECT_DOUBLE_EQ(details.precisions[2], 1.0 / 4.0);
  EXPECT_DOUBLE_EQ(details.precisions[3], 0.0);
}

TEST(Bleu, TrigramScoreIsGeometricMean) {
  std::vector<Words> candidates = {kCatSat};
  std::vector<RefSet> refs = {{kCatIs}};
  // (5/6 * 3/5 * 1/4)^(1/3) = (1/8)^(1/3)
  EXPECT_NEAR(metrics::corpus_bleu(candidates, refs, order(3)), 0.5, 1e-12);
}

TEST(Bleu, ZeroWeightOrderIsSkipped) {
  std::vector<Words> candidates = {kCatSat};
  std::vector<RefSet> refs = {{kCatIs}};
  metrics::BleuConfig config;
  config.weights = {1.0 / 3.0, 1.0 / 3.0, 1.0 / 3.0, 0.0};
  EXPECT_NEAR(metrics::corpus_bleu(candidates, refs, config), 0.5, 1e-12);
}

TEST(Bleu, EpsilonFloorSmoothing) {
  std::vector<Words> candidates = {kCatSat};
  std::vector<RefSet> refs = {{kCatIs}};
  metrics::BleuConfig config;
  config.smoothing = metrics::BleuSmoothing::EpsilonFloor;
  config.epsilon = 0.1;
  const double expected =
      std::pow(5.0 / 6.0 * 3.0 / 5.0 * 1.0 / 4.0 * (0.1 / 3.0), 0.25);
  const double score = metrics::corpus_bleu(candidates, refs, config);
  EXPECT_NEAR(score, expected, 1e-12);
  EXPECT_GT(score, 0.0);
  EXPECT_LT(score, 1.0);
}

TEST(Bleu, CandidatesShorterThanMaxOrderScoreZero) {
  std::vector<Words> candidates = {{"a", "b"}, {"c", "d", "e"}};
  std::vector<RefSet> refs = {{{"a", "b"}}, {{"c", "d", "e"}}};
  const auto details = metrics::corpus_bleu_details(
      std::vector<metrics::BleuPair<std::string>>{
          {candidates[0], refs[0]}, {candidates[1], refs[1]}});
  ASSERT_EQ(details.precisions.size(), 4u);
  EXPECT_DOUBLE_EQ(details.precisions[3], 0.0);
  EXPECT_DOUBLE_EQ(details.score, 0.0);
  EXPECT_DOUBLE_EQ(metrics::corpus_bleu(candidates, refs), 0.0);
}

TEST(Bleu, EpsilonFloorCoversOrdersWithoutNGrams) {
  metrics::BleuConfig config;
  config.smoothing = metrics::BleuSmoothing::EpsilonFloor;
  config.epsilon = 0.1;
  const auto details = metrics::corpus_bleu_details(
      std::vector<metrics::BleuPair<std::string>>{
          {{"a", "b"}, {{"a", "b"}}}},
      config);
  ASSERT_EQ(details.precisions.size(), 4u);
  EXPECT_DOUBLE_EQ(details.precisions[0], 1.0);
  EXPECT_DOUBLE_EQ(details.precisions[1], 1.0);
  EXPECT_DOUBLE_EQ(details.precisions[2], 0.1);
  EXPECT_DOUBLE_EQ(details.precisions[3], 0.1);
  EXPECT_NEAR(details.score, std::sqrt(0.1), 1e-12);
}

TEST(Bleu, ShortCandidateIsPenalised) {
  std::vector<Words> candidates = {{"the", "cat"}};
  std::vector<RefSet> refs = {{kCatSat}};
  EXPECT_NEAR(metrics::corpus_bleu(candidates, refs, order(2)), std::exp(-2.0),
              1e-12);
}

TEST(Bleu, CorpusPrecisionAggregatesCounts) {
  std::vector<Words> candidates = {{"a", "b", "c", "d"}, kCatSat};
  std::vector<RefSet> refs = {{{"a", "b", "c", "d"}}, {kCatIs}};
  // unigrams 9/10, bigrams 6/8, trigrams 3/6, c == r == 10
  const double corpus = metrics::corpus_bleu(candidates, refs, order(3));
  EXPECT_NEAR(corpus, std::cbrt(0.9 * 0.75 * 0.5), 1e-12);

  const double mean =
      (metrics::sentence_bleu(candidates[0], refs[0], order(3)) +
       metrics::sentence_bleu(candidates[1], refs[1], order(3))) /
      2.0;
  EXPECT_NEAR(mean, 0.75, 1e-12);
  EXPECT_GT(std::abs(corpus - mean), 1e-3);
}

TEST(Bleu, StatsAccumulate) {
  metrics::BleuStats stats(2);
  stats.add(kCatSat, RefSet{kCatIs});
  stats.add(Words{"the", "mat"}, RefSet{{"a", "mat"}, {"the", "mat", "x"}});
  EXPECT_EQ(stats.sentences, 2u);
  EXPECT_EQ(stats.candidate_length, 8u);
  // closest to 2 among {2, 3} is 2
  EXPECT_EQ(stats.reference_length, 8u);
  EXPECT_EQ(stats.matches[0], 7u);
  EXPECT_EQ(stats.totals[0], 8u);
  EXPECT_EQ(stats.matches[1], 4u);
  EXPECT_EQ(stats.totals[1], 6u);
}

TEST(Bleu, PairFormMatchesParallelForm) {
  std::vector<metrics::BleuPair<std::string>> dataset = {
      {kCatSat, {kCatIs, {"a", "cat", "sat", "on", "a", "mat"}}},
      {{"a", "b", "c"}, {{"a", "b", "c", "d"}}},
  };
  std::vector<Words> candidates;
  std::vector<RefSet> refs;
  for (const auto& pair : dataset) {
    candidates.push_back(pair.first);
    refs.push_back(pair.second);
  }
  EXPECT_DOUBLE_EQ(metrics::corpus_bleu(dataset, order(2)),
                   metrics::corpus_bleu(candidates, refs, order(2)));
}

TEST(Bleu, IntegerTokens) {
  std::vector<std::vector<int>> candidates = {{1, 2, 3, 4, 5}};
  std::vector<std::vector<std::vector<int>>> refs = {{{1, 2, 3, 4, 5}}};
  EXPECT_DOUBLE_EQ(metrics::corpus_bleu(candidates, refs), 1.0);
}

TEST(Bleu, ZeroCandidateLengthIsDegenerate) {
  std::vector<Words> candidates = {{}, {}};
  std::vector<RefSet> refs = {{{"a"}}, {{"b"}}};
  EXPECT_THROW(metrics::corpus_bleu(candidates, refs),
               metrics::DegenerateDataset);
}

TEST(Bleu, InvalidInputs) {
  std::vector<Words> candidates = {kCatSat};
  std::vector<RefSet> no_refs = {{}};
  EXPECT_THROW(metrics::corpus_bleu(candidates, no_refs),
               metrics::InvalidInput);

  std::vector<Words> none;
  std::vector<RefSet> none_refs;
  EXPECT_THROW(metrics::corpus_bleu(none, none_refs), metrics::InvalidInput);

  std::vector<RefSet> two_refs = {{kCatIs}, {kCatIs}};
  EXPECT_THROW(metrics::corpus_bleu(candidates, two_refs),
               metrics::InvalidInput);

  std::vector<RefSet> refs = {{kCatIs}};
  metrics::BleuConfig bad_weights;
  bad_weights.weights = {0.5, 0.5};
  EXPECT_THROW(metrics::corpus_bleu(candidates, refs, bad_weights),
               metrics::InvalidInput);

  EXPECT_THROW(metrics::corpus_bleu(candidates, refs, order(0)),
               metrics::InvalidInput);

  metrics::BleuConfig infinite_weight;
  infinite_weight.weights = {std::numeric_limits<double>::infinity(), 0.0,
                             0.0, 0.0};
  EXPECT_THROW(metrics::corpus_bleu(candidates, refs, infinite_weight),
               metrics::InvalidInput);

  metrics::BleuConfig zero_weights;
  zero_weights.weights = {0.0, 0.0, 0.0, 0.0};
  std::vector<Words> unrelated = {{"x", "y", "z", "w"}};
  std::vector<RefSet> unrelated_refs = {{{"a", "b", "c", "d"}}};
  EXPECT_THROW(metrics::corpus_bleu(unrelated, unrelated_refs, zero_weights),
               metrics::InvalidInput);

  metrics::BleuConfig bad_epsilon;
  bad_epsilon.smoothing = metrics::BleuSmoothing::EpsilonFloor;
  bad_epsilon.epsilon = 0.0;
  EXPECT_THROW(metrics::corpus_bleu(candidates, refs, bad_epsilon),
               metrics::InvalidInput);
}

TEST(Bleu, StatsOrderMustMatchConfig) {
  metrics::BleuStats stats(2);
  stats.add(kCatSat, RefSet{kCatSat});
  EXPECT_THROW(metrics::compute_bleu(stats, order(4)), metrics::InvalidInput);
  EXPECT_DOUBLE_EQ(metrics::compute_bleu(stats, order(2)).score, 1.0);
}
