#include <chrono>
#include <cmath>
#include <cstddef>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "metrics/bleu.hpp"
#include "metrics/edit_distance.hpp"
#include "metrics/ranking.hpp"

namespace {

using clock = std::chrono::steady_clock;

volatile double sink = 0.0;

std::vector<int> random_tokens(size_t n, int vocab, std::mt19937& rng) {
  std::uniform_int_distribution<int> dist(0, vocab - 1);
  std::vector<int> out(n);
  for (auto& t : out) t = dist(rng);
  return out;
}

template <typename Fn>
double time_ms(Fn&& fn, int iterations) {
  auto start = clock::now();
  for (int i = 0; i < iterations; ++i) fn();
  auto end = clock::now();
  return std::chrono::duration<double, std::milli>(end - start).count() /
         iterations;
}

void run_edit_distance_suite(size_t length, int iterations) {
  std::mt19937 rng(42);
  auto a = random_tokens(length, 50, rng);
  auto b = random_tokens(length, 50, rng);
  double distance_ms = time_ms(
      [&] { sink = static_cast<double>(metrics::edit_distance(a, b)); },
      iterations);
  double ops_ms = time_ms(
      [&] {
        sink = static_cast<double>(metrics::edit_operations(a, b).total());
      },
      iterations);
  std::cout << "== edit_distance (N=" << length << ", iters=" << iterations
            << ") ==" << std::endl;
  std::cout << std::left << std::setw(18) << "two-row" << distance_ms
            << " ms" << std::endl;
  std::cout << std::left << std::setw(18) << "full + backtrace" << ops_ms
            << " ms" << std::endl
            << std::endl;
}

void run_bleu_suite(size_t sentences, size_t length, int iterations) {
  std::mt19937 rng(7);
  std::vector<std::vector<int>> candidates;
  std::vector<std::vector<std::vector<int>>> references;
  for (size_t i = 0; i < sentences; ++i) {
    candidates.push_back(random_tokens(length, 20, rng));
    references.push_back({random_tokens(length, 20, rng),
                          random_tokens(length + 3, 20, rng)});
  }
  metrics::BleuConfig config;
  config.smoothing = metrics::BleuSmoothing::EpsilonFloor;
  double ms = time_ms(
      [&] { sink = metrics::corpus_bleu(candidates, references, config); },
      iterations);
  std::cout << "== corpus_bleu (sentences=" << sentences
            << ", len=" << length << ", iters=" << iterations << ") =="
            << std::endl;
  std::cout << ms << " ms" << std::endl << std::endl;
}

void run_ranking_suite(size_t n, int iterations) {
  std::mt19937 rng(99);
  std::uniform_real_distribution<double> score(0.0, 1.0);
  std::bernoulli_distribution label(0.3);
  std::vector<double> scores(n);
  std::vector<int> labels(n);
  for (size_t i = 0; i < n; ++i) {
    labels[i] = label(rng) ? 1 : 0;
    // coarse scores so that ties are common
    scores[i] = std::round(score(rng) * 100.0) / 100.0 + 0.2 * labels[i];
  }
  labels[0] = 1;
  labels[1] = 0;
  double ms = time_ms(
      [&] { sink = metrics::evaluate_ranking(scores, labels).roc_auc; },
      iterations);
  std::cout << "== evaluate_ranking (N=" << n << ", iters=" << iterations
            << ") ==" << std::endl;
  std::cout << ms << " ms" << std::endl << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
  size_t length = 512;
  int iterations = 20;
  if (argc > 1) length = static_cast<size_t>(std::stoul(argv[1]));
  if (argc > 2) iterations = std::stoi(argv[2]);

  run_edit_distance_suite(length, iterations);
  run_bleu_suite(1000, 25, iterations);
  run_ranking_suite(1 << 18, iterations);

  return 0;
}
