#pragma once

#include <cstddef>
#include <vector>

#include "metrics/errors.hpp"

namespace metrics {

struct CurvePoint {
  double x;
  double y;
  double threshold;  ///< score at which this point is reached
};

// Cumulative counts once every pair scored >= threshold is predicted
// positive.
struct ThresholdCount {
  double threshold;
  size_t true_positives;
  size_t false_positives;
};

struct ThresholdSweep {
  std::vector<ThresholdCount> steps;  ///< one per distinct score, descending
  size_t positives = 0;
  size_t negatives = 0;
};

struct RankingReport {
  std::vector<CurvePoint> roc;
  std::vector<CurvePoint> precision_recall;
  double roc_auc = 0.0;
  double average_precision = 0.0;
  size_t positives = 0;
  size_t negatives = 0;
};

/**
 * @brief Sweep the decision threshold from +inf down through every distinct
 *        score.
 *
 * Pairs are sorted by descending score. All pairs sharing a score enter at
 * the same step, so the output does not depend on the input order of ties.
 *
 * @param scores Predicted scores
 * @param labels True labels, each 0 or 1
 * @throws InvalidInput on empty or mismatched arrays, non-binary labels or
 *         NaN scores
 * @throws UndefinedCurve if either class is absent
 */
ThresholdSweep sweep_thresholds(const std::vector<double>& scores,
                                const std::vector<int>& labels);

// (false positive rate, true positive rate) per distinct score.
std::vector<CurvePoint> roc_curve(const std::vector<double>& scores,
                                  const std::vector<int>& labels);

// (recall, precision) per distinct score.
std::vector<CurvePoint> precision_recall_curve(
    const std::vector<double>& scores, const std::vector<int>& labels);

// Trapezoidal area under (0,0) + curve + (1,1).
double roc_auc(const std::vector<double>& scores,
               const std::vector<int>& labels);

// Sum of precision * recall increase over the PR steps. No interpolation.
double average_precision(const std::vector<double>& scores,
                         const std::vector<int>& labels);

// Area helpers over already-built curves.
double trapezoidal_auc(const std::vector<CurvePoint>& roc);
double step_average_precision(const std::vector<CurvePoint>& pr);

RankingReport evaluate_ranking(const std::vector<double>& scores,
                               const std::vector<int>& labels);

}  // namespace metrics
