#include "metrics/ranking.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

namespace metrics {

namespace {

void validate_inputs(const std::vector<double>& scores,
                     const std::vector<int>& labels) {
  if (scores.empty()) {
    throw InvalidInput("ranking: score array is empty");
  }
  if (scores.size() != labels.size()) {
    throw InvalidInput("ranking: " + std::to_string(scores.size()) +
                       " scores but " + std::to_string(labels.size()) +
                       " labels");
  }
  for (size_t i = 0; i < scores.size(); ++i) {
    if (std::isnan(scores[i])) {
      throw InvalidInput("ranking: score " + std::to_string(i) + " is NaN");
    }
    if (labels[i] != 0 && labels[i] != 1) {
      throw InvalidInput("ranking: label " + std::to_string(i) + " is " +
                         std::to_string(labels[i]) + ", expected 0 or 1");
    }
  }
}

std::vector<CurvePoint> roc_points(const ThresholdSweep& sweep) {
  const double p = static_cast<double>(sweep.positives);
  const double n = static_cast<double>(sweep.negatives);
  std::vector<CurvePoint> points;
  points.reserve(sweep.steps.size());
  for (const auto& step : sweep.steps) {
    points.push_back({static_cast<double>(step.false_positives) / n,
                      static_cast<double>(step.true_positives) / p,
                      step.threshold});
  }
  return points;
}

std::vector<CurvePoint> pr_points(const ThresholdSweep& sweep) {
  const double p = static_cast<double>(sweep.positives);
  std::vector<CurvePoint> points;
  points.reserve(sweep.steps.size());
  for (const auto& step : sweep.steps) {
    const double tp = static_cast<double>(step.true_positives);
    const double predicted =
        static_cast<double>(step.true_positives + step.false_positives);
    points.push_back({tp / p, tp / predicted, step.threshold});
  }
  return points;
}

}  // namespace

ThresholdSweep sweep_thresholds(const std::vector<double>& scores,
                                const std::vector<int>& labels) {
  validate_inputs(scores, labels);

  ThresholdSweep sweep;
  for (int label : labels) {
    if (label == 1) {
      sweep.positives++;
    } else {
      sweep.negatives++;
    }
  }
  if (sweep.positives == 0 || sweep.negatives == 0) {
    throw UndefinedCurve("ranking: need at least one positive and one "
                         "negative label (got " +
                         std::to_string(sweep.positives) + " positives, " +
                         std::to_string(sweep.negatives) + " negatives)");
  }

  std::vector<size_t> order(scores.size());
  std::iota(order.begin(), order.end(), 0);
  std::sort(order.begin(), order.end(),
            [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });

  size_t tp = 0;
  size_t fp = 0;
  size_t i = 0;
  while (i < order.size()) {
    const double threshold = scores[order[i]];
    // absorb every pair tied at this score before emitting
    while (i < order.size() && scores[order[i]] == threshold) {
      if (labels[order[i]] == 1) {
        tp++;
      } else {
        fp++;
      }
      i++;
    }
    sweep.steps.push_back({threshold, tp, fp});
  }
  return sweep;
}

std::vector<CurvePoint> roc_curve(const std::vector<double>& scores,
                                  const std::vector<int>& labels) {
  return roc_points(sweep_thresholds(scores, labels));
}

std::vector<CurvePoint> precision_recall_curve(
    const std::vector<double>& scores, const std::vector<int>& labels) {
  return pr_points(sweep_thresholds(scores, labels));
}

double trapezoidal_auc(const std::vector<CurvePoint>& roc) {
  double area = 0.0;
  double prev_x = 0.0;
  double prev_y = 0.0;
  for (const auto& point : roc) {
    area += (point.x - prev_x) * (point.y + prev_y) / 2.0;
    prev_x = point.x;
    prev_y = point.y;
  }
  area += (1.0 - prev_x) * (1.0 + prev_y) / 2.0;
  return area;
}

double step_average_precision(const std::vector<CurvePoint>& pr) {
  double ap = 0.0;
  double prev_recall = 0.0;
  for (const auto& point : pr) {
    ap += (point.x - prev_recall) * point.y;
    prev_recall = point.x;
  }
  return ap;
}

double roc_auc(const std::vector<double>& scores,
               const std::vector<int>& labels) {
  return trapezoidal_auc(roc_curve(scores, labels));
}

double average_precision(const std::vector<double>& scores,
                         const std::vector<int>& labels) {
  return step_average_precision(precision_recall_curve(scores, labels));
}

RankingReport evaluate_ranking(const std::vector<double>& scores,
                               const std::vector<int>& labels) {
  const ThresholdSweep sweep = sweep_thresholds(scores, labels);
  RankingReport report;
  report.roc = roc_points(sweep);
  report.precision_recall = pr_points(sweep);
  report.roc_auc = trapezoidal_auc(report.roc);
  report.average_precision = step_average_precision(report.precision_recall);
  report.positives = sweep.positives;
  report.negatives = sweep.negatives;
  return report;
}

}  // namespace metrics
