#include "pcm.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace study::psychometrics {

namespace {

constexpr double kLogSqrtTwoPi = 0.9189385332046727;

double log_sum_exp(const std::vector<double>& values) {
  double max_value = -std::numeric_limits<double>::infinity();
  for (double v : values) {
    max_value = std::max(max_value, v);
  }
  if (!std::isfinite(max_value)) {
    return max_value;
  }
  double acc = 0.0;
  for (double v : values) {
    acc += std::exp(v - max_value);
  }
  return max_value + std::log(acc);
}

} // namespace

const std::array<double, kGridPoints>& theta_grid() {
  static const std::array<double, kGridPoints> grid = [] {
    std::array<double, kGridPoints> g{};
    const double step = (kGridMax - kGridMin) / static_cast<double>(kGridPoints - 1);
    for (std::size_t i = 0; i < kGridPoints; ++i) {
      g[i] = kGridMin + step * static_cast<double>(i);
    }
    return g;
  }();
  return grid;
}

int category_count(const ItemMetadata& item) {
  if (item.score_categories > 0) {
    return item.score_categories;
  }
  return std::max<int>(1, static_cast<int>(item.category_thresholds.size()));
}

std::vector<double> effective_thresholds(const ItemMetadata& item) {
  const int m = category_count(item);
  std::vector<double> tau(static_cast<std::size_t>(m), 0.0);
  const std::size_t n = std::min(tau.size(), item.category_thresholds.size());
  for (std::size_t j = 0; j < n; ++j) {
    tau[j] = item.category_thresholds[j];
  }
  return tau;
}

int score_to_category(double score_fraction, int categories) {
  if (categories <= 0) {
    throw std::invalid_argument("score_to_category: categories must be positive");
  }
  const double clipped = detail::clip01(score_fraction);
  return static_cast<int>(std::lround(clipped * static_cast<double>(categories)));
}

std::vector<double> category_log_probabilities(double theta, double difficulty,
                                               const std::vector<double>& thresholds) {
  std::vector<double> numerators;
  numerators.reserve(thresholds.size() + 1);
  double running = 0.0;
  numerators.push_back(running);
  for (double tau : thresholds) {
    running += theta - difficulty - tau;
    numerators.push_back(running);
  }
  const double log_z = log_sum_exp(numerators);
  for (double& v : numerators) {
    v -= log_z;
  }
  return numerators;
}

std::vector<double> category_probabilities(double theta, double difficulty,
                                           const std::vector<double>& thresholds) {
  auto probs = category_log_probabilities(theta, difficulty, thresholds);
  for (double& p : probs) {
    p = std::exp(p);
  }
  return probs;
}

double category_log_likelihood(double theta, const ItemMetadata& item, int category) {
  const auto log_probs =
      category_log_probabilities(theta, item.difficulty, effective_thresholds(item));
  if (category < 0 || static_cast<std::size_t>(category) >= log_probs.size()) {
    throw std::out_of_range("category_log_likelihood: category out of range for item " +
                            item.item_id);
  }
  return log_probs[static_cast<std::size_t>(category)];
}

double expected_score(double theta, const ItemMetadata& item) {
  const auto probs = category_probabilities(theta, item.difficulty, effective_thresholds(item));
  double mean = 0.0;
  for (std::size_t k = 0; k < probs.size(); ++k) {
    mean += probs[k] * static_cast<double>(k);
  }
  return mean;
}

double item_information(double theta, const ItemMetadata& item) {
  const auto probs = category_probabilities(theta, item.difficulty, effective_thresholds(item));
  double mean = 0.0;
  for (std::size_t k = 0; k < probs.size(); ++k) {
    mean += probs[k] * static_cast<double>(k);
  }
  double variance = 0.0;
  for (std::size_t k = 0; k < probs.size(); ++k) {
    const double d = static_cast<double>(k) - mean;
    variance += probs[k] * d * d;
  }
  return variance;
}

double normal_cdf(double z) {
  return 0.5 * std::erfc(-z / std::sqrt(2.0));
}

double normal_log_density(double x, double mean, double stddev) {
  const double z = (x - mean) / stddev;
  return -0.5 * z * z - std::log(stddev) - kLogSqrtTwoPi;
}

double elo_expected(double rating, double opponent_rating) {
  return 1.0 / (1.0 + std::pow(10.0, (opponent_rating - rating) / kEloScale));
}

double elo_to_theta(double rating) {
  return (rating - kEloBase) / kEloScale;
}

double theta_to_elo(double theta) {
  return kEloBase + kEloScale * theta;
}

} // namespace study::psychometrics
