#pragma once

#include "study/types.hpp"

#include <array>
#include <cstddef>
#include <vector>

namespace study::psychometrics {

constexpr std::size_t kGridPoints = 41;
constexpr double kGridMin = -4.0;
constexpr double kGridMax = 4.0;

constexpr double kEloBase = 1500.0;
constexpr double kEloScale = 400.0;

// Fixed quadrature grid shared by the ability model and calibration.
const std::array<double, kGridPoints>& theta_grid();

// Step parameters tau_1..tau_m for an item; empty thresholds mean all zero.
std::vector<double> effective_thresholds(const ItemMetadata& item);

int category_count(const ItemMetadata& item);

// Nearest category, halves rounding up: 0.5 on a dichotomous item is
// category 1, matching the 0.5 success cut used for probes and reviews.
int score_to_category(double score_fraction, int categories);

// Rasch partial credit model:
//   log P(X = k | theta) = sum_{j<=k}(theta - b - tau_j) - log Z
// Returned vector has m + 1 entries (categories 0..m).
std::vector<double> category_log_probabilities(double theta, double difficulty,
                                               const std::vector<double>& thresholds);
std::vector<double> category_probabilities(double theta, double difficulty,
                                           const std::vector<double>& thresholds);

double category_log_likelihood(double theta, const ItemMetadata& item, int category);

double expected_score(double theta, const ItemMetadata& item);

// Fisher information of a Rasch-family item equals the variance of the
// category score at theta.
double item_information(double theta, const ItemMetadata& item);

double normal_cdf(double z);
double normal_log_density(double x, double mean, double stddev);

double elo_expected(double rating, double opponent_rating);
double elo_to_theta(double rating);
double theta_to_elo(double theta);

} // namespace study::psychometrics
