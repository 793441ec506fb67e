#include "study/ability_model.hpp"

#include "psychometrics/pcm.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <cstddef>
#include <limits>
#include <stdexcept>

namespace study {

std::string to_string(AbilityModel::Source source) {
  switch (source) {
    case AbilityModel::Source::Elo: return "elo";
    case AbilityModel::Source::Blend: return "blend";
    case AbilityModel::Source::Psychometric: return "psychometric";
  }
  return "elo";
}

AbilityModel::AbilityModel(const ItemBank& bank, AbilityConfig config)
    : bank_(bank), config_(config) {
  if (config_.prior_sd <= 0.0 || config_.tightened_prior_sd <= 0.0) {
    throw std::invalid_argument("AbilityModel: prior standard deviations must be positive");
  }
  if (config_.min_se <= 0.0) {
    throw std::invalid_argument("AbilityModel: min_se must be positive");
  }
  if (config_.se_history_limit == 0) {
    throw std::invalid_argument("AbilityModel: se_history_limit must be positive");
  }
}

void AbilityModel::record_se(TopicAbilityState& state) const {
  state.se_history.push_back(state.se);
  if (state.se_history.size() > config_.se_history_limit) {
    const auto excess = static_cast<std::ptrdiff_t>(state.se_history.size() - config_.se_history_limit);
    state.se_history.erase(state.se_history.begin(), state.se_history.begin() + excess);
  }
}

double AbilityModel::prior_sd(std::size_t response_count) const {
  if (response_count >= static_cast<std::size_t>(config_.tighten_after_responses)) {
    return config_.tightened_prior_sd;
  }
  return config_.prior_sd;
}

double AbilityModel::mastery_probability(double theta, double se) const {
  const double denom = std::max(se, config_.min_se);
  return psychometrics::normal_cdf((theta - config_.mastery_cut) / denom);
}

AbilityModel::Estimate AbilityModel::estimate(const TopicAbilityState& topic,
                                              const std::vector<ResponseRecord>& history) const {
  const auto& grid = psychometrics::theta_grid();

  std::size_t counted = 0;
  for (const auto& record : history) {
    if (!record.degenerate) {
      ++counted;
    }
  }
  const double sd = prior_sd(counted);

  Estimate result;
  std::array<double, psychometrics::kGridPoints> log_weights{};
  for (std::size_t i = 0; i < grid.size(); ++i) {
    log_weights[i] = psychometrics::normal_log_density(grid[i], topic.prior_mean, sd);
  }

  for (const auto& record : history) {
    if (record.degenerate) {
      continue;
    }
    const ItemMetadata* item = bank_.find(record.item_id);
    if (!item) {
      result.missing_items.push_back(record.item_id);
      continue;
    }
    const int m = psychometrics::category_count(*item);
    const int category = std::min(record.category, m);
    const auto tau = psychometrics::effective_thresholds(*item);
    for (std::size_t i = 0; i < grid.size(); ++i) {
      const auto log_probs =
          psychometrics::category_log_probabilities(grid[i], item->difficulty, tau);
      log_weights[i] += log_probs[static_cast<std::size_t>(category)];
    }
    ++result.used_responses;
  }

  double max_log = -std::numeric_limits<double>::infinity();
  bool has_nan = false;
  for (double lw : log_weights) {
    if (std::isnan(lw)) {
      has_nan = true;
    }
    max_log = std::max(max_log, lw);
  }

  auto degenerate = [&]() {
    result.theta = topic.theta;
    result.se = std::max(topic.se, config_.min_se);
    result.mastery_probability = mastery_probability(result.theta, result.se);
    result.degenerate = true;
    return result;
  };

  if (has_nan || !std::isfinite(max_log)) {
    return degenerate();
  }

  double total = 0.0;
  double mean = 0.0;
  std::array<double, psychometrics::kGridPoints> weights{};
  for (std::size_t i = 0; i < grid.size(); ++i) {
    weights[i] = std::exp(log_weights[i] - max_log);
    total += weights[i];
    mean += weights[i] * grid[i];
  }
  if (!(total > 0.0) || !std::isfinite(total)) {
    return degenerate();
  }
  mean /= total;

  double variance = 0.0;
  for (std::size_t i = 0; i < grid.size(); ++i) {
    const double d = grid[i] - mean;
    variance += (weights[i] / total) * d * d;
  }
  if (!std::isfinite(mean) || !std::isfinite(variance)) {
    return degenerate();
  }

  result.theta = mean;
  result.se = std::max(config_.min_se, std::sqrt(variance));
  result.mastery_probability = mastery_probability(result.theta, result.se);
  return result;
}

AbilityModel::UpdateResult AbilityModel::update(const TopicAbilityState& topic,
                                                const ItemMetadata& item,
                                                double score_fraction,
                                                TimestampMs answered_at) const {
  if (item.topic_id != topic.topic_id) {
    throw std::invalid_argument("AbilityModel::update item '" + item.item_id +
                                "' does not belong to topic '" + topic.topic_id + "'");
  }

  UpdateResult result;
  result.state = topic;
  result.theta_before = topic.theta;
  result.se_before = topic.se;

  auto& state = result.state;
  const int m = psychometrics::category_count(item);

  ResponseRecord record;
  record.item_id = item.item_id;
  record.score_fraction = detail::clip01(score_fraction);
  record.category = psychometrics::score_to_category(record.score_fraction, m);
  record.categories = m;
  record.answered_at = answered_at;
  state.responses.push_back(record);
  state.response_count += 1;
  state.last_practiced_at = answered_at;

  result.psychometric = estimate(state, state.responses);
  if (result.psychometric.degenerate) {
    state.responses.back().degenerate = true;
    record_se(state);
    result.degenerate = true;
    result.source = state.psychometric_active ? Source::Psychometric : Source::Elo;
    result.elo_theta = psychometrics::elo_to_theta(state.elo_rating);
    return result;
  }

  const double item_rating = psychometrics::theta_to_elo(item.difficulty);
  const double expected = psychometrics::elo_expected(state.elo_rating, item_rating);
  state.elo_rating += config_.elo_k * (record.score_fraction - expected);
  result.elo_theta = psychometrics::elo_to_theta(state.elo_rating);

  const bool psychometric_eligible =
      state.response_count >= config_.min_topic_responses &&
      item.calibration_count >= config_.min_item_calibration;

  double theta = result.elo_theta;
  if (!psychometric_eligible) {
    result.source = Source::Elo;
  } else if (!state.psychometric_active) {
    const double w = config_.transition_elo_weight;
    theta = w * result.elo_theta + (1.0 - w) * result.psychometric.theta;
    state.psychometric_active = true;
    result.source = Source::Blend;
  } else {
    theta = result.psychometric.theta;
    result.source = Source::Psychometric;
  }

  state.theta = theta;
  state.se = std::max(config_.min_se, result.psychometric.se);
  record_se(state);
  return result;
}

} // namespace study
