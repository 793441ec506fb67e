#pragma once

#include "config.hpp"
#include "item_bank.hpp"
#include "types.hpp"

#include <string>
#include <vector>

namespace study {

class AbilityModel {
public:
  struct Estimate {
    double theta = 0.0;
    double se = 0.8;
    double mastery_probability = 0.5;
    bool degenerate = false;
    std::size_t used_responses = 0;
    std::vector<std::string> missing_items;
  };

  enum class Source {
    Elo,
    Blend,
    Psychometric
  };

  struct UpdateResult {
    TopicAbilityState state;
    Source source = Source::Elo;
    bool degenerate = false;
    double theta_before = 0.0;
    double se_before = 0.0;
    double elo_theta = 0.0;
    Estimate psychometric;
  };

  explicit AbilityModel(const ItemBank& bank, AbilityConfig config = {});

  // Posterior over the fixed grid given every non-degenerate response in
  // `history`. On numerical collapse the topic's current (theta, se) is
  // returned with `degenerate` set.
  Estimate estimate(const TopicAbilityState& topic,
                    const std::vector<ResponseRecord>& history) const;

  UpdateResult update(const TopicAbilityState& topic, const ItemMetadata& item,
                      double score_fraction, TimestampMs answered_at) const;

  double mastery_probability(double theta, double se) const;

  double prior_sd(std::size_t response_count) const;

  const AbilityConfig& config() const noexcept { return config_; }

private:
  void record_se(TopicAbilityState& state) const;

  const ItemBank& bank_;
  AbilityConfig config_;
};

std::string to_string(AbilityModel::Source source);

} // namespace study
