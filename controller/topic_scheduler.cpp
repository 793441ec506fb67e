#include "study/topic_scheduler.hpp"

#include "../src/rng.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace study {

namespace {

constexpr double kDefaultSe = 0.8;

double days_since_practice(const TopicAbilityState* state, TimestampMs now) {
  if (!state || state->last_practiced_at <= 0) {
    return std::numeric_limits<double>::infinity();
  }
  return std::max(0.0, detail::days_between(state->last_practiced_at, now));
}

double topic_se(const TopicAbilityState* state) {
  return state ? state->se : kDefaultSe;
}

} // namespace

std::string to_string(TopicStopReason reason) {
  switch (reason) {
    case TopicStopReason::SeTarget: return "se_target";
    case TopicStopReason::SePlateau: return "se_plateau";
    case TopicStopReason::Mastery: return "mastery";
  }
  return "se_target";
}

std::string to_string(SessionStopReason reason) {
  switch (reason) {
    case SessionStopReason::Fatigue: return "fatigue";
    case SessionStopReason::TimeBudget: return "time_budget";
    case SessionStopReason::ItemLimit: return "item_limit";
    case SessionStopReason::BlueprintSatisfied: return "blueprint_satisfied";
    case SessionStopReason::Exhausted: return "exhausted";
    case SessionStopReason::Requested: return "requested";
  }
  return "requested";
}

TopicScheduler::TopicScheduler(const ExposureController& exposure, SchedulerConfig config)
    : exposure_(exposure), config_(config) {
  if (config_.arm_observation_variance <= 0.0) {
    throw std::invalid_argument("TopicScheduler: observation variance must be positive");
  }
  if (config_.min_sample <= 0.0) {
    throw std::invalid_argument("TopicScheduler: min_sample must be positive");
  }
  if (config_.plateau_window < 2) {
    throw std::invalid_argument("TopicScheduler: plateau_window must cover at least two values");
  }
}

SchedulerArm TopicScheduler::initial_arm(const std::string& topic_id,
                                         const TopicAbilityState* state,
                                         const TopicHistory* history,
                                         TimestampMs now) const {
  const double se = topic_se(state);
  const double prior_sd = (0.3 + 0.2 * se) * config_.arm_prior_scale;

  SchedulerArm arm;
  arm.topic_id = topic_id;
  arm.mean = std::max(config_.arm_prior_floor, se - config_.stop_se) * config_.arm_prior_scale;
  arm.variance = prior_sd * prior_sd;

  // History older than the untouched horizon no longer describes the learner.
  const double idle_days = days_since_practice(state, now);
  const bool stale = std::isfinite(idle_days) && idle_days > config_.untouched_days;
  if (history && history->observations > 0 && !stale &&
      std::isfinite(history->mean_delta_se_per_min)) {
    const double n = static_cast<double>(history->observations);
    const double precision = 1.0 / arm.variance + n / config_.arm_observation_variance;
    arm.mean = (arm.mean / arm.variance +
                n * history->mean_delta_se_per_min / config_.arm_observation_variance) /
               precision;
    arm.variance = 1.0 / precision;
    arm.observations = history->observations;
  }
  return arm;
}

void TopicScheduler::observe(SchedulerArm& arm, double delta_se_per_minute) const {
  if (!std::isfinite(delta_se_per_minute)) {
    return;
  }
  const double precision = 1.0 / arm.variance + 1.0 / config_.arm_observation_variance;
  arm.mean = (arm.mean / arm.variance + delta_se_per_minute / config_.arm_observation_variance) /
             precision;
  arm.variance = 1.0 / precision;
  arm.observations += 1;
}

double TopicScheduler::urgency(const TopicAbilityState* state, TimestampMs now) const {
  const double days = days_since_practice(state, now);
  if (!std::isfinite(days)) {
    return 1.0;
  }
  return 1.0 + std::max(0.0, days - config_.urgency_grace_days) / config_.urgency_scale_days;
}

bool TopicScheduler::cooling_down(const TopicAbilityState* state, TimestampMs now) const {
  return state && state->cooldown_until && now < *state->cooldown_until;
}

TimestampMs TopicScheduler::cooldown_until(TimestampMs now) const {
  return now + static_cast<TimestampMs>(config_.topic_cooldown_hours * kMsPerHour);
}

std::optional<TopicChoice> TopicScheduler::choose_next_topic(
    const std::map<std::string, SchedulerArm>& arms, const std::vector<TopicStats>& topics,
    const SessionShareTracker& shares, TimestampMs now, std::uint64_t& rng_state) const {
  std::vector<const TopicStats*> ordered;
  for (const auto& t : topics) {
    ordered.push_back(&t);
  }
  std::sort(ordered.begin(), ordered.end(),
            [](const TopicStats* a, const TopicStats* b) { return a->topic_id < b->topic_id; });

  std::vector<TopicCandidate> candidates;
  std::map<std::string, const TopicStats*> by_id;
  for (const TopicStats* stats : ordered) {
    by_id[stats->topic_id] = stats;
    if (stats->exhausted) {
      continue;
    }
    const double deficit = exposure_.blueprint_gap(shares, BlueprintLevel::Topic, stats->topic_id);
    if (cooling_down(stats->state, now) && deficit <= config_.cooldown_override_deficit) {
      continue;
    }
    if (!exposure_.within_window(shares, BlueprintLevel::Topic, stats->topic_id)) {
      continue;
    }

    SchedulerArm arm;
    auto it = arms.find(stats->topic_id);
    if (it != arms.end()) {
      arm = it->second;
    } else {
      arm = initial_arm(stats->topic_id, stats->state, nullptr, now);
    }

    TopicCandidate candidate;
    candidate.topic_id = stats->topic_id;
    candidate.deficit = deficit;
    candidate.sampled_delta = std::max(
        config_.min_sample, rand_normal(rng_state, arm.mean, std::sqrt(std::max(0.0, arm.variance))));
    candidate.urgency = urgency(stats->state, now);
    candidate.blueprint_multiplier =
        exposure_.blueprint_multiplier(shares, BlueprintLevel::Topic, stats->topic_id);
    candidate.score = candidate.sampled_delta * candidate.urgency * candidate.blueprint_multiplier;
    candidates.push_back(candidate);
  }

  auto expected_delta = [&](const std::string& topic_id) {
    auto it = arms.find(topic_id);
    if (it != arms.end()) {
      return it->second.mean;
    }
    return initial_arm(topic_id, by_id[topic_id]->state, nullptr, now).mean;
  };

  if (candidates.empty()) {
    const TopicStats* lowest = nullptr;
    double lowest_share = std::numeric_limits<double>::infinity();
    for (const TopicStats* stats : ordered) {
      if (stats->exhausted) {
        continue;
      }
      const double share = shares.share(BlueprintLevel::Topic, stats->topic_id);
      if (share < lowest_share) {
        lowest_share = share;
        lowest = stats;
      }
    }
    if (!lowest) {
      return std::nullopt;
    }
    TopicChoice choice;
    choice.topic_id = lowest->topic_id;
    choice.fallback = true;
    choice.expected_delta_se = expected_delta(lowest->topic_id);
    choice.urgency = urgency(lowest->state, now);
    choice.blueprint_multiplier =
        exposure_.blueprint_multiplier(shares, BlueprintLevel::Topic, lowest->topic_id);
    choice.deficit = exposure_.blueprint_gap(shares, BlueprintLevel::Topic, lowest->topic_id);
    return choice;
  }

  double best = 0.0;
  for (const auto& c : candidates) {
    best = std::max(best, c.score);
  }
  std::vector<const TopicCandidate*> tied;
  for (const auto& c : candidates) {
    if (c.score >= best * (1.0 - config_.tie_tolerance)) {
      tied.push_back(&c);
    }
  }
  std::sort(tied.begin(), tied.end(), [&](const TopicCandidate* a, const TopicCandidate* b) {
    if (a->deficit != b->deficit) {
      return a->deficit > b->deficit;
    }
    const double se_a = topic_se(by_id[a->topic_id]->state);
    const double se_b = topic_se(by_id[b->topic_id]->state);
    if (se_a != se_b) {
      return se_a > se_b;
    }
    const double days_a = days_since_practice(by_id[a->topic_id]->state, now);
    const double days_b = days_since_practice(by_id[b->topic_id]->state, now);
    if (days_a != days_b) {
      return days_a > days_b;
    }
    return a->topic_id < b->topic_id;
  });

  const TopicCandidate& winner = *tied.front();
  TopicChoice choice;
  choice.topic_id = winner.topic_id;
  choice.score = winner.score;
  choice.expected_delta_se = expected_delta(winner.topic_id);
  choice.urgency = winner.urgency;
  choice.blueprint_multiplier = winner.blueprint_multiplier;
  choice.deficit = winner.deficit;
  choice.candidates = std::move(candidates);
  return choice;
}

std::optional<TopicStopReason> TopicScheduler::evaluate_topic_stop(
    const TopicAbilityState& state, double mastery_probability, bool fresh_successful_probe) const {
  if (state.response_count < config_.stop_min_attempts) {
    return std::nullopt;
  }
  if (state.se <= config_.stop_se) {
    return TopicStopReason::SeTarget;
  }
  const auto& history = state.se_history;
  // Plateau: mean |step| over the last `plateau_window` SE values.
  if (history.size() >= config_.plateau_window) {
    const std::size_t first = history.size() - config_.plateau_window;
    double total_change = 0.0;
    for (std::size_t i = first + 1; i < history.size(); ++i) {
      total_change += std::fabs(history[i] - history[i - 1]);
    }
    const double mean_change = total_change / static_cast<double>(config_.plateau_window - 1);
    if (mean_change < config_.plateau_delta) {
      return TopicStopReason::SePlateau;
    }
  }
  if (mastery_probability >= config_.mastery_threshold && fresh_successful_probe) {
    return TopicStopReason::Mastery;
  }
  return std::nullopt;
}

double TopicScheduler::fatigue_index(double elapsed_minutes, int mastered_topics) const {
  const double time_load = std::max(0.0, elapsed_minutes) / config_.fatigue_minutes;
  const double mastery_load =
      static_cast<double>(std::max(0, mastered_topics)) / config_.fatigue_mastered_topics;
  return 0.6 * std::max(time_load, mastery_load);
}

bool TopicScheduler::fatigued(double elapsed_minutes, int mastered_topics) const {
  return fatigue_index(elapsed_minutes, mastered_topics) >= config_.fatigue_stop_index - 1e-12;
}

} // namespace study
