#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace study {

struct AbilityConfig {
  double prior_sd = 0.8;
  double tightened_prior_sd = 0.6;
  int tighten_after_responses = 20;
  double elo_k = 16.0;
  int min_topic_responses = 3;       // below this the Elo estimate is used
  int min_item_calibration = 10;     // items with fewer platform responses use Elo
  double transition_elo_weight = 0.7;
  double mastery_cut = 0.0;
  double min_se = 1e-3;
  std::size_t se_history_limit = 32;  // oldest SE values are dropped beyond this
};

struct SelectorConfig {
  std::size_t top_k = 5;
  double max_median_time_sec = 360.0;
  double blueprint_window = 0.05;
  double fatigue_after_minutes = 45.0;
  double fatigue_scalar = 0.8;
  double probe_window = 0.3;
  std::size_t probe_fresh_responses = 5;
  double probe_success_score = 0.5;
  double mastery_threshold = 0.85;
  std::size_t probe_history_limit = 16;
};

struct ExposureConfig {
  double window_days = 14.0;
  int max_per_day = 1;
  int max_per_week = 2;
  double cooldown_hours = 96.0;
  double full_recovery_days = 7.0;
  double recovered_multiplier = 0.5;
  double overfamiliar_mean_score = 0.9;
  double overfamiliar_se = 0.15;
  double overfamiliar_multiplier = 0.6;

  // Blueprint drift response
  double drift_dead_zone = 0.05;
  double over_slope = 2.0;
  double over_floor = 0.2;
  double under_slope = 3.0;
  double under_cap = 1.5;
};

struct SchedulerConfig {
  double topic_cooldown_hours = 96.0;
  double cooldown_override_deficit = 0.08;
  double tie_tolerance = 0.01;
  double urgency_grace_days = 3.0;
  double urgency_scale_days = 7.0;
  double min_sample = 1e-6;

  // Arm priors follow the topic's remaining SE: mean = max(floor, se - stop_se) * scale.
  double arm_prior_scale = 0.1;
  double arm_prior_floor = 0.01;
  double arm_observation_variance = 0.01;
  double untouched_days = 14.0;

  // Topic stop rules
  double stop_se = 0.20;
  int stop_min_attempts = 12;
  std::size_t plateau_window = 5;
  double plateau_delta = 0.02;
  double mastery_threshold = 0.85;

  // Session stop rules
  double fatigue_minutes = 70.0;
  int fatigue_mastered_topics = 3;
  double fatigue_stop_index = 0.6;
};

struct RetentionConfig {
  double desired_retention = 0.9;
  double maximum_interval_days = 36500.0;
  double default_budget_fraction = 0.4;
  double extended_budget_fraction = 0.6;
  double extended_overdue_days = 7.0;
  double jump_ahead_overdue_days = 3.0;
  double overdue_boost = 0.1;
  double handoff_mastery = 0.85;
  std::size_t handoff_se_window = 3;
  // FSRS-6 default weights.
  std::vector<double> weights = {0.212,  1.2931, 2.3065, 8.2956, 6.4133, 0.8334, 3.0194,
                                 0.001,  1.8722, 0.1666, 0.796,  1.4835, 0.0614, 0.2629,
                                 1.6483, 0.6014, 1.8729, 0.5425, 0.0912, 0.0658, 0.1542};
};

struct TelemetryConfig {
  bool asynchronous = true;
  std::size_t queue_capacity = 4096;
  int max_attempts = 3;
  int retry_backoff_ms = 50;
};

struct EngineConfig {
  AbilityConfig ability;
  SelectorConfig selector;
  ExposureConfig exposure;
  SchedulerConfig scheduler;
  RetentionConfig retention;
  TelemetryConfig telemetry;
  double default_session_minutes = 60.0;
};

} // namespace study
