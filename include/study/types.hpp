#pragma once

#include <algorithm>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace study {

using TimestampMs = std::int64_t;

constexpr TimestampMs kMsPerMinute = 60LL * 1000LL;
constexpr TimestampMs kMsPerHour = 60LL * kMsPerMinute;
constexpr TimestampMs kMsPerDay = 24LL * kMsPerHour;

namespace detail {

inline double clip01(double value) {
  return std::clamp(value, 0.0, 1.0);
}

inline double hours_between(TimestampMs from, TimestampMs to) {
  return static_cast<double>(to - from) / static_cast<double>(kMsPerHour);
}

inline double days_between(TimestampMs from, TimestampMs to) {
  return static_cast<double>(to - from) / static_cast<double>(kMsPerDay);
}

} // namespace detail

// Recoverable conditions. None of them terminates a session.
enum class EngineIssue {
  DegenerateLikelihood,
  NoEligibleItem,
  NoEligibleTopic,
  MissingItemMetadata,
  TelemetryWriteFailure
};

inline std::string to_string(EngineIssue issue) {
  switch (issue) {
    case EngineIssue::DegenerateLikelihood: return "degenerate_likelihood";
    case EngineIssue::NoEligibleItem: return "no_eligible_item";
    case EngineIssue::NoEligibleTopic: return "no_eligible_topic";
    case EngineIssue::MissingItemMetadata: return "missing_item_metadata";
    case EngineIssue::TelemetryWriteFailure: return "telemetry_write_failure";
  }
  return "unknown";
}

//-----------------------------------------------------------------
// ITEM BANK INPUT
//-----------------------------------------------------------------
struct ItemMetadata {
  std::string item_id;
  std::string topic_id;
  std::string system_id;
  double difficulty = 0.0;
  std::vector<double> category_thresholds;
  double median_time_sec = 60.0;
  int score_categories = 1;
  int calibration_count = 0;
};

enum class BlueprintLevel {
  Topic,
  System
};

inline std::string to_string(BlueprintLevel level) {
  switch (level) {
    case BlueprintLevel::Topic: return "topic";
    case BlueprintLevel::System: return "system";
  }
  return "topic";
}

struct BlueprintTarget {
  BlueprintLevel level = BlueprintLevel::Topic;
  std::string key;
  double target_share = 0.0;
};

//-----------------------------------------------------------------
// LEARNER STATE (persisted by an external store)
//-----------------------------------------------------------------
struct ResponseRecord {
  std::string item_id;
  double score_fraction = 0.0;
  int category = 0;
  int categories = 1;
  TimestampMs answered_at = 0;
  bool degenerate = false;
};

struct ProbeRecord {
  std::string item_id;
  std::size_t response_index = 0;
  bool success = false;
};

struct TopicAbilityState {
  std::string topic_id;
  double theta = 0.0;
  double se = 0.8;
  int response_count = 0;
  double elo_rating = 1500.0;
  TimestampMs last_practiced_at = 0;
  double prior_mean = 0.0;
  bool psychometric_active = false;
  std::vector<ResponseRecord> responses;
  std::vector<double> se_history;
  std::vector<ProbeRecord> probes;
  bool mastery_confirmed = false;
  bool handed_off = false;
  std::optional<TimestampMs> cooldown_until;
};

struct ExposureRecord {
  std::string item_id;
  std::vector<TimestampMs> presented_at;
  double score_sum = 0.0;
  int score_count = 0;

  double mean_score() const {
    return score_count > 0 ? score_sum / static_cast<double>(score_count) : 0.0;
  }
};

enum class CardLane {
  Retention,
  Training
};

inline std::string to_string(CardLane lane) {
  switch (lane) {
    case CardLane::Retention: return "retention";
    case CardLane::Training: return "training";
  }
  return "retention";
}

struct RetentionCard {
  std::string card_id;
  std::string item_id;
  std::string topic_id;
  double stability = 0.0;
  double difficulty = 5.0;
  TimestampMs due_at = 0;
  TimestampMs last_reviewed_at = 0;
  int lapse_count = 0;
  int review_count = 0;
  CardLane lane = CardLane::Retention;
};

// Aggregated SE-reduction-per-minute observations from earlier sessions.
struct TopicHistory {
  int observations = 0;
  double mean_delta_se_per_min = 0.0;
};

struct LearnerState {
  std::string learner_id;
  std::map<std::string, TopicAbilityState> topics;
  std::map<std::string, ExposureRecord> exposure;
  std::map<std::string, RetentionCard> cards;
  std::map<std::string, TopicHistory> history;

  TopicAbilityState& topic(const std::string& topic_id) {
    auto it = topics.find(topic_id);
    if (it == topics.end()) {
      TopicAbilityState state;
      state.topic_id = topic_id;
      it = topics.emplace(topic_id, std::move(state)).first;
    }
    return it->second;
  }

  const TopicAbilityState* find_topic(const std::string& topic_id) const {
    auto it = topics.find(topic_id);
    return it == topics.end() ? nullptr : &it->second;
  }

  // Item currently frozen in the retention lane (never offered for training).
  bool in_retention_lane(const std::string& item_id) const {
    for (const auto& kv : cards) {
      if (kv.second.item_id == item_id && kv.second.lane == CardLane::Retention) {
        return true;
      }
    }
    return false;
  }
};

//-----------------------------------------------------------------
// SESSION SCHEDULING STATE (ephemeral)
//-----------------------------------------------------------------
struct SchedulerArm {
  std::string topic_id;
  double mean = 0.0;
  double variance = 1.0;
  int observations = 0;
};

// "Why this next" tuple returned beside every chosen item.
struct Explanation {
  double theta = 0.0;
  double se = 0.0;
  double mastery_probability = 0.0;
  double blueprint_gap = 0.0;
  double urgency_multiplier = 1.0;
  double item_info = 0.0;
  std::string selection_reason;
};

} // namespace study
