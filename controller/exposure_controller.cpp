#include "study/exposure_controller.hpp"

#include <algorithm>
#include <cmath>
#include <optional>

namespace study {

void SessionShareTracker::record(const ItemMetadata& item) {
  ++total_;
  ++topic_counts_[item.topic_id];
  if (!item.system_id.empty()) {
    ++system_counts_[item.system_id];
  }
}

std::size_t SessionShareTracker::count(BlueprintLevel level, const std::string& key) const {
  const auto& map = counts(level);
  auto it = map.find(key);
  return it == map.end() ? 0 : it->second;
}

double SessionShareTracker::share(BlueprintLevel level, const std::string& key) const {
  if (total_ == 0) {
    return 0.0;
  }
  return static_cast<double>(count(level, key)) / static_cast<double>(total_);
}

double SessionShareTracker::projected_share(BlueprintLevel level, const std::string& key) const {
  return static_cast<double>(count(level, key) + 1) / static_cast<double>(total_ + 1);
}

ExposureController::ExposureController(BlueprintConfig blueprint, ExposureConfig config)
    : blueprint_(std::move(blueprint)), config_(config) {}

double ExposureController::exposure_multiplier(const LearnerState& learner,
                                               const ItemMetadata& item,
                                               TimestampMs now) const {
  auto it = learner.exposure.find(item.item_id);
  if (it == learner.exposure.end() || it->second.presented_at.empty()) {
    return 1.0;
  }
  const auto& record = it->second;

  int last_day = 0;
  int last_week = 0;
  std::optional<TimestampMs> latest;
  for (TimestampMs at : record.presented_at) {
    const double hours = detail::hours_between(at, now);
    if (hours < 0.0) {
      continue;
    }
    if (hours < 24.0) {
      ++last_day;
    }
    if (hours < 24.0 * 7.0) {
      ++last_week;
    }
    latest = latest ? std::max(*latest, at) : at;
  }
  if (!latest) {
    return 1.0;
  }

  double multiplier = 1.0;
  const double since_last = detail::hours_between(*latest, now);
  if (last_day >= config_.max_per_day || last_week >= config_.max_per_week ||
      since_last < config_.cooldown_hours) {
    return 0.0;
  }
  if (since_last / 24.0 < config_.full_recovery_days) {
    multiplier = config_.recovered_multiplier;
  }

  if (record.score_count > 0 && record.mean_score() > config_.overfamiliar_mean_score &&
      !learner.in_retention_lane(item.item_id)) {
    const TopicAbilityState* topic = learner.find_topic(item.topic_id);
    if (topic && topic->se < config_.overfamiliar_se) {
      multiplier = std::min(multiplier, config_.overfamiliar_multiplier);
    }
  }
  return multiplier;
}

double ExposureController::blueprint_multiplier(const SessionShareTracker& shares,
                                                BlueprintLevel level,
                                                const std::string& key) const {
  auto target = blueprint_.target(level, key);
  if (!target) {
    return 1.0;
  }
  const double drift = shares.share(level, key) - *target;
  if (drift > config_.drift_dead_zone) {
    return std::max(config_.over_floor, 1.0 - config_.over_slope * drift);
  }
  if (drift < -config_.drift_dead_zone) {
    return std::min(config_.under_cap, 1.0 + config_.under_slope * std::fabs(drift));
  }
  return 1.0;
}

double ExposureController::blueprint_multiplier(const SessionShareTracker& shares,
                                                const ItemMetadata& item) const {
  double multiplier = blueprint_multiplier(shares, BlueprintLevel::Topic, item.topic_id);
  if (!item.system_id.empty()) {
    multiplier *= blueprint_multiplier(shares, BlueprintLevel::System, item.system_id);
  }
  return multiplier;
}

double ExposureController::blueprint_gap(const SessionShareTracker& shares, BlueprintLevel level,
                                         const std::string& key) const {
  auto target = blueprint_.target(level, key);
  if (!target) {
    return 0.0;
  }
  return *target - shares.share(level, key);
}

bool ExposureController::within_window(const SessionShareTracker& shares, BlueprintLevel level,
                                       const std::string& key) const {
  auto target = blueprint_.target(level, key);
  if (!target) {
    return true;
  }
  if (shares.share(level, key) <= *target) {
    return true;
  }
  return shares.projected_share(level, key) <= *target + config_.drift_dead_zone;
}

bool ExposureController::within_window(const SessionShareTracker& shares,
                                       const ItemMetadata& item) const {
  if (!within_window(shares, BlueprintLevel::Topic, item.topic_id)) {
    return false;
  }
  if (!item.system_id.empty() && !within_window(shares, BlueprintLevel::System, item.system_id)) {
    return false;
  }
  return true;
}

bool ExposureController::all_targets_within_window(const SessionShareTracker& shares) const {
  for (auto level : {BlueprintLevel::Topic, BlueprintLevel::System}) {
    for (const auto& kv : blueprint_.level_targets(level)) {
      if (std::fabs(shares.share(level, kv.first) - kv.second) > config_.drift_dead_zone) {
        return false;
      }
    }
  }
  return true;
}

void ExposureController::record_presentation(LearnerState& learner, SessionShareTracker& shares,
                                             const ItemMetadata& item, TimestampMs now) const {
  record_exposure(learner, item, now);
  shares.record(item);
}

void ExposureController::record_exposure(LearnerState& learner, const ItemMetadata& item,
                                         TimestampMs now) const {
  auto& record = learner.exposure[item.item_id];
  record.item_id = item.item_id;
  record.presented_at.push_back(now);
  const auto window_ms = static_cast<TimestampMs>(config_.window_days * kMsPerDay);
  record.presented_at.erase(
      std::remove_if(record.presented_at.begin(), record.presented_at.end(),
                     [&](TimestampMs at) { return now - at > window_ms; }),
      record.presented_at.end());
}

void ExposureController::record_score(LearnerState& learner, const std::string& item_id,
                                      double score_fraction) const {
  auto& record = learner.exposure[item_id];
  record.item_id = item_id;
  record.score_sum += detail::clip01(score_fraction);
  record.score_count += 1;
}

std::size_t ExposureController::exposure_count(const LearnerState& learner,
                                               const std::string& item_id,
                                               TimestampMs now) const {
  auto it = learner.exposure.find(item_id);
  if (it == learner.exposure.end()) {
    return 0;
  }
  const auto window_ms = static_cast<TimestampMs>(config_.window_days * kMsPerDay);
  return static_cast<std::size_t>(
      std::count_if(it->second.presented_at.begin(), it->second.presented_at.end(),
                    [&](TimestampMs at) { return at <= now && now - at <= window_ms; }));
}

} // namespace study
