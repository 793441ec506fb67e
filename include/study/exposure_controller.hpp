#pragma once

#include "config.hpp"
#include "item_bank.hpp"
#include "types.hpp"

#include <map>
#include <string>

namespace study {

// Per-session presentation counts at topic and system level.
class SessionShareTracker {
public:
  void record(const ItemMetadata& item);

  std::size_t total() const { return total_; }
  std::size_t count(BlueprintLevel level, const std::string& key) const;

  // Live share; 0 before anything was presented.
  double share(BlueprintLevel level, const std::string& key) const;

  // Share the key would have if one more item of it were presented.
  double projected_share(BlueprintLevel level, const std::string& key) const;

  const std::map<std::string, std::size_t>& counts(BlueprintLevel level) const {
    return level == BlueprintLevel::Topic ? topic_counts_ : system_counts_;
  }

private:
  std::size_t total_ = 0;
  std::map<std::string, std::size_t> topic_counts_;
  std::map<std::string, std::size_t> system_counts_;
};

class ExposureController {
public:
  // `blueprint` must already be resolved against the item bank.
  explicit ExposureController(BlueprintConfig blueprint, ExposureConfig config = {});

  // 0 while an exposure cap binds, 0.5 after the cooldown, 1.0 after a clean
  // week or for never-seen items; dampened for overfamiliar items.
  double exposure_multiplier(const LearnerState& learner, const ItemMetadata& item,
                             TimestampMs now) const;

  double blueprint_multiplier(const SessionShareTracker& shares, BlueprintLevel level,
                              const std::string& key) const;
  // Product of the topic and system multipliers.
  double blueprint_multiplier(const SessionShareTracker& shares, const ItemMetadata& item) const;

  // target - live share; 0 for keys without a target.
  double blueprint_gap(const SessionShareTracker& shares, BlueprintLevel level,
                       const std::string& key) const;

  // False when presenting one more item of `key` would lift its share above
  // target + window while it is already above target.
  bool within_window(const SessionShareTracker& shares, BlueprintLevel level,
                     const std::string& key) const;
  bool within_window(const SessionShareTracker& shares, const ItemMetadata& item) const;

  // True when every configured live share is within target +/- window.
  bool all_targets_within_window(const SessionShareTracker& shares) const;

  void record_presentation(LearnerState& learner, SessionShareTracker& shares,
                           const ItemMetadata& item, TimestampMs now) const;
  // Exposure only; retention reviews do not count toward blueprint shares.
  void record_exposure(LearnerState& learner, const ItemMetadata& item, TimestampMs now) const;
  void record_score(LearnerState& learner, const std::string& item_id, double score_fraction) const;

  // Presentations inside the sliding window.
  std::size_t exposure_count(const LearnerState& learner, const std::string& item_id,
                             TimestampMs now) const;

  const BlueprintConfig& blueprint() const noexcept { return blueprint_; }
  const ExposureConfig& config() const noexcept { return config_; }

private:
  BlueprintConfig blueprint_;
  ExposureConfig config_;
};

} // namespace study
