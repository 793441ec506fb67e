#pragma once

#include "config.hpp"
#include "exposure_controller.hpp"
#include "types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace study {

// What the scheduler knows about one candidate topic between items.
struct TopicStats {
  std::string topic_id;
  const TopicAbilityState* state = nullptr;  // null for a topic never practiced
  bool exhausted = false;                    // selector found nothing left this session
};

struct TopicCandidate {
  std::string topic_id;
  double sampled_delta = 0.0;
  double urgency = 1.0;
  double blueprint_multiplier = 1.0;
  double score = 0.0;
  double deficit = 0.0;
};

struct TopicChoice {
  std::string topic_id;
  double score = 0.0;
  double expected_delta_se = 0.0;
  double urgency = 1.0;
  double blueprint_multiplier = 1.0;
  double deficit = 0.0;
  // No topic was eligible; the lowest-share topic was taken instead.
  bool fallback = false;
  std::vector<TopicCandidate> candidates;
};

enum class TopicStopReason {
  SeTarget,
  SePlateau,
  Mastery
};

std::string to_string(TopicStopReason reason);

enum class SessionStopReason {
  Fatigue,
  TimeBudget,
  ItemLimit,
  BlueprintSatisfied,
  Exhausted,
  Requested
};

std::string to_string(SessionStopReason reason);

class TopicScheduler {
public:
  explicit TopicScheduler(const ExposureController& exposure, SchedulerConfig config = {});

  // Prior over SE reduction per minute, combined with aggregated history.
  SchedulerArm initial_arm(const std::string& topic_id, const TopicAbilityState* state,
                           const TopicHistory* history, TimestampMs now) const;

  // Normal-Normal conjugate update with one observed SE reduction per minute.
  void observe(SchedulerArm& arm, double delta_se_per_minute) const;

  double urgency(const TopicAbilityState* state, TimestampMs now) const;

  std::optional<TopicChoice> choose_next_topic(const std::map<std::string, SchedulerArm>& arms,
                                               const std::vector<TopicStats>& topics,
                                               const SessionShareTracker& shares,
                                               TimestampMs now,
                                               std::uint64_t& rng_state) const;

  // Evaluated after every response on the active topic.
  std::optional<TopicStopReason> evaluate_topic_stop(const TopicAbilityState& state,
                                                     double mastery_probability,
                                                     bool fresh_successful_probe) const;

  double fatigue_index(double elapsed_minutes, int mastered_topics) const;
  bool fatigued(double elapsed_minutes, int mastered_topics) const;

  TimestampMs cooldown_until(TimestampMs now) const;

  const SchedulerConfig& config() const noexcept { return config_; }

private:
  bool cooling_down(const TopicAbilityState* state, TimestampMs now) const;

  const ExposureController& exposure_;
  SchedulerConfig config_;
};

} // namespace study
