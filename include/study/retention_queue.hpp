#pragma once

#include "config.hpp"
#include "item_bank.hpp"
#include "types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace study {

struct QueuedCard {
  std::string card_id;
  std::string item_id;
  std::string topic_id;
  double retrievability = 1.0;
  double days_overdue = 0.0;
  double priority = 0.0;
  double median_time_sec = 0.0;
  bool jump_ahead = false;
};

struct RetentionPlan {
  std::vector<QueuedCard> queue;
  double budget_minutes = 0.0;
  double planned_minutes = 0.0;
  bool extended_budget = false;
  std::size_t due_cards = 0;
  std::vector<std::string> missing_items;
};

enum class HandoffStatus {
  Ready,
  Deferred,   // not enough recorded responses to judge the SE trend
  NotReady
};

std::string to_string(HandoffStatus status);

struct ReviewOutcome {
  RetentionCard before;
  RetentionCard after;
  double retrievability = 1.0;
  bool lapsed = false;
};

class RetentionQueue {
public:
  explicit RetentionQueue(const ItemBank& bank, RetentionConfig config = {});

  // FSRS-6 forgetting curve R = (1 + factor * t / S)^decay.
  double retrievability(const RetentionCard& card, TimestampMs now) const;
  double next_interval_days(double stability) const;

  RetentionPlan build_queue(const std::map<std::string, RetentionCard>& cards,
                            double session_minutes_budget, TimestampMs now) const;

  RetentionCard on_review_result(const RetentionCard& card, bool correct, TimestampMs now) const;

  // Handoff needs mastery, a successful fresh probe and a non-increasing SE
  // over the last responses. Runs at most once per mastery episode.
  HandoffStatus evaluate_handoff(const TopicAbilityState& topic, double mastery_probability,
                                 const SelectorConfig& selector) const;

  // Creates (or re-activates) the card for the probe item that confirmed
  // mastery and freezes it out of training.
  RetentionCard hand_off(LearnerState& learner, const std::string& topic_id,
                         const ItemMetadata& item, TimestampMs now) const;

  // Applies a retention response. A lapse sends the item back to training and
  // clears the topic's mastered status.
  ReviewOutcome apply_review(LearnerState& learner, const std::string& card_id, bool correct,
                             TimestampMs now) const;

  const RetentionConfig& config() const noexcept { return config_; }

private:
  double initial_difficulty(int rating) const;
  double next_difficulty(double difficulty, int rating) const;
  double short_term_stability(double stability, int rating) const;
  double next_stability(double difficulty, double stability, double retrievability,
                        int rating) const;

  const ItemBank& bank_;
  RetentionConfig config_;
  double decay_ = 0.0;
  double factor_ = 0.0;
};

std::string card_id_for(const std::string& item_id);

} // namespace study
