#include "study/retention_queue.hpp"

#include "study/item_selector.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace study {

namespace {

constexpr int kAgain = 1;
constexpr int kGood = 3;
constexpr int kEasy = 4;

constexpr double kMinDifficulty = 1.0;
constexpr double kMaxDifficulty = 10.0;
constexpr double kMinStability = 0.001;
constexpr std::size_t kWeightCount = 21;

double clamp_difficulty(double d) {
  return std::clamp(d, kMinDifficulty, kMaxDifficulty);
}

double clamp_stability(double s) {
  return std::max(s, kMinStability);
}

} // namespace

std::string to_string(HandoffStatus status) {
  switch (status) {
    case HandoffStatus::Ready: return "ready";
    case HandoffStatus::Deferred: return "deferred";
    case HandoffStatus::NotReady: return "not_ready";
  }
  return "not_ready";
}

std::string card_id_for(const std::string& item_id) {
  return "card-" + item_id;
}

RetentionQueue::RetentionQueue(const ItemBank& bank, RetentionConfig config)
    : bank_(bank), config_(std::move(config)) {
  if (config_.weights.size() != kWeightCount) {
    throw std::invalid_argument("RetentionQueue: expected " + std::to_string(kWeightCount) +
                                " FSRS weights, got " + std::to_string(config_.weights.size()));
  }
  if (!(config_.desired_retention > 0.0 && config_.desired_retention < 1.0)) {
    throw std::invalid_argument("RetentionQueue: desired retention must be in (0,1)");
  }
  decay_ = -config_.weights[20];
  factor_ = std::pow(0.9, 1.0 / decay_) - 1.0;
}

double RetentionQueue::initial_difficulty(int rating) const {
  const auto& w = config_.weights;
  return w[4] - std::exp(w[5] * (static_cast<double>(rating) - 1.0)) + 1.0;
}

double RetentionQueue::next_difficulty(double difficulty, int rating) const {
  const auto& w = config_.weights;
  const double delta = -(w[6] * (static_cast<double>(rating) - 3.0));
  const double damped = (kMaxDifficulty - difficulty) * delta / (kMaxDifficulty - kMinDifficulty);
  return clamp_difficulty(w[7] * initial_difficulty(kEasy) + (1.0 - w[7]) * (difficulty + damped));
}

double RetentionQueue::short_term_stability(double stability, int rating) const {
  const auto& w = config_.weights;
  double increase = std::exp(w[17] * (static_cast<double>(rating) - 3.0 + w[18])) *
                    std::pow(stability, -w[19]);
  if (rating >= kGood) {
    increase = std::max(increase, 1.0);
  }
  return clamp_stability(stability * increase);
}

double RetentionQueue::next_stability(double difficulty, double stability, double retrievability,
                                      int rating) const {
  const auto& w = config_.weights;
  if (rating == kAgain) {
    return clamp_stability(w[11] * std::pow(difficulty, -w[12]) *
                           (std::pow(stability + 1.0, w[13]) - 1.0) *
                           std::exp((1.0 - retrievability) * w[14]));
  }
  const double increase = std::exp(w[8]) * (11.0 - difficulty) * std::pow(stability, -w[9]) *
                          (std::exp((1.0 - retrievability) * w[10]) - 1.0);
  return clamp_stability(stability * (1.0 + increase));
}

double RetentionQueue::retrievability(const RetentionCard& card, TimestampMs now) const {
  if (card.stability <= 0.0) {
    return 0.0;
  }
  const double elapsed = std::max(0.0, detail::days_between(card.last_reviewed_at, now));
  return std::pow(1.0 + factor_ * elapsed / card.stability, decay_);
}

double RetentionQueue::next_interval_days(double stability) const {
  const double days =
      stability / factor_ * (std::pow(config_.desired_retention, 1.0 / decay_) - 1.0);
  return std::clamp(std::round(days), 1.0, config_.maximum_interval_days);
}

RetentionPlan RetentionQueue::build_queue(const std::map<std::string, RetentionCard>& cards,
                                          double session_minutes_budget, TimestampMs now) const {
  RetentionPlan plan;
  std::vector<QueuedCard> due;
  for (const auto& kv : cards) {
    const RetentionCard& card = kv.second;
    if (card.lane != CardLane::Retention || card.due_at > now) {
      continue;
    }
    const ItemMetadata* item = bank_.find(card.item_id);
    if (!item) {
      plan.missing_items.push_back(card.item_id);
      continue;
    }
    QueuedCard queued;
    queued.card_id = card.card_id;
    queued.item_id = card.item_id;
    queued.topic_id = card.topic_id;
    queued.retrievability = retrievability(card, now);
    queued.days_overdue = std::max(0.0, detail::days_between(card.due_at, now));
    queued.priority =
        -queued.retrievability * (1.0 + config_.overdue_boost * queued.days_overdue);
    queued.median_time_sec = item->median_time_sec;
    queued.jump_ahead = queued.days_overdue > config_.jump_ahead_overdue_days;
    if (queued.days_overdue > config_.extended_overdue_days) {
      plan.extended_budget = true;
    }
    due.push_back(queued);
  }
  plan.due_cards = due.size();

  std::sort(due.begin(), due.end(), [](const QueuedCard& a, const QueuedCard& b) {
    if (a.jump_ahead != b.jump_ahead) {
      return a.jump_ahead;
    }
    if (a.priority != b.priority) {
      return a.priority < b.priority;
    }
    return a.card_id < b.card_id;
  });

  const double fraction =
      plan.extended_budget ? config_.extended_budget_fraction : config_.default_budget_fraction;
  plan.budget_minutes = std::max(0.0, session_minutes_budget) * fraction;
  for (auto& queued : due) {
    const double minutes = queued.median_time_sec / 60.0;
    if (plan.planned_minutes + minutes > plan.budget_minutes) {
      break;
    }
    plan.planned_minutes += minutes;
    plan.queue.push_back(std::move(queued));
  }
  return plan;
}

RetentionCard RetentionQueue::on_review_result(const RetentionCard& card, bool correct,
                                               TimestampMs now) const {
  RetentionCard next = card;
  const int rating = correct ? kGood : kAgain;
  const double elapsed = std::max(0.0, detail::days_between(card.last_reviewed_at, now));
  const double r = retrievability(card, now);

  next.difficulty = next_difficulty(card.difficulty, rating);
  next.stability = elapsed < 1.0 ? short_term_stability(card.stability, rating)
                                 : next_stability(card.difficulty, card.stability, r, rating);
  next.review_count += 1;
  next.last_reviewed_at = now;
  next.due_at = now + static_cast<TimestampMs>(next_interval_days(next.stability) * kMsPerDay);
  if (!correct) {
    next.lapse_count += 1;
    next.lane = CardLane::Training;
  }
  return next;
}

HandoffStatus RetentionQueue::evaluate_handoff(const TopicAbilityState& topic,
                                               double mastery_probability,
                                               const SelectorConfig& selector) const {
  if (topic.handed_off || mastery_probability < config_.handoff_mastery) {
    return HandoffStatus::NotReady;
  }
  const std::size_t window = config_.handoff_se_window;
  if (topic.se_history.size() < window || topic.responses.size() < window) {
    return HandoffStatus::Deferred;
  }
  if (!has_fresh_successful_probe(topic, selector)) {
    return HandoffStatus::NotReady;
  }
  const auto& history = topic.se_history;
  for (std::size_t i = history.size() - window + 1; i < history.size(); ++i) {
    if (history[i] > history[i - 1]) {
      return HandoffStatus::NotReady;
    }
  }
  return HandoffStatus::Ready;
}

RetentionCard RetentionQueue::hand_off(LearnerState& learner, const std::string& topic_id,
                                       const ItemMetadata& item, TimestampMs now) const {
  const std::string card_id = card_id_for(item.item_id);
  auto it = learner.cards.find(card_id);
  RetentionCard card;
  if (it != learner.cards.end()) {
    card = it->second;
  } else {
    card.card_id = card_id;
    card.item_id = item.item_id;
    card.topic_id = topic_id;
    card.stability = clamp_stability(config_.weights[kGood - 1]);
    card.difficulty = clamp_difficulty(initial_difficulty(kGood));
  }
  card.lane = CardLane::Retention;
  card.last_reviewed_at = now;
  card.due_at = now + static_cast<TimestampMs>(next_interval_days(card.stability) * kMsPerDay);
  learner.cards[card_id] = card;

  auto& topic = learner.topic(topic_id);
  topic.mastery_confirmed = true;
  topic.handed_off = true;
  return card;
}

ReviewOutcome RetentionQueue::apply_review(LearnerState& learner, const std::string& card_id,
                                           bool correct, TimestampMs now) const {
  auto it = learner.cards.find(card_id);
  if (it == learner.cards.end()) {
    throw std::invalid_argument("Unknown retention card: " + card_id);
  }
  ReviewOutcome outcome;
  outcome.before = it->second;
  outcome.retrievability = retrievability(it->second, now);
  outcome.after = on_review_result(it->second, correct, now);
  outcome.lapsed = !correct;
  it->second = outcome.after;

  if (outcome.lapsed) {
    auto& topic = learner.topic(outcome.after.topic_id);
    topic.mastery_confirmed = false;
    topic.handed_off = false;
  }
  return outcome;
}

} // namespace study
