#include "study/retention_queue.hpp"
#include "study/item_selector.hpp"

#include "test_support.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

using study::testing::TestSuite;
using study::testing::kEpoch;
using study::testing::make_item;
using study::testing::near;

namespace {

constexpr study::TimestampMs kDay = study::kMsPerDay;

study::RetentionCard make_card(const std::string& item_id, study::TimestampMs due_at,
                               double stability, study::TimestampMs last_reviewed_at) {
  study::RetentionCard card;
  card.card_id = study::card_id_for(item_id);
  card.item_id = item_id;
  card.topic_id = "t";
  card.stability = stability;
  card.difficulty = 5.0;
  card.due_at = due_at;
  card.last_reviewed_at = last_reviewed_at;
  return card;
}

void add(std::map<std::string, study::RetentionCard>& cards, const study::RetentionCard& card) {
  cards[card.card_id] = card;
}

} // namespace

int main() {
  TestSuite suite;

  study::ItemBank bank(1, {make_item("i-0", "t", 0.0), make_item("i-1", "t", 0.1),
                           make_item("i-2", "t", 0.2), make_item("i-3", "t", 0.3),
                           make_item("i-4", "t", 0.4)});
  study::RetentionQueue queue(bank);

  {
    auto card = make_card("i-0", kEpoch, 10.0, kEpoch);
    suite.require(near(queue.retrievability(card, kEpoch), 1.0, 1e-12),
                  "Retrievability right after a review should be 1");
    card.last_reviewed_at = kEpoch - 10 * kDay;
    suite.require(near(queue.retrievability(card, kEpoch), 0.9, 1e-9),
                  "Retrievability should be 90% after S days");
    suite.require(queue.next_interval_days(10.0) == 10.0,
                  "At 90% desired retention the interval equals the stability");
    suite.require(queue.next_interval_days(0.2) == 1.0, "Intervals are at least one day");
  }

  {
    std::map<std::string, study::RetentionCard> cards;
    add(cards, make_card("i-0", kEpoch - kDay, 4.0, kEpoch - 5 * kDay));
    add(cards, make_card("i-1", kEpoch - 5 * kDay, 5.0, kEpoch - 10 * kDay));
    add(cards, make_card("i-2", kEpoch + 2 * kDay, 5.0, kEpoch - 3 * kDay));
    auto training = make_card("i-3", kEpoch - kDay, 5.0, kEpoch - 6 * kDay);
    training.lane = study::CardLane::Training;
    add(cards, training);
    add(cards, make_card("ghost", kEpoch - kDay, 5.0, kEpoch - 6 * kDay));

    auto plan = queue.build_queue(cards, 30.0, kEpoch);
    suite.require(plan.due_cards == 2, "Only due retention-lane cards should be queued");
    suite.require(plan.missing_items.size() == 1 && plan.missing_items[0] == "ghost",
                  "Cards without item metadata should be reported");
    suite.require(!plan.extended_budget && near(plan.budget_minutes, 12.0, 1e-9),
                  "Default retention budget should be 40% of the session");
    suite.require(plan.queue.size() == 2 && plan.queue[0].item_id == "i-1" &&
                      plan.queue[0].jump_ahead,
                  "Cards more than 3 days overdue should jump ahead");
    suite.require(near(plan.planned_minutes, 2.0, 1e-9), "Planned time should sum median times");

    auto tight = queue.build_queue(cards, 3.0, kEpoch);
    suite.require(tight.queue.size() == 1, "Queue should stop once the budget is spent");

    add(cards, make_card("i-4", kEpoch - 10 * kDay, 2.0, kEpoch - 12 * kDay));
    auto extended = queue.build_queue(cards, 30.0, kEpoch);
    suite.require(extended.extended_budget && near(extended.budget_minutes, 18.0, 1e-9),
                  "A card more than a week overdue should extend the budget to 60%");
    suite.require(extended.queue.front().item_id == "i-4",
                  "Lower retrievability and longer overdue should come first");
  }

  {
    auto card = make_card("i-0", kEpoch, 10.0, kEpoch - 10 * kDay);
    auto recalled = queue.on_review_result(card, true, kEpoch);
    suite.require(recalled.stability > card.stability, "Recall should grow stability");
    suite.require(recalled.due_at > kEpoch + 10 * kDay, "Recall should push the due date out");
    suite.require(recalled.review_count == 1 && recalled.lapse_count == 0,
                  "Recall should count a review without a lapse");
    suite.require(recalled.lane == study::CardLane::Retention, "Recalled cards stay in retention");
    suite.require(recalled.last_reviewed_at == kEpoch, "Review time should be recorded");

    auto lapsed = queue.on_review_result(card, false, kEpoch);
    suite.require(lapsed.stability < card.stability, "A lapse should shrink stability");
    suite.require(lapsed.lapse_count == 1, "A lapse should be counted");
    suite.require(lapsed.lane == study::CardLane::Training, "A lapse returns the card to training");

    auto same_day = make_card("i-0", kEpoch, 2.0, kEpoch - study::kMsPerHour);
    auto short_term = queue.on_review_result(same_day, true, kEpoch);
    suite.require(short_term.stability >= same_day.stability,
                  "Same-day recall should never reduce stability");
  }

  {
    study::SelectorConfig selector;
    study::TopicAbilityState topic;
    topic.topic_id = "t";
    suite.require(queue.evaluate_handoff(topic, 0.8, selector) == study::HandoffStatus::NotReady,
                  "Handoff needs mastery");

    topic.se_history = {0.5, 0.4};
    suite.require(queue.evaluate_handoff(topic, 0.9, selector) == study::HandoffStatus::Deferred,
                  "Too short an SE history should defer the handoff");

    for (int i = 0; i < 3; ++i) {
      study::ResponseRecord record;
      record.item_id = "i-0";
      topic.responses.push_back(record);
    }
    topic.se_history = {0.5, 0.4, 0.35};
    suite.require(queue.evaluate_handoff(topic, 0.9, selector) == study::HandoffStatus::NotReady,
                  "Handoff needs a fresh successful probe");

    topic.probes.push_back({"i-0", 2, true});
    suite.require(queue.evaluate_handoff(topic, 0.9, selector) == study::HandoffStatus::Ready,
                  "Mastery, probe and falling SE should allow the handoff");

    topic.se_history = {0.5, 0.4, 0.45};
    suite.require(queue.evaluate_handoff(topic, 0.9, selector) == study::HandoffStatus::NotReady,
                  "A rising SE should block the handoff");

    topic.se_history = {0.5, 0.4, 0.35};
    topic.handed_off = true;
    suite.require(queue.evaluate_handoff(topic, 0.9, selector) == study::HandoffStatus::NotReady,
                  "A topic hands off once per mastery episode");
  }

  {
    study::LearnerState learner;
    learner.learner_id = "learner";
    auto card = queue.hand_off(learner, "t", *bank.find("i-0"), kEpoch);
    suite.require(card.card_id == "card-i-0", "Card ids derive from the item id");
    suite.require(learner.cards.count("card-i-0") == 1, "Handoff should store the card");
    suite.require(card.due_at == kEpoch + 2 * kDay, "First interval should follow initial stability");
    suite.require(learner.topics["t"].handed_off && learner.topics["t"].mastery_confirmed,
                  "Handoff should confirm mastery");
    suite.require(learner.in_retention_lane("i-0"), "Handed-off items leave training");

    auto recalled = queue.apply_review(learner, "card-i-0", true, kEpoch + 3 * kDay);
    suite.require(!recalled.lapsed && recalled.after.review_count == 1,
                  "A recalled review should be recorded");

    auto lapse = queue.apply_review(learner, "card-i-0", false, kEpoch + 20 * kDay);
    suite.require(lapse.lapsed && learner.cards["card-i-0"].lane == study::CardLane::Training,
                  "A lapse should move the card back to training");
    suite.require(!learner.topics["t"].handed_off && !learner.topics["t"].mastery_confirmed,
                  "A lapse should clear the topic's mastery");
    suite.require(!learner.in_retention_lane("i-0"), "Lapsed items are trainable again");

    auto again = queue.hand_off(learner, "t", *bank.find("i-0"), kEpoch + 30 * kDay);
    suite.require(again.lapse_count == 1 && again.lane == study::CardLane::Retention,
                  "Re-mastery should reactivate the existing card");

    bool threw = false;
    try {
      queue.apply_review(learner, "card-missing", true, kEpoch);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "Reviewing an unknown card should throw");
  }

  {
    study::RetentionConfig bad;
    bad.weights.pop_back();
    bool threw = false;
    try {
      study::RetentionQueue invalid(bank, bad);
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "A weight vector of the wrong length should be rejected");
  }

  if (!suite.ok) {
    std::cerr << "Retention queue tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Retention queue tests passed" << std::endl;
  return 0;
}
