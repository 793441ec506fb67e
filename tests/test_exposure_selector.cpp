#include "study/exposure_controller.hpp"
#include "study/item_selector.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <variant>
#include <vector>

using study::BlueprintLevel;
using study::testing::TestSuite;
using study::testing::kEpoch;
using study::testing::make_item;
using study::testing::near;

namespace {

constexpr study::TimestampMs kHour = study::kMsPerHour;
constexpr study::TimestampMs kDay = study::kMsPerDay;

study::LearnerState learner_with_exposure(const std::string& item_id,
                                          const std::vector<study::TimestampMs>& presented) {
  study::LearnerState learner;
  learner.learner_id = "learner";
  auto& record = learner.exposure[item_id];
  record.item_id = item_id;
  record.presented_at = presented;
  return learner;
}

std::vector<std::string> ids_of(const study::ItemBank& bank, const std::string& topic) {
  std::vector<std::string> ids;
  for (const auto* item : bank.items_for_topic(topic)) {
    ids.push_back(item->item_id);
  }
  return ids;
}

} // namespace

int main() {
  TestSuite suite;

  const auto item = make_item("x", "t", 0.0);
  study::ExposureController exposure(study::BlueprintConfig{});

  {
    study::LearnerState learner;
    suite.require(exposure.exposure_multiplier(learner, item, kEpoch) == 1.0,
                  "Never-seen items should have full exposure weight");

    auto recent = learner_with_exposure("x", {kEpoch - 2 * kHour});
    suite.require(exposure.exposure_multiplier(recent, item, kEpoch) == 0.0,
                  "Items seen within 24h should be blocked");

    auto cooling = learner_with_exposure("x", {kEpoch - 72 * kHour});
    suite.require(exposure.exposure_multiplier(cooling, item, kEpoch) == 0.0,
                  "Items inside the 96h cooldown should be blocked");

    auto recovering = learner_with_exposure("x", {kEpoch - 5 * kDay});
    suite.require(near(exposure.exposure_multiplier(recovering, item, kEpoch), 0.5, 1e-12),
                  "Items past the cooldown but inside a week should be halved");

    auto recovered = learner_with_exposure("x", {kEpoch - 8 * kDay});
    suite.require(exposure.exposure_multiplier(recovered, item, kEpoch) == 1.0,
                  "Items unseen for a week should recover fully");

    auto weekly = learner_with_exposure("x", {kEpoch - 6 * kDay - 12 * kHour, kEpoch - 5 * kDay});
    suite.require(exposure.exposure_multiplier(weekly, item, kEpoch) == 0.0,
                  "A second presentation inside 7 days should hit the weekly cap");

    auto future = learner_with_exposure("x", {kEpoch + kDay});
    suite.require(exposure.exposure_multiplier(future, item, kEpoch) == 1.0,
                  "Future-dated presentations should be ignored");

    auto familiar = learner_with_exposure("x", {kEpoch - 10 * kDay});
    familiar.exposure["x"].score_sum = 1.9;
    familiar.exposure["x"].score_count = 2;
    familiar.topic("t").se = 0.1;
    suite.require(near(exposure.exposure_multiplier(familiar, item, kEpoch), 0.6, 1e-12),
                  "Overfamiliar items should be dampened");

    study::RetentionCard card;
    card.card_id = "card-x";
    card.item_id = "x";
    card.topic_id = "t";
    familiar.cards[card.card_id] = card;
    suite.require(exposure.exposure_multiplier(familiar, item, kEpoch) == 1.0,
                  "Retention-lane items are exempt from the overfamiliarity dampener");
  }

  {
    study::LearnerState learner;
    exposure.record_exposure(learner, item, kEpoch - 20 * kDay);
    exposure.record_exposure(learner, item, kEpoch);
    suite.require(learner.exposure["x"].presented_at.size() == 1,
                  "Presentations outside the 14-day window should be pruned");
    suite.require(exposure.exposure_count(learner, "x", kEpoch) == 1,
                  "Exposure count should cover the sliding window");
    exposure.record_score(learner, "x", 0.75);
    suite.require(near(learner.exposure["x"].mean_score(), 0.75, 1e-12),
                  "Scores should accumulate on the exposure record");
  }

  study::ItemBank bp_bank(1, {make_item("a1", "a", 0.0, "s1"), make_item("b1", "b", 0.0, "s2")});
  study::ExposureController blueprint(
      study::BlueprintConfig({{BlueprintLevel::Topic, "a", 0.5}}).resolved_for(bp_bank));

  {
    suite.require(blueprint.blueprint().target(BlueprintLevel::Topic, "b").has_value() &&
                      near(*blueprint.blueprint().target(BlueprintLevel::Topic, "b"), 0.5, 1e-12),
                  "Unconfigured topics should share the remaining mass");
    suite.require(near(*blueprint.blueprint().target(BlueprintLevel::System, "s1"), 0.5, 1e-12),
                  "Unconfigured systems should split evenly");

    study::SessionShareTracker shares;
    suite.require(shares.share(BlueprintLevel::Topic, "a") == 0.0,
                  "Share before any presentation should be zero");
    for (int i = 0; i < 4; ++i) {
      shares.record(*bp_bank.find("a1"));
    }
    suite.require(near(blueprint.blueprint_multiplier(shares, BlueprintLevel::Topic, "a"), 0.2,
                       1e-12),
                  "Over-served topics should be damped down to the floor");
    suite.require(near(blueprint.blueprint_multiplier(shares, BlueprintLevel::Topic, "b"), 1.5,
                       1e-12),
                  "Under-served topics should be boosted up to the cap");
    suite.require(near(blueprint.blueprint_multiplier(shares, *bp_bank.find("b1")), 2.25, 1e-12),
                  "Item multiplier should combine topic and system drift");
    suite.require(!blueprint.within_window(shares, BlueprintLevel::Topic, "a"),
                  "A topic already above target should leave the window");
    suite.require(blueprint.within_window(shares, BlueprintLevel::Topic, "b"),
                  "A topic below target should stay eligible");
    suite.require(near(blueprint.blueprint_gap(shares, BlueprintLevel::Topic, "b"), 0.5, 1e-12),
                  "Gap should be target minus live share");
    suite.require(!blueprint.all_targets_within_window(shares),
                  "Skewed shares should not satisfy the blueprint");

    for (int i = 0; i < 4; ++i) {
      shares.record(*bp_bank.find("b1"));
    }
    suite.require(blueprint.blueprint_multiplier(shares, BlueprintLevel::Topic, "a") == 1.0,
                  "Drift inside the dead zone should not change the weight");
    suite.require(blueprint.all_targets_within_window(shares),
                  "Balanced shares should satisfy the blueprint");
  }

  // Selector over one topic with difficulties spread around theta = 0.
  std::vector<study::ItemMetadata> items;
  const std::vector<double> difficulties = {-3.0, -2.0, -1.0, -0.5, 0.0, 0.5, 1.0, 2.0, 3.0};
  for (std::size_t i = 0; i < difficulties.size(); ++i) {
    items.push_back(make_item(study::testing::numbered_id("t", static_cast<int>(i)), "t",
                              difficulties[i]));
  }
  items.push_back(make_item("u-00", "u", 0.0));
  study::ItemBank bank(1, items);
  study::ExposureController open_exposure(study::BlueprintConfig{}.resolved_for(bank));
  study::ItemSelector selector(bank, open_exposure);
  const auto pool = ids_of(bank, "t");

  study::TopicAbilityState topic;
  topic.topic_id = "t";

  {
    study::LearnerState learner;
    study::SessionShareTracker shares;
    study::SelectionContext context;
    context.learner = &learner;
    context.shares = &shares;
    context.now = kEpoch;

    std::set<std::string> chosen;
    for (std::uint64_t seed = 1; seed <= 60; ++seed) {
      std::uint64_t rng = seed;
      auto result = selector.select_next(topic, pool, context, rng);
      auto* selection = std::get_if<study::Selection>(&result);
      suite.require(selection != nullptr, "Open pool should always yield an item");
      if (!selection) {
        continue;
      }
      chosen.insert(selection->item.item_id);
      suite.require(selection->reason == "randomesque_top5",
                    "Default selection should be randomesque over the top 5");
      suite.require(selection->shortlist_size == 5, "Shortlist should hold five items");
      suite.require(std::fabs(selection->item.difficulty) <= 1.0,
                    "Only the five most informative items should be drawn");
    }
    suite.require(chosen.size() > 1, "Randomesque draw should vary across seeds");

    std::uint64_t rng_a = 42;
    std::uint64_t rng_b = 42;
    auto first = selector.select_next(topic, pool, context, rng_a);
    auto second = selector.select_next(topic, pool, context, rng_b);
    suite.require(std::get<study::Selection>(first).item.item_id ==
                      std::get<study::Selection>(second).item.item_id,
                  "Selection should be deterministic for a fixed seed");
  }

  {
    auto learner = learner_with_exposure("t-04", {kEpoch - kHour});
    study::RetentionCard card;
    card.card_id = "card-t-05";
    card.item_id = "t-05";
    card.topic_id = "t";
    learner.cards[card.card_id] = card;
    study::SelectionContext context;
    context.learner = &learner;
    context.now = kEpoch;
    for (std::uint64_t seed = 1; seed <= 40; ++seed) {
      std::uint64_t rng = seed;
      auto result = selector.select_next(topic, pool, context, rng);
      const auto& selection = std::get<study::Selection>(result);
      suite.require(selection.item.item_id != "t-04", "Exposure-capped items are never selected");
      suite.require(selection.item.item_id != "t-05", "Retention-lane items are never selected");
    }
  }

  {
    std::vector<study::ItemMetadata> slow_items = {make_item("s-0", "s", 0.0, "", 50, 400.0),
                                                   make_item("s-1", "s", 0.2, "", 50, 500.0)};
    study::ItemBank slow_bank(1, slow_items);
    study::ExposureController slow_exposure(study::BlueprintConfig{}.resolved_for(slow_bank));
    study::ItemSelector slow_selector(slow_bank, slow_exposure);
    study::TopicAbilityState slow_topic;
    slow_topic.topic_id = "s";
    study::SelectionContext context;
    std::uint64_t rng = 3;
    auto result = slow_selector.select_next(slow_topic, {"s-0", "s-1"}, context, rng);
    suite.require(std::get<study::Selection>(result).reason == "time_cap_relaxed",
                  "Over-long items should only be served once the time cap is relaxed");
  }

  {
    study::ItemBank skew_bank(1, {make_item("a-0", "a", 0.0), make_item("b-0", "b", 0.0)});
    study::ExposureController skew(
        study::BlueprintConfig({{BlueprintLevel::Topic, "a", 0.2}}).resolved_for(skew_bank));
    study::ItemSelector skew_selector(skew_bank, skew);
    study::SessionShareTracker shares;
    for (int i = 0; i < 4; ++i) {
      shares.record(*skew_bank.find("a-0"));
    }
    study::TopicAbilityState a_topic;
    a_topic.topic_id = "a";
    study::SelectionContext context;
    context.shares = &shares;
    std::uint64_t rng = 9;
    auto result = skew_selector.select_next(a_topic, {"a-0"}, context, rng);
    suite.require(std::get<study::Selection>(result).reason == "blueprint_relaxed",
                  "Blueprint window should relax only as the last resort");
  }

  {
    study::SelectionContext context;
    context.mastery_probability = 0.9;
    std::uint64_t rng = 11;
    auto result = selector.select_next(topic, pool, context, rng);
    const auto& selection = std::get<study::Selection>(result);
    suite.require(selection.reason == "probe", "Near-mastery topics should be probed");
    suite.require(selection.item.item_id == "t-04",
                  "Probe items must lie within 0.3 logits of theta");

    study::TopicAbilityState probed = topic;
    study::ResponseRecord record;
    record.item_id = "t-04";
    probed.responses.push_back(record);
    probed.probes.push_back({"t-04", 0, true});
    suite.require(study::has_fresh_successful_probe(probed, selector.config()),
                  "A recent successful probe should be fresh");
    auto unrestricted = selector.select_next(probed, pool, context, rng);
    suite.require(std::get<study::Selection>(unrestricted).reason == "randomesque_top5",
                  "A fresh successful probe lifts the probe restriction");

    for (int i = 0; i < 5; ++i) {
      probed.responses.push_back(record);
    }
    suite.require(!study::fresh_probe(probed, selector.config()).has_value(),
                  "Probes older than the last five responses are stale");

    study::SelectorConfig short_memory;
    short_memory.probe_history_limit = 3;
    study::TopicAbilityState trimmed = topic;
    for (std::size_t i = 0; i < 10; ++i) {
      trimmed.responses.push_back(record);
      study::record_probe(trimmed, {"t-04", i, i == 9}, short_memory);
    }
    suite.require(trimmed.probes.size() == 3 && trimmed.probes.front().response_index == 7,
                  "Probe history should keep only the latest entries");
    suite.require(study::has_fresh_successful_probe(trimmed, short_memory),
                  "Trimming should keep the latest probe usable");
  }

  {
    study::LearnerState learner;
    for (const auto& id : pool) {
      learner.exposure[id].item_id = id;
      learner.exposure[id].presented_at.push_back(kEpoch - kHour);
    }
    study::SelectionContext context;
    context.learner = &learner;
    context.now = kEpoch;
    std::uint64_t rng = 5;
    auto with_ghost = pool;
    with_ghost.push_back("ghost");
    auto result = selector.select_next(topic, with_ghost, context, rng);
    auto* none = std::get_if<study::NoEligibleItem>(&result);
    suite.require(none != nullptr, "Fully capped pool should report no eligible item");
    if (none) {
      suite.require(none->capped == pool.size(), "Every capped item should be counted");
      suite.require(none->missing_items.size() == 1 && none->missing_items[0] == "ghost",
                    "Unknown candidate ids should be reported");
    }
  }

  suite.require(near(selector.fatigue_scalar(50.0), 0.8, 1e-12) &&
                    selector.fatigue_scalar(30.0) == 1.0,
                "Utility should be scaled down after 45 minutes");

  if (!suite.ok) {
    std::cerr << "Exposure and selector tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Exposure and selector tests passed" << std::endl;
  return 0;
}
