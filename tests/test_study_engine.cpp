#include "study/study_engine.hpp"
#include "study/exposure_controller.hpp"
#include "study/item_selector.hpp"
#include "study/retention_queue.hpp"

#include "../src/json_bridge.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

using study::testing::TestSuite;
using study::testing::SimulatedLearner;
using study::testing::kEpoch;
using study::testing::make_item;
using study::testing::near;
using study::testing::report_for;
using study::testing::run_session;

namespace {

std::unique_ptr<study::StudyEngine> make_test_engine(
    const std::shared_ptr<study::MemorySink>& sink,
    study::ItemBank bank = study::testing::two_topic_bank(),
    study::BlueprintConfig blueprint = study::testing::seventy_thirty()) {
  study::EngineConfig config;
  config.telemetry.asynchronous = false;
  return study::make_engine(std::move(bank), std::move(blueprint), config, sink);
}

study::SessionSpec make_spec(const std::string& learner_id, std::uint64_t seed) {
  study::SessionSpec spec;
  spec.learner_id = learner_id;
  spec.seed = seed;
  return spec;
}

template <typename Fn>
bool throws_invalid_argument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  TestSuite suite;
  const SimulatedLearner sim{0.5};

  {
    auto sink = std::make_shared<study::MemorySink>();
    auto engine = make_test_engine(sink);
    study::LearnerState learner;
    auto spec = make_spec("ana", 7);
    spec.max_items = 5;
    const auto session = engine->create_session(spec, learner);
    suite.require(session == "sess-1", "Session ids should be sequential");
    suite.require(learner.learner_id == "ana", "An empty learner state should adopt the learner id");

    auto run = run_session(*engine, session, learner, sim, kEpoch);
    suite.require(run.finished, "Item-limited session should finish");
    suite.require(run.presentations.size() == 5, "Item limit should cap presentations");
    suite.require(run.summary.stop_reason == "item_limit", "Stop reason should be item_limit");
    suite.require(run.summary.training_items == 5 && run.summary.retention_items == 0,
                  "A fresh learner only sees training items");
    suite.require(run.presentations.front().presentation_id == "p-001" &&
                      run.presentations.back().presentation_id == "p-005",
                  "Presentation ids should count up");
    suite.require(near(run.summary.elapsed_minutes, 5.0, 1e-9),
                  "Elapsed time should follow the reported answer times");

    std::size_t responses = 0;
    for (const auto& kv : learner.topics) {
      responses += kv.second.responses.size();
    }
    suite.require(responses == 5, "Every training response should be recorded");

    const auto presented = sink->events_of(study::events::kItemPresented);
    const auto answered = sink->events_of(study::events::kItemResponse);
    const auto stops = sink->events_of(study::events::kSessionStop);
    suite.require(presented.size() == 5 && answered.size() == 5,
                  "Every presentation and response should be logged");
    suite.require(stops.size() == 1 && stops[0].payload["reason"] == "item_limit",
                  "Session stop should be logged with its reason");
    suite.require(answered[0].payload.contains("theta_after") &&
                      answered[0].payload.contains("se_after"),
                  "Response events should carry the updated estimate");
    const auto transitions = sink->events_of(study::events::kTopicTransition);
    suite.require(!transitions.empty() && transitions[0].payload["reason"] == "scheduler",
                  "The first topic should be announced as a scheduler transition");

    const auto all = sink->events();
    bool increasing = true;
    for (std::size_t i = 1; i < all.size(); ++i) {
      increasing = increasing && all[i].sequence > all[i - 1].sequence;
    }
    suite.require(increasing, "Telemetry sequence numbers should increase");
  }

  {
    auto run_once = [&]() {
      auto engine = make_test_engine(std::make_shared<study::MemorySink>());
      study::LearnerState learner;
      auto spec = make_spec("ana", 99);
      spec.max_items = 25;
      const auto session = engine->create_session(spec, learner);
      return run_session(*engine, session, learner, sim, kEpoch);
    };
    auto first = run_once();
    auto second = run_once();
    bool same = first.presentations.size() == second.presentations.size();
    for (std::size_t i = 0; same && i < first.presentations.size(); ++i) {
      same = first.presentations[i].item.item_id == second.presentations[i].item.item_id &&
             first.presentations[i].explanation.selection_reason ==
                 second.presentations[i].explanation.selection_reason;
    }
    suite.require(same, "Same seed and learner state should replay the same session");

    std::set<std::string> unique;
    for (const auto& p : first.presentations) {
      unique.insert(p.item.item_id);
    }
    suite.require(unique.size() == first.presentations.size(),
                  "Exposure caps should prevent repeats within a session");
  }

  {
    auto engine = make_test_engine(std::make_shared<study::MemorySink>());
    study::LearnerState learner;
    auto spec = make_spec("ana", 5);
    spec.max_items = 40;
    const auto session = engine->create_session(spec, learner);
    auto run = run_session(*engine, session, learner, sim, kEpoch);
    suite.require(run.finished, "Blueprint session should finish");
    suite.require(run.summary.stop_reason == "item_limit" ||
                      run.summary.stop_reason == "blueprint_satisfied",
                  "A 40-item session should end on the limit or a met blueprint");
    std::size_t cardio = 0;
    std::size_t training = 0;
    for (const auto& p : run.presentations) {
      if (p.lane == study::Lane::Training) {
        ++training;
        cardio += p.item.topic_id == "cardio" ? 1 : 0;
      }
    }
    if (training >= 20) {
      const double share = static_cast<double>(cardio) / static_cast<double>(training);
      suite.require(share >= 0.55 && share <= 0.85,
                    "Training mix should track the 70/30 blueprint");
    }
  }

  {
    auto engine = make_test_engine(std::make_shared<study::MemorySink>());
    study::LearnerState learner;
    auto spec = make_spec("ana", 11);
    spec.session_minutes = 10.0;
    const auto session = engine->create_session(spec, learner);
    auto run = run_session(*engine, session, learner, sim, kEpoch);
    suite.require(run.summary.stop_reason == "time_budget" && run.presentations.size() == 10,
                  "A 10-minute session of one-minute items should stop on time");
  }

  {
    auto engine = make_test_engine(std::make_shared<study::MemorySink>());
    study::LearnerState learner;
    const auto session = engine->create_session(make_spec("ana", 3), learner);

    suite.require(throws_invalid_argument([&]() {
                    study::ResponseReport report;
                    report.score_fraction = 1.0;
                    engine->submit_response(session, learner, report);
                  }),
                  "Submitting without an outstanding item should throw");

    auto first = engine->next_item(session, learner, kEpoch);
    auto again = engine->next_item(session, learner, kEpoch + 1000);
    const auto& a = std::get<study::ItemPresentation>(first);
    const auto& b = std::get<study::ItemPresentation>(again);
    suite.require(a.presentation_id == b.presentation_id && a.item.item_id == b.item.item_id,
                  "An unanswered item should be returned again");

    suite.require(throws_invalid_argument([&]() {
                    auto report = report_for(a, 1.0);
                    report.presentation_id = "p-999";
                    engine->submit_response(session, learner, report);
                  }),
                  "A response for another presentation should throw");

    study::LearnerState stranger;
    stranger.learner_id = "bob";
    suite.require(throws_invalid_argument([&]() { engine->next_item(session, stranger, kEpoch); }),
                  "Another learner's state should be rejected");
    suite.require(throws_invalid_argument([&]() { engine->next_item("sess-404", learner, kEpoch); }),
                  "Unknown sessions should be rejected");
    suite.require(throws_invalid_argument([&]() {
                    study::LearnerState anonymous;
                    engine->create_session(make_spec("", 1), anonymous);
                  }),
                  "Sessions without a learner id should be rejected");
    suite.require(throws_invalid_argument([&]() {
                    auto spec = make_spec("ana", 1);
                    spec.topics = {"dermatology"};
                    engine->create_session(spec, learner);
                  }),
                  "Unknown topics should be rejected");

    auto state = engine->debug_state(session);
    suite.require(state.contains("arms") && state.contains("topic_shares") &&
                      state.contains("retention") && state.contains("pending"),
                  "Debug state should expose scheduler, shares, retention and pending item");

    auto summary = engine->end_session(session, learner);
    suite.require(summary.stop_reason == "requested", "Explicit end should be reported");
    suite.require(throws_invalid_argument([&]() { engine->debug_state(session); }),
                  "Ended sessions should be released");
  }

  {
    auto sink = std::make_shared<study::MemorySink>();
    auto engine = make_test_engine(sink);
    study::LearnerState learner;
    learner.learner_id = "ben";
    study::RetentionCard card;
    card.card_id = study::card_id_for("c-05");
    card.item_id = "c-05";
    card.topic_id = "cardio";
    card.stability = 3.0;
    card.difficulty = 5.0;
    card.last_reviewed_at = kEpoch - 5 * study::kMsPerDay;
    card.due_at = kEpoch - 2 * study::kMsPerDay;
    learner.cards[card.card_id] = card;

    const auto session = engine->create_session(make_spec("ben", 4), learner);
    auto next = engine->next_item(session, learner, kEpoch);
    const auto presentation = std::get<study::ItemPresentation>(next);
    suite.require(presentation.lane == study::Lane::Retention &&
                      presentation.card_id.value_or("") == "card-c-05",
                  "Due retention cards should be served first");
    suite.require(presentation.explanation.selection_reason == "retention_due",
                  "Retention items should explain why they were served");

    engine->submit_response(session, learner, report_for(presentation, 0.0));
    suite.require(learner.cards["card-c-05"].lane == study::CardLane::Training &&
                      learner.cards["card-c-05"].lapse_count == 1,
                  "A missed review should send the card back to training");
    const auto retention_events = sink->events_of(study::events::kRetentionEvent);
    suite.require(retention_events.size() == 1 && retention_events[0].payload["result"] == "lapse",
                  "The lapse should be logged");

    auto summary = engine->end_session(session, learner);
    suite.require(summary.retention_items == 1 && summary.lapsed_cards.size() == 1 &&
                      summary.lapsed_cards[0] == "card-c-05",
                  "Summary should report the lapsed card");

    const auto lapse_bank = study::testing::two_topic_bank();
    study::ExposureController exposure(study::testing::seventy_thirty().resolved_for(lapse_bank));
    study::ItemSelector selector(lapse_bank, exposure);
    study::SelectionContext context;
    context.learner = &learner;
    context.now = kEpoch + study::kMsPerHour;
    std::uint64_t rng = 17;
    auto cooling = selector.select_next(learner.topic("cardio"), {"c-05"}, context, rng);
    suite.require(std::holds_alternative<study::NoEligibleItem>(cooling),
                  "A lapsed item stays behind the exposure cooldown right after review");

    context.now = kEpoch + 97 * study::kMsPerHour;
    auto reopened = selector.select_next(learner.topic("cardio"), {"c-05"}, context, rng);
    const auto* selection = std::get_if<study::Selection>(&reopened);
    suite.require(selection != nullptr && selection->item.item_id == "c-05",
                  "A lapsed item should be trainable again once the cooldown has passed");
  }

  {
    auto sink = std::make_shared<study::MemorySink>();
    auto engine = make_test_engine(sink);
    study::LearnerState learner;
    learner.learner_id = "dee";
    auto& cardio = learner.topic("cardio");
    cardio.theta = 1.2;
    cardio.se = 0.8;
    cardio.response_count = 20;
    cardio.psychometric_active = true;
    cardio.last_practiced_at = kEpoch - 2 * study::kMsPerDay;
    cardio.se_history = {0.9, 0.8};
    for (int i = 0; i < 20; ++i) {
      study::ResponseRecord record;
      record.item_id = study::testing::numbered_id("c", i);
      record.score_fraction = 1.0;
      record.category = 1;
      record.categories = 1;
      record.answered_at = kEpoch - 2 * study::kMsPerDay;
      cardio.responses.push_back(record);
    }

    auto spec = make_spec("dee", 3);
    spec.topics = {"cardio"};
    const auto session = engine->create_session(spec, learner);
    auto next = engine->next_item(session, learner, kEpoch);
    const auto probe = std::get<study::ItemPresentation>(next);
    suite.require(probe.explanation.selection_reason == "probe",
                  "A topic near mastery should be probed before handoff");
    suite.require(std::fabs(probe.item.difficulty - 1.2) <= 0.3,
                  "The probe should sit near the ability estimate");

    const SimulatedLearner strong{2.0};
    engine->submit_response(session, learner, report_for(probe, strong.answer(probe.item)));
    const auto card_id = study::card_id_for(probe.item.item_id);
    suite.require(learner.cards.count(card_id) == 1, "Confirmed mastery should create a card");
    suite.require(learner.in_retention_lane(probe.item.item_id),
                  "The probe item should be frozen into the retention lane");
    suite.require(learner.topics["cardio"].handed_off, "The topic should be marked handed off");
    suite.require(learner.topics["cardio"].cooldown_until.has_value(),
                  "A stopped topic should cool down");
    bool logged = false;
    for (const auto& event : sink->events_of(study::events::kRetentionEvent)) {
      logged = logged || event.payload["result"] == "handoff";
    }
    suite.require(logged, "The handoff should be logged");

    auto summary = engine->end_session(session, learner);
    suite.require(summary.cards_created.size() == 1 && summary.cards_created[0] == card_id,
                  "Summary should list the created card");
    suite.require(!summary.topics.empty() && summary.topics[0].handed_off &&
                      summary.topics[0].stop_reason.value_or("") == "mastery",
                  "Topic summary should record the mastery stop");

    const auto json = study::bridge::to_json(learner);
    const auto restored = study::bridge::learner_state_from_json(json);
    suite.require(study::bridge::to_json(restored) == json,
                  "Learner state should survive a JSON round trip");
    suite.require(restored.cards.at(card_id).lane == study::CardLane::Retention,
                  "Card lanes should be restored");
  }

  {
    auto sink = std::make_shared<study::MemorySink>();
    auto broken = make_item("g-0", "glitch", std::numeric_limits<double>::quiet_NaN());
    auto engine = make_test_engine(sink, study::ItemBank(1, {broken}), study::BlueprintConfig{});
    study::LearnerState learner;
    const auto session = engine->create_session(make_spec("eve", 1), learner);
    auto run = run_session(*engine, session, learner, sim, kEpoch);
    suite.require(run.presentations.size() == 1, "The single item should be served once");
    suite.require(sink->events_of(study::events::kDegenerateUpdate).size() == 1,
                  "A collapsed likelihood should be reported");
    suite.require(learner.topics["glitch"].theta == 0.0 &&
                      learner.topics["glitch"].responses.back().degenerate,
                  "The degenerate response should not move the estimate");
    suite.require(run.summary.stop_reason == "exhausted",
                  "A session with nothing left to serve should end as exhausted");
    bool warned = false;
    for (const auto& event : sink->events_of(study::events::kEngineWarning)) {
      warned = warned || event.payload["issue"] == "no_eligible_item";
    }
    suite.require(warned, "Running out of items should raise a warning");
  }

  {
    auto engine = make_test_engine(std::make_shared<study::MemorySink>());
    study::LearnerState first_learner;
    const auto pinned = engine->create_session(make_spec("ana", 1), first_learner);
    engine->next_item(pinned, first_learner, kEpoch);

    engine->publish_item_bank(study::testing::two_topic_bank(2));
    suite.require(engine->item_bank_version() == 2, "Published bank should become current");
    suite.require(engine->debug_state(pinned)["item_bank_version"] == 1,
                  "Running sessions should keep their item bank");

    study::LearnerState second_learner;
    const auto fresh = engine->create_session(make_spec("bob", 1), second_learner);
    suite.require(engine->debug_state(fresh)["item_bank_version"] == 2,
                  "New sessions should use the published bank");
    suite.require(engine->end_session(pinned, first_learner).item_bank_version == 1,
                  "Summary should name the pinned bank version");
  }

  {
    study::EngineConfig config;
    config.selector.top_k = 3;
    config.telemetry.asynchronous = false;
    const auto json = study::bridge::to_json(config);
    const auto parsed = study::bridge::engine_config_from_json(json);
    suite.require(parsed.selector.top_k == 3 && !parsed.telemetry.asynchronous,
                  "Engine config should parse its own JSON");
    suite.require(study::bridge::to_json(parsed) == json, "Engine config JSON should round trip");

    auto partial = study::bridge::engine_config_from_json({{"scheduler", {{"stop_se", 0.25}}}});
    suite.require(near(partial.scheduler.stop_se, 0.25, 1e-12) &&
                      partial.scheduler.stop_min_attempts == 12,
                  "Missing config fields should keep their defaults");

    const nlohmann::json bank_json = {
        {"version", 3},
        {"items",
         {{{"item_id", "x"}, {"topic_id", "t"}, {"category_thresholds", {-0.5, 0.5}}},
          {{"item_id", "y"}, {"topic_id", "t"}, {"system_id", "s"}, {"difficulty", 1.0}}}}};
    const auto bank = study::bridge::item_bank_from_json(bank_json);
    suite.require(bank.version() == 3 && bank.size() == 2, "Item bank JSON should load");
    suite.require(bank.find("x")->score_categories == 2,
                  "Score categories should default to the threshold count");

    const auto blueprint =
        study::bridge::blueprint_from_json({{"topics", {{"cardio", 0.6}}}, {"systems", {{"heart", 0.5}}}});
    suite.require(near(*blueprint.target(study::BlueprintLevel::Topic, "cardio"), 0.6, 1e-12) &&
                      near(*blueprint.target(study::BlueprintLevel::System, "heart"), 0.5, 1e-12),
                  "Blueprint JSON should load both levels");

    suite.require(throws_invalid_argument([]() {
                    study::bridge::item_bank_from_json({{"items", {{{"topic_id", "t"}}}}});
                  }),
                  "Items without an id should be rejected");
  }

  if (!suite.ok) {
    std::cerr << "Study engine tests FAILED" << std::endl;
    return 1;
  }
  std::cout << "Study engine tests passed" << std::endl;
  return 0;
}
