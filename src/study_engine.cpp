#include "study/study_engine.hpp"

#include "study/ability_model.hpp"
#include "study/exposure_controller.hpp"
#include "study/item_selector.hpp"
#include "study/retention_queue.hpp"
#include "study/topic_scheduler.hpp"
#include "debug_log.hpp"
#include "json_bridge.hpp"
#include "psychometrics/pcm.hpp"
#include "rng.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace study {
namespace {

std::string make_presentation_id(std::size_t index) {
  std::ostringstream oss;
  oss << "p-";
  oss.width(3);
  oss.fill('0');
  oss << index + 1;
  return oss.str();
}

bool engine_debug() {
  static const bool enabled = debug_flag_enabled("STUDY_DEBUG_ENGINE");
  return enabled;
}

// Every component bound to one item bank snapshot. Sessions share it
// read-only for their whole lifetime.
struct Snapshot {
  Snapshot(ItemBank bank_in, const BlueprintConfig& blueprint, const EngineConfig& config)
      : bank(std::move(bank_in)),
        exposure(blueprint.resolved_for(bank), config.exposure),
        ability(bank, config.ability),
        selector(bank, exposure, config.selector),
        scheduler(exposure, config.scheduler),
        retention(bank, config.retention) {}

  Snapshot(const Snapshot&) = delete;
  Snapshot& operator=(const Snapshot&) = delete;

  ItemBank bank;
  ExposureController exposure;
  AbilityModel ability;
  ItemSelector selector;
  TopicScheduler scheduler;
  RetentionQueue retention;
};

struct PendingItem {
  ItemPresentation presentation;
  double theta_before = 0.0;
  double se_before = 0.0;
  bool answered = false;
};

// Consecutive training items on one topic.
struct TopicStint {
  std::string topic_id;
  double se_start = 0.0;
  double expected_delta_se = 0.0;
  double minutes = 0.0;
  std::size_t items = 0;
};

struct SessionData {
  std::string id;
  SessionSpec spec;
  std::shared_ptr<const Snapshot> snapshot;
  std::uint64_t rng_state = 0;
  double session_minutes = 0.0;
  std::vector<std::string> topics;

  bool started = false;
  TimestampMs started_at = 0;
  TimestampMs last_seen = 0;

  SessionShareTracker shares;
  std::map<std::string, SchedulerArm> arms;
  std::set<std::string> exhausted;
  std::optional<TopicStint> stint;
  std::string last_topic;

  RetentionPlan retention_plan;
  double retention_fraction = 0.0;
  std::size_t retention_cursor = 0;
  double training_seconds = 0.0;
  double retention_seconds = 0.0;

  std::optional<PendingItem> pending;
  std::size_t presented = 0;
  std::size_t training_items = 0;
  std::size_t retention_items = 0;

  std::map<std::string, TopicSessionSummary> topic_summaries;
  std::set<std::string> mastered_topics;
  std::vector<std::string> cards_created;
  std::vector<std::string> lapsed_cards;

  bool finished = false;
  SessionSummary summary;
};

class StudyEngineImpl : public StudyEngine {
public:
  StudyEngineImpl(ItemBank bank, BlueprintConfig blueprint, EngineConfig config,
                  std::shared_ptr<TelemetrySink> sink)
      : blueprint_(std::move(blueprint)),
        config_(std::move(config)),
        telemetry_(std::move(sink), config_.telemetry) {
    if (config_.ability.se_history_limit < config_.scheduler.plateau_window) {
      throw std::invalid_argument("EngineConfig: se_history_limit must cover the plateau window");
    }
    current_ = std::make_shared<const Snapshot>(std::move(bank), blueprint_, config_);
  }

  std::string create_session(const SessionSpec& spec, LearnerState& learner) override {
    if (spec.learner_id.empty() && learner.learner_id.empty()) {
      throw std::invalid_argument("Session needs a learner id");
    }
    if (!spec.learner_id.empty() && !learner.learner_id.empty() &&
        spec.learner_id != learner.learner_id) {
      throw std::invalid_argument("Learner state '" + learner.learner_id +
                                  "' does not match session learner '" + spec.learner_id + "'");
    }
    if (learner.learner_id.empty()) {
      learner.learner_id = spec.learner_id;
    }

    auto snapshot = current_snapshot();
    SessionData session;
    session.id = "sess-" + std::to_string(next_session_id_++);
    session.spec = spec;
    session.spec.learner_id = learner.learner_id;
    session.snapshot = snapshot;
    session.rng_state = spec.seed;
    session.session_minutes =
        spec.session_minutes > 0.0 ? spec.session_minutes : config_.default_session_minutes;

    if (spec.topics.empty()) {
      session.topics = snapshot->bank.topics();
    } else {
      for (const auto& topic : spec.topics) {
        if (snapshot->bank.items_for_topic(topic).empty()) {
          throw std::invalid_argument("Unknown topic for session: " + topic);
        }
        if (std::find(session.topics.begin(), session.topics.end(), topic) == session.topics.end()) {
          session.topics.push_back(topic);
        }
      }
    }
    if (session.topics.empty()) {
      throw std::invalid_argument("Item bank has no topics to study");
    }

    const std::string id = session.id;
    sessions_.emplace(id, std::move(session));
    if (engine_debug()) {
      debug_line("engine", "created " + id + " for learner '" + learner.learner_id +
                               "' on item bank v" + std::to_string(snapshot->bank.version()));
    }
    return id;
  }

  Next next_item(const std::string& session_id, LearnerState& learner, TimestampMs now) override {
    auto& session = get_session(session_id);
    check_learner(session, learner);
    if (session.finished) {
      return session.summary;
    }
    if (session.pending && !session.pending->answered) {
      return session.pending->presentation;
    }
    ensure_started(session, learner, now);
    session.last_seen = std::max(session.last_seen, now);
    return advance(session, learner, now);
  }

  Next submit_response(const std::string& session_id, LearnerState& learner,
                       const ResponseReport& report) override {
    auto& session = get_session(session_id);
    check_learner(session, learner);
    if (session.finished) {
      throw std::invalid_argument("Session already finished: " + session_id);
    }
    if (!session.pending || session.pending->answered) {
      throw std::invalid_argument("No outstanding item for session: " + session_id);
    }
    auto& pending = *session.pending;
    if (!report.presentation_id.empty() &&
        report.presentation_id != pending.presentation.presentation_id) {
      throw std::invalid_argument("Response for unknown presentation: " + report.presentation_id);
    }
    if (!report.item_id.empty() && report.item_id != pending.presentation.item.item_id) {
      throw std::invalid_argument("Response for item '" + report.item_id +
                                  "' but outstanding item is '" +
                                  pending.presentation.item.item_id + "'");
    }

    const ItemMetadata& item = pending.presentation.item;
    const double seconds =
        report.latency_ms > 0 ? static_cast<double>(report.latency_ms) / 1000.0 : item.median_time_sec;
    TimestampMs now = report.answered_at;
    if (now <= 0) {
      now = pending.presentation.presented_at + static_cast<TimestampMs>(seconds * 1000.0);
    }
    session.last_seen = std::max(session.last_seen, now);

    if (pending.presentation.lane == Lane::Retention) {
      handle_retention_response(session, learner, pending, report, seconds, now);
    } else {
      handle_training_response(session, learner, pending, report, seconds, now);
    }
    pending.answered = true;
    return advance(session, learner, now);
  }

  SessionSummary end_session(const std::string& session_id, LearnerState& learner) override {
    auto& session = get_session(session_id);
    check_learner(session, learner);
    if (!session.finished) {
      finish(session, learner, SessionStopReason::Requested, session.last_seen);
    }
    SessionSummary summary = session.summary;
    sessions_.erase(session_id);
    return summary;
  }

  nlohmann::json debug_state(const std::string& session_id) override {
    auto& session = get_session(session_id);
    const auto& snap = *session.snapshot;
    nlohmann::json state = nlohmann::json::object();
    state["session_id"] = session.id;
    state["learner_id"] = session.spec.learner_id;
    state["item_bank_version"] = snap.bank.version();
    state["rng_state"] = session.rng_state;
    state["started"] = session.started;
    state["finished"] = session.finished;
    state["elapsed_minutes"] = elapsed_minutes(session, session.last_seen);
    state["training_seconds"] = session.training_seconds;
    state["retention_seconds"] = session.retention_seconds;
    state["presented"] = session.presented;
    state["active_topic"] = session.stint ? nlohmann::json(session.stint->topic_id) : nlohmann::json();

    nlohmann::json arms = nlohmann::json::object();
    for (const auto& kv : session.arms) {
      arms[kv.first] = {{"mean", kv.second.mean},
                        {"variance", kv.second.variance},
                        {"observations", kv.second.observations}};
    }
    state["arms"] = arms;

    nlohmann::json shares = nlohmann::json::object();
    for (const auto& kv : session.shares.counts(BlueprintLevel::Topic)) {
      shares[kv.first] = {{"count", kv.second},
                          {"share", session.shares.share(BlueprintLevel::Topic, kv.first)},
                          {"target", snap.exposure.blueprint()
                                         .target(BlueprintLevel::Topic, kv.first)
                                         .value_or(0.0)}};
    }
    state["topic_shares"] = shares;
    state["exhausted_topics"] = session.exhausted;
    state["mastered_topics"] = session.mastered_topics;

    nlohmann::json retention = nlohmann::json::object();
    retention["budget_minutes"] = session.retention_plan.budget_minutes;
    retention["planned_minutes"] = session.retention_plan.planned_minutes;
    retention["extended_budget"] = session.retention_plan.extended_budget;
    retention["cursor"] = session.retention_cursor;
    nlohmann::json queue = nlohmann::json::array();
    for (const auto& queued : session.retention_plan.queue) {
      queue.push_back(queued.card_id);
    }
    retention["queue"] = queue;
    state["retention"] = retention;

    if (session.pending) {
      state["pending"] = {{"presentation_id", session.pending->presentation.presentation_id},
                          {"item_id", session.pending->presentation.item.item_id},
                          {"answered", session.pending->answered}};
    }
    if (session.finished) {
      state["summary"] = bridge::to_json(session.summary);
    }
    const auto stats = telemetry_.stats();
    state["telemetry"] = {{"emitted", stats.emitted},
                          {"written", stats.written},
                          {"retries", stats.retries},
                          {"dropped", stats.dropped()}};
    return state;
  }

  void publish_item_bank(ItemBank bank) override {
    auto snapshot = std::make_shared<const Snapshot>(std::move(bank), blueprint_, config_);
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (engine_debug()) {
      debug_line("engine", "publishing item bank v" + std::to_string(snapshot->bank.version()) +
                               " (was v" + std::to_string(current_->bank.version()) + ")");
    }
    current_ = std::move(snapshot);
  }

  std::uint64_t item_bank_version() const override {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_->bank.version();
  }

  TelemetryStats telemetry_stats() const override { return telemetry_.stats(); }

  void flush_telemetry() override { telemetry_.flush(); }

private:
  std::shared_ptr<const Snapshot> current_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return current_;
  }

  SessionData& get_session(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
      throw std::invalid_argument("Unknown session id: " + session_id);
    }
    return it->second;
  }

  void check_learner(const SessionData& session, const LearnerState& learner) const {
    if (learner.learner_id != session.spec.learner_id) {
      throw std::invalid_argument("Learner state '" + learner.learner_id +
                                  "' does not belong to session " + session.id);
    }
  }

  static double elapsed_minutes(const SessionData& session, TimestampMs now) {
    if (!session.started) {
      return 0.0;
    }
    return std::max(0.0, static_cast<double>(now - session.started_at) /
                             static_cast<double>(kMsPerMinute));
  }

  void emit(const std::string& type, nlohmann::json payload) {
    telemetry_.emit(type, std::move(payload));
  }

  void warn(const SessionData& session, EngineIssue issue, nlohmann::json payload) {
    payload["session_id"] = session.id;
    payload["issue"] = to_string(issue);
    if (engine_debug()) {
      debug_line("engine", "warning " + payload.dump());
    }
    emit(events::kEngineWarning, std::move(payload));
  }

  void ensure_started(SessionData& session, LearnerState& learner, TimestampMs now) {
    if (session.started) {
      return;
    }
    const auto& snap = *session.snapshot;
    session.started = true;
    session.started_at = session.spec.started_at > 0 ? session.spec.started_at : now;
    session.last_seen = session.started_at;

    for (const auto& topic : session.topics) {
      const TopicAbilityState* state = learner.find_topic(topic);
      const TopicHistory* history = nullptr;
      auto hist = learner.history.find(topic);
      if (hist != learner.history.end()) {
        history = &hist->second;
      }
      session.arms[topic] = snap.scheduler.initial_arm(topic, state, history, session.started_at);

      TopicSessionSummary summary;
      summary.topic_id = topic;
      if (state) {
        summary.theta_start = summary.theta = state->theta;
        summary.se_start = summary.se = state->se;
      } else {
        TopicAbilityState fresh;
        summary.theta_start = summary.theta = fresh.theta;
        summary.se_start = summary.se = fresh.se;
      }
      summary.mastery_probability = snap.ability.mastery_probability(summary.theta, summary.se);
      session.topic_summaries[topic] = summary;
    }

    session.retention_plan =
        snap.retention.build_queue(learner.cards, session.session_minutes, session.started_at);
    session.retention_fraction = session.retention_plan.extended_budget
                                     ? snap.retention.config().extended_budget_fraction
                                     : snap.retention.config().default_budget_fraction;
    for (const auto& item_id : session.retention_plan.missing_items) {
      warn(session, EngineIssue::MissingItemMetadata, {{"item_id", item_id}, {"lane", "retention"}});
    }
    if (engine_debug()) {
      debug_line("engine", session.id + " started with " + std::to_string(session.topics.size()) +
                               " topics, " + std::to_string(session.retention_plan.queue.size()) +
                               " retention cards queued");
    }
  }

  std::optional<SessionStopReason> stop_reason(const SessionData& session, double elapsed) const {
    const auto& scheduler = session.snapshot->scheduler;
    if (session.spec.max_items && session.presented >= *session.spec.max_items) {
      return SessionStopReason::ItemLimit;
    }
    if (scheduler.fatigued(elapsed, static_cast<int>(session.mastered_topics.size()))) {
      return SessionStopReason::Fatigue;
    }
    if (elapsed >= session.session_minutes) {
      return SessionStopReason::TimeBudget;
    }
    return std::nullopt;
  }

  Next advance(SessionData& session, LearnerState& learner, TimestampMs now) {
    const double elapsed = elapsed_minutes(session, now);
    if (auto reason = stop_reason(session, elapsed)) {
      return finish(session, learner, *reason, now);
    }
    if (auto presentation = next_retention(session, learner, now)) {
      return *presentation;
    }

    const auto& snap = *session.snapshot;
    for (;;) {
      std::vector<TopicStats> stats;
      stats.reserve(session.topics.size());
      for (const auto& topic : session.topics) {
        stats.push_back({topic, learner.find_topic(topic), session.exhausted.count(topic) > 0});
      }
      auto choice = snap.scheduler.choose_next_topic(session.arms, stats, session.shares, now,
                                                     session.rng_state);
      if (!choice) {
        return finish(session, learner, SessionStopReason::Exhausted, now);
      }
      if (choice->fallback) {
        if (session.shares.total() > 0 && snap.exposure.all_targets_within_window(session.shares)) {
          return finish(session, learner, SessionStopReason::BlueprintSatisfied, now);
        }
        warn(session, EngineIssue::NoEligibleTopic, {{"fallback_topic", choice->topic_id}});
      }

      const TopicAbilityState& state = learner.topic(choice->topic_id);
      std::vector<std::string> pool;
      for (const ItemMetadata* item : snap.bank.items_for_topic(choice->topic_id)) {
        pool.push_back(item->item_id);
      }
      SelectionContext context;
      context.learner = &learner;
      context.shares = &session.shares;
      context.elapsed_minutes = elapsed;
      context.now = now;
      context.mastery_probability = snap.ability.mastery_probability(state.theta, state.se);

      auto result = snap.selector.select_next(state, pool, context, session.rng_state);
      if (auto* none = std::get_if<NoEligibleItem>(&result)) {
        for (const auto& item_id : none->missing_items) {
          warn(session, EngineIssue::MissingItemMetadata, {{"item_id", item_id}});
        }
        session.exhausted.insert(choice->topic_id);
        warn(session, EngineIssue::NoEligibleItem,
             {{"topic_id", choice->topic_id},
              {"candidates", none->candidates},
              {"exposure_capped", none->capped}});
        continue;
      }
      auto& selection = std::get<Selection>(result);
      for (const auto& item_id : selection.missing_items) {
        warn(session, EngineIssue::MissingItemMetadata, {{"item_id", item_id}});
      }
      switch_topic(session, learner, *choice);
      return present_training(session, learner, selection, *choice, now);
    }
  }

  std::optional<ItemPresentation> next_retention(SessionData& session, LearnerState& learner,
                                                 TimestampMs now) {
    const auto& snap = *session.snapshot;
    const auto& plan = session.retention_plan;
    while (session.retention_cursor < plan.queue.size()) {
      const double total = session.training_seconds + session.retention_seconds;
      if (session.retention_seconds > session.retention_fraction * total) {
        return std::nullopt;
      }
      const QueuedCard& queued = plan.queue[session.retention_cursor];
      auto card = learner.cards.find(queued.card_id);
      const ItemMetadata* item = snap.bank.find(queued.item_id);
      if (card == learner.cards.end() || card->second.lane != CardLane::Retention || !item) {
        ++session.retention_cursor;
        continue;
      }
      if ((session.retention_seconds + item->median_time_sec) / 60.0 > plan.budget_minutes) {
        session.retention_cursor = plan.queue.size();
        return std::nullopt;
      }
      ++session.retention_cursor;

      if (session.last_topic != queued.topic_id) {
        emit(events::kTopicTransition, {{"session_id", session.id},
                                        {"from_topic", session.last_topic},
                                        {"to_topic", queued.topic_id},
                                        {"reason", "retention"},
                                        {"expected_delta_se", 0.0},
                                        {"actual_delta_se", 0.0}});
      }

      const TopicAbilityState& state = learner.topic(queued.topic_id);
      ItemPresentation presentation;
      presentation.session_id = session.id;
      presentation.presentation_id = make_presentation_id(session.presented);
      presentation.item = *item;
      presentation.lane = Lane::Retention;
      presentation.card_id = queued.card_id;
      presentation.presented_at = now;
      presentation.explanation.theta = state.theta;
      presentation.explanation.se = state.se;
      presentation.explanation.mastery_probability =
          snap.ability.mastery_probability(state.theta, state.se);
      presentation.explanation.blueprint_gap =
          snap.exposure.blueprint_gap(session.shares, BlueprintLevel::Topic, queued.topic_id);
      presentation.explanation.urgency_multiplier = 1.0;
      presentation.explanation.item_info = psychometrics::item_information(state.theta, *item);
      presentation.explanation.selection_reason = "retention_due";

      const std::size_t exposure_count = snap.exposure.exposure_count(learner, item->item_id, now);
      snap.exposure.record_exposure(learner, *item, now);
      emit(events::kItemPresented,
           {{"session_id", session.id},
            {"item_id", item->item_id},
            {"topic_id", item->topic_id},
            {"system_id", item->system_id},
            {"theta_before", state.theta},
            {"se_before", state.se},
            {"blueprint_share", session.shares.share(BlueprintLevel::Topic, item->topic_id)},
            {"exposure_count", exposure_count},
            {"lane", to_string(Lane::Retention)},
            {"card_id", queued.card_id}});

      PendingItem pending;
      pending.presentation = presentation;
      pending.theta_before = state.theta;
      pending.se_before = state.se;
      session.pending = std::move(pending);
      session.last_topic = queued.topic_id;
      ++session.presented;
      ++session.retention_items;
      return presentation;
    }
    return std::nullopt;
  }

  // Folds the finished stint into the learner's aggregated history and
  // returns the SE reduction achieved during it.
  double close_stint(SessionData& session, LearnerState& learner) {
    if (!session.stint) {
      return 0.0;
    }
    const TopicStint stint = *session.stint;
    session.stint.reset();
    const TopicAbilityState* state = learner.find_topic(stint.topic_id);
    const double actual = state ? stint.se_start - state->se : 0.0;
    if (stint.minutes > 0.0) {
      auto& history = learner.history[stint.topic_id];
      const double n = static_cast<double>(history.observations);
      history.mean_delta_se_per_min =
          (history.mean_delta_se_per_min * n + actual / stint.minutes) / (n + 1.0);
      history.observations += 1;
    }
    return actual;
  }

  void switch_topic(SessionData& session, LearnerState& learner, const TopicChoice& choice) {
    if (session.stint && session.stint->topic_id == choice.topic_id) {
      return;
    }
    const std::string from = session.stint ? session.stint->topic_id : session.last_topic;
    const double actual = close_stint(session, learner);

    TopicStint stint;
    stint.topic_id = choice.topic_id;
    stint.se_start = learner.topic(choice.topic_id).se;
    stint.expected_delta_se = choice.expected_delta_se;
    session.stint = stint;

    emit(events::kTopicTransition, {{"session_id", session.id},
                                    {"from_topic", from},
                                    {"to_topic", choice.topic_id},
                                    {"reason", "scheduler"},
                                    {"expected_delta_se", choice.expected_delta_se},
                                    {"actual_delta_se", actual},
                                    {"fallback", choice.fallback}});
    if (engine_debug()) {
      debug_line("engine", session.id + " topic " + (from.empty() ? "<start>" : from) + " -> " +
                               choice.topic_id + " score=" + std::to_string(choice.score));
    }
  }

  ItemPresentation present_training(SessionData& session, LearnerState& learner,
                                    const Selection& selection, const TopicChoice& choice,
                                    TimestampMs now) {
    const auto& snap = *session.snapshot;
    const ItemMetadata& item = selection.item;
    const TopicAbilityState& state = learner.topic(item.topic_id);

    const std::size_t exposure_count = snap.exposure.exposure_count(learner, item.item_id, now);
    const double share = session.shares.share(BlueprintLevel::Topic, item.topic_id);

    ItemPresentation presentation;
    presentation.session_id = session.id;
    presentation.presentation_id = make_presentation_id(session.presented);
    presentation.item = item;
    presentation.lane = Lane::Training;
    presentation.presented_at = now;
    presentation.explanation.theta = state.theta;
    presentation.explanation.se = state.se;
    presentation.explanation.mastery_probability =
        snap.ability.mastery_probability(state.theta, state.se);
    presentation.explanation.blueprint_gap = choice.deficit;
    presentation.explanation.urgency_multiplier = choice.urgency;
    presentation.explanation.item_info = selection.information;
    presentation.explanation.selection_reason = selection.reason;

    snap.exposure.record_presentation(learner, session.shares, item, now);
    emit(events::kItemPresented, {{"session_id", session.id},
                                  {"item_id", item.item_id},
                                  {"topic_id", item.topic_id},
                                  {"system_id", item.system_id},
                                  {"theta_before", state.theta},
                                  {"se_before", state.se},
                                  {"blueprint_share", share},
                                  {"exposure_count", exposure_count},
                                  {"lane", to_string(Lane::Training)},
                                  {"utility", selection.utility},
                                  {"selection_reason", selection.reason}});

    PendingItem pending;
    pending.presentation = presentation;
    pending.theta_before = state.theta;
    pending.se_before = state.se;
    session.pending = std::move(pending);
    session.last_topic = item.topic_id;
    ++session.presented;
    ++session.training_items;
    return presentation;
  }

  void handle_training_response(SessionData& session, LearnerState& learner,
                                const PendingItem& pending, const ResponseReport& report,
                                double seconds, TimestampMs now) {
    const auto& snap = *session.snapshot;
    const auto& selector_config = snap.selector.config();
    const ItemMetadata& item = pending.presentation.item;

    const TopicAbilityState before = learner.topic(item.topic_id);
    auto result = snap.ability.update(before, item, report.score_fraction, now);
    for (const auto& item_id : result.psychometric.missing_items) {
      warn(session, EngineIssue::MissingItemMetadata, {{"item_id", item_id}, {"lane", "training"}});
    }

    auto& state = learner.topic(item.topic_id);
    state = std::move(result.state);
    if (result.degenerate) {
      emit(events::kDegenerateUpdate, {{"session_id", session.id},
                                       {"item_id", item.item_id},
                                       {"topic_id", item.topic_id},
                                       {"theta", state.theta},
                                       {"se", state.se},
                                       {"issue", to_string(EngineIssue::DegenerateLikelihood)}});
    } else if (is_probe_item(pending.theta_before, item, selector_config)) {
      ProbeRecord probe;
      probe.item_id = item.item_id;
      probe.response_index = state.responses.size() - 1;
      probe.success = report.score_fraction >= selector_config.probe_success_score;
      record_probe(state, std::move(probe), selector_config);
    }
    snap.exposure.record_score(learner, item.item_id, report.score_fraction);

    const double mastery = snap.ability.mastery_probability(state.theta, state.se);
    emit(events::kItemResponse, {{"session_id", session.id},
                                 {"item_id", item.item_id},
                                 {"score_fraction", report.score_fraction},
                                 {"theta_after", state.theta},
                                 {"se_after", state.se},
                                 {"mastery_probability", mastery},
                                 {"latency_ms", report.latency_ms},
                                 {"lane", to_string(Lane::Training)},
                                 {"estimate_source", to_string(result.source)}});

    session.training_seconds += seconds;
    const double minutes = seconds / 60.0;
    if (session.stint && session.stint->topic_id == item.topic_id) {
      session.stint->minutes += minutes;
      session.stint->items += 1;
    }
    auto arm = session.arms.find(item.topic_id);
    if (arm != session.arms.end() && minutes > 0.0 && !result.degenerate) {
      snap.scheduler.observe(arm->second, (pending.se_before - state.se) / minutes);
    }

    auto& summary = session.topic_summaries[item.topic_id];
    summary.topic_id = item.topic_id;
    summary.items += 1;
    summary.theta = state.theta;
    summary.se = state.se;
    summary.mastery_probability = mastery;

    const auto handoff = snap.retention.evaluate_handoff(state, mastery, selector_config);
    if (handoff == HandoffStatus::Ready) {
      const auto probe = fresh_probe(state, selector_config);
      const ItemMetadata* probe_item = probe ? snap.bank.find(probe->item_id) : nullptr;
      if (!probe_item) {
        warn(session, EngineIssue::MissingItemMetadata,
             {{"item_id", probe ? probe->item_id : std::string()}, {"lane", "handoff"}});
      } else {
        const RetentionCard card = snap.retention.hand_off(learner, item.topic_id, *probe_item, now);
        session.cards_created.push_back(card.card_id);
        session.mastered_topics.insert(item.topic_id);
        summary.handed_off = true;
        emit(events::kRetentionEvent, {{"session_id", session.id},
                                       {"card_id", card.card_id},
                                       {"due_at", card.due_at},
                                       {"answered_at", now},
                                       {"result", "handoff"},
                                       {"next_due", card.due_at}});
      }
    } else if (handoff == HandoffStatus::Deferred && engine_debug()) {
      debug_line("engine", session.id + " handoff for " + item.topic_id +
                               " deferred: too few responses");
    }

    auto& topic = learner.topic(item.topic_id);
    const auto stop = snap.scheduler.evaluate_topic_stop(
        topic, mastery, has_fresh_successful_probe(topic, selector_config));
    if (stop) {
      topic.cooldown_until = snap.scheduler.cooldown_until(now);
      summary.stop_reason = to_string(*stop);
      if (*stop == TopicStopReason::Mastery) {
        session.mastered_topics.insert(item.topic_id);
      }
      if (engine_debug()) {
        debug_line("engine", session.id + " topic " + item.topic_id + " stopped: " +
                                 to_string(*stop));
      }
    }
  }

  void handle_retention_response(SessionData& session, LearnerState& learner,
                                 const PendingItem& pending, const ResponseReport& report,
                                 double seconds, TimestampMs now) {
    const auto& snap = *session.snapshot;
    const ItemMetadata& item = pending.presentation.item;
    const std::string card_id = pending.presentation.card_id.value_or(card_id_for(item.item_id));
    const bool correct = report.score_fraction >= snap.selector.config().probe_success_score;

    const auto outcome = snap.retention.apply_review(learner, card_id, correct, now);
    snap.exposure.record_score(learner, item.item_id, report.score_fraction);
    session.retention_seconds += seconds;

    emit(events::kRetentionEvent, {{"session_id", session.id},
                                   {"card_id", card_id},
                                   {"due_at", outcome.before.due_at},
                                   {"answered_at", now},
                                   {"result", outcome.lapsed ? "lapse" : "recalled"},
                                   {"next_due", outcome.after.due_at},
                                   {"retrievability", outcome.retrievability},
                                   {"lane", to_string(outcome.after.lane)}});

    const TopicAbilityState& state = learner.topic(item.topic_id);
    emit(events::kItemResponse,
         {{"session_id", session.id},
          {"item_id", item.item_id},
          {"score_fraction", report.score_fraction},
          {"theta_after", state.theta},
          {"se_after", state.se},
          {"mastery_probability", snap.ability.mastery_probability(state.theta, state.se)},
          {"latency_ms", report.latency_ms},
          {"lane", to_string(Lane::Retention)}});

    if (outcome.lapsed) {
      session.lapsed_cards.push_back(card_id);
      session.mastered_topics.erase(item.topic_id);
      if (engine_debug()) {
        debug_line("engine", session.id + " card " + card_id + " lapsed, " + item.item_id +
                                 " returns to training");
      }
    }
  }

  SessionSummary finish(SessionData& session, LearnerState& learner, SessionStopReason reason,
                        TimestampMs now) {
    if (session.finished) {
      return session.summary;
    }
    const auto& snap = *session.snapshot;
    const std::string from = session.stint ? session.stint->topic_id : std::string();
    const double expected = session.stint ? session.stint->expected_delta_se : 0.0;
    const double actual = close_stint(session, learner);
    if (reason == SessionStopReason::Fatigue && !from.empty()) {
      emit(events::kTopicTransition, {{"session_id", session.id},
                                      {"from_topic", from},
                                      {"to_topic", ""},
                                      {"reason", "fatigue"},
                                      {"expected_delta_se", expected},
                                      {"actual_delta_se", actual}});
    }

    const double elapsed = elapsed_minutes(session, now);
    SessionSummary summary;
    summary.session_id = session.id;
    summary.learner_id = session.spec.learner_id;
    summary.item_bank_version = snap.bank.version();
    summary.training_items = session.training_items;
    summary.retention_items = session.retention_items;
    summary.elapsed_minutes = elapsed;
    summary.fatigue_index =
        snap.scheduler.fatigue_index(elapsed, static_cast<int>(session.mastered_topics.size()));
    summary.stop_reason = to_string(reason);
    for (const auto& kv : session.topic_summaries) {
      summary.topics.push_back(kv.second);
    }
    summary.cards_created = session.cards_created;
    summary.lapsed_cards = session.lapsed_cards;

    session.summary = summary;
    session.finished = true;
    emit(events::kSessionStop, {{"session_id", session.id},
                                {"reason", summary.stop_reason},
                                {"training_items", summary.training_items},
                                {"retention_items", summary.retention_items},
                                {"elapsed_minutes", summary.elapsed_minutes},
                                {"fatigue_index", summary.fatigue_index}});
    if (engine_debug()) {
      debug_line("engine", session.id + " stopped: " + summary.stop_reason);
    }
    return summary;
  }

  BlueprintConfig blueprint_;
  EngineConfig config_;
  TelemetryEmitter telemetry_;

  mutable std::mutex snapshot_mutex_;
  std::shared_ptr<const Snapshot> current_;

  std::unordered_map<std::string, SessionData> sessions_;
  std::uint64_t next_session_id_ = 1;
};

} // namespace

std::unique_ptr<StudyEngine> make_engine(ItemBank bank, BlueprintConfig blueprint,
                                         EngineConfig config,
                                         std::shared_ptr<TelemetrySink> sink) {
  return std::make_unique<StudyEngineImpl>(std::move(bank), std::move(blueprint), std::move(config),
                                           std::move(sink));
}

} // namespace study
