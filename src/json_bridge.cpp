#include "json_bridge.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <string_view>

namespace study::bridge {
namespace {

template <typename Setter>
bool assign_if_present(const nlohmann::json& obj, const char* key, Setter&& setter) {
  if (!obj.contains(key)) {
    return false;
  }
  const auto& value = obj[key];
  if (value.is_null()) {
    return false;
  }
  setter(value);
  return true;
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::int64_t json_to_int64(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<std::int64_t>();
  }
  if (value.is_number_float()) {
    return static_cast<std::int64_t>(std::llround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

std::size_t json_to_size(const nlohmann::json& value, std::string_view key) {
  const auto v = json_to_int64(value, key);
  if (v < 0) {
    throw std::invalid_argument("Expected non-negative integer for field '" + std::string(key) + "'");
  }
  return static_cast<std::size_t>(v);
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<double> json_to_double_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<number> for field '" + std::string(key) + "'");
  }
  std::vector<double> out;
  out.reserve(value.size());
  for (const auto& entry : value) {
    out.push_back(json_to_double(entry, key));
  }
  return out;
}

const nlohmann::json& require(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key) || obj[key].is_null()) {
    throw std::invalid_argument(std::string("Missing required field '") + key + "'");
  }
  return obj[key];
}

BlueprintLevel blueprint_level_from_string(const std::string& value) {
  if (value == "topic") {
    return BlueprintLevel::Topic;
  }
  if (value == "system") {
    return BlueprintLevel::System;
  }
  throw std::invalid_argument("Unknown blueprint level: " + value);
}

CardLane card_lane_from_string(const std::string& value) {
  if (value == "retention") {
    return CardLane::Retention;
  }
  if (value == "training") {
    return CardLane::Training;
  }
  throw std::invalid_argument("Unknown card lane: " + value);
}

nlohmann::json to_json(const ResponseRecord& record) {
  nlohmann::json json_record = nlohmann::json::object();
  json_record["item_id"] = record.item_id;
  json_record["score_fraction"] = record.score_fraction;
  json_record["category"] = record.category;
  json_record["categories"] = record.categories;
  json_record["answered_at"] = record.answered_at;
  json_record["degenerate"] = record.degenerate;
  return json_record;
}

ResponseRecord response_record_from_json(const nlohmann::json& json_record) {
  ResponseRecord record;
  record.item_id = json_to_string(require(json_record, "item_id"), "item_id");
  assign_if_present(json_record, "score_fraction",
                    [&](const nlohmann::json& v) { record.score_fraction = json_to_double(v, "score_fraction"); });
  assign_if_present(json_record, "category",
                    [&](const nlohmann::json& v) { record.category = json_to_int(v, "category"); });
  assign_if_present(json_record, "categories",
                    [&](const nlohmann::json& v) { record.categories = json_to_int(v, "categories"); });
  assign_if_present(json_record, "answered_at",
                    [&](const nlohmann::json& v) { record.answered_at = json_to_int64(v, "answered_at"); });
  assign_if_present(json_record, "degenerate",
                    [&](const nlohmann::json& v) { record.degenerate = json_to_bool(v, "degenerate"); });
  return record;
}

nlohmann::json to_json(const ExposureRecord& record) {
  nlohmann::json json_record = nlohmann::json::object();
  json_record["presented_at"] = record.presented_at;
  json_record["score_sum"] = record.score_sum;
  json_record["score_count"] = record.score_count;
  return json_record;
}

ExposureRecord exposure_record_from_json(const std::string& item_id, const nlohmann::json& json_record) {
  ExposureRecord record;
  record.item_id = item_id;
  assign_if_present(json_record, "presented_at", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Expected array for field 'presented_at'");
    }
    for (const auto& at : v) {
      record.presented_at.push_back(json_to_int64(at, "presented_at"));
    }
  });
  assign_if_present(json_record, "score_sum",
                    [&](const nlohmann::json& v) { record.score_sum = json_to_double(v, "score_sum"); });
  assign_if_present(json_record, "score_count",
                    [&](const nlohmann::json& v) { record.score_count = json_to_int(v, "score_count"); });
  return record;
}

} // namespace

nlohmann::json to_json(const ItemMetadata& item) {
  nlohmann::json json_item = nlohmann::json::object();
  json_item["item_id"] = item.item_id;
  json_item["topic_id"] = item.topic_id;
  json_item["system_id"] = item.system_id;
  json_item["difficulty"] = item.difficulty;
  json_item["category_thresholds"] = item.category_thresholds;
  json_item["median_time_sec"] = item.median_time_sec;
  json_item["score_categories"] = item.score_categories;
  json_item["calibration_count"] = item.calibration_count;
  return json_item;
}

ItemMetadata item_metadata_from_json(const nlohmann::json& json_item) {
  ItemMetadata item;
  item.item_id = json_to_string(require(json_item, "item_id"), "item_id");
  item.topic_id = json_to_string(require(json_item, "topic_id"), "topic_id");
  assign_if_present(json_item, "system_id",
                    [&](const nlohmann::json& v) { item.system_id = json_to_string(v, "system_id"); });
  assign_if_present(json_item, "difficulty",
                    [&](const nlohmann::json& v) { item.difficulty = json_to_double(v, "difficulty"); });
  assign_if_present(json_item, "category_thresholds", [&](const nlohmann::json& v) {
    item.category_thresholds = json_to_double_vector(v, "category_thresholds");
  });
  assign_if_present(json_item, "median_time_sec", [&](const nlohmann::json& v) {
    item.median_time_sec = json_to_double(v, "median_time_sec");
  });
  const bool has_categories = assign_if_present(json_item, "score_categories", [&](const nlohmann::json& v) {
    item.score_categories = json_to_int(v, "score_categories");
  });
  if (!has_categories && !item.category_thresholds.empty()) {
    item.score_categories = static_cast<int>(item.category_thresholds.size());
  }
  assign_if_present(json_item, "calibration_count", [&](const nlohmann::json& v) {
    item.calibration_count = json_to_int(v, "calibration_count");
  });
  return item;
}

nlohmann::json to_json(const ItemBank& bank) {
  nlohmann::json json_bank = nlohmann::json::object();
  json_bank["version"] = bank.version();
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : bank.items()) {
    items.push_back(to_json(item));
  }
  json_bank["items"] = items;
  return json_bank;
}

ItemBank item_bank_from_json(const nlohmann::json& json_bank) {
  std::uint64_t version = 1;
  const nlohmann::json* items = &json_bank;
  if (json_bank.is_object()) {
    assign_if_present(json_bank, "version", [&](const nlohmann::json& v) {
      version = static_cast<std::uint64_t>(json_to_size(v, "version"));
    });
    items = &require(json_bank, "items");
  }
  if (!items->is_array()) {
    throw std::invalid_argument("Item bank 'items' must be an array");
  }
  std::vector<ItemMetadata> parsed;
  parsed.reserve(items->size());
  for (const auto& entry : *items) {
    parsed.push_back(item_metadata_from_json(entry));
  }
  return ItemBank(version, std::move(parsed));
}

nlohmann::json to_json(const BlueprintConfig& blueprint) {
  nlohmann::json json_blueprint = nlohmann::json::object();
  nlohmann::json topics = nlohmann::json::object();
  for (const auto& kv : blueprint.level_targets(BlueprintLevel::Topic)) {
    topics[kv.first] = kv.second;
  }
  nlohmann::json systems = nlohmann::json::object();
  for (const auto& kv : blueprint.level_targets(BlueprintLevel::System)) {
    systems[kv.first] = kv.second;
  }
  json_blueprint["topics"] = topics;
  json_blueprint["systems"] = systems;
  return json_blueprint;
}

BlueprintConfig blueprint_from_json(const nlohmann::json& json_blueprint) {
  if (!json_blueprint.is_object()) {
    throw std::invalid_argument("Blueprint config must be a JSON object");
  }
  std::vector<BlueprintTarget> targets;
  auto read_level = [&](const char* key, BlueprintLevel level) {
    assign_if_present(json_blueprint, key, [&](const nlohmann::json& v) {
      if (!v.is_object()) {
        throw std::invalid_argument(std::string("Blueprint field '") + key + "' must be an object");
      }
      for (const auto& entry : v.items()) {
        targets.push_back({level, entry.key(), json_to_double(entry.value(), entry.key())});
      }
    });
  };
  read_level("topics", BlueprintLevel::Topic);
  read_level("systems", BlueprintLevel::System);

  assign_if_present(json_blueprint, "targets", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Blueprint field 'targets' must be an array");
    }
    for (const auto& entry : v) {
      BlueprintTarget target;
      target.level = blueprint_level_from_string(json_to_string(require(entry, "level"), "level"));
      target.key = json_to_string(require(entry, "key"), "key");
      target.target_share = json_to_double(require(entry, "target_share"), "target_share");
      targets.push_back(target);
    }
  });
  return BlueprintConfig(std::move(targets));
}

nlohmann::json to_json(const TopicAbilityState& state) {
  nlohmann::json json_state = nlohmann::json::object();
  json_state["topic_id"] = state.topic_id;
  json_state["theta"] = state.theta;
  json_state["se"] = state.se;
  json_state["response_count"] = state.response_count;
  json_state["elo_rating"] = state.elo_rating;
  json_state["last_practiced_at"] = state.last_practiced_at;
  json_state["prior_mean"] = state.prior_mean;
  json_state["psychometric_active"] = state.psychometric_active;
  nlohmann::json responses = nlohmann::json::array();
  for (const auto& record : state.responses) {
    responses.push_back(to_json(record));
  }
  json_state["responses"] = responses;
  json_state["se_history"] = state.se_history;
  nlohmann::json probes = nlohmann::json::array();
  for (const auto& probe : state.probes) {
    probes.push_back({{"item_id", probe.item_id},
                      {"response_index", probe.response_index},
                      {"success", probe.success}});
  }
  json_state["probes"] = probes;
  json_state["mastery_confirmed"] = state.mastery_confirmed;
  json_state["handed_off"] = state.handed_off;
  if (state.cooldown_until.has_value()) {
    json_state["cooldown_until"] = state.cooldown_until.value();
  } else {
    json_state["cooldown_until"] = nullptr;
  }
  return json_state;
}

TopicAbilityState topic_state_from_json(const nlohmann::json& json_state) {
  TopicAbilityState state;
  state.topic_id = json_to_string(require(json_state, "topic_id"), "topic_id");
  assign_if_present(json_state, "theta",
                    [&](const nlohmann::json& v) { state.theta = json_to_double(v, "theta"); });
  assign_if_present(json_state, "se", [&](const nlohmann::json& v) { state.se = json_to_double(v, "se"); });
  if (!(state.se > 0.0)) {
    throw std::invalid_argument("Topic '" + state.topic_id + "' has a non-positive SE");
  }
  assign_if_present(json_state, "response_count", [&](const nlohmann::json& v) {
    state.response_count = json_to_int(v, "response_count");
  });
  assign_if_present(json_state, "elo_rating",
                    [&](const nlohmann::json& v) { state.elo_rating = json_to_double(v, "elo_rating"); });
  assign_if_present(json_state, "last_practiced_at", [&](const nlohmann::json& v) {
    state.last_practiced_at = json_to_int64(v, "last_practiced_at");
  });
  assign_if_present(json_state, "prior_mean",
                    [&](const nlohmann::json& v) { state.prior_mean = json_to_double(v, "prior_mean"); });
  assign_if_present(json_state, "psychometric_active", [&](const nlohmann::json& v) {
    state.psychometric_active = json_to_bool(v, "psychometric_active");
  });
  assign_if_present(json_state, "responses", [&](const nlohmann::json& v) {
    for (const auto& entry : v) {
      state.responses.push_back(response_record_from_json(entry));
    }
  });
  assign_if_present(json_state, "se_history", [&](const nlohmann::json& v) {
    state.se_history = json_to_double_vector(v, "se_history");
  });
  assign_if_present(json_state, "probes", [&](const nlohmann::json& v) {
    for (const auto& entry : v) {
      ProbeRecord probe;
      probe.item_id = json_to_string(require(entry, "item_id"), "item_id");
      probe.response_index = json_to_size(require(entry, "response_index"), "response_index");
      assign_if_present(entry, "success",
                        [&](const nlohmann::json& s) { probe.success = json_to_bool(s, "success"); });
      state.probes.push_back(probe);
    }
  });
  assign_if_present(json_state, "mastery_confirmed", [&](const nlohmann::json& v) {
    state.mastery_confirmed = json_to_bool(v, "mastery_confirmed");
  });
  assign_if_present(json_state, "handed_off",
                    [&](const nlohmann::json& v) { state.handed_off = json_to_bool(v, "handed_off"); });
  assign_if_present(json_state, "cooldown_until", [&](const nlohmann::json& v) {
    state.cooldown_until = json_to_int64(v, "cooldown_until");
  });
  return state;
}

nlohmann::json to_json(const RetentionCard& card) {
  nlohmann::json json_card = nlohmann::json::object();
  json_card["card_id"] = card.card_id;
  json_card["item_id"] = card.item_id;
  json_card["topic_id"] = card.topic_id;
  json_card["stability"] = card.stability;
  json_card["difficulty"] = card.difficulty;
  json_card["due_at"] = card.due_at;
  json_card["last_reviewed_at"] = card.last_reviewed_at;
  json_card["lapse_count"] = card.lapse_count;
  json_card["review_count"] = card.review_count;
  json_card["lane"] = to_string(card.lane);
  return json_card;
}

RetentionCard retention_card_from_json(const nlohmann::json& json_card) {
  RetentionCard card;
  card.card_id = json_to_string(require(json_card, "card_id"), "card_id");
  card.item_id = json_to_string(require(json_card, "item_id"), "item_id");
  card.topic_id = json_to_string(require(json_card, "topic_id"), "topic_id");
  card.stability = json_to_double(require(json_card, "stability"), "stability");
  card.difficulty = json_to_double(require(json_card, "difficulty"), "difficulty");
  card.due_at = json_to_int64(require(json_card, "due_at"), "due_at");
  assign_if_present(json_card, "last_reviewed_at", [&](const nlohmann::json& v) {
    card.last_reviewed_at = json_to_int64(v, "last_reviewed_at");
  });
  assign_if_present(json_card, "lapse_count",
                    [&](const nlohmann::json& v) { card.lapse_count = json_to_int(v, "lapse_count"); });
  assign_if_present(json_card, "review_count",
                    [&](const nlohmann::json& v) { card.review_count = json_to_int(v, "review_count"); });
  assign_if_present(json_card, "lane", [&](const nlohmann::json& v) {
    card.lane = card_lane_from_string(json_to_string(v, "lane"));
  });
  return card;
}

nlohmann::json to_json(const LearnerState& learner) {
  nlohmann::json json_learner = nlohmann::json::object();
  json_learner["learner_id"] = learner.learner_id;
  nlohmann::json topics = nlohmann::json::object();
  for (const auto& kv : learner.topics) {
    topics[kv.first] = to_json(kv.second);
  }
  json_learner["topics"] = topics;
  nlohmann::json exposure = nlohmann::json::object();
  for (const auto& kv : learner.exposure) {
    exposure[kv.first] = to_json(kv.second);
  }
  json_learner["exposure"] = exposure;
  nlohmann::json cards = nlohmann::json::object();
  for (const auto& kv : learner.cards) {
    cards[kv.first] = to_json(kv.second);
  }
  json_learner["cards"] = cards;
  nlohmann::json history = nlohmann::json::object();
  for (const auto& kv : learner.history) {
    history[kv.first] = {{"observations", kv.second.observations},
                         {"mean_delta_se_per_min", kv.second.mean_delta_se_per_min}};
  }
  json_learner["history"] = history;
  return json_learner;
}

LearnerState learner_state_from_json(const nlohmann::json& json_learner) {
  if (!json_learner.is_object()) {
    throw std::invalid_argument("Learner state must be a JSON object");
  }
  LearnerState learner;
  assign_if_present(json_learner, "learner_id",
                    [&](const nlohmann::json& v) { learner.learner_id = json_to_string(v, "learner_id"); });
  assign_if_present(json_learner, "topics", [&](const nlohmann::json& v) {
    for (const auto& entry : v.items()) {
      auto state = topic_state_from_json(entry.value());
      if (state.topic_id != entry.key()) {
        throw std::invalid_argument("Topic key '" + entry.key() + "' does not match topic_id '" +
                                    state.topic_id + "'");
      }
      learner.topics[entry.key()] = std::move(state);
    }
  });
  assign_if_present(json_learner, "exposure", [&](const nlohmann::json& v) {
    for (const auto& entry : v.items()) {
      learner.exposure[entry.key()] = exposure_record_from_json(entry.key(), entry.value());
    }
  });
  assign_if_present(json_learner, "cards", [&](const nlohmann::json& v) {
    for (const auto& entry : v.items()) {
      learner.cards[entry.key()] = retention_card_from_json(entry.value());
    }
  });
  assign_if_present(json_learner, "history", [&](const nlohmann::json& v) {
    for (const auto& entry : v.items()) {
      TopicHistory history;
      assign_if_present(entry.value(), "observations", [&](const nlohmann::json& n) {
        history.observations = json_to_int(n, "observations");
      });
      assign_if_present(entry.value(), "mean_delta_se_per_min", [&](const nlohmann::json& m) {
        history.mean_delta_se_per_min = json_to_double(m, "mean_delta_se_per_min");
      });
      learner.history[entry.key()] = history;
    }
  });
  return learner;
}

nlohmann::json to_json(const EngineConfig& config) {
  nlohmann::json json_config = nlohmann::json::object();
  const auto& a = config.ability;
  json_config["ability"] = {{"prior_sd", a.prior_sd},
                            {"tightened_prior_sd", a.tightened_prior_sd},
                            {"tighten_after_responses", a.tighten_after_responses},
                            {"elo_k", a.elo_k},
                            {"min_topic_responses", a.min_topic_responses},
                            {"min_item_calibration", a.min_item_calibration},
                            {"transition_elo_weight", a.transition_elo_weight},
                            {"mastery_cut", a.mastery_cut},
                            {"min_se", a.min_se},
                            {"se_history_limit", a.se_history_limit}};
  const auto& s = config.selector;
  json_config["selector"] = {{"top_k", s.top_k},
                             {"max_median_time_sec", s.max_median_time_sec},
                             {"blueprint_window", s.blueprint_window},
                             {"fatigue_after_minutes", s.fatigue_after_minutes},
                             {"fatigue_scalar", s.fatigue_scalar},
                             {"probe_window", s.probe_window},
                             {"probe_fresh_responses", s.probe_fresh_responses},
                             {"probe_success_score", s.probe_success_score},
                             {"mastery_threshold", s.mastery_threshold},
                             {"probe_history_limit", s.probe_history_limit}};
  const auto& e = config.exposure;
  json_config["exposure"] = {{"window_days", e.window_days},
                             {"max_per_day", e.max_per_day},
                             {"max_per_week", e.max_per_week},
                             {"cooldown_hours", e.cooldown_hours},
                             {"full_recovery_days", e.full_recovery_days},
                             {"recovered_multiplier", e.recovered_multiplier},
                             {"overfamiliar_mean_score", e.overfamiliar_mean_score},
                             {"overfamiliar_se", e.overfamiliar_se},
                             {"overfamiliar_multiplier", e.overfamiliar_multiplier},
                             {"drift_dead_zone", e.drift_dead_zone},
                             {"over_slope", e.over_slope},
                             {"over_floor", e.over_floor},
                             {"under_slope", e.under_slope},
                             {"under_cap", e.under_cap}};
  const auto& sc = config.scheduler;
  json_config["scheduler"] = {{"topic_cooldown_hours", sc.topic_cooldown_hours},
                              {"cooldown_override_deficit", sc.cooldown_override_deficit},
                              {"tie_tolerance", sc.tie_tolerance},
                              {"urgency_grace_days", sc.urgency_grace_days},
                              {"urgency_scale_days", sc.urgency_scale_days},
                              {"min_sample", sc.min_sample},
                              {"arm_prior_scale", sc.arm_prior_scale},
                              {"arm_prior_floor", sc.arm_prior_floor},
                              {"arm_observation_variance", sc.arm_observation_variance},
                              {"untouched_days", sc.untouched_days},
                              {"stop_se", sc.stop_se},
                              {"stop_min_attempts", sc.stop_min_attempts},
                              {"plateau_window", sc.plateau_window},
                              {"plateau_delta", sc.plateau_delta},
                              {"mastery_threshold", sc.mastery_threshold},
                              {"fatigue_minutes", sc.fatigue_minutes},
                              {"fatigue_mastered_topics", sc.fatigue_mastered_topics},
                              {"fatigue_stop_index", sc.fatigue_stop_index}};
  const auto& r = config.retention;
  json_config["retention"] = {{"desired_retention", r.desired_retention},
                              {"maximum_interval_days", r.maximum_interval_days},
                              {"default_budget_fraction", r.default_budget_fraction},
                              {"extended_budget_fraction", r.extended_budget_fraction},
                              {"extended_overdue_days", r.extended_overdue_days},
                              {"jump_ahead_overdue_days", r.jump_ahead_overdue_days},
                              {"overdue_boost", r.overdue_boost},
                              {"handoff_mastery", r.handoff_mastery},
                              {"handoff_se_window", r.handoff_se_window},
                              {"weights", r.weights}};
  const auto& t = config.telemetry;
  json_config["telemetry"] = {{"asynchronous", t.asynchronous},
                              {"queue_capacity", t.queue_capacity},
                              {"max_attempts", t.max_attempts},
                              {"retry_backoff_ms", t.retry_backoff_ms}};
  json_config["default_session_minutes"] = config.default_session_minutes;
  return json_config;
}

EngineConfig engine_config_from_json(const nlohmann::json& json_config) {
  if (!json_config.is_object()) {
    throw std::invalid_argument("Engine config must be a JSON object");
  }
  EngineConfig config;
  auto number = [](double& target, const char* key) {
    return [&target, key](const nlohmann::json& v) { target = json_to_double(v, key); };
  };
  auto integer = [](int& target, const char* key) {
    return [&target, key](const nlohmann::json& v) { target = json_to_int(v, key); };
  };
  auto size = [](std::size_t& target, const char* key) {
    return [&target, key](const nlohmann::json& v) { target = json_to_size(v, key); };
  };

  assign_if_present(json_config, "ability", [&](const nlohmann::json& j) {
    auto& a = config.ability;
    assign_if_present(j, "prior_sd", number(a.prior_sd, "prior_sd"));
    assign_if_present(j, "tightened_prior_sd", number(a.tightened_prior_sd, "tightened_prior_sd"));
    assign_if_present(j, "tighten_after_responses",
                      integer(a.tighten_after_responses, "tighten_after_responses"));
    assign_if_present(j, "elo_k", number(a.elo_k, "elo_k"));
    assign_if_present(j, "min_topic_responses", integer(a.min_topic_responses, "min_topic_responses"));
    assign_if_present(j, "min_item_calibration",
                      integer(a.min_item_calibration, "min_item_calibration"));
    assign_if_present(j, "transition_elo_weight",
                      number(a.transition_elo_weight, "transition_elo_weight"));
    assign_if_present(j, "mastery_cut", number(a.mastery_cut, "mastery_cut"));
    assign_if_present(j, "min_se", number(a.min_se, "min_se"));
    assign_if_present(j, "se_history_limit", size(a.se_history_limit, "se_history_limit"));
  });
  assign_if_present(json_config, "selector", [&](const nlohmann::json& j) {
    auto& s = config.selector;
    assign_if_present(j, "top_k", size(s.top_k, "top_k"));
    assign_if_present(j, "max_median_time_sec", number(s.max_median_time_sec, "max_median_time_sec"));
    assign_if_present(j, "blueprint_window", number(s.blueprint_window, "blueprint_window"));
    assign_if_present(j, "fatigue_after_minutes",
                      number(s.fatigue_after_minutes, "fatigue_after_minutes"));
    assign_if_present(j, "fatigue_scalar", number(s.fatigue_scalar, "fatigue_scalar"));
    assign_if_present(j, "probe_window", number(s.probe_window, "probe_window"));
    assign_if_present(j, "probe_fresh_responses",
                      size(s.probe_fresh_responses, "probe_fresh_responses"));
    assign_if_present(j, "probe_success_score", number(s.probe_success_score, "probe_success_score"));
    assign_if_present(j, "mastery_threshold", number(s.mastery_threshold, "mastery_threshold"));
    assign_if_present(j, "probe_history_limit", size(s.probe_history_limit, "probe_history_limit"));
  });
  assign_if_present(json_config, "exposure", [&](const nlohmann::json& j) {
    auto& e = config.exposure;
    assign_if_present(j, "window_days", number(e.window_days, "window_days"));
    assign_if_present(j, "max_per_day", integer(e.max_per_day, "max_per_day"));
    assign_if_present(j, "max_per_week", integer(e.max_per_week, "max_per_week"));
    assign_if_present(j, "cooldown_hours", number(e.cooldown_hours, "cooldown_hours"));
    assign_if_present(j, "full_recovery_days", number(e.full_recovery_days, "full_recovery_days"));
    assign_if_present(j, "recovered_multiplier", number(e.recovered_multiplier, "recovered_multiplier"));
    assign_if_present(j, "overfamiliar_mean_score",
                      number(e.overfamiliar_mean_score, "overfamiliar_mean_score"));
    assign_if_present(j, "overfamiliar_se", number(e.overfamiliar_se, "overfamiliar_se"));
    assign_if_present(j, "overfamiliar_multiplier",
                      number(e.overfamiliar_multiplier, "overfamiliar_multiplier"));
    assign_if_present(j, "drift_dead_zone", number(e.drift_dead_zone, "drift_dead_zone"));
    assign_if_present(j, "over_slope", number(e.over_slope, "over_slope"));
    assign_if_present(j, "over_floor", number(e.over_floor, "over_floor"));
    assign_if_present(j, "under_slope", number(e.under_slope, "under_slope"));
    assign_if_present(j, "under_cap", number(e.under_cap, "under_cap"));
  });
  assign_if_present(json_config, "scheduler", [&](const nlohmann::json& j) {
    auto& sc = config.scheduler;
    assign_if_present(j, "topic_cooldown_hours", number(sc.topic_cooldown_hours, "topic_cooldown_hours"));
    assign_if_present(j, "cooldown_override_deficit",
                      number(sc.cooldown_override_deficit, "cooldown_override_deficit"));
    assign_if_present(j, "tie_tolerance", number(sc.tie_tolerance, "tie_tolerance"));
    assign_if_present(j, "urgency_grace_days", number(sc.urgency_grace_days, "urgency_grace_days"));
    assign_if_present(j, "urgency_scale_days", number(sc.urgency_scale_days, "urgency_scale_days"));
    assign_if_present(j, "min_sample", number(sc.min_sample, "min_sample"));
    assign_if_present(j, "arm_prior_scale", number(sc.arm_prior_scale, "arm_prior_scale"));
    assign_if_present(j, "arm_prior_floor", number(sc.arm_prior_floor, "arm_prior_floor"));
    assign_if_present(j, "arm_observation_variance",
                      number(sc.arm_observation_variance, "arm_observation_variance"));
    assign_if_present(j, "untouched_days", number(sc.untouched_days, "untouched_days"));
    assign_if_present(j, "stop_se", number(sc.stop_se, "stop_se"));
    assign_if_present(j, "stop_min_attempts", integer(sc.stop_min_attempts, "stop_min_attempts"));
    assign_if_present(j, "plateau_window", size(sc.plateau_window, "plateau_window"));
    assign_if_present(j, "plateau_delta", number(sc.plateau_delta, "plateau_delta"));
    assign_if_present(j, "mastery_threshold", number(sc.mastery_threshold, "mastery_threshold"));
    assign_if_present(j, "fatigue_minutes", number(sc.fatigue_minutes, "fatigue_minutes"));
    assign_if_present(j, "fatigue_mastered_topics",
                      integer(sc.fatigue_mastered_topics, "fatigue_mastered_topics"));
    assign_if_present(j, "fatigue_stop_index", number(sc.fatigue_stop_index, "fatigue_stop_index"));
  });
  assign_if_present(json_config, "retention", [&](const nlohmann::json& j) {
    auto& r = config.retention;
    assign_if_present(j, "desired_retention", number(r.desired_retention, "desired_retention"));
    assign_if_present(j, "maximum_interval_days",
                      number(r.maximum_interval_days, "maximum_interval_days"));
    assign_if_present(j, "default_budget_fraction",
                      number(r.default_budget_fraction, "default_budget_fraction"));
    assign_if_present(j, "extended_budget_fraction",
                      number(r.extended_budget_fraction, "extended_budget_fraction"));
    assign_if_present(j, "extended_overdue_days",
                      number(r.extended_overdue_days, "extended_overdue_days"));
    assign_if_present(j, "jump_ahead_overdue_days",
                      number(r.jump_ahead_overdue_days, "jump_ahead_overdue_days"));
    assign_if_present(j, "overdue_boost", number(r.overdue_boost, "overdue_boost"));
    assign_if_present(j, "handoff_mastery", number(r.handoff_mastery, "handoff_mastery"));
    assign_if_present(j, "handoff_se_window", size(r.handoff_se_window, "handoff_se_window"));
    assign_if_present(j, "weights",
                      [&](const nlohmann::json& v) { r.weights = json_to_double_vector(v, "weights"); });
  });
  assign_if_present(json_config, "telemetry", [&](const nlohmann::json& j) {
    auto& t = config.telemetry;
    assign_if_present(j, "asynchronous",
                      [&](const nlohmann::json& v) { t.asynchronous = json_to_bool(v, "asynchronous"); });
    assign_if_present(j, "queue_capacity", size(t.queue_capacity, "queue_capacity"));
    assign_if_present(j, "max_attempts", integer(t.max_attempts, "max_attempts"));
    assign_if_present(j, "retry_backoff_ms", integer(t.retry_backoff_ms, "retry_backoff_ms"));
  });
  assign_if_present(json_config, "default_session_minutes",
                    number(config.default_session_minutes, "default_session_minutes"));
  return config;
}

nlohmann::json to_json(const SessionSpec& spec) {
  nlohmann::json json_spec = nlohmann::json::object();
  json_spec["learner_id"] = spec.learner_id;
  json_spec["seed"] = spec.seed;
  json_spec["session_minutes"] = spec.session_minutes;
  json_spec["started_at"] = spec.started_at;
  json_spec["topics"] = spec.topics;
  if (spec.max_items.has_value()) {
    json_spec["max_items"] = spec.max_items.value();
  } else {
    json_spec["max_items"] = nullptr;
  }
  return json_spec;
}

SessionSpec session_spec_from_json(const nlohmann::json& json_spec) {
  if (!json_spec.is_object()) {
    throw std::invalid_argument("Session spec must be a JSON object");
  }
  SessionSpec spec;
  assign_if_present(json_spec, "learner_id",
                    [&](const nlohmann::json& v) { spec.learner_id = json_to_string(v, "learner_id"); });
  assign_if_present(json_spec, "seed", [&](const nlohmann::json& v) {
    if (v.is_number_unsigned()) {
      spec.seed = v.get<std::uint64_t>();
    } else {
      spec.seed = static_cast<std::uint64_t>(json_to_int64(v, "seed"));
    }
  });
  assign_if_present(json_spec, "session_minutes", [&](const nlohmann::json& v) {
    spec.session_minutes = json_to_double(v, "session_minutes");
  });
  assign_if_present(json_spec, "started_at",
                    [&](const nlohmann::json& v) { spec.started_at = json_to_int64(v, "started_at"); });
  assign_if_present(json_spec, "topics", [&](const nlohmann::json& v) {
    if (!v.is_array()) {
      throw std::invalid_argument("Expected array<string> for field 'topics'");
    }
    for (const auto& entry : v) {
      spec.topics.push_back(json_to_string(entry, "topics"));
    }
  });
  assign_if_present(json_spec, "max_items",
                    [&](const nlohmann::json& v) { spec.max_items = json_to_size(v, "max_items"); });
  return spec;
}

nlohmann::json to_json(const Explanation& explanation) {
  nlohmann::json json_explanation = nlohmann::json::object();
  json_explanation["theta"] = explanation.theta;
  json_explanation["se"] = explanation.se;
  json_explanation["mastery_probability"] = explanation.mastery_probability;
  json_explanation["blueprint_gap"] = explanation.blueprint_gap;
  json_explanation["urgency_multiplier"] = explanation.urgency_multiplier;
  json_explanation["item_info"] = explanation.item_info;
  json_explanation["selection_reason"] = explanation.selection_reason;
  return json_explanation;
}

nlohmann::json to_json(const ItemPresentation& presentation) {
  nlohmann::json json_presentation = nlohmann::json::object();
  json_presentation["session_id"] = presentation.session_id;
  json_presentation["presentation_id"] = presentation.presentation_id;
  json_presentation["item"] = to_json(presentation.item);
  json_presentation["lane"] = to_string(presentation.lane);
  if (presentation.card_id.has_value()) {
    json_presentation["card_id"] = presentation.card_id.value();
  } else {
    json_presentation["card_id"] = nullptr;
  }
  json_presentation["explanation"] = to_json(presentation.explanation);
  json_presentation["presented_at"] = presentation.presented_at;
  return json_presentation;
}

nlohmann::json to_json(const ResponseReport& report) {
  nlohmann::json json_report = nlohmann::json::object();
  json_report["presentation_id"] = report.presentation_id;
  json_report["item_id"] = report.item_id;
  json_report["score_fraction"] = report.score_fraction;
  json_report["latency_ms"] = report.latency_ms;
  json_report["answered_at"] = report.answered_at;
  return json_report;
}

ResponseReport response_report_from_json(const nlohmann::json& json_report) {
  ResponseReport report;
  assign_if_present(json_report, "presentation_id", [&](const nlohmann::json& v) {
    report.presentation_id = json_to_string(v, "presentation_id");
  });
  assign_if_present(json_report, "item_id",
                    [&](const nlohmann::json& v) { report.item_id = json_to_string(v, "item_id"); });
  report.score_fraction = json_to_double(require(json_report, "score_fraction"), "score_fraction");
  assign_if_present(json_report, "latency_ms",
                    [&](const nlohmann::json& v) { report.latency_ms = json_to_int64(v, "latency_ms"); });
  assign_if_present(json_report, "answered_at",
                    [&](const nlohmann::json& v) { report.answered_at = json_to_int64(v, "answered_at"); });
  return report;
}

nlohmann::json to_json(const SessionSummary& summary) {
  nlohmann::json json_summary = nlohmann::json::object();
  json_summary["session_id"] = summary.session_id;
  json_summary["learner_id"] = summary.learner_id;
  json_summary["item_bank_version"] = summary.item_bank_version;
  json_summary["training_items"] = summary.training_items;
  json_summary["retention_items"] = summary.retention_items;
  json_summary["elapsed_minutes"] = summary.elapsed_minutes;
  json_summary["fatigue_index"] = summary.fatigue_index;
  json_summary["stop_reason"] = summary.stop_reason;
  nlohmann::json topics = nlohmann::json::array();
  for (const auto& topic : summary.topics) {
    nlohmann::json json_topic = {{"topic_id", topic.topic_id},
                                 {"items", topic.items},
                                 {"theta_start", topic.theta_start},
                                 {"se_start", topic.se_start},
                                 {"theta", topic.theta},
                                 {"se", topic.se},
                                 {"mastery_probability", topic.mastery_probability},
                                 {"handed_off", topic.handed_off}};
    if (topic.stop_reason.has_value()) {
      json_topic["stop_reason"] = topic.stop_reason.value();
    } else {
      json_topic["stop_reason"] = nullptr;
    }
    topics.push_back(json_topic);
  }
  json_summary["topics"] = topics;
  json_summary["cards_created"] = summary.cards_created;
  json_summary["lapsed_cards"] = summary.lapsed_cards;
  return json_summary;
}

} // namespace study::bridge
