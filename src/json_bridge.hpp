#pragma once

#include "../include/study/config.hpp"
#include "../include/study/item_bank.hpp"
#include "../include/study/study_engine.hpp"

#include <nlohmann/json.hpp>

namespace study::bridge {

nlohmann::json to_json(const ItemMetadata& item);
ItemMetadata item_metadata_from_json(const nlohmann::json& json_item);

nlohmann::json to_json(const ItemBank& bank);
ItemBank item_bank_from_json(const nlohmann::json& json_bank);

nlohmann::json to_json(const BlueprintConfig& blueprint);
BlueprintConfig blueprint_from_json(const nlohmann::json& json_blueprint);

nlohmann::json to_json(const TopicAbilityState& state);
TopicAbilityState topic_state_from_json(const nlohmann::json& json_state);

nlohmann::json to_json(const RetentionCard& card);
RetentionCard retention_card_from_json(const nlohmann::json& json_card);

nlohmann::json to_json(const LearnerState& learner);
LearnerState learner_state_from_json(const nlohmann::json& json_learner);

nlohmann::json to_json(const EngineConfig& config);
EngineConfig engine_config_from_json(const nlohmann::json& json_config);

nlohmann::json to_json(const SessionSpec& spec);
SessionSpec session_spec_from_json(const nlohmann::json& json_spec);

nlohmann::json to_json(const Explanation& explanation);

nlohmann::json to_json(const ItemPresentation& presentation);

nlohmann::json to_json(const ResponseReport& report);
ResponseReport response_report_from_json(const nlohmann::json& json_report);

nlohmann::json to_json(const SessionSummary& summary);

} // namespace study::bridge
