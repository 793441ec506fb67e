#pragma once

#include "config.hpp"
#include "item_bank.hpp"
#include "telemetry.hpp"
#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace study {

struct SessionSpec {
  std::string learner_id;
  std::uint64_t seed = 0;
  double session_minutes = 0.0;        // 0 uses EngineConfig::default_session_minutes
  TimestampMs started_at = 0;          // 0 starts the clock at the first request
  std::vector<std::string> topics;     // empty means every topic of the bank
  std::optional<std::size_t> max_items;
};

enum class Lane {
  Training,
  Retention
};

inline std::string to_string(Lane lane) {
  return lane == Lane::Retention ? "retention" : "training";
}

struct ItemPresentation {
  std::string session_id;
  std::string presentation_id;
  ItemMetadata item;
  Lane lane = Lane::Training;
  std::optional<std::string> card_id;
  Explanation explanation;
  TimestampMs presented_at = 0;
};

struct ResponseReport {
  std::string presentation_id;
  std::string item_id;
  double score_fraction = 0.0;
  std::int64_t latency_ms = 0;
  TimestampMs answered_at = 0;
};

struct TopicSessionSummary {
  std::string topic_id;
  std::size_t items = 0;
  double theta_start = 0.0;
  double se_start = 0.0;
  double theta = 0.0;
  double se = 0.0;
  double mastery_probability = 0.0;
  std::optional<std::string> stop_reason;
  bool handed_off = false;
};

struct SessionSummary {
  std::string session_id;
  std::string learner_id;
  std::uint64_t item_bank_version = 0;
  std::size_t training_items = 0;
  std::size_t retention_items = 0;
  double elapsed_minutes = 0.0;
  double fatigue_index = 0.0;
  std::string stop_reason;
  std::vector<TopicSessionSummary> topics;
  std::vector<std::string> cards_created;
  std::vector<std::string> lapsed_cards;
};

class StudyEngine {
public:
  virtual ~StudyEngine() = default;

  // Pins the currently published item bank for the lifetime of the session.
  virtual std::string create_session(const SessionSpec& spec, LearnerState& learner) = 0;

  using Next = std::variant<ItemPresentation, SessionSummary>;

  // Returns the outstanding item again until it is answered.
  virtual Next next_item(const std::string& session_id, LearnerState& learner,
                         TimestampMs now) = 0;

  virtual Next submit_response(const std::string& session_id, LearnerState& learner,
                               const ResponseReport& report) = 0;

  virtual SessionSummary end_session(const std::string& session_id, LearnerState& learner) = 0;

  virtual nlohmann::json debug_state(const std::string& session_id) = 0;

  // Sessions created afterwards use `bank`; running sessions keep theirs.
  virtual void publish_item_bank(ItemBank bank) = 0;

  virtual std::uint64_t item_bank_version() const = 0;

  virtual TelemetryStats telemetry_stats() const = 0;

  virtual void flush_telemetry() = 0;
};

std::unique_ptr<StudyEngine> make_engine(ItemBank bank, BlueprintConfig blueprint,
                                         EngineConfig config = {},
                                         std::shared_ptr<TelemetrySink> sink = nullptr);

} // namespace study
