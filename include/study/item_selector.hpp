#pragma once

#include "config.hpp"
#include "exposure_controller.hpp"
#include "item_bank.hpp"
#include "types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace study {

struct SelectionContext {
  const LearnerState* learner = nullptr;
  const SessionShareTracker* shares = nullptr;
  double elapsed_minutes = 0.0;
  TimestampMs now = 0;
  double mastery_probability = 0.0;
};

struct ScoredItem {
  const ItemMetadata* item = nullptr;
  double utility = 0.0;
  double information = 0.0;
  double blueprint_multiplier = 1.0;
  double exposure_multiplier = 1.0;
  bool probe = false;
};

struct Selection {
  ItemMetadata item;
  double utility = 0.0;
  double information = 0.0;
  double blueprint_multiplier = 1.0;
  double exposure_multiplier = 1.0;
  bool probe = false;
  std::string reason;
  std::size_t shortlist_size = 0;
  std::vector<std::string> missing_items;
};

struct NoEligibleItem {
  std::string topic_id;
  std::size_t candidates = 0;
  std::size_t capped = 0;
  std::vector<std::string> missing_items;
};

using SelectionResult = std::variant<Selection, NoEligibleItem>;

// A response is a probe when the item sat within the probe window of the
// ability estimate at presentation time.
bool is_probe_item(double theta, const ItemMetadata& item, const SelectorConfig& config);

// Latest probe among the topic's last `probe_fresh_responses` responses.
std::optional<ProbeRecord> fresh_probe(const TopicAbilityState& topic, const SelectorConfig& config);
bool has_fresh_successful_probe(const TopicAbilityState& topic, const SelectorConfig& config);

// Appends `probe`, keeping at most `probe_history_limit` of the latest probes.
void record_probe(TopicAbilityState& topic, ProbeRecord probe, const SelectorConfig& config);

class ItemSelector {
public:
  ItemSelector(const ItemBank& bank, const ExposureController& exposure,
               SelectorConfig config = {});

  SelectionResult select_next(const TopicAbilityState& topic,
                              const std::vector<std::string>& candidate_pool,
                              const SelectionContext& context,
                              std::uint64_t& rng_state) const;

  double fatigue_scalar(double elapsed_minutes) const;

  ScoredItem score(const TopicAbilityState& topic, const ItemMetadata& item,
                   const SelectionContext& context) const;

  const SelectorConfig& config() const noexcept { return config_; }

private:
  const ItemBank& bank_;
  const ExposureController& exposure_;
  SelectorConfig config_;
};

} // namespace study
