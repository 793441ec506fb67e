#include "study/item_selector.hpp"

#include "psychometrics/pcm.hpp"
#include "rng.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace study {

namespace {

enum class Stage {
  Strict,
  TimeCapRelaxed,
  BlueprintRelaxed
};

const char* stage_reason(Stage stage) {
  switch (stage) {
    case Stage::Strict: return "randomesque";
    case Stage::TimeCapRelaxed: return "time_cap_relaxed";
    case Stage::BlueprintRelaxed: return "blueprint_relaxed";
  }
  return "randomesque";
}

} // namespace

bool is_probe_item(double theta, const ItemMetadata& item, const SelectorConfig& config) {
  return std::fabs(theta - item.difficulty) <= config.probe_window;
}

std::optional<ProbeRecord> fresh_probe(const TopicAbilityState& topic,
                                       const SelectorConfig& config) {
  if (topic.probes.empty()) {
    return std::nullopt;
  }
  const ProbeRecord& latest = topic.probes.back();
  const std::size_t total = topic.responses.size();
  const std::size_t window = config.probe_fresh_responses;
  const std::size_t oldest = total > window ? total - window : 0;
  if (latest.response_index < oldest || latest.response_index >= total) {
    return std::nullopt;
  }
  return latest;
}

bool has_fresh_successful_probe(const TopicAbilityState& topic, const SelectorConfig& config) {
  auto probe = fresh_probe(topic, config);
  return probe && probe->success;
}

void record_probe(TopicAbilityState& topic, ProbeRecord probe, const SelectorConfig& config) {
  topic.probes.push_back(std::move(probe));
  if (topic.probes.size() > config.probe_history_limit) {
    const auto excess = static_cast<std::ptrdiff_t>(topic.probes.size() - config.probe_history_limit);
    topic.probes.erase(topic.probes.begin(), topic.probes.begin() + excess);
  }
}

ItemSelector::ItemSelector(const ItemBank& bank, const ExposureController& exposure,
                           SelectorConfig config)
    : bank_(bank), exposure_(exposure), config_(config) {
  if (config_.top_k == 0) {
    throw std::invalid_argument("ItemSelector: top_k must be positive");
  }
  if (config_.probe_history_limit == 0) {
    throw std::invalid_argument("ItemSelector: probe_history_limit must be positive");
  }
}

double ItemSelector::fatigue_scalar(double elapsed_minutes) const {
  return elapsed_minutes > config_.fatigue_after_minutes ? config_.fatigue_scalar : 1.0;
}

ScoredItem ItemSelector::score(const TopicAbilityState& topic, const ItemMetadata& item,
                               const SelectionContext& context) const {
  ScoredItem scored;
  scored.item = &item;
  scored.information = psychometrics::item_information(topic.theta, item);
  scored.exposure_multiplier =
      context.learner ? exposure_.exposure_multiplier(*context.learner, item, context.now) : 1.0;
  scored.blueprint_multiplier =
      context.shares ? exposure_.blueprint_multiplier(*context.shares, item) : 1.0;
  scored.probe = is_probe_item(topic.theta, item, config_);
  scored.utility = (scored.information / item.median_time_sec) * scored.blueprint_multiplier *
                   scored.exposure_multiplier * fatigue_scalar(context.elapsed_minutes);
  if (!std::isfinite(scored.utility)) {
    scored.utility = 0.0;
  }
  return scored;
}

SelectionResult ItemSelector::select_next(const TopicAbilityState& topic,
                                          const std::vector<std::string>& candidate_pool,
                                          const SelectionContext& context,
                                          std::uint64_t& rng_state) const {
  std::vector<std::string> missing;
  std::vector<ScoredItem> open;
  std::size_t capped = 0;
  for (const auto& item_id : candidate_pool) {
    const ItemMetadata* item = bank_.find(item_id);
    if (!item) {
      missing.push_back(item_id);
      continue;
    }
    if (context.learner && context.learner->in_retention_lane(item_id)) {
      continue;
    }
    auto scored = score(topic, *item, context);
    if (scored.exposure_multiplier <= 0.0) {
      ++capped;
      continue;
    }
    open.push_back(scored);
  }

  const bool wants_probe = context.mastery_probability >= config_.mastery_threshold &&
                           !has_fresh_successful_probe(topic, config_);

  for (Stage stage : {Stage::Strict, Stage::TimeCapRelaxed, Stage::BlueprintRelaxed}) {
    std::vector<ScoredItem> pool;
    for (const auto& scored : open) {
      if (stage == Stage::Strict && scored.item->median_time_sec > config_.max_median_time_sec) {
        continue;
      }
      if (stage != Stage::BlueprintRelaxed && context.shares &&
          !exposure_.within_window(*context.shares, *scored.item)) {
        continue;
      }
      pool.push_back(scored);
    }
    if (pool.empty()) {
      continue;
    }

    bool probe_pick = false;
    if (wants_probe) {
      std::vector<ScoredItem> probes;
      std::copy_if(pool.begin(), pool.end(), std::back_inserter(probes),
                   [](const ScoredItem& s) { return s.probe; });
      if (!probes.empty()) {
        pool.swap(probes);
        probe_pick = true;
      }
    }

    std::sort(pool.begin(), pool.end(), [](const ScoredItem& a, const ScoredItem& b) {
      if (a.utility != b.utility) {
        return a.utility > b.utility;
      }
      return a.item->item_id < b.item->item_id;
    });
    const std::size_t keep = std::min(config_.top_k, pool.size());
    const int pick = rand_int(rng_state, 0, static_cast<int>(keep) - 1);
    const ScoredItem& chosen = pool[static_cast<std::size_t>(pick)];

    Selection selection;
    selection.item = *chosen.item;
    selection.utility = chosen.utility;
    selection.information = chosen.information;
    selection.blueprint_multiplier = chosen.blueprint_multiplier;
    selection.exposure_multiplier = chosen.exposure_multiplier;
    selection.probe = chosen.probe;
    selection.shortlist_size = keep;
    selection.missing_items = std::move(missing);
    if (probe_pick) {
      selection.reason = "probe";
    } else if (stage == Stage::Strict) {
      selection.reason = std::string(stage_reason(stage)) + "_top" + std::to_string(config_.top_k);
    } else {
      selection.reason = stage_reason(stage);
    }
    return selection;
  }

  NoEligibleItem none;
  none.topic_id = topic.topic_id;
  none.candidates = candidate_pool.size();
  none.capped = capped;
  none.missing_items = std::move(missing);
  return none;
}

} // namespace study
