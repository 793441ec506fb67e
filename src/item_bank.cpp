#include "study/item_bank.hpp"

#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <set>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace study {

namespace {

constexpr double kShareTolerance = 1e-6;

void validate_item(const ItemMetadata& item) {
  if (item.item_id.empty()) {
    throw std::invalid_argument("ItemBank: item without id");
  }
  if (item.topic_id.empty()) {
    throw std::invalid_argument("ItemBank: item '" + item.item_id + "' has no topic");
  }
  if (item.score_categories < 1) {
    throw std::invalid_argument("ItemBank: item '" + item.item_id +
                                "' must have at least one score category");
  }
  if (!item.category_thresholds.empty() &&
      static_cast<int>(item.category_thresholds.size()) != item.score_categories) {
    throw std::invalid_argument("ItemBank: item '" + item.item_id +
                                "' threshold count does not match score categories");
  }
  if (!(item.median_time_sec > 0.0)) {
    throw std::invalid_argument("ItemBank: item '" + item.item_id +
                                "' needs a positive median time");
  }
}

nlohmann::json read_json_file(const std::filesystem::path& path, const char* what) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error(std::string(what) + " not found at: " + path.string());
  }
  std::ifstream stream(path);
  if (!stream) {
    throw std::runtime_error(std::string("Failed to open ") + what + ": " + path.string());
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  return nlohmann::json::parse(content);
}

void resolve_level(std::map<std::string, double>& targets,
                   const std::vector<std::string>& siblings,
                   BlueprintLevel level) {
  double assigned = 0.0;
  std::vector<std::string> unconfigured;
  for (const auto& key : siblings) {
    auto it = targets.find(key);
    if (it == targets.end()) {
      unconfigured.push_back(key);
    }
  }
  for (const auto& kv : targets) {
    if (kv.second < 0.0 || kv.second > 1.0) {
      throw std::invalid_argument("Blueprint: share for '" + kv.first + "' outside [0,1]");
    }
    assigned += kv.second;
  }
  if (assigned > 1.0 + kShareTolerance) {
    throw std::invalid_argument("Blueprint: " + to_string(level) + " shares sum to " +
                                std::to_string(assigned) + " (> 1)");
  }

  if (!unconfigured.empty()) {
    const double remaining = std::max(0.0, 1.0 - assigned);
    const double each = remaining / static_cast<double>(unconfigured.size());
    for (const auto& key : unconfigured) {
      targets[key] = each;
    }
    return;
  }

  if (assigned > kShareTolerance && std::fabs(assigned - 1.0) > kShareTolerance) {
    if (debug_flag_enabled("STUDY_DEBUG_ENGINE")) {
      debug_line("blueprint", to_string(level) + " shares sum to " + std::to_string(assigned) +
                                  ", renormalizing");
    }
    for (auto& kv : targets) {
      kv.second /= assigned;
    }
  }
}

} // namespace

ItemBank::ItemBank(std::uint64_t version, std::vector<ItemMetadata> items)
    : version_(version), items_(std::move(items)) {
  std::set<std::string> systems;
  for (std::size_t i = 0; i < items_.size(); ++i) {
    const auto& item = items_[i];
    validate_item(item);
    if (!by_id_.emplace(item.item_id, i).second) {
      throw std::invalid_argument("ItemBank: duplicate item id '" + item.item_id + "'");
    }
    by_topic_[item.topic_id].push_back(i);
    if (!item.system_id.empty()) {
      systems.insert(item.system_id);
    }
  }
  for (auto& kv : by_topic_) {
    std::sort(kv.second.begin(), kv.second.end(), [this](std::size_t a, std::size_t b) {
      return items_[a].item_id < items_[b].item_id;
    });
    topics_.push_back(kv.first);
  }
  systems_.assign(systems.begin(), systems.end());
}

const ItemMetadata* ItemBank::find(const std::string& item_id) const {
  auto it = by_id_.find(item_id);
  if (it == by_id_.end()) {
    return nullptr;
  }
  return &items_[it->second];
}

std::vector<const ItemMetadata*> ItemBank::items_for_topic(const std::string& topic_id) const {
  std::vector<const ItemMetadata*> out;
  auto it = by_topic_.find(topic_id);
  if (it == by_topic_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (std::size_t index : it->second) {
    out.push_back(&items_[index]);
  }
  return out;
}

BlueprintConfig::BlueprintConfig(std::vector<BlueprintTarget> targets) {
  for (const auto& target : targets) {
    if (target.key.empty()) {
      throw std::invalid_argument("Blueprint: target without key");
    }
    auto& map = level_map(target.level);
    if (!map.emplace(target.key, target.target_share).second) {
      throw std::invalid_argument("Blueprint: duplicate " + to_string(target.level) + " '" +
                                  target.key + "'");
    }
  }
}

std::map<std::string, double>& BlueprintConfig::level_map(BlueprintLevel level) {
  return level == BlueprintLevel::Topic ? topic_targets_ : system_targets_;
}

const std::map<std::string, double>& BlueprintConfig::level_targets(BlueprintLevel level) const {
  return level == BlueprintLevel::Topic ? topic_targets_ : system_targets_;
}

BlueprintConfig BlueprintConfig::resolved_for(const ItemBank& bank) const {
  BlueprintConfig resolved = *this;
  resolve_level(resolved.topic_targets_, bank.topics(), BlueprintLevel::Topic);
  resolve_level(resolved.system_targets_, bank.systems(), BlueprintLevel::System);
  return resolved;
}

std::optional<double> BlueprintConfig::target(BlueprintLevel level, const std::string& key) const {
  const auto& map = level_targets(level);
  auto it = map.find(key);
  if (it == map.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<BlueprintTarget> BlueprintConfig::targets() const {
  std::vector<BlueprintTarget> out;
  for (const auto& kv : topic_targets_) {
    out.push_back({BlueprintLevel::Topic, kv.first, kv.second});
  }
  for (const auto& kv : system_targets_) {
    out.push_back({BlueprintLevel::System, kv.first, kv.second});
  }
  return out;
}

ItemBank load_item_bank(const std::filesystem::path& path) {
  return bridge::item_bank_from_json(read_json_file(path, "Item bank"));
}

BlueprintConfig load_blueprint(const std::filesystem::path& path) {
  return bridge::blueprint_from_json(read_json_file(path, "Blueprint config"));
}

} // namespace study
