#pragma once

#include "types.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace study {

/**
 * ItemBank is an immutable snapshot of externally authored item metadata.
 * A session pins exactly one snapshot; re-calibration publishes a new one
 * with a higher version instead of mutating this one.
 */
class ItemBank {
public:
  ItemBank() = default;
  ItemBank(std::uint64_t version, std::vector<ItemMetadata> items);

  std::uint64_t version() const { return version_; }
  std::size_t size() const { return items_.size(); }
  bool empty() const { return items_.empty(); }
  const std::vector<ItemMetadata>& items() const { return items_; }

  const ItemMetadata* find(const std::string& item_id) const;

  // Items of a topic ordered by item id.
  std::vector<const ItemMetadata*> items_for_topic(const std::string& topic_id) const;

  // Sorted, de-duplicated keys.
  const std::vector<std::string>& topics() const { return topics_; }
  const std::vector<std::string>& systems() const { return systems_; }

private:
  std::uint64_t version_ = 0;
  std::vector<ItemMetadata> items_;
  std::unordered_map<std::string, std::size_t> by_id_;
  std::map<std::string, std::vector<std::size_t>> by_topic_;
  std::vector<std::string> topics_;
  std::vector<std::string> systems_;
};

class BlueprintConfig {
public:
  BlueprintConfig() = default;
  explicit BlueprintConfig(std::vector<BlueprintTarget> targets);

  // Fills in every topic and system of the bank. Unconfigured siblings share
  // the unassigned mass equally. Throws when a level sums above 1.
  BlueprintConfig resolved_for(const ItemBank& bank) const;

  std::optional<double> target(BlueprintLevel level, const std::string& key) const;
  const std::map<std::string, double>& level_targets(BlueprintLevel level) const;

  bool empty() const { return topic_targets_.empty() && system_targets_.empty(); }

  std::vector<BlueprintTarget> targets() const;

private:
  std::map<std::string, double>& level_map(BlueprintLevel level);

  std::map<std::string, double> topic_targets_;
  std::map<std::string, double> system_targets_;
};

ItemBank load_item_bank(const std::filesystem::path& path);
BlueprintConfig load_blueprint(const std::filesystem::path& path);

} // namespace study
