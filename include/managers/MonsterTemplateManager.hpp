/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef MONSTER_TEMPLATE_MANAGER_HPP
#define MONSTER_TEMPLATE_MANAGER_HPP

#include "ai/AIStrategy.hpp"
#include "ai/MonsterBehavior.hpp"
#include "ai/threat/ThreatConfig.hpp"
#include "entities/Monster.hpp"
#include "entities/components/AbilitiesComponent.hpp"
#include "entities/components/StatsComponent.hpp"
#include <limits>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace HexCrawl {

class JsonValue;

/**
 * @brief Validated blueprint for spawning monsters
 */
struct MonsterDefinition {
  std::string id;
  std::string name;
  std::string description;
  EntityStats stats;
  std::vector<AbilityDefinition> abilities;
  AIVariant aiVariant{AIVariant::Aggressive};
  ThreatConfig threatConfig{ThreatConfig::createDefault()};
  std::vector<MonsterBehavior> behaviors;
  int spawnWeight{1};
  int difficulty{1};
  std::vector<std::string> tags;
};

/**
 * @brief Registry of monster definitions.
 *
 * Explicitly constructed and passed by reference; there is no global
 * instance. Definitions come from JSON documents shaped as
 * {"monsters": [...]} or from registerBuiltinDefinitions().
 */
class MonsterTemplateManager {
 public:
  MonsterTemplateManager() = default;

  /**
   * @brief Loads every definition in the file
   * @return false if the file cannot be read or any entry was rejected
   */
  bool loadFromFile(const std::string& path);
  bool loadFromString(const std::string& json);

  /**
   * @brief Validates and stores a definition, replacing one with the same id
   */
  bool registerDefinition(const MonsterDefinition& definition);
  void registerBuiltinDefinitions();
  bool removeDefinition(const std::string& id);
  void clear();

  const MonsterDefinition* getDefinition(const std::string& id) const;
  bool hasDefinition(const std::string& id) const;
  std::vector<std::string> getDefinitionIds() const;
  std::vector<const MonsterDefinition*> getDefinitionsByTag(const std::string& tag) const;
  size_t size() const { return m_definitions.size(); }

  /**
   * @brief Spawn-weighted pick among definitions up to maxDifficulty
   * @return nullptr when nothing qualifies
   */
  const MonsterDefinition* pickWeighted(std::mt19937& rng,
                                        int maxDifficulty = std::numeric_limits<int>::max()) const;

  /**
   * @brief New monster instance from a registered definition
   * @return nullptr for an unknown definition id
   */
  MonsterPtr createMonster(const std::string& definitionId, const std::string& instanceId,
                           const HexCoordinate& position) const;

  /**
   * @return Reason the definition is unusable, or std::nullopt if valid
   */
  static std::optional<std::string> validateDefinition(const MonsterDefinition& definition);

  static MonsterDefinition createGoblinWarrior();

 private:
  std::unordered_map<std::string, MonsterDefinition> m_definitions;

  bool loadFromJson(const JsonValue& root, const std::string& source);
  static bool parseDefinition(const JsonValue& json, MonsterDefinition& out, std::string& error);
  static bool parseAbility(const JsonValue& json, AbilityDefinition& out, std::string& error);
  static bool parseThreatConfig(const JsonValue& json, ThreatConfig& out, std::string& error);
  static bool parseBehavior(const JsonValue& json, MonsterBehavior& out, std::string& error);
  static bool parseCondition(const JsonValue& json, BehaviorCondition& out, std::string& error);
  static bool parseAction(const JsonValue& json, BehaviorAction& out, std::string& error);
};

} // namespace HexCrawl

#endif  // MONSTER_TEMPLATE_MANAGER_HPP
