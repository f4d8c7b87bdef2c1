/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/MonsterTemplateManager.hpp"
#include "core/Logger.hpp"
#include "utils/JsonReader.hpp"
#include <algorithm>
#include <exception>
#include <type_traits>
#include <unordered_set>

namespace HexCrawl {

namespace {

// Absent or null keys keep the default already in 'out'
bool readInt(const JsonValue& object, const char* key, int& out, std::string& error) {
  const JsonValue& value = object[key];
  if (value.isNull()) {
    return true;
  }
  auto number = value.tryAsInt();
  if (!number) {
    error = std::string("'") + key + "' must be a whole number";
    return false;
  }
  out = *number;
  return true;
}

bool readDouble(const JsonValue& object, const char* key, double& out, std::string& error) {
  const JsonValue& value = object[key];
  if (value.isNull()) {
    return true;
  }
  auto number = value.tryAsNumber();
  if (!number) {
    error = std::string("'") + key + "' must be a number";
    return false;
  }
  out = *number;
  return true;
}

bool readBool(const JsonValue& object, const char* key, bool& out, std::string& error) {
  const JsonValue& value = object[key];
  if (value.isNull()) {
    return true;
  }
  auto flag = value.tryAsBool();
  if (!flag) {
    error = std::string("'") + key + "' must be a boolean";
    return false;
  }
  out = *flag;
  return true;
}

bool readString(const JsonValue& object, const char* key, std::string& out, std::string& error) {
  const JsonValue& value = object[key];
  if (value.isNull()) {
    return true;
  }
  auto text = value.tryAsString();
  if (!text) {
    error = std::string("'") + key + "' must be a string";
    return false;
  }
  out = *text;
  return true;
}

bool requireString(const JsonValue& object, const char* key, std::string& out,
                   std::string& error) {
  if (!object[key].isString() || object[key].asString().empty()) {
    error = std::string("missing required field '") + key + "'";
    return false;
  }
  out = object[key].asString();
  return true;
}

bool readSelector(const JsonValue& object, const char* key, TargetSelector& out,
                  std::string& error) {
  std::string name;
  if (!readString(object, key, name, error)) {
    return false;
  }
  if (name.empty()) {
    return true;
  }
  auto selector = targetSelectorFromName(name);
  if (!selector) {
    error = "unknown target selector '" + name + "'";
    return false;
  }
  out = *selector;
  return true;
}

bool isFraction(double value) {
  return value >= 0.0 && value <= 1.0;
}

} // anonymous namespace

bool MonsterTemplateManager::loadFromFile(const std::string& path) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    TEMPLATE_ERROR("MonsterTemplateManager::loadFromFile - Failed to load file: " + path +
                   " - " + reader.getLastError());
    return false;
  }
  return loadFromJson(reader.getRoot(), path);
}

bool MonsterTemplateManager::loadFromString(const std::string& json) {
  JsonReader reader;
  if (!reader.parse(json)) {
    TEMPLATE_ERROR("MonsterTemplateManager::loadFromString - Failed to parse JSON: " +
                   reader.getLastError());
    return false;
  }
  return loadFromJson(reader.getRoot(), "string");
}

bool MonsterTemplateManager::loadFromJson(const JsonValue& root, const std::string& source) {
  if (!root.isObject()) {
    TEMPLATE_ERROR("MonsterTemplateManager::loadFromJson - Root JSON in " + source + " is not an object");
    return false;
  }
  if (!root.hasKey("monsters") || !root["monsters"].isArray()) {
    TEMPLATE_ERROR("MonsterTemplateManager::loadFromJson - Missing or invalid 'monsters' array in " +
                   source);
    return false;
  }

  const JsonValue& monsters = root["monsters"];
  size_t loadedCount = 0;
  size_t failedCount = 0;

  for (size_t i = 0; i < monsters.size(); ++i) {
    MonsterDefinition definition;
    std::string error;
    try {
      if (!parseDefinition(monsters[i], definition, error)) {
        ++failedCount;
        TEMPLATE_ERROR("MonsterTemplateManager::loadFromJson - Entry " + std::to_string(i) +
                       " rejected: " + error);
        continue;
      }
    } catch (const std::exception& ex) {
      ++failedCount;
      TEMPLATE_ERROR("MonsterTemplateManager::loadFromJson - Exception processing entry " +
                     std::to_string(i) + ": " + ex.what());
      continue;
    }

    if (registerDefinition(definition)) {
      ++loadedCount;
    } else {
      ++failedCount;
    }
  }

  TEMPLATE_INFO("MonsterTemplateManager::loadFromJson - Completed " + source + ": " +
                std::to_string(loadedCount) + " loaded, " + std::to_string(failedCount) +
                " failed");
  return failedCount == 0;
}

bool MonsterTemplateManager::registerDefinition(const MonsterDefinition& definition) {
  if (auto invalid = validateDefinition(definition)) {
    TEMPLATE_ERROR("MonsterTemplateManager::registerDefinition - '" + definition.id +
                   "' is invalid: " + *invalid);
    return false;
  }

  auto [it, inserted] = m_definitions.insert_or_assign(definition.id, definition);
  if (!inserted) {
    TEMPLATE_WARN("MonsterTemplateManager::registerDefinition - Replaced definition '" +
                  it->first + "'");
  } else {
    TEMPLATE_DEBUG("MonsterTemplateManager::registerDefinition - Registered '" + it->first + "'");
  }
  return true;
}

MonsterDefinition MonsterTemplateManager::createGoblinWarrior() {
  MonsterDefinition goblin;
  goblin.id = "goblin_warrior";
  goblin.name = "Goblin Warrior";
  goblin.description = "A fierce goblin warrior";
  goblin.stats.maxHp = 45;
  goblin.stats.baseArmor = 1;
  goblin.stats.baseDamage = 12;
  goblin.stats.movementRange = 3;

  AbilityDefinition slash;
  slash.id = "rusty_slash";
  slash.name = "Rusty Slash";
  slash.variant = AbilityVariant::Attack;
  slash.damage = 12;
  slash.range = 1;
  slash.cooldown = 0;
  slash.description = "A basic attack";
  goblin.abilities.push_back(slash);

  goblin.aiVariant = AIVariant::Aggressive;
  goblin.threatConfig = ThreatConfig::createDefault();
  goblin.spawnWeight = 10;
  goblin.difficulty = 1;
  goblin.tags = {"goblin", "melee"};
  return goblin;
}

void MonsterTemplateManager::registerBuiltinDefinitions() {
  registerDefinition(createGoblinWarrior());
}

bool MonsterTemplateManager::removeDefinition(const std::string& id) {
  return m_definitions.erase(id) > 0;
}

void MonsterTemplateManager::clear() {
  m_definitions.clear();
  TEMPLATE_DEBUG("MonsterTemplateManager::clear - Registry cleared");
}

const MonsterDefinition* MonsterTemplateManager::getDefinition(const std::string& id) const {
  auto it = m_definitions.find(id);
  return it != m_definitions.end() ? &it->second : nullptr;
}

bool MonsterTemplateManager::hasDefinition(const std::string& id) const {
  return m_definitions.find(id) != m_definitions.end();
}

std::vector<std::string> MonsterTemplateManager::getDefinitionIds() const {
  std::vector<std::string> ids;
  ids.reserve(m_definitions.size());
  for (const auto& [id, definition] : m_definitions) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

std::vector<const MonsterDefinition*>
MonsterTemplateManager::getDefinitionsByTag(const std::string& tag) const {
  std::vector<const MonsterDefinition*> matching;
  for (const auto& id : getDefinitionIds()) {
    const MonsterDefinition& definition = m_definitions.at(id);
    if (std::find(definition.tags.begin(), definition.tags.end(), tag) != definition.tags.end()) {
      matching.push_back(&definition);
    }
  }
  return matching;
}

const MonsterDefinition* MonsterTemplateManager::pickWeighted(std::mt19937& rng,
                                                              int maxDifficulty) const {
  // Sorted ids keep the pick reproducible for a given seed
  std::vector<const MonsterDefinition*> pool;
  int totalWeight = 0;
  for (const auto& id : getDefinitionIds()) {
    const MonsterDefinition& definition = m_definitions.at(id);
    if (definition.spawnWeight > 0 && definition.difficulty <= maxDifficulty) {
      pool.push_back(&definition);
      totalWeight += definition.spawnWeight;
    }
  }
  if (pool.empty()) {
    return nullptr;
  }

  std::uniform_int_distribution<int> roll(0, totalWeight - 1);
  int remaining = roll(rng);
  for (const MonsterDefinition* definition : pool) {
    if (remaining < definition->spawnWeight) {
      return definition;
    }
    remaining -= definition->spawnWeight;
  }
  return pool.back();
}

MonsterPtr MonsterTemplateManager::createMonster(const std::string& definitionId,
                                                 const std::string& instanceId,
                                                 const HexCoordinate& position) const {
  const MonsterDefinition* definition = getDefinition(definitionId);
  if (definition == nullptr) {
    TEMPLATE_ERROR("MonsterTemplateManager::createMonster - Unknown definition '" +
                   definitionId + "'");
    return nullptr;
  }

  auto monster = std::make_shared<Monster>(instanceId, definition->name, definition->stats,
                                           position, definition->abilities,
                                           definition->aiVariant, definition->threatConfig,
                                           definition->behaviors);
  monster->setDefinitionId(definition->id);
  return monster;
}

std::optional<std::string>
MonsterTemplateManager::validateDefinition(const MonsterDefinition& definition) {
  if (definition.id.empty()) {
    return "id is required";
  }
  if (definition.name.empty()) {
    return "name is required";
  }

  const EntityStats& stats = definition.stats;
  if (stats.maxHp <= 0) {
    return "maxHp must be positive";
  }
  if (stats.baseArmor < 0 || stats.baseDamage < 0 || stats.movementRange < 0) {
    return "armor, damage and movement range must not be negative";
  }
  if (definition.spawnWeight < 0) {
    return "spawnWeight must not be negative";
  }
  if (definition.difficulty < 1) {
    return "difficulty must be at least 1";
  }

  std::unordered_set<std::string> abilityIds{AbilitiesComponent::BASIC_ATTACK_ID,
                                             AbilitiesComponent::WAIT_ID};
  for (const auto& ability : definition.abilities) {
    if (ability.id.empty()) {
      return "ability without id";
    }
    if (!abilityIds.insert(ability.id).second) {
      return "duplicate ability '" + ability.id + "'";
    }
    if (ability.damage < 0 || ability.healing < 0 || ability.range < 0 ||
        ability.cooldown < 0 || ability.areaOfEffect < 0) {
      return "ability '" + ability.id + "' has a negative value";
    }
    for (const auto& effect : ability.statusEffects) {
      if (effect.duration <= 0 || !isFraction(effect.chance)) {
        return "ability '" + ability.id + "' has an invalid status effect";
      }
    }
  }

  const ThreatConfig& threat = definition.threatConfig;
  if (!isFraction(threat.decayRate) || threat.healingMultiplier < 0.0 ||
      threat.damageMultiplier < 0.0 || threat.armorMultiplier < 0.0 ||
      threat.avoidLastTargetRounds < 0) {
    return "threat configuration out of range";
  }

  for (const auto& behavior : definition.behaviors) {
    if (behavior.id.empty()) {
      return "behavior without id";
    }
    for (const auto& condition : behavior.conditions) {
      std::optional<std::string> problem = std::visit([&](auto&& arg) -> std::optional<std::string> {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, HpBelow> || std::is_same_v<T, HpAbove> ||
                      std::is_same_v<T, AllyInDanger>) {
          if (!isFraction(arg.threshold)) {
            return "threshold must be between 0 and 1";
          }
        } else if constexpr (std::is_same_v<T, EnemyInRange>) {
          if (arg.range < 0) {
            return "range must not be negative";
          }
        } else if constexpr (std::is_same_v<T, CooldownReady>) {
          if (abilityIds.count(arg.abilityId) == 0) {
            return "unknown ability '" + arg.abilityId + "'";
          }
        }
        return std::nullopt;
      }, condition);
      if (problem) {
        return "behavior '" + behavior.id + "' " + conditionKindName(condition) + ": " + *problem;
      }
    }

    if (const auto* use = std::get_if<UseAbility>(&behavior.action)) {
      if (abilityIds.count(use->abilityId) == 0) {
        return "behavior '" + behavior.id + "' uses unknown ability '" + use->abilityId + "'";
      }
    }
  }

  return std::nullopt;
}

bool MonsterTemplateManager::parseDefinition(const JsonValue& json, MonsterDefinition& out,
                                             std::string& error) {
  if (!json.isObject()) {
    error = "entry is not an object";
    return false;
  }
  if (!requireString(json, "id", out.id, error) || !requireString(json, "name", out.name, error) ||
      !readString(json, "description", out.description, error)) {
    return false;
  }

  const JsonValue& stats = json["stats"];
  if (!stats.isObject() || !stats.hasKey("maxHp")) {
    error = "missing required field 'stats.maxHp'";
    return false;
  }
  if (!readInt(stats, "maxHp", out.stats.maxHp, error) ||
      !readInt(stats, "baseArmor", out.stats.baseArmor, error) ||
      !readInt(stats, "baseDamage", out.stats.baseDamage, error) ||
      !readInt(stats, "movementRange", out.stats.movementRange, error)) {
    return false;
  }

  std::string variantName;
  if (!requireString(json, "aiVariant", variantName, error)) {
    return false;
  }
  auto variant = aiVariantFromName(variantName);
  if (!variant) {
    error = "unknown AI variant '" + variantName + "'";
    return false;
  }
  out.aiVariant = *variant;

  const JsonValue& abilities = json["abilities"];
  if (!abilities.isNull() && !abilities.isArray()) {
    error = "'abilities' must be an array";
    return false;
  }
  for (size_t i = 0; i < abilities.size(); ++i) {
    AbilityDefinition ability;
    if (!parseAbility(abilities[i], ability, error)) {
      return false;
    }
    out.abilities.push_back(std::move(ability));
  }

  if (!json["threatConfig"].isNull() &&
      !parseThreatConfig(json["threatConfig"], out.threatConfig, error)) {
    return false;
  }

  const JsonValue& behaviors = json["behaviors"];
  if (!behaviors.isNull() && !behaviors.isArray()) {
    error = "'behaviors' must be an array";
    return false;
  }
  for (size_t i = 0; i < behaviors.size(); ++i) {
    MonsterBehavior behavior;
    if (!parseBehavior(behaviors[i], behavior, error)) {
      return false;
    }
    out.behaviors.push_back(std::move(behavior));
  }

  if (!readInt(json, "spawnWeight", out.spawnWeight, error) ||
      !readInt(json, "difficulty", out.difficulty, error)) {
    return false;
  }

  const JsonValue& tags = json["tags"];
  for (size_t i = 0; tags.isArray() && i < tags.size(); ++i) {
    if (auto tag = tags[i].tryAsString()) {
      out.tags.push_back(*tag);
    }
  }
  return true;
}

bool MonsterTemplateManager::parseAbility(const JsonValue& json, AbilityDefinition& out,
                                          std::string& error) {
  if (!json.isObject()) {
    error = "ability is not an object";
    return false;
  }
  if (!requireString(json, "id", out.id, error)) {
    return false;
  }
  out.name = out.id;
  if (!readString(json, "name", out.name, error) ||
      !readString(json, "description", out.description, error)) {
    return false;
  }

  std::string variantName = "attack";
  if (!readString(json, "variant", variantName, error)) {
    return false;
  }
  auto variant = abilityVariantFromName(variantName);
  if (!variant) {
    error = "ability '" + out.id + "' has unknown variant '" + variantName + "'";
    return false;
  }
  out.variant = *variant;

  if (!readInt(json, "damage", out.damage, error) || !readInt(json, "healing", out.healing, error) ||
      !readInt(json, "range", out.range, error) || !readInt(json, "cooldown", out.cooldown, error) ||
      !readInt(json, "areaOfEffect", out.areaOfEffect, error)) {
    return false;
  }

  const JsonValue& effects = json["statusEffects"];
  for (size_t i = 0; effects.isArray() && i < effects.size(); ++i) {
    const JsonValue& effectJson = effects[i];
    std::string effectName;
    if (!requireString(effectJson, "effect", effectName, error)) {
      return false;
    }
    auto type = statusEffectFromName(effectName);
    if (!type) {
      error = "unknown status effect '" + effectName + "'";
      return false;
    }

    StatusEffectApplication application;
    application.effect = *type;
    int value = 0;
    if (!readInt(effectJson, "duration", application.duration, error) ||
        !readDouble(effectJson, "chance", application.chance, error)) {
      return false;
    }
    if (effectJson.hasKey("value")) {
      if (!readInt(effectJson, "value", value, error)) {
        return false;
      }
      application.value = value;
    }
    out.statusEffects.push_back(application);
  }
  return true;
}

bool MonsterTemplateManager::parseThreatConfig(const JsonValue& json, ThreatConfig& out,
                                               std::string& error) {
  if (!json.isObject()) {
    error = "'threatConfig' must be an object";
    return false;
  }
  return readBool(json, "enabled", out.enabled, error) &&
         readDouble(json, "decayRate", out.decayRate, error) &&
         readDouble(json, "healingMultiplier", out.healingMultiplier, error) &&
         readDouble(json, "damageMultiplier", out.damageMultiplier, error) &&
         readDouble(json, "armorMultiplier", out.armorMultiplier, error) &&
         readInt(json, "avoidLastTargetRounds", out.avoidLastTargetRounds, error) &&
         readBool(json, "fallbackToLowestHp", out.fallbackToLowestHp, error) &&
         readBool(json, "enableTiebreaker", out.enableTiebreaker, error);
}

bool MonsterTemplateManager::parseBehavior(const JsonValue& json, MonsterBehavior& out,
                                           std::string& error) {
  if (!json.isObject()) {
    error = "behavior is not an object";
    return false;
  }
  if (!requireString(json, "id", out.id, error)) {
    return false;
  }
  out.name = out.id;
  if (!readString(json, "name", out.name, error) ||
      !readInt(json, "priority", out.priority, error)) {
    return false;
  }

  const JsonValue& conditions = json["conditions"];
  for (size_t i = 0; conditions.isArray() && i < conditions.size(); ++i) {
    BehaviorCondition condition;
    if (!parseCondition(conditions[i], condition, error)) {
      return false;
    }
    out.conditions.push_back(std::move(condition));
  }

  if (!json["action"].isObject()) {
    error = "behavior '" + out.id + "' has no action";
    return false;
  }
  return parseAction(json["action"], out.action, error);
}

bool MonsterTemplateManager::parseCondition(const JsonValue& json, BehaviorCondition& out,
                                            std::string& error) {
  std::string kind;
  if (!json.isObject() || !requireString(json, "kind", kind, error)) {
    error = "condition needs a 'kind'";
    return false;
  }

  if (kind == "hp_below") {
    HpBelow condition;
    if (!readDouble(json, "value", condition.threshold, error)) return false;
    out = condition;
  } else if (kind == "hp_above") {
    HpAbove condition;
    if (!readDouble(json, "value", condition.threshold, error)) return false;
    out = condition;
  } else if (kind == "enemy_in_range") {
    EnemyInRange condition;
    if (!readInt(json, "value", condition.range, error)) return false;
    out = condition;
  } else if (kind == "ally_in_danger") {
    AllyInDanger condition;
    if (!readDouble(json, "value", condition.threshold, error)) return false;
    out = condition;
  } else if (kind == "cooldown_ready") {
    CooldownReady condition;
    if (!requireString(json, "abilityId", condition.abilityId, error)) return false;
    out = condition;
  } else if (kind == "round_at_least") {
    RoundAtLeast condition;
    if (!readInt(json, "value", condition.round, error)) return false;
    out = condition;
  } else {
    error = "unknown condition kind '" + kind + "'";
    return false;
  }
  return true;
}

bool MonsterTemplateManager::parseAction(const JsonValue& json, BehaviorAction& out,
                                         std::string& error) {
  std::string kind;
  if (!requireString(json, "kind", kind, error)) {
    error = "action needs a 'kind'";
    return false;
  }

  if (kind == "use_ability") {
    UseAbility action;
    if (!requireString(json, "abilityId", action.abilityId, error) ||
        !readSelector(json, "target", action.target, error)) {
      return false;
    }
    out = action;
  } else if (kind == "move_to") {
    MoveTo action;
    if (!readSelector(json, "target", action.target, error)) {
      return false;
    }
    const JsonValue& position = json["position"];
    if (position.isObject()) {
      auto q = position["q"].tryAsInt();
      auto r = position["r"].tryAsInt();
      if (!q || !r) {
        error = "move_to position needs integer 'q' and 'r'";
        return false;
      }
      action.position = HexCoordinate::make(*q, *r);
    }
    out = action;
  } else if (kind == "flee") {
    Flee action;
    if (!readSelector(json, "from", action.from, error)) {
      return false;
    }
    out = action;
  } else if (kind == "focus_target") {
    FocusTarget action;
    if (!readSelector(json, "target", action.target, error)) {
      return false;
    }
    out = action;
  } else if (kind == "call_for_help") {
    CallForHelp action;
    if (!readString(json, "abilityId", action.abilityId, error)) {
      return false;
    }
    out = action;
  } else if (kind == "hold") {
    out = Hold{};
  } else {
    error = "unknown action kind '" + kind + "'";
    return false;
  }
  return true;
}

} // namespace HexCrawl
