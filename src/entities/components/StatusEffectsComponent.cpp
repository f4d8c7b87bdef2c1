/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/components/StatusEffectsComponent.hpp"
#include <algorithm>
#include <array>

namespace HexCrawl {

namespace {

constexpr std::array<StatusEffectInfo, 12> EFFECT_INFO = {{
    {"poison", "Takes damage each turn", EffectCategory::Debuff, true, 5},
    {"regeneration", "Heals each turn", EffectCategory::Buff, true, 3},
    {"stunned", "Cannot act", EffectCategory::Debuff, false, 1},
    {"shielded", "Increases armor", EffectCategory::Buff, true, 10},
    {"vulnerable", "Takes increased damage", EffectCategory::Debuff, false, 1},
    {"enraged", "Deals increased damage", EffectCategory::Buff, false, 1},
    {"weakened", "Deals reduced damage", EffectCategory::Debuff, false, 1},
    {"invisible", "Cannot be targeted", EffectCategory::Buff, false, 1},
    {"burning", "Takes fire damage each turn", EffectCategory::Debuff, true, 3},
    {"frozen", "Cannot move or act", EffectCategory::Debuff, false, 1},
    {"blessed", "Enhanced healing received", EffectCategory::Buff, false, 1},
    {"cursed", "Reduced healing received", EffectCategory::Debuff, false, 1},
}};

} // anonymous namespace

const StatusEffectInfo& getStatusEffectInfo(StatusEffectType type) {
    return EFFECT_INFO[static_cast<size_t>(type)];
}

std::optional<StatusEffectType> statusEffectFromName(const std::string& name) {
    for (size_t i = 0; i < EFFECT_INFO.size(); ++i) {
        if (name == EFFECT_INFO[i].name) {
            return static_cast<StatusEffectType>(i);
        }
    }
    return std::nullopt;
}

std::string toString(StatusEffectType type) {
    return getStatusEffectInfo(type).name;
}

EffectApplyResult StatusEffectsComponent::addEffect(StatusEffectType type, int duration,
                                                    std::optional<int> value) {
    const StatusEffectInfo& info = getStatusEffectInfo(type);
    if (duration <= 0) {
        return {false, std::string("Invalid duration for ") + info.name, 0};
    }

    auto it = m_effects.find(type);
    if (it != m_effects.end()) {
        StatusEffect& existing = it->second;

        if (info.stackable) {
            if (existing.stacks >= info.maxStacks) {
                return {false, std::string(info.name) + " already at maximum stacks (" +
                                   std::to_string(info.maxStacks) + ")",
                        existing.stacks};
            }
            ++existing.stacks;
            existing.duration = std::max(existing.duration, duration);
            if (!existing.baseValue) {
                existing.baseValue = value;
            }
            return {true, "", existing.stacks};
        }

        const bool longer = duration > existing.duration;
        const bool stronger = value && *value > existing.baseValue.value_or(0);
        if (!longer && !stronger) {
            return {false, std::string(info.name) + " already active with better effect", 1};
        }
        m_effects.erase(it);
    }

    StatusEffect effect;
    effect.type = type;
    effect.duration = duration;
    effect.baseValue = value;
    m_effects.emplace(type, effect);
    return {true, "", 1};
}

bool StatusEffectsComponent::removeEffect(StatusEffectType type) {
    return m_effects.erase(type) > 0;
}

bool StatusEffectsComponent::hasEffect(StatusEffectType type) const {
    return m_effects.find(type) != m_effects.end();
}

const StatusEffect* StatusEffectsComponent::getEffect(StatusEffectType type) const {
    auto it = m_effects.find(type);
    return it != m_effects.end() ? &it->second : nullptr;
}

int StatusEffectsComponent::getStacks(StatusEffectType type) const {
    const StatusEffect* effect = getEffect(type);
    return effect ? effect->stacks : 0;
}

std::vector<StatusEffect> StatusEffectsComponent::getEffects() const {
    std::vector<StatusEffect> effects;
    effects.reserve(m_effects.size());
    for (const auto& [type, effect] : m_effects) {
        effects.push_back(effect);
    }
    return effects;
}

std::vector<StatusEffect> StatusEffectsComponent::getEffectsByCategory(EffectCategory category) const {
    std::vector<StatusEffect> effects;
    for (const auto& [type, effect] : m_effects) {
        if (getStatusEffectInfo(type).category == category) {
            effects.push_back(effect);
        }
    }
    return effects;
}

std::vector<StatusEffectType> StatusEffectsComponent::clearEffects() {
    std::vector<StatusEffectType> cleared;
    cleared.reserve(m_effects.size());
    for (const auto& [type, effect] : m_effects) {
        cleared.push_back(type);
    }
    m_effects.clear();
    return cleared;
}

std::vector<StatusEffectType> StatusEffectsComponent::clearEffectsByCategory(EffectCategory category) {
    std::vector<StatusEffectType> cleared;
    for (auto it = m_effects.begin(); it != m_effects.end();) {
        if (getStatusEffectInfo(it->first).category == category) {
            cleared.push_back(it->first);
            it = m_effects.erase(it);
        } else {
            ++it;
        }
    }
    return cleared;
}

StatusEffectRoundResult StatusEffectsComponent::processRound() {
    StatusEffectRoundResult result;

    for (auto it = m_effects.begin(); it != m_effects.end();) {
        StatusEffect& effect = it->second;
        const int value = effect.value();

        switch (effect.type) {
        case StatusEffectType::Poison:
        case StatusEffectType::Burning:
            if (value > 0) {
                result.ticks.push_back({toString(effect.type) + "_damage", value});
            }
            break;
        case StatusEffectType::Regeneration:
            if (value > 0) {
                result.ticks.push_back({"regeneration_heal", value});
            }
            break;
        default:
            break;
        }

        if (--effect.duration <= 0) {
            result.expired.push_back(effect.type);
            it = m_effects.erase(it);
        } else {
            ++it;
        }
    }

    return result;
}

bool StatusEffectsComponent::canAct() const {
    return !hasEffect(StatusEffectType::Stunned) && !hasEffect(StatusEffectType::Frozen);
}

bool StatusEffectsComponent::canMove() const {
    return !hasEffect(StatusEffectType::Stunned) && !hasEffect(StatusEffectType::Frozen);
}

bool StatusEffectsComponent::canBeTargeted() const {
    return !hasEffect(StatusEffectType::Invisible);
}

int StatusEffectsComponent::valueOr(StatusEffectType type, int fallback) const {
    const StatusEffect* effect = getEffect(type);
    if (effect == nullptr || !effect->baseValue || *effect->baseValue == 0) {
        return fallback;
    }
    return effect->value();
}

double StatusEffectsComponent::getDamageModifier() const {
    double modifier = 1.0;
    if (hasEffect(StatusEffectType::Enraged)) {
        modifier *= 1.0 + valueOr(StatusEffectType::Enraged, 50) / 100.0;
    }
    if (hasEffect(StatusEffectType::Weakened)) {
        modifier *= 1.0 - valueOr(StatusEffectType::Weakened, 25) / 100.0;
    }
    return modifier;
}

double StatusEffectsComponent::getDamageTakenModifier() const {
    double modifier = 1.0;
    if (hasEffect(StatusEffectType::Vulnerable)) {
        modifier *= 1.0 + valueOr(StatusEffectType::Vulnerable, 50) / 100.0;
    }
    return modifier;
}

double StatusEffectsComponent::getHealingModifier() const {
    double modifier = 1.0;
    if (hasEffect(StatusEffectType::Blessed)) {
        modifier *= 1.0 + valueOr(StatusEffectType::Blessed, 50) / 100.0;
    }
    if (hasEffect(StatusEffectType::Cursed)) {
        modifier *= 1.0 - valueOr(StatusEffectType::Cursed, 50) / 100.0;
    }
    return modifier;
}

int StatusEffectsComponent::getArmorBonus() const {
    const StatusEffect* shield = getEffect(StatusEffectType::Shielded);
    return shield ? shield->value() : 0;
}

} // namespace HexCrawl
