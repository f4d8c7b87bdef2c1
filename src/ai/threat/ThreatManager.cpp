/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/threat/ThreatManager.hpp"
#include "ai/threat/ThreatCalculator.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <unordered_set>

namespace HexCrawl {

namespace {
std::string oneDecimal(double value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1) << value;
    return out.str();
}
} // anonymous namespace

ThreatManager::ThreatManager(const ThreatConfig& config) : m_config(config) {}

void ThreatManager::initializeThreat(const std::string& entityId) {
    if (!m_config.enabled) {
        return;
    }
    if (m_threatTable.find(entityId) == m_threatTable.end()) {
        TrackedThreat tracked;
        tracked.lastUpdatedRound = m_roundsActive;
        m_threatTable.emplace(entityId, std::move(tracked));
    }
}

bool ThreatManager::addThreat(const ThreatUpdate& update) {
    if (!m_config.enabled) {
        return false;
    }

    const ThreatValidation validation = ThreatCalculator::validateThreatUpdate(update);
    if (!validation.valid) {
        THREAT_WARN("Ignoring threat update from '" + update.entityId + "': " + validation.reason);
        return false;
    }

    const double rawThreat = ThreatCalculator::calculateRawThreat(update, m_config);
    if (rawThreat <= 0.0) {
        return false;
    }

    initializeThreat(update.entityId);
    TrackedThreat& tracked = m_threatTable[update.entityId];
    tracked.threat += rawThreat;
    tracked.lastUpdatedRound = m_roundsActive;
    tracked.history.push_back(update);
    if (tracked.history.size() > MAX_HISTORY_PER_ENTITY) {
        tracked.history.erase(tracked.history.begin());
    }

    THREAT_DEBUG(update.entityId + " +" + oneDecimal(rawThreat) + " threat (" +
                 update.source + "), total " + oneDecimal(tracked.threat));
    return true;
}

double ThreatManager::getThreat(const std::string& entityId) const {
    auto it = m_threatTable.find(entityId);
    return it != m_threatTable.end() ? it->second.threat : 0.0;
}

void ThreatManager::setThreat(const std::string& entityId, double value) {
    if (!m_config.enabled) {
        return;
    }
    if (value <= MINIMUM_THREAT_THRESHOLD) {
        m_threatTable.erase(entityId);
        return;
    }
    initializeThreat(entityId);
    TrackedThreat& tracked = m_threatTable[entityId];
    tracked.threat = value;
    tracked.lastUpdatedRound = m_roundsActive;
}

void ThreatManager::removeEntity(const std::string& entityId) {
    m_threatTable.erase(entityId);
    m_lastTargets.erase(std::remove_if(m_lastTargets.begin(), m_lastTargets.end(),
                                       [&entityId](const auto& entry) {
                                           return entry.first == entityId;
                                       }),
                        m_lastTargets.end());
}

void ThreatManager::clearAllThreat() {
    m_threatTable.clear();
    m_lastTargets.clear();
}

void ThreatManager::trackTarget(const std::string& entityId) {
    if (!m_config.enabled || entityId.empty()) {
        return;
    }

    m_lastTargets.erase(std::remove_if(m_lastTargets.begin(), m_lastTargets.end(),
                                       [&entityId](const auto& entry) {
                                           return entry.first == entityId;
                                       }),
                        m_lastTargets.end());
    m_lastTargets.insert(m_lastTargets.begin(), {entityId, m_roundsActive});

    const size_t maxTracked = static_cast<size_t>(std::max(1, m_config.avoidLastTargetRounds));
    if (m_lastTargets.size() > maxTracked) {
        m_lastTargets.resize(maxTracked);
    }
}

bool ThreatManager::wasRecentlyTargeted(const std::string& entityId) const {
    if (!m_config.enabled || m_config.avoidLastTargetRounds <= 0) {
        return false;
    }
    for (const auto& [id, round] : m_lastTargets) {
        if (id == entityId) {
            return m_roundsActive - round <= m_config.avoidLastTargetRounds;
        }
    }
    return false;
}

TargetingResult ThreatManager::selectTarget(const std::vector<TargetCandidate>& candidates) {
    std::vector<TargetCandidate> living;
    living.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        if (candidate.alive && candidate.currentHp > 0) {
            living.push_back(candidate);
        }
    }

    if (!m_config.enabled || living.empty()) {
        return {std::nullopt, "No threat system or no available targets", 0.0};
    }

    cleanupMissingEntities(living);

    std::vector<const TargetCandidate*> pool;
    for (const auto& candidate : living) {
        if (!wasRecentlyTargeted(candidate.id)) {
            pool.push_back(&candidate);
        }
    }
    // Everyone was targeted recently
    if (pool.empty()) {
        for (const auto& candidate : living) {
            pool.push_back(&candidate);
        }
    }

    double maxThreat = 0.0;
    std::vector<const TargetCandidate*> withThreat;
    for (const TargetCandidate* candidate : pool) {
        const double threat = getThreat(candidate->id);
        if (threat > MINIMUM_THREAT_THRESHOLD) {
            withThreat.push_back(candidate);
            maxThreat = std::max(maxThreat, threat);
        }
    }

    if (withThreat.empty()) {
        return selectFallback(pool);
    }

    std::vector<const TargetCandidate*> tied;
    for (const TargetCandidate* candidate : withThreat) {
        if (std::fabs(getThreat(candidate->id) - maxThreat) < TIE_EPSILON) {
            tied.push_back(candidate);
        }
    }

    TargetingResult result;
    if (tied.size() == 1) {
        result.targetId = tied.front()->id;
        result.reason = "Selected target with highest threat: " + oneDecimal(maxThreat);
        result.confidence = 0.9;
    } else if (m_config.enableTiebreaker) {
        const auto lowestId = std::min_element(tied.begin(), tied.end(),
                                               [](const TargetCandidate* a, const TargetCandidate* b) {
                                                   return a->id < b->id;
                                               });
        result.targetId = (*lowestId)->id;
        result.reason = "Tie between " + std::to_string(tied.size()) +
                        " targets broken by id (threat: " + oneDecimal(maxThreat) + ")";
        result.confidence = 0.8;
    } else {
        result.targetId = tied.front()->id;
        result.reason = "First of " + std::to_string(tied.size()) +
                        " tied targets (threat: " + oneDecimal(maxThreat) + ")";
        result.confidence = 0.7;
    }

    trackTarget(*result.targetId);
    return result;
}

TargetingResult ThreatManager::selectFallback(const std::vector<const TargetCandidate*>& pool) {
    TargetingResult result;

    if (m_config.fallbackToLowestHp) {
        const TargetCandidate* lowest = pool.front();
        for (const TargetCandidate* candidate : pool) {
            if (candidate->hpPercent() < lowest->hpPercent()) {
                lowest = candidate;
            }
        }
        result.targetId = lowest->id;
        result.reason = "No threat found, targeting lowest HP (" +
                        oneDecimal(lowest->hpPercent() * 100.0) + "% HP)";
        result.confidence = 0.5;
    } else {
        const auto first = std::min_element(pool.begin(), pool.end(),
                                            [](const TargetCandidate* a, const TargetCandidate* b) {
                                                return a->id < b->id;
                                            });
        result.targetId = (*first)->id;
        result.reason = "No threat found, first target by id (" +
                        std::to_string(pool.size()) + " options)";
        result.confidence = 0.3;
    }

    trackTarget(*result.targetId);
    return result;
}

void ThreatManager::processRound() {
    if (!m_config.enabled) {
        return;
    }
    ++m_roundsActive;
    decayBy(m_config.decayRate);
}

void ThreatManager::applyThreatReduction(double reductionRate) {
    if (!m_config.enabled) {
        return;
    }
    decayBy(reductionRate);
}

void ThreatManager::decayBy(double rate) {
    for (auto it = m_threatTable.begin(); it != m_threatTable.end();) {
        it->second.threat *= 1.0 - rate;
        if (it->second.threat <= MINIMUM_THREAT_THRESHOLD) {
            THREAT_DEBUG("Threat for " + it->first + " decayed away");
            it = m_threatTable.erase(it);
        } else {
            ++it;
        }
    }
}

void ThreatManager::cleanupMissingEntities(const std::vector<TargetCandidate>& living) {
    std::unordered_set<std::string> ids;
    for (const auto& candidate : living) {
        ids.insert(candidate.id);
    }

    for (auto it = m_threatTable.begin(); it != m_threatTable.end();) {
        if (ids.count(it->first) == 0) {
            it = m_threatTable.erase(it);
        } else {
            ++it;
        }
    }

    m_lastTargets.erase(std::remove_if(m_lastTargets.begin(), m_lastTargets.end(),
                                       [&ids](const auto& entry) {
                                           return ids.count(entry.first) == 0;
                                       }),
                        m_lastTargets.end());
}

void ThreatManager::resetForEncounter() {
    clearAllThreat();
    m_roundsActive = 0;
}

ThreatEntry ThreatManager::toEntry(const std::string& entityId, const TrackedThreat& tracked) const {
    return ThreatEntry{entityId, tracked.threat, tracked.lastUpdatedRound};
}

std::vector<ThreatEntry> ThreatManager::getAllThreats() const {
    std::vector<ThreatEntry> entries;
    entries.reserve(m_threatTable.size());
    for (const auto& [id, tracked] : m_threatTable) {
        entries.push_back(toEntry(id, tracked));
    }
    return entries;
}

std::vector<ThreatEntry> ThreatManager::getTopThreats(size_t count) const {
    std::vector<ThreatEntry> entries = getAllThreats();
    // Stable so equal scores stay in id order
    std::stable_sort(entries.begin(), entries.end(),
                     [](const ThreatEntry& a, const ThreatEntry& b) { return a.threat > b.threat; });
    if (entries.size() > count) {
        entries.resize(count);
    }
    return entries;
}

std::vector<ThreatUpdate> ThreatManager::getThreatHistory(const std::string& entityId) const {
    auto it = m_threatTable.find(entityId);
    if (it == m_threatTable.end()) {
        return {};
    }
    return it->second.history;
}

double ThreatManager::getTotalThreatGenerated(const std::string& entityId) const {
    return ThreatCalculator::combineThreatUpdates(getThreatHistory(entityId), m_config);
}

std::vector<std::string> ThreatManager::getLastTargets() const {
    std::vector<std::string> ids;
    ids.reserve(m_lastTargets.size());
    for (const auto& entry : m_lastTargets) {
        ids.push_back(entry.first);
    }
    return ids;
}

} // namespace HexCrawl
