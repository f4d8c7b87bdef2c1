/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef THREAT_MANAGER_HPP
#define THREAT_MANAGER_HPP

#include "ai/threat/ThreatConfig.hpp"
#include <boost/container/flat_map.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace HexCrawl {

/**
 * @brief What the targeting engine needs to know about a candidate
 */
struct TargetCandidate {
    std::string id;
    std::string name;
    int currentHp{0};
    int maxHp{1};
    bool alive{true};

    double hpPercent() const {
        return maxHp > 0 ? static_cast<double>(currentHp) / maxHp : 0.0;
    }
};

struct TargetingResult {
    std::optional<std::string> targetId;
    std::string reason;
    double confidence{0.0};

    bool hasTarget() const { return targetId.has_value(); }
};

/**
 * @brief Read-only view of one threat table row
 */
struct ThreatEntry {
    std::string entityId;
    double threat{0.0};
    int lastUpdatedRound{0};
};

/**
 * @brief Per-monster threat table with decay and anti-repetition targeting
 *
 * One instance per monster. The table is keyed by candidate id in a sorted
 * flat map so iteration order never depends on insertion order.
 *
 * Round protocol: selectTarget() during the decision phase, addThreat()
 * while actions resolve, processRound() once at the end of the round.
 */
class ThreatManager {
public:
    static constexpr double MINIMUM_THREAT_THRESHOLD = 0.1;
    static constexpr double TIE_EPSILON = 0.01;
    static constexpr size_t MAX_HISTORY_PER_ENTITY = 10;

    explicit ThreatManager(const ThreatConfig& config = ThreatConfig::createDefault());

    bool isEnabled() const { return m_config.enabled; }
    const ThreatConfig& getConfig() const { return m_config; }

    void initializeThreat(const std::string& entityId);

    /**
     * @brief Adds the raw threat of an event to its source's entry
     * @return true if the update changed the table
     *
     * Invalid updates are logged and ignored; so is everything while the
     * manager is disabled.
     */
    bool addThreat(const ThreatUpdate& update);

    double getThreat(const std::string& entityId) const;

    // Values at or below the minimum threshold remove the entry
    void setThreat(const std::string& entityId, double value);

    void removeEntity(const std::string& entityId);
    void clearAllThreat();

    void trackTarget(const std::string& entityId);
    bool wasRecentlyTargeted(const std::string& entityId) const;

    /**
     * @brief Picks a target among the living candidates
     *
     * Entries for ids missing from the candidate list are purged first.
     * Recently targeted candidates are skipped unless nobody else is left.
     * The chosen candidate is tracked for anti-repetition.
     */
    TargetingResult selectTarget(const std::vector<TargetCandidate>& candidates);

    /**
     * @brief Advances the round counter and applies decay
     */
    void processRound();

    void applyThreatReduction(double reductionRate);

    // Must only be called between encounters
    void resetForEncounter();

    std::vector<ThreatEntry> getTopThreats(size_t count = 3) const;
    std::vector<ThreatEntry> getAllThreats() const;
    std::vector<ThreatUpdate> getThreatHistory(const std::string& entityId) const;
    double getTotalThreatGenerated(const std::string& entityId) const;

    int getRoundsActive() const { return m_roundsActive; }

    // Most recent first
    std::vector<std::string> getLastTargets() const;

private:
    struct TrackedThreat {
        double threat{0.0};
        int lastUpdatedRound{0};
        std::vector<ThreatUpdate> history;
    };

    ThreatConfig m_config;
    boost::container::flat_map<std::string, TrackedThreat> m_threatTable;
    // (entity id, round it was selected), most recent first
    std::vector<std::pair<std::string, int>> m_lastTargets;
    int m_roundsActive{0};

    void decayBy(double rate);
    void cleanupMissingEntities(const std::vector<TargetCandidate>& living);
    TargetingResult selectFallback(const std::vector<const TargetCandidate*>& pool);
    ThreatEntry toEntry(const std::string& entityId, const TrackedThreat& tracked) const;
};

} // namespace HexCrawl

#endif // THREAT_MANAGER_HPP
