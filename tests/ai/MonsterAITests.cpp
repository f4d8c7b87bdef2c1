/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE MonsterAITests
#include <boost/test/unit_test.hpp>

#include "ai/AIDecision.hpp"
#include "ai/AIStrategy.hpp"
#include "ai/MonsterAI.hpp"
#include "ai/MonsterBehavior.hpp"
#include "ai/pathfinding/HexPathfinder.hpp"
#include "core/Logger.hpp"
#include "entities/Monster.hpp"
#include "entities/Player.hpp"
#include <memory>
#include <string>
#include <variant>
#include <vector>

using namespace HexCrawl;

struct MonsterAIFixture {
    MonsterAIFixture() { HEXCRAWL_ENABLE_BENCHMARK_MODE(); }
    ~MonsterAIFixture() { HEXCRAWL_DISABLE_BENCHMARK_MODE(); }

    HexPathfinder pathfinder;

    static EntityStats stats(int maxHp, int damage = 10, int movement = 3) {
        EntityStats s;
        s.maxHp = maxHp;
        s.baseDamage = damage;
        s.movementRange = movement;
        return s;
    }

    static std::unique_ptr<Player> player(const std::string& id, const HexCoordinate& pos,
                                          int maxHp = 100) {
        return std::make_unique<Player>(id, id, stats(maxHp), pos);
    }

    static std::unique_ptr<Monster> monster(const std::string& id, const HexCoordinate& pos,
                                            AIVariant variant,
                                            std::vector<AbilityDefinition> abilities = {},
                                            std::vector<MonsterBehavior> behaviors = {}) {
        return std::make_unique<Monster>(id, id, stats(50), pos, std::move(abilities), variant,
                                         ThreatConfig::createDefault(), std::move(behaviors));
    }

    static TargetingContext context(const CombatEntity& self,
                                    std::vector<const CombatEntity*> allies,
                                    std::vector<const CombatEntity*> enemies, int round = 1) {
        TargetingContext ctx;
        ctx.allies = std::move(allies);
        ctx.enemies = std::move(enemies);
        ctx.currentRound = round;
        ctx.occupied.insert(self.getPosition());
        for (const CombatEntity* e : ctx.allies) {
            ctx.occupied.insert(e->getPosition());
        }
        for (const CombatEntity* e : ctx.enemies) {
            ctx.occupied.insert(e->getPosition());
        }
        return ctx;
    }

    static AbilityDefinition healAbility() {
        AbilityDefinition heal;
        heal.id = "mend";
        heal.name = "Mend";
        heal.variant = AbilityVariant::Healing;
        heal.healing = 15;
        heal.range = 2;
        heal.cooldown = 2;
        return heal;
    }
};

BOOST_FIXTURE_TEST_SUITE(AIDecisionTests, MonsterAIFixture)

BOOST_AUTO_TEST_CASE(FactoryDefaults) {
    AIDecision wait = AIDecision::wait("idle");
    BOOST_CHECK(wait.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(wait.priority, AIPriority::LOW);

    AIDecision move = AIDecision::move(HexCoordinate::make(1, 0), "go");
    BOOST_CHECK(move.variant() == ActionVariant::Move);
    BOOST_CHECK_EQUAL(move.priority, AIPriority::MEDIUM);

    AIDecision attack = AIDecision::attack("p1", "hit");
    BOOST_CHECK(attack.variant() == ActionVariant::Attack);
    BOOST_CHECK_EQUAL(attack.priority, AIPriority::HIGH);
    BOOST_CHECK_CLOSE(attack.confidence, 0.8, 0.001);

    AIDecision ability = AIDecision::ability("fireball", std::string("p1"), "cast");
    BOOST_CHECK(ability.variant() == ActionVariant::Ability);
}

BOOST_AUTO_TEST_CASE(ToActionCarriesPayload) {
    CombatAction move = AIDecision::move(HexCoordinate::make(2, -1), "go").toAction("m1");
    BOOST_CHECK(move.variant == ActionVariant::Move);
    BOOST_CHECK_EQUAL(move.entityId, "m1");
    BOOST_REQUIRE(move.targetPosition.has_value());
    BOOST_CHECK(*move.targetPosition == HexCoordinate::make(2, -1));

    CombatAction attack = AIDecision::attack("p1", "hit").toAction("m1");
    BOOST_CHECK(attack.variant == ActionVariant::Attack);
    BOOST_REQUIRE(attack.targetId.has_value());
    BOOST_CHECK_EQUAL(*attack.targetId, "p1");

    CombatAction wait = AIDecision::wait("idle").toAction("m1");
    BOOST_CHECK(wait.variant == ActionVariant::Wait);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(AIStrategyTests, MonsterAIFixture)

BOOST_AUTO_TEST_CASE(CreateCoversEveryVariant) {
    for (AIVariant variant : {AIVariant::Aggressive, AIVariant::Defensive, AIVariant::Tactical,
                              AIVariant::Berserker, AIVariant::Support, AIVariant::Passive}) {
        auto strategy = AIStrategy::create(variant);
        BOOST_REQUIRE(strategy);
        BOOST_CHECK(strategy->getVariant() == variant);
        BOOST_CHECK_EQUAL(strategy->getName(), toString(variant));
    }
}

BOOST_AUTO_TEST_CASE(VariantNamesRoundTrip) {
    BOOST_CHECK(aiVariantFromName("berserker") == AIVariant::Berserker);
    BOOST_CHECK(!aiVariantFromName("cowardly").has_value());
}

BOOST_AUTO_TEST_CASE(BoardHelpers) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    auto near = player("near", HexCoordinate::make(1, 0), 100);
    auto far = player("far", HexCoordinate::make(3, 0), 100);
    near->setCurrentHp(80);
    far->setCurrentHp(20);

    std::vector<const CombatEntity*> list{far.get(), near.get()};
    BOOST_CHECK_EQUAL(AIStrategy::nearest(*self, list)->getId(), "near");
    BOOST_CHECK_EQUAL(AIStrategy::weakest(list)->getId(), "far");
    BOOST_CHECK_EQUAL(AIStrategy::strongest(list)->getId(), "near");
    BOOST_CHECK_EQUAL(AIStrategy::findById(list, "far")->getId(), "far");
    BOOST_CHECK(AIStrategy::findById(list, "ghost") == nullptr);
    BOOST_CHECK_EQUAL(AIStrategy::withinRange(*self, list, 1).size(), 1u);
    BOOST_CHECK(AIStrategy::nearest(*self, {}) == nullptr);
}

BOOST_AUTO_TEST_CASE(AggressiveAttacksAdjacentTarget) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    auto hero = player("p1", HexCoordinate::make(1, 0));

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Attack);
    BOOST_CHECK_EQUAL(std::get<AttackPayload>(decision.payload).targetId, "p1");
}

BOOST_AUTO_TEST_CASE(AggressiveMovesTowardDistantTarget) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    auto hero = player("p1", HexCoordinate::make(4, 0));

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_REQUIRE(decision.variant() == ActionVariant::Move);
    const HexCoordinate& dest = std::get<MovePayload>(decision.payload).destination;
    BOOST_CHECK(dest == HexCoordinate::make(3, 0));
    BOOST_CHECK_EQUAL(decision.reasoning, "Moving toward highest threat target");
}

BOOST_AUTO_TEST_CASE(AggressiveClosesOnNearbyEnemy) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    auto hero = player("p1", HexCoordinate::make(2, 0));

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_REQUIRE(decision.variant() == ActionVariant::Move);
    BOOST_CHECK_EQUAL(decision.priority, AIPriority::HIGH);
    BOOST_CHECK_EQUAL(hexDistance(std::get<MovePayload>(decision.payload).destination,
                                  hero->getPosition()), 1);
}

BOOST_AUTO_TEST_CASE(NoEnemiesMeansWait) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    AIDecision decision = self->makeDecision(context(*self, {}, {}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(decision.reasoning, "No targets available");
}

BOOST_AUTO_TEST_CASE(DefensiveRetreatsWhenWounded) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Defensive);
    auto hero = player("p1", HexCoordinate::make(1, 0));
    self->setCurrentHp(10);

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_REQUIRE(decision.variant() == ActionVariant::Move);
    BOOST_CHECK_EQUAL(decision.priority, AIPriority::HIGH);
    BOOST_CHECK_GT(hexDistance(std::get<MovePayload>(decision.payload).destination,
                               hero->getPosition()), 1);
}

BOOST_AUTO_TEST_CASE(DefensiveCounterattacksWhenHealthy) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Defensive);
    auto hero = player("p1", HexCoordinate::make(1, 0));

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Attack);
    BOOST_CHECK_EQUAL(decision.priority, AIPriority::MEDIUM);
}

BOOST_AUTO_TEST_CASE(PassiveWaitsUnlessThreatened) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Passive);
    auto hero = player("p1", HexCoordinate::make(3, 0));

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(decision.priority, AIPriority::MINIMAL);

    auto adjacent = player("p2", HexCoordinate::make(0, 1));
    decision = self->makeDecision(context(*self, {}, {adjacent.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Attack);
}

BOOST_AUTO_TEST_CASE(BerserkerEscalatesWhenHurt) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Berserker);
    auto hero = player("p1", HexCoordinate::make(1, 0));

    AIDecision healthy = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(healthy.variant() == ActionVariant::Attack);
    BOOST_CHECK_EQUAL(healthy.priority, AIPriority::HIGH);

    self->setCurrentHp(20);
    AIDecision hurt = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(hurt.variant() == ActionVariant::Attack);
    BOOST_CHECK_EQUAL(hurt.priority, AIPriority::EMERGENCY);
}

BOOST_AUTO_TEST_CASE(SupportHealsWoundedAlly) {
    auto self = monster("shaman", HexCoordinate::make(0, 0), AIVariant::Support, {healAbility()});
    auto ally = monster("brute", HexCoordinate::make(1, 0), AIVariant::Aggressive);
    auto hero = player("p1", HexCoordinate::make(4, 0));
    ally->setCurrentHp(10);

    AIDecision decision =
        self->makeDecision(context(*self, {ally.get()}, {hero.get()}), pathfinder);
    BOOST_REQUIRE(decision.variant() == ActionVariant::Ability);
    const auto& payload = std::get<AbilityPayload>(decision.payload);
    BOOST_CHECK_EQUAL(payload.abilityId, "mend");
    BOOST_REQUIRE(payload.targetId.has_value());
    BOOST_CHECK_EQUAL(*payload.targetId, "brute");
}

BOOST_AUTO_TEST_CASE(SupportFallsBackToDefensiveWhenNoOneIsHurt) {
    auto self = monster("shaman", HexCoordinate::make(0, 0), AIVariant::Support, {healAbility()});
    auto ally = monster("brute", HexCoordinate::make(1, 0), AIVariant::Aggressive);
    auto hero = player("p1", HexCoordinate::make(4, 0));

    AIDecision decision =
        self->makeDecision(context(*self, {ally.get()}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(decision.reasoning, "Defensive stance");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MonsterBehaviorTests, MonsterAIFixture)

BOOST_AUTO_TEST_CASE(KindNames) {
    BOOST_CHECK_EQUAL(conditionKindName(BehaviorCondition{HpBelow{0.3}}), "hp_below");
    BOOST_CHECK_EQUAL(conditionKindName(BehaviorCondition{CooldownReady{"x"}}), "cooldown_ready");
    BOOST_CHECK_EQUAL(actionKindName(BehaviorAction{Flee{}}), "flee");
    BOOST_CHECK_EQUAL(actionKindName(BehaviorAction{Hold{}}), "hold");
    BOOST_CHECK_EQUAL(toString(TargetSelector::WeakestEnemy), "weakest_enemy");
    BOOST_CHECK(targetSelectorFromName("self") == TargetSelector::Self);
    BOOST_CHECK(!targetSelectorFromName("everyone").has_value());
}

BOOST_AUTO_TEST_CASE(HighestPriorityMatchingBehaviorWins) {
    MonsterBehavior hold;
    hold.id = "hold_ground";
    hold.name = "Hold Ground";
    hold.priority = 1;
    hold.action = Hold{};

    MonsterBehavior lateHold;
    lateHold.id = "late_hold";
    lateHold.name = "Late Hold";
    lateHold.priority = 5;
    lateHold.conditions = {RoundAtLeast{3}};
    lateHold.action = Hold{};

    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive, {},
                        {hold, lateHold});
    auto hero = player("p1", HexCoordinate::make(1, 0));

    AIDecision early = self->makeDecision(context(*self, {}, {hero.get()}, 1), pathfinder);
    BOOST_CHECK(early.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(early.reasoning, "Behavior: Hold Ground");

    AIDecision late = self->makeDecision(context(*self, {}, {hero.get()}, 3), pathfinder);
    BOOST_CHECK_EQUAL(late.reasoning, "Behavior: Late Hold");
}

BOOST_AUTO_TEST_CASE(UnmetConditionsFallThroughToVariant) {
    MonsterBehavior desperate;
    desperate.id = "desperate";
    desperate.name = "Desperate";
    desperate.priority = 10;
    desperate.conditions = {HpBelow{0.2}};
    desperate.action = Hold{};

    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive, {}, {desperate});
    auto hero = player("p1", HexCoordinate::make(1, 0));

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Attack);

    self->setCurrentHp(5);
    decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(decision.reasoning, "Behavior: Desperate");
}

BOOST_AUTO_TEST_CASE(AddAndRemoveBehaviors) {
    MonsterAI ai(AIVariant::Passive);
    MonsterBehavior low;
    low.id = "low";
    low.priority = 1;
    MonsterBehavior high;
    high.id = "high";
    high.priority = 9;

    ai.addBehavior(low);
    ai.addBehavior(high);
    BOOST_REQUIRE_EQUAL(ai.getBehaviors().size(), 2u);
    BOOST_CHECK_EQUAL(ai.getBehaviors().front().id, "high");

    high.priority = 0;
    ai.addBehavior(high);
    BOOST_CHECK_EQUAL(ai.getBehaviors().size(), 2u);
    BOOST_CHECK_EQUAL(ai.getBehaviors().front().id, "low");

    BOOST_CHECK(ai.removeBehavior("low"));
    BOOST_CHECK(!ai.removeBehavior("low"));
    BOOST_CHECK_EQUAL(ai.getBehaviors().size(), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MonsterStateTests, MonsterAIFixture)

BOOST_AUTO_TEST_CASE(StunnedMonsterWaits) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    auto hero = player("p1", HexCoordinate::make(1, 0));
    self->statusEffects().addEffect(StatusEffectType::Stunned, 2);

    AIDecision decision = self->makeDecision(context(*self, {}, {hero.get()}), pathfinder);
    BOOST_CHECK(decision.variant() == ActionVariant::Wait);
    BOOST_CHECK_EQUAL(decision.reasoning, "Unable to act");
}

BOOST_AUTO_TEST_CASE(DecisionHistoryIsBounded) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Passive);
    for (int i = 0; i < 25; ++i) {
        self->makeDecision(context(*self, {}, {}), pathfinder);
    }

    BOOST_CHECK_EQUAL(self->ai().getDecisionHistory().size(), MonsterAI::MAX_DECISION_HISTORY);
    BOOST_REQUIRE(self->ai().getLastDecision().has_value());

    DecisionStats stats = self->ai().getDecisionStats();
    BOOST_CHECK_EQUAL(stats.totalDecisions, 20);
    BOOST_CHECK_EQUAL(stats.byVariant[ActionVariant::Wait], 20);
    BOOST_CHECK_CLOSE(stats.averagePriority, static_cast<double>(AIPriority::MINIMAL), 0.001);
}

BOOST_AUTO_TEST_CASE(DamageBuildsThreatAndRoundsDecayIt) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Aggressive);
    self->recordDamageFrom("p1", 20, 2);
    BOOST_CHECK_CLOSE(self->threat().getThreat("p1"), 40.0, 0.001);

    self->recordDamageFrom("p2", 0, 2);
    BOOST_CHECK_EQUAL(self->threat().getThreat("p2"), 0.0);

    self->endRound();
    BOOST_CHECK_CLOSE(self->threat().getThreat("p1"), 36.0, 0.001);
}

BOOST_AUTO_TEST_CASE(ResetForEncounterClearsMemory) {
    auto self = monster("m1", HexCoordinate::make(0, 0), AIVariant::Passive);
    self->recordDamageFrom("p1", 20, 0);
    self->makeDecision(context(*self, {}, {}), pathfinder);
    self->setCurrentHp(5);

    self->resetForEncounter();
    BOOST_CHECK_EQUAL(self->threat().getThreat("p1"), 0.0);
    BOOST_CHECK(self->ai().getDecisionHistory().empty());
    BOOST_CHECK(!self->ai().getLastDecision().has_value());
    BOOST_CHECK_EQUAL(self->getCurrentHp(), self->getMaxHp());
}

BOOST_AUTO_TEST_SUITE_END()
