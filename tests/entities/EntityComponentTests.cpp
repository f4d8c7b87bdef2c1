/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityComponentTests
#include <boost/test/unit_test.hpp>

#include "core/Logger.hpp"
#include "entities/Player.hpp"
#include "entities/components/AbilitiesComponent.hpp"
#include "entities/components/MovementComponent.hpp"
#include "entities/components/StatsComponent.hpp"
#include "entities/components/StatusEffectsComponent.hpp"
#include <algorithm>
#include <stdexcept>

using namespace HexCrawl;

struct EntityFixture {
    EntityFixture() { HEXCRAWL_ENABLE_BENCHMARK_MODE(); }
    ~EntityFixture() { HEXCRAWL_DISABLE_BENCHMARK_MODE(); }

    static EntityStats makeStats(int maxHp, int armor, int damage, int movement = 3) {
        EntityStats stats;
        stats.maxHp = maxHp;
        stats.baseArmor = armor;
        stats.baseDamage = damage;
        stats.movementRange = movement;
        return stats;
    }

    static AbilityDefinition makeAbility(const std::string& id, int cooldown, int damage = 10) {
        AbilityDefinition ability;
        ability.id = id;
        ability.name = id;
        ability.damage = damage;
        ability.cooldown = cooldown;
        return ability;
    }
};

BOOST_FIXTURE_TEST_SUITE(StatsComponentTests, EntityFixture)

BOOST_AUTO_TEST_CASE(TestInvalidMaxHpRejected) {
    BOOST_CHECK_THROW(StatsComponent{makeStats(0, 0, 10)}, std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestArmorReduction) {
    StatsComponent stats(makeStats(100, 5, 10));
    DamageResult result = stats.takeDamage(20, "test");
    BOOST_CHECK_EQUAL(result.blocked, 10);
    BOOST_CHECK_EQUAL(result.damageDealt, 10);
    BOOST_CHECK_EQUAL(stats.getCurrentHp(), 90);
    BOOST_CHECK(!result.died);
}

BOOST_AUTO_TEST_CASE(TestArmorCapAndMinimumDamage) {
    StatsComponent stats(makeStats(100, 20, 10));
    DamageResult result = stats.takeDamage(5);
    BOOST_CHECK_EQUAL(result.blocked, 4);
    BOOST_CHECK_EQUAL(result.damageDealt, 1);
}

BOOST_AUTO_TEST_CASE(TestLethalDamageAndHealing) {
    StatsComponent stats(makeStats(30, 0, 10));
    BOOST_CHECK_EQUAL(stats.takeDamage(0).damageDealt, 0);

    DamageResult lethal = stats.takeDamage(50);
    BOOST_CHECK(lethal.died);
    BOOST_CHECK_EQUAL(lethal.damageDealt, 30);
    BOOST_CHECK(!stats.isAlive());

    // Dead entities neither take damage nor heal
    BOOST_CHECK_EQUAL(stats.takeDamage(5).damageDealt, 0);
    BOOST_CHECK_EQUAL(stats.heal(10).amountHealed, 0);

    stats.revive(0.5);
    BOOST_CHECK_EQUAL(stats.getCurrentHp(), 15);
    HealResult healed = stats.heal(100);
    BOOST_CHECK_EQUAL(healed.amountHealed, 15);
    BOOST_CHECK_EQUAL(healed.newHp, 30);
}

BOOST_AUTO_TEST_CASE(TestHpClampingAndWounds) {
    StatsComponent stats(makeStats(40, 0, 10));
    stats.setCurrentHp(500);
    BOOST_CHECK_EQUAL(stats.getCurrentHp(), 40);
    stats.setCurrentHp(-3);
    BOOST_CHECK_EQUAL(stats.getCurrentHp(), 0);

    stats.setCurrentHp(10);
    BOOST_CHECK(stats.isCriticallyWounded());
    BOOST_CHECK_CLOSE(stats.getHpPercentage(), 0.25, 0.0001);
}

BOOST_AUTO_TEST_CASE(TestDamageOutputModifier) {
    StatsComponent stats(makeStats(40, 0, 15));
    BOOST_CHECK_EQUAL(stats.calculateDamageOutput(), 15);
    stats.setDamageModifier(1.5);
    BOOST_CHECK_EQUAL(stats.calculateDamageOutput(), 22);
    stats.setDamageModifier(0.0);
    BOOST_CHECK_CLOSE(stats.getDamageModifier(), StatsComponent::MIN_DAMAGE_MODIFIER, 0.0001);
    stats.resetToStartingStats();
    BOOST_CHECK_CLOSE(stats.getDamageModifier(), 1.0, 0.0001);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(StatusEffectsComponentTests, EntityFixture)

BOOST_AUTO_TEST_CASE(TestInvalidDuration) {
    StatusEffectsComponent effects;
    BOOST_CHECK(!effects.addEffect(StatusEffectType::Poison, 0, 3).success);
    BOOST_CHECK(!effects.hasEffects());
}

BOOST_AUTO_TEST_CASE(TestStackingKeepsBaseAndLongestDuration) {
    StatusEffectsComponent effects;
    BOOST_CHECK_EQUAL(effects.addEffect(StatusEffectType::Poison, 3, 2).stacks, 1);
    EffectApplyResult second = effects.addEffect(StatusEffectType::Poison, 5, 4);
    BOOST_CHECK(second.success);
    BOOST_CHECK_EQUAL(second.stacks, 2);

    const StatusEffect* poison = effects.getEffect(StatusEffectType::Poison);
    BOOST_REQUIRE(poison != nullptr);
    BOOST_CHECK_EQUAL(poison->duration, 5);
    BOOST_CHECK_EQUAL(poison->value(), 4);

    StatusEffectRoundResult round = effects.processRound();
    BOOST_REQUIRE_EQUAL(round.ticks.size(), 1u);
    BOOST_CHECK_EQUAL(round.ticks.front().type, "poison_damage");
    BOOST_CHECK_EQUAL(round.ticks.front().value, 4);
    BOOST_CHECK_EQUAL(effects.getEffect(StatusEffectType::Poison)->duration, 4);
}

BOOST_AUTO_TEST_CASE(TestMaximumStacks) {
    StatusEffectsComponent effects;
    for (int i = 0; i < 5; ++i) {
        BOOST_CHECK(effects.addEffect(StatusEffectType::Poison, 2, 1).success);
    }
    EffectApplyResult overflow = effects.addEffect(StatusEffectType::Poison, 2, 1);
    BOOST_CHECK(!overflow.success);
    BOOST_CHECK_EQUAL(overflow.stacks, 5);
}

BOOST_AUTO_TEST_CASE(TestNonStackableReplacement) {
    StatusEffectsComponent effects;
    BOOST_CHECK(effects.addEffect(StatusEffectType::Stunned, 1).success);
    BOOST_CHECK(!effects.addEffect(StatusEffectType::Stunned, 1).success);
    BOOST_CHECK(effects.addEffect(StatusEffectType::Stunned, 2).success);
    BOOST_CHECK_EQUAL(effects.getStacks(StatusEffectType::Stunned), 1);
    BOOST_CHECK_EQUAL(effects.getEffect(StatusEffectType::Stunned)->duration, 2);
}

BOOST_AUTO_TEST_CASE(TestExpiryRestoresActions) {
    StatusEffectsComponent effects;
    effects.addEffect(StatusEffectType::Frozen, 1);
    BOOST_CHECK(!effects.canAct());
    BOOST_CHECK(!effects.canMove());

    StatusEffectRoundResult round = effects.processRound();
    BOOST_REQUIRE_EQUAL(round.expired.size(), 1u);
    BOOST_CHECK_EQUAL(round.expired.front(), StatusEffectType::Frozen);
    BOOST_CHECK(effects.canAct());
}

BOOST_AUTO_TEST_CASE(TestModifiers) {
    StatusEffectsComponent effects;
    effects.addEffect(StatusEffectType::Enraged, 2);
    effects.addEffect(StatusEffectType::Weakened, 2);
    BOOST_CHECK_CLOSE(effects.getDamageModifier(), 1.5 * 0.75, 0.0001);

    effects.addEffect(StatusEffectType::Vulnerable, 2, 100);
    BOOST_CHECK_CLOSE(effects.getDamageTakenModifier(), 2.0, 0.0001);

    effects.addEffect(StatusEffectType::Cursed, 2);
    BOOST_CHECK_CLOSE(effects.getHealingModifier(), 0.5, 0.0001);

    effects.addEffect(StatusEffectType::Invisible, 1);
    BOOST_CHECK(!effects.canBeTargeted());

    auto cleared = effects.clearEffectsByCategory(EffectCategory::Debuff);
    BOOST_CHECK_EQUAL(cleared.size(), 3u);
    BOOST_CHECK(effects.hasEffect(StatusEffectType::Enraged));
    BOOST_CHECK(!effects.hasEffect(StatusEffectType::Cursed));
}

BOOST_AUTO_TEST_CASE(TestEffectNames) {
    BOOST_CHECK(statusEffectFromName("burning") == StatusEffectType::Burning);
    BOOST_CHECK(!statusEffectFromName("sleepy").has_value());
    BOOST_CHECK_EQUAL(toString(StatusEffectType::Regeneration), "regeneration");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(AbilitiesComponentTests, EntityFixture)

BOOST_AUTO_TEST_CASE(TestBuiltinAbilities) {
    AbilitiesComponent abilities({makeAbility("cleave", 2)});
    BOOST_CHECK(abilities.hasAbility("cleave"));
    BOOST_CHECK(abilities.hasAbility(AbilitiesComponent::BASIC_ATTACK_ID));
    BOOST_CHECK(abilities.hasAbility(AbilitiesComponent::WAIT_ID));
    BOOST_CHECK(!abilities.canUseAbility("fireball").success);
}

BOOST_AUTO_TEST_CASE(TestCooldownCycle) {
    AbilitiesComponent abilities({makeAbility("cleave", 2)});
    BOOST_CHECK(abilities.useAbility("cleave").success);
    BOOST_CHECK_EQUAL(abilities.getCooldown("cleave"), 2);
    BOOST_CHECK(!abilities.useAbility("cleave").success);

    BOOST_CHECK(abilities.processRound().empty());
    BOOST_CHECK_EQUAL(abilities.getCooldown("cleave"), 1);

    auto ready = abilities.processRound();
    BOOST_REQUIRE_EQUAL(ready.size(), 1u);
    BOOST_CHECK_EQUAL(ready.front(), "cleave");
    BOOST_CHECK(abilities.canUseAbility("cleave").success);
    BOOST_CHECK_EQUAL(abilities.getUsageCount("cleave"), 1);
}

BOOST_AUTO_TEST_CASE(TestDamageAndTargets) {
    AbilitiesComponent abilities({makeAbility("cleave", 0, 15)});
    BOOST_CHECK_EQUAL(abilities.calculateDamage("cleave", 1.5), 22);
    BOOST_CHECK_EQUAL(abilities.calculateHealing("cleave"), 0);
    BOOST_CHECK(abilities.isTargetRequired("cleave"));
    BOOST_CHECK(!abilities.isTargetRequired(AbilitiesComponent::WAIT_ID));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(MovementComponentTests, EntityFixture)

BOOST_AUTO_TEST_CASE(TestMoveRules) {
    MovementComponent movement(HexCoordinate::make(0, 0), 2);
    const HexCoordinate blocked = HexCoordinate::make(1, 0);
    const HexCoordinate taken = HexCoordinate::make(0, 1);

    BOOST_CHECK(!movement.moveTo(HexCoordinate::make(3, 0), {}, {}).success);
    BOOST_CHECK_EQUAL(movement.moveTo(taken, PositionSet{taken}, {}).reason, "Position is occupied");
    BOOST_CHECK_EQUAL(movement.moveTo(blocked, {}, PositionSet{blocked}).reason,
                      "Position is blocked by obstacle");

    MoveResult moved = movement.moveTo(HexCoordinate::make(2, 0), {}, {});
    BOOST_REQUIRE(moved.success);
    BOOST_CHECK_EQUAL(movement.getCurrentPosition(), HexCoordinate::make(2, 0));
    BOOST_CHECK_EQUAL(movement.moveTo(HexCoordinate::make(3, 0), {}, {}).reason,
                      "Already moved this round");

    movement.resetForNewRound();
    BOOST_CHECK(movement.moveTo(HexCoordinate::make(3, 0), {}, {}).success);
    BOOST_CHECK_EQUAL(movement.getMovementStats().totalMoves, 2);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(CombatEntityTests, EntityFixture)

BOOST_AUTO_TEST_CASE(TestAdventurerDefaults) {
    PlayerPtr player = Player::createAdventurer("p1", "Aldric", HexCoordinate::make(1, 1));
    BOOST_CHECK_EQUAL(player->getKind(), EntityKind::Player);
    BOOST_CHECK_EQUAL(player->getMaxHp(), 100);
    BOOST_CHECK_EQUAL(player->getEffectiveArmor(), 2);
    BOOST_CHECK_EQUAL(player->calculateDamageOutput(), 15);
    BOOST_CHECK_EQUAL(player->movement().getMovementRange(), 3);

    TargetCandidate candidate = player->toTargetCandidate();
    BOOST_CHECK_EQUAL(candidate.id, "p1");
    BOOST_CHECK_EQUAL(candidate.currentHp, 100);
    BOOST_CHECK(candidate.alive);
}

BOOST_AUTO_TEST_CASE(TestEmptyIdRejected) {
    BOOST_CHECK_THROW(Player("", "Nobody", makeStats(10, 0, 1), HexCoordinate{}),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(TestEffectsShapeDamage) {
    Player player("p1", "Aldric", makeStats(100, 0, 20), HexCoordinate{});

    player.addStatusEffect(StatusEffectType::Vulnerable, 2);
    BOOST_CHECK_EQUAL(player.takeDamage(20).damageDealt, 30);

    player.statusEffects().removeEffect(StatusEffectType::Vulnerable);
    player.addStatusEffect(StatusEffectType::Shielded, 2, 5);
    BOOST_CHECK_EQUAL(player.getEffectiveArmor(), 5);
    BOOST_CHECK_EQUAL(player.takeDamage(20).damageDealt, 10);

    player.addStatusEffect(StatusEffectType::Enraged, 2);
    BOOST_CHECK_EQUAL(player.calculateDamageOutput(), 30);
}

BOOST_AUTO_TEST_CASE(TestCursedHealing) {
    Player player("p1", "Aldric", makeStats(100, 0, 10), HexCoordinate{});
    player.setCurrentHp(50);
    player.addStatusEffect(StatusEffectType::Cursed, 2);
    BOOST_CHECK_EQUAL(player.heal(20).amountHealed, 10);
}

BOOST_AUTO_TEST_CASE(TestStunnedCannotMoveOrAct) {
    Player player("p1", "Aldric", makeStats(100, 0, 10), HexCoordinate{});
    player.addStatusEffect(StatusEffectType::Stunned, 1);
    BOOST_CHECK(!player.canAct());
    BOOST_CHECK_EQUAL(player.moveTo(HexCoordinate::make(1, 0), {}, {}).reason,
                      "Cannot move while stunned or frozen");

    player.setCurrentHp(0);
    BOOST_CHECK_EQUAL(player.moveTo(HexCoordinate::make(1, 0), {}, {}).reason, "Entity is dead");
    BOOST_CHECK(!player.addStatusEffect(StatusEffectType::Poison, 2, 1).success);
}

BOOST_AUTO_TEST_CASE(TestEndRoundTicks) {
    Player player("p1", "Aldric", makeStats(100, 0, 10), HexCoordinate{});
    player.setCurrentHp(60);
    player.addStatusEffect(StatusEffectType::Poison, 2, 5);
    player.addStatusEffect(StatusEffectType::Regeneration, 1, 3);

    EndOfRoundResult result = player.endRound();
    BOOST_CHECK_EQUAL(result.entityId, "p1");
    BOOST_CHECK_EQUAL(result.damageTaken, 5);
    BOOST_CHECK_EQUAL(result.healingReceived, 3);
    BOOST_CHECK_EQUAL(player.getCurrentHp(), 58);
    BOOST_CHECK(!result.died);
    BOOST_REQUIRE_EQUAL(result.expiredEffects.size(), 1u);
    BOOST_CHECK_EQUAL(result.expiredEffects.front(), StatusEffectType::Regeneration);
}

BOOST_AUTO_TEST_CASE(TestDeathFromPoison) {
    Player player("p1", "Aldric", makeStats(100, 0, 10), HexCoordinate{});
    player.setCurrentHp(3);
    player.addStatusEffect(StatusEffectType::Poison, 3, 5);

    EndOfRoundResult result = player.endRound();
    BOOST_CHECK(result.died);
    BOOST_CHECK(!player.isAlive());

    // Nothing ticks on the dead
    EndOfRoundResult after = player.endRound();
    BOOST_CHECK(after.ticks.empty());
    BOOST_CHECK_EQUAL(after.damageTaken, 0);
}

BOOST_AUTO_TEST_CASE(TestResetForEncounter) {
    PlayerPtr player = Player::createAdventurer("p1", "Aldric", HexCoordinate::make(0, 0));
    player->recordDamageDealt(25);
    player->recordHealingDone(10);
    player->recordDamageDealt(-4);
    BOOST_CHECK_EQUAL(player->getTotalDamageDealt(), 25);

    player->takeDamage(40);
    player->addStatusEffect(StatusEffectType::Burning, 3, 2);
    player->moveTo(HexCoordinate::make(2, 0), {}, {});

    player->resetForEncounter();
    BOOST_CHECK_EQUAL(player->getCurrentHp(), 100);
    BOOST_CHECK(!player->statusEffects().hasEffects());
    BOOST_CHECK_EQUAL(player->getPosition(), HexCoordinate::make(0, 0));
    BOOST_CHECK_EQUAL(player->getTotalDamageDealt(), 0);
    BOOST_CHECK_EQUAL(player->getTotalHealingDone(), 0);
}

BOOST_AUTO_TEST_SUITE_END()
