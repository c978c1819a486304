/**
 * @file Ants.cpp
 * @brief Ant variant behavior.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Ants.h"
#include "AntColony.h"
#include "Hive.h"
#include "Logger.h"
#include "Place.h"

#include <stdexcept>
#include <vector>

namespace {
constexpr int SlowDuration = 3;
constexpr int StunDuration = 1;
}

// ------- Harvester -------

HarvesterAnt::HarvesterAnt() : Ant(AntKind::Harvester, 1, 0) {}

void HarvesterAnt::act(AntColony& colony) {
    colony.addFood(1);
}

// ------- Throwers -------

ThrowerAnt::ThrowerAnt() : ThrowerAnt(AntKind::Thrower, 0, 10) {}

ThrowerAnt::ThrowerAnt(AntKind kind, int minRange, int maxRange)
    : Ant(kind, 1, 1), rangeMin(minRange), rangeMax(maxRange) {}

/** @copydoc ThrowerAnt::nearestBee */
std::shared_ptr<Bee> ThrowerAnt::nearestBee(AntColony& colony) const {
    const Place* hive = &colony.hive();
    int distance = 0;
    for (const Place* p = place(); p && p != hive; p = p->entrance(), ++distance) {
        const auto& bees = p->bees();
        if (bees.empty()) continue;
        auto bee = bees[(size_t)colony.randInt(0, (int)bees.size() - 1)];
        if (distance >= rangeMin && distance <= rangeMax) return bee;
    }
    return nullptr;
}

/** @copydoc ThrowerAnt::throwAt */
void ThrowerAnt::throwAt(const std::shared_ptr<Bee>& target) {
    if (target) target->reduceArmor(damage());
}

void ThrowerAnt::act(AntColony& colony) {
    throwAt(nearestBee(colony));
}

ShortThrower::ShortThrower() : ThrowerAnt(AntKind::ShortThrower, 0, 2) {}

LongThrower::LongThrower() : ThrowerAnt(AntKind::LongThrower, 4, 10) {}

ScubaThrower::ScubaThrower() : ScubaThrower(AntKind::Scuba) {}

ScubaThrower::ScubaThrower(AntKind kind) : ThrowerAnt(kind, 0, 10) {}

SlowThrower::SlowThrower() : ThrowerAnt(AntKind::Slow, 0, 10) {}

void SlowThrower::throwAt(const std::shared_ptr<Bee>& target) {
    if (target) target->applyEffect(EffectKind::Slow, SlowDuration);
}

StunThrower::StunThrower() : ThrowerAnt(AntKind::Stun, 0, 10) {}

void StunThrower::throwAt(const std::shared_ptr<Bee>& target) {
    if (target) target->applyEffect(EffectKind::Stun, StunDuration);
}

// ------- Fire -------

FireAnt::FireAnt() : Ant(AntKind::Fire, 1, 3) {}

/** @brief Lose armor; on expiry burn every bee present before this ant leaves its place. */
void FireAnt::reduceArmor(int amount) {
    loseArmor(amount);
    if (armor() > 0 || !place()) return;
    // Burning bees removes them from the live list.
    std::vector<std::shared_ptr<Bee>> victims = place()->bees();
    for (auto& bee : victims) bee->reduceArmor(damage());
    expire();
}

// ------- Wall / Ninja -------

WallAnt::WallAnt() : Ant(AntKind::Wall, 4, 0) {}

NinjaAnt::NinjaAnt() : Ant(AntKind::Ninja, 1, 1) {}

void NinjaAnt::act(AntColony&) {
    if (!place()) return;
    std::vector<std::shared_ptr<Bee>> victims = place()->bees();
    for (auto& bee : victims) bee->reduceArmor(damage());
}

// ------- Hungry -------

HungryAnt::HungryAnt() : Ant(AntKind::Hungry, 1, 0) {}

void HungryAnt::eatBee(Bee& bee) {
    bee.reduceArmor(bee.armor());
}

void HungryAnt::act(AntColony& colony) {
    if (digestTurns > 0) {
        --digestTurns;
        return;
    }
    if (!place()) return;
    const auto& bees = place()->bees();
    if (bees.empty()) return;
    auto bee = bees[(size_t)colony.randInt(0, (int)bees.size() - 1)];
    digestTurns = TimeToDigest;
    Logger::debug(toString() + " eats " + bee->toString());
    eatBee(*bee);
}

// ------- Bodyguard -------

BodyguardAnt::BodyguardAnt() : Ant(AntKind::Bodyguard, 2, 0) {}

/** @copydoc BodyguardAnt::containAnt */
void BodyguardAnt::containAnt(std::shared_ptr<Ant> other) {
    if (!other || !canContain(*other)) {
        throw std::logic_error(toString() + " cannot contain " + (other ? other->toString() : std::string("nothing")));
    }
    sheltered = std::move(other);
}

/** @copydoc BodyguardAnt::releaseContained */
std::shared_ptr<Ant> BodyguardAnt::releaseContained() {
    std::shared_ptr<Ant> out;
    out.swap(sheltered);
    return out;
}

void BodyguardAnt::act(AntColony& colony) {
    if (sheltered) {
        std::shared_ptr<Ant> guarded = sheltered;
        guarded->action(colony);
    }
}

// ------- Queen -------

QueenAnt::QueenAnt(bool trueQueen) : ScubaThrower(AntKind::Queen), authoritative(trueQueen) {}

/** @brief Impostors expire; the true queen marks her place, throws, then boosts her tunnel. */
void QueenAnt::act(AntColony& colony) {
    if (!authoritative) {
        Logger::warn("impostor " + toString() + " expires");
        reduceArmor(armor());
        return;
    }
    colony.setQueenAntPlace(place());
    throwAt(nearestBee(colony));
    boostTunnel();
}

/** @copydoc QueenAnt::hasBoosted */
bool QueenAnt::hasBoosted(const std::shared_ptr<Ant>& ant) const {
    return boosted.count(ant) > 0;
}

/** @copydoc QueenAnt::boostTunnel */
void QueenAnt::boostTunnel() {
    const Place* home = place();
    if (!home) return;
    // The queen may herself be sheltered; her guard is recorded but not boosted.
    if (const auto& guard = home->ant(); guard && guard.get() != this && guard->isContainer()) {
        boosted.insert(guard);
    }
    for (const Place* p = home->entrance(); p; p = p->entrance()) boostAt(*p);
    for (const Place* p = home->exit(); p; p = p->exit()) boostAt(*p);
}

void QueenAnt::boostAt(const Place& p) {
    const auto& ant = p.ant();
    if (!ant) return;
    if (ant->isContainer()) {
        boosted.insert(ant);
        auto inner = ant->containedAnt();
        if (inner && inner.get() != this) boost(inner);
    } else {
        boost(ant);
    }
}

void QueenAnt::boost(const std::shared_ptr<Ant>& ant) {
    if (hasBoosted(ant)) return;
    ant->setDamage(ant->damage() * 2);
    boosted.insert(ant);
    Logger::debug("queen doubles " + ant->toString() + " damage to " + std::to_string(ant->damage()));
}

// ------- Remover -------

RemoverAnt::RemoverAnt() : Ant(AntKind::Remover, 0, 0) {}
