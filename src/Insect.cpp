/**
 * @file Insect.cpp
 * @brief Insect, Ant and Bee implementation.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Insect.h"
#include "AntColony.h"
#include "Logger.h"
#include "Place.h"

#include <stdexcept>

/** @copydoc Insect::Insect */
Insect::Insect(int armor, int damage)
    : armorPoints(armor), dmg(damage) {}

/** @copydoc Insect::reduceArmor */
void Insect::reduceArmor(int amount) {
    loseArmor(amount);
    if (armorPoints <= 0) expire();
}

void Insect::expire() {
    if (!where) return;
    Logger::info(toString() + " ran out of armor and expired");
    auto self = shared_from_this();
    where->removeInsect(self);
}

/** @copydoc Insect::action */
void Insect::action(AntColony& colony) {
    effects.invoke(colony.time(), [this, &colony] { act(colony); });
}

/** @copydoc Insect::applyEffect */
void Insect::applyEffect(EffectKind kind, int duration) {
    effects.apply(kind, duration);
    Logger::debug(toString() + " is affected by " + effectName(kind) + " for " + std::to_string(duration) +
                  " turns, now " + effects.describe());
}

void Insect::act(AntColony&) {}

/** @copydoc Insect::toString */
std::string Insect::toString() const {
    return name() + "(" + std::to_string(armorPoints) + ", " + (where ? where->name() : std::string("None")) + ")";
}

// ------- Ant -------

/** @copydoc Ant::Ant */
Ant::Ant(AntKind kind, int armor, int damage)
    : Insect(armor, damage), antKind(kind) {}

std::string Ant::name() const {
    return antTypeInfo(antKind).name;
}

/** @copydoc Ant::foodCost */
int Ant::foodCost() const {
    return antTypeInfo(antKind).foodCost;
}

/** @copydoc Ant::canContain */
bool Ant::canContain(const Ant& other) const {
    return isContainer() && !containedAnt() && !other.isContainer();
}

/** @copydoc Ant::containAnt */
void Ant::containAnt(std::shared_ptr<Ant>) {
    throw std::logic_error(toString() + " cannot contain another ant");
}

// ------- Bee -------

/** @copydoc Bee::Bee */
Bee::Bee(int armor) : Insect(armor, 1) {}

/** @copydoc Bee::sting */
void Bee::sting(Ant& ant) {
    ant.reduceArmor(damage());
}

/** @copydoc Bee::moveTo */
void Bee::moveTo(Place& destination) {
    auto self = shared_from_this();
    if (place()) place()->removeInsect(self);
    destination.addInsect(self);
}

/** @copydoc Bee::blocked */
bool Bee::blocked() const {
    if (!place()) return false;
    const auto& ant = place()->ant();
    return ant && ant->blocksPath();
}

/** @brief Sting the blocking ant, otherwise advance one place toward the colony queen. */
void Bee::act(AntColony&) {
    Place* here = place();
    if (!here) return;
    if (blocked()) {
        std::shared_ptr<Ant> target = here->ant();
        sting(*target);
    } else if (!here->isHive() && armor() > 0 && here->exit()) {
        moveTo(*here->exit());
    }
}
