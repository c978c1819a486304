/**
 * @file Hive.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Hive.h"
#include "AntColony.h"
#include "Insect.h"
#include "Logger.h"

#include <stdexcept>

/** @copydoc Hive::Hive */
Hive::Hive(AssaultPlan assault)
    : Place("Hive"), plan(std::move(assault)) {
    for (auto& bee : plan.allBees()) addInsect(bee);
}

/** @copydoc Hive::addInsect */
void Hive::addInsect(const std::shared_ptr<Insect>& insect) {
    if (insect && insect->isAnt()) {
        throw std::logic_error("the hive cannot hold " + insect->toString());
    }
    Place::addInsect(insect);
}

/** @copydoc Hive::strategy */
void Hive::strategy(AntColony& colony) {
    const auto& wave = plan.wave(colony.time());
    if (wave.empty()) return;
    const auto& exits = colony.beeEntrances();
    if (exits.empty()) throw std::logic_error("no bee entrances registered for the hive");
    for (const auto& bee : wave) {
        // A bee only leaves once, and only from here.
        if (bee->place() != this) continue;
        Place* target = exits[(size_t)colony.randInt(0, (int)exits.size() - 1)];
        bee->moveTo(*target);
        Logger::debug("bee enters " + target->name());
    }
}
