/**
 * @file Place.cpp
 * @brief Place and Water implementation: occupancy, containment and drowning.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Place.h"
#include "Insect.h"
#include "Logger.h"

#include <algorithm>
#include <stdexcept>

/** @copydoc Place::Place */
Place::Place(std::string name, Place* exit)
    : label(std::move(name)), exitPlace(exit) {
    // Several tunnels may share one exit; the first link is kept.
    if (exitPlace && !exitPlace->entrancePlace) exitPlace->entrancePlace = this;
}

/** @copydoc Place::addInsect */
void Place::addInsect(const std::shared_ptr<Insect>& insect) {
    if (!insect) return;
    if (insect->isAnt()) {
        addAnt(std::static_pointer_cast<Ant>(insect));
    } else {
        beeList.push_back(std::static_pointer_cast<Bee>(insect));
    }
    insect->setPlace(this);
}

void Place::addAnt(const std::shared_ptr<Ant>& ant) {
    if (!occupant) {
        occupant = ant;
    } else if (occupant->canContain(*ant)) {
        occupant->containAnt(ant);
    } else if (ant->canContain(*occupant)) {
        ant->containAnt(occupant);
        occupant = ant;
    } else {
        throw std::logic_error("Two ants in " + label + ": " + occupant->toString() + " and " + ant->name());
    }
}

/** @copydoc Place::removeInsect */
void Place::removeInsect(const std::shared_ptr<Insect>& insect) {
    if (!insect) return;
    if (insect->isAnt()) {
        removeAnt(std::static_pointer_cast<Ant>(insect));
        return;
    }
    auto it = std::find(beeList.begin(), beeList.end(), insect);
    if (it == beeList.end()) {
        throw std::logic_error(insect->toString() + " is not in " + label);
    }
    beeList.erase(it);
    insect->setPlace(nullptr);
}

void Place::removeAnt(const std::shared_ptr<Ant>& ant) {
    const bool visible = (occupant == ant);
    const bool sheltered = !visible && occupant && occupant->containedAnt() == ant;
    if (!visible && !sheltered) {
        throw std::logic_error(ant->toString() + " is not in " + label);
    }
    if (!ant->isRemovable()) {
        Logger::debug(ant->toString() + " cannot be removed");
        return;
    }
    if (sheltered) {
        occupant->releaseContained();
    } else if (ant->isContainer()) {
        // The guarded ant (if any) takes over the slot; its place is already this one.
        occupant = ant->releaseContained();
    } else {
        occupant.reset();
    }
    ant->setPlace(nullptr);
}

// ------- Water -------

/** @brief Add as a normal place, then drown the newcomer unless it is watersafe. */
void Water::addInsect(const std::shared_ptr<Insect>& insect) {
    Place::addInsect(insect);
    if (insect && !insect->isWatersafe()) {
        Logger::debug(insect->toString() + " drowns");
        insect->reduceArmor(insect->armor());
    }
}
