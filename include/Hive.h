/**
 * @file Hive.h
 * @brief Declares Hive, the place from which the bees launch their assault.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include "AssaultPlan.h"
#include "Place.h"

class AntColony;

/**
 * @class Hive
 * @brief Holds every scheduled bee until its wave, then sends it to a random bee entrance.
 *
 * The hive has no exit or entrance of its own and never holds an ant.
 */
class Hive : public Place {
public:
    /** @brief Build the hive and move every bee of @p plan into it. */
    explicit Hive(AssaultPlan plan);

    bool isHive() const override { return true; }
    /** @brief Bees only; adding an ant throws std::logic_error. */
    void addInsect(const std::shared_ptr<Insect>& insect) override;

    /** @brief Move the wave scheduled for the colony's current turn to random bee entrances. */
    void strategy(AntColony& colony);

    /** @brief The schedule this hive follows. */
    const AssaultPlan& assaultPlan() const { return plan; }

private:
    AssaultPlan plan;
};
