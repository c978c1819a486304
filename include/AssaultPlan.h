/**
 * @file AssaultPlan.h
 * @brief Declares AssaultPlan, the bees' schedule of timed waves, and the stock plans.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <map>
#include <memory>
#include <vector>

class Bee;

/**
 * @class AssaultPlan
 * @brief Maps a turn number to the wave of bees that leaves the hive on that turn.
 *
 * The plan owns pre-built bees; the hive consults it once per turn and never changes it.
 */
class AssaultPlan {
public:
    /** @brief Create an empty plan whose bees will have @p beeArmor armor. */
    explicit AssaultPlan(int beeArmor = 3);

    /** @brief Append @p count new bees to the wave at @p time; returns *this for chaining. */
    AssaultPlan& addWave(int time, int count);

    /** @brief Bees scheduled for @p time (empty when none). */
    const std::vector<std::shared_ptr<Bee>>& wave(int time) const;
    /** @brief Every scheduled bee, in wave order. */
    std::vector<std::shared_ptr<Bee>> allBees() const;
    /** @brief Armor given to bees added from now on. */
    int beeArmor() const { return armor; }
    /** @brief Turns that have a wave, ascending. */
    std::vector<int> waveTimes() const;

private:
    int armor;
    std::map<int, std::vector<std::shared_ptr<Bee>>> waves;
};

/** @brief Two single-bee waves at turns 2 and 3. */
AssaultPlan makeTestAssaultPlan();
/** @brief One bee at turn 2, one on every odd turn 3..13, then eight at turn 15. */
AssaultPlan makeFullAssaultPlan();
/** @brief Armor-4 bees: two at turn 1, one per turn 3..14, then twenty at turn 15. */
AssaultPlan makeInsaneAssaultPlan();
