/**
 * @file Insect.h
 * @brief Declares Insect, the base of every unit, plus the Ant and Bee factions.
 *
 * Insects are always held by std::shared_ptr. An insect's place is a non-owning back-pointer that only
 * Place::addInsect and Place::removeInsect write, so occupancy and location never drift apart.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>
#include <string>

#include "AntTypes.h"
#include "StatusEffect.h"

class AntColony;
class Place;

/**
 * @class Insect
 * @brief Shared capabilities of defenders and attackers: armor, damage, location and a per-turn action.
 */
class Insect : public std::enable_shared_from_this<Insect> {
public:
    /** @brief Construct an insect with @p armor points and @p damage per hit. */
    Insect(int armor, int damage);
    virtual ~Insect() = default;

    Insect(const Insect&) = delete;
    Insect& operator=(const Insect&) = delete;

    // Identity
    /** @brief Type name shown in diagnostics ("Bee", "Thrower", ...). */
    virtual std::string name() const = 0;
    /** @brief Whether this insect belongs to the ant faction. */
    virtual bool isAnt() const { return false; }
    /** @brief Whether this insect survives entering water. */
    virtual bool isWatersafe() const { return false; }

    // State
    /** @brief Remaining armor; the insect expires once it drops to 0 or below. */
    int armor() const { return armorPoints; }
    /** @brief Damage dealt per hit. */
    int damage() const { return dmg; }
    /** @brief Overwrite the damage per hit (used by the queen's aura). */
    void setDamage(int value) { dmg = value; }
    /** @brief Current place, or nullptr once removed from the colony. */
    Place* place() const { return where; }

    /**
     * @brief Reduce armor by @p amount; at 0 or below the insect is removed from its place.
     *
     * Removal happens once: an insect that already left its place only loses armor.
     */
    virtual void reduceArmor(int amount);

    /** @brief Perform this turn's action, filtered through any active status effects. */
    void action(AntColony& colony);
    /** @brief Wrap the current action in @p kind for @p duration turns. */
    void applyEffect(EffectKind kind, int duration);
    /** @brief Installed status effects. */
    const ActionState& actionState() const { return effects; }

    /** @brief Diagnostic text such as "Bee(3, tunnel_0_4)". */
    std::string toString() const;

protected:
    /** @brief The unmodified per-turn behavior of this insect type. */
    virtual void act(AntColony& colony);

    /** @brief Subtract armor without triggering removal. */
    void loseArmor(int amount) { armorPoints -= amount; }
    /** @brief Log the expiry and remove this insect from its place, if it still has one. */
    void expire();

private:
    friend class Place;
    void setPlace(Place* p) { where = p; }

    int armorPoints;          /**< remaining armor */
    int dmg;                  /**< damage per hit */
    Place* where{nullptr};    /**< current place (non-owning) */
    ActionState effects;      /**< status effects wrapping act() */
};

/**
 * @class Ant
 * @brief A stationary defender deployed by the player's strategy for a food cost.
 */
class Ant : public Insect {
public:
    /** @brief Construct an ant of @p kind; name and food cost come from the ant type registry. */
    Ant(AntKind kind, int armor, int damage);

    std::string name() const override;
    bool isAnt() const override { return true; }

    /** @brief Registry kind of this ant. */
    AntKind kind() const { return antKind; }
    /** @brief Food the colony pays to deploy this ant. */
    int foodCost() const;

    /** @brief Whether bees in this place are stopped and sting this ant. */
    virtual bool blocksPath() const { return true; }
    /** @brief Whether colony removal may take this ant off the board. */
    virtual bool isRemovable() const { return true; }

    // Containment
    /** @brief Whether this ant can shelter another ant. */
    virtual bool isContainer() const { return false; }
    /** @brief Whether this ant can shelter @p other right now (free slot, @p other not a container). */
    bool canContain(const Ant& other) const;
    /** @brief Sheltered ant, if any. */
    virtual std::shared_ptr<Ant> containedAnt() const { return nullptr; }
    /** @brief Take @p other into the shelter slot; throws std::logic_error on a non-container. */
    virtual void containAnt(std::shared_ptr<Ant> other);
    /** @brief Empty the shelter slot and return its previous occupant. */
    virtual std::shared_ptr<Ant> releaseContained() { return nullptr; }

private:
    AntKind antKind;
};

/**
 * @class Bee
 * @brief An attacker that advances toward the colony queen and stings the ant blocking its way.
 */
class Bee : public Insect {
public:
    /** @brief Construct a bee with @p armor; every bee stings for 1. */
    explicit Bee(int armor);

    std::string name() const override { return "Bee"; }
    bool isWatersafe() const override { return true; }

    /** @brief Sting @p ant for this bee's damage. */
    void sting(Ant& ant);
    /** @brief Leave the current place and enter @p destination. */
    void moveTo(Place& destination);
    /** @brief True if the visible ant in this bee's place blocks the path. */
    bool blocked() const;

protected:
    void act(AntColony& colony) override;
};
