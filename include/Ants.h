/**
 * @file Ants.h
 * @brief Declares the deployable ant variants.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>
#include <set>

#include "Insect.h"

/** @brief Produces 1 extra food for the colony each turn. */
class HarvesterAnt : public Ant {
public:
    HarvesterAnt();

protected:
    void act(AntColony& colony) override;
};

/**
 * @class ThrowerAnt
 * @brief Throws a leaf each turn at a random bee in the nearest occupied place within range.
 *
 * Range is measured in places along entrance links from the thrower's own place (distance 0) back
 * toward the hive; the hive itself is never targeted.
 */
class ThrowerAnt : public Ant {
public:
    ThrowerAnt();

    /** @brief Closest reachable bee in [minRange, maxRange], or nullptr. */
    std::shared_ptr<Bee> nearestBee(AntColony& colony) const;
    /** @brief Hit @p target; a null target is a no-op. */
    virtual void throwAt(const std::shared_ptr<Bee>& target);

    int minRange() const { return rangeMin; }
    int maxRange() const { return rangeMax; }

protected:
    ThrowerAnt(AntKind kind, int minRange, int maxRange);

    void act(AntColony& colony) override;

private:
    int rangeMin;
    int rangeMax;
};

/** @brief Thrower limited to bees at most 2 places away. */
class ShortThrower : public ThrowerAnt {
public:
    ShortThrower();
};

/** @brief Thrower limited to bees at least 4 places away. */
class LongThrower : public ThrowerAnt {
public:
    LongThrower();
};

/** @brief Water-safe thrower. */
class ScubaThrower : public ThrowerAnt {
public:
    ScubaThrower();

    bool isWatersafe() const override { return true; }

protected:
    explicit ScubaThrower(AntKind kind);
};

/** @brief Thrower whose leaves slow bees for 3 turns instead of damaging them. */
class SlowThrower : public ThrowerAnt {
public:
    SlowThrower();
    void throwAt(const std::shared_ptr<Bee>& target) override;
};

/** @brief Thrower whose leaves stun bees for 1 turn instead of damaging them. */
class StunThrower : public ThrowerAnt {
public:
    StunThrower();
    void throwAt(const std::shared_ptr<Bee>& target) override;
};

/**
 * @class FireAnt
 * @brief When its armor runs out, burns every bee in its place for its damage before leaving.
 */
class FireAnt : public Ant {
public:
    FireAnt();
    void reduceArmor(int amount) override;
};

/** @brief High-armor blocker with no action. */
class WallAnt : public Ant {
public:
    WallAnt();
};

/** @brief Does not block bees; damages every bee sharing its place each turn. */
class NinjaAnt : public Ant {
public:
    NinjaAnt();
    bool blocksPath() const override { return false; }

protected:
    void act(AntColony& colony) override;
};

/**
 * @class HungryAnt
 * @brief Swallows a random bee in its place whole, then spends timeToDigest turns digesting.
 */
class HungryAnt : public Ant {
public:
    static constexpr int TimeToDigest = 3;

    HungryAnt();

    /** @brief Turns left before the next bee can be eaten. */
    int digesting() const { return digestTurns; }
    /** @brief Deplete all of @p bee's armor. */
    void eatBee(Bee& bee);

protected:
    void act(AntColony& colony) override;

private:
    int digestTurns{0};
};

/**
 * @class BodyguardAnt
 * @brief Container that shelters one non-container ant and acts on its behalf.
 */
class BodyguardAnt : public Ant {
public:
    BodyguardAnt();

    bool isContainer() const override { return true; }
    std::shared_ptr<Ant> containedAnt() const override { return sheltered; }
    void containAnt(std::shared_ptr<Ant> other) override;
    std::shared_ptr<Ant> releaseContained() override;

protected:
    /** @brief Delegate to the sheltered ant; an empty bodyguard does nothing. */
    void act(AntColony& colony) override;

private:
    std::shared_ptr<Ant> sheltered; /**< the guarded ant, if any */
};

/**
 * @class QueenAnt
 * @brief Water-safe thrower that doubles, once, the damage of every ant in her tunnel.
 *
 * Only the colony's first queen is authoritative ("true"). The true queen cannot be removed and
 * her place becomes part of what the bees must not reach. Any later queen is an impostor that
 * expires on its first action.
 */
class QueenAnt : public ScubaThrower {
public:
    explicit QueenAnt(bool trueQueen);

    bool isTrueQueen() const { return authoritative; }
    bool isRemovable() const override { return !authoritative; }

    /** @brief Whether @p ant's damage has already been doubled by this queen. */
    bool hasBoosted(const std::shared_ptr<Ant>& ant) const;

    /**
     * @brief Walk the tunnel in both directions from the queen's place, doubling every ant not yet doubled.
     *
     * A container is recorded without being doubled and its sheltered ant is doubled instead.
     */
    void boostTunnel();

protected:
    void act(AntColony& colony) override;

private:
    void boostAt(const Place& place);
    void boost(const std::shared_ptr<Ant>& ant);

    bool authoritative;
    std::set<std::weak_ptr<Ant>, std::owner_less<std::weak_ptr<Ant>>> boosted;
};

/** @brief Utility kind the front end uses to clear a place; has no armor and no action. */
class RemoverAnt : public Ant {
public:
    RemoverAnt();
};
