/**
 * @file Place.h
 * @brief Declares Place, a node of the tunnel graph, and Water, a place that drowns non-watersafe insects.
 *
 * Places are linked by exit pointers toward the colony queen; a place constructed with an exit becomes
 * that exit's entrance. Any number of bees may share a place; the ant slot holds at most one ant, or
 * one container sheltering one other ant.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

class Ant;
class Bee;
class Insect;

/**
 * @class Place
 * @brief Holds insects and has an exit to another place.
 */
class Place {
public:
    /** @brief Create a place named @p name whose exit is @p exit (may be nullptr). */
    explicit Place(std::string name, Place* exit = nullptr);
    virtual ~Place() = default;

    Place(const Place&) = delete;
    Place& operator=(const Place&) = delete;

    /** @brief Unique name of this place. */
    const std::string& name() const { return label; }
    /** @brief Next place toward the colony queen, or nullptr. */
    Place* exit() const { return exitPlace; }
    /** @brief Previous place toward the hive, or nullptr. */
    Place* entrance() const { return entrancePlace; }

    /** @brief Bees currently in this place, in arrival order. */
    const std::vector<std::shared_ptr<Bee>>& bees() const { return beeList; }
    /** @brief The visible ant (a container when one shelters another), or null. */
    const std::shared_ptr<Ant>& ant() const { return occupant; }

    /** @brief Whether this is the hive, where bees wait for their wave. */
    virtual bool isHive() const { return false; }
    /** @brief Whether this place drowns non-watersafe insects. */
    virtual bool isWater() const { return false; }

    /**
     * @brief Put @p insect in this place and point its place back here.
     *
     * Bees are appended. An ant fills the empty slot, is sheltered by a container already here, or
     * (being a container) shelters the ant already here. Any other combination throws
     * std::logic_error and leaves the place unchanged.
     */
    virtual void addInsect(const std::shared_ptr<Insect>& insect);

    /**
     * @brief Take @p insect out of this place and clear its place pointer.
     *
     * Removing a container promotes its sheltered ant to the visible slot. Removing an ant that
     * refuses removal (the true queen) does nothing. Throws std::logic_error if @p insect is not here.
     */
    virtual void removeInsect(const std::shared_ptr<Insect>& insect);

    /** @brief Diagnostic text: the place name. */
    std::string toString() const { return label; }

private:
    friend class AntColony; // links bee entrances to the hive at registration

    void addAnt(const std::shared_ptr<Ant>& ant);
    void removeAnt(const std::shared_ptr<Ant>& ant);

    std::string label;                         /**< unique name */
    Place* exitPlace;                          /**< toward the colony queen (non-owning) */
    Place* entrancePlace{nullptr};             /**< toward the hive (non-owning) */
    std::vector<std::shared_ptr<Bee>> beeList; /**< bees present */
    std::shared_ptr<Ant> occupant;             /**< visible ant */
};

/**
 * @class Water
 * @brief A place that reduces the armor of every non-watersafe insect entering it to 0.
 */
class Water : public Place {
public:
    using Place::Place;

    bool isWater() const override { return true; }
    void addInsect(const std::shared_ptr<Insect>& insect) override;
};
