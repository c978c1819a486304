/**
 * @file AntColony.h
 * @brief Declares AntColony, the owner of the game world and the fixed-order turn loop.
 *
 * The colony owns every place, the food supply, the turn counter and the game PRNG. Each turn runs
 * five phases in order: the hive releases its wave, the strategy deploys or removes ants, every ant
 * acts, every bee acts, and time advances. Each acting phase iterates a snapshot taken before it
 * starts, so insects expiring or moving mid-phase never disturb the iteration.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <functional>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "Layouts.h"

class Ant;
class Bee;
class Hive;
class Insect;
class Place;

/**
 * @class AntColony
 * @brief Manages global game state and simulates time.
 */
class AntColony {
public:
    /** @brief Game status, evaluated at the top of every turn. */
    enum class State { Running, Won, Lost };

    /** @brief Deploys/removes ants through the colony; called once per turn, may do nothing. */
    using Strategy = std::function<void(AntColony&)>;

    /**
     * @brief Create a colony.
     *
     * @param strategy  placement strategy (may be empty for a passive colony)
     * @param hive      the hive, already holding every scheduled bee
     * @param layout    builds the tunnel places leading to the colony queen
     * @param food      starting food
     * @param seed      PRNG seed; 0 draws one from std::random_device
     */
    AntColony(Strategy strategy, std::unique_ptr<Hive> hive, const Layout& layout,
              int food = 2, unsigned seed = 0);
    ~AntColony();

    AntColony(const AntColony&) = delete;
    AntColony& operator=(const AntColony&) = delete;

    // Simulation
    /** @brief Run turns until the game is won or lost, or halt() is called; returns the final state. */
    State simulate();
    /** @brief Run one turn if the game is still running; returns the state afterwards. */
    State step();
    /** @brief Current state: Lost if a bee reached the queen, Won if no bee is left, else Running. */
    State state() const;
    /** @brief Stop simulate() after the current phase; the state is left as is. */
    void halt() { halted = true; }
    /** @brief Whether halt() was requested. */
    bool isHalted() const { return halted; }

    // Strategy operations
    /**
     * @brief Place a new @p antTypeName ant at @p placeName if enough food remains.
     *
     * Returns false (and changes nothing) when food is short. Deploying "Remover" removes the ant at
     * the place instead. Unknown names throw std::invalid_argument; a placement that breaks the
     * one-ant rule throws std::logic_error with food untouched.
     */
    bool deployAnt(const std::string& placeName, const std::string& antTypeName);
    /** @brief Remove the visible ant at @p placeName; no-op if the place is empty. */
    void removeAnt(const std::string& placeName);

    // Queries
    /** @brief Visible ants in place registration order. */
    std::vector<std::shared_ptr<Ant>> ants() const;
    /** @brief Bees in place registration order (the hive first). */
    std::vector<std::shared_ptr<Bee>> bees() const;
    /** @brief ants() followed by bees(). */
    std::vector<std::shared_ptr<Insect>> insects() const;

    /** @brief Turns elapsed. */
    int time() const { return turn; }
    /** @brief Food available for deployment. */
    int food() const { return foodSupply; }
    /** @brief Add @p amount food (harvesters). */
    void addFood(int amount) { foodSupply += amount; }

    /** @brief The hive. */
    Hive& hive() { return *hivePlace; }
    const Hive& hive() const { return *hivePlace; }
    /** @brief The colony queen's place at the end of every tunnel. */
    Place& queen() { return *queenPlace; }
    const Place& queen() const { return *queenPlace; }
    /** @brief Registered places in registration order (the hive first). */
    const std::vector<Place*>& places() const { return placeOrder; }
    /** @brief Places where bees enter from the hive. */
    const std::vector<Place*>& beeEntrances() const { return entrances; }
    /** @brief Registered place named @p name; throws std::invalid_argument if unknown. */
    Place& place(const std::string& name);

    /** @brief Record the true queen's place; bees reaching it lose the game too. */
    void setQueenAntPlace(Place* p) { queenAntPlace = p; }
    /** @brief Whether any bee stands in the colony queen's place or the true queen's place. */
    bool queenInvaded() const;
    /** @brief Whether a true queen has been deployed. */
    bool hasTrueQueen() const { return trueQueenDeployed; }

    /** @brief Uniform integer in [lo,hi] from the colony PRNG. */
    int randInt(int lo, int hi);

    /** @brief Diagnostic text listing every insect plus food and time. */
    std::string toString() const;

private:
    void registerPlace(std::unique_ptr<Place> place, bool isBeeEntrance);
    static const char* stateName(State s);

    Strategy strategy;
    std::vector<std::unique_ptr<Place>> owned;          /**< every place, including hive and queen */
    std::unordered_map<std::string, Place*> placeIndex; /**< registered places by name */
    std::vector<Place*> placeOrder;                     /**< registration order */
    std::vector<Place*> entrances;                      /**< bee entrances */
    Hive* hivePlace{nullptr};
    Place* queenPlace{nullptr};
    Place* queenAntPlace{nullptr};
    bool trueQueenDeployed{false};
    bool halted{false};
    int foodSupply;
    int turn{0};
    std::mt19937 prng;
};
