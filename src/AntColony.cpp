/**
 * @file AntColony.cpp
 * @brief AntColony implementation: place registry, deployment and the turn loop.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AntColony.h"
#include "AntTypes.h"
#include "Ants.h"
#include "Hive.h"
#include "Insect.h"
#include "Logger.h"
#include "Place.h"

#include <stdexcept>

/** @copydoc AntColony::AntColony */
AntColony::AntColony(Strategy strat, std::unique_ptr<Hive> hive, const Layout& layout,
                     int food, unsigned seed)
    : strategy(std::move(strat)), foodSupply(food), prng(seed) {
    if (!hive) throw std::invalid_argument("an ant colony needs a hive");
    if (seed == 0) {
        std::random_device rd;
        prng.seed(rd());
    }
    auto queen = std::make_unique<Place>("AntQueen");
    queenPlace = queen.get();
    owned.push_back(std::move(queen));

    hivePlace = hive.get();
    registerPlace(std::move(hive), false);
    if (layout) {
        layout(*queenPlace, [this](std::unique_ptr<Place> p, bool isBeeEntrance) {
            registerPlace(std::move(p), isBeeEntrance);
        });
    }
    Logger::info("colony configured: places=" + std::to_string(placeOrder.size()) +
                 " entrances=" + std::to_string(entrances.size()) +
                 " food=" + std::to_string(foodSupply));
}

AntColony::~AntColony() = default;

void AntColony::registerPlace(std::unique_ptr<Place> p, bool isBeeEntrance) {
    if (!p) return;
    if (placeIndex.count(p->name())) {
        throw std::invalid_argument("duplicate place name: " + p->name());
    }
    Place* raw = p.get();
    owned.push_back(std::move(p));
    placeIndex[raw->name()] = raw;
    placeOrder.push_back(raw);
    if (isBeeEntrance) {
        raw->entrancePlace = hivePlace;
        entrances.push_back(raw);
    }
}

/** @copydoc AntColony::simulate */
AntColony::State AntColony::simulate() {
    Logger::info("simulation starting: " + toString());
    State s = state();
    while (s == State::Running && !halted) s = step();
    if (s == State::Lost) {
        Logger::info("The ant queen has perished. Please try again.");
    } else if (s == State::Won) {
        Logger::info("All bees are vanquished. You win!");
    } else {
        Logger::info("simulation halted at turn " + std::to_string(turn));
    }
    return s;
}

/** @copydoc AntColony::step */
AntColony::State AntColony::step() {
    State s = state();
    if (s != State::Running || halted) return s;
    Logger::setTurn(turn);

    hivePlace->strategy(*this);
    if (strategy) strategy(*this);
    if (halted) return state();

    for (auto& ant : ants()) {
        if (ant->armor() > 0) ant->action(*this);
    }
    for (auto& bee : bees()) {
        if (bee->armor() > 0) bee->action(*this);
    }
    ++turn;

    s = state();
    if (s != State::Running) {
        Logger::info(std::string("game over: ") + stateName(s) + " after " + std::to_string(turn) + " turns");
    }
    return s;
}

/** @copydoc AntColony::state */
AntColony::State AntColony::state() const {
    if (queenInvaded()) return State::Lost;
    for (const Place* p : placeOrder) {
        if (!p->bees().empty()) return State::Running;
    }
    return State::Won;
}

/** @copydoc AntColony::queenInvaded */
bool AntColony::queenInvaded() const {
    if (!queenPlace->bees().empty()) return true;
    return queenAntPlace && !queenAntPlace->bees().empty();
}

/** @copydoc AntColony::deployAnt */
bool AntColony::deployAnt(const std::string& placeName, const std::string& antTypeName) {
    const AntTypeInfo* info = findAntType(antTypeName);
    if (!info) throw std::invalid_argument("unknown ant type: " + antTypeName);
    Place& target = place(placeName);
    if (info->kind == AntKind::Remover) {
        removeAnt(placeName);
        return true;
    }
    if (foodSupply < info->foodCost) {
        Logger::warn("Not enough food remains to place " + antTypeName);
        return false;
    }
    const bool crown = (info->kind == AntKind::Queen && !trueQueenDeployed);
    std::shared_ptr<Ant> ant = makeAnt(info->kind, crown);
    target.addInsect(ant);
    if (crown) trueQueenDeployed = true;
    foodSupply -= info->foodCost;
    Logger::info("deployed " + ant->toString() + " food=" + std::to_string(foodSupply));
    return true;
}

/** @copydoc AntColony::removeAnt */
void AntColony::removeAnt(const std::string& placeName) {
    Place& target = place(placeName);
    std::shared_ptr<Ant> ant = target.ant();
    if (!ant) return;
    Logger::info("removing " + ant->toString());
    target.removeInsect(ant);
}

/** @copydoc AntColony::place */
Place& AntColony::place(const std::string& name) {
    auto it = placeIndex.find(name);
    if (it == placeIndex.end()) throw std::invalid_argument("unknown place: " + name);
    return *it->second;
}

std::vector<std::shared_ptr<Ant>> AntColony::ants() const {
    std::vector<std::shared_ptr<Ant>> out;
    for (const Place* p : placeOrder) {
        if (p->ant()) out.push_back(p->ant());
    }
    return out;
}

std::vector<std::shared_ptr<Bee>> AntColony::bees() const {
    std::vector<std::shared_ptr<Bee>> out;
    for (const Place* p : placeOrder) {
        out.insert(out.end(), p->bees().begin(), p->bees().end());
    }
    return out;
}

std::vector<std::shared_ptr<Insect>> AntColony::insects() const {
    std::vector<std::shared_ptr<Insect>> out;
    for (auto& a : ants()) out.push_back(a);
    for (auto& b : bees()) out.push_back(b);
    return out;
}

/** @copydoc AntColony::randInt */
int AntColony::randInt(int lo, int hi) {
    std::uniform_int_distribution<int> d(lo, hi);
    return d(prng);
}

/** @copydoc AntColony::toString */
std::string AntColony::toString() const {
    std::string out = "[";
    bool first = true;
    for (const auto& insect : insects()) {
        if (!first) out += ", ";
        out += insect->toString();
        first = false;
    }
    out += "] (Food: " + std::to_string(foodSupply) + ", Time: " + std::to_string(turn) + ")";
    return out;
}

const char* AntColony::stateName(State s) {
    switch (s) {
        case State::Running: return "running";
        case State::Won: return "won";
        case State::Lost: return "lost";
    }
    return "unknown";
}
