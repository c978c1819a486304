/**
 * @file test_queen.cpp
 * @brief True queen, impostors, the damage aura and the queen's place.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <doctest/doctest.h>

#include <memory>

#include "Ants.h"
#include "ColonyHarness.h"

namespace {
std::shared_ptr<QueenAnt> queenAt(Place& p) {
    auto ant = p.ant();
    if (ant && ant->isContainer()) ant = ant->containedAnt();
    return std::dynamic_pointer_cast<QueenAnt>(ant);
}
}

TEST_SUITE("queen") {

TEST_CASE("only the first queen is the true queen") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 20);
    CHECK_FALSE(h.colony.hasTrueQueen());
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Queen"));
    CHECK(h.colony.hasTrueQueen());
    REQUIRE(h.colony.deployAnt("tunnel_0_5", "Queen"));
    auto first = queenAt(h.at(3));
    auto second = queenAt(h.at(5));
    REQUIRE(first);
    REQUIRE(second);
    CHECK(first->isTrueQueen());
    CHECK_FALSE(second->isTrueQueen());
    h.colony.step();
    CHECK(h.at(5).ant() == nullptr);
    CHECK(h.at(3).ant() == first);
}

TEST_CASE("the true queen cannot be removed") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 20);
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Queen"));
    auto queen = h.at(3).ant();
    h.colony.removeAnt("tunnel_0_3");
    CHECK(h.at(3).ant() == queen);
    CHECK(h.colony.deployAnt("tunnel_0_3", "Remover"));
    CHECK(h.at(3).ant() == queen);
    CHECK(queen->place() == &h.at(3));
}

TEST_CASE("the aura doubles every ant in the tunnel exactly once") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 30);
    REQUIRE(h.colony.deployAnt("tunnel_0_1", "Thrower"));
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Queen"));
    REQUIRE(h.colony.deployAnt("tunnel_0_5", "Thrower"));
    REQUIRE(h.colony.deployAnt("tunnel_0_5", "Bodyguard"));
    auto before = h.at(1).ant();
    auto guard = h.at(5).ant();
    auto guarded = guard->containedAnt();
    auto queen = queenAt(h.at(3));

    h.colony.step();
    CHECK(before->damage() == 2);
    CHECK(guarded->damage() == 2);
    CHECK(guard->damage() == 0);
    CHECK(queen->hasBoosted(guard));
    CHECK(queen->damage() == 1);

    REQUIRE(h.colony.deployAnt("tunnel_0_7", "Thrower"));
    auto late = h.at(7).ant();
    h.colony.step();
    CHECK(before->damage() == 2);
    CHECK(guarded->damage() == 2);
    CHECK(late->damage() == 2);
}

TEST_CASE("a later queen never doubles an ant twice") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 30);
    REQUIRE(h.colony.deployAnt("tunnel_0_1", "Thrower"));
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Queen"));
    REQUIRE(h.colony.deployAnt("tunnel_0_6", "Short"));
    auto thrower = h.at(1).ant();
    auto shortThrower = h.at(6).ant();
    for (int i = 0; i < 3; ++i) h.colony.step();
    CHECK(thrower->damage() == 2);
    CHECK(shortThrower->damage() == 2);

    REQUIRE(h.colony.deployAnt("tunnel_0_5", "Queen"));
    auto impostor = queenAt(h.at(5));
    REQUIRE(impostor);
    CHECK_FALSE(impostor->isTrueQueen());
    h.colony.step();
    h.colony.step();
    CHECK(h.at(5).ant() == nullptr);
    CHECK(impostor->place() == nullptr);
    CHECK(thrower->damage() == 2);
    CHECK(shortThrower->damage() == 2);
}

TEST_CASE("guarding an ant that is already doubled keeps it at double") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 30);
    REQUIRE(h.colony.deployAnt("tunnel_0_1", "Thrower"));
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Queen"));
    auto thrower = h.at(1).ant();
    auto queen = queenAt(h.at(3));
    h.colony.step();
    CHECK(thrower->damage() == 2);

    REQUIRE(h.colony.deployAnt("tunnel_0_1", "Bodyguard"));
    auto guard = h.at(1).ant();
    CHECK(guard->containedAnt() == thrower);
    h.colony.step();
    h.colony.step();
    CHECK(thrower->damage() == 2);
    CHECK(guard->damage() == 0);
    CHECK(queen->hasBoosted(guard));
}

TEST_CASE("a guarded queen boosts the tunnel but not her guard") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 30);
    REQUIRE(h.colony.deployAnt("tunnel_0_4", "Queen"));
    REQUIRE(h.colony.deployAnt("tunnel_0_4", "Bodyguard"));
    REQUIRE(h.colony.deployAnt("tunnel_0_6", "Wall"));
    REQUIRE(h.colony.deployAnt("tunnel_0_2", "Ninja"));
    auto queen = queenAt(h.at(4));
    REQUIRE(queen);
    h.colony.step();
    CHECK(queen->hasBoosted(h.at(4).ant()));
    CHECK(h.at(2).ant()->damage() == 2);
    CHECK(queen->hasBoosted(h.at(6).ant()));
}

TEST_CASE("bees reaching the true queen's place end the game") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 20);
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Queen"));
    h.beeAt(3);
    CHECK(h.colony.state() == AntColony::State::Running);
    h.colony.step();
    CHECK(h.colony.queenInvaded());
    CHECK(h.colony.state() == AntColony::State::Lost);
}

}
