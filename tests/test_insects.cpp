/**
 * @file test_insects.cpp
 * @brief Ant variant behavior inside a running colony.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <doctest/doctest.h>

#include <memory>

#include "AntTypes.h"
#include "Ants.h"
#include "ColonyHarness.h"

TEST_SUITE("insects") {

TEST_CASE("the registry names and prices every kind") {
    CHECK(antTypes().size() == 14);
    const AntTypeInfo* thrower = findAntType("Thrower");
    REQUIRE(thrower != nullptr);
    CHECK(thrower->foodCost == 4);
    CHECK(findAntType("Harvester")->foodCost == 2);
    CHECK(findAntType("Ninja")->foodCost == 6);
    CHECK(findAntType("Remover")->foodCost == 0);
    CHECK(findAntType("Nope") == nullptr);
    for (const auto& info : antTypes()) {
        auto ant = makeAnt(info.kind);
        CHECK(ant->name() == info.name);
        CHECK(ant->foodCost() == info.foodCost);
    }
}

TEST_CASE("stock armor and damage") {
    CHECK(makeAnt(AntKind::Wall)->armor() == 4);
    CHECK(makeAnt(AntKind::Bodyguard)->armor() == 2);
    CHECK(makeAnt(AntKind::Fire)->damage() == 3);
    CHECK(makeAnt(AntKind::Remover)->armor() == 0);
    CHECK_FALSE(makeAnt(AntKind::Ninja)->blocksPath());
    CHECK(makeAnt(AntKind::Thrower)->blocksPath());
}

TEST_CASE("a harvester adds one food per turn") {
    ColonyHarness h(AssaultPlan().addWave(10, 1), 2);
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Harvester"));
    CHECK(h.colony.food() == 0);
    h.colony.step();
    CHECK(h.colony.food() == 1);
    h.colony.step();
    CHECK(h.colony.food() == 2);
}

TEST_CASE("a thrower hits the nearest bee within its range") {
    ColonyHarness h;
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Thrower"));
    auto far = h.beeAt(6);
    auto near = h.beeAt(2);
    h.colony.step();
    CHECK(near->armor() == 2);
    CHECK(far->armor() == 3);
}

TEST_CASE("a short thrower ignores bees beyond two places") {
    ColonyHarness h;
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Short"));
    auto bee = h.beeAt(3);
    h.colony.step();
    CHECK(bee->armor() == 3);
    CHECK(bee->place() == &h.at(2));
    h.colony.step();
    CHECK(bee->armor() == 2);
}

TEST_CASE("a long thrower ignores bees closer than four places") {
    ColonyHarness h;
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Long"));
    auto bee = h.beeAt(5);
    h.colony.step();
    CHECK(bee->armor() == 2);
    h.colony.step();
    CHECK(bee->armor() == 1);
    h.colony.step();
    CHECK(bee->armor() == 1);
    CHECK(bee->place() == &h.at(2));
}

TEST_CASE("a wall holds bees until it falls") {
    ColonyHarness h(AssaultPlan().addWave(0, 1));
    REQUIRE(h.colony.deployAnt("tunnel_0_7", "Wall"));
    auto wall = h.at(7).ant();
    for (int i = 0; i < 3; ++i) h.colony.step();
    CHECK(wall->armor() == 1);
    REQUIRE(h.colony.bees().size() == 1);
    CHECK(h.colony.bees()[0]->place() == &h.at(7));
    h.colony.step();
    CHECK(wall->place() == nullptr);
    CHECK(h.at(7).ant() == nullptr);
    h.colony.step();
    CHECK(h.colony.bees()[0]->place() == &h.at(6));
}

TEST_CASE("a ninja damages every bee in its place without blocking") {
    ColonyHarness h(AssaultPlan().addWave(0, 2));
    REQUIRE(h.colony.deployAnt("tunnel_0_7", "Ninja"));
    auto ninja = h.at(7).ant();
    h.colony.step();
    auto bees = h.colony.bees();
    REQUIRE(bees.size() == 2);
    for (auto& bee : bees) {
        CHECK(bee->armor() == 2);
        CHECK(bee->place() == &h.at(6));
    }
    CHECK(ninja->armor() == 1);
}

TEST_CASE("a dying fire ant burns every bee present") {
    ColonyHarness h(AssaultPlan().addWave(0, 2));
    REQUIRE(h.colony.deployAnt("tunnel_0_7", "Fire"));
    CHECK(h.colony.step() == AntColony::State::Won);
    CHECK(h.colony.time() == 1);
    CHECK(h.at(7).ant() == nullptr);
    CHECK(h.at(7).bees().empty());
}

TEST_CASE("a hungry ant eats a bee and then digests") {
    ColonyHarness h(AssaultPlan().addWave(0, 1).addWave(1, 1));
    REQUIRE(h.colony.deployAnt("tunnel_0_7", "Hungry"));
    auto hungry = std::static_pointer_cast<HungryAnt>(h.at(7).ant());
    h.colony.step();
    CHECK(hungry->digesting() == HungryAnt::TimeToDigest);
    CHECK(h.colony.bees().size() == 1);
    h.colony.step();
    CHECK(hungry->digesting() == HungryAnt::TimeToDigest - 1);
    CHECK(hungry->place() == nullptr);
}

TEST_CASE("a hungry ant eats again once digestion is over") {
    ColonyHarness h(AssaultPlan().addWave(20, 1));
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Hungry"));
    auto hungry = std::static_pointer_cast<HungryAnt>(h.at(0).ant());
    auto first = h.beeAt(0);
    h.colony.step();
    CHECK(first->armor() == 0);
    CHECK(hungry->digesting() == HungryAnt::TimeToDigest);
    for (int i = 0; i < HungryAnt::TimeToDigest; ++i) h.colony.step();
    CHECK(hungry->digesting() == 0);

    auto second = h.beeAt(0);
    h.colony.step();
    CHECK(second->armor() == 0);
    CHECK(second->place() == nullptr);
    CHECK(hungry->digesting() == HungryAnt::TimeToDigest);
    CHECK(hungry->place() == &h.at(0));
}

TEST_CASE("a bodyguard acts for the ant it shelters") {
    ColonyHarness h;
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Thrower"));
    REQUIRE(h.colony.deployAnt("tunnel_0_0", "Bodyguard"));
    auto bee = h.beeAt(7);
    h.colony.step();
    CHECK(bee->armor() == 2);
    CHECK(h.colony.ants().size() == 1);
}

TEST_CASE("bees sting the guard, not the guarded ant") {
    ColonyHarness h;
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Wall"));
    REQUIRE(h.colony.deployAnt("tunnel_0_3", "Bodyguard"));
    auto guard = h.at(3).ant();
    auto wall = guard->containedAnt();
    h.beeAt(3);
    h.colony.step();
    CHECK(guard->armor() == 1);
    CHECK(wall->armor() == 4);
}

}
