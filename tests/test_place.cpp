/**
 * @file test_place.cpp
 * @brief Place linking, ant slot rules and bodyguard containment.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include <doctest/doctest.h>

#include <memory>
#include <stdexcept>

#include "AntTypes.h"
#include "Ants.h"
#include "Insect.h"
#include "Place.h"

TEST_SUITE("place") {

TEST_CASE("constructing with an exit links the entrance once") {
    Place queen("queen");
    Place a("a", &queen);
    Place b("b", &queen);
    CHECK(a.exit() == &queen);
    CHECK(b.exit() == &queen);
    CHECK(queen.entrance() == &a);
    CHECK(a.entrance() == nullptr);
}

TEST_CASE("bees share a place and record where they are") {
    Place p("p");
    auto b1 = std::make_shared<Bee>(3);
    auto b2 = std::make_shared<Bee>(3);
    p.addInsect(b1);
    p.addInsect(b2);
    CHECK(p.bees().size() == 2);
    CHECK(b1->place() == &p);
    p.removeInsect(b1);
    CHECK(p.bees().size() == 1);
    CHECK(b1->place() == nullptr);
    CHECK_THROWS_AS(p.removeInsect(b1), std::logic_error);
}

TEST_CASE("a second plain ant is refused and nothing changes") {
    Place p("p");
    auto first = makeAnt(AntKind::Thrower);
    auto second = makeAnt(AntKind::Harvester);
    p.addInsect(first);
    CHECK_THROWS_AS(p.addInsect(second), std::logic_error);
    CHECK(p.ant() == first);
    CHECK(second->place() == nullptr);
}

TEST_CASE("a bodyguard shelters an ant in either order") {
    SUBCASE("guard first") {
        Place p("p");
        auto guard = makeAnt(AntKind::Bodyguard);
        auto thrower = makeAnt(AntKind::Thrower);
        p.addInsect(guard);
        p.addInsect(thrower);
        CHECK(p.ant() == guard);
        CHECK(guard->containedAnt() == thrower);
        CHECK(thrower->place() == &p);
    }
    SUBCASE("guard second") {
        Place p("p");
        auto guard = makeAnt(AntKind::Bodyguard);
        auto thrower = makeAnt(AntKind::Thrower);
        p.addInsect(thrower);
        p.addInsect(guard);
        CHECK(p.ant() == guard);
        CHECK(guard->containedAnt() == thrower);
        CHECK(guard->place() == &p);
    }
}

TEST_CASE("containers never nest and a full container refuses more") {
    Place p("p");
    auto guard = makeAnt(AntKind::Bodyguard);
    p.addInsect(guard);
    CHECK_THROWS_AS(p.addInsect(makeAnt(AntKind::Bodyguard)), std::logic_error);
    p.addInsect(makeAnt(AntKind::Thrower));
    CHECK_THROWS_AS(p.addInsect(makeAnt(AntKind::Wall)), std::logic_error);
    CHECK_THROWS_AS(makeAnt(AntKind::Wall)->containAnt(makeAnt(AntKind::Thrower)), std::logic_error);
}

TEST_CASE("removing a guard promotes the sheltered ant") {
    Place p("p");
    auto guard = makeAnt(AntKind::Bodyguard);
    auto thrower = makeAnt(AntKind::Thrower);
    p.addInsect(guard);
    p.addInsect(thrower);
    p.removeInsect(guard);
    CHECK(p.ant() == thrower);
    CHECK(thrower->place() == &p);
    CHECK(guard->place() == nullptr);
    CHECK(guard->containedAnt() == nullptr);
}

TEST_CASE("removing the sheltered ant leaves the guard") {
    Place p("p");
    auto guard = makeAnt(AntKind::Bodyguard);
    auto thrower = makeAnt(AntKind::Thrower);
    p.addInsect(guard);
    p.addInsect(thrower);
    p.removeInsect(thrower);
    CHECK(p.ant() == guard);
    CHECK(guard->containedAnt() == nullptr);
    CHECK(thrower->place() == nullptr);
}

TEST_CASE("removing an ant that is not here throws") {
    Place p("p");
    CHECK_THROWS_AS(p.removeInsect(makeAnt(AntKind::Thrower)), std::logic_error);
}

TEST_CASE("an expiring guard hands the slot to its charge") {
    Place p("p");
    auto guard = makeAnt(AntKind::Bodyguard);
    auto thrower = makeAnt(AntKind::Thrower);
    p.addInsect(guard);
    p.addInsect(thrower);
    guard->reduceArmor(2);
    CHECK(p.ant() == thrower);
    CHECK(guard->place() == nullptr);
}

TEST_CASE("insects describe themselves") {
    Place p("tunnel_0_4");
    auto bee = std::make_shared<Bee>(3);
    CHECK(bee->toString() == "Bee(3, None)");
    p.addInsect(bee);
    CHECK(bee->toString() == "Bee(3, tunnel_0_4)");
}

}
