/**
 * @file AntTypes.h
 * @brief Closed registry of deployable ant kinds: display name, food cost and factory.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <memory>
#include <string>
#include <vector>

class Ant;

/** @brief Every ant kind the colony can deploy. */
enum class AntKind {
    Harvester,
    Thrower,
    ShortThrower,
    LongThrower,
    Fire,
    Wall,
    Ninja,
    Scuba,
    Hungry,
    Bodyguard,
    Queen,
    Slow,
    Stun,
    Remover
};

/** @brief Static description of one ant kind. */
struct AntTypeInfo {
    AntKind kind;     /**< registry key */
    const char* name; /**< name used by strategies ("Thrower", "Long", ...) */
    int foodCost;     /**< food spent on deployment */
};

/** @brief All ant kinds in display order. */
const std::vector<AntTypeInfo>& antTypes();

/** @brief Registry entry for @p kind. */
const AntTypeInfo& antTypeInfo(AntKind kind);

/** @brief Registry entry whose name is @p name, or nullptr. */
const AntTypeInfo* findAntType(const std::string& name);

/**
 * @brief Construct a fresh ant of @p kind.
 *
 * @param trueQueen only meaningful for AntKind::Queen: whether the new queen is the colony's one
 *        authoritative queen. The colony owns that decision and passes it in.
 */
std::shared_ptr<Ant> makeAnt(AntKind kind, bool trueQueen = false);
