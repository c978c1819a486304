/**
 * @file AntTypes.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AntTypes.h"
#include "Ants.h"

#include <stdexcept>

const std::vector<AntTypeInfo>& antTypes() {
    static const std::vector<AntTypeInfo> table = {
        {AntKind::Harvester,    "Harvester", 2},
        {AntKind::Thrower,      "Thrower",   4},
        {AntKind::ShortThrower, "Short",     3},
        {AntKind::LongThrower,  "Long",      3},
        {AntKind::Fire,         "Fire",      4},
        {AntKind::Wall,         "Wall",      4},
        {AntKind::Ninja,        "Ninja",     6},
        {AntKind::Scuba,        "Scuba",     5},
        {AntKind::Hungry,       "Hungry",    4},
        {AntKind::Bodyguard,    "Bodyguard", 4},
        {AntKind::Queen,        "Queen",     6},
        {AntKind::Slow,         "Slow",      4},
        {AntKind::Stun,         "Stun",      6},
        {AntKind::Remover,      "Remover",   0},
    };
    return table;
}

const AntTypeInfo& antTypeInfo(AntKind kind) {
    for (const auto& info : antTypes()) {
        if (info.kind == kind) return info;
    }
    throw std::out_of_range("unregistered ant kind");
}

const AntTypeInfo* findAntType(const std::string& name) {
    for (const auto& info : antTypes()) {
        if (name == info.name) return &info;
    }
    return nullptr;
}

std::shared_ptr<Ant> makeAnt(AntKind kind, bool trueQueen) {
    switch (kind) {
        case AntKind::Harvester:    return std::make_shared<HarvesterAnt>();
        case AntKind::Thrower:      return std::make_shared<ThrowerAnt>();
        case AntKind::ShortThrower: return std::make_shared<ShortThrower>();
        case AntKind::LongThrower:  return std::make_shared<LongThrower>();
        case AntKind::Fire:         return std::make_shared<FireAnt>();
        case AntKind::Wall:         return std::make_shared<WallAnt>();
        case AntKind::Ninja:        return std::make_shared<NinjaAnt>();
        case AntKind::Scuba:        return std::make_shared<ScubaThrower>();
        case AntKind::Hungry:       return std::make_shared<HungryAnt>();
        case AntKind::Bodyguard:    return std::make_shared<BodyguardAnt>();
        case AntKind::Queen:        return std::make_shared<QueenAnt>(trueQueen);
        case AntKind::Slow:         return std::make_shared<SlowThrower>();
        case AntKind::Stun:         return std::make_shared<StunThrower>();
        case AntKind::Remover:      return std::make_shared<RemoverAnt>();
    }
    throw std::out_of_range("unregistered ant kind");
}
