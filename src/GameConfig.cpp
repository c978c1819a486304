/**
 * @file GameConfig.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "GameConfig.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

static bool parseCount(const char* s, long& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    errno = 0;
    long v = std::strtol(s, &end, 10);
    if (end == s || *end != '\0' || errno != 0 || v < 0 || v > INT_MAX) return false;
    out = v;
    return true;
}

GameConfig loadGameConfig(int argc, char** argv) {
    GameConfig cfg;
    long tmp;

    // Env overrides
    if (parseCount(std::getenv("ANTS_FOOD"), tmp)) cfg.food = (int)tmp;
    if (parseCount(std::getenv("ANTS_SEED"), tmp)) cfg.seed = (unsigned)tmp;

    // Arg overrides; an explicit --food beats -t regardless of order
    bool ten = false;
    bool haveFood = false;
    long food = 0;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        auto read_next = [&](int& idx) -> const char* {
            if (idx + 1 < argc) return argv[++idx];
            return nullptr;
        };
        if (a == "-h" || a == "--help") {
            cfg.showHelp = true;
        } else if (a == "-t" || a == "--ten") {
            ten = true;
        } else if (a == "-f" || a == "--full") {
            cfg.plan = PlanKind::Full;
            cfg.layout = LayoutKind::Dry;
        } else if (a == "-w" || a == "--water") {
            cfg.layout = LayoutKind::Mixed;
        } else if (a == "-i" || a == "--insane") {
            cfg.plan = PlanKind::Insane;
        } else if (a == "--food") {
            if (parseCount(read_next(i), tmp)) { food = tmp; haveFood = true; }
        } else if (a.rfind("--food=", 0) == 0) {
            if (parseCount(a.c_str() + std::strlen("--food="), tmp)) { food = tmp; haveFood = true; }
        } else if (a == "--seed") {
            if (parseCount(read_next(i), tmp)) cfg.seed = (unsigned)tmp;
        } else if (a.rfind("--seed=", 0) == 0) {
            if (parseCount(a.c_str() + std::strlen("--seed="), tmp)) cfg.seed = (unsigned)tmp;
        }
    }
    if (ten) cfg.food = 10;
    if (haveFood) cfg.food = (int)food;
    return cfg;
}

std::string usageText(const std::string& prog) {
    return "Usage: " + prog + " [options]\n"
           "  -h, --help      show this help\n"
           "  -t, --ten       start with 10 food\n"
           "  -f, --full      full assault plan on three dry tunnels\n"
           "  -w, --water     tunnels with water every third place\n"
           "  -i, --insane    insane assault plan\n"
           "      --food N    starting food (env ANTS_FOOD)\n"
           "      --seed N    random seed, 0 for a fresh one (env ANTS_SEED)\n"
           "Keys: arrows move, [ ] pick ant, d deploy, x remove, space/enter end turn, q quit\n";
}

Layout makeLayout(const GameConfig& cfg) {
    switch (cfg.layout) {
        case LayoutKind::Dry: return dryLayout;
        case LayoutKind::Mixed:
            return [](Place& queen, const RegisterPlace& reg) { mixedLayout(queen, reg); };
        case LayoutKind::Test: break;
    }
    return testLayout;
}

AssaultPlan makeAssaultPlan(const GameConfig& cfg) {
    switch (cfg.plan) {
        case PlanKind::Full: return makeFullAssaultPlan();
        case PlanKind::Insane: return makeInsaneAssaultPlan();
        case PlanKind::Test: break;
    }
    return makeTestAssaultPlan();
}
