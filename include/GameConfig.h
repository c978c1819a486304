/**
 * @file GameConfig.h
 * @brief Run options for the ants game: defaults, environment overrides, then command-line overrides.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <string>

#include "AssaultPlan.h"
#include "Layouts.h"

/** @brief Which tunnel layout to build. */
enum class LayoutKind { Test, Dry, Mixed };
/** @brief Which assault plan the hive carries. */
enum class PlanKind { Test, Full, Insane };

struct GameConfig {
    int food{2};                        /**< starting food */
    unsigned seed{0};                   /**< engine PRNG seed; 0 = nondeterministic */
    LayoutKind layout{LayoutKind::Test};
    PlanKind plan{PlanKind::Test};
    bool showHelp{false};
};

/**
 * @brief Build the run options.
 *
 * ANTS_FOOD and ANTS_SEED override the defaults; flags override the environment:
 * -t/--ten, -f/--full, -w/--water, -i/--insane, --food N, --food=N, --seed N, --seed=N, -h/--help.
 * Malformed or negative numbers are ignored.
 */
GameConfig loadGameConfig(int argc, char** argv);

/** @brief Usage text for @p prog. */
std::string usageText(const std::string& prog);

/** @brief The layout selected by @p cfg. */
Layout makeLayout(const GameConfig& cfg);
/** @brief The assault plan selected by @p cfg. */
AssaultPlan makeAssaultPlan(const GameConfig& cfg);
