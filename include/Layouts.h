/**
 * @file Layouts.h
 * @brief Tunnel layouts: functions that build the places of a colony and register them.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <functional>
#include <memory>

class Place;

/** @brief Hands a new place to the colony; the flag marks a bee entrance. */
using RegisterPlace = std::function<void(std::unique_ptr<Place>, bool isBeeEntrance)>;

/** @brief Builds a colony's places leading to the colony queen @p queen. */
using Layout = std::function<void(Place& queen, const RegisterPlace& registerPlace)>;

/**
 * @brief Register @p tunnels tunnels of @p length places each, built from the queen outward.
 *
 * Places are named tunnel_<t>_<s>; when @p moatFrequency is non-zero every moatFrequency-th step is
 * a Water place named water_<t>_<s>. The outermost place of each tunnel is a bee entrance.
 */
void mixedLayout(Place& queen, const RegisterPlace& registerPlace,
                 int length = 8, int tunnels = 3, int moatFrequency = 3);

/** @brief One dry tunnel of 8 places. */
void testLayout(Place& queen, const RegisterPlace& registerPlace);
/** @brief Two dry tunnels of 8 places. */
void testLayoutMultiTunnels(Place& queen, const RegisterPlace& registerPlace);
/** @brief Three dry tunnels of 8 places. */
void dryLayout(Place& queen, const RegisterPlace& registerPlace);
