/**
 * @file Layouts.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "Layouts.h"
#include "Place.h"

#include <string>

void mixedLayout(Place& queen, const RegisterPlace& registerPlace,
                 int length, int tunnels, int moatFrequency) {
    for (int tunnel = 0; tunnel < tunnels; ++tunnel) {
        Place* exit = &queen;
        for (int step = 0; step < length; ++step) {
            const std::string suffix = std::to_string(tunnel) + "_" + std::to_string(step);
            std::unique_ptr<Place> place;
            if (moatFrequency != 0 && (step + 1) % moatFrequency == 0) {
                place = std::make_unique<Water>("water_" + suffix, exit);
            } else {
                place = std::make_unique<Place>("tunnel_" + suffix, exit);
            }
            exit = place.get();
            registerPlace(std::move(place), step == length - 1);
        }
    }
}

void testLayout(Place& queen, const RegisterPlace& registerPlace) {
    mixedLayout(queen, registerPlace, 8, 1, 0);
}

void testLayoutMultiTunnels(Place& queen, const RegisterPlace& registerPlace) {
    mixedLayout(queen, registerPlace, 8, 2, 0);
}

void dryLayout(Place& queen, const RegisterPlace& registerPlace) {
    mixedLayout(queen, registerPlace, 8, 3, 0);
}
