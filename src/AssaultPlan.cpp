/**
 * @file AssaultPlan.cpp
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "AssaultPlan.h"
#include "Insect.h"

AssaultPlan::AssaultPlan(int beeArmor) : armor(beeArmor) {}

AssaultPlan& AssaultPlan::addWave(int time, int count) {
    auto& bees = waves[time];
    for (int i = 0; i < count; ++i) bees.push_back(std::make_shared<Bee>(armor));
    return *this;
}

const std::vector<std::shared_ptr<Bee>>& AssaultPlan::wave(int time) const {
    static const std::vector<std::shared_ptr<Bee>> none;
    auto it = waves.find(time);
    return it == waves.end() ? none : it->second;
}

std::vector<std::shared_ptr<Bee>> AssaultPlan::allBees() const {
    std::vector<std::shared_ptr<Bee>> out;
    for (const auto& kv : waves) out.insert(out.end(), kv.second.begin(), kv.second.end());
    return out;
}

std::vector<int> AssaultPlan::waveTimes() const {
    std::vector<int> out;
    for (const auto& kv : waves) out.push_back(kv.first);
    return out;
}

AssaultPlan makeTestAssaultPlan() {
    AssaultPlan plan;
    plan.addWave(2, 1).addWave(3, 1);
    return plan;
}

AssaultPlan makeFullAssaultPlan() {
    AssaultPlan plan;
    plan.addWave(2, 1);
    for (int time = 3; time < 15; time += 2) plan.addWave(time, 1);
    plan.addWave(15, 8);
    return plan;
}

AssaultPlan makeInsaneAssaultPlan() {
    AssaultPlan plan(4);
    plan.addWave(1, 2);
    for (int time = 3; time < 15; ++time) plan.addWave(time, 1);
    plan.addWave(15, 20);
    return plan;
}
