/**
 * @file StatusEffect.cpp
 * @brief ActionState implementation: layered slow/stun effects.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#include "StatusEffect.h"

#include <algorithm>

const char* effectName(EffectKind kind) {
    switch (kind) {
        case EffectKind::Slow: return "slow";
        case EffectKind::Stun: return "stun";
    }
    return "effect";
}

/** @copydoc ActionState::apply */
void ActionState::apply(EffectKind kind, int duration) {
    if (duration <= 0) return;
    layers.push_back(Layer{kind, duration});
}

/** @copydoc ActionState::invoke */
void ActionState::invoke(int turn, const std::function<void()>& base) {
    invokeLayers(layers.size(), turn, base);
    layers.erase(std::remove_if(layers.begin(), layers.end(),
                                [](const Layer& l) { return l.remaining <= 0; }),
                 layers.end());
}

void ActionState::invokeLayers(size_t count, int turn, const std::function<void()>& base) {
    if (count == 0) {
        base();
        return;
    }
    Layer& layer = layers[count - 1];
    if (layer.remaining <= 0) {
        invokeLayers(count - 1, turn, base);
        return;
    }
    --layer.remaining;
    switch (layer.kind) {
        case EffectKind::Slow:
            if (turn % 2 == 0) invokeLayers(count - 1, turn, base);
            break;
        case EffectKind::Stun:
            break;
    }
}

/** @copydoc ActionState::describe */
std::string ActionState::describe() const {
    std::string out;
    for (auto it = layers.rbegin(); it != layers.rend(); ++it) {
        if (!out.empty()) out += ' ';
        out += effectName(it->kind);
        out += '(' + std::to_string(it->remaining) + ')';
    }
    return out;
}
