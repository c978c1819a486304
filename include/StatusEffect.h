/**
 * @file StatusEffect.h
 * @brief Declares ActionState: time-bounded effects layered over an insect's base action.
 *
 * @copyright Copyright (c) 2025 Sam Caldwell. Released under the MIT License.
 */
#pragma once

#include <functional>
#include <string>
#include <vector>

/** @brief Built-in effects a thrower can inflict. */
enum class EffectKind {
    Slow, /**< the wrapped action only runs on even turns */
    Stun  /**< the wrapped action does not run at all */
};

/** @brief Display name of an effect ("slow", "stun"). */
const char* effectName(EffectKind kind);

/**
 * @class ActionState
 * @brief The per-turn behavior of an insect: its base action wrapped by zero or more effect layers.
 *
 * Each layer is applied over whatever is installed at the time, so a second effect applied before the
 * first expires nests inside-out. On invocation the outermost layer runs first: while it has turns
 * left it consumes one and applies its transform to the rest of the chain; once exhausted it passes
 * straight through. Exhausted layers are dropped after the call.
 */
class ActionState {
public:
    /** @brief Wrap the current behavior in @p kind for the next @p duration invocations. */
    void apply(EffectKind kind, int duration);

    /** @brief Run one turn of behavior at simulation time @p turn; @p base is the unwrapped action. */
    void invoke(int turn, const std::function<void()>& base);

    /** @brief Number of layers still installed. */
    size_t depth() const { return layers.size(); }
    /** @brief True once every effect has expired and the base action runs unchanged. */
    bool empty() const { return layers.empty(); }
    /** @brief Remaining turns of the outermost layer (0 when empty). */
    int outermostRemaining() const { return layers.empty() ? 0 : layers.back().remaining; }

    /** @brief Short description such as "stun(1) slow(2)", outermost first. */
    std::string describe() const;

private:
    struct Layer {
        EffectKind kind;
        int remaining;
    };

    /** @brief Invoke the chain made of the first @p count layers (innermost first) around @p base. */
    void invokeLayers(size_t count, int turn, const std::function<void()>& base);

    std::vector<Layer> layers; /**< innermost first */
};
