#pragma once

#include "../common/Constants.h"
#include "../common/Types.h"

/**
 * GestureStateMachine
 * --------------------
 * Confidence-frame hysteresis. Prevents:
 *  - gesture jitter
 *  - single-frame blips reaching the viewport
 *
 * We track:
 *  - candidate   (last raw gesture seen)
 *  - streak      (consecutive frames it was seen)
 *  - confirmed   (what we report)
 */

class GestureStateMachine
{
public:
    struct State
    {
        Gesture candidate = Gesture::Idle;
        int streak = 0;
        Gesture confirmed = Gesture::Idle;
    };

    explicit GestureStateMachine(int stableFrames = GESTURE_CONFIDENCE_FRAMES)
        : stableFrames_(stableFrames) {}

    // Feeds one raw gesture, returns the confirmed one
    Gesture filterGesture(Gesture raw) { return advance(state_, raw, stableFrames_); }

    Gesture confirmed() const { return state_.confirmed; }
    const State &state() const { return state_; }

    static Gesture advance(State &state, Gesture raw, int stableFrames);

private:
    int stableFrames_;
    State state_;
};
