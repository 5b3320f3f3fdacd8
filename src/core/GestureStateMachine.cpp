#include "GestureStateMachine.h"

Gesture GestureStateMachine::advance(State &st, Gesture raw, int stableFrames)
{
    if (raw == st.candidate)
    {
        // saturates, nothing past the threshold is observable
        if (st.streak < stableFrames)
            st.streak++;
    }
    else
    {
        st.candidate = raw;
        st.streak = 1;
    }

    if (st.streak >= stableFrames)
        st.confirmed = raw;

    return st.confirmed;
}
