#pragma once

namespace clouddrive
{

#define DEFINE_CALL_STATES(expander) \
    expander(IDLE) \
    expander(RUNNING) \
    expander(COMPLETED) \
    expander(FAILED) \
    expander(CANCELLED)

enum CallState : unsigned int
{
#define DEFINE_ENUMERANT(name) CALL_STATE_##name,
    DEFINE_CALL_STATES(DEFINE_ENUMERANT)
#undef DEFINE_ENUMERANT
}; // CallState

const char* toString(CallState state);

// Has the call reached a state it can never leave?
bool terminal(CallState state);

} // clouddrive
