#include "MediaEngine.h"

const char* playerStateName(PlayerState state) {
    switch (state) {
        case PlayerState::Playing:   return "playing";
        case PlayerState::Paused:    return "paused";
        case PlayerState::Opening:   return "opening";
        case PlayerState::Ended:     return "ended";
        case PlayerState::Error:     return "error";
        case PlayerState::Buffering: return "buffering";
        case PlayerState::Stopped:
        default:
            return "stopped";
    }
}
