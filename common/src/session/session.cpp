#include "session/session.hpp"

namespace parley {

const char* to_string(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::IN_FLIGHT: return "IN_FLIGHT";
        case TurnOutcome::COMPLETED: return "COMPLETED";
        case TurnOutcome::FAILED:    return "FAILED";
        case TurnOutcome::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

} // namespace parley
