#include "core/types.hpp"
#include "esp_timer.h"

namespace parley {

uint64_t system_clock_ms() {
    return static_cast<uint64_t>(esp_timer_get_time() / 1000);
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::INIT:       return "INIT";
        case SessionState::LISTENING:  return "LISTENING";
        case SessionState::PROCESSING: return "PROCESSING";
        case SessionState::CLOSED:     return "CLOSED";
    }
    return "UNKNOWN";
}

const char* to_string(TurnState state) {
    switch (state) {
        case TurnState::IDLE:                 return "IDLE";
        case TurnState::TRANSCRIBING:         return "TRANSCRIBING";
        case TurnState::PERSISTING_USER:      return "PERSISTING_USER";
        case TurnState::GENERATING:           return "GENERATING";
        case TurnState::PERSISTING_ASSISTANT: return "PERSISTING_ASSISTANT";
        case TurnState::FAILED:               return "FAILED";
    }
    return "UNKNOWN";
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:            return "SUCCESS";
        case ErrorCode::INIT_FAILED:        return "INIT_FAILED";
        case ErrorCode::WIFI_FAILED:        return "WIFI_FAILED";
        case ErrorCode::SERVER_FAILED:      return "SERVER_FAILED";
        case ErrorCode::INVALID_FRAME:      return "INVALID_FRAME";
        case ErrorCode::INVALID_STATE:      return "INVALID_STATE";
        case ErrorCode::NOT_FOUND:          return "NOT_FOUND";
        case ErrorCode::SESSION_CLOSED:     return "SESSION_CLOSED";
        case ErrorCode::TURN_IN_FLIGHT:     return "TURN_IN_FLIGHT";
        case ErrorCode::PERSISTENCE_FAILED: return "PERSISTENCE_FAILED";
        case ErrorCode::MEMORY_ERROR:       return "MEMORY_ERROR";
        case ErrorCode::TIMEOUT_ERROR:      return "TIMEOUT_ERROR";
    }
    return "UNKNOWN";
}

} // namespace parley
