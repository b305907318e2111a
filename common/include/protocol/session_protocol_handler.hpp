#pragma once

#include "core/types.hpp"
#include "protocol/frame_validator.hpp"
#include "protocol/protocol_frame.hpp"
#include "session/session_registry.hpp"
#include "utils/token_bucket.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace parley {

// One client transport; a connection carries at most one session
struct Connection {
    int id = -1;
    std::string session_id;
    FrameSink sink;
};

/**
 * Entry point for inbound frames: size check, parse, validate, dispatch.
 * Rejections are answered with an error frame on the connection and never
 * reach a session.
 */
class SessionProtocolHandler {
public:
    struct Stats {
        uint32_t frames_received = 0;
        uint32_t frames_rejected = 0;
        uint32_t frames_dropped = 0;
        uint32_t frames_rate_limited = 0;
        uint32_t sessions_started = 0;
    };

    SessionProtocolHandler(SessionRegistry& registry, const ProtocolConfig& config,
                           Clock clock = Clock());

    // Text frame as received from the socket
    void handle_text(Connection& connection, const std::string& raw);

    // Ceiling check for frames the transport has not read yet;
    // rejects with an error frame when too large
    bool admit_frame_size(Connection& connection, size_t length);

    // Raw PCM16LE for the session bound to the connection
    void handle_binary(Connection& connection, const uint8_t* data, size_t length);

    // Transport gone; closes the session this connection owns and
    // forgets its rate limits
    void handle_disconnect(Connection& connection);

    ValidationResult validate(const ProtocolFrame& frame) const;

    // Routes an already validated frame
    ErrorCode dispatch(Connection& connection, ProtocolFrame& frame);

    const Stats& stats() const { return stats_; }

private:
    // Per-connection token buckets; heartbeats are never charged
    struct RateLimits {
        TokenBucket audio;
        TokenBucket control;
    };

    bool admit_rate(Connection& connection, FrameType type, const std::string& session_id);
    ErrorCode start_session(Connection& connection, ProtocolFrame& frame);
    ErrorCode end_session(Connection& connection, const ProtocolFrame& frame);
    ErrorCode heartbeat(Connection& connection, const ProtocolFrame& frame);
    ErrorCode forward_audio(const std::string& session_id, std::vector<uint8_t> audio, float energy);
    void reject(Connection& connection, const std::string& session_id, const std::string& message);
    void send(Connection& connection, const ProtocolFrame& frame);

    SessionRegistry& registry_;
    ProtocolConfig config_;
    FrameValidator validator_;
    Clock clock_;
    Stats stats_;

    // session id -> owning connection id
    std::mutex owners_mutex_;
    std::map<std::string, int> owners_;

    std::mutex limits_mutex_;
    std::map<int, RateLimits> limits_;
};

} // namespace parley
