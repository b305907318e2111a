#pragma once

#include "pipeline/providers.hpp"
#include "protocol/protocol_frame.hpp"
#include "session/session.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace parley {

/**
 * Mailbox entry of a SessionWorker. Everything that mutates a session
 * arrives as one of these, from the socket or from a collaborator task.
 * The mailbox carries owning pointers; the receiver deletes them.
 */
struct SessionEvent {
    enum class Kind {
        START,
        AUDIO,
        TRANSCRIPTION_PARTIAL,
        TRANSCRIPTION_DONE,
        AI_DELTA,
        AI_DONE,
        TICK
    };

    Kind kind = Kind::TICK;
    uint64_t turn_id = 0;
    uint64_t timestamp_ms = 0;

    // START
    SessionOptions options;
    FrameSink sink;

    // AUDIO
    std::vector<uint8_t> audio;
    float energy = -1.0f;

    // TRANSCRIPTION_PARTIAL, AI_DELTA
    std::string text;
    float confidence = 0.0f;

    TranscriptionResult transcription;
    AIResponse ai;

    static SessionEvent start(const SessionOptions& options, FrameSink sink) {
        SessionEvent event;
        event.kind = Kind::START;
        event.options = options;
        event.sink = std::move(sink);
        return event;
    }

    static SessionEvent audio_chunk(std::vector<uint8_t> audio, float energy) {
        SessionEvent event;
        event.kind = Kind::AUDIO;
        event.audio = std::move(audio);
        event.energy = energy;
        return event;
    }

    static SessionEvent transcription_partial(uint64_t turn_id, const std::string& text,
                                              float confidence) {
        SessionEvent event;
        event.kind = Kind::TRANSCRIPTION_PARTIAL;
        event.turn_id = turn_id;
        event.text = text;
        event.confidence = confidence;
        return event;
    }

    static SessionEvent transcription_done(uint64_t turn_id, const TranscriptionResult& result) {
        SessionEvent event;
        event.kind = Kind::TRANSCRIPTION_DONE;
        event.turn_id = turn_id;
        event.transcription = result;
        return event;
    }

    static SessionEvent ai_delta(uint64_t turn_id, const std::string& delta) {
        SessionEvent event;
        event.kind = Kind::AI_DELTA;
        event.turn_id = turn_id;
        event.text = delta;
        return event;
    }

    static SessionEvent ai_done(uint64_t turn_id, const AIResponse& response) {
        SessionEvent event;
        event.kind = Kind::AI_DONE;
        event.turn_id = turn_id;
        event.ai = response;
        return event;
    }

    static SessionEvent tick(uint64_t now_ms) {
        SessionEvent event;
        event.kind = Kind::TICK;
        event.timestamp_ms = now_ms;
        return event;
    }
};

} // namespace parley
