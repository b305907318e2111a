#pragma once

#include "core/task_manager.hpp"
#include "core/types.hpp"
#include "pipeline/providers.hpp"
#include <string>

namespace parley {

/**
 * HTTP collaborators. Each request runs on its own FreeRTOS task and
 * reports through the callback when the exchange ends.
 *
 * Transcription: POST audio/wav, answer {"text","confidence","language"}.
 * AI: POST {"sessionId","text","language","context":[{role,content}]},
 *     answer {"content","model","tokensUsed"}. The streaming variant asks
 *     for application/x-ndjson: {"delta":"..."} lines closed by
 *     {"done":true,"model":...,"tokensUsed":...}.
 */
struct HttpProviderOptions {
    uint32_t timeout_ms = 30000;
    uint32_t stack_size = 8192;
    UBaseType_t priority = 5;
    size_t max_response_bytes = 64 * 1024;
};

TranscriptionProvider make_http_transcription(const ProviderConfig& config,
                                              TaskManager& tasks,
                                              const HttpProviderOptions& options);

AIResponder make_http_ai_responder(const ProviderConfig& config,
                                   TaskManager& tasks,
                                   const HttpProviderOptions& options);

// Body codecs, shared with tests
bool parse_transcription_body(const std::string& body, TranscriptionResult& out);
std::string build_ai_request_body(const AIRequest& request);
bool parse_ai_body(const std::string& body, AIResponse& out);

// One NDJSON line of a streamed reply
struct AIStreamLine {
    bool is_delta = false;
    bool is_done = false;
    std::string delta;
    std::string model;
    uint32_t tokens_used = 0;
    std::string error;
};

bool parse_ai_stream_line(const std::string& line, AIStreamLine& out);

/**
 * Builds an AIResponse from an NDJSON body delivered in arbitrary chunks.
 * Lines may span chunks; the last line needs no newline. Deltas are
 * passed to on_delta as they complete. Input after the done or error
 * line is ignored.
 */
class AIStreamAssembler {
public:
    explicit AIStreamAssembler(AIDeltaCallback on_delta = AIDeltaCallback());

    void feed(const char* data, size_t length);

    // Consumes a trailing unterminated line; a stream without a done
    // line ends unsuccessfully
    void finish();

    bool finished() const { return finished_; }
    const AIResponse& response() const { return response_; }

private:
    void consume_line(const std::string& line);

    AIDeltaCallback on_delta_;
    std::string pending_;
    AIResponse response_;
    bool finished_;
};

} // namespace parley
