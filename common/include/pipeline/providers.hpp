#pragma once

#include "session/message.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace parley {

struct TranscriptionRequest {
    std::string session_id;
    uint64_t turn_id = 0;
    std::vector<uint8_t> audio;  // PCM16LE
    std::string format = "pcm16";
    uint32_t sample_rate = 16000;
    uint8_t channels = 1;
    std::string language;
    bool auto_detect = false;
};

struct TranscriptionResult {
    bool success = false;
    std::string text;
    float confidence = 0.0f;
    std::string detected_language;
    uint32_t processing_time_ms = 0;
    std::string error_message;
};

struct ContextMessage {
    MessageRole role = MessageRole::USER;
    std::string content;
};

struct AIRequest {
    std::string session_id;
    uint64_t turn_id = 0;
    std::string text;
    std::string language;
    std::vector<ContextMessage> context;  // oldest first
};

struct AIResponse {
    bool success = false;
    std::string content;
    std::string model;
    uint32_t tokens_used = 0;
    uint32_t processing_time_ms = 0;
    std::string error_message;
};

using TranscriptionCallback = std::function<void(const TranscriptionResult&)>;
using PartialTranscriptCallback = std::function<void(const std::string& text, float confidence)>;
using AIDeltaCallback = std::function<void(const std::string& delta)>;
using AIResponseCallback = std::function<void(const AIResponse&)>;

/**
 * Speech-to-text capability set.
 * transcribe is mandatory, transcribe_streaming is optional.
 * Callbacks may run on any task and at most once each for the final result.
 */
struct TranscriptionProvider {
    std::string name;
    std::function<void(const TranscriptionRequest&, TranscriptionCallback)> transcribe;
    std::function<void(const TranscriptionRequest&, PartialTranscriptCallback,
                       TranscriptionCallback)> transcribe_streaming;

    bool valid() const { return static_cast<bool>(transcribe); }
    bool supports_streaming() const { return static_cast<bool>(transcribe_streaming); }
};

/**
 * Response generation capability set.
 * generate is mandatory, generate_streaming is optional.
 */
struct AIResponder {
    std::string name;
    std::function<void(const AIRequest&, AIResponseCallback)> generate;
    std::function<void(const AIRequest&, AIDeltaCallback, AIResponseCallback)> generate_streaming;

    bool valid() const { return static_cast<bool>(generate); }
    bool supports_streaming() const { return static_cast<bool>(generate_streaming); }
};

// Mock collaborators: deterministic, answer inline on the caller's task
struct MockTranscriptionConfig {
    std::string text = "Hello, how are you?";
    float confidence = 0.95f;
    std::string language = "en-US";
    bool fail = false;
    std::string error_message = "mock transcription failure";
    bool respond = true;                   // false: never calls back
    std::vector<std::string> partials;     // emitted before the final result
};

struct MockAIConfig {
    std::string reply = "I'm doing well, thank you for asking.";
    std::string model = "mock-model";
    uint32_t tokens_used = 12;
    bool fail = false;
    std::string error_message = "mock generation failure";
    bool respond = true;
    bool streaming = true;                 // expose generate_streaming
};

TranscriptionProvider make_mock_transcription(const MockTranscriptionConfig& config = MockTranscriptionConfig());
AIResponder make_mock_ai_responder(const MockAIConfig& config = MockAIConfig());

} // namespace parley
