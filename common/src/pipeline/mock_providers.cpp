#include "pipeline/providers.hpp"
#include "esp_log.h"

static const char* TAG = "MockProviders";

namespace parley {

namespace {

// Word-sized chunks whose concatenation equals text
std::vector<std::string> split_words(const std::string& text) {
    std::vector<std::string> chunks;
    std::string current;
    for (char c : text) {
        current += c;
        if (c == ' ') {
            chunks.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        chunks.push_back(current);
    }
    return chunks;
}

TranscriptionResult mock_transcription_result(const MockTranscriptionConfig& config) {
    TranscriptionResult result;
    if (config.fail) {
        result.success = false;
        result.error_message = config.error_message;
        return result;
    }
    result.success = true;
    result.text = config.text;
    result.confidence = config.confidence;
    result.detected_language = config.language;
    result.processing_time_ms = 1;
    return result;
}

AIResponse mock_ai_response(const MockAIConfig& config) {
    AIResponse response;
    if (config.fail) {
        response.success = false;
        response.error_message = config.error_message;
        return response;
    }
    response.success = true;
    response.content = config.reply;
    response.model = config.model;
    response.tokens_used = config.tokens_used;
    response.processing_time_ms = 1;
    return response;
}

} // namespace

TranscriptionProvider make_mock_transcription(const MockTranscriptionConfig& config) {
    TranscriptionProvider provider;
    provider.name = "mock";

    provider.transcribe = [config](const TranscriptionRequest& request, TranscriptionCallback done) {
        ESP_LOGD(TAG, "transcribe turn %llu: %zu bytes",
                 static_cast<unsigned long long>(request.turn_id), request.audio.size());
        if (!config.respond) return;
        done(mock_transcription_result(config));
    };

    if (!config.partials.empty()) {
        provider.transcribe_streaming = [config](const TranscriptionRequest& request,
                                                 PartialTranscriptCallback partial,
                                                 TranscriptionCallback done) {
            ESP_LOGD(TAG, "transcribe_streaming turn %llu",
                     static_cast<unsigned long long>(request.turn_id));
            if (!config.respond) return;
            for (const auto& text : config.partials) {
                partial(text, config.confidence);
            }
            done(mock_transcription_result(config));
        };
    }

    return provider;
}

AIResponder make_mock_ai_responder(const MockAIConfig& config) {
    AIResponder responder;
    responder.name = "mock";

    responder.generate = [config](const AIRequest& request, AIResponseCallback done) {
        ESP_LOGD(TAG, "generate turn %llu with %zu context messages",
                 static_cast<unsigned long long>(request.turn_id), request.context.size());
        if (!config.respond) return;
        done(mock_ai_response(config));
    };

    if (config.streaming) {
        responder.generate_streaming = [config](const AIRequest& request,
                                                AIDeltaCallback delta,
                                                AIResponseCallback done) {
            ESP_LOGD(TAG, "generate_streaming turn %llu",
                     static_cast<unsigned long long>(request.turn_id));
            if (!config.respond) return;
            if (!config.fail) {
                for (const auto& chunk : split_words(config.reply)) {
                    delta(chunk);
                }
            }
            done(mock_ai_response(config));
        };
    }

    return responder;
}

} // namespace parley
