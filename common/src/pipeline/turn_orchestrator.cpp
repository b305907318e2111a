#include "pipeline/turn_orchestrator.hpp"
#include "utils/encoding.hpp"
#include "esp_log.h"
#include <algorithm>

static const char* TAG = "TurnOrchestrator";

namespace parley {

TurnOrchestrator::TurnOrchestrator(Session& session, const Dependencies& deps,
                                   FrameSink emit, PostBack post_back)
    : session_(session)
    , store_(deps.store)
    , transcription_(deps.transcription)
    , ai_(deps.ai)
    , config_(deps.config)
    , clock_(deps.clock ? deps.clock : Clock(system_clock_ms))
    , emit_(std::move(emit))
    , post_back_(std::move(post_back))
    , state_(TurnState::IDLE)
    , last_turn_id_(0) {

    if (!store_) {
        ESP_LOGE(TAG, "No conversation store; every turn will fail to persist");
    }
}

TurnOrchestrator::~TurnOrchestrator() = default;

ErrorCode TurnOrchestrator::on_turn_trigger(const std::string& session_id,
                                            std::vector<uint8_t> audio) {
    if (session_id != session_.id || session_.is_closed()) {
        ESP_LOGW(TAG, "Trigger for closed or foreign session %s ignored", session_id.c_str());
        return ErrorCode::SESSION_CLOSED;
    }

    if (state_ != TurnState::IDLE) {
        stats_.triggers_rejected++;
        ESP_LOGW(TAG, "[%s] Turn %llu still in flight (%s), trigger rejected",
                 session_.id.c_str(), static_cast<unsigned long long>(current_turn_id()),
                 to_string(state_));
        return ErrorCode::TURN_IN_FLIGHT;
    }

    if (audio.empty()) {
        ESP_LOGW(TAG, "[%s] Trigger without audio ignored", session_.id.c_str());
        return ErrorCode::INVALID_STATE;
    }

    if (!transcription_.valid()) {
        ESP_LOGE(TAG, "No transcription provider configured");
        return ErrorCode::INIT_FAILED;
    }

    turn_ = std::make_unique<Turn>();
    turn_->id = ++last_turn_id_;
    turn_->audio = std::move(audio);
    turn_->started_at_ms = now();
    turn_->stage_deadline_ms = turn_->started_at_ms + config_.transcription_timeout_ms;

    state_ = TurnState::TRANSCRIBING;
    session_.state = SessionState::PROCESSING;
    stats_.turns_started++;

    ESP_LOGI(TAG, "[%s] Turn %llu started: %zu bytes of audio",
             session_.id.c_str(), static_cast<unsigned long long>(turn_->id),
             turn_->audio.size());

    TranscriptionRequest request;
    request.session_id = session_.id;
    request.turn_id = turn_->id;
    request.audio = turn_->audio;
    request.sample_rate = session_.options.sample_rate;
    request.channels = session_.options.channels;
    request.language = session_.options.language;
    request.auto_detect = session_.options.auto_detect;

    // Results may arrive synchronously; nothing below may touch turn_
    uint64_t turn_id = turn_->id;
    PostBack post_back = post_back_;
    TranscriptionCallback done = [post_back, turn_id](const TranscriptionResult& result) {
        post_back(SessionEvent::transcription_done(turn_id, result));
    };

    if (transcription_.supports_streaming()) {
        PartialTranscriptCallback partial = [post_back, turn_id](const std::string& text,
                                                                 float confidence) {
            post_back(SessionEvent::transcription_partial(turn_id, text, confidence));
        };
        transcription_.transcribe_streaming(request, partial, done);
    } else {
        transcription_.transcribe(request, done);
    }

    return ErrorCode::SUCCESS;
}

void TurnOrchestrator::on_transcription_partial(uint64_t turn_id, const std::string& text,
                                                float confidence) {
    if (!is_current(turn_id, TurnState::TRANSCRIBING)) return;
    if (is_blank(text)) return;

    emit(make_transcript(session_.id, trim(text), confidence, false, session_.options.language));
}

void TurnOrchestrator::on_transcription_result(uint64_t turn_id, const TranscriptionResult& result) {
    if (!is_current(turn_id, TurnState::TRANSCRIBING)) return;

    turn_->transcription = result;

    if (!result.success) {
        ESP_LOGW(TAG, "[%s] Transcription failed: %s", session_.id.c_str(),
                 result.error_message.c_str());
        fail_turn(error_codes::TRANSCRIPTION_FAILED,
                  "Transcription failed: " + result.error_message);
        return;
    }

    std::string text = trim(result.text);
    if (text.empty()) {
        fail_turn(error_codes::NO_SPEECH, "No speech recognized");
        return;
    }
    if (text.size() > Message::MAX_CONTENT_LENGTH) {
        ESP_LOGW(TAG, "[%s] Transcript truncated from %zu characters",
                 session_.id.c_str(), text.size());
        text.resize(Message::MAX_CONTENT_LENGTH);
    }

    float confidence = std::max(0.0f, std::min(1.0f, result.confidence));
    std::string language = result.detected_language.empty() ? session_.options.language
                                                             : result.detected_language;

    emit(make_transcript(session_.id, text, confidence, true, language));

    state_ = TurnState::PERSISTING_USER;

    Message user_message;
    std::string audio_hash = sha256_hex(turn_->audio.data(), turn_->audio.size());
    if (Message::create_user(session_.id, text, confidence, language, audio_hash,
                             user_message) != ErrorCode::SUCCESS) {
        fail_turn(error_codes::TRANSCRIPTION_FAILED, "Transcript could not be stored");
        return;
    }

    if (persist_message(user_message) != ErrorCode::SUCCESS) {
        fail_turn(error_codes::PERSISTENCE_FAILED, "Failed to persist user message");
        return;
    }
    turn_->user_message_id = user_message.id();
    remember(user_message);

    if (config_.confidence_gate && !(confidence > config_.min_response_confidence)) {
        ESP_LOGI(TAG, "[%s] Confidence %.2f below gate %.2f, no response generated",
                 session_.id.c_str(), confidence, config_.min_response_confidence);
        complete_turn();
        return;
    }

    start_generation();
}

void TurnOrchestrator::start_generation() {
    if (!ai_.valid()) {
        fail_turn(error_codes::AI_GENERATION_FAILED, "No AI responder configured",
                  turn_->user_message_id);
        return;
    }

    state_ = TurnState::GENERATING;
    turn_->ai_started_at_ms = now();
    turn_->stage_deadline_ms = turn_->ai_started_at_ms + config_.ai_timeout_ms;

    AIRequest request;
    request.session_id = session_.id;
    request.turn_id = turn_->id;
    request.text = session_.messages.back().content();
    request.language = session_.messages.back().language();
    request.context = build_context();

    uint64_t turn_id = turn_->id;
    PostBack post_back = post_back_;
    AIResponseCallback done = [post_back, turn_id](const AIResponse& response) {
        post_back(SessionEvent::ai_done(turn_id, response));
    };

    if (config_.stream_ai_response && ai_.supports_streaming()) {
        AIDeltaCallback delta = [post_back, turn_id](const std::string& text) {
            post_back(SessionEvent::ai_delta(turn_id, text));
        };
        ai_.generate_streaming(request, delta, done);
    } else {
        ai_.generate(request, done);
    }
}

void TurnOrchestrator::on_ai_delta(uint64_t turn_id, const std::string& delta) {
    if (!is_current(turn_id, TurnState::GENERATING)) return;
    if (delta.empty()) return;

    turn_->streamed_text += delta;
    turn_->delta_count++;
    emit(make_assistant_delta(session_.id, delta));
}

void TurnOrchestrator::on_ai_result(uint64_t turn_id, const AIResponse& response) {
    if (!is_current(turn_id, TurnState::GENERATING)) return;

    turn_->ai_response = response;
    const std::string user_message_id = turn_->user_message_id;

    if (!response.success) {
        ESP_LOGW(TAG, "[%s] AI generation failed: %s", session_.id.c_str(),
                 response.error_message.c_str());
        fail_turn(error_codes::AI_GENERATION_FAILED,
                  "AI generation failed: " + response.error_message, user_message_id);
        return;
    }

    std::string content = response.content.empty() ? turn_->streamed_text : response.content;
    if (is_blank(content)) {
        fail_turn(error_codes::AI_GENERATION_FAILED, "AI generation returned no content",
                  user_message_id);
        return;
    }
    if (trim(content).size() > Message::MAX_CONTENT_LENGTH) {
        content = trim(content).substr(0, Message::MAX_CONTENT_LENGTH);
    }

    state_ = TurnState::PERSISTING_ASSISTANT;

    uint32_t latency = static_cast<uint32_t>(now() - turn_->ai_started_at_ms);
    Message assistant_message;
    if (Message::create_assistant(session_.id, content, response.model, response.tokens_used,
                                  latency, user_message_id, assistant_message) != ErrorCode::SUCCESS) {
        fail_turn(error_codes::AI_GENERATION_FAILED, "AI response could not be stored",
                  user_message_id);
        return;
    }

    if (persist_message(assistant_message) != ErrorCode::SUCCESS) {
        fail_turn(error_codes::PERSISTENCE_FAILED, "Failed to persist assistant message",
                  user_message_id);
        return;
    }
    turn_->assistant_message_id = assistant_message.id();
    remember(assistant_message);

    emit(make_assistant_done(session_.id, assistant_message.content(), response.model,
                             response.tokens_used, latency, assistant_message.id()));

    complete_turn();
}

void TurnOrchestrator::check_timeouts(uint64_t now_ms) {
    if (!turn_ || now_ms < turn_->stage_deadline_ms) return;

    if (state_ == TurnState::TRANSCRIBING) {
        ESP_LOGW(TAG, "[%s] Transcription of turn %llu timed out", session_.id.c_str(),
                 static_cast<unsigned long long>(turn_->id));
        fail_turn(error_codes::TRANSCRIPTION_TIMEOUT,
                  "Transcription timed out after " +
                  std::to_string(config_.transcription_timeout_ms) + " ms");
    } else if (state_ == TurnState::GENERATING) {
        ESP_LOGW(TAG, "[%s] AI generation of turn %llu timed out", session_.id.c_str(),
                 static_cast<unsigned long long>(turn_->id));
        fail_turn(error_codes::AI_TIMEOUT,
                  "AI generation timed out after " + std::to_string(config_.ai_timeout_ms) + " ms",
                  turn_->user_message_id);
    }
}

void TurnOrchestrator::cancel(const std::string& reason) {
    if (!turn_) return;

    ESP_LOGI(TAG, "[%s] Turn %llu cancelled: %s", session_.id.c_str(),
             static_cast<unsigned long long>(turn_->id), reason.c_str());
    finish_turn(TurnOutcome::CANCELLED, "");
}

bool TurnOrchestrator::is_current(uint64_t turn_id, TurnState expected) {
    if (session_.is_closed() || !turn_ || turn_->id != turn_id || state_ != expected) {
        stats_.stale_results++;
        ESP_LOGD(TAG, "[%s] Dropping result for turn %llu (current %llu, %s)",
                 session_.id.c_str(), static_cast<unsigned long long>(turn_id),
                 static_cast<unsigned long long>(current_turn_id()), to_string(state_));
        return false;
    }
    return true;
}

void TurnOrchestrator::complete_turn() {
    stats_.turns_completed++;
    ESP_LOGI(TAG, "[%s] Turn %llu completed in %llu ms", session_.id.c_str(),
             static_cast<unsigned long long>(turn_->id),
             static_cast<unsigned long long>(now() - turn_->started_at_ms));
    finish_turn(TurnOutcome::COMPLETED, "");
}

void TurnOrchestrator::fail_turn(const char* code, const std::string& message,
                                 const std::string& message_id) {
    state_ = TurnState::FAILED;
    stats_.turns_failed++;
    emit(make_error(session_.id, message, code, message_id));
    finish_turn(TurnOutcome::FAILED, code);
}

void TurnOrchestrator::finish_turn(TurnOutcome outcome, const std::string& error_code) {
    session_.turns.push_back(turn_->to_record(outcome, error_code, now()));
    if (config_.turn_history > 0 && session_.turns.size() > config_.turn_history) {
        session_.turns.erase(session_.turns.begin(),
                             session_.turns.end() - config_.turn_history);
    }
    turn_.reset();

    state_ = TurnState::IDLE;
    if (!session_.is_closed()) {
        session_.state = SessionState::LISTENING;
    }
}

ErrorCode TurnOrchestrator::persist_message(Message& message) {
    if (!store_) {
        message.mark_failed("no store");
        return ErrorCode::PERSISTENCE_FAILED;
    }

    message.mark_processing();
    if (store_->append_message(message) != ErrorCode::SUCCESS) {
        message.mark_failed("append failed");
        ESP_LOGE(TAG, "[%s] Failed to append %s message", session_.id.c_str(),
                 to_string(message.role()));
        return ErrorCode::PERSISTENCE_FAILED;
    }

    if (store_->update_message_status(message.id(), ProcessingStatus::COMPLETED) != ErrorCode::SUCCESS) {
        message.mark_failed("status update failed");
        ErrorCode marked = store_->update_message_status(message.id(), ProcessingStatus::FAILED,
                                                         "status update failed");
        ESP_LOGE(TAG, "[%s] Failed to complete message %s (mark failed: %s)",
                 session_.id.c_str(), message.id().c_str(), to_string(marked));
        return ErrorCode::PERSISTENCE_FAILED;
    }

    message.mark_completed();
    return ErrorCode::SUCCESS;
}

void TurnOrchestrator::remember(const Message& message) {
    // The context window plus the message being answered
    session_.messages.push_back(message);
    size_t keep = static_cast<size_t>(config_.context_window) + 1;
    if (session_.messages.size() > keep) {
        session_.messages.erase(session_.messages.begin(), session_.messages.end() - keep);
    }
}

std::vector<ContextMessage> TurnOrchestrator::build_context() const {
    std::vector<ContextMessage> context;
    for (const auto& message : session_.messages) {
        if (message.id() == turn_->user_message_id) continue;
        if (message.status() != ProcessingStatus::COMPLETED) continue;

        ContextMessage entry;
        entry.role = message.role();
        entry.content = message.content();
        context.push_back(entry);
    }

    if (context.size() > config_.context_window) {
        context.erase(context.begin(), context.end() - config_.context_window);
    }
    return context;
}

void TurnOrchestrator::emit(const ProtocolFrame& frame) {
    if (emit_) {
        emit_(frame);
    }
}

uint64_t TurnOrchestrator::now() const {
    return clock_();
}

} // namespace parley
