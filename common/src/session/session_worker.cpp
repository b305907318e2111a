#include "session/session_worker.hpp"
#include "esp_log.h"
#include <algorithm>
#include <stdexcept>

static const char* TAG = "SessionWorker";

namespace parley {

namespace {
const uint32_t WORKER_TICK_MS = 100;
const uint32_t POST_WAIT_MS = 20;
}

std::shared_ptr<SessionWorker> SessionWorker::create(const std::string& session_id,
                                                     const SessionOptions& options,
                                                     const Dependencies& deps,
                                                     Mode mode) {
    std::shared_ptr<SessionWorker> worker(new SessionWorker(session_id, options, deps, mode));

    // Collaborator callbacks hold only a weak reference
    std::weak_ptr<SessionWorker> weak = worker;
    TurnOrchestrator::Dependencies turn_deps;
    turn_deps.store = deps.store;
    turn_deps.transcription = deps.transcription;
    turn_deps.ai = deps.ai;
    turn_deps.config = deps.turn;
    turn_deps.clock = worker->clock_;

    SessionWorker* raw = worker.get();
    worker->orchestrator_ = std::make_unique<TurnOrchestrator>(
        worker->session_, turn_deps,
        [raw](const ProtocolFrame& frame) { raw->emit(frame); },
        [weak](SessionEvent&& event) {
            std::shared_ptr<SessionWorker> target = weak.lock();
            if (!target) return false;
            return target->post(std::move(event));
        });

    return worker;
}

SessionWorker::SessionWorker(const std::string& session_id, const SessionOptions& options,
                             const Dependencies& deps, Mode mode)
    : id_(session_id)
    , mode_(mode)
    , deps_(deps)
    , clock_(deps.clock ? deps.clock : Clock(system_clock_ms))
    , vad_(deps.vad)
    , tracker_(deps.silence)
    , turn_audio_(turn_buffer_bytes(options, deps.turn))
    , rejected_frames_(0)
    , mailbox_(nullptr)
    , draining_(false)
    , dropped_events_(0)
    , close_notify_(false)
    , closing_(false)
    , closed_(false)
    , last_activity_ms_(0) {

    UBaseType_t depth = std::max<uint32_t>(deps.protocol.session_queue_depth, 1);
    mailbox_ = xQueueCreate(depth, sizeof(SessionEvent*));
    if (!mailbox_) {
        ESP_LOGE(TAG, "[%s] Failed to create mailbox (%u slots)", session_id.c_str(),
                 static_cast<unsigned>(depth));
        throw std::runtime_error("Failed to create session mailbox");
    }

    uint64_t now = clock_();
    session_.id = session_id;
    session_.options = options;
    session_.created_at_ms = now;
    session_.last_activity_ms = now;
    last_activity_ms_ = now;
}

SessionWorker::~SessionWorker() {
    if (mailbox_) {
        SessionEvent* leftover = nullptr;
        while (xQueueReceive(mailbox_, &leftover, 0) == pdTRUE) {
            delete leftover;
        }
        vQueueDelete(mailbox_);
    }
    ESP_LOGD(TAG, "[%s] Worker destroyed", id_.c_str());
}

bool SessionWorker::post(SessionEvent&& event) {
    if (!enqueue(std::move(event))) {
        return false;
    }
    if (mode_ == Mode::INLINE) {
        process_pending();
    }
    return true;
}

void SessionWorker::request_close(const std::string& reason, bool notify) {
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        if (closing_.load()) {
            return;
        }
        close_reason_ = reason;
        close_notify_ = notify;
        closing_ = true;
    }

    if (mode_ == Mode::INLINE) {
        process_pending();
    } else {
        wake();
    }
}

bool SessionWorker::enqueue(SessionEvent&& event) {
    if (closing_.load() || closed_.load()) {
        return false;
    }

    std::unique_ptr<SessionEvent> item = std::make_unique<SessionEvent>(std::move(event));
    SessionEvent* raw = item.get();

    // The inline drainer is the caller, so it must never wait
    TickType_t wait = mode_ == Mode::TASK ? pdMS_TO_TICKS(POST_WAIT_MS) : 0;
    if (xQueueSend(mailbox_, &raw, wait) != pdTRUE) {
        dropped_events_++;
        ESP_LOGW(TAG, "[%s] Mailbox full, event %d dropped", id_.c_str(),
                 static_cast<int>(raw->kind));
        return false;
    }

    item.release();
    return true;
}

void SessionWorker::wake() {
    // Null entry; a full mailbox wakes the task anyway
    SessionEvent* none = nullptr;
    xQueueSend(mailbox_, &none, 0);
}

void SessionWorker::run() {
    ESP_LOGI(TAG, "[%s] Worker task started", id_.c_str());

    while (!closed_.load()) {
        SessionEvent* raw = nullptr;
        if (xQueueReceive(mailbox_, &raw, pdMS_TO_TICKS(WORKER_TICK_MS)) == pdTRUE) {
            std::unique_ptr<SessionEvent> event(raw);
            if (event && !closed_.load()) {
                handle(*event);
            }
        }

        process_pending();

        if (!closed_.load()) {
            orchestrator_->check_timeouts(clock_());
        }
    }

    ESP_LOGI(TAG, "[%s] Worker task exiting", id_.c_str());
}

size_t SessionWorker::process_pending() {
    if (draining_.exchange(true)) {
        return 0;
    }

    size_t processed = 0;
    SessionEvent* raw = nullptr;
    while (!closed_.load() && xQueueReceive(mailbox_, &raw, 0) == pdTRUE) {
        std::unique_ptr<SessionEvent> event(raw);
        if (!event) continue;

        handle(*event);
        processed++;
    }

    if (closing_.load() && !closed_.load()) {
        finish_close();
    }

    draining_ = false;
    return processed;
}

void SessionWorker::touch(uint64_t now_ms) {
    last_activity_ms_ = now_ms;
}

void SessionWorker::handle(SessionEvent& event) {
    switch (event.kind) {
        case SessionEvent::Kind::START:
            handle_start(event);
            break;
        case SessionEvent::Kind::AUDIO:
            handle_audio(event);
            break;
        case SessionEvent::Kind::TRANSCRIPTION_PARTIAL:
            orchestrator_->on_transcription_partial(event.turn_id, event.text, event.confidence);
            break;
        case SessionEvent::Kind::TRANSCRIPTION_DONE:
            orchestrator_->on_transcription_result(event.turn_id, event.transcription);
            break;
        case SessionEvent::Kind::AI_DELTA:
            orchestrator_->on_ai_delta(event.turn_id, event.text);
            break;
        case SessionEvent::Kind::AI_DONE:
            orchestrator_->on_ai_result(event.turn_id, event.ai);
            break;
        case SessionEvent::Kind::TICK:
            orchestrator_->check_timeouts(event.timestamp_ms ? event.timestamp_ms : clock_());
            break;
    }
}

void SessionWorker::handle_start(SessionEvent& event) {
    uint64_t now = clock_();
    sink_ = event.sink;
    session_.last_activity_ms = now;
    touch(now);

    if (session_.state == SessionState::INIT) {
        session_.state = SessionState::LISTENING;
        ESP_LOGI(TAG, "[%s] Session started: language=%s auto_detect=%d rate=%u channels=%u",
                 id_.c_str(), session_.options.language.c_str(), session_.options.auto_detect,
                 static_cast<unsigned>(session_.options.sample_rate),
                 static_cast<unsigned>(session_.options.channels));
    } else {
        // Language settings follow the client; the audio format is fixed by the turn buffer
        session_.options.language = event.options.language;
        session_.options.auto_detect = event.options.auto_detect;
        if (event.options.sample_rate != session_.options.sample_rate ||
            event.options.channels != session_.options.channels) {
            ESP_LOGW(TAG, "[%s] Reattach asked for %u Hz x%u, keeping %u Hz x%u", id_.c_str(),
                     static_cast<unsigned>(event.options.sample_rate),
                     static_cast<unsigned>(event.options.channels),
                     static_cast<unsigned>(session_.options.sample_rate),
                     static_cast<unsigned>(session_.options.channels));
        }
        ESP_LOGI(TAG, "[%s] Session reattached (%s): language=%s auto_detect=%d", id_.c_str(),
                 to_string(session_.state), session_.options.language.c_str(),
                 session_.options.auto_detect);
    }

    if (deps_.store &&
        deps_.store->save_session(SessionRecord::from_session(session_)) != ErrorCode::SUCCESS) {
        ESP_LOGW(TAG, "[%s] Failed to save session record", id_.c_str());
    }

    emit(make_session_ready(id_, session_.options.language, session_.options.auto_detect,
                            session_.options.sample_rate, session_.options.channels));
}

void SessionWorker::handle_audio(SessionEvent& event) {
    uint64_t now = clock_();
    session_.last_activity_ms = now;
    touch(now);

    AudioFrame frame = AudioFrame::from_pcm16le(event.audio.data(), event.audio.size(),
                                                session_.options.sample_rate,
                                                session_.options.channels, now);
    if (event.energy >= 0.0f) {
        frame.energy = event.energy;
    }

    VoiceActivityResult vad = vad_.classify(frame);
    SilenceClassification silence;
    if (tracker_.update(vad, silence) != ErrorCode::SUCCESS) {
        rejected_frames_++;
        emit(make_error(id_, "Audio frame is too short to classify (" +
                        std::to_string(event.audio.size()) + " bytes)",
                        error_codes::VALIDATION_ERROR));
        return;
    }

    // The pause after a finished utterance belongs to no turn
    bool trailing_pause = tracker_.has_triggered_this_episode() &&
                          silence.type >= SilenceType::MEDIUM &&
                          !silence.should_trigger_processing;
    if (!trailing_pause) {
        turn_audio_.write(event.audio.data(), event.audio.size());
    }

    if (silence.state_changed && deps_.protocol.emit_vad_events) {
        emit(make_vad_state(id_, to_string(silence.type), silence.silence_duration_ms,
                            silence.speech_duration_ms));
    }

    if (silence.should_trigger_processing) {
        if (orchestrator_->in_flight()) {
            // Rejected; the buffered audio rolls into the next turn
            orchestrator_->on_turn_trigger(id_, std::vector<uint8_t>());
            return;
        }

        std::vector<uint8_t> audio;
        turn_audio_.drain(audio);
        ErrorCode result = orchestrator_->on_turn_trigger(id_, std::move(audio));
        if (result != ErrorCode::SUCCESS) {
            ESP_LOGW(TAG, "[%s] Turn not started: %s", id_.c_str(), to_string(result));
        }
        return;
    }

    // Leading silence or a noise blip followed by long silence is not worth keeping
    if (silence.type == SilenceType::LONG && silence.speech_duration_ms == 0 &&
        !tracker_.has_triggered_this_episode() && !orchestrator_->in_flight()) {
        turn_audio_.clear();
    }
}

void SessionWorker::finish_close() {
    std::string reason;
    bool notify;
    {
        std::lock_guard<std::mutex> lock(close_mutex_);
        reason = close_reason_;
        notify = close_notify_;
    }

    orchestrator_->cancel(reason);
    tracker_.reset();
    turn_audio_.clear();

    session_.state = SessionState::CLOSED;
    session_.last_activity_ms = clock_();

    if (deps_.store &&
        deps_.store->save_session(SessionRecord::from_session(session_)) != ErrorCode::SUCCESS) {
        ESP_LOGW(TAG, "[%s] Failed to save closed session record", id_.c_str());
    }

    if (notify) {
        emit(make_session_closed(id_, reason));
    }

    ESP_LOGI(TAG, "[%s] Session closed (%s): %u turns, %u rejected frames, %u dropped events",
             id_.c_str(), reason.c_str(),
             static_cast<unsigned>(orchestrator_->stats().turns_started),
             static_cast<unsigned>(rejected_frames_),
             static_cast<unsigned>(dropped_events_.load()));

    sink_ = nullptr;
    closed_ = true;
}

void SessionWorker::emit(const ProtocolFrame& frame) {
    if (!sink_) return;

    ProtocolFrame stamped = frame;
    if (stamped.timestamp_ms == 0) {
        stamped.timestamp_ms = clock_();
    }
    sink_(stamped);
}

size_t SessionWorker::turn_buffer_bytes(const SessionOptions& options, const TurnConfig& turn) {
    uint64_t bytes_per_second = static_cast<uint64_t>(options.sample_rate) * options.channels * 2;
    uint64_t bytes = bytes_per_second * turn.max_turn_audio_ms / 1000;
    bytes = std::min<uint64_t>(bytes, turn.max_turn_audio_bytes);
    bytes -= bytes % 2;
    return bytes >= 2 ? static_cast<size_t>(bytes) : 2;
}

} // namespace parley
