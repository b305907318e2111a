#pragma once

#include "audio/silence_tracker.hpp"
#include "audio/vad_processor.hpp"
#include "core/types.hpp"
#include "pipeline/providers.hpp"
#include "pipeline/turn_orchestrator.hpp"
#include "protocol/protocol_frame.hpp"
#include "session/session.hpp"
#include "session/session_event.hpp"
#include "storage/conversation_store.hpp"
#include "utils/ring_buffer.hpp"
#include "freertos/FreeRTOS.h"
#include "freertos/queue.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace parley {

/**
 * Serial executor for one session. Owns the session state, its VAD,
 * silence tracker, turn audio buffer and turn orchestrator, and applies
 * mailbox events one at a time.
 *
 * The mailbox is a FreeRTOS queue of owning SessionEvent pointers.
 * TASK mode: run() is the body of a dedicated FreeRTOS task.
 * INLINE mode: post() drains the mailbox on the posting thread; a post
 * made while draining is queued behind the current event.
 *
 * create() throws std::bad_alloc or std::runtime_error when the turn
 * buffer or the mailbox cannot be allocated.
 */
class SessionWorker : public std::enable_shared_from_this<SessionWorker> {
public:
    enum class Mode {
        INLINE,
        TASK
    };

    struct Dependencies {
        ConversationStore* store = nullptr;
        TranscriptionProvider transcription;
        AIResponder ai;
        VadConfig vad;
        SilenceConfig silence;
        TurnConfig turn;
        ProtocolConfig protocol;
        Clock clock;
    };

    static std::shared_ptr<SessionWorker> create(const std::string& session_id,
                                                 const SessionOptions& options,
                                                 const Dependencies& deps,
                                                 Mode mode);
    ~SessionWorker();

    SessionWorker(const SessionWorker&) = delete;
    SessionWorker& operator=(const SessionWorker&) = delete;

    // Thread-safe; false once the session is closing or the mailbox is full
    bool post(SessionEvent&& event);

    // Marks the session closing; the worker closes it after the events
    // already queued
    void request_close(const std::string& reason, bool notify);

    // TASK mode body; returns after the session closed
    void run();

    // Applies queued events without blocking; returns how many
    size_t process_pending();

    void touch(uint64_t now_ms);

    const std::string& id() const { return id_; }
    Mode mode() const { return mode_; }
    bool is_closing() const { return closing_.load(); }
    bool is_closed() const { return closed_.load(); }
    uint64_t last_activity_ms() const { return last_activity_ms_.load(); }
    uint32_t dropped_events() const { return dropped_events_.load(); }

    // Worker-thread state, exposed for diagnostics and tests
    const Session& session() const { return session_; }
    const TurnOrchestrator& orchestrator() const { return *orchestrator_; }
    const SilenceTracker& silence_tracker() const { return tracker_; }
    size_t buffered_audio_bytes() const { return turn_audio_.available(); }
    size_t turn_buffer_capacity() const { return turn_audio_.capacity(); }

    // Turn buffer size for a format, bounded by the configured byte cap
    static size_t turn_buffer_bytes(const SessionOptions& options, const TurnConfig& turn);

private:
    SessionWorker(const std::string& session_id, const SessionOptions& options,
                  const Dependencies& deps, Mode mode);

    bool enqueue(SessionEvent&& event);
    void wake();
    void handle(SessionEvent& event);
    void handle_start(SessionEvent& event);
    void handle_audio(SessionEvent& event);
    void finish_close();
    void emit(const ProtocolFrame& frame);

    const std::string id_;
    const Mode mode_;
    Dependencies deps_;
    Clock clock_;

    // Owned by the worker thread
    Session session_;
    VADProcessor vad_;
    SilenceTracker tracker_;
    RingBuffer turn_audio_;
    std::unique_ptr<TurnOrchestrator> orchestrator_;
    FrameSink sink_;
    uint32_t rejected_frames_;

    QueueHandle_t mailbox_;
    std::atomic<bool> draining_;
    std::atomic<uint32_t> dropped_events_;

    // Close request, read by the worker once closing_ is set
    std::mutex close_mutex_;
    std::string close_reason_;
    bool close_notify_;

    std::atomic<bool> closing_;
    std::atomic<bool> closed_;
    std::atomic<uint64_t> last_activity_ms_;
};

} // namespace parley
