#pragma once

#include "core/task_manager.hpp"
#include "core/types.hpp"
#include "protocol/protocol_frame.hpp"
#include "session/session.hpp"
#include "session/session_worker.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace parley {

/**
 * Process-wide map of live sessions. The lock guards only the map; all
 * per-session work happens on the session's own worker.
 *
 * With a TaskManager each session gets a FreeRTOS task; without one the
 * workers run inline on the caller (used by tests).
 */
class SessionRegistry {
public:
    struct TaskSettings {
        uint32_t stack_size = 8192;
        UBaseType_t priority = 5;
    };

    SessionRegistry(const SessionWorker::Dependencies& deps,
                    const ProtocolConfig& protocol,
                    TaskManager* tasks = nullptr);
    SessionRegistry(const SessionWorker::Dependencies& deps,
                    const ProtocolConfig& protocol,
                    TaskManager* tasks,
                    const TaskSettings& task_settings);
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    // Creates the session or reattaches to a live one; the worker
    // answers SESSION_READY through sink
    ErrorCode find_or_create(const std::string& session_id,
                             const SessionOptions& options,
                             FrameSink sink,
                             std::shared_ptr<SessionWorker>& out,
                             bool* created = nullptr);

    // Null when unknown or closing
    std::shared_ptr<SessionWorker> find(const std::string& session_id) const;

    // Graceful close; notify sends SESSION_CLOSED to the client
    ErrorCode close(const std::string& session_id, const std::string& reason, bool notify);

    // Liveness refresh (heartbeat)
    ErrorCode touch(const std::string& session_id, uint64_t now_ms);

    // Closes sessions idle for longer than the configured timeout
    size_t sweep_idle(uint64_t now_ms);

    // Forwards a timeout check to every worker
    void tick(uint64_t now_ms);

    size_t active_count() const;
    std::vector<std::string> session_ids() const;

    void close_all(const std::string& reason);

private:
    SessionWorker::Dependencies deps_;
    ProtocolConfig protocol_;
    TaskManager* tasks_;
    TaskSettings task_settings_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<SessionWorker>> sessions_;
};

} // namespace parley
