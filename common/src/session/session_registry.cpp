#include "session/session_registry.hpp"
#include "esp_log.h"
#include <exception>

static const char* TAG = "SessionRegistry";

namespace parley {

SessionRegistry::SessionRegistry(const SessionWorker::Dependencies& deps,
                                 const ProtocolConfig& protocol,
                                 TaskManager* tasks)
    : SessionRegistry(deps, protocol, tasks, TaskSettings()) {
}

SessionRegistry::SessionRegistry(const SessionWorker::Dependencies& deps,
                                 const ProtocolConfig& protocol,
                                 TaskManager* tasks,
                                 const TaskSettings& task_settings)
    : deps_(deps)
    , protocol_(protocol)
    , tasks_(tasks)
    , task_settings_(task_settings) {

    if (!deps_.clock) {
        deps_.clock = system_clock_ms;
    }
    deps_.protocol = protocol_;
}

SessionRegistry::~SessionRegistry() {
    close_all("shutdown");
}

ErrorCode SessionRegistry::find_or_create(const std::string& session_id,
                                          const SessionOptions& options,
                                          FrameSink sink,
                                          std::shared_ptr<SessionWorker>& out,
                                          bool* created) {
    std::shared_ptr<SessionWorker> worker;
    bool is_new = false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it != sessions_.end() && !it->second->is_closing()) {
            worker = it->second;
        } else {
            SessionWorker::Mode mode = tasks_ ? SessionWorker::Mode::TASK
                                              : SessionWorker::Mode::INLINE;
            try {
                worker = SessionWorker::create(session_id, options, deps_, mode);
            } catch (const std::exception& e) {
                ESP_LOGE(TAG, "Session %s could not be created: %s", session_id.c_str(), e.what());
                return ErrorCode::INIT_FAILED;
            }
            sessions_[session_id] = worker;
            is_new = true;
        }
    }

    if (is_new && tasks_) {
        std::shared_ptr<SessionWorker> task_ref = worker;
        ErrorCode result = tasks_->spawn("sess", [task_ref]() { task_ref->run(); },
                                         task_settings_.stack_size,
                                         task_settings_.priority);
        if (result != ErrorCode::SUCCESS) {
            ESP_LOGE(TAG, "No task for session %s: %s", session_id.c_str(), to_string(result));
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_.erase(session_id);
            return result;
        }
    }

    if (!worker->post(SessionEvent::start(options, std::move(sink)))) {
        return ErrorCode::SESSION_CLOSED;
    }

    if (is_new) {
        ESP_LOGI(TAG, "Session %s created (%u active)", session_id.c_str(),
                 static_cast<unsigned>(active_count()));
    }
    if (created) *created = is_new;
    out = worker;
    return ErrorCode::SUCCESS;
}

std::shared_ptr<SessionWorker> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end() || it->second->is_closing()) {
        return nullptr;
    }
    return it->second;
}

ErrorCode SessionRegistry::close(const std::string& session_id, const std::string& reason,
                                 bool notify) {
    std::shared_ptr<SessionWorker> worker;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return ErrorCode::NOT_FOUND;
        }
        worker = it->second;
        sessions_.erase(it);
    }

    worker->request_close(reason, notify);
    ESP_LOGI(TAG, "Session %s closing: %s", session_id.c_str(), reason.c_str());
    return ErrorCode::SUCCESS;
}

ErrorCode SessionRegistry::touch(const std::string& session_id, uint64_t now_ms) {
    std::shared_ptr<SessionWorker> worker = find(session_id);
    if (!worker) {
        return ErrorCode::NOT_FOUND;
    }
    worker->touch(now_ms);
    return ErrorCode::SUCCESS;
}

size_t SessionRegistry::sweep_idle(uint64_t now_ms) {
    std::vector<std::string> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            uint64_t last = entry.second->last_activity_ms();
            if (now_ms > last && now_ms - last > protocol_.session_idle_timeout_ms) {
                idle.push_back(entry.first);
            }
        }
    }

    for (const auto& id : idle) {
        ESP_LOGI(TAG, "Session %s idle, closing", id.c_str());
        close(id, "idle timeout", true);
    }
    return idle.size();
}

void SessionRegistry::tick(uint64_t now_ms) {
    std::vector<std::shared_ptr<SessionWorker>> workers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : sessions_) {
            workers.push_back(entry.second);
        }
    }

    for (auto& worker : workers) {
        worker->post(SessionEvent::tick(now_ms));
    }
}

size_t SessionRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    for (const auto& entry : sessions_) {
        ids.push_back(entry.first);
    }
    return ids;
}

void SessionRegistry::close_all(const std::string& reason) {
    for (const auto& id : session_ids()) {
        close(id, reason, false);
    }
}

} // namespace parley
