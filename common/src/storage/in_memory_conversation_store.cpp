#include "storage/conversation_store.hpp"
#include "esp_log.h"
#include <algorithm>
#include <iterator>

static const char* TAG = "ConversationStore";

namespace parley {

SessionRecord SessionRecord::from_session(const Session& session) {
    SessionRecord record;
    record.id = session.id;
    record.state = session.state;
    record.language = session.options.language;
    record.auto_detect = session.options.auto_detect;
    record.created_at_ms = session.created_at_ms;
    record.last_activity_ms = session.last_activity_ms;
    return record;
}

InMemoryConversationStore::InMemoryConversationStore()
    : InMemoryConversationStore(StoreConfig()) {
}

InMemoryConversationStore::InMemoryConversationStore(const StoreConfig& config)
    : config_(config)
    , evicted_messages_(0)
    , evicted_sessions_(0) {
}

InMemoryConversationStore::~InMemoryConversationStore() = default;

ErrorCode InMemoryConversationStore::save_session(const SessionRecord& session) {
    if (session.id.empty()) {
        return ErrorCode::PERSISTENCE_FAILED;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    sessions_[session.id] = session;
    ESP_LOGD(TAG, "Saved session %s (%s)", session.id.c_str(), to_string(session.state));

    auto closed = std::find(closed_order_.begin(), closed_order_.end(), session.id);
    if (session.state != SessionState::CLOSED) {
        if (closed != closed_order_.end()) {
            closed_order_.erase(closed);
        }
        return ErrorCode::SUCCESS;
    }

    if (closed == closed_order_.end()) {
        closed_order_.push_back(session.id);
    }
    while (config_.max_closed_sessions > 0 && closed_order_.size() > config_.max_closed_sessions) {
        std::string oldest = closed_order_.front();
        closed_order_.pop_front();
        evict_session(oldest);
    }
    return ErrorCode::SUCCESS;
}

ErrorCode InMemoryConversationStore::find_session(const std::string& session_id,
                                                  SessionRecord& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return ErrorCode::NOT_FOUND;
    }
    out = it->second;
    return ErrorCode::SUCCESS;
}

ErrorCode InMemoryConversationStore::append_message(const Message& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (message_index_.count(message.id())) {
        ESP_LOGW(TAG, "Duplicate message id %s", message.id().c_str());
        return ErrorCode::PERSISTENCE_FAILED;
    }

    while (config_.max_messages > 0 && messages_.size() >= config_.max_messages) {
        evict_oldest_message();
    }

    messages_.push_back(message);
    message_index_[message.id()] = std::prev(messages_.end());
    ESP_LOGD(TAG, "Appended %s message %s to session %s",
             to_string(message.role()), message.id().c_str(), message.session_id().c_str());
    return ErrorCode::SUCCESS;
}

ErrorCode InMemoryConversationStore::update_message_status(const std::string& message_id,
                                                           ProcessingStatus status,
                                                           const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = message_index_.find(message_id);
    if (it == message_index_.end()) {
        return ErrorCode::NOT_FOUND;
    }

    if (!it->second->transition_to(status, error)) {
        return ErrorCode::INVALID_STATE;
    }
    return ErrorCode::SUCCESS;
}

ErrorCode InMemoryConversationStore::find_message(const std::string& message_id,
                                                  Message& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = message_index_.find(message_id);
    if (it == message_index_.end()) {
        return ErrorCode::NOT_FOUND;
    }
    out = *it->second;
    return ErrorCode::SUCCESS;
}

std::vector<Message> InMemoryConversationStore::find_messages(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Message> result;
    for (const auto& message : messages_) {
        if (message.session_id() == session_id) {
            result.push_back(message);
        }
    }
    return result;
}

size_t InMemoryConversationStore::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

size_t InMemoryConversationStore::message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_.size();
}

uint32_t InMemoryConversationStore::evicted_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_messages_;
}

uint32_t InMemoryConversationStore::evicted_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_sessions_;
}

// Callers hold mutex_
void InMemoryConversationStore::evict_oldest_message() {
    if (messages_.empty()) return;

    message_index_.erase(messages_.front().id());
    messages_.pop_front();
    evicted_messages_++;
}

void InMemoryConversationStore::evict_session(const std::string& session_id) {
    sessions_.erase(session_id);

    size_t removed = 0;
    for (auto it = messages_.begin(); it != messages_.end();) {
        if (it->session_id() == session_id) {
            message_index_.erase(it->id());
            it = messages_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }

    evicted_sessions_++;
    evicted_messages_ += static_cast<uint32_t>(removed);
    ESP_LOGI(TAG, "Evicted closed session %s with %u messages", session_id.c_str(),
             static_cast<unsigned>(removed));
}

} // namespace parley
