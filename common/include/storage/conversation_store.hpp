#pragma once

#include "core/types.hpp"
#include "session/message.hpp"
#include "session/session.hpp"
#include <deque>
#include <list>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace parley {

// Persisted view of a session
struct SessionRecord {
    std::string id;
    SessionState state = SessionState::INIT;
    std::string language;
    bool auto_detect = false;
    uint64_t created_at_ms = 0;
    uint64_t last_activity_ms = 0;

    static SessionRecord from_session(const Session& session);
};

/**
 * Durable storage for sessions and messages.
 * Calls are synchronous and may come from any session task.
 */
class ConversationStore {
public:
    virtual ~ConversationStore() = default;

    virtual ErrorCode save_session(const SessionRecord& session) = 0;
    virtual ErrorCode find_session(const std::string& session_id, SessionRecord& out) const = 0;

    virtual ErrorCode append_message(const Message& message) = 0;
    virtual ErrorCode update_message_status(const std::string& message_id,
                                            ProcessingStatus status,
                                            const std::string& error = "") = 0;
    virtual ErrorCode find_message(const std::string& message_id, Message& out) const = 0;

    // Messages of a session in insertion order
    virtual std::vector<Message> find_messages(const std::string& session_id) const = 0;
};

/**
 * Heap-backed store used by the hub and by tests.
 *
 * Bounded by StoreConfig: past max_messages the oldest message is
 * evicted, and past max_closed_sessions the session closed longest ago
 * is dropped together with its messages. A limit of 0 disables it.
 */
class InMemoryConversationStore : public ConversationStore {
public:
    InMemoryConversationStore();
    explicit InMemoryConversationStore(const StoreConfig& config);
    ~InMemoryConversationStore() override;

    ErrorCode save_session(const SessionRecord& session) override;
    ErrorCode find_session(const std::string& session_id, SessionRecord& out) const override;

    ErrorCode append_message(const Message& message) override;
    ErrorCode update_message_status(const std::string& message_id,
                                    ProcessingStatus status,
                                    const std::string& error = "") override;
    ErrorCode find_message(const std::string& message_id, Message& out) const override;
    std::vector<Message> find_messages(const std::string& session_id) const override;

    size_t session_count() const;
    size_t message_count() const;
    uint32_t evicted_messages() const;
    uint32_t evicted_sessions() const;

private:
    void evict_oldest_message();
    void evict_session(const std::string& session_id);

    StoreConfig config_;

    mutable std::mutex mutex_;
    std::map<std::string, SessionRecord> sessions_;
    std::list<Message> messages_;
    std::map<std::string, std::list<Message>::iterator> message_index_;
    std::deque<std::string> closed_order_;

    uint32_t evicted_messages_;
    uint32_t evicted_sessions_;
};

} // namespace parley
