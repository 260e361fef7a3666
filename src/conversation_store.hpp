#pragma once
#include "backend.hpp"
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <mutex>
#include <atomic>

namespace chordrelay {

// In-memory session id -> ordered message list.
//
// Constructed once per process and passed by reference to whoever mutates
// it. No operation fails for an unknown session id: absence reads as an
// empty conversation. The map lock is held only to find or create an entry;
// each session has its own lock, so different sessions never wait on each
// other's mutations.
class ConversationStore {
public:
    // Exclusive claim on one session for the duration of a relay turn.
    // Releases on destruction. Moveable, not copyable.
    class TurnGuard {
    public:
        TurnGuard() = default;
        ~TurnGuard() { release(); }
        TurnGuard(TurnGuard&& other) noexcept : flag_(other.flag_) { other.flag_ = nullptr; }
        TurnGuard& operator=(TurnGuard&& other) noexcept {
            if (this != &other) {
                release();
                flag_ = other.flag_;
                other.flag_ = nullptr;
            }
            return *this;
        }
        TurnGuard(const TurnGuard&) = delete;
        TurnGuard& operator=(const TurnGuard&) = delete;

        explicit operator bool() const { return flag_ != nullptr; }
        void release();

    private:
        friend class ConversationStore;
        explicit TurnGuard(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}
        std::shared_ptr<std::atomic<bool>> flag_;
    };

    void append(const std::string& session_id, Message message);

    // Copy in insertion order; empty for unknown ids.
    std::vector<Message> read(const std::string& session_id) const;

    // Copy with every system message moved ahead of the rest, relative order
    // within each group preserved. This is what a backend call must send.
    std::vector<Message> read_for_backend(const std::string& session_id) const;

    // Drop existing system messages and prepend the given ones.
    void replace_system_prefix(const std::string& session_id,
                               const std::vector<Message>& system_messages);

    // Remove exactly one trailing message; no-op when empty.
    void remove_last(const std::string& session_id);

    void set_exact(const std::string& session_id, std::vector<Message> messages);

    size_t size(const std::string& session_id) const;
    std::vector<std::string> session_ids() const;

    // Claim the session for one turn. Returns an empty guard when another
    // turn for the same session is still in flight.
    TurnGuard try_begin_turn(const std::string& session_id);

private:
    struct Entry {
        mutable std::mutex mutex;
        std::vector<Message> messages;
        std::shared_ptr<std::atomic<bool>> busy = std::make_shared<std::atomic<bool>>(false);
    };

    std::shared_ptr<Entry> find(const std::string& session_id) const;
    std::shared_ptr<Entry> find_or_create(const std::string& session_id);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Entry>> sessions_;
};

// Stable partition: system messages first.
std::vector<Message> order_system_first(const std::vector<Message>& messages);

} // namespace chordrelay
