#include "conversation_store.hpp"
#include <algorithm>

namespace chordrelay {

std::vector<Message> order_system_first(const std::vector<Message>& messages) {
    std::vector<Message> ordered = messages;
    std::stable_partition(ordered.begin(), ordered.end(),
        [](const Message& m) { return m.role == Role::System; });
    return ordered;
}

void ConversationStore::TurnGuard::release() {
    if (flag_) {
        flag_->store(false);
        flag_.reset();
    }
}

std::shared_ptr<ConversationStore::Entry>
ConversationStore::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it != sessions_.end() ? it->second : nullptr;
}

std::shared_ptr<ConversationStore::Entry>
ConversationStore::find_or_create(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = sessions_[session_id];
    if (!slot) slot = std::make_shared<Entry>();
    return slot;
}

void ConversationStore::append(const std::string& session_id, Message message) {
    auto entry = find_or_create(session_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->messages.push_back(std::move(message));
}

std::vector<Message> ConversationStore::read(const std::string& session_id) const {
    auto entry = find(session_id);
    if (!entry) return {};
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->messages;
}

std::vector<Message> ConversationStore::read_for_backend(const std::string& session_id) const {
    return order_system_first(read(session_id));
}

void ConversationStore::replace_system_prefix(const std::string& session_id,
                                              const std::vector<Message>& system_messages) {
    auto entry = find_or_create(session_id);
    std::lock_guard<std::mutex> lock(entry->mutex);

    std::vector<Message> updated = system_messages;
    for (auto& m : entry->messages) {
        if (m.role != Role::System) updated.push_back(std::move(m));
    }
    entry->messages = std::move(updated);
}

void ConversationStore::remove_last(const std::string& session_id) {
    auto entry = find(session_id);
    if (!entry) return;
    std::lock_guard<std::mutex> lock(entry->mutex);
    if (!entry->messages.empty()) entry->messages.pop_back();
}

void ConversationStore::set_exact(const std::string& session_id, std::vector<Message> messages) {
    auto entry = find_or_create(session_id);
    std::lock_guard<std::mutex> lock(entry->mutex);
    entry->messages = std::move(messages);
}

size_t ConversationStore::size(const std::string& session_id) const {
    auto entry = find(session_id);
    if (!entry) return 0;
    std::lock_guard<std::mutex> lock(entry->mutex);
    return entry->messages.size();
}

std::vector<std::string> ConversationStore::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, _] : sessions_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

ConversationStore::TurnGuard ConversationStore::try_begin_turn(const std::string& session_id) {
    auto entry = find_or_create(session_id);
    bool expected = false;
    if (!entry->busy->compare_exchange_strong(expected, true)) {
        return TurnGuard();
    }
    return TurnGuard(entry->busy);
}

} // namespace chordrelay
