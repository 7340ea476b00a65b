#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>

struct ChatMessage {
    uint64_t    senderId{ 0 };
    std::string senderName;
    std::string text;
};

// Most recent messages in arrival order. Past capacity the oldest entry is evicted.
// Nothing here is persisted.
class ChatLog {
public:
    explicit ChatLog(size_t capacity = 25) : m_capacity(capacity ? capacity : 1) {}

    void push(ChatMessage msg);

    const std::deque<ChatMessage>& entries() const { return m_entries; }
    size_t size() const { return m_entries.size(); }
    size_t capacity() const { return m_capacity; }

    // Shrinking evicts from the front immediately.
    void setCapacity(size_t capacity);
    void clear() { m_entries.clear(); m_total = 0; }

    // Total pushed since construction/clear, including evicted ones.
    uint64_t totalReceived() const { return m_total; }

    static std::string formatLine(const ChatMessage& m);

private:
    void trim();

private:
    size_t m_capacity;
    std::deque<ChatMessage> m_entries;
    uint64_t m_total{ 0 };
};
