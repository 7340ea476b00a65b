#include "ChatLog.hpp"

void ChatLog::push(ChatMessage msg) {
    m_entries.push_back(std::move(msg));
    ++m_total;
    trim();
}

void ChatLog::setCapacity(size_t capacity) {
    m_capacity = capacity ? capacity : 1;
    trim();
}

void ChatLog::trim() {
    while (m_entries.size() > m_capacity) m_entries.pop_front();
}

std::string ChatLog::formatLine(const ChatMessage& m) {
    return m.senderName + ": " + m.text;
}
