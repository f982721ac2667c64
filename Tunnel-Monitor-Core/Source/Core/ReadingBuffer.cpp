#include "Core/ReadingBuffer.hpp"

ReadingBuffer::ReadingBuffer(std::size_t capacity)
    : m_capacity(capacity) {
}

void ReadingBuffer::push(Reading r) {
    m_items.push_back(std::move(r));
    while (m_items.size() > m_capacity) m_items.pop_front();
}

void ReadingBuffer::clear() {
    m_items.clear();
}

std::vector<Reading> ReadingBuffer::toVector() const {
    return std::vector<Reading>(m_items.begin(), m_items.end());
}
