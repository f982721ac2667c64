#pragma once
#include <cstddef>
#include <deque>
#include <vector>
#include "Core/Telemetry.hpp"

// FIFO limitato: oltre la capacità scarta le letture più vecchie.
class ReadingBuffer {
public:
    static constexpr std::size_t kDefaultCapacity = 500;

    explicit ReadingBuffer(std::size_t capacity = kDefaultCapacity);

    // Accoda; se si supera la capacità elimina dalla testa fino a size == capacity
    void push(Reading r);
    void clear();

    [[nodiscard]] std::size_t size() const { return m_items.size(); }
    [[nodiscard]] std::size_t capacity() const { return m_capacity; }
    [[nodiscard]] bool empty() const { return m_items.empty(); }

    // Copia in ordine di arrivo (la più vecchia per prima)
    std::vector<Reading> toVector() const;

private:
    std::size_t m_capacity;
    std::deque<Reading> m_items;
};
