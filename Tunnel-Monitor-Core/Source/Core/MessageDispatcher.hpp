#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include "Core/StateStore.hpp"

enum class DispatchResult {
    Applied,        // una mutazione dello store
    Ignored,        // nessuna mutazione (tag sconosciuto, forma non valida, pong)
    DecodeFailed    // JSON non valido: scartato
};

struct DispatchStats {
    std::uint64_t received = 0;
    std::uint64_t applied = 0;
    std::uint64_t ignored = 0;
    std::uint64_t decodeFailures = 0;
    std::uint64_t pongs = 0;
    std::string   lastDecodeError;
};

// Decodifica i frame grezzi e li applica allo StateStore.
// Non propaga mai errori verso il chiamante.
class MessageDispatcher {
public:
    explicit MessageDispatcher(StateStore& store);

    DispatchResult dispatch(const std::string& raw);

    [[nodiscard]] DispatchStats stats() const;

private:
    StateStore& m_store;

    mutable std::mutex m_mx;
    DispatchStats m_stats;
};
