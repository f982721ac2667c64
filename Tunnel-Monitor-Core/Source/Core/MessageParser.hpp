#pragma once
#include <optional>
#include <string>
#include "Core/Telemetry.hpp"

// Classificazione di un frame in ingresso (in ordine di priorità)
enum class InboundKind {
    Status,             // {"type":"status","data":{...}}
    RecordingStarted,   // {"type":"recording_started"}
    RecordingStopped,   // {"type":"recording_stopped"}
    ReadingsCleared,    // {"type":"readings_cleared"}
    Pong,               // {"type":"pong"}
    Reading,            // nessun tag riconosciuto ma "timestamp" presente
    Ignored             // tag sconosciuto o payload con forma non valida
};

const char* ToString(InboundKind k);

struct InboundMessage {
    InboundKind  kind{ InboundKind::Ignored };
    SystemStatus status{};      // valido per Status
    Reading      reading{};     // valido per Reading
};

// Decodifica un frame JSON testuale.
// - nullopt solo se il testo non è JSON valido (outErr riceve il motivo)
// - tipi sconosciuti o campi mancanti -> InboundKind::Ignored (non è un errore)
std::optional<InboundMessage> ParseInboundMessage(const std::string& raw, std::string* outErr = nullptr);
