#pragma once
#include <functional>
#include <memory>
#include <string>
#include <asio.hpp>

// Eventi consegnati dal trasporto, sempre sul thread dell'io_context
struct TransportEvent {
    enum class Kind { Opened, Data, Errored, Closed };

    Kind kind;
    std::string payload;   // testo del frame (Data) o motivo (Errored)
};

using TransportEventSink = std::function<void(TransportEvent)>;

// Trasporto a messaggi testuali. Dopo un Errored arriva sempre un Closed.
class ITransport {
public:
    virtual ~ITransport() = default;

    // Avvia l'apertura asincrona. Lancia se il trasporto non può nemmeno partire
    // (URL non valido, risorse non disponibili).
    virtual void open(const std::string& url) = 0;

    // Accoda un frame testuale; false se il trasporto non è aperto.
    virtual bool send(const std::string& text) = 0;

    virtual void close() = 0;
    [[nodiscard]] virtual bool isOpen() const = 0;
};

using TransportFactory = std::function<std::unique_ptr<ITransport>(asio::io_context&, TransportEventSink)>;
