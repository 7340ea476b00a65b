#pragma once
#include <cstdint>
#include <string>

// Identity of a connected peer, assigned by the transport for the lifetime of a session.
// The host is always kHostClientId; remote peers get 1, 2, 3...
using ClientId = uint64_t;

static constexpr ClientId kHostClientId = 0;
static constexpr ClientId kInvalidClientId = ~ClientId{ 0 };

// Reliable, ordered, per-connection message transport. Implementations post what they
// observe (connects, drops, frames) into the EventQueue they were built with; nothing
// is reported by calling back into the session directly.
class Transport {
public:
    virtual ~Transport() = default;

    // Host: accept peers on all interfaces at `port`.
    virtual bool listen(uint16_t port) = 0;

    // Joining peer: start connecting. Success/failure arrives later as an event.
    virtual bool connect(const std::string& address, uint16_t port) = 0;

    // Reliable send. Host addresses remote peers by id; a joining peer can only reach kHostClientId.
    virtual bool send(ClientId to, const void* data, uint32_t size) = 0;

    // Drops every connection and the listener. Safe to call repeatedly.
    virtual void close(const char* reason) = 0;

    // Receive pending frames. Called from the owning context only.
    virtual void pump() = 0;
};
