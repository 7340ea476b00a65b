#pragma once
#include <string>
#include <unordered_map>

#include "NetCommon.hpp"
#include "Transport.hpp"

class EventQueue;

// Transport over GameNetworkingSockets. One instance is either a host (listen socket +
// poll group, many connections) or a joining peer (one connection), never both.
// Register it with NetRuntime::setSink() so status changes reach it.
class GnsTransport : public Transport, public ConnStatusSink {
public:
    GnsTransport(ISteamNetworkingSockets* iface, EventQueue& events);
    ~GnsTransport() override;

    bool listen(uint16_t port) override;
    bool connect(const std::string& address, uint16_t port) override;
    bool send(ClientId to, const void* data, uint32_t size) override;
    void close(const char* reason) override;
    void pump() override;

    void onConnStatusChanged(SteamNetConnectionStatusChangedCallback_t* info) override;

    // True if the callback concerns our listen socket or our outgoing connection.
    bool owns(const SteamNetConnectionStatusChangedCallback_t* info) const;

    size_t peerCount() const { return m_idToConn.size(); }

private:
    enum class Mode { None, Host, Client };

    void onHostConnStatus(SteamNetConnectionStatusChangedCallback_t* info);
    void onClientConnStatus(SteamNetConnectionStatusChangedCallback_t* info);

    void handleClientFrame(const void* data, uint32_t size);

private:
    ISteamNetworkingSockets* m_iface{ nullptr };
    EventQueue& m_events;
    Mode m_mode{ Mode::None };

    // host
    HSteamListenSocket m_listen{ k_HSteamListenSocket_Invalid };
    HSteamNetPollGroup m_poll{ k_HSteamNetPollGroup_Invalid };
    std::unordered_map<HSteamNetConnection, ClientId> m_connToId;
    std::unordered_map<ClientId, HSteamNetConnection> m_idToConn;
    ClientId m_nextId{ kHostClientId + 1 };

    // joining peer
    HSteamNetConnection m_conn{ k_HSteamNetConnection_Invalid };
    bool m_welcomed{ false };
};
