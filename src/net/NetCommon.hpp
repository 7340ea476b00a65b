#pragma once
#include <cstdint>

#include <steam/steamnetworkingsockets.h>
#include <steam/isteamnetworkingsockets.h>
#include <steam/steamnetworkingtypes.h>
#include <steam/isteamnetworkingutils.h>
#include <steam/steam_api_common.h>

// Receives the connection status changes NetRuntime::pumpCallbacks() delivers.
class ConnStatusSink {
public:
    virtual ~ConnStatusSink() = default;
    virtual void onConnStatusChanged(SteamNetConnectionStatusChangedCallback_t* info) = 0;
};

struct NetRuntimeConfig {
    ESteamNetworkingSocketsDebugOutputType debugLevel = k_ESteamNetworkingSocketsDebugOutputType_Warning;

    // On a LAN an unreachable host should turn into "Connection failed" quickly.
    int32_t connectTimeoutMs = 5000;
    int32_t connectedTimeoutMs = 10000;
};

// GameNetworkingSockets for the whole process. At most one runtime is up at a time.
class NetRuntime {
public:
    NetRuntime() = default;
    ~NetRuntime() { shutdown(); }

    NetRuntime(const NetRuntime&) = delete;
    NetRuntime& operator=(const NetRuntime&) = delete;

    bool init(const NetRuntimeConfig& cfg = {});
    void shutdown();

    bool isUp() const { return m_iface != nullptr; }
    ISteamNetworkingSockets* iface() const { return m_iface; }

    // Call once per frame/tick. Connection state callbacks are only delivered from here.
    void pumpCallbacks();

    // Where status changes go. Detach (nullptr) before the sink is destroyed.
    void setSink(ConnStatusSink* sink) { m_sink = sink; }

private:
    static void s_onConnStatusChanged(SteamNetConnectionStatusChangedCallback_t* info);
    static void s_debugOutput(ESteamNetworkingSocketsDebugOutputType type, const char* msg);

private:
    ISteamNetworkingSockets* m_iface{ nullptr };
    ConnStatusSink* m_sink{ nullptr };
};
