#include "NetCommon.hpp"
#include <iostream>

// GNS callbacks carry no user pointer.
static NetRuntime* g_active = nullptr;

void NetRuntime::s_debugOutput(ESteamNetworkingSocketsDebugOutputType type, const char* msg) {
    if (type <= k_ESteamNetworkingSocketsDebugOutputType_Warning)
        std::cerr << "[GNS] " << msg << "\n";
    else
        std::cout << "[GNS] " << msg << "\n";
}

void NetRuntime::s_onConnStatusChanged(SteamNetConnectionStatusChangedCallback_t* info) {
    if (g_active && g_active->m_sink) g_active->m_sink->onConnStatusChanged(info);
}

bool NetRuntime::init(const NetRuntimeConfig& cfg) {
    if (m_iface) return true;
    if (g_active) {
        std::cerr << "[Transport] another NetRuntime is already up\n";
        return false;
    }

    SteamDatagramErrMsg errMsg{};
    if (!GameNetworkingSockets_Init(nullptr, errMsg)) {
        std::cerr << "[Transport] GameNetworkingSockets_Init failed: " << errMsg << "\n";
        return false;
    }

    ISteamNetworkingSockets* iface = SteamNetworkingSockets();
    if (!iface) {
        std::cerr << "[Transport] no ISteamNetworkingSockets interface\n";
        GameNetworkingSockets_Kill();
        return false;
    }

    ISteamNetworkingUtils* utils = SteamNetworkingUtils();
    utils->SetDebugOutputFunction(cfg.debugLevel, &NetRuntime::s_debugOutput);
    utils->SetGlobalConfigValueInt32(k_ESteamNetworkingConfig_TimeoutInitial, cfg.connectTimeoutMs);
    utils->SetGlobalConfigValueInt32(k_ESteamNetworkingConfig_TimeoutConnected, cfg.connectedTimeoutMs);
    utils->SetGlobalCallback_SteamNetConnectionStatusChanged(&NetRuntime::s_onConnStatusChanged);

    m_iface = iface;
    g_active = this;
    std::cout << "[Transport] GameNetworkingSockets up\n";
    return true;
}

void NetRuntime::shutdown() {
    if (!m_iface) return;

    m_sink = nullptr;
    m_iface = nullptr;
    g_active = nullptr;
    GameNetworkingSockets_Kill();
    std::cout << "[Transport] GameNetworkingSockets down\n";
}

void NetRuntime::pumpCallbacks() {
    if (m_iface) m_iface->RunCallbacks();
}
