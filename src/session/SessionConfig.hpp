#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "net/DiscoveryProtocol.hpp"

struct SessionConfig {
    uint16_t    listenPort = 7777;                       // session transport, all interfaces
    uint16_t    discoveryPort = discovery::kDefaultPort;
    std::string serverName = "Local Game";               // at most discovery::kMaxServerNameLen bytes

    std::string advertisedAddress;  // empty: first LAN IPv4 of this machine
    std::string broadcastAddress;   // empty: subnet broadcast of that interface

    size_t maxMessages = 25;

    int discoveryAttempts = 3;
    std::chrono::milliseconds discoveryInterval{ 1000 };

    // Host stops answering discovery while this many remote peers are connected. 0 = never.
    size_t maxPeers = 0;
};

// Fills `cfg` from command-line flags:
//   --port N  --discovery-port N  --name S  --advertise IP  --broadcast IP
//   --max-messages N  --attempts N  --interval-ms N  --max-peers N
// Flags it does not know are appended to `rest` (front ends add their own).
// Returns false and prints usage on a malformed or out-of-range value.
bool parseSessionArgs(int argc, char** argv, SessionConfig& cfg, std::vector<std::string>& rest);

void printSessionUsage(const char* exe);
