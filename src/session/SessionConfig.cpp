#include "SessionConfig.hpp"
#include <iostream>
#include <limits>

static bool parseUnsigned(const std::string& s, unsigned long long maxValue, unsigned long long& out) {
    if (s.empty() || s[0] == '-') return false;
    try {
        size_t used = 0;
        out = std::stoull(s, &used);
        return used == s.size() && out <= maxValue;
    }
    catch (const std::exception&) {
        return false;
    }
}

void printSessionUsage(const char* exe) {
    std::cerr << "Usage: " << exe << " [--port N] [--discovery-port N] [--name S]\n"
              << "       [--advertise IP] [--broadcast IP] [--max-messages N]\n"
              << "       [--attempts N] [--interval-ms N] [--max-peers N]\n";
}

bool parseSessionArgs(int argc, char** argv, SessionConfig& cfg, std::vector<std::string>& rest) {
    constexpr auto kU16 = std::numeric_limits<uint16_t>::max();
    constexpr auto kInt = (unsigned long long)std::numeric_limits<int>::max();

    for (int i = 1; i < argc; ++i) {
        const std::string s = argv[i];
        const bool hasValue = i + 1 < argc;
        unsigned long long v = 0;

        auto bad = [&](const char* what) {
            std::cerr << "Bad value for " << s << ": expected " << what << "\n";
            printSessionUsage(argv[0]);
            return false;
        };

        if (s == "--port" && hasValue) {
            if (!parseUnsigned(argv[++i], kU16, v) || v == 0) return bad("port 1-65535");
            cfg.listenPort = (uint16_t)v;
        }
        else if (s == "--discovery-port" && hasValue) {
            if (!parseUnsigned(argv[++i], kU16, v) || v == 0) return bad("port 1-65535");
            cfg.discoveryPort = (uint16_t)v;
        }
        else if (s == "--name" && hasValue) {
            cfg.serverName = argv[++i];
            if (cfg.serverName.empty() || cfg.serverName.size() > discovery::kMaxServerNameLen)
                return bad("name of 1-64 bytes");
        }
        else if (s == "--advertise" && hasValue) {
            cfg.advertisedAddress = argv[++i];
            if (!discovery::isDottedQuad(cfg.advertisedAddress)) return bad("IPv4 address");
        }
        else if (s == "--broadcast" && hasValue) {
            cfg.broadcastAddress = argv[++i];
            if (!discovery::isDottedQuad(cfg.broadcastAddress)) return bad("IPv4 address");
        }
        else if (s == "--max-messages" && hasValue) {
            if (!parseUnsigned(argv[++i], kInt, v) || v == 0) return bad("positive count");
            cfg.maxMessages = (size_t)v;
        }
        else if (s == "--attempts" && hasValue) {
            if (!parseUnsigned(argv[++i], kInt, v) || v == 0) return bad("positive count");
            cfg.discoveryAttempts = (int)v;
        }
        else if (s == "--interval-ms" && hasValue) {
            if (!parseUnsigned(argv[++i], kInt, v)) return bad("milliseconds");
            cfg.discoveryInterval = std::chrono::milliseconds(v);
        }
        else if (s == "--max-peers" && hasValue) {
            if (!parseUnsigned(argv[++i], kInt, v)) return bad("count");
            cfg.maxPeers = (size_t)v;
        }
        else {
            rest.push_back(s);
        }
    }
    return true;
}
