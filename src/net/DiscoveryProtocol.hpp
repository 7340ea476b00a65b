#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace discovery {

    // Exact payload of a discovery request. Anything else on the discovery port is noise.
    static constexpr char kRequestToken[] = "DISCOVER_LANCHAT_SERVER";

    static constexpr uint16_t kDefaultPort = 47777;

    // Largest datagram either side will read.
    static constexpr size_t kMaxDatagram = 1024;

    // Longest server name, in bytes. Keeps any announcement well inside kMaxDatagram.
    static constexpr size_t kMaxServerNameLen = 64;

    // Host -> joining peer, unicast reply to a request.
    // Encoded as a JSON object: {"Address": "...", "Port": n, "ServerName": "..."}
    struct ServerAnnouncement {
        std::string address;     // dotted-quad IPv4 of the host's session listener
        uint16_t    port{ 0 };   // session listen port (never the discovery port)
        std::string serverName;
    };

    bool isRequest(const std::string& payload);

    std::string encodeAnnouncement(const ServerAnnouncement& a);

    // True only for a structurally valid announcement: all three fields present with the
    // right types, a dotted-quad address and a nonzero port.
    bool decodeAnnouncement(const std::string& payload, ServerAnnouncement& out);

    bool isDottedQuad(const std::string& s);

} // namespace discovery
