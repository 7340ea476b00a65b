#include "DiscoveryProtocol.hpp"
#include <iostream>
#include <limits>

#include <arpa/inet.h>
#include <nlohmann/json.hpp>

namespace discovery {

    using json = nlohmann::json;

    bool isRequest(const std::string& payload) {
        return payload == kRequestToken;
    }

    std::string encodeAnnouncement(const ServerAnnouncement& a) {
        json j;
        j["Address"] = a.address;
        j["Port"] = a.port;
        j["ServerName"] = a.serverName;
        // serverName comes from user config; never let a bad byte sequence throw here
        return j.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    bool isDottedQuad(const std::string& s) {
        in_addr tmp{};
        return inet_pton(AF_INET, s.c_str(), &tmp) == 1;
    }

    bool decodeAnnouncement(const std::string& payload, ServerAnnouncement& out) {
        const json j = json::parse(payload, nullptr, /*allow_exceptions=*/false);
        if (j.is_discarded() || !j.is_object()) return false;

        const auto addr = j.find("Address");
        const auto port = j.find("Port");
        const auto name = j.find("ServerName");
        if (addr == j.end() || port == j.end() || name == j.end()) return false;
        if (!addr->is_string() || !name->is_string()) return false;
        if (!port->is_number_unsigned()) return false;

        const uint64_t p = port->get<uint64_t>();
        if (p == 0 || p > std::numeric_limits<uint16_t>::max()) return false;

        std::string address = addr->get<std::string>();
        if (!isDottedQuad(address)) return false;

        out.address = std::move(address);
        out.port = (uint16_t)p;
        out.serverName = name->get<std::string>();
        return true;
    }

} // namespace discovery
