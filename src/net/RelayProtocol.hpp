#pragma once
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace relay {

    static constexpr uint32_t kProtocol = 1;

    static constexpr size_t kMaxNameLen = 48;   // incl. NUL
    static constexpr size_t kMaxTextLen = 256;  // incl. NUL

    enum class Type : uint8_t {
        Welcome = 1,           // host transport -> new peer (consumed by the transport)
        SubmitMessage = 2,     // peer -> host
        BroadcastMessage = 3,  // host -> all
        RequestRoster = 4,     // peer -> host
        RosterUpdate = 5,      // host -> all (or one, when replaying)
        RosterRemove = 6,      // host -> all
    };

#pragma pack(push, 1)

    struct Welcome {
        Type     type;      // Welcome
        uint32_t protocol;  // kProtocol
        uint64_t yourId;
    };

    struct SubmitMessage {
        Type     type;      // SubmitMessage
        uint64_t senderId;  // client-supplied; host uses the connection's id instead
        char     text[kMaxTextLen];
    };

    struct BroadcastMessage {
        Type     type;      // BroadcastMessage
        uint64_t senderId;  // as resolved by the host
        char     senderName[kMaxNameLen];
        char     text[kMaxTextLen];
    };

    struct RequestRoster {
        Type     type;  // RequestRoster
        uint64_t requestingId;
    };

    struct RosterUpdate {
        Type     type;  // RosterUpdate
        uint64_t clientId;
        char     name[kMaxNameLen];
    };

    struct RosterRemove {
        Type     type;  // RosterRemove
        uint64_t clientId;
    };

#pragma pack(pop)

    // Truncates to fit, always NUL-terminated. A cut never lands inside a UTF-8
    // sequence: continuation bytes of the first dropped character go with it.
    template <size_t N>
    inline void writeString(char (&dst)[N], const std::string& src) {
        size_t n = src.size() < N - 1 ? src.size() : N - 1;
        if (n < src.size()) {
            while (n > 0 && (static_cast<unsigned char>(src[n]) & 0xC0) == 0x80) --n;
        }
        std::memcpy(dst, src.data(), n);
        dst[n] = '\0';
    }

    // False if the field has no terminator (malformed frame).
    template <size_t N>
    inline bool readString(const char (&src)[N], std::string& out) {
        const void* nul = std::memchr(src, '\0', N);
        if (!nul) return false;
        out.assign(src, static_cast<const char*>(nul) - src);
        return true;
    }

    // Copies a frame out of an arbitrary (possibly unaligned) buffer. False if too short.
    template <typename T>
    inline bool readFrame(const void* data, size_t size, T& out) {
        if (size < sizeof(T)) return false;
        std::memcpy(&out, data, sizeof(T));
        return true;
    }

} // namespace relay
