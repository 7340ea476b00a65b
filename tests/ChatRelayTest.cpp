#include <gtest/gtest.h>

#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include "net/RelayProtocol.hpp"
#include "SessionHarness.hpp"

namespace {

SessionConfig roomyPeer() {
    SessionConfig cfg = peerConfig();
    cfg.maxMessages = 500;
    return cfg;
}

SessionConfig roomyHost() {
    SessionConfig cfg = hostConfig();
    cfg.maxMessages = 500;
    return cfg;
}

relay::SubmitMessage submitFrame(ClientId claimedSender, const std::string& text) {
    relay::SubmitMessage m{};
    m.type = relay::Type::SubmitMessage;
    m.senderId = claimedSender;
    relay::writeString(m.text, text);
    return m;
}

// Well-formed UTF-8: every lead byte followed by exactly its continuation bytes.
bool isValidUtf8(const std::string& s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        if (c < 0x80) len = 1;
        else if ((c & 0xE0) == 0xC0) len = 2;
        else if ((c & 0xF0) == 0xE0) len = 3;
        else if ((c & 0xF8) == 0xF0) len = 4;
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return false;
        }
        i += len;
    }
    return true;
}

std::string repeat(const std::string& piece, size_t times) {
    std::string out;
    for (size_t i = 0; i < times; ++i) out += piece;
    return out;
}

} // namespace

TEST(RelayFrameTest, TruncationKeepsWholeCharacters) {
    relay::SubmitMessage m{};
    std::string back;

    // 200 x U+00E9: 400 bytes, the frame holds 255
    relay::writeString(m.text, repeat("\xC3\xA9", 200));
    ASSERT_TRUE(relay::readString(m.text, back));
    EXPECT_EQ(back.size(), 254u);
    EXPECT_TRUE(isValidUtf8(back));

    // 'a' + 100 x U+20AC: the cut would land after the second byte of a euro sign
    relay::writeString(m.text, "a" + repeat("\xE2\x82\xAC", 100));
    ASSERT_TRUE(relay::readString(m.text, back));
    EXPECT_EQ(back.size(), 253u);
    EXPECT_TRUE(isValidUtf8(back));

    // 4-byte characters in a 48-byte name field
    relay::RosterUpdate u{};
    relay::writeString(u.name, repeat("\xF0\x9F\x98\x80", 20));
    ASSERT_TRUE(relay::readString(u.name, back));
    EXPECT_EQ(back.size(), 44u);
    EXPECT_TRUE(isValidUtf8(back));
}

TEST(RelayFrameTest, TextThatFitsIsUntouched) {
    relay::SubmitMessage m{};
    std::string back;
    const std::string text = repeat("\xC3\xA9", 127);  // 254 bytes
    relay::writeString(m.text, text);
    ASSERT_TRUE(relay::readString(m.text, back));
    EXPECT_EQ(back, text);
}

class ChatRelayTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(host.session.startHosting());
        ASSERT_TRUE(joinAndSync(host, a));
        ASSERT_TRUE(joinAndSync(host, b, { &a }));
    }

    bool allHave(size_t n) {
        return pumpUntil({ &host, &a, &b }, [&] {
            return host.session.messages().size() == n
                && a.session.messages().size() == n
                && b.session.messages().size() == n;
        });
    }

    FakeNetwork net;
    Node host{ net, roomyHost() };
    Node a{ net, roomyPeer() };
    Node b{ net, roomyPeer() };
};

TEST_F(ChatRelayTest, MessageReachesEveryoneWithHostResolvedName) {
    ASSERT_TRUE(a.session.sendMessage("hi"));
    ASSERT_TRUE(allHave(1));

    const std::string expected = Roster::defaultName(a.session.localId()) + ": hi";
    EXPECT_EQ(lines(host.session.messages())[0], expected);
    EXPECT_EQ(lines(a.session.messages())[0], expected);
    EXPECT_EQ(lines(b.session.messages())[0], expected);
    EXPECT_EQ(b.session.messages().entries()[0].senderId, a.session.localId());
}

TEST_F(ChatRelayTest, HostMessagesReachPeers) {
    ASSERT_TRUE(host.session.sendMessage("welcome"));
    ASSERT_TRUE(allHave(1));
    EXPECT_EQ(lines(b.session.messages())[0], "Player 0: welcome");
}

TEST_F(ChatRelayTest, SubmitterOnlySeesOwnMessageAfterRelay) {
    ASSERT_TRUE(a.session.sendMessage("echo"));
    EXPECT_EQ(a.session.messages().size(), 0u);
    ASSERT_TRUE(allHave(1));
}

TEST_F(ChatRelayTest, ConcurrentSubmissionsShareOneOrder) {
    constexpr int kEach = 40;

    std::thread ta([&] { for (int i = 0; i < kEach; ++i) a.session.sendMessage("a" + std::to_string(i)); });
    std::thread tb([&] { for (int i = 0; i < kEach; ++i) b.session.sendMessage("b" + std::to_string(i)); });
    ta.join();
    tb.join();
    host.session.sendMessage("h");

    ASSERT_TRUE(allHave(2 * kEach + 1));
    const auto order = lines(host.session.messages());
    EXPECT_EQ(lines(a.session.messages()), order);
    EXPECT_EQ(lines(b.session.messages()), order);

    // each sender's own messages keep their submission order
    int nextA = 0;
    const std::string prefixA = Roster::defaultName(a.session.localId()) + ": a";
    for (const auto& line : order) {
        if (line.compare(0, prefixA.size(), prefixA) == 0) {
            EXPECT_EQ(line, prefixA + std::to_string(nextA));
            ++nextA;
        }
    }
    EXPECT_EQ(nextA, kEach);
}

TEST_F(ChatRelayTest, HostIgnoresSpoofedSenderId) {
    const auto frame = submitFrame(b.session.localId(), "not really b");
    ASSERT_TRUE(a.transport.send(kHostClientId, &frame, sizeof(frame)));
    ASSERT_TRUE(allHave(1));

    const ChatMessage& m = b.session.messages().entries()[0];
    EXPECT_EQ(m.senderId, a.session.localId());
    EXPECT_EQ(m.senderName, Roster::defaultName(a.session.localId()));
}

TEST_F(ChatRelayTest, LateJoinerGetsFullRoster) {
    ASSERT_TRUE(a.session.sendMessage("before"));
    ASSERT_TRUE(allHave(1));

    Node late(net, roomyPeer());
    ASSERT_TRUE(joinAndSync(host, late, { &a, &b }));

    EXPECT_EQ(late.session.roster().size(), 4u);
    EXPECT_TRUE(late.session.roster() == host.session.roster());
    EXPECT_TRUE(late.session.roster() == a.session.roster());
    EXPECT_TRUE(late.session.roster().contains(kHostClientId));
    EXPECT_TRUE(late.session.roster().contains(late.session.localId()));
    // history is not replayed
    EXPECT_EQ(late.session.messages().size(), 0u);
}

TEST_F(ChatRelayTest, RepeatedRosterRequestIsHarmless) {
    relay::RequestRoster r{};
    r.type = relay::Type::RequestRoster;
    r.requestingId = a.session.localId();
    ASSERT_TRUE(a.transport.send(kHostClientId, &r, sizeof(r)));
    ASSERT_TRUE(a.transport.send(kHostClientId, &r, sizeof(r)));

    pumpRounds({ &host, &a, &b });
    EXPECT_TRUE(a.session.roster() == host.session.roster());
    EXPECT_EQ(a.session.roster().size(), 3u);
}

TEST_F(ChatRelayTest, HostDropsShortAndUnterminatedFrames) {
    const uint8_t shortSubmit[3] = { (uint8_t)relay::Type::SubmitMessage, 1, 2 };
    ASSERT_TRUE(a.transport.send(kHostClientId, shortSubmit, sizeof(shortSubmit)));

    relay::SubmitMessage noNul{};
    noNul.type = relay::Type::SubmitMessage;
    noNul.senderId = a.session.localId();
    std::memset(noNul.text, 'x', sizeof(noNul.text));
    ASSERT_TRUE(a.transport.send(kHostClientId, &noNul, sizeof(noNul)));

    const uint8_t unknown[1] = { 0x7f };
    ASSERT_TRUE(a.transport.send(kHostClientId, unknown, sizeof(unknown)));

    const auto blank = submitFrame(a.session.localId(), "   ");
    ASSERT_TRUE(a.transport.send(kHostClientId, &blank, sizeof(blank)));

    ASSERT_TRUE(pumpUntil({ &host }, [&] { return host.session.relayDropped() == 4u; }));
    pumpRounds({ &host, &a, &b });
    EXPECT_EQ(host.session.messages().size(), 0u);
    EXPECT_EQ(b.session.messages().size(), 0u);
    EXPECT_EQ(host.session.role(), SessionRole::Hosting);
}

TEST_F(ChatRelayTest, HostRejectsPeerOnlyFrames) {
    relay::RosterUpdate forged{};
    forged.type = relay::Type::RosterUpdate;
    forged.clientId = 999;
    relay::writeString(forged.name, "Intruder");
    ASSERT_TRUE(a.transport.send(kHostClientId, &forged, sizeof(forged)));

    relay::BroadcastMessage fake{};
    fake.type = relay::Type::BroadcastMessage;
    fake.senderId = 0;
    relay::writeString(fake.senderName, "Player 0");
    relay::writeString(fake.text, "fake");
    ASSERT_TRUE(a.transport.send(kHostClientId, &fake, sizeof(fake)));

    ASSERT_TRUE(pumpUntil({ &host }, [&] { return host.session.relayDropped() == 2u; }));
    pumpRounds({ &host, &a, &b });
    EXPECT_FALSE(host.session.roster().contains(999));
    EXPECT_FALSE(b.session.roster().contains(999));
    EXPECT_EQ(b.session.messages().size(), 0u);
}

TEST_F(ChatRelayTest, PeerIgnoresFramesNotFromHost) {
    relay::RosterUpdate u{};
    u.type = relay::Type::RosterUpdate;
    u.clientId = 999;
    relay::writeString(u.name, "Ghost");
    b.events.post(SessionEvent::message(a.session.localId(), &u, sizeof(u)));

    pumpRounds({ &b });
    EXPECT_EQ(b.session.relayDropped(), 1u);
    EXPECT_FALSE(b.session.roster().contains(999));
}

TEST_F(ChatRelayTest, PeerDropsMalformedHostFrames) {
    const uint8_t shortBroadcast[2] = { (uint8_t)relay::Type::BroadcastMessage, 0 };
    b.events.post(SessionEvent::message(kHostClientId, shortBroadcast, sizeof(shortBroadcast)));

    relay::RosterUpdate noNul{};
    noNul.type = relay::Type::RosterUpdate;
    noNul.clientId = 55;
    std::memset(noNul.name, 'n', sizeof(noNul.name));
    b.events.post(SessionEvent::message(kHostClientId, &noNul, sizeof(noNul)));

    const auto submit = submitFrame(kHostClientId, "wrong direction");
    b.events.post(SessionEvent::message(kHostClientId, &submit, sizeof(submit)));

    pumpRounds({ &b });
    EXPECT_EQ(b.session.relayDropped(), 3u);
    EXPECT_FALSE(b.session.roster().contains(55));
    EXPECT_EQ(b.session.messages().size(), 0u);
    EXPECT_EQ(b.session.role(), SessionRole::Connected);
}

TEST_F(ChatRelayTest, LongTextIsTruncatedNotRejected) {
    const std::string longText(1000, 'z');
    ASSERT_TRUE(a.session.sendMessage(longText));
    ASSERT_TRUE(allHave(1));
    EXPECT_EQ(b.session.messages().entries()[0].text, std::string(relay::kMaxTextLen - 1, 'z'));
}

TEST_F(ChatRelayTest, LongMultiByteTextArrivesAsValidUtf8) {
    ASSERT_TRUE(a.session.sendMessage(repeat("\xC3\xA9", 200)));
    ASSERT_TRUE(allHave(1));

    for (Node* n : { &host, &a, &b }) {
        const std::string& text = n->session.messages().entries()[0].text;
        EXPECT_EQ(text.size(), 254u);
        EXPECT_TRUE(isValidUtf8(text));
    }
}

TEST(ChatRelayHistoryTest, LogKeepsMostRecentMessages) {
    FakeNetwork net;
    Node host(net, hostConfig());
    Node a(net, peerConfig());
    ASSERT_TRUE(host.session.startHosting());
    ASSERT_TRUE(joinAndSync(host, a));

    for (int i = 0; i < 30; ++i) ASSERT_TRUE(host.session.sendMessage("msg " + std::to_string(i)));
    ASSERT_TRUE(pumpUntil({ &host, &a }, [&] { return a.session.messages().totalReceived() == 30u; }));

    ASSERT_EQ(a.session.messages().size(), 25u);
    EXPECT_EQ(a.session.messages().entries().front().text, "msg 5");
    EXPECT_EQ(a.session.messages().entries().back().text, "msg 29");
    EXPECT_EQ(host.session.messages().size(), 25u);
}
