#include <gtest/gtest.h>

#include "net/DiscoveryProtocol.hpp"

using discovery::ServerAnnouncement;

TEST(DiscoveryProtocolTest, RequestMustMatchExactly) {
    EXPECT_TRUE(discovery::isRequest("DISCOVER_LANCHAT_SERVER"));

    EXPECT_FALSE(discovery::isRequest(""));
    EXPECT_FALSE(discovery::isRequest("DISCOVER_LANCHAT_SERVER\n"));
    EXPECT_FALSE(discovery::isRequest(" DISCOVER_LANCHAT_SERVER"));
    EXPECT_FALSE(discovery::isRequest("discover_lanchat_server"));
    EXPECT_FALSE(discovery::isRequest(std::string("DISCOVER_LANCHAT_SERVER\0", 24)));
    EXPECT_FALSE(discovery::isRequest("DISCOVER_LANCHAT_SERVE"));
}

TEST(DiscoveryProtocolTest, AnnouncementUsesNamedFields) {
    const std::string text = discovery::encodeAnnouncement({ "192.168.1.10", 7777, "Local Game" });
    EXPECT_NE(text.find("\"Address\":\"192.168.1.10\""), std::string::npos);
    EXPECT_NE(text.find("\"Port\":7777"), std::string::npos);
    EXPECT_NE(text.find("\"ServerName\":\"Local Game\""), std::string::npos);

    ServerAnnouncement out;
    ASSERT_TRUE(discovery::decodeAnnouncement(text, out));
    EXPECT_EQ(out.address, "192.168.1.10");
    EXPECT_EQ(out.port, 7777);
    EXPECT_EQ(out.serverName, "Local Game");
}

TEST(DiscoveryProtocolTest, AcceptsFieldsInAnyOrderAndExtraKeys) {
    ServerAnnouncement out;
    ASSERT_TRUE(discovery::decodeAnnouncement(
        R"({"ServerName":"Den","Version":2,"Port":27020,"Address":"10.0.0.4"})", out));
    EXPECT_EQ(out.address, "10.0.0.4");
    EXPECT_EQ(out.port, 27020);
    EXPECT_EQ(out.serverName, "Den");
}

TEST(DiscoveryProtocolTest, RejectsStructurallyInvalidReplies) {
    ServerAnnouncement out;
    EXPECT_FALSE(discovery::decodeAnnouncement("", out));
    EXPECT_FALSE(discovery::decodeAnnouncement("DISCOVER_LANCHAT_SERVER", out));
    EXPECT_FALSE(discovery::decodeAnnouncement("{", out));
    EXPECT_FALSE(discovery::decodeAnnouncement("[1,2,3]", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":7777})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Port":7777,"ServerName":"x"})", out));
}

TEST(DiscoveryProtocolTest, RejectsBadPort) {
    ServerAnnouncement out;
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":0,"ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":-1,"ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":65536,"ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":"7777","ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":77.5,"ServerName":"x"})", out));
}

TEST(DiscoveryProtocolTest, RejectsBadAddress) {
    ServerAnnouncement out;
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"host.local","Port":7777,"ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"300.1.1.1","Port":7777,"ServerName":"x"})", out));
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":7,"Port":7777,"ServerName":"x"})", out));
}

TEST(DiscoveryProtocolTest, FailedDecodeLeavesOutputUntouched) {
    ServerAnnouncement out{ "1.2.3.4", 1, "keep" };
    EXPECT_FALSE(discovery::decodeAnnouncement(R"({"Address":"10.0.0.4","Port":0,"ServerName":"x"})", out));
    EXPECT_EQ(out.address, "1.2.3.4");
    EXPECT_EQ(out.serverName, "keep");
}
