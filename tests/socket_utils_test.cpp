#include <gtest/gtest.h>

#include "filebeam/SocketUtils.h"
#include "filebeam/config.h"

using namespace FileBeam;

TEST(SocketUtilsTest, ParsesIpv4) {
    SocketAddress addr;
    std::string error;
    ASSERT_TRUE(parseSocketAddress("127.0.0.1:4433", addr, error)) << error;
    EXPECT_EQ(addr.host, "127.0.0.1");
    EXPECT_EQ(addr.port, 4433);
    EXPECT_EQ(addr.toString(), "127.0.0.1:4433");
}

TEST(SocketUtilsTest, ParsesBracketedIpv6) {
    SocketAddress addr;
    std::string error;
    ASSERT_TRUE(parseSocketAddress("[::1]:0", addr, error)) << error;
    EXPECT_EQ(addr.host, "::1");
    EXPECT_EQ(addr.port, 0);
    EXPECT_EQ(formatEndpoint(addr.host, 9), "[::1]:9");
}

TEST(SocketUtilsTest, RejectsMalformedAddresses) {
    SocketAddress addr;
    std::string error;
    for (const char* text : {"", "127.0.0.1", "localhost:4433", "1.2.3.4:99999",
                             "::1:4433", "[::1]4433", "1.2.3.4:port"}) {
        EXPECT_FALSE(parseSocketAddress(text, addr, error)) << text;
    }
}

TEST(SocketUtilsTest, DefaultAddressesUseDefaultPort) {
    SocketAddress listen;
    SocketAddress server;
    std::string error;
    ASSERT_TRUE(parseSocketAddress(DEFAULT_LISTEN_ADDRESS, listen, error)) << error;
    ASSERT_TRUE(parseSocketAddress(DEFAULT_SERVER_ADDRESS, server, error)) << error;
    EXPECT_EQ(listen.port, DEFAULT_PORT);
    EXPECT_EQ(server.port, DEFAULT_PORT);
}
