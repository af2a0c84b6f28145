/**
 * @file cli_args_test.cpp
 * @brief Tests for filebeam_server / filebeam_client argument parsing.
 */

#include "filebeam/CliArgs.h"

#include <gtest/gtest.h>

using namespace FileBeam;

TEST(ServerArgsTest, NoArgumentsUsesDefaults) {
    const char* argv[] = {"filebeam_server"};
    ServerArgs a = ServerArgs::parseOrThrow(1, argv);
    EXPECT_FALSE(a.showHelp);
    EXPECT_FALSE(a.listenAddress.has_value());

    ServerSettings s;
    a.applyTo(s);
    EXPECT_EQ(s.listenAddress, DEFAULT_LISTEN_ADDRESS);
}

TEST(ServerArgsTest, FlagsOverrideSettings) {
    const char* argv[] = {"filebeam_server", "--addr", "127.0.0.1:0", "--output=inbox",
                          "--cert", "c.pem", "--key", "k.pem", "-v"};
    ServerArgs a = ServerArgs::parseOrThrow(9, argv);

    ServerSettings s;
    s.outputDir = "from-config";
    a.applyTo(s);
    EXPECT_EQ(s.listenAddress, "127.0.0.1:0");
    EXPECT_EQ(s.outputDir, "inbox");
    EXPECT_EQ(s.certPath, "c.pem");
    EXPECT_EQ(s.keyPath, "k.pem");
    EXPECT_TRUE(s.verbose);
}

TEST(ServerArgsTest, HelpFlagSetsShowHelp) {
    const char* argv[] = {"filebeam_server", "-h"};
    EXPECT_TRUE(ServerArgs::parseOrThrow(2, argv).showHelp);
    EXPECT_NE(ServerArgs::usage("filebeam_server").find("--output"), std::string::npos);
}

TEST(ServerArgsTest, UnknownArgumentThrows) {
    const char* argv[] = {"filebeam_server", "--bogus"};
    EXPECT_THROW((void)ServerArgs::parseOrThrow(2, argv), std::runtime_error);
}

TEST(ServerArgsTest, MissingValueThrows) {
    const char* argv[] = {"filebeam_server", "--addr"};
    try {
        (void)ServerArgs::parseOrThrow(2, argv);
        FAIL() << "expected throw";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Missing value for --addr");
    }
}

TEST(ServerArgsTest, EmptyValueThrows) {
    const char* argv[] = {"filebeam_server", "--output="};
    EXPECT_THROW((void)ServerArgs::parseOrThrow(2, argv), std::runtime_error);
}

TEST(ClientArgsTest, FileIsRequired) {
    const char* argv[] = {"filebeam_client", "--server", "127.0.0.1:4433"};
    try {
        (void)ClientArgs::parseOrThrow(3, argv);
        FAIL() << "expected throw";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "Missing required argument: --file <path>");
    }
}

TEST(ClientArgsTest, HelpDoesNotRequireFile) {
    const char* argv[] = {"filebeam_client", "--help"};
    EXPECT_TRUE(ClientArgs::parseOrThrow(2, argv).showHelp);
}

TEST(ClientArgsTest, AllFlagsApply) {
    const char* argv[] = {"filebeam_client", "--file", "a.bin", "--server=10.0.0.1:1",
                          "--server-name", "files.example", "--ca-cert", "ca.pem"};
    ClientArgs a = ClientArgs::parseOrThrow(8, argv);
    EXPECT_EQ(a.filePath, "a.bin");

    ClientSettings s;
    a.applyTo(s);
    EXPECT_EQ(s.serverAddress, "10.0.0.1:1");
    EXPECT_EQ(s.serverName, "files.example");
    EXPECT_EQ(s.caCertPath, "ca.pem");
}
