/**
 * @file settings_test.cpp
 * @brief JSON settings round trip and lenient loading
 */

#include "filebeam/Settings.h"
#include "test_util.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace FileBeam;
using namespace FileBeam::test;

TEST(SettingsTest, ServerDefaultsMatchConfig) {
    const ServerSettings s;
    EXPECT_EQ(s.listenAddress, DEFAULT_LISTEN_ADDRESS);
    EXPECT_EQ(s.outputDir, DEFAULT_OUTPUT_DIR);
    EXPECT_EQ(s.maxConnections, MAX_CONCURRENT_CONNECTIONS);
    EXPECT_EQ(s.subjectAltNames.size(), DEFAULT_SUBJECT_ALT_NAMES.size());
    EXPECT_FALSE(s.verbose);
}

TEST(SettingsTest, ServerRoundTripsThroughJson) {
    ServerSettings s;
    s.listenAddress = "127.0.0.1:9000";
    s.outputDir = "/tmp/in";
    s.subjectAltNames = {"files.example", "10.0.0.2"};
    s.maxConnections = 8;
    s.verbose = true;

    const ServerSettings back = ServerSettings::fromJson(s.toJson());
    EXPECT_EQ(back.listenAddress, "127.0.0.1:9000");
    EXPECT_EQ(back.outputDir, "/tmp/in");
    EXPECT_EQ(back.subjectAltNames, s.subjectAltNames);
    EXPECT_EQ(back.maxConnections, 8u);
    EXPECT_TRUE(back.verbose);
}

/**
 * @test Wrong types and non-positive numbers keep the defaults
 */
TEST(SettingsTest, InvalidFieldsFallBackToDefaults) {
    const json j = json::parse(R"({
        "listen_address": 42,
        "max_connections": 0,
        "idle_timeout_ms": -5,
        "verbose": "yes",
        "output_dir": "inbox",
        "unknown_key": true
    })");

    const ServerSettings s = ServerSettings::fromJson(j);
    EXPECT_EQ(s.listenAddress, DEFAULT_LISTEN_ADDRESS);
    EXPECT_EQ(s.maxConnections, MAX_CONCURRENT_CONNECTIONS);
    EXPECT_EQ(s.idleTimeoutMs, IDLE_TIMEOUT_MS);
    EXPECT_FALSE(s.verbose);
    EXPECT_EQ(s.outputDir, "inbox");
}

TEST(SettingsTest, NonObjectYieldsDefaults) {
    const ClientSettings s = ClientSettings::fromJson(json::array({1, 2}));
    EXPECT_EQ(s.serverAddress, DEFAULT_SERVER_ADDRESS);
    EXPECT_EQ(s.serverName, DEFAULT_SERVER_NAME);
}

TEST(SettingsTest, ClientReadsKnownKeys) {
    const json j = {{"server_address", "10.1.1.1:4433"},
                    {"server_name", "files.example"},
                    {"ca_cert_path", "ca.pem"},
                    {"idle_timeout_ms", 5000}};

    const ClientSettings s = ClientSettings::fromJson(j);
    EXPECT_EQ(s.serverAddress, "10.1.1.1:4433");
    EXPECT_EQ(s.serverName, "files.example");
    EXPECT_EQ(s.caCertPath, "ca.pem");
    EXPECT_EQ(s.idleTimeoutMs, 5000u);
}

TEST(SettingsTest, SignedIntegersAreAccepted) {
    const json j = {{"max_connections", static_cast<int64_t>(8)},
                    {"idle_timeout_ms", static_cast<int>(2500)}};
    ASSERT_TRUE(j["max_connections"].is_number_integer());
    ASSERT_FALSE(j["max_connections"].is_number_unsigned());

    const ServerSettings s = ServerSettings::fromJson(j);
    EXPECT_EQ(s.maxConnections, 8u);
    EXPECT_EQ(s.idleTimeoutMs, 2500u);
}

TEST(SettingsTest, TimeoutAboveRangeFallsBackToDefault) {
    const json j = {{"idle_timeout_ms", static_cast<int64_t>(1) << 40}};
    EXPECT_EQ(ClientSettings::fromJson(j).idleTimeoutMs, IDLE_TIMEOUT_MS);
}

TEST(SettingsTest, LoadJsonFileReportsErrors) {
    ScratchDir dir("settings");
    json out;
    std::string error;

    EXPECT_FALSE(loadJsonFile((dir.path() / "missing.json").string(), out, error));
    EXPECT_NE(error.find("Failed to open config file"), std::string::npos);

    writeFile(dir.path() / "bad.json", "{ not json");
    EXPECT_FALSE(loadJsonFile((dir.path() / "bad.json").string(), out, error));
    EXPECT_NE(error.find("Invalid JSON"), std::string::npos);

    writeFile(dir.path() / "good.json", R"({"output_dir": "x"})");
    ASSERT_TRUE(loadJsonFile((dir.path() / "good.json").string(), out, error)) << error;
    EXPECT_EQ(ServerSettings::fromJson(out).outputDir, "x");
}
