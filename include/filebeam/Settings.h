/**
 * @file Settings.h
 * @brief Runtime settings for the server and client programs
 */

#pragma once

#include "config.h"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace FileBeam {

/**
 * @brief filebeam_server settings
 *
 * JSON keys: listen_address, cert_path, key_path, output_dir,
 * subject_alt_names, max_connections, idle_timeout_ms, log_file, verbose.
 */
struct ServerSettings {
    std::string listenAddress = DEFAULT_LISTEN_ADDRESS;
    std::string certPath = DEFAULT_CERT_PATH;
    std::string keyPath = DEFAULT_KEY_PATH;
    std::string outputDir = DEFAULT_OUTPUT_DIR;
    std::vector<std::string> subjectAltNames{DEFAULT_SUBJECT_ALT_NAMES.begin(),
                                             DEFAULT_SUBJECT_ALT_NAMES.end()};
    size_t maxConnections = MAX_CONCURRENT_CONNECTIONS;
    uint32_t idleTimeoutMs = IDLE_TIMEOUT_MS;
    std::string logFile;
    bool verbose = false;

    nlohmann::json toJson() const;

    /**
     * @brief Lenient parse: missing or wrongly-typed keys keep their defaults
     */
    static ServerSettings fromJson(const nlohmann::json& j);
};

/**
 * @brief filebeam_client settings
 *
 * JSON keys: server_address, server_name, ca_cert_path, idle_timeout_ms,
 * log_file, verbose.
 */
struct ClientSettings {
    std::string serverAddress = DEFAULT_SERVER_ADDRESS;
    std::string serverName = DEFAULT_SERVER_NAME;
    std::string caCertPath = DEFAULT_CERT_PATH;
    uint32_t idleTimeoutMs = IDLE_TIMEOUT_MS;
    std::string logFile;
    bool verbose = false;

    nlohmann::json toJson() const;
    static ClientSettings fromJson(const nlohmann::json& j);
};

/**
 * @brief Read and parse a JSON file
 * @return false if the file cannot be read or is not valid JSON
 */
bool loadJsonFile(const std::string& path, nlohmann::json& out, std::string& errorMsg);

}  // namespace FileBeam
