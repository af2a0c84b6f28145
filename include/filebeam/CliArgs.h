/**
 * @file CliArgs.h
 * @brief Command-line argument parsing for filebeam_server and filebeam_client.
 */

#pragma once

#include "Settings.h"
#include <optional>
#include <stdexcept>
#include <string>

namespace FileBeam {

struct ServerArgs {
    bool showHelp = false;
    bool verbose = false;

    std::optional<std::string> configPath;
    std::optional<std::string> listenAddress;
    std::optional<std::string> certPath;
    std::optional<std::string> keyPath;
    std::optional<std::string> outputDir;
    std::optional<std::string> logFile;

    static ServerArgs parseOrThrow(int argc, const char* const* argv);

    /**
     * @brief Overlay flags given on the command line onto settings
     */
    void applyTo(ServerSettings& settings) const;

    static std::string usage(const std::string& program);
};

struct ClientArgs {
    bool showHelp = false;
    bool verbose = false;

    std::string filePath;  ///< Required unless showHelp

    std::optional<std::string> configPath;
    std::optional<std::string> serverAddress;
    std::optional<std::string> serverName;
    std::optional<std::string> caCertPath;
    std::optional<std::string> logFile;

    static ClientArgs parseOrThrow(int argc, const char* const* argv);
    void applyTo(ClientSettings& settings) const;

    static std::string usage(const std::string& program);
};

}  // namespace FileBeam
