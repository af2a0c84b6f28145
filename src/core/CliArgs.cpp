/**
 * @file CliArgs.cpp
 * @brief Command-line argument parsing for filebeam_server and filebeam_client.
 */

#include "filebeam/CliArgs.h"

namespace FileBeam {

namespace {

// Accepts both "--flag value" and "--flag=value"
bool matchValueFlag(const std::string& arg, const char* flag, int& i, int argc,
                    const char* const* argv, std::optional<std::string>& out) {
    const std::string name(flag);
    if (arg == name) {
        if (i + 1 >= argc || !argv[i + 1]) {
            throw std::runtime_error("Missing value for " + name);
        }
        out = std::string(argv[++i]);
        return true;
    }
    if (arg.compare(0, name.size() + 1, name + "=") == 0) {
        out = arg.substr(name.size() + 1);
        return true;
    }
    return false;
}

void requireNonEmpty(const std::optional<std::string>& value, const char* flag) {
    if (value && value->empty()) {
        throw std::runtime_error(std::string("Empty value for ") + flag);
    }
}

}  // namespace

//=============================================================================
// ServerArgs
//=============================================================================

ServerArgs ServerArgs::parseOrThrow(int argc, const char* const* argv) {
    ServerArgs out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--verbose" || a == "-v") {
            out.verbose = true;
            continue;
        }

        if (matchValueFlag(a, "--addr", i, argc, argv, out.listenAddress) ||
            matchValueFlag(a, "--cert", i, argc, argv, out.certPath) ||
            matchValueFlag(a, "--key", i, argc, argv, out.keyPath) ||
            matchValueFlag(a, "--output", i, argc, argv, out.outputDir) ||
            matchValueFlag(a, "--config", i, argc, argv, out.configPath) ||
            matchValueFlag(a, "--log-file", i, argc, argv, out.logFile)) {
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    requireNonEmpty(out.listenAddress, "--addr");
    requireNonEmpty(out.certPath, "--cert");
    requireNonEmpty(out.keyPath, "--key");
    requireNonEmpty(out.outputDir, "--output");
    requireNonEmpty(out.configPath, "--config");

    return out;
}

void ServerArgs::applyTo(ServerSettings& settings) const {
    if (listenAddress) settings.listenAddress = *listenAddress;
    if (certPath) settings.certPath = *certPath;
    if (keyPath) settings.keyPath = *keyPath;
    if (outputDir) settings.outputDir = *outputDir;
    if (logFile) settings.logFile = *logFile;
    if (verbose) settings.verbose = true;
}

std::string ServerArgs::usage(const std::string& program) {
    return "Usage: " + program + " [options]\n"
           "\n"
           "Receive files over TLS and write them to the output directory.\n"
           "\n"
           "Options:\n"
           "  --addr <ip:port>     Listen address (default " + std::string(DEFAULT_LISTEN_ADDRESS) + ")\n"
           "  --cert <path>        Certificate PEM, generated if missing (default " + DEFAULT_CERT_PATH + ")\n"
           "  --key <path>         Private key PEM, generated if missing (default " + DEFAULT_KEY_PATH + ")\n"
           "  --output <dir>       Directory for received files (default " + DEFAULT_OUTPUT_DIR + ")\n"
           "  --config <file>      JSON settings file (flags override it)\n"
           "  --log-file <path>    Also append log lines to this file\n"
           "  --verbose, -v        Enable debug logging\n"
           "  --help, -h           Show this help\n";
}

//=============================================================================
// ClientArgs
//=============================================================================

ClientArgs ClientArgs::parseOrThrow(int argc, const char* const* argv) {
    ClientArgs out;
    std::optional<std::string> file;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? std::string(argv[i]) : std::string();

        if (a == "--help" || a == "-h") {
            out.showHelp = true;
            continue;
        }

        if (a == "--verbose" || a == "-v") {
            out.verbose = true;
            continue;
        }

        if (matchValueFlag(a, "--file", i, argc, argv, file) ||
            matchValueFlag(a, "--server", i, argc, argv, out.serverAddress) ||
            matchValueFlag(a, "--server-name", i, argc, argv, out.serverName) ||
            matchValueFlag(a, "--ca-cert", i, argc, argv, out.caCertPath) ||
            matchValueFlag(a, "--config", i, argc, argv, out.configPath) ||
            matchValueFlag(a, "--log-file", i, argc, argv, out.logFile)) {
            continue;
        }

        throw std::runtime_error("Unknown argument: " + a);
    }

    requireNonEmpty(out.serverAddress, "--server");
    requireNonEmpty(out.serverName, "--server-name");
    requireNonEmpty(out.caCertPath, "--ca-cert");
    requireNonEmpty(out.configPath, "--config");

    if (out.showHelp) {
        return out;
    }

    if (!file || file->empty()) {
        throw std::runtime_error("Missing required argument: --file <path>");
    }
    out.filePath = *file;

    return out;
}

void ClientArgs::applyTo(ClientSettings& settings) const {
    if (serverAddress) settings.serverAddress = *serverAddress;
    if (serverName) settings.serverName = *serverName;
    if (caCertPath) settings.caCertPath = *caCertPath;
    if (logFile) settings.logFile = *logFile;
    if (verbose) settings.verbose = true;
}

std::string ClientArgs::usage(const std::string& program) {
    return "Usage: " + program + " --file <path> [options]\n"
           "\n"
           "Send one file to a filebeam_server over TLS.\n"
           "\n"
           "Options:\n"
           "  --file <path>          File to send (required)\n"
           "  --server <ip:port>     Server address (default " + std::string(DEFAULT_SERVER_ADDRESS) + ")\n"
           "  --server-name <name>   Name expected in the server certificate (default " + DEFAULT_SERVER_NAME + ")\n"
           "  --ca-cert <path>       Certificate to trust (default " + DEFAULT_CERT_PATH + ")\n"
           "  --config <file>        JSON settings file (flags override it)\n"
           "  --log-file <path>      Also append log lines to this file\n"
           "  --verbose, -v          Enable debug logging\n"
           "  --help, -h             Show this help\n";
}

}  // namespace FileBeam
