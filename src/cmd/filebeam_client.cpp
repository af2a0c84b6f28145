/**
 * @file filebeam_client.cpp
 * @brief Send one file to a filebeam_server over TLS
 *
 * Usage:
 *   filebeam_client --file <path> [--server 127.0.0.1:4433]
 *                   [--server-name localhost] [--ca-cert certs/server-cert.pem]
 */

#include "filebeam/CliArgs.h"
#include "filebeam/Debug.h"
#include "filebeam/ErrorCodes.h"
#include "filebeam/FileSender.h"
#include "filebeam/Settings.h"
#include "filebeam/SocketUtils.h"
#include "filebeam/ThreadSafeLog.h"
#include "filebeam/TlsSocket.h"
#include "filebeam/TransferHeader.h"
#include "filebeam/TransportStream.h"

#include <cerrno>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

using namespace FileBeam;

namespace {

int fail(TransferErrorKind kind, const std::string& message) {
    LOG_ERROR("[" << errorCodeFor(kind) << "] " << errorKindToString(kind) << ": " << message);
    return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    ClientArgs args;
    try {
        args = ClientArgs::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ClientArgs::usage(argv[0]);
        return 2;
    }

    if (args.showHelp) {
        std::cout << ClientArgs::usage(argv[0]);
        return 0;
    }

    std::string error;
    ClientSettings settings;
    if (args.configPath) {
        nlohmann::json j;
        if (!loadJsonFile(*args.configPath, j, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        settings = ClientSettings::fromJson(j);
    }
    args.applyTo(settings);

    initDebugLoggingFromEnv();
    if (settings.verbose) {
        setDebugLogging(true);
    }
    if (!settings.logFile.empty() && !ThreadSafeLog::open(settings.logFile, error)) {
        LOG_WARNING(error << "; continuing without a log file");
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(settings.caCertPath, ec)) {
        LOG_ERROR("CA certificate not found at " << settings.caCertPath
                  << "; copy the server certificate there or pass --ca-cert");
        return 1;
    }

    FileSender sender(args.filePath);
    if (!sender.initialize(error)) {
        return fail(sender.getLastErrorKind(), error);
    }

    SocketAddress server;
    if (!parseSocketAddress(settings.serverAddress, server, error)) {
        LOG_ERROR(error);
        return 1;
    }

    auto context = TlsContext::createClient(settings.caCertPath, error);
    if (!context) {
        LOG_ERROR(error);
        return 1;
    }

    const int fd = connectSocket(server, error);
    if (fd == INVALID_SOCKET_FD) {
        return fail(TransferErrorKind::TRANSPORT, error);
    }
    if (!setSocketRecvTimeout(fd, settings.idleTimeoutMs)) {
        LOG_WARNING("Failed to set receive timeout: " << describeErrno(errno));
    }

    auto tls = std::make_shared<TlsSocket>(fd, context);
    if (!tls->handshake(settings.serverName, error)) {
        return fail(TransferErrorKind::TRANSPORT, error);
    }

    std::string fpError;
    const std::string fingerprint = tls->getPeerFingerprint(fpError);
    if (!fingerprint.empty()) {
        LOG_DEBUG("Server certificate SHA-256 " << fingerprint);
    }

    TlsConnection connection(tls, server.toString());
    std::unique_ptr<TransportStream> stream = connection.openStream(error);
    if (!stream) {
        return fail(TransferErrorKind::TRANSPORT, error);
    }

    LOG_DEBUG("Sending '" << sender.getFileName() << "' ("
              << formatByteCount(sender.getFileSize()) << ") to " << server.toString());

    auto progress = [](const std::string& sessionId, uint64_t sent, uint64_t total, double percentage) {
        LOG_DEBUG(sessionId << ": " << sent << "/" << total << " bytes ("
                  << static_cast<int>(percentage) << "%)");
    };

    if (!sender.sendFile(*stream, error, progress)) {
        return fail(sender.getLastErrorKind(), error);
    }

    connection.close();

    std::cout << "Sent '" << sender.getFileName() << "' (" << sender.getBytesSent()
              << " bytes) to " << server.toString() << std::endl;
    return 0;
}
