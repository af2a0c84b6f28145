/**
 * @file filebeam_server.cpp
 * @brief Receive files over TLS into an output directory
 *
 * Usage:
 *   filebeam_server [--addr 0.0.0.0:4433] [--cert certs/server-cert.pem]
 *                   [--key certs/server-key.pem] [--output received]
 */

#include "filebeam/CertificateManager.h"
#include "filebeam/CliArgs.h"
#include "filebeam/Debug.h"
#include "filebeam/Settings.h"
#include "filebeam/SocketUtils.h"
#include "filebeam/StreamReceiver.h"
#include "filebeam/ThreadSafeLog.h"
#include "filebeam/TlsSocket.h"
#include "filebeam/TransferServer.h"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace FileBeam;

// Global flag for graceful shutdown
static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

int main(int argc, char* argv[]) {
    ServerArgs args;
    try {
        args = ServerArgs::parseOrThrow(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << ServerArgs::usage(argv[0]);
        return 2;
    }

    if (args.showHelp) {
        std::cout << ServerArgs::usage(argv[0]);
        return 0;
    }

    std::string error;
    ServerSettings settings;
    if (args.configPath) {
        nlohmann::json j;
        if (!loadJsonFile(*args.configPath, j, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
        settings = ServerSettings::fromJson(j);
    }
    args.applyTo(settings);

    initDebugLoggingFromEnv();
    if (settings.verbose) {
        setDebugLogging(true);
    }
    if (!settings.logFile.empty() && !ThreadSafeLog::open(settings.logFile, error)) {
        LOG_WARNING(error << "; continuing without a log file");
    }

    // Output directory
    std::error_code ec;
    std::filesystem::create_directories(settings.outputDir, ec);
    if (ec) {
        LOG_ERROR("Failed to create output directory " << settings.outputDir << ": " << ec.message());
        return 1;
    }
    auto outputDir = std::make_shared<const std::filesystem::path>(settings.outputDir);

    // TLS identity
    CertificatePaths paths;
    if (!CertificateManager::ensureSelfSignedCertificate(settings.certPath, settings.keyPath,
                                                         settings.subjectAltNames, paths, error)) {
        LOG_ERROR("Failed to provision certificate: " << error);
        return 1;
    }

    auto tls = TlsContext::createServer(paths.certPath, paths.keyPath, error);
    if (!tls) {
        LOG_ERROR(error);
        return 1;
    }

    std::string fpError;
    const std::string fingerprint = CertificateManager::getCertificateFingerprint(paths.certPath, fpError);
    if (!fingerprint.empty()) {
        LOG_INFO("Certificate " << paths.certPath << " SHA-256 " << fingerprint);
    }

    TransferServer server(tls, outputDir);
    server.setMaxConnections(settings.maxConnections);
    server.setIdleTimeoutMs(settings.idleTimeoutMs);

    std::mutex outputMutex;
    server.setTransferCallback([&outputMutex](const std::string& remoteAddress,
                                              const ReceiveResult& result) {
        (void)remoteAddress;
        const std::string summary = formatReceiveSummary(result);
        if (summary.empty()) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex);
        if (result.hasIntegrityMismatch()) {
            std::cerr << summary << std::endl;
        } else {
            std::cout << summary << std::endl;
        }
    });

    if (!server.start(settings.listenAddress, error)) {
        LOG_ERROR("Failed to start server: " << error);
        return 1;
    }

    SocketAddress listen;
    std::string shownAddress = settings.listenAddress;
    if (parseSocketAddress(settings.listenAddress, listen, error)) {
        shownAddress = formatEndpoint(listen.host, server.getBoundPort());
    }
    std::cout << "Server listening on " << shownAddress << std::endl;

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    LOG_INFO("Shutdown signal received. Stopping server...");
    server.stop();
    return 0;
}
