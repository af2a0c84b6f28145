/**
 * @file Settings.cpp
 * @brief Runtime settings for the server and client programs
 */

#include "filebeam/Settings.h"
#include <fstream>
#include <limits>
#include <sstream>

namespace FileBeam {

namespace {

void readString(const nlohmann::json& j, const char* key, std::string& out) {
    if (j.contains(key) && j[key].is_string()) {
        out = j[key].get<std::string>();
    }
}

void readBool(const nlohmann::json& j, const char* key, bool& out) {
    if (j.contains(key) && j[key].is_boolean()) {
        out = j[key].get<bool>();
    }
}

template <typename T>
void readPositive(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key) || !j[key].is_number_integer()) {
        return;
    }
    // Integer literals are stored signed unless they exceed int64_t
    uint64_t value = 0;
    if (j[key].is_number_unsigned()) {
        value = j[key].get<uint64_t>();
    } else {
        const auto signedValue = j[key].get<int64_t>();
        if (signedValue <= 0) {
            return;
        }
        value = static_cast<uint64_t>(signedValue);
    }
    if (value > 0 && value <= static_cast<uint64_t>(std::numeric_limits<T>::max())) {
        out = static_cast<T>(value);
    }
}

}  // namespace

//=============================================================================
// ServerSettings
//=============================================================================

nlohmann::json ServerSettings::toJson() const {
    nlohmann::json j;
    j["listen_address"] = listenAddress;
    j["cert_path"] = certPath;
    j["key_path"] = keyPath;
    j["output_dir"] = outputDir;
    j["subject_alt_names"] = subjectAltNames;
    j["max_connections"] = maxConnections;
    j["idle_timeout_ms"] = idleTimeoutMs;
    j["log_file"] = logFile;
    j["verbose"] = verbose;
    return j;
}

ServerSettings ServerSettings::fromJson(const nlohmann::json& j) {
    ServerSettings s;
    if (!j.is_object()) {
        return s;
    }

    readString(j, "listen_address", s.listenAddress);
    readString(j, "cert_path", s.certPath);
    readString(j, "key_path", s.keyPath);
    readString(j, "output_dir", s.outputDir);
    readString(j, "log_file", s.logFile);
    readBool(j, "verbose", s.verbose);
    readPositive(j, "max_connections", s.maxConnections);
    readPositive(j, "idle_timeout_ms", s.idleTimeoutMs);

    if (j.contains("subject_alt_names") && j["subject_alt_names"].is_array()) {
        std::vector<std::string> names;
        for (const auto& entry : j["subject_alt_names"]) {
            if (entry.is_string() && !entry.get<std::string>().empty()) {
                names.push_back(entry.get<std::string>());
            }
        }
        s.subjectAltNames = std::move(names);
    }

    return s;
}

//=============================================================================
// ClientSettings
//=============================================================================

nlohmann::json ClientSettings::toJson() const {
    nlohmann::json j;
    j["server_address"] = serverAddress;
    j["server_name"] = serverName;
    j["ca_cert_path"] = caCertPath;
    j["idle_timeout_ms"] = idleTimeoutMs;
    j["log_file"] = logFile;
    j["verbose"] = verbose;
    return j;
}

ClientSettings ClientSettings::fromJson(const nlohmann::json& j) {
    ClientSettings s;
    if (!j.is_object()) {
        return s;
    }

    readString(j, "server_address", s.serverAddress);
    readString(j, "server_name", s.serverName);
    readString(j, "ca_cert_path", s.caCertPath);
    readString(j, "log_file", s.logFile);
    readBool(j, "verbose", s.verbose);
    readPositive(j, "idle_timeout_ms", s.idleTimeoutMs);

    return s;
}

//=============================================================================
// File loading
//=============================================================================

bool loadJsonFile(const std::string& path, nlohmann::json& out, std::string& errorMsg) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        errorMsg = "Failed to open config file: " + path;
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();

    nlohmann::json j = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (j.is_discarded()) {
        errorMsg = "Invalid JSON in config file: " + path;
        return false;
    }

    out = std::move(j);
    return true;
}

}  // namespace FileBeam
