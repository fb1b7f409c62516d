#include "config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace shareflow {

namespace {

using json = nlohmann::json;

template <typename T, typename Validate>
void ReadField(const json& j, const char* key, T& target, Validate&& validate) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return;
    }

    try {
        T value = it->get<T>();
        if (!validate(value)) {
            std::cerr << "[Config] Invalid value for " << key << ": " << it->dump()
                      << ", keeping default" << std::endl;
            return;
        }
        target = value;
    } catch (const json::exception& e) {
        std::cerr << "[Config] Error reading " << key << ": " << e.what() << std::endl;
    }
}

bool ValidPort(int port) {
    return port > 0 && port <= 65535;
}

} // namespace

RelayConfig LoadConfig(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Could not open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw ConfigError("Could not parse config file " + path + ": " + e.what());
    }

    std::cout << "[Config] Configuration loaded from: " << path << std::endl;
    return ParseConfig(j);
}

RelayConfig ParseConfig(const json& j) {
    if (!j.is_object()) {
        throw ConfigError("Configuration must be a JSON object");
    }

    RelayConfig config;

    int port = config.port;
    ReadField(j, "port", port, ValidPort);
    config.port = static_cast<uint16_t>(port);

    ReadField(j, "bindAddress", config.bindAddress, [](const std::string& v) { return !v.empty(); });
    ReadField(j, "maxViewers", config.maxViewers, [](int v) {
        return v >= 1 && v <= 10;
    });

    int64_t sweepSeconds = config.sweepInterval.count();
    ReadField(j, "sweepIntervalSeconds", sweepSeconds, [](int64_t v) { return v > 0; });
    config.sweepInterval = std::chrono::seconds(sweepSeconds);

    int64_t idleHours = config.roomIdleTimeout.count();
    ReadField(j, "roomIdleHours", idleHours, [](int64_t v) { return v > 0; });
    config.roomIdleTimeout = std::chrono::hours(idleHours);

    ReadField(j, "logLevel", config.logLevel, [](const std::string& v) {
        try {
            ParseLogLevel(v);
            return true;
        } catch (const ConfigError&) {
            return false;
        }
    });

    ReadField(j, "enableTls", config.enableTls, [](bool) { return true; });
    ReadField(j, "certificatePemFile", config.certificatePemFile, [](const std::string&) { return true; });
    ReadField(j, "keyPemFile", config.keyPemFile, [](const std::string&) { return true; });

    if (config.enableTls && (config.certificatePemFile.empty() || config.keyPemFile.empty())) {
        throw ConfigError("enableTls requires certificatePemFile and keyPemFile");
    }

    return config;
}

void ApplyEnvironment(RelayConfig& config) {
    const char* port = std::getenv("PORT");
    if (!port || !*port) {
        return;
    }

    char* end = nullptr;
    long value = std::strtol(port, &end, 10);
    if (*end != '\0' || value <= 0 || value > 65535) {
        std::cerr << "[Config] Ignoring invalid PORT=" << port << std::endl;
        return;
    }
    config.port = static_cast<uint16_t>(value);
}

rtc::LogLevel ParseLogLevel(const std::string& name) {
    if (name == "none") return rtc::LogLevel::None;
    if (name == "fatal") return rtc::LogLevel::Fatal;
    if (name == "error") return rtc::LogLevel::Error;
    if (name == "warning") return rtc::LogLevel::Warning;
    if (name == "info") return rtc::LogLevel::Info;
    if (name == "debug") return rtc::LogLevel::Debug;
    if (name == "verbose") return rtc::LogLevel::Verbose;
    throw ConfigError("Unknown log level: " + name);
}

nlohmann::json ToJson(const RelayConfig& config) {
    return {
        {"port", config.port},
        {"bindAddress", config.bindAddress},
        {"maxViewers", config.maxViewers},
        {"sweepIntervalSeconds", config.sweepInterval.count()},
        {"roomIdleHours", config.roomIdleTimeout.count()},
        {"logLevel", config.logLevel},
        {"enableTls", config.enableTls},
        {"certificatePemFile", config.certificatePemFile},
        {"keyPemFile", config.keyPemFile},
    };
}

} // namespace shareflow
