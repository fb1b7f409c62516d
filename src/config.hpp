#pragma once

#include <rtc/rtc.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace shareflow {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct RelayConfig {
    uint16_t port = 3001;
    std::string bindAddress = "0.0.0.0";
    int maxViewers = 10;
    std::chrono::seconds sweepInterval{3600};
    std::chrono::hours roomIdleTimeout{12};
    std::string logLevel = "info";

    bool enableTls = false;
    std::string certificatePemFile;
    std::string keyPemFile;
};

// Reads a JSON config file. Throws ConfigError when the file cannot be read or
// parsed; individual bad values are reported and left at their defaults.
RelayConfig LoadConfig(const std::string& path);
RelayConfig ParseConfig(const nlohmann::json& j);

// PORT overrides the configured port, as on most hosting platforms.
void ApplyEnvironment(RelayConfig& config);

// Throws ConfigError for unknown names.
rtc::LogLevel ParseLogLevel(const std::string& name);

nlohmann::json ToJson(const RelayConfig& config);

} // namespace shareflow
