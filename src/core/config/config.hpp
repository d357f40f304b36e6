#pragma once
#include <cstdint>
#include <string>

namespace courier::core {

struct ClientSection {
    std::string service;  // "dynamodb" selects the DynamoDB integration
    std::string description = "resources/dynamodb-2012-08-10.api.json";
    std::string paginators;
    std::string waiters;
    std::string region = "us-east-1";
    std::string endpoint;
    std::string signature_version;
    std::string defaults;  // JSON object merged under every call's parameters
};

struct CredentialsSection {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    bool from_env = false;
};

struct TransportSection {
    unsigned int threads = 1;
    unsigned int timeout_seconds = 30;  // NOLINT
    bool verify_peer = true;
};

struct LogSection {
    std::string level = "info";
    std::string file = "logs/courier.log";
};

struct AppConfig {
    ClientSection client;
    CredentialsSection credentials;
    TransportSection transport;
    LogSection log;
};

/**
 * @brief Loads configuration from a TOML file.
 * @param path Path to the .toml file (default: "config.toml")
 * @return Parsed AppConfig object; defaults when the file does not exist.
 * @throws std::runtime_error if the file cannot be parsed.
 */
AppConfig LoadConfig(const std::string& path = "config.toml");

}  // namespace courier::core
