#include "config.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <stdexcept>
#include <toml++/toml.hpp>

namespace courier::core {

AppConfig LoadConfig(const std::string& path) {
    AppConfig config;

    if (!std::filesystem::exists(path)) {
        spdlog::warn("Config file '{}' not found. Using defaults.", path);
        return config;
    }

    toml::table tbl;
    try {
        tbl = toml::parse_file(path);
    } catch (const toml::parse_error& err) {
        spdlog::critical("Failed to parse config file: {}", err.description());
        throw std::runtime_error("Config parse error in " + path + ": " +
                                 std::string(err.description()));
    }

    // 1. Client
    if (auto client = tbl["client"]) {
        config.client.service = client["service"].value_or(config.client.service);
        config.client.description = client["description"].value_or(config.client.description);
        config.client.paginators = client["paginators"].value_or(config.client.paginators);
        config.client.waiters = client["waiters"].value_or(config.client.waiters);
        config.client.region = client["region"].value_or(config.client.region);
        config.client.endpoint = client["endpoint"].value_or(config.client.endpoint);
        config.client.signature_version =
            client["signature_version"].value_or(config.client.signature_version);
        config.client.defaults = client["defaults"].value_or(config.client.defaults);
    }

    // 2. Credentials
    if (auto creds = tbl["credentials"]) {
        config.credentials.from_env = creds["from_env"].value_or(false);
        config.credentials.access_key = creds["access_key"].value_or("");
        config.credentials.secret_key = creds["secret_key"].value_or("");
        config.credentials.session_token = creds["session_token"].value_or("");
    }

    // 3. Transport
    if (auto transport = tbl["transport"]) {
        config.transport.threads = transport["threads"].value_or<unsigned int>(1);
        config.transport.timeout_seconds = transport["timeout_seconds"].value_or<unsigned int>(30);  // NOLINT
        config.transport.verify_peer = transport["verify_peer"].value_or(true);
    }
    if (config.transport.threads == 0) {
        throw std::runtime_error("transport.threads must be at least 1");
    }

    // 4. Logging
    if (auto log = tbl["log"]) {
        config.log.level = log["level"].value_or(config.log.level);
        config.log.file = log["file"].value_or(config.log.file);
    }

    spdlog::info("Loaded configuration from {}", path);
    return config;
}

}  // namespace courier::core
