// 1. Standard Library
#include <chrono>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

// 2. Third Party
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

// 3. Local Headers
#include "BeastTransport.hpp"
#include "Cli.hpp"
#include "Client.hpp"
#include "Credentials.hpp"
#include "DynamoDbClient.hpp"
#include "Errors.hpp"
#include "IoContextPool.hpp"
#include "ServiceDescription.hpp"
#include "config.hpp"

using namespace courier;

static void setup_logging(const std::string& file) {
    std::vector<spdlog::sink_ptr> sinks;

    // A. Console Sink (stderr, stdout carries the results)
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    sinks.push_back(console_sink);

    // B. Rotating File Sink (Max 5MB, 3 files)
    constexpr size_t MAX_SIZE = 1024 * 1024 * 5;
    constexpr size_t MAX_FILES = 3;
    auto file_sink =
        std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file, MAX_SIZE, MAX_FILES);
    file_sink->set_level(spdlog::level::trace);
    sinks.push_back(file_sink);

    // C. Register Logger
    auto logger = std::make_shared<spdlog::logger>("courier", sinks.begin(), sinks.end());
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);

    // D. Global Formatting
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

static void usage() {
    spdlog::critical("Usage: courier <config.toml> <operation> [json-params] [--paginate]");
    spdlog::critical("       courier <config.toml> --wait <waiter> [json-params]");
    spdlog::critical("Example: courier config.toml ListTables '{\"Limit\": 10}' --paginate");
}

static std::shared_ptr<infra::signing::ICredentialsProvider> make_credentials(
    const core::CredentialsSection& cfg) {
    if (cfg.from_env) {
        return std::make_shared<infra::signing::EnvCredentialsProvider>();
    }
    infra::signing::Credentials creds;
    creds.access_key = cfg.access_key;
    creds.secret_key = cfg.secret_key;
    creds.session_token = cfg.session_token;
    return std::make_shared<infra::signing::StaticCredentialsProvider>(std::move(creds));
}

static core::Client make_client(const core::AppConfig& cfg,
                                std::shared_ptr<network::ITransport> transport) {
    std::optional<std::filesystem::path> paginators;
    std::optional<std::filesystem::path> waiters;
    if (!cfg.client.paginators.empty()) paginators = cfg.client.paginators;
    if (!cfg.client.waiters.empty()) waiters = cfg.client.waiters;

    core::ClientOptions options;
    options.api = models::ServiceDescription::LoadFile(cfg.client.description, paginators, waiters);
    options.region = cfg.client.region;
    if (!cfg.client.endpoint.empty()) options.endpoint = cfg.client.endpoint;
    if (!cfg.client.signature_version.empty()) {
        options.signature_version = cfg.client.signature_version;
    }
    options.credentials = make_credentials(cfg.credentials);
    options.defaults = app::ParseParams(cfg.client.defaults);
    options.transport = std::move(transport);

    if (cfg.client.service == "dynamodb") {
        return services::dynamodb::MakeDynamoDbClient(std::move(options));
    }
    return core::Client(std::move(options));
}

int main(int argc, char* argv[]) {
    // 1. Argument Validation
    if (argc < 3) {
        setup_logging("logs/courier.log");
        usage();
        return EXIT_FAILURE;
    }
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        core::AppConfig cfg = core::LoadConfig(args[0]);
        setup_logging(cfg.log.file);
        spdlog::set_level(spdlog::level::from_str(cfg.log.level));

        std::string operation;
        std::string waiter;
        std::string params_text;
        bool paginate = false;
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--paginate") {
                paginate = true;
            } else if (args[i] == "--wait" && i + 1 < args.size()) {
                waiter = args[++i];
            } else if (operation.empty() && waiter.empty() && !args[i].starts_with('{')) {
                operation = args[i];
            } else {
                params_text = args[i];
            }
        }
        if (operation.empty() == waiter.empty()) {
            usage();
            return EXIT_FAILURE;
        }

        // 2. Transport Setup
        infra::io::IoContextPool pool(cfg.transport.threads);
        pool.Run();

        network::TransportOptions transport_options;
        transport_options.timeout = std::chrono::seconds(cfg.transport.timeout_seconds);
        transport_options.verify_peer = cfg.transport.verify_peer;
        auto transport = std::make_shared<network::BeastTransport>(pool, transport_options);

        // 3. Client + Call
        core::Client client = make_client(cfg, transport);
        json::object params = app::ParseParams(params_text);

        if (!waiter.empty()) {
            client.WaitUntil(waiter, std::move(params));
            std::cout << app::WaiterSuccessLine(waiter) << '\n';
        } else if (paginate) {
            for (const auto& page : client.Paginate(operation, std::move(params))) {
                std::cout << page.ToString() << '\n';
            }
        } else {
            std::cout << client.Execute(operation, std::move(params)).ToString() << '\n';
        }

        pool.Stop();
    } catch (const core::ServiceException& e) {
        spdlog::error("{} [code={}, status={}, request_id={}]", e.what(), e.ErrorCode(),
                      e.StatusCode(), e.RequestId());
        return EXIT_FAILURE;
    } catch (const core::WaiterError& e) {
        spdlog::error("{} after {} attempt(s)", e.what(), e.Attempts());
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal Error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::shutdown();
    return EXIT_SUCCESS;
}
