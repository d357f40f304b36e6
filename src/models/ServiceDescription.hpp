#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace courier::models {

struct OperationModel {
    std::string name;
    std::string http_method = "POST";
    std::string request_uri = "/";
};

// Token fields may name several members; they are paired by position.
struct PaginatorConfig {
    std::vector<std::string> input_token;
    std::vector<std::string> output_token;
    std::vector<std::string> result_key;
    std::string limit_key;
    std::string more_results;
};

enum class AcceptorState { Success, Failure, Retry };
enum class AcceptorMatcher { Path, PathAll, PathAny, Status, Error };

struct AcceptorConfig {
    AcceptorState state = AcceptorState::Retry;
    AcceptorMatcher matcher = AcceptorMatcher::Path;
    std::string argument;
    json::value expected;
};

struct WaiterConfig {
    std::string operation;
    std::chrono::milliseconds delay{5000};
    int max_attempts = 20;
    std::vector<AcceptorConfig> acceptors;
};

AcceptorState ParseAcceptorState(std::string_view state);
AcceptorMatcher ParseAcceptorMatcher(std::string_view matcher);
std::string_view ToString(AcceptorState state) noexcept;

/**
 * @brief Read-only model of one service API document.
 *
 * Loaded once per client type and shared (as `shared_ptr<const ...>`) by every
 * transaction of the clients built from it. Only the members the request
 * pipeline reads are modelled; shapes are left to the service codecs.
 */
class ServiceDescription {
   public:
    /**
     * @brief Builds a description from parsed documents.
     * @param api The API document (`metadata`, `operations`, optionally
     *            inline `pagination` and `waiters`).
     * @param paginators Optional separate paginator document.
     * @param waiters Optional separate waiter document.
     * @throws std::invalid_argument if a required member is missing or malformed.
     */
    static ServiceDescription FromJson(const json::object& api,
                                       const json::object* paginators = nullptr,
                                       const json::object* waiters = nullptr);

    /**
     * @brief Loads a description from JSON files on disk.
     * @throws std::runtime_error if a file cannot be read or parsed.
     */
    static std::shared_ptr<const ServiceDescription> LoadFile(
        const std::filesystem::path& api_path,
        const std::optional<std::filesystem::path>& paginators_path = std::nullopt,
        const std::optional<std::filesystem::path>& waiters_path = std::nullopt);

    bool HasOperation(std::string_view name) const;

    // @throws std::invalid_argument for an unknown operation.
    const OperationModel& Operation(std::string_view name) const;

    std::vector<std::string> OperationNames() const;

    std::optional<PaginatorConfig> PaginationTemplate(std::string_view operation) const;
    std::optional<WaiterConfig> WaitTemplate(std::string_view waiter) const;

    // `signingName`, falling back to `endpointPrefix`.
    const std::string& SigningName() const noexcept;

    const std::string& ServiceFullName() const noexcept { return service_full_name_; }
    const std::string& EndpointPrefix() const noexcept { return endpoint_prefix_; }
    const std::string& Protocol() const noexcept { return protocol_; }
    const std::string& SignatureVersion() const noexcept { return signature_version_; }
    const std::string& JsonVersion() const noexcept { return json_version_; }
    const std::string& TargetPrefix() const noexcept { return target_prefix_; }
    const std::string& ApiVersion() const noexcept { return api_version_; }

   private:
    std::string service_full_name_;
    std::string endpoint_prefix_;
    std::string signing_name_;
    std::string protocol_;
    std::string signature_version_;
    std::string json_version_;
    std::string target_prefix_;
    std::string api_version_;

    std::map<std::string, OperationModel, std::less<>> operations_;
    std::map<std::string, PaginatorConfig, std::less<>> paginators_;
    std::map<std::string, WaiterConfig, std::less<>> waiters_;
};

}  // namespace courier::models
