#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "HttpMessage.hpp"
#include "types.hpp"

namespace courier::core {

// Call-scoped metadata.
struct CommandOptions {
    // Run after the client's interceptors and before the signer.
    std::vector<network::PreSendHook> hooks;
};

/**
 * @brief One invocation of one operation.
 *
 * Built by the client (name resolved, defaults merged) and never modified
 * afterwards; the only way to change a command is to build a new one.
 */
class Command {
   public:
    Command(std::string name, json::object params, CommandOptions options = {},
            bool is_async = false);

    const std::string& Name() const noexcept { return name_; }
    const json::object& Params() const noexcept { return params_; }
    const std::vector<network::PreSendHook>& Hooks() const noexcept { return options_.hooks; }
    bool IsAsync() const noexcept { return is_async_; }

    bool Has(std::string_view key) const { return params_.contains(key); }
    const json::value* Find(std::string_view key) const { return params_.if_contains(key); }

    // Same command, flagged for asynchronous delivery.
    Command AsAsync() const;

   private:
    std::string name_;
    json::object params_;
    CommandOptions options_;
    bool is_async_ = false;
};

}  // namespace courier::core
