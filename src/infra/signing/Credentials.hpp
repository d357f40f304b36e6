#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace courier::infra::signing {

struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::optional<std::chrono::system_clock::time_point> expiration;

    bool Empty() const noexcept { return access_key.empty() || secret_key.empty(); }
};

/**
 * @brief Source of credentials, queried at signing time.
 *
 * Implementations may refresh between calls; the pipeline never caches the
 * returned snapshot beyond a single signature.
 */
class ICredentialsProvider {
   public:
    virtual ~ICredentialsProvider() = default;
    virtual Credentials GetCredentials() = 0;
};

class StaticCredentialsProvider : public ICredentialsProvider {
   public:
    explicit StaticCredentialsProvider(Credentials credentials);
    Credentials GetCredentials() override { return credentials_; }

   private:
    Credentials credentials_;
};

// Reads AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and AWS_SESSION_TOKEN on every call.
class EnvCredentialsProvider : public ICredentialsProvider {
   public:
    Credentials GetCredentials() override;
};

}  // namespace courier::infra::signing
