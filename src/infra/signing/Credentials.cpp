#include "Credentials.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <utility>

namespace courier::infra::signing {

namespace {
std::string env_or_empty(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}
}  // namespace

StaticCredentialsProvider::StaticCredentialsProvider(Credentials credentials)
    : credentials_(std::move(credentials)) {}

Credentials EnvCredentialsProvider::GetCredentials() {
    Credentials c;
    c.access_key = env_or_empty("AWS_ACCESS_KEY_ID");
    c.secret_key = env_or_empty("AWS_SECRET_ACCESS_KEY");
    c.session_token = env_or_empty("AWS_SESSION_TOKEN");
    if (c.Empty()) {
        spdlog::warn("AWS_ACCESS_KEY_ID / AWS_SECRET_ACCESS_KEY are not set");
    }
    return c;
}

}  // namespace courier::infra::signing
