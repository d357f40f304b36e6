#include "SignatureProvider.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

#include "SignatureV4.hpp"

namespace courier::infra::signing {

std::shared_ptr<ISigner> SignatureProvider::Resolve(const std::string& version,
                                                    const std::string& signing_name,
                                                    const std::string& region) {
    std::lock_guard<std::mutex> lock(mutex_);

    Key key{version, signing_name, region};
    if (auto it = cache_.find(key); it != cache_.end()) {
        return it->second;
    }

    std::shared_ptr<ISigner> signer;
    if (version == "v4") {
        signer = std::make_shared<SignatureV4>(signing_name, region);
    } else if (version == "anonymous") {
        signer = std::make_shared<AnonymousSigner>();
    } else {
        throw std::invalid_argument("Unknown signature version: " + version);
    }

    spdlog::debug("Created {} signer for {} in {}", version, signing_name, region);
    cache_.emplace(std::move(key), signer);
    return signer;
}

std::size_t SignatureProvider::CacheSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

SignatureProvider& SignatureProvider::Default() {
    static SignatureProvider instance;
    return instance;
}

}  // namespace courier::infra::signing
