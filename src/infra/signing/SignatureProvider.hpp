#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

#include "Signer.hpp"

namespace courier::infra::signing {

/**
 * @brief Resolves signers by (signature version, signing name, region).
 *
 * Known versions: "v4" and "anonymous". Resolved signers are cached, so two
 * clients of the same service and region share one instance.
 */
class SignatureProvider {
   public:
    /**
     * @throws std::invalid_argument for an unknown signature version.
     */
    std::shared_ptr<ISigner> Resolve(const std::string& version, const std::string& signing_name,
                                     const std::string& region);

    std::size_t CacheSize() const;

    static SignatureProvider& Default();

   private:
    using Key = std::tuple<std::string, std::string, std::string>;

    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<ISigner>> cache_;
};

}  // namespace courier::infra::signing
