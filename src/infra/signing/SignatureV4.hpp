#pragma once
// Sign requests with AWS Signature Version 4
// http://docs.aws.amazon.com/general/latest/gr/sigv4_signing.html

#include <ctime>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "Signer.hpp"

namespace courier::infra::signing {

class SignatureV4 : public ISigner {
   public:
    using Clock = std::function<std::time_t()>;
    using HeaderMap = std::map<std::string, std::vector<std::string>>;

    /**
     * @param service The signing name of the service (credential scope).
     * @param region The region of the credential scope.
     * @param clock Source of the signing time; defaults to the system clock.
     */
    SignatureV4(std::string service, std::string region, Clock clock = {});

    void Sign(network::HttpRequest& request, const Credentials& credentials) const override;

    const std::string& Service() const noexcept { return service_; }
    const std::string& Region() const noexcept { return region_; }

    // Step 1: canonical request. `signed_headers` receives the header list.
    std::string CreateCanonicalRequest(const network::HttpRequest& request,
                                       const std::string& payload_hash,
                                       std::string& signed_headers) const;

    // Step 2: string to sign.
    std::string CreateStringToSign(const std::string& amz_date, const std::string& datestamp,
                                   const std::string& canonical_request) const;

    // Step 3: signing key (raw bytes) derived from the secret and the date.
    std::string DeriveSigningKey(const std::string& secret_key,
                                 const std::string& datestamp) const;

    std::string CredentialScope(const std::string& datestamp) const;

    // hashlib.sha256(str).hexdigest()
    static std::string Sha256Hex(std::string_view data);

    // hmac.new(key, msg, hashlib.sha256).digest()
    static std::string HmacSha256(std::string_view key, std::string_view msg);

    static std::string Hexlify(std::string_view digest);

   private:
    std::string CanonicalUri(std::string_view path) const;
    static std::string CanonicalQueryString(std::string_view query);
    static HeaderMap CollectHeaders(const network::HttpRequest& request);

    std::string service_;
    std::string region_;
    Clock clock_;
};

}  // namespace courier::infra::signing
