#include "SignatureV4.hpp"

#include <openssl/hmac.h>
#include <openssl/sha.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <boost/url/encode.hpp>
#include <boost/url/grammar/lut_chars.hpp>
#include <boost/url/rfc/unreserved_chars.hpp>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace courier::infra::signing {

namespace {

constexpr const char* ALGORITHM = "AWS4-HMAC-SHA256";
constexpr const char* TERMINATOR = "aws4_request";

std::tm get_safe_gmtime(std::time_t timer) {
    std::tm tm_snapshot{};
#if defined(_WIN32)
    gmtime_s(&tm_snapshot, &timer);
#else
    gmtime_r(&timer, &tm_snapshot);
#endif
    return tm_snapshot;
}

std::string format_time(const std::tm& tm, const char* pattern) {
    std::array<char, 20> buf{};
    std::strftime(buf.data(), buf.size(), pattern, &tm);
    return buf.data();
}

std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Trims both ends and collapses inner runs of spaces.
std::string normalize_header_value(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    bool pending_space = false;
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

constexpr boost::urls::grammar::lut_chars CANONICAL_PATH_CHARS =
    boost::urls::unreserved_chars + boost::urls::grammar::lut_chars('/');

// Excluded from the signature because proxies and the transport may rewrite them.
bool is_unsigned_header(const std::string& name) {
    return name == "user-agent" || name == "expect" || name == "x-amzn-trace-id" ||
           name == "authorization";
}

}  // namespace

SignatureV4::SignatureV4(std::string service, std::string region, Clock clock)
    : service_(std::move(service)), region_(std::move(region)), clock_(std::move(clock)) {}

std::string SignatureV4::Sha256Hex(std::string_view data) {
    std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash.data());
    return Hexlify(std::string_view(reinterpret_cast<const char*>(hash.data()), hash.size()));
}

std::string SignatureV4::HmacSha256(std::string_view key, std::string_view msg) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(msg.data()), msg.size(), digest.data(),
             &len) == nullptr) {
        throw std::runtime_error("HMAC-SHA256 computation failed");
    }
    return std::string(reinterpret_cast<const char*>(digest.data()), len);
}

std::string SignatureV4::Hexlify(std::string_view digest) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (unsigned char c : digest) {
        out.push_back(HEX[c >> 4]);
        out.push_back(HEX[c & 0x0F]);
    }
    return out;
}

std::string SignatureV4::CredentialScope(const std::string& datestamp) const {
    return datestamp + "/" + region_ + "/" + service_ + "/" + TERMINATOR;
}

std::string SignatureV4::DeriveSigningKey(const std::string& secret_key,
                                          const std::string& datestamp) const {
    std::string k_date = HmacSha256("AWS4" + secret_key, datestamp);
    std::string k_region = HmacSha256(k_date, region_);
    std::string k_service = HmacSha256(k_region, service_);
    return HmacSha256(k_service, TERMINATOR);
}

std::string SignatureV4::CanonicalUri(std::string_view path) const {
    if (path.empty()) return "/";
    // S3 signs the path as sent; every other service signs it encoded once more.
    if (service_ == "s3") return std::string(path);
    return boost::urls::encode(path, CANONICAL_PATH_CHARS);
}

std::string SignatureV4::CanonicalQueryString(std::string_view query) {
    std::map<std::string, std::vector<std::string>> query_map;

    std::size_t start = 0;
    while (start < query.size()) {
        auto amp = query.find('&', start);
        if (amp == std::string_view::npos) amp = query.size();
        std::string_view pair = query.substr(start, amp - start);
        if (!pair.empty()) {
            auto eq = pair.find('=');
            std::string key(pair.substr(0, eq));
            std::string value = eq == std::string_view::npos ? "" : std::string(pair.substr(eq + 1));
            query_map[key].push_back(std::move(value));
        }
        start = amp + 1;
    }

    std::string canonical;
    for (auto& [key, values] : query_map) {
        std::sort(values.begin(), values.end());
        for (const auto& value : values) {
            if (!canonical.empty()) canonical += "&";
            canonical += key + "=" + value;
        }
    }
    return canonical;
}

SignatureV4::HeaderMap SignatureV4::CollectHeaders(const network::HttpRequest& request) {
    HeaderMap headers;
    for (const auto& field : request.message) {
        std::string name = to_lower(field.name_string());
        if (is_unsigned_header(name)) continue;
        headers[name].push_back(normalize_header_value(field.value()));
    }
    for (auto& [_, values] : headers) {
        std::sort(values.begin(), values.end());
    }
    return headers;
}

std::string SignatureV4::CreateCanonicalRequest(const network::HttpRequest& request,
                                                const std::string& payload_hash,
                                                std::string& signed_headers) const {
    // Step 1.1: the verb
    std::string method(request.message.method_string());

    // Step 1.2 / 1.3: canonical URI and query string
    std::string_view target = request.message.target();
    auto q = target.find('?');
    std::string_view path = target.substr(0, q);
    std::string_view query = q == std::string_view::npos ? std::string_view{} : target.substr(q + 1);

    // Step 1.4 / 1.5: canonical headers and the signed header list, sorted by name
    HeaderMap merged = CollectHeaders(request);
    std::string canonical_headers;
    signed_headers.clear();
    for (const auto& [name, values] : merged) {
        canonical_headers += name + ":";
        for (std::size_t i = 0; i < values.size(); ++i) {
            if (i > 0) canonical_headers += ",";
            canonical_headers += values[i];
        }
        canonical_headers += "\n";

        if (!signed_headers.empty()) signed_headers += ";";
        signed_headers += name;
    }

    // Step 1.6 / 1.7: combine with the payload hash
    return method + "\n" + CanonicalUri(path) + "\n" + CanonicalQueryString(query) + "\n" +
           canonical_headers + "\n" + signed_headers + "\n" + payload_hash;
}

std::string SignatureV4::CreateStringToSign(const std::string& amz_date,
                                            const std::string& datestamp,
                                            const std::string& canonical_request) const {
    return std::string(ALGORITHM) + "\n" + amz_date + "\n" + CredentialScope(datestamp) + "\n" +
           Sha256Hex(canonical_request);
}

void SignatureV4::Sign(network::HttpRequest& request, const Credentials& credentials) const {
    if (credentials.Empty()) {
        throw std::invalid_argument("Cannot sign request: credentials are incomplete");
    }

    const std::time_t now = clock_ ? clock_() : std::time(nullptr);
    const std::tm timeinfo = get_safe_gmtime(now);
    const std::string amz_date = format_time(timeinfo, "%Y%m%dT%H%M%SZ");
    const std::string datestamp = format_time(timeinfo, "%Y%m%d");

    auto& msg = request.message;
    msg.erase(http::field::authorization);
    msg.erase("X-Amz-Date");
    msg.erase("X-Amz-Security-Token");

    if (msg.find(http::field::host) == msg.end()) {
        msg.set(http::field::host, request.Authority());
    }
    msg.set("X-Amz-Date", amz_date);
    if (!credentials.session_token.empty()) {
        msg.set("X-Amz-Security-Token", credentials.session_token);
    }

    const std::string payload_hash = Sha256Hex(msg.body());
    if (service_ == "s3") {
        msg.set("X-Amz-Content-Sha256", payload_hash);
    }

    std::string signed_headers;
    const std::string canonical_request = CreateCanonicalRequest(request, payload_hash, signed_headers);
    const std::string string_to_sign = CreateStringToSign(amz_date, datestamp, canonical_request);
    const std::string signature =
        Hexlify(HmacSha256(DeriveSigningKey(credentials.secret_key, datestamp), string_to_sign));

    // Step 4: Authorization header
    msg.set(http::field::authorization,
            std::string(ALGORITHM) + " Credential=" + credentials.access_key + "/" +
                CredentialScope(datestamp) + ", SignedHeaders=" + signed_headers +
                ", Signature=" + signature);

    spdlog::trace("[SigV4] signed {} {} with scope {}", std::string(msg.method_string()),
                  std::string(msg.target()), CredentialScope(datestamp));
}

}  // namespace courier::infra::signing
