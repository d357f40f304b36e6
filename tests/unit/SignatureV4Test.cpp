#include <gtest/gtest.h>

#include <ctime>
#include <memory>
#include <string>

#include "Credentials.hpp"
#include "SignatureProvider.hpp"
#include "SignatureV4.hpp"

using namespace courier;
using infra::signing::Credentials;
using infra::signing::SignatureV4;

namespace {

// 2015-08-30T12:36:00Z, the date of the AWS SigV4 test suite.
constexpr std::time_t SUITE_TIME = 1440938160;

const Credentials SUITE_CREDENTIALS{"AKIDEXAMPLE", "wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", "",
                                    std::nullopt};

network::HttpRequest SuiteRequest(const std::string& target) {
    network::HttpRequest req;
    req.host = "example.amazonaws.com";
    req.message = http::request<http::string_body>(http::verb::get, target, 11);
    req.message.set(http::field::host, "example.amazonaws.com");
    return req;
}

SignatureV4 SuiteSigner() {
    return SignatureV4("service", "us-east-1", [] { return SUITE_TIME; });
}

}  // namespace

TEST(SignatureV4Test, GetVanilla) {
    auto req = SuiteRequest("/");
    SuiteSigner().Sign(req, SUITE_CREDENTIALS);

    EXPECT_EQ(req.message["X-Amz-Date"], "20150830T123600Z");
    EXPECT_EQ(req.message[http::field::authorization],
              "AWS4-HMAC-SHA256 Credential=AKIDEXAMPLE/20150830/us-east-1/service/aws4_request, "
              "SignedHeaders=host;x-amz-date, "
              "Signature=5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31");
}

TEST(SignatureV4Test, GetVanillaQueryOrderKey) {
    auto req = SuiteRequest("/?Param2=value2&Param1=value1");
    SuiteSigner().Sign(req, SUITE_CREDENTIALS);

    std::string auth(req.message[http::field::authorization]);
    EXPECT_NE(auth.find("Signature=b97d918cfa904a5beff61c982a1b6f458b799221646efd99d3219ec94cdf2500"),
              std::string::npos);
}

TEST(SignatureV4Test, CanonicalRequestOfGetVanilla) {
    auto req = SuiteRequest("/");
    req.message.set("X-Amz-Date", "20150830T123600Z");
    std::string signed_headers;
    std::string canonical = SuiteSigner().CreateCanonicalRequest(
        req, SignatureV4::Sha256Hex(""), signed_headers);

    EXPECT_EQ(signed_headers, "host;x-amz-date");
    EXPECT_EQ(canonical,
              "GET\n/\n\nhost:example.amazonaws.com\nx-amz-date:20150830T123600Z\n\n"
              "host;x-amz-date\n"
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(SignatureV4::Sha256Hex(canonical),
              "bb579772317eb040ac9ed261061d46c1f17a8133879d6129b6e1c25292927e63");
}

TEST(SignatureV4Test, CanonicalUriIsEncodedAgainExceptForS3) {
    auto req = SuiteRequest("/things/a%20b/c+d?x=1");
    req.message.set("X-Amz-Date", "20150830T123600Z");
    std::string signed_headers;

    auto second_line = [](const std::string& canonical) {
        auto start = canonical.find('\n') + 1;
        return canonical.substr(start, canonical.find('\n', start) - start);
    };

    std::string canonical =
        SuiteSigner().CreateCanonicalRequest(req, SignatureV4::Sha256Hex(""), signed_headers);
    EXPECT_EQ(second_line(canonical), "/things/a%2520b/c%2Bd");

    SignatureV4 s3("s3", "us-east-1", [] { return SUITE_TIME; });
    canonical = s3.CreateCanonicalRequest(req, SignatureV4::Sha256Hex(""), signed_headers);
    EXPECT_EQ(second_line(canonical), "/things/a%20b/c+d");
}

TEST(SignatureV4Test, ContentHashHeaderOnlyForS3) {
    auto req = SuiteRequest("/");
    req.message.body() = "payload";
    SuiteSigner().Sign(req, SUITE_CREDENTIALS);
    EXPECT_EQ(req.message.find("X-Amz-Content-Sha256"), req.message.end());

    auto object = SuiteRequest("/bucket/key");
    object.message.body() = "payload";
    SignatureV4("s3", "us-east-1", [] { return SUITE_TIME; }).Sign(object, SUITE_CREDENTIALS);
    EXPECT_EQ(std::string(object.message["X-Amz-Content-Sha256"]),
              SignatureV4::Sha256Hex("payload"));
    std::string auth(object.message[http::field::authorization]);
    EXPECT_NE(auth.find("SignedHeaders=host;x-amz-content-sha256;x-amz-date"), std::string::npos);
}

TEST(SignatureV4Test, DerivesTheDocumentedSigningKey) {
    SignatureV4 signer("iam", "us-east-1");
    std::string key = signer.DeriveSigningKey("wJalrXUtnFEMI/K7MDENG+bPxRfiCYEXAMPLEKEY", "20120215");
    EXPECT_EQ(SignatureV4::Hexlify(key),
              "f4780e2d9f65fa895f9c67b32ce1baf0b0d8a43505a000a1a9e090d414db404d");
    EXPECT_EQ(signer.CredentialScope("20120215"), "20120215/us-east-1/iam/aws4_request");
}

TEST(SignatureV4Test, SkipsVolatileHeadersAndAddsSessionToken) {
    auto req = SuiteRequest("/");
    req.message.set(http::field::user_agent, "courier-test");
    req.message.set("X-Amzn-Trace-Id", "Root=1");

    Credentials creds = SUITE_CREDENTIALS;
    creds.session_token = "TOKEN";
    SuiteSigner().Sign(req, creds);

    std::string auth(req.message[http::field::authorization]);
    EXPECT_NE(auth.find("SignedHeaders=host;x-amz-date;x-amz-security-token,"), std::string::npos);
    EXPECT_EQ(req.message["X-Amz-Security-Token"], "TOKEN");
}

TEST(SignatureV4Test, ResigningReplacesPreviousSignature) {
    auto req = SuiteRequest("/");
    SuiteSigner().Sign(req, SUITE_CREDENTIALS);
    SuiteSigner().Sign(req, SUITE_CREDENTIALS);

    EXPECT_EQ(req.message.count(http::field::authorization), 1u);
    EXPECT_NE(std::string(req.message[http::field::authorization])
                  .find("Signature=5fa00fa31553b73ebf1942676e86291e8372ff2a2260956d9b8aae1d763fbf31"),
              std::string::npos);
}

TEST(SignatureV4Test, AddsHostWhenMissing) {
    network::HttpRequest req;
    req.host = "localhost";
    req.port = "8000";
    req.scheme = "http";
    SuiteSigner().Sign(req, SUITE_CREDENTIALS);
    EXPECT_EQ(req.message[http::field::host], "localhost:8000");
}

TEST(SignatureV4Test, RejectsIncompleteCredentials) {
    auto req = SuiteRequest("/");
    EXPECT_THROW(SuiteSigner().Sign(req, Credentials{}), std::invalid_argument);
    EXPECT_EQ(req.message.find(http::field::authorization), req.message.end());
}

TEST(SignatureProviderTest, CachesSignersPerScope) {
    infra::signing::SignatureProvider provider;
    auto a = provider.Resolve("v4", "dynamodb", "us-east-1");
    auto b = provider.Resolve("v4", "dynamodb", "us-east-1");
    auto c = provider.Resolve("v4", "dynamodb", "eu-west-1");

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_EQ(provider.CacheSize(), 2u);
    EXPECT_NE(std::dynamic_pointer_cast<SignatureV4>(a), nullptr);
    EXPECT_EQ(std::dynamic_pointer_cast<SignatureV4>(c)->Region(), "eu-west-1");
}

TEST(SignatureProviderTest, AnonymousAndUnknownVersions) {
    infra::signing::SignatureProvider provider;
    auto anonymous = provider.Resolve("anonymous", "dynamodb", "us-east-1");
    ASSERT_NE(anonymous, nullptr);

    network::HttpRequest req;
    anonymous->Sign(req, Credentials{});
    EXPECT_EQ(req.message.find(http::field::authorization), req.message.end());

    EXPECT_THROW(provider.Resolve("v2", "dynamodb", "us-east-1"), std::invalid_argument);
}
