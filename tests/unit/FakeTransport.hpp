#pragma once

#include <deque>
#include <exception>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "ClientOptions.hpp"
#include "Credentials.hpp"
#include "HttpMessage.hpp"
#include "ServiceDescription.hpp"
#include "types.hpp"

namespace courier::testing {

inline network::HttpResponse JsonResponse(unsigned int status, const std::string& body,
                                          const std::map<std::string, std::string>& headers = {}) {
    network::HttpResponse res{static_cast<http::status>(status), 11};
    res.set(http::field::content_type, "application/x-amz-json-1.0");
    for (const auto& [name, value] : headers) res.set(name, value);
    res.body() = body;
    res.prepare_payload();
    return res;
}

/**
 * @brief Scripted in-memory transport.
 *
 * Runs the pre-send hooks like a real transport, records the request as it
 * would have gone on the wire, and answers with the next queued reply (or
 * the fallback once the queue is empty). With `defer` set, completions are
 * held until `CompletePending()` or a cancel.
 */
class FakeTransport : public network::ITransport {
   public:
    struct Reply {
        std::optional<network::HttpResponse> response;
        std::exception_ptr error;
    };

    void Queue(network::HttpResponse response) {
        std::lock_guard lock(mutex_);
        replies_.push_back({std::move(response), nullptr});
    }

    void QueueJson(unsigned int status, const std::string& body,
                   const std::map<std::string, std::string>& headers = {}) {
        Queue(JsonResponse(status, body, headers));
    }

    void QueueError(std::exception_ptr error) {
        std::lock_guard lock(mutex_);
        replies_.push_back({std::nullopt, std::move(error)});
    }

    void SetFallback(network::HttpResponse response) {
        std::lock_guard lock(mutex_);
        fallback_ = std::move(response);
    }

    void SetDefer(bool defer) {
        std::lock_guard lock(mutex_);
        defer_ = defer;
    }

    std::shared_ptr<network::ITransfer> Send(std::shared_ptr<network::HttpRequest> request,
                                             Completion on_complete) override {
        try {
            request->RunBeforeSend();
        } catch (const std::exception&) {
            on_complete({std::nullopt, std::current_exception()});
            return std::make_shared<Transfer>(nullptr);
        }

        Reply reply;
        bool defer = false;
        {
            std::lock_guard lock(mutex_);
            sent_.push_back(*request);
            if (!replies_.empty()) {
                reply = std::move(replies_.front());
                replies_.pop_front();
            } else {
                reply.response = fallback_;
            }
            defer = defer_;
        }

        auto transfer = std::make_shared<Transfer>(
            std::make_shared<Pending>(Pending{request->Url(), std::move(on_complete), std::move(reply)}));
        if (defer) {
            std::lock_guard lock(mutex_);
            pending_.push_back(transfer);
        } else {
            transfer->Finish(false);
        }
        return transfer;
    }

    // Delivers every held completion.
    void CompletePending() {
        std::vector<std::shared_ptr<Transfer>> pending;
        {
            std::lock_guard lock(mutex_);
            pending.swap(pending_);
        }
        for (auto& transfer : pending) transfer->Finish(false);
    }

    std::vector<network::HttpRequest> Sent() const {
        std::lock_guard lock(mutex_);
        return sent_;
    }

    std::size_t SendCount() const {
        std::lock_guard lock(mutex_);
        return sent_.size();
    }

    // Parsed JSON body of the n-th sent request.
    json::object SentBody(std::size_t n) const {
        std::lock_guard lock(mutex_);
        const auto& body = sent_.at(n).message.body();
        if (body.empty()) return {};
        return json::parse(body).as_object();
    }

   private:
    struct Pending {
        std::string url;
        Completion on_complete;
        Reply reply;
    };

    class Transfer : public network::ITransfer {
       public:
        explicit Transfer(std::shared_ptr<Pending> pending) : pending_(std::move(pending)) {}

        bool Cancel() override { return Finish(true); }

        bool Finish(bool cancelled) {
            std::shared_ptr<Pending> pending;
            {
                std::lock_guard lock(mutex_);
                pending.swap(pending_);
            }
            if (!pending) return false;

            network::TransferResult result;
            if (cancelled) {
                result.error = std::make_exception_ptr(network::RequestError(
                    "Request cancelled", pending->url, std::nullopt,
                    boost::asio::error::operation_aborted));
            } else {
                result.response = std::move(pending->reply.response);
                result.error = std::move(pending->reply.error);
            }
            pending->on_complete(std::move(result));
            return true;
        }

       private:
        std::mutex mutex_;
        std::shared_ptr<Pending> pending_;
    };

    mutable std::mutex mutex_;
    std::deque<Reply> replies_;
    network::HttpResponse fallback_ = JsonResponse(200, "{}");
    bool defer_ = false;
    std::vector<network::HttpRequest> sent_;
    std::vector<std::shared_ptr<Transfer>> pending_;
};

// Credentials provider that counts how often it is asked.
class CountingCredentialsProvider : public infra::signing::ICredentialsProvider {
   public:
    explicit CountingCredentialsProvider(std::string access_key)
        : access_key_(std::move(access_key)) {}

    infra::signing::Credentials GetCredentials() override {
        std::lock_guard lock(mutex_);
        ++calls_;
        return {access_key_, "secret", "", std::nullopt};
    }

    void SetAccessKey(std::string access_key) {
        std::lock_guard lock(mutex_);
        access_key_ = std::move(access_key);
    }

    int Calls() const {
        std::lock_guard lock(mutex_);
        return calls_;
    }

   private:
    mutable std::mutex mutex_;
    std::string access_key_;
    int calls_ = 0;
};

// A small json-protocol service: one paginated operation, one waiter.
inline std::shared_ptr<const models::ServiceDescription> MakeTestApi() {
    static const char* API = R"({
        "metadata": {
            "endpointPrefix": "dynamodb",
            "serviceFullName": "Test Service",
            "protocol": "json",
            "jsonVersion": "1.0",
            "targetPrefix": "DynamoDB_20120810"
        },
        "operations": {
            "GetItem": {},
            "PutItem": {},
            "ListThings": {},
            "DescribeThing": {}
        },
        "pagination": {
            "ListThings": {
                "input_token": "NextToken",
                "output_token": "NextToken",
                "result_key": "Things"
            }
        },
        "waiters": {
            "ThingReady": {
                "operation": "DescribeThing",
                "delay": 0,
                "maxAttempts": 3,
                "acceptors": [
                    {"state": "success", "matcher": "path", "argument": "Thing.Status", "expected": "DONE"},
                    {"state": "failure", "matcher": "path", "argument": "Thing.Status", "expected": "ERROR"},
                    {"state": "retry", "matcher": "error", "expected": "ThingNotFoundException"}
                ]
            }
        }
    })";
    return std::make_shared<const models::ServiceDescription>(
        models::ServiceDescription::FromJson(json::parse(API).as_object()));
}

inline core::ClientOptions MakeTestOptions(std::shared_ptr<network::ITransport> transport) {
    core::ClientOptions options;
    options.api = MakeTestApi();
    options.region = "us-east-1";
    options.credentials = std::make_shared<infra::signing::StaticCredentialsProvider>(
        infra::signing::Credentials{"AKIDEXAMPLE", "secret", "", std::nullopt});
    options.transport = std::move(transport);
    return options;
}

}  // namespace courier::testing
