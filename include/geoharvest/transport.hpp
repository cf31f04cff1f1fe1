#pragma once

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace geoharvest {

    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string error; // non-empty when the request never produced an HTTP response
        bool timedOut = false;

        bool transportFailed() const { return !error.empty(); }
    };

    // One blocking GET with a hard timeout. Implementations must be callable from several
    // threads at once.
    class Transport {
      public:
        virtual ~Transport() = default;

        virtual HttpResponse get(const std::string &url, const QueryParams &params,
                                 std::chrono::milliseconds timeout) = 0;
    };

    class CurlTransport : public Transport {
      private:
        std::string userAgent_;

      public:
        explicit CurlTransport(std::string userAgent = "geoharvest/0.1");

        HttpResponse get(const std::string &url, const QueryParams &params,
                         std::chrono::milliseconds timeout) override;
    };

    // "url?k=v&..." with percent-encoded keys and values
    std::string buildUrl(const std::string &url, const QueryParams &params);

} // namespace geoharvest
