#include "geoharvest/transport.hpp"
#include "geoharvest/error.hpp"

#include <curl/curl.h>

#include <cctype>
#include <iomanip>
#include <memory>
#include <mutex>
#include <sstream>

namespace geoharvest {

    namespace {
        struct CurlDeleter {
            void operator()(CURL *handle) const {
                if (handle)
                    curl_easy_cleanup(handle);
            }
        };
        using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

        std::once_flag curlInitFlag;

        size_t writeCallback(char *data, size_t size, size_t nmemb, void *userp) {
            auto *body = static_cast<std::string *>(userp);
            // no exception may cross libcurl; a short count aborts with CURLE_WRITE_ERROR
            try {
                body->append(data, size * nmemb);
            } catch (const std::exception &) {
                return 0;
            }
            return size * nmemb;
        }

        std::string percentEncode(const std::string &s) {
            std::ostringstream oss;
            oss << std::hex << std::uppercase;
            for (unsigned char c : s) {
                if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                    oss << c;
                } else {
                    oss << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
                }
            }
            return oss.str();
        }
    } // namespace

    std::string buildUrl(const std::string &url, const QueryParams &params) {
        std::string out = url;
        char sep = url.find('?') == std::string::npos ? '?' : '&';
        for (auto const &[key, value] : params) {
            out += sep;
            out += percentEncode(key);
            out += '=';
            out += percentEncode(value);
            sep = '&';
        }
        return out;
    }

    CurlTransport::CurlTransport(std::string userAgent) : userAgent_(std::move(userAgent)) {
        std::call_once(curlInitFlag, [] {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
                throw HarvestError(ErrorKind::NetworkError, "CurlTransport: curl_global_init failed", false);
        });
    }

    HttpResponse CurlTransport::get(const std::string &url, const QueryParams &params,
                                    std::chrono::milliseconds timeout) {
        HttpResponse response;

        CurlPtr curl(curl_easy_init());
        if (!curl) {
            response.error = "curl_easy_init failed";
            return response;
        }

        std::string full = buildUrl(url, params);
        curl_easy_setopt(curl.get(), CURLOPT_URL, full.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
        curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeout.count()));
        curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, userAgent_.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");

        CURLcode res = curl_easy_perform(curl.get());
        if (res != CURLE_OK) {
            response.error = curl_easy_strerror(res);
            response.timedOut = res == CURLE_OPERATION_TIMEDOUT;
            return response;
        }

        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
        return response;
    }

} // namespace geoharvest
