#include "geoharvest/fetcher.hpp"
#include "geoharvest/parser.hpp"
#include "geoharvest/planner.hpp"
#include "geoharvest/thread_pool.hpp"

#include <boost/json.hpp>
#include <algorithm>
#include <future>
#include <iterator>
#include <iomanip>
#include <sstream>
#include <thread>

namespace geoharvest {

    namespace {
        std::string formatEnvelope(const BBox &b) {
            std::ostringstream oss;
            oss << std::setprecision(15) << b.xmin << "," << b.ymin << "," << b.xmax << "," << b.ymax;
            return oss.str();
        }

        bool retryableStatus(long status) { return status >= 500 || status == 429; }

        bool limitFlag(const boost::json::object &obj) {
            auto const *flag = obj.if_contains("exceededTransferLimit");
            return flag && flag->is_bool() && flag->as_bool();
        }

        // Anything other than a HarvestError thrown by f is reported as a HarvestError of the given kind
        template <typename F> auto classified(ErrorKind kind, const char *prefix, F &&f) -> decltype(f()) {
            try {
                return f();
            } catch (const HarvestError &) {
                throw;
            } catch (const std::exception &e) {
                throw HarvestError(kind, prefix + std::string(e.what()));
            }
        }
    } // namespace

    FetchPolicy FetchPolicy::from(const HarvestConfig &cfg) {
        FetchPolicy p;
        p.request_timeout = cfg.request_timeout;
        p.retries = cfg.retries;
        p.retry_backoff = cfg.retry_backoff;
        p.page_size = cfg.page_size;
        p.max_page_failures = cfg.max_page_failures;
        p.workers = cfg.chunk_workers;
        return p;
    }

    QueryParams queryParams(const ChunkRequest &chunk, int outSr) {
        QueryParams params{{"where", "1=1"}, {"outFields", "*"}, {"returnGeometry", "true"}};
        if (auto *cell = std::get_if<GridCell>(&chunk.target)) {
            params.emplace_back("geometry", formatEnvelope(cell->envelope));
            params.emplace_back("geometryType", "esriGeometryEnvelope");
            params.emplace_back("spatialRel", "esriSpatialRelIntersects");
            params.emplace_back("f", "json");
        } else {
            auto const &page = std::get<PageCursor>(chunk.target);
            params.emplace_back("resultOffset", std::to_string(page.offset));
            params.emplace_back("resultRecordCount", std::to_string(page.size));
            params.emplace_back("f", "geojson");
        }
        params.emplace_back("inSR", "4326");
        params.emplace_back("outSR", std::to_string(outSr));
        return params;
    }

    std::vector<RawFeature> readFeatures(const HttpResponse &response, bool *transferLimit) {
        if (response.transportFailed()) {
            throw HarvestError(ErrorKind::NetworkError,
                               (response.timedOut ? "timeout: " : "connection failed: ") + response.error);
        }
        if (response.status < 200 || response.status >= 300) {
            throw HarvestError(ErrorKind::ServerError, "HTTP " + std::to_string(response.status),
                               retryableStatus(response.status));
        }

        boost::json::error_code ec;
        auto j = boost::json::parse(response.body, ec);
        if (ec)
            throw HarvestError(ErrorKind::MalformedResponse, "response is not JSON: " + ec.message());
        if (!j.is_object())
            throw HarvestError(ErrorKind::MalformedResponse, "response is not a JSON object");
        auto const &obj = j.as_object();

        // ArcGIS reports failures as HTTP 200 with an "error" object
        if (obj.contains("error") && obj.at("error").is_object()) {
            auto const &err = obj.at("error").as_object();
            long code = 0;
            if (err.contains("code") && err.at("code").is_number())
                code = static_cast<long>(boost::json::value_to<double>(err.at("code")));
            std::string message = "server error " + std::to_string(code);
            if (err.contains("message") && err.at("message").is_string())
                message += ": " + std::string(err.at("message").as_string());
            throw HarvestError(ErrorKind::ServerError, message, retryableStatus(code));
        }

        if (!obj.contains("features") || !obj.at("features").is_array())
            throw HarvestError(ErrorKind::MalformedResponse, "response has no 'features' array");

        // ArcGIS JSON carries the flag at the top level, ArcGIS GeoJSON under "properties"
        if (transferLimit) {
            *transferLimit = limitFlag(obj) || (obj.contains("properties") && obj.at("properties").is_object() &&
                                                limitFlag(obj.at("properties").as_object()));
        }

        std::vector<RawFeature> out;
        auto const &features = obj.at("features").as_array();
        out.reserve(features.size());
        for (auto const &f : features) {
            RawFeature raw;
            if (f.is_object()) {
                auto const &fo = f.as_object();
                if (fo.contains("geometry"))
                    raw.geometry = fo.at("geometry");
                if (fo.contains("attributes"))
                    raw.attributes = parseProperties(fo.at("attributes"));
                else if (fo.contains("properties"))
                    raw.attributes = parseProperties(fo.at("properties"));
            }
            out.push_back(std::move(raw));
        }
        return out;
    }

    Fetcher::Fetcher(std::shared_ptr<Transport> transport, FetchPolicy policy, Logger log)
        : transport_(std::move(transport)), policy_(policy), log_(log ? std::move(log) : nullLogger()) {}

    ChunkResult Fetcher::fetchChunk(const LayerDescriptor &layer, ChunkRequest chunk, int outSr,
                                    Clock::time_point deadline) const {
        ChunkResult result;
        const int maxAttempts = 1 + std::max(0, policy_.retries);
        const auto params = queryParams(chunk, outSr);

        for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
            if (Clock::now() >= deadline) {
                result.status = attempt == 1 ? ChunkStatus::Skipped : ChunkStatus::Failed;
                result.budgetExhausted = true;
                if (attempt == 1)
                    result.message = "layer budget exhausted";
                break;
            }

            chunk.attempt = attempt;
            result.attempts = attempt;
            log_->debug("[{}] GET {} {} attempt {}", layer.name, layer.url, describe(chunk), attempt);
            try {
                auto response = classified(ErrorKind::NetworkError, "transport failed: ",
                                           [&] { return transport_->get(layer.url, params, policy_.request_timeout); });
                bool limited = false;
                result.features = classified(ErrorKind::MalformedResponse, "cannot read response: ",
                                             [&] { return readFeatures(response, &limited); });
                result.truncated = limited && std::holds_alternative<GridCell>(chunk.target);
                result.status = ChunkStatus::Fetched;
                result.error.reset();
                result.message.clear();
                break;
            } catch (const HarvestError &e) {
                result.status = ChunkStatus::Failed;
                result.error = e.kind();
                result.message = e.what();
                bool retry = e.retryable() && attempt < maxAttempts;
                log_->warn("[{}] chunk {} attempt {}/{} failed ({}): {}{}", layer.name, describe(chunk), attempt,
                           maxAttempts, toString(e.kind()), e.what(), retry ? "; retrying" : "");
                if (!retry)
                    break;
                auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
                std::this_thread::sleep_for(std::max(std::chrono::milliseconds(0),
                                                     std::min(policy_.retry_backoff, remaining)));
            }
        }

        result.request = std::move(chunk);
        return result;
    }

    void Fetcher::record(LayerFetch &fetch, ChunkResult &&result) const {
        ++fetch.planned;
        switch (result.status) {
        case ChunkStatus::Fetched:
            ++fetch.fetched;
            if (!result.features.empty())
                log_->info("[{}]   +{} features {}", result.request.layer, result.features.size(),
                           describe(result.request));
            if (result.truncated) {
                ++fetch.truncated;
                log_->warn("[{}] chunk {} hit the server record limit at {} features; the layer is incomplete",
                           result.request.layer, describe(result.request), result.features.size());
            }
            std::move(result.features.begin(), result.features.end(), std::back_inserter(fetch.features));
            break;
        case ChunkStatus::Failed:
            ++fetch.failed;
            log_->warn("[{}] chunk {} abandoned after {} attempt(s): {}", result.request.layer,
                       describe(result.request), result.attempts, result.message);
            break;
        case ChunkStatus::Skipped:
            ++fetch.skipped;
            fetch.budgetExceeded = true;
            break;
        }
        if (result.budgetExhausted)
            fetch.budgetExceeded = true;
    }

    LayerFetch Fetcher::fetchGrid(const LayerDescriptor &layer, const std::vector<ChunkRequest> &plan, int outSr,
                                  Clock::time_point deadline) const {
        LayerFetch fetch;
        std::vector<std::future<ChunkResult>> pending;
        pending.reserve(plan.size());
        {
            ThreadPool pool(std::min(std::max<std::size_t>(policy_.workers, 1), std::max<std::size_t>(plan.size(), 1)));
            for (auto const &chunk : plan) {
                pending.push_back(pool.enqueue([this, &layer, chunk, outSr, deadline] {
                    return fetchChunk(layer, chunk, outSr, deadline);
                }));
            }
        }

        for (auto &f : pending)
            record(fetch, f.get());

        if (fetch.budgetExceeded)
            log_->warn("[{}] layer budget exceeded: {} of {} chunks skipped", layer.name, fetch.skipped,
                       fetch.planned);
        return fetch;
    }

    LayerFetch Fetcher::fetchPages(const LayerDescriptor &layer, int outSr, Clock::time_point deadline) const {
        LayerFetch fetch;
        std::size_t offset = 0;
        int consecutiveFailures = 0;

        for (std::size_t index = 0;; ++index) {
            if (Clock::now() >= deadline) {
                fetch.budgetExceeded = true;
                log_->warn("[{}] layer budget exceeded at offset {}", layer.name, offset);
                break;
            }

            auto result = fetchChunk(layer, planPage(layer.name, index, offset, policy_.page_size), outSr, deadline);
            auto status = result.status;
            auto count = result.features.size();
            record(fetch, std::move(result));

            if (status == ChunkStatus::Fetched) {
                consecutiveFailures = 0;
                if (count == 0)
                    break;
                offset += count;
            } else if (status == ChunkStatus::Skipped) {
                break;
            } else {
                if (++consecutiveFailures >= policy_.max_page_failures) {
                    log_->warn("[{}] giving up paging after {} consecutive failed pages", layer.name,
                               consecutiveFailures);
                    break;
                }
                offset += policy_.page_size;
            }
        }
        return fetch;
    }

} // namespace geoharvest
