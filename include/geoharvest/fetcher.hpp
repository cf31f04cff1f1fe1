#pragma once

#include "geoharvest/config.hpp"
#include "geoharvest/error.hpp"
#include "geoharvest/log.hpp"
#include "geoharvest/transport.hpp"
#include "geoharvest/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoharvest {

    using Clock = std::chrono::steady_clock;

    struct FetchPolicy {
        std::chrono::milliseconds request_timeout{std::chrono::seconds(45)};
        int retries = 1;
        std::chrono::milliseconds retry_backoff{2000};
        std::size_t page_size = 1000;
        int max_page_failures = 3;
        std::size_t workers = 4;

        static FetchPolicy from(const HarvestConfig &cfg);
    };

    enum class ChunkStatus { Fetched, Failed, Skipped };

    struct ChunkResult {
        ChunkRequest request;
        ChunkStatus status = ChunkStatus::Skipped;
        std::vector<RawFeature> features;
        std::optional<ErrorKind> error;
        std::string message;
        int attempts = 0;
        bool budgetExhausted = false;
        bool truncated = false; // grid chunk answered with exceededTransferLimit
    };

    struct LayerFetch {
        std::vector<RawFeature> features;
        std::size_t planned = 0;
        std::size_t fetched = 0;
        std::size_t failed = 0;
        std::size_t skipped = 0;
        std::size_t truncated = 0;
        bool budgetExceeded = false;

        bool complete() const { return !budgetExceeded && failed == 0 && skipped == 0 && truncated == 0; }
    };

    // where/outFields/returnGeometry/inSR/outSR plus the envelope (f=json) or page (f=geojson) parameters
    QueryParams queryParams(const ChunkRequest &chunk, int outSr);

    // Classifies one response. Throws HarvestError: NetworkError, ServerError (retryable for 5xx,
    // 429 and ArcGIS error bodies with code >= 500) or MalformedResponse.
    // transferLimit, when given, is set from the response's exceededTransferLimit flag.
    std::vector<RawFeature> readFeatures(const HttpResponse &response, bool *transferLimit = nullptr);

    class Fetcher {
      private:
        std::shared_ptr<Transport> transport_;
        FetchPolicy policy_;
        Logger log_;

        void record(LayerFetch &fetch, ChunkResult &&result) const;

      public:
        Fetcher(std::shared_ptr<Transport> transport, FetchPolicy policy, Logger log);

        // One chunk or page with retries. Never throws: anything a Transport or the response
        // decoding throws becomes a failed attempt.
        ChunkResult fetchChunk(const LayerDescriptor &layer, ChunkRequest chunk, int outSr,
                               Clock::time_point deadline) const;

        // Grid chunks on a bounded worker pool; chunks not started before the deadline are skipped
        LayerFetch fetchGrid(const LayerDescriptor &layer, const std::vector<ChunkRequest> &plan, int outSr,
                             Clock::time_point deadline) const;

        // Sequential offset paging until an empty page, the deadline or too many failed pages
        LayerFetch fetchPages(const LayerDescriptor &layer, int outSr, Clock::time_point deadline) const;

        const FetchPolicy &policy() const { return policy_; }
    };

} // namespace geoharvest
