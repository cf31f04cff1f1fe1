#pragma once

#include "geoharvest/config.hpp"
#include "geoharvest/crs.hpp"
#include "geoharvest/error.hpp"
#include "geoharvest/fetcher.hpp"
#include "geoharvest/log.hpp"
#include "geoharvest/tiles.hpp"
#include "geoharvest/transport.hpp"
#include "geoharvest/types.hpp"

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoharvest {

    // PENDING -> FETCHING -> {ASSEMBLED | EMPTY} -> (FALLBACK_SUBSTITUTED)? -> DONE
    enum class LayerState { Pending, Fetching, Assembled, Empty, FallbackSubstituted, Done };

    const char *toString(LayerState state);

    struct HarvestSummary {
        std::string layer;
        std::size_t featureCount = 0;
        bool complete = false;
        bool fallbackSubstituted = false;
        LayerState outcome = LayerState::Pending; // last state before DONE
        LayerState state = LayerState::Pending;
        std::filesystem::path outputPath;
        std::optional<ErrorKind> error; // set when the layer produced nothing usable
        std::string message;

        bool usable() const { return !error && !outputPath.empty(); }
    };

    struct RunReport {
        std::vector<HarvestSummary> layers;

        std::size_t usable() const;
    };

    class Harvester {
      private:
        HarvestConfig config_;
        std::shared_ptr<Transport> transport_;
        Logger log_;
        CrsResolver resolver_;
        Fetcher fetcher_;

        void transition(HarvestSummary &summary, LayerState next) const;
        void harvestInto(const LayerDescriptor &layer, HarvestSummary &summary) const;
        // Copies the layer's fallback to the output directory. Returns false with the reason in problem when
        // there is no readable fallback. Throws HarvestError(OutputError) when the copy fails.
        bool substituteFallback(const LayerDescriptor &layer, HarvestSummary &summary, std::string &problem) const;
        // Records a layer failure, then substitutes the fallback unless it was already tried
        void recover(const LayerDescriptor &layer, HarvestSummary &summary, ErrorKind kind,
                     const std::string &what) const;

      public:
        Harvester(HarvestConfig config, std::shared_ptr<Transport> transport, Logger log);

        // Runs one layer to DONE. Errors inside the layer are recorded in the summary, never thrown.
        HarvestSummary harvestLayer(const LayerDescriptor &layer) const;

        // All layers with at most config.layer_workers in flight; summaries keep catalog order
        RunReport run(const std::vector<LayerDescriptor> &layers) const;
        RunReport run() const { return run(config_.layers); }

        // One tiling job per usable layer. Throws HarvestError(NoUsableData) when there is none.
        std::vector<TileJob> handoff(const RunReport &report) const;

        const HarvestConfig &config() const { return config_; }
    };

    std::ostream &operator<<(std::ostream &os, RunReport const &report);

} // namespace geoharvest
