#include "geoharvest/harvester.hpp"
#include "geoharvest/assembler.hpp"
#include "geoharvest/normalizer.hpp"
#include "geoharvest/parser.hpp"
#include "geoharvest/planner.hpp"
#include "geoharvest/thread_pool.hpp"
#include "geoharvest/transform.hpp"

#include <algorithm>
#include <future>
#include <iomanip>
#include <ostream>

namespace geoharvest {

    namespace {
        Transform checkedTransform(const std::string &code) {
            if (!epsgNumber(code))
                throw HarvestError(ErrorKind::ReprojectionError, "Transform: " + code + " has no EPSG code for outSR");
            return Transform(code);
        }

        // Falls back to the default CRS when the resolved one has no EPSG code or PROJ cannot instantiate it.
        // On return epsgNumber(crs.code) is set and matches the transform's source.
        Transform makeTransform(const LayerDescriptor &layer, ResolvedCrs &crs, const std::string &defaultCrs,
                                const Logger &log) {
            try {
                return checkedTransform(crs.code);
            } catch (const HarvestError &e) {
                if (crs.code == defaultCrs)
                    throw;
                log->warn("[{}] {}; using default {}", layer.name, e.what(), defaultCrs);
                crs = ResolvedCrs{defaultCrs, CrsSource::Default};
                return checkedTransform(crs.code);
            }
        }
    } // namespace

    const char *toString(LayerState state) {
        switch (state) {
        case LayerState::Pending:
            return "PENDING";
        case LayerState::Fetching:
            return "FETCHING";
        case LayerState::Assembled:
            return "ASSEMBLED";
        case LayerState::Empty:
            return "EMPTY";
        case LayerState::FallbackSubstituted:
            return "FALLBACK_SUBSTITUTED";
        case LayerState::Done:
            return "DONE";
        }
        return "UNKNOWN";
    }

    std::size_t RunReport::usable() const {
        return static_cast<std::size_t>(
            std::count_if(layers.begin(), layers.end(), [](const HarvestSummary &s) { return s.usable(); }));
    }

    Harvester::Harvester(HarvestConfig config, std::shared_ptr<Transport> transport, Logger log)
        : config_(std::move(config)), transport_(std::move(transport)), log_(log ? std::move(log) : nullLogger()),
          resolver_(transport_, config_.default_crs, config_.request_timeout, log_),
          fetcher_(transport_, FetchPolicy::from(config_), log_) {}

    void Harvester::transition(HarvestSummary &summary, LayerState next) const {
        log_->info("[{}] {} -> {}", summary.layer, toString(summary.state), toString(next));
        if (next != LayerState::Done)
            summary.outcome = next;
        summary.state = next;
    }

    void Harvester::harvestInto(const LayerDescriptor &layer, HarvestSummary &summary) const {
        const auto deadline = Clock::now() + config_.layer_budget;
        const auto fetchedAt = isoTimestamp(std::chrono::system_clock::now());
        transition(summary, LayerState::Fetching);

        auto crs = resolver_.resolve(layer);
        auto transform = makeTransform(layer, crs, resolver_.defaultCrs(), log_);
        const int outSr = *epsgNumber(crs.code);

        LayerFetch fetch;
        if (layer.bbox) {
            auto plan = planChunks(layer.name, *layer.bbox, config_.grid_rows, config_.grid_cols);
            log_->info("[{}] fetching {} chunks over [{}, {}, {}, {}]", layer.name, plan.size(), layer.bbox->xmin,
                       layer.bbox->ymin, layer.bbox->xmax, layer.bbox->ymax);
            fetch = fetcher_.fetchGrid(layer, plan, outSr, deadline);
        } else {
            log_->info("[{}] paging {} features at a time", layer.name, config_.page_size);
            fetch = fetcher_.fetchPages(layer, outSr, deadline);
        }
        log_->info("[{}] {} raw features from {}/{} chunks ({} failed, {} skipped)", layer.name,
                   fetch.features.size(), fetch.fetched, fetch.planned, fetch.failed, fetch.skipped);

        auto normalized =
            normalizeFeatures(fetch.features, transform, NormalizeOptions{config_.axis_swap}, log_, layer.name);
        auto assembly = assemble(layer, crs, std::move(normalized), fetch, config_.output_dir, fetchedAt, log_);

        if (assembly.status == AssemblyStatus::Assembled) {
            summary.featureCount = assembly.collection.features.size();
            summary.complete = assembly.collection.provenance.complete;
            summary.outputPath = assembly.path;
            transition(summary, LayerState::Assembled);
            return;
        }

        log_->warn("[{}] {}: no features after {} chunks", layer.name, toString(ErrorKind::LayerEmpty),
                   fetch.planned);
        transition(summary, LayerState::Empty);
        std::string problem;
        if (!substituteFallback(layer, summary, problem)) {
            summary.error = ErrorKind::LayerEmpty;
            summary.message = "no features and " + problem;
            log_->error("[{}] {}", layer.name, summary.message);
        }
    }

    bool Harvester::substituteFallback(const LayerDescriptor &layer, HarvestSummary &summary,
                                       std::string &problem) const {
        auto source = layer.fallback.empty() ? config_.fallback_dir / (layer.name + ".geojson") : layer.fallback;
        std::error_code ec;
        if (!std::filesystem::exists(source, ec)) {
            problem = "no fallback at " + source.string();
            return false;
        }

        FeatureCollection fc;
        try {
            fc = ReadFeatureCollection(source);
        } catch (const std::exception &e) {
            problem = "unreadable fallback " + source.string() + ": " + e.what();
            return false;
        }

        auto dest = layerOutputPath(config_.output_dir, layer.name);
        auto tmp = dest;
        tmp += ".tmp";
        try {
            std::filesystem::create_directories(config_.output_dir);
            std::filesystem::copy_file(source, tmp, std::filesystem::copy_options::overwrite_existing);
            std::filesystem::rename(tmp, dest);
        } catch (const std::filesystem::filesystem_error &e) {
            std::filesystem::remove(tmp, ec);
            throw HarvestError(ErrorKind::OutputError, "cannot copy fallback: " + std::string(e.what()));
        }

        summary.featureCount = fc.features.size();
        summary.complete = false;
        summary.fallbackSubstituted = true;
        summary.outputPath = dest;
        log_->warn("[{}] using fallback {} ({} features)", layer.name, source.string(), summary.featureCount);
        transition(summary, LayerState::FallbackSubstituted);
        return true;
    }

    void Harvester::recover(const LayerDescriptor &layer, HarvestSummary &summary, ErrorKind kind,
                            const std::string &what) const {
        log_->error("[{}] layer failed ({}): {}", layer.name, toString(kind), what);
        summary.error = kind;
        summary.message = what;
        summary.outputPath.clear();
        summary.featureCount = 0;
        summary.complete = false;

        // EMPTY means the fallback was already tried and its copy is what failed
        if (summary.state == LayerState::Empty)
            return;
        transition(summary, LayerState::Empty);
        try {
            std::string problem;
            if (substituteFallback(layer, summary, problem)) {
                summary.error.reset();
                summary.message = what + "; fallback substituted";
            } else {
                summary.message = what + "; " + problem;
                log_->error("[{}] {}", layer.name, problem);
            }
        } catch (const std::exception &e) {
            summary.message = what + "; " + e.what();
            log_->error("[{}] {}", layer.name, e.what());
        }
    }

    HarvestSummary Harvester::harvestLayer(const LayerDescriptor &layer) const {
        HarvestSummary summary;
        summary.layer = layer.name;
        try {
            harvestInto(layer, summary);
        } catch (const HarvestError &e) {
            recover(layer, summary, e.kind(), e.what());
        } catch (const std::exception &e) {
            recover(layer, summary, ErrorKind::OutputError, e.what());
        }
        transition(summary, LayerState::Done);
        return summary;
    }

    RunReport Harvester::run(const std::vector<LayerDescriptor> &layers) const {
        RunReport report;
        report.layers.reserve(layers.size());
        if (layers.empty())
            return report;

        std::vector<std::future<HarvestSummary>> pending;
        pending.reserve(layers.size());
        {
            ThreadPool pool(std::min(std::max<std::size_t>(config_.layer_workers, 1), layers.size()));
            for (auto const &layer : layers)
                pending.push_back(pool.enqueue([this, &layer] { return harvestLayer(layer); }));
        }
        for (auto &f : pending)
            report.layers.push_back(f.get());

        log_->info("{} of {} layers usable", report.usable(), report.layers.size());
        return report;
    }

    std::vector<TileJob> Harvester::handoff(const RunReport &report) const {
        std::vector<TileJob> jobs;
        for (auto const &s : report.layers) {
            if (s.usable())
                jobs.push_back(TileJob{s.outputPath, s.layer, config_.min_zoom, config_.max_zoom});
        }
        if (jobs.empty())
            throw HarvestError(ErrorKind::NoUsableData,
                               "none of " + std::to_string(report.layers.size()) + " layers produced usable data");
        return jobs;
    }

    std::ostream &operator<<(std::ostream &os, RunReport const &report) {
        os << std::left << std::setw(16) << "LAYER" << std::setw(22) << "STATE" << std::setw(10) << "FEATURES"
           << std::setw(10) << "COMPLETE" << std::setw(10) << "FALLBACK" << "ERROR\n";
        for (auto const &s : report.layers) {
            os << std::left << std::setw(16) << s.layer << std::setw(22) << toString(s.outcome) << std::setw(10)
               << s.featureCount << std::setw(10) << (s.complete ? "yes" : "no") << std::setw(10)
               << (s.fallbackSubstituted ? "yes" : "no") << (s.error ? toString(*s.error) : "-") << "\n";
        }
        return os;
    }

} // namespace geoharvest
