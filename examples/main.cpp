#include "geoharvest/geoharvest.hpp"

#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>

namespace {
    void usage(const char *prog) {
        std::cerr << "usage: " << prog
                  << " [--config FILE] [--output DIR] [--fallback DIR] [--log FILE] [--no-tiles] [--verbose]\n";
    }
} // namespace

int main(int argc, char **argv) {
    std::string configFile;
    std::string outputDir;
    std::string fallbackDir;
    std::string logFile;
    bool tiles = true;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        auto needsValue = [&](const char *flag) {
            if (i + 1 >= argc) {
                std::cerr << "ERROR: " << flag << " needs a value\n";
                usage(argv[0]);
                std::exit(1);
            }
            return std::string(argv[++i]);
        };
        if (std::strcmp(argv[i], "--config") == 0)
            configFile = needsValue("--config");
        else if (std::strcmp(argv[i], "--output") == 0)
            outputDir = needsValue("--output");
        else if (std::strcmp(argv[i], "--fallback") == 0)
            fallbackDir = needsValue("--fallback");
        else if (std::strcmp(argv[i], "--log") == 0)
            logFile = needsValue("--log");
        else if (std::strcmp(argv[i], "--no-tiles") == 0)
            tiles = false;
        else if (std::strcmp(argv[i], "--verbose") == 0)
            verbose = true;
        else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            usage(argv[0]);
            return 0;
        } else {
            std::cerr << "ERROR: unknown argument " << argv[i] << "\n";
            usage(argv[0]);
            return 1;
        }
    }

    geoharvest::HarvestConfig cfg;
    try {
        if (!configFile.empty())
            cfg = geoharvest::readConfig(configFile);
        else
            cfg.layers = geoharvest::defaultCatalog(cfg.fallback_dir);
    } catch (const geoharvest::HarvestError &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    if (!outputDir.empty())
        cfg.output_dir = outputDir;
    if (!fallbackDir.empty())
        geoharvest::setFallbackDir(cfg, fallbackDir);
    if (!logFile.empty())
        cfg.log_file = logFile;

    try {
        auto log = geoharvest::makeLogger("geoharvest", cfg.log_file,
                                          verbose ? spdlog::level::debug : spdlog::level::info);
        log->info("=== harvest of {} layers started ===", cfg.layers.size());

        geoharvest::Harvester harvester(cfg, std::make_shared<geoharvest::CurlTransport>(), log);
        auto report = harvester.run();
        std::cout << report;

        auto jobs = harvester.handoff(report);
        if (tiles) {
            geoharvest::CommandTileBuilder builder(cfg.tiles_dir, log);
            auto built = geoharvest::buildTiles(builder, jobs);
            log->info("tiles generated for {} of {} layers in {}", built.size(), jobs.size(), cfg.tiles_dir.string());
        }
        log->info("=== harvest finished: {} of {} layers usable ===", report.usable(), report.layers.size());
    } catch (const geoharvest::HarvestError &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    } catch (const std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
