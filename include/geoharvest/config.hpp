#pragma once

#include "geoharvest/types.hpp"

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace geoharvest {

    struct HarvestConfig {
        std::filesystem::path output_dir = "geojson";
        std::filesystem::path tiles_dir = "tiles";
        std::filesystem::path fallback_dir = "fallback_data";
        std::filesystem::path log_file = "harvest.log";

        std::size_t grid_rows = 5;
        std::size_t grid_cols = 5;

        std::chrono::milliseconds layer_budget{std::chrono::seconds(300)};
        std::chrono::milliseconds request_timeout{std::chrono::seconds(45)};
        int retries = 1;
        std::chrono::milliseconds retry_backoff{2000};

        std::size_t page_size = 1000;
        int max_page_failures = 3;

        std::size_t chunk_workers = 4;
        std::size_t layer_workers = 1;

        std::string default_crs = "EPSG:4326";
        bool axis_swap = false;

        int min_zoom = 4;
        int max_zoom = 14;

        std::vector<LayerDescriptor> layers;
    };

    // The three statewide layers the harvester was built for
    std::vector<LayerDescriptor> defaultCatalog(const std::filesystem::path &fallbackDir);

    // Reads a JSON config/catalog file. Missing keys keep their defaults; a file without
    // "layers" gets the default catalog. Throws HarvestError(ConfigError).
    HarvestConfig readConfig(const std::filesystem::path &file);

    HarvestConfig parseConfig(const std::string &text);

    // Moves fallback_dir; layers whose fallback was derived from the old directory follow it
    void setFallbackDir(HarvestConfig &cfg, const std::filesystem::path &dir);

    // Throws HarvestError(ConfigError) on duplicate/empty names, empty URLs or invalid bboxes
    void validateCatalog(const std::vector<LayerDescriptor> &layers);

} // namespace geoharvest
