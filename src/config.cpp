#include "geoharvest/config.hpp"
#include "geoharvest/crs.hpp"
#include "geoharvest/error.hpp"
#include "geoharvest/planner.hpp"

#include <boost/json.hpp>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace geoharvest {

    namespace {
        using json = boost::json::value;

        std::string getString(const boost::json::object &obj, const char *key, const std::string &fallback) {
            if (!obj.contains(key))
                return fallback;
            auto const &v = obj.at(key);
            if (!v.is_string())
                throw HarvestError(ErrorKind::ConfigError, std::string("config: '") + key + "' must be a string");
            return std::string(v.as_string());
        }

        double getNumber(const boost::json::object &obj, const char *key, double fallback) {
            if (!obj.contains(key))
                return fallback;
            auto const &v = obj.at(key);
            if (!v.is_number())
                throw HarvestError(ErrorKind::ConfigError, std::string("config: '") + key + "' must be a number");
            return boost::json::value_to<double>(v);
        }

        std::size_t getCount(const boost::json::object &obj, const char *key, std::size_t fallback) {
            double d = getNumber(obj, key, static_cast<double>(fallback));
            if (d < 1.0)
                throw HarvestError(ErrorKind::ConfigError, std::string("config: '") + key + "' must be >= 1");
            return static_cast<std::size_t>(d);
        }

        BBox parseBBox(const json &v, const std::string &layer) {
            if (!v.is_array() || v.as_array().size() != 4)
                throw HarvestError(ErrorKind::ConfigError,
                                   "config: layer '" + layer + "' bbox must be [xmin,ymin,xmax,ymax]");
            auto const &a = v.as_array();
            for (auto const &n : a) {
                if (!n.is_number())
                    throw HarvestError(ErrorKind::ConfigError, "config: layer '" + layer + "' bbox must be numeric");
            }
            return BBox{boost::json::value_to<double>(a[0]), boost::json::value_to<double>(a[1]),
                        boost::json::value_to<double>(a[2]), boost::json::value_to<double>(a[3])};
        }

        LayerDescriptor parseLayer(const json &v, const std::filesystem::path &fallbackDir) {
            if (!v.is_object())
                throw HarvestError(ErrorKind::ConfigError, "config: every layer must be an object");
            auto const &obj = v.as_object();

            LayerDescriptor layer;
            layer.name = getString(obj, "name", "");
            layer.url = getString(obj, "url", "");
            if (obj.contains("bbox") && !obj.at("bbox").is_null())
                layer.bbox = parseBBox(obj.at("bbox"), layer.name);
            if (obj.contains("crs") && !obj.at("crs").is_null())
                layer.crs = getString(obj, "crs", "");
            auto fallback = getString(obj, "fallback", "");
            layer.fallback = fallback.empty() ? fallbackDir / (layer.name + ".geojson") : fallback;
            return layer;
        }
    } // namespace

    std::vector<LayerDescriptor> defaultCatalog(const std::filesystem::path &fallbackDir) {
        std::vector<LayerDescriptor> layers;
        layers.push_back(LayerDescriptor{
            "WV_wells", "https://tagis.dep.wv.gov/arcgis/rest/services/WVDEP_enterprise/oil_gas/MapServer/0/query",
            BBox{-82.8, 37.0, -77.7, 40.6}, std::nullopt, fallbackDir / "WV_wells.geojson"});
        layers.push_back(LayerDescriptor{
            "OH_parcels", "https://geo.oit.ohio.gov/arcgis/rest/services/Statewide/Parcels/MapServer/0/query",
            BBox{-84.8, 38.3, -80.5, 42.0}, std::nullopt, fallbackDir / "OH_parcels.geojson"});
        layers.push_back(LayerDescriptor{"TX_parcels",
                                         "https://feature.geographic.texas.gov/arcgis/rest/services/Parcels/"
                                         "stratmap25_land_parcels_48/MapServer/0/query",
                                         BBox{-106.7, 25.7, -93.5, 36.6}, std::nullopt,
                                         fallbackDir / "TX_parcels.geojson"});
        return layers;
    }

    void validateCatalog(const std::vector<LayerDescriptor> &layers) {
        std::unordered_set<std::string> seen;
        for (auto const &layer : layers) {
            if (layer.name.empty())
                throw HarvestError(ErrorKind::ConfigError, "config: layer without a name");
            if (!seen.insert(layer.name).second)
                throw HarvestError(ErrorKind::ConfigError, "config: duplicate layer name '" + layer.name + "'");
            if (layer.url.empty())
                throw HarvestError(ErrorKind::ConfigError, "config: layer '" + layer.name + "' has no url");
            if (layer.bbox && !isValidBBox(*layer.bbox))
                throw HarvestError(ErrorKind::ConfigError, "config: layer '" + layer.name + "' has an invalid bbox");
            // the query asks the server for outSR=<EPSG id>, so the declared CRS must name one
            if (layer.crs && !layer.crs->empty() && !epsgNumber(*layer.crs))
                throw HarvestError(ErrorKind::ConfigError,
                                   "config: layer '" + layer.name + "' crs '" + *layer.crs + "' has no EPSG code");
        }
    }

    HarvestConfig parseConfig(const std::string &text) {
        boost::json::error_code ec;
        json j = boost::json::parse(text, ec);
        if (ec)
            throw HarvestError(ErrorKind::ConfigError, "config: invalid JSON: " + ec.message());
        if (!j.is_object())
            throw HarvestError(ErrorKind::ConfigError, "config: top-level value must be an object");
        auto const &obj = j.as_object();

        HarvestConfig cfg;
        cfg.output_dir = getString(obj, "output_dir", cfg.output_dir.string());
        cfg.tiles_dir = getString(obj, "tiles_dir", cfg.tiles_dir.string());
        cfg.fallback_dir = getString(obj, "fallback_dir", cfg.fallback_dir.string());
        cfg.log_file = getString(obj, "log_file", cfg.log_file.string());

        if (obj.contains("grid")) {
            auto const &g = obj.at("grid");
            if (!g.is_array() || g.as_array().size() != 2 || !g.as_array()[0].is_number() ||
                !g.as_array()[1].is_number())
                throw HarvestError(ErrorKind::ConfigError, "config: 'grid' must be [rows, cols]");
            double rows = boost::json::value_to<double>(g.as_array()[0]);
            double cols = boost::json::value_to<double>(g.as_array()[1]);
            if (rows < 1.0 || cols < 1.0)
                throw HarvestError(ErrorKind::ConfigError, "config: 'grid' divisions must be >= 1");
            cfg.grid_rows = static_cast<std::size_t>(rows);
            cfg.grid_cols = static_cast<std::size_t>(cols);
        }

        auto seconds = [&](const char *key, std::chrono::milliseconds current) {
            double s = getNumber(obj, key, current.count() / 1000.0);
            if (s < 0.0)
                throw HarvestError(ErrorKind::ConfigError, std::string("config: '") + key + "' must be >= 0");
            return std::chrono::milliseconds(static_cast<long long>(s * 1000.0));
        };
        cfg.layer_budget = seconds("layer_budget_seconds", cfg.layer_budget);
        cfg.request_timeout = seconds("request_timeout_seconds", cfg.request_timeout);

        double retries = getNumber(obj, "retries", cfg.retries);
        if (retries < 0.0)
            throw HarvestError(ErrorKind::ConfigError, "config: 'retries' must be >= 0");
        cfg.retries = static_cast<int>(retries);
        double backoff = getNumber(obj, "retry_backoff_ms", static_cast<double>(cfg.retry_backoff.count()));
        if (backoff < 0.0)
            throw HarvestError(ErrorKind::ConfigError, "config: 'retry_backoff_ms' must be >= 0");
        cfg.retry_backoff = std::chrono::milliseconds(static_cast<long long>(backoff));

        cfg.page_size = getCount(obj, "page_size", cfg.page_size);
        cfg.max_page_failures = static_cast<int>(getCount(obj, "max_page_failures", cfg.max_page_failures));
        cfg.chunk_workers = getCount(obj, "chunk_workers", cfg.chunk_workers);
        cfg.layer_workers = getCount(obj, "layer_workers", cfg.layer_workers);

        cfg.default_crs = getString(obj, "default_crs", cfg.default_crs);
        if (!epsgNumber(cfg.default_crs))
            throw HarvestError(ErrorKind::ConfigError,
                               "config: 'default_crs' '" + cfg.default_crs + "' has no EPSG code");
        if (obj.contains("axis_swap")) {
            if (!obj.at("axis_swap").is_bool())
                throw HarvestError(ErrorKind::ConfigError, "config: 'axis_swap' must be a boolean");
            cfg.axis_swap = obj.at("axis_swap").as_bool();
        }

        cfg.min_zoom = static_cast<int>(getNumber(obj, "min_zoom", cfg.min_zoom));
        cfg.max_zoom = static_cast<int>(getNumber(obj, "max_zoom", cfg.max_zoom));
        if (cfg.min_zoom < 0 || cfg.min_zoom > cfg.max_zoom)
            throw HarvestError(ErrorKind::ConfigError, "config: zoom range must satisfy 0 <= min_zoom <= max_zoom");

        if (obj.contains("layers")) {
            auto const &layers = obj.at("layers");
            if (!layers.is_array())
                throw HarvestError(ErrorKind::ConfigError, "config: 'layers' must be an array");
            for (auto const &l : layers.as_array())
                cfg.layers.push_back(parseLayer(l, cfg.fallback_dir));
        } else {
            cfg.layers = defaultCatalog(cfg.fallback_dir);
        }
        validateCatalog(cfg.layers);
        return cfg;
    }

    void setFallbackDir(HarvestConfig &cfg, const std::filesystem::path &dir) {
        for (auto &layer : cfg.layers) {
            if (layer.fallback.empty() || layer.fallback == cfg.fallback_dir / (layer.name + ".geojson"))
                layer.fallback = dir / (layer.name + ".geojson");
        }
        cfg.fallback_dir = dir;
    }

    HarvestConfig readConfig(const std::filesystem::path &file) {
        std::ifstream ifs(file);
        if (!ifs)
            throw HarvestError(ErrorKind::ConfigError, "readConfig(): cannot open \"" + file.string() + '\"');
        std::stringstream buffer;
        buffer << ifs.rdbuf();
        return parseConfig(buffer.str());
    }

} // namespace geoharvest
