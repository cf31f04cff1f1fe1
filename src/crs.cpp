#include "geoharvest/crs.hpp"
#include "geoharvest/error.hpp"
#include "geoharvest/transform.hpp"

#include <boost/json.hpp>
#include <charconv>

namespace geoharvest {

    namespace {
        std::optional<std::int64_t> readWkid(const boost::json::value &sr) {
            if (!sr.is_object())
                return std::nullopt;
            auto const &obj = sr.as_object();
            for (const char *key : {"latestWkid", "wkid"}) {
                if (obj.contains(key) && obj.at(key).is_number())
                    return static_cast<std::int64_t>(boost::json::value_to<double>(obj.at(key)));
            }
            return std::nullopt;
        }
    } // namespace

    const char *toString(CrsSource source) {
        switch (source) {
        case CrsSource::Declared:
            return "declared";
        case CrsSource::Probed:
            return "probed";
        case CrsSource::Default:
            return "default";
        }
        return "unknown";
    }

    std::optional<std::string> wkidToEpsg(std::int64_t wkid) {
        if (wkid <= 0)
            return std::nullopt;
        if (wkid == 102100 || wkid == 102113 || wkid == 900913)
            return std::string("EPSG:3857");
        return "EPSG:" + std::to_string(wkid);
    }

    std::optional<int> epsgNumber(const std::string &crs) {
        auto c = canonicalCrs(crs);
        const std::string prefix = "EPSG:";
        if (c.compare(0, prefix.size(), prefix) != 0)
            return std::nullopt;
        int value = 0;
        auto const *first = c.data() + prefix.size();
        auto const *last = c.data() + c.size();
        auto [ptr, ec] = std::from_chars(first, last, value);
        if (ec != std::errc() || ptr != last || value <= 0)
            return std::nullopt;
        return value;
    }

    std::string metadataUrl(const std::string &queryUrl) {
        std::string url = queryUrl;
        auto q = url.find('?');
        if (q != std::string::npos)
            url.erase(q);
        while (!url.empty() && url.back() == '/')
            url.pop_back();
        const std::string suffix = "/query";
        if (url.size() >= suffix.size() && url.compare(url.size() - suffix.size(), suffix.size(), suffix) == 0)
            url.erase(url.size() - suffix.size());
        return url;
    }

    std::string parseSpatialReference(const std::string &body) {
        boost::json::error_code ec;
        auto j = boost::json::parse(body, ec);
        if (ec || !j.is_object())
            throw HarvestError(ErrorKind::CRSProbeFailure, "metadata response is not a JSON object");
        auto const &obj = j.as_object();

        std::optional<std::int64_t> wkid;
        if (obj.contains("extent") && obj.at("extent").is_object()) {
            auto const &extent = obj.at("extent").as_object();
            if (extent.contains("spatialReference"))
                wkid = readWkid(extent.at("spatialReference"));
        }
        if (!wkid && obj.contains("spatialReference"))
            wkid = readWkid(obj.at("spatialReference"));
        if (!wkid)
            throw HarvestError(ErrorKind::CRSProbeFailure, "metadata has no spatialReference wkid");

        auto code = wkidToEpsg(*wkid);
        if (!code)
            throw HarvestError(ErrorKind::CRSProbeFailure, "unusable wkid " + std::to_string(*wkid));
        return *code;
    }

    CrsResolver::CrsResolver(std::shared_ptr<Transport> transport, std::string defaultCrs,
                             std::chrono::milliseconds timeout, Logger log)
        : transport_(std::move(transport)), defaultCrs_(canonicalCrs(defaultCrs)), timeout_(timeout),
          log_(log ? std::move(log) : nullLogger()) {}

    std::string CrsResolver::probe(const LayerDescriptor &layer) const {
        auto url = metadataUrl(layer.url);
        auto response = transport_->get(url, {{"f", "json"}}, timeout_);
        if (response.transportFailed())
            throw HarvestError(ErrorKind::CRSProbeFailure, "metadata request failed: " + response.error);
        if (response.status < 200 || response.status >= 300)
            throw HarvestError(ErrorKind::CRSProbeFailure,
                               "metadata request returned HTTP " + std::to_string(response.status));
        return parseSpatialReference(response.body);
    }

    ResolvedCrs CrsResolver::resolve(const LayerDescriptor &layer) const {
        if (layer.crs && !layer.crs->empty()) {
            auto code = canonicalCrs(*layer.crs);
            log_->info("[{}] source CRS {} (declared)", layer.name, code);
            return {code, CrsSource::Declared};
        }

        try {
            auto code = probe(layer);
            log_->info("[{}] source CRS {} (probed {})", layer.name, code, metadataUrl(layer.url));
            return {code, CrsSource::Probed};
        } catch (const HarvestError &e) {
            log_->warn("[{}] {}: {}; assuming {}", layer.name, toString(e.kind()), e.what(), defaultCrs_);
        }
        return {defaultCrs_, CrsSource::Default};
    }

} // namespace geoharvest
