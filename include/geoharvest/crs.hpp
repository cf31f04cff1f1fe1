#pragma once

#include "geoharvest/log.hpp"
#include "geoharvest/transport.hpp"
#include "geoharvest/types.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace geoharvest {

    enum class CrsSource { Declared, Probed, Default };

    const char *toString(CrsSource source);

    struct ResolvedCrs {
        std::string code; // "EPSG:<id>"
        CrsSource source = CrsSource::Default;
    };

    // Esri Web Mercator ids (102100, 102113, 900913) -> EPSG:3857, anything else -> EPSG:<wkid>
    std::optional<std::string> wkidToEpsg(std::int64_t wkid);

    // Numeric part of an "EPSG:<id>" code
    std::optional<int> epsgNumber(const std::string &crs);

    // Layer metadata endpoint: the query URL without its trailing "/query"
    std::string metadataUrl(const std::string &queryUrl);

    // Reads extent.spatialReference or spatialReference (latestWkid before wkid).
    // Throws HarvestError(CRSProbeFailure).
    std::string parseSpatialReference(const std::string &body);

    class CrsResolver {
      private:
        std::shared_ptr<Transport> transport_;
        std::string defaultCrs_;
        std::chrono::milliseconds timeout_;
        Logger log_;

      public:
        CrsResolver(std::shared_ptr<Transport> transport, std::string defaultCrs, std::chrono::milliseconds timeout,
                    Logger log);

        // Declared CRS, then metadata probe, then the default. Never throws for a failed probe.
        ResolvedCrs resolve(const LayerDescriptor &layer) const;

        // Throws HarvestError(CRSProbeFailure)
        std::string probe(const LayerDescriptor &layer) const;

        const std::string &defaultCrs() const { return defaultCrs_; }
    };

} // namespace geoharvest
