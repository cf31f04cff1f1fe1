#include "geoharvest/assembler.hpp"
#include "geoharvest/error.hpp"
#include "geoharvest/writer.hpp"

namespace geoharvest {

    std::filesystem::path layerOutputPath(const std::filesystem::path &outputDir, const std::string &layer) {
        return outputDir / (layer + ".geojson");
    }

    FeatureCollection buildCollection(const LayerDescriptor &layer, const ResolvedCrs &crs, NormalizeResult normalized,
                                      const LayerFetch &fetch, const std::string &fetchedAt) {
        FeatureCollection fc;
        fc.provenance.layer = layer.name;
        fc.provenance.source_crs = crs.code;
        fc.provenance.endpoint = layer.url;
        fc.provenance.fetched_at = fetchedAt;
        fc.provenance.complete = fetch.complete();
        fc.provenance.drops = normalized.stats;
        fc.features = std::move(normalized.features);
        fc.global_properties["crs_source"] = toString(crs.source);
        return fc;
    }

    Assembly assemble(const LayerDescriptor &layer, const ResolvedCrs &crs, NormalizeResult normalized,
                      const LayerFetch &fetch, const std::filesystem::path &outputDir, const std::string &fetchedAt,
                      const Logger &log) {
        Assembly out;
        out.collection = buildCollection(layer, crs, std::move(normalized), fetch, fetchedAt);
        if (out.collection.features.empty()) {
            out.status = AssemblyStatus::Empty;
            return out;
        }

        auto path = layerOutputPath(outputDir, layer.name);
        try {
            std::filesystem::create_directories(outputDir);
            WriteFeatureCollection(out.collection, path);
        } catch (const std::exception &e) {
            throw HarvestError(ErrorKind::OutputError, "cannot write " + path.string() + ": " + e.what());
        }

        out.status = AssemblyStatus::Assembled;
        out.path = std::move(path);
        if (log) {
            auto const &drops = out.collection.provenance.drops;
            log->info("[{}] wrote {} features to {} (complete={}, dropped {} decode / {} reprojection)", layer.name,
                      out.collection.features.size(), out.path.string(), out.collection.provenance.complete,
                      drops.decode_drops, drops.reprojection_drops);
        }
        return out;
    }

} // namespace geoharvest
