#pragma once

#include "geoharvest/types.hpp"

#include <memory>
#include <string>

struct pj_ctx;
struct PJconsts;

namespace geoharvest {

    // "EPSG:4326", "epsg:4326", "WGS84", "CRS:84", "OGC:CRS84" -> "EPSG:4326". OGC URN/URL forms of an EPSG
    // code become "EPSG:<id>", and the Esri Web Mercator ids (ESRI:102100, EPSG:900913, ...) become "EPSG:3857".
    // Other strings are upper-cased and trimmed.
    std::string canonicalCrs(const std::string &crs);

    bool isWgs84(const std::string &crs);

    // Source CRS -> WGS84 (lon, lat), built once per layer and used from one thread.
    // Throws HarvestError(ReprojectionError) when PROJ cannot build the operation.
    class Transform {
      private:
        struct ContextDeleter {
            void operator()(pj_ctx *ctx) const;
        };
        struct ProjDeleter {
            void operator()(PJconsts *pj) const;
        };

        std::string source_;
        std::unique_ptr<pj_ctx, ContextDeleter> ctx_;
        std::unique_ptr<PJconsts, ProjDeleter> pj_;

        dp::Point apply(const dp::Point &p, bool forward) const;

      public:
        explicit Transform(const std::string &sourceCrs);

        Transform(Transform &&) noexcept = default;
        Transform &operator=(Transform &&) = delete;

        const std::string &source() const { return source_; }
        bool isIdentity() const { return !pj_; }

        // Throws HarvestError(ReprojectionError) on non-finite input or a failed transformation
        dp::Point forward(const dp::Point &p) const;
        dp::Point inverse(const dp::Point &p) const;
    };

    bool inWgs84Range(const dp::Point &p);

} // namespace geoharvest
