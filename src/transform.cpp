#include "geoharvest/transform.hpp"
#include "geoharvest/crs.hpp"
#include "geoharvest/error.hpp"

#include <proj.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <sstream>

namespace geoharvest {

    namespace {
        bool startsWith(const std::string &s, const std::string &prefix) {
            return s.compare(0, prefix.size(), prefix) == 0;
        }

        bool allDigits(const std::string &s) {
            return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
        }

        std::optional<std::int64_t> authorityNumber(const std::string &s, const std::string &authority) {
            if (!startsWith(s, authority))
                return std::nullopt;
            auto number = s.substr(authority.size());
            if (!allDigits(number))
                return std::nullopt;
            std::int64_t value = 0;
            auto [ptr, ec] = std::from_chars(number.data(), number.data() + number.size(), value);
            if (ec != std::errc() || ptr != number.data() + number.size())
                return std::nullopt;
            return value;
        }
    } // namespace

    void Transform::ContextDeleter::operator()(pj_ctx *ctx) const {
        if (ctx)
            proj_context_destroy(ctx);
    }

    void Transform::ProjDeleter::operator()(PJconsts *pj) const {
        if (pj)
            proj_destroy(pj);
    }

    std::string canonicalCrs(const std::string &crs) {
        auto begin = std::find_if_not(crs.begin(), crs.end(), [](unsigned char c) { return std::isspace(c); });
        auto end = std::find_if_not(crs.rbegin(), crs.rend(), [](unsigned char c) { return std::isspace(c); }).base();
        std::string s = begin < end ? std::string(begin, end) : std::string();
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });

        // urn:ogc:def:crs:EPSG::3857, urn:ogc:def:crs:EPSG:6.3:3857, http://www.opengis.net/def/crs/EPSG/0/3857
        for (const char *prefix : {"URN:OGC:DEF:CRS:EPSG:", "HTTP://WWW.OPENGIS.NET/DEF/CRS/EPSG/"}) {
            if (startsWith(s, prefix)) {
                s = "EPSG:" + s.substr(s.find_last_of(":/") + 1);
                break;
            }
        }
        if (allDigits(s))
            s = "EPSG:" + s;
        if (s == "WGS84" || s == "WGS 84" || s == "CRS:84" || s == "OGC:CRS84" ||
            s == "URN:OGC:DEF:CRS:OGC:1.3:CRS84" || s == "HTTP://WWW.OPENGIS.NET/DEF/CRS/OGC/1.3/CRS84")
            return "EPSG:4326";

        // EPSG:<wkid> and the Esri Web Mercator ids go through the same wkid table as probed metadata
        if (auto wkid = authorityNumber(s, "EPSG:")) {
            if (auto code = wkidToEpsg(*wkid))
                return *code;
        } else if (auto esri = authorityNumber(s, "ESRI:")) {
            auto code = wkidToEpsg(*esri);
            if (code && *code == "EPSG:3857")
                return *code;
        }
        return s;
    }

    bool isWgs84(const std::string &crs) { return canonicalCrs(crs) == "EPSG:4326"; }

    bool inWgs84Range(const dp::Point &p) {
        return std::isfinite(p.x) && std::isfinite(p.y) && p.x >= -180.0 && p.x <= 180.0 && p.y >= -90.0 &&
               p.y <= 90.0;
    }

    Transform::Transform(const std::string &sourceCrs) : source_(canonicalCrs(sourceCrs)) {
        if (source_.empty())
            throw HarvestError(ErrorKind::ReprojectionError, "Transform: empty source CRS");
        if (source_ == "EPSG:4326")
            return;

        ctx_.reset(proj_context_create());
        if (!ctx_)
            throw HarvestError(ErrorKind::ReprojectionError, "Transform: proj_context_create failed");

        PJ *raw = proj_create_crs_to_crs(ctx_.get(), source_.c_str(), "EPSG:4326", nullptr);
        if (!raw) {
            int err = proj_context_errno(ctx_.get());
            throw HarvestError(ErrorKind::ReprojectionError, "Transform: cannot build " + source_ +
                                                                 " -> EPSG:4326: " +
                                                                 proj_context_errno_string(ctx_.get(), err));
        }

        // lon/lat axis order regardless of the authority definition
        PJ *normalized = proj_normalize_for_visualization(ctx_.get(), raw);
        proj_destroy(raw);
        if (!normalized)
            throw HarvestError(ErrorKind::ReprojectionError, "Transform: cannot normalize " + source_ + " axis order");
        pj_.reset(normalized);
    }

    dp::Point Transform::apply(const dp::Point &p, bool forward) const {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            throw HarvestError(ErrorKind::ReprojectionError, "Transform: non-finite coordinate");
        }
        if (!pj_)
            return dp::Point{p.x, p.y, 0.0};

        proj_errno_reset(pj_.get());
        PJ_COORD out = proj_trans(pj_.get(), forward ? PJ_FWD : PJ_INV, proj_coord(p.x, p.y, 0, 0));
        int err = proj_errno(pj_.get());
        if (err != 0 || !std::isfinite(out.xy.x) || !std::isfinite(out.xy.y)) {
            std::ostringstream oss;
            oss << "Transform: " << source_ << (forward ? " -> " : " <- ") << "EPSG:4326 failed for (" << p.x << ","
                << p.y << ")";
            if (err != 0)
                oss << ": " << proj_context_errno_string(ctx_.get(), err);
            throw HarvestError(ErrorKind::ReprojectionError, oss.str());
        }
        return dp::Point{out.xy.x, out.xy.y, 0.0};
    }

    dp::Point Transform::forward(const dp::Point &p) const { return apply(p, true); }

    dp::Point Transform::inverse(const dp::Point &p) const { return apply(p, false); }

} // namespace geoharvest
