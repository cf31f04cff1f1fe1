#include "geoharvest/geoharvest.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace geoharvest {

    std::string isoTimestamp(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

    FeatureCollection read(const std::filesystem::path &file) { return ReadFeatureCollection(file); }

    void write(const FeatureCollection &fc, const std::filesystem::path &outPath) {
        WriteFeatureCollection(fc, outPath);
    }

} // namespace geoharvest
