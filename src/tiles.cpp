#include "geoharvest/tiles.hpp"

#include <cerrno>
#include <cstring>
#include <spawn.h>
#include <sys/wait.h>

extern char **environ;

namespace geoharvest {

    CommandTileBuilder::CommandTileBuilder(std::filesystem::path tilesDir, Logger log, std::string program)
        : program_(std::move(program)), tilesDir_(std::move(tilesDir)), log_(log ? std::move(log) : nullLogger()) {}

    std::vector<std::string> CommandTileBuilder::command(const TileJob &job) const {
        return {program_,
                "--output-to-directory",
                (tilesDir_ / job.layer).string(),
                "--layer",
                job.layer,
                "--force",
                "--minimum-zoom=" + std::to_string(job.minZoom),
                "--maximum-zoom=" + std::to_string(job.maxZoom),
                job.geojson.string()};
    }

    bool CommandTileBuilder::build(const TileJob &job) {
        std::error_code ec;
        if (!std::filesystem::exists(job.geojson, ec)) {
            log_->warn("[{}] no GeoJSON at {}, skipping tiles", job.layer, job.geojson.string());
            return false;
        }
        std::filesystem::create_directories(tilesDir_ / job.layer, ec);
        if (ec) {
            log_->warn("[{}] cannot create {}: {}", job.layer, (tilesDir_ / job.layer).string(), ec.message());
            return false;
        }

        auto args = command(job);
        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &a : args)
            argv.push_back(a.data());
        argv.push_back(nullptr);

        pid_t pid = 0;
        int rc = posix_spawnp(&pid, program_.c_str(), nullptr, nullptr, argv.data(), environ);
        if (rc != 0) {
            log_->warn("[{}] cannot start {}: {}", job.layer, program_, std::strerror(rc));
            return false;
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                log_->warn("[{}] waitpid failed: {}", job.layer, std::strerror(errno));
                return false;
            }
        }
        if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
            log_->warn("[{}] {} failed (status {})", job.layer, program_,
                       WIFEXITED(status) ? WEXITSTATUS(status) : -1);
            return false;
        }
        log_->info("[{}] built tiles in {}", job.layer, (tilesDir_ / job.layer).string());
        return true;
    }

    std::vector<std::string> buildTiles(TileBuilder &builder, const std::vector<TileJob> &jobs) {
        std::vector<std::string> built;
        for (auto const &job : jobs) {
            if (builder.build(job))
                built.push_back(job.layer);
        }
        return built;
    }

} // namespace geoharvest
