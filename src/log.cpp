#include "geoharvest/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <vector>

namespace geoharvest {

    Logger makeLogger(const std::string &name, const std::filesystem::path &logFile,
                      spdlog::level::level_enum level) {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!logFile.empty()) {
            if (logFile.has_parent_path())
                std::filesystem::create_directories(logFile.parent_path());
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile.string(), false));
        }

        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
        logger->set_level(level);
        logger->flush_on(spdlog::level::warn);
        return logger;
    }

    Logger nullLogger() {
        auto sink = std::make_shared<spdlog::sinks::null_sink_mt>();
        return std::make_shared<spdlog::logger>("null", sink);
    }

} // namespace geoharvest
