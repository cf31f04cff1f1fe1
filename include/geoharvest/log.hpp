#pragma once

#include <spdlog/logger.h>

#include <filesystem>
#include <memory>
#include <string>

namespace geoharvest {

    using Logger = std::shared_ptr<spdlog::logger>;

    // Colored stdout plus an append-only run log. Both sinks are the mutex-guarded variants so
    // layers running on different threads serialize their writes. An empty logFile skips the file.
    Logger makeLogger(const std::string &name, const std::filesystem::path &logFile,
                      spdlog::level::level_enum level = spdlog::level::info);

    // Logger that drops everything; used when a component is built without one
    Logger nullLogger();

} // namespace geoharvest
