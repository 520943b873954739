#include "core/log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace vinyl::log {

void init(const std::filesystem::path& log_file,
          spdlog::level::level_enum level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(
            log_file.string(), true));
    }

    auto logger =
        std::make_shared<spdlog::logger>("vinyl", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    logger->set_level(level);

    spdlog::set_default_logger(logger);
    spdlog::debug("vinylbake v0.1.0");
}

void shutdown() {
    spdlog::shutdown();
}

} // namespace vinyl::log
