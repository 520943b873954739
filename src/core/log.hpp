#pragma once

#include <filesystem>
#include <spdlog/spdlog.h>

namespace vinyl::log {

/// Initialize logging with console + file sinks.
/// An empty path disables the file sink.
void init(const std::filesystem::path& log_file = "vinylbake.log",
          spdlog::level::level_enum level = spdlog::level::info);

/// Flush and shutdown logging.
void shutdown();

} // namespace vinyl::log
