#pragma once
#include <string>
#include <optional>
#include <spdlog/spdlog.h>

namespace runbox::util {

// Install the "runbox" default logger (colored stdout, plus a file sink when log_file is set)
void init_logger(spdlog::level::level_enum level = spdlog::level::info,
                 const std::string& log_file = "");

void set_log_level(spdlog::level::level_enum level);

// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
std::optional<spdlog::level::level_enum> log_level_from_string(const std::string& text);

} // namespace runbox::util
