#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace codebox::util {

// Install the stderr logger as spdlog's default. stdout belongs to the protocol.
void init_logger(spdlog::level::level_enum level = spdlog::level::info);

void set_log_level(spdlog::level::level_enum level);

// Parse "debug", "info", "warn", ... Unknown names fall back to info.
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace codebox::util
