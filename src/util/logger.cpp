#include "util/logger.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace codebox::util {

void init_logger(spdlog::level::level_enum level) {
    auto console = spdlog::get("codebox");
    if (!console) {
        console = spdlog::stderr_color_mt("codebox");
    }
    spdlog::set_default_logger(console);
    spdlog::set_level(level);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace codebox::util
