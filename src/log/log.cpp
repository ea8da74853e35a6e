#include "vdl/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace vdl {

namespace {

const char* kMainLogger = "vdl";
const char* kSecurityLogger = "security";
const char* kDownloadLogger = "download";

std::shared_ptr<spdlog::logger> get_or_create(const char* name) {
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    try {
        return spdlog::stderr_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // Registered concurrently by another thread
        return spdlog::get(name);
    }
}

} // namespace

void init_logging(const LoggingSettings& settings) {
    auto main = get_or_create(kMainLogger);
    spdlog::set_default_logger(main);
    set_log_level(settings.level);

    if (!settings.log_security_events) {
        security_logger()->set_level(spdlog::level::off);
    }
    if (!settings.log_downloads) {
        download_logger()->set_level(spdlog::level::off);
    }
}

void set_log_level(const std::string& level) {
    // from_str maps unknown names to off; fall back to info instead
    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }

    get_or_create(kMainLogger)->set_level(lvl);
    security_logger()->set_level(lvl);
    download_logger()->set_level(lvl);
}

std::shared_ptr<spdlog::logger> security_logger() {
    return get_or_create(kSecurityLogger);
}

std::shared_ptr<spdlog::logger> download_logger() {
    return get_or_create(kDownloadLogger);
}

} // namespace vdl
