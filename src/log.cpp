#include "svcloc/log.hpp"

#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace svcloc::log {

namespace {

std::mutex& logger_mutex() {
    static std::mutex m;
    return m;
}

std::shared_ptr<spdlog::logger>& logger_slot() {
    static std::shared_ptr<spdlog::logger> slot;
    return slot;
}

std::shared_ptr<spdlog::logger> make_default_logger() {
    if (auto existing = spdlog::get(logger_name)) {
        return existing;
    }
    // Not registered in spdlog's registry: a host that later creates its own
    // "svcloc" logger must not collide with ours.
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto created = std::make_shared<spdlog::logger>(logger_name, std::move(sink));
    created->set_level(spdlog::level::warn);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard lock(logger_mutex());
    auto& slot = logger_slot();
    if (!slot) {
        slot = make_default_logger();
    }
    return slot;
}

void set_logger(std::shared_ptr<spdlog::logger> logger) {
    std::lock_guard lock(logger_mutex());
    logger_slot() = std::move(logger);
}

void set_level(spdlog::level::level_enum level) {
    logger()->set_level(level);
}

} // namespace svcloc::log
