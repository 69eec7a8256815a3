#pragma once

#include "export.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace svcloc::log {

/// Name under which the default logger is looked up in (or added to)
/// spdlog's registry.
inline constexpr const char* logger_name = "svcloc";

/// Logger used by the library.  On first use an existing spdlog logger named
/// "svcloc" is reused; otherwise a stderr color logger at level `warn` is
/// created.
SVCLOC_EXPORT std::shared_ptr<spdlog::logger> logger();

/// Route library logging to `logger`.  Passing nullptr restores the default.
SVCLOC_EXPORT void set_logger(std::shared_ptr<spdlog::logger> logger);

/// Shorthand for `logger()->set_level(level)`.
SVCLOC_EXPORT void set_level(spdlog::level::level_enum level);

} // namespace svcloc::log
