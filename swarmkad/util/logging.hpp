#pragma once

// Header for making actual log statements such as swarmkad::log::info and so on work.

#include <oxen/log.hpp>

#include <string>
#include <string_view>

namespace swarmkad
{
    namespace log = oxen::log;

    struct LoggingConfig;

    /// Applies the [logging] section: resets the level and replaces all sinks with the configured
    /// one.  `file` is only consulted for log::Type::File; an empty name or "-" means stdout.
    void configure_logging(const LoggingConfig& conf);
}  // namespace swarmkad

namespace
{
    static auto util_cat = swarmkad::log::Cat("swarmkad.util");
}  // namespace
