#include "logging.hpp"

#include <swarmkad/config/config.hpp>

namespace swarmkad
{
    void configure_logging(const LoggingConfig& conf)
    {
        auto log_type = conf.type;

        if (log_type == log::Type::File && (conf.file == "stdout" || conf.file == "-" || conf.file.empty()))
            log_type = log::Type::Print;

        log::reset_level(conf.level);

        log::clear_sinks();
        log::add_sink(log_type, log_type == log::Type::System ? "swarmkad" : conf.file);

        log::debug(util_cat, "Logging configured");
    }
}  // namespace swarmkad
