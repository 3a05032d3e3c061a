#include "config.hpp"

#include <swarmkad/util/str.hpp>

#include <fmt/format.h>

#include <stdexcept>

namespace swarmkad
{
    static auto logcat = log::Cat("config");

    RandomSource random_source_from_string(std::string_view str)
    {
        const auto lower = lowercase_ascii_string(std::string{str});
        if (lower == "system")
            return RandomSource::system;
        if (lower == "seeded")
            return RandomSource::seeded;
        throw std::invalid_argument{fmt::format("'{}' is not a valid random source", str)};
    }

    std::string_view ToString(RandomSource src)
    {
        switch (src)
        {
            case RandomSource::system:
                return "system";
            case RandomSource::seeded:
                return "seeded";
        }
        return "[unknown random source]";
    }

    void KademliaConfig::load(const ConfigParser::SectionValues& values)
    {
        for (const auto& [key, value] : values)
        {
            if (key == "random-source")
                random_source = random_source_from_string(value);
            else if (key == "seed")
            {
                if (not parse_int(value, seed))
                    throw std::invalid_argument{fmt::format("[kademlia]:seed: '{}' is not an unsigned integer", value)};
            }
            else
                throw std::invalid_argument{fmt::format("unknown config option [kademlia]:{}", key)};
        }
    }

    void LoggingConfig::load(const ConfigParser::SectionValues& values)
    {
        for (const auto& [key, value] : values)
        {
            if (key == "type")
                type = log::type_from_string(lowercase_ascii_string(value));
            else if (key == "level")
                level = log::level_from_string(lowercase_ascii_string(value));
            else if (key == "file")
                file = value;
            else
                throw std::invalid_argument{fmt::format("unknown config option [logging]:{}", key)};
        }
    }

    void Config::load(const fs::path& fname)
    {
        ConfigParser parser;
        if (not parser.load_file(fname))
            throw std::runtime_error{fmt::format("failed to load config file {}", fname.string())};
        load_parser(parser);
    }

    void Config::load_string(std::string_view ini)
    {
        ConfigParser parser;
        if (not parser.load_from_str(ini))
            throw std::runtime_error{"failed to parse config"};
        load_parser(parser);
    }

    void Config::load_parser(const ConfigParser& parser)
    {
        if (not parser.visit_section("kademlia", [this](const auto& values) {
                kademlia.load(values);
                return true;
            }))
            log::debug(logcat, "No [kademlia] section, using defaults");

        if (not parser.visit_section("logging", [this](const auto& values) {
                logging.load(values);
                return true;
            }))
            log::debug(logcat, "No [logging] section, using defaults");

        parser.iter_all_sections([](std::string_view name, const auto&) {
            if (name != "kademlia" and name != "logging")
                log::warning(logcat, "Ignoring unknown config section [{}]", name);
        });

        log::debug(logcat, "Loaded config: random-source={}, seed={}", kademlia.random_source, kademlia.seed);
    }
}  // namespace swarmkad
