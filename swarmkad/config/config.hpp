#pragma once

#include "ini.hpp"

#include <swarmkad/util/formattable.hpp>
#include <swarmkad/util/fs.hpp>
#include <swarmkad/util/logging.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace swarmkad
{
    enum class RandomSource
    {
        system,
        seeded,
    };

    RandomSource random_source_from_string(std::string_view str);

    std::string_view ToString(RandomSource src);

    template <>
    inline constexpr bool IsToStringFormattable<RandomSource> = true;

    /// [kademlia] section
    struct KademliaConfig
    {
        RandomSource random_source = RandomSource::system;
        uint64_t seed = 0;

        void load(const ConfigParser::SectionValues& values);
    };

    /// [logging] section
    struct LoggingConfig
    {
        log::Type type = log::Type::Print;
        log::Level level = log::Level::info;
        std::string file;

        void load(const ConfigParser::SectionValues& values);
    };

    struct Config
    {
        KademliaConfig kademlia;
        LoggingConfig logging;

        /// Loads an ini file.  Throws std::runtime_error if the file cannot be read or parsed and
        /// std::invalid_argument for a bad value or an unknown key in a known section.  Missing
        /// sections and keys keep their defaults.
        void load(const fs::path& fname);

        void load_string(std::string_view ini);

       private:
        void load_parser(const ConfigParser& parser);
    };
}  // namespace swarmkad
