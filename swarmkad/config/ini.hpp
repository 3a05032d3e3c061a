#pragma once

#include <swarmkad/util/fs.hpp>

#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace swarmkad
{
    struct ConfigParser
    {
        using SectionValues = std::unordered_multimap<std::string, std::string>;
        using ConfigMap = std::unordered_map<std::string, SectionValues>;

        /// load config file
        /// return true on success
        /// return false on error
        bool load_file(const fs::path& fname);

        /// load from string
        /// return true on success
        /// return false on error
        bool load_from_str(std::string_view str);

        /// iterate all sections and their values
        void iter_all_sections(std::function<void(std::string_view, const SectionValues&)> visit) const;

        /// visit a section in config read only by name
        /// return false if no section or value propagated from visitor
        bool visit_section(const char* name, std::function<bool(const SectionValues&)> visit) const;

       private:
        bool parse();

        std::string _data;
        ConfigMap _config;
        fs::path _filename;
    };

}  // namespace swarmkad
