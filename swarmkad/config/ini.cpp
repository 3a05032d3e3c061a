#include "ini.hpp"

#include <swarmkad/util/file.hpp>
#include <swarmkad/util/logging.hpp>

#include <cctype>
#include <iterator>
#include <list>
#include <memory>

namespace swarmkad
{
    static auto logcat = log::Cat("config");

    bool ConfigParser::load_file(const fs::path& fname)
    {
        try
        {
            _data = util::file_to_string(fname);
        }
        catch (const std::exception& e)
        {
            log::warning(logcat, "Failed to read config file {}: {}", fname.string(), e.what());
            return false;
        }
        _filename = fname;
        return parse();
    }

    bool ConfigParser::load_from_str(std::string_view str)
    {
        _data.assign(str.begin(), str.end());
        return parse();
    }

    static bool whitespace(char ch)
    {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    // drops a trailing "# ..." or "; ..." comment; the marker must follow whitespace
    static std::string_view strip_inline_comment(std::string_view v)
    {
        for (size_t i = 1; i < v.size(); ++i)
        {
            if ((v[i] == '#' || v[i] == ';') && whitespace(v[i - 1]))
            {
                v = v.substr(0, i);
                break;
            }
        }
        while (!v.empty() && whitespace(v.back()))
            v.remove_suffix(1);
        return v;
    }

    bool ConfigParser::parse()
    {
        _config.clear();

        std::list<std::string_view> lines;
        {
            auto itr = _data.begin();
            // split into lines
            while (itr != _data.end())
            {
                auto beg = itr;
                while (itr != _data.end() && *itr != '\n' && *itr != '\r')
                    ++itr;
                lines.emplace_back(std::addressof(*beg), std::distance(beg, itr));
                if (itr == _data.end())
                    break;
                ++itr;
            }
        }

        std::string_view sectName;
        size_t lineno = 0;
        for (auto line : lines)
        {
            lineno++;
            // Trim whitespace
            while (!line.empty() && whitespace(line.front()))
                line.remove_prefix(1);
            while (!line.empty() && whitespace(line.back()))
                line.remove_suffix(1);

            // Skip blank lines
            if (line.empty() or line.front() == ';' or line.front() == '#')
                continue;

            if (line.front() == '[' && line.back() == ']')
            {
                // section header
                line.remove_prefix(1);
                line.remove_suffix(1);
                sectName = line;
            }
            else if (auto kvDelim = line.find('='); kvDelim != std::string_view::npos)
            {
                // key value pair
                std::string_view k = line.substr(0, kvDelim);
                std::string_view v = line.substr(kvDelim + 1);
                // Trim inner whitespace
                while (!k.empty() && whitespace(k.back()))
                    k.remove_suffix(1);
                while (!v.empty() && whitespace(v.front()))
                    v.remove_prefix(1);
                v = strip_inline_comment(v);

                if (k.empty())
                {
                    log::error(logcat, "{} invalid line ({}): '{}'", _filename.string(), lineno, line);
                    return false;
                }
                log::trace(logcat, "{}: [{}]:{}={}", _filename.string(), sectName, k, v);
                _config[std::string{sectName}].emplace(k, v);
            }
            else  // malformed?
            {
                log::error(logcat, "{} invalid line ({}): '{}'", _filename.string(), lineno, line);
                return false;
            }
        }
        return true;
    }

    void ConfigParser::iter_all_sections(std::function<void(std::string_view, const SectionValues&)> visit) const
    {
        for (const auto& item : _config)
            visit(item.first, item.second);
    }

    bool ConfigParser::visit_section(const char* name, std::function<bool(const SectionValues& sect)> visit) const
    {
        // _config is effectively:
        // unordered_map< string, unordered_multimap< string, string  >>
        // in human terms: a map of of sections
        //                 where a section is a multimap of k:v pairs
        auto itr = _config.find(name);
        if (itr == _config.end())
            return false;
        return visit(itr->second);
    }

}  // namespace swarmkad
