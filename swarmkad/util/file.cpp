#include "file.hpp"

#include <fstream>
#include <ios>

namespace swarmkad::util
{
    std::string file_to_string(const fs::path& filename)
    {
        fs::ifstream in;
        in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
        in.open(filename, std::ios::binary | std::ios::in);
        in.seekg(0, std::ios::end);
        auto size = in.tellg();
        in.seekg(0, std::ios::beg);

        std::string contents;
        contents.resize(size);
        in.read(contents.data(), size);
        return contents;
    }
}  // namespace swarmkad::util
