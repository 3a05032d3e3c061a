#pragma once

#include "fs.hpp"

#include <string>

namespace swarmkad::util
{
    /// Reads a binary file from disk into a string.  Throws on error.
    std::string file_to_string(const fs::path& filename);
}  // namespace swarmkad::util
