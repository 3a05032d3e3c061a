#include "str.hpp"

namespace swarmkad
{
    std::string lowercase_ascii_string(std::string src)
    {
        for (char& ch : src)
            if (ch >= 'A' && ch <= 'Z')
                ch = ch + ('a' - 'A');
        return src;
    }
}  // namespace swarmkad
