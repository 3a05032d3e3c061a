#include "address.hpp"

#include <swarmkad/util/logging.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <oxenc/hex.h>

namespace swarmkad::kademlia
{
    static auto logcat = log::Cat("kademlia");

    InvalidLength::InvalidLength(size_t expected, size_t actual)
        : std::invalid_argument{fmt::format("invalid address length: expected {} bytes, got {}", expected, actual)},
          expected{expected},
          actual{actual}
    {}

    Address Address::from_bytes(ustring_view bytes)
    {
        if (bytes.size() != SIZE)
        {
            log::debug(logcat, "Rejecting {} byte address input", bytes.size());
            throw InvalidLength{SIZE, bytes.size()};
        }
        return Address{bytes.data()};
    }

    Address Address::from_hex(std::string_view hex)
    {
        if (hex.size() != 2 * SIZE)
            throw InvalidEncoding{
                fmt::format("invalid address encoding: expected {} hex digits, got {}", 2 * SIZE, hex.size())};

        for (size_t i = 0; i < hex.size(); ++i)
        {
            if (not oxenc::is_hex_digit(hex[i]))
                throw InvalidEncoding{fmt::format("invalid address encoding: non-hex character at offset {}", i)};
        }

        Address addr;
        if (not addr.FromHex(hex))
            throw InvalidEncoding{"invalid address encoding"};
        return addr;
    }

    void to_json(nlohmann::json& j, const Address& addr)
    {
        j = addr.ToHex();
    }

    void from_json(const nlohmann::json& j, Address& addr)
    {
        if (not j.is_string())
            throw InvalidEncoding{fmt::format("invalid address encoding: expected a JSON string, got {}", j.type_name())};
        addr = Address::from_hex(j.get_ref<const std::string&>());
    }
}  // namespace swarmkad::kademlia
