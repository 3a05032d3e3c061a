#pragma once

#include <swarmkad/util/aligned.hpp>
#include <swarmkad/util/types.hpp>

#include <nlohmann/json_fwd.hpp>

#include <array>
#include <stdexcept>
#include <string>
#include <string_view>

namespace swarmkad::kademlia
{
    /// thrown when raw input is not exactly Address::SIZE bytes
    struct InvalidLength : public std::invalid_argument
    {
        InvalidLength(size_t expected, size_t actual);

        size_t expected;
        size_t actual;
    };

    /// thrown when a textual address is not exactly 2 * Address::SIZE hex digits
    struct InvalidEncoding : public std::invalid_argument
    {
        using std::invalid_argument::invalid_argument;
    };

    /// A point in the 256 bit XOR metric space.
    struct Address : public AlignedBuffer<32>
    {
        static constexpr int BITS = SIZE * 8;

        using Data = std::array<byte_t, SIZE>;

        Address() : AlignedBuffer<SIZE>()
        {}

        explicit Address(const byte_t* buf) : AlignedBuffer<SIZE>(buf)
        {}

        explicit Address(const Data& data) : AlignedBuffer<SIZE>(data)
        {}

        explicit Address(const AlignedBuffer<SIZE>& data) : AlignedBuffer<SIZE>(data)
        {}

        /// Copies exactly SIZE raw bytes.  Throws InvalidLength otherwise.
        static Address from_bytes(ustring_view bytes);

        static Address from_bytes(std::string_view bytes)
        {
            return from_bytes(to_usv(bytes));
        }

        /// Parses the 64 character hex form produced by ToHex().  Accepts either case.  Throws
        /// InvalidEncoding on a wrong length or a non-hex character.
        static Address from_hex(std::string_view hex);

        std::string ToString() const
        {
            return ToHex();
        }

        Address operator^(const Address& other) const
        {
            Address dist;
            std::transform(begin(), end(), other.begin(), dist.begin(), std::bit_xor<byte_t>());
            return dist;
        }

        bool operator==(const Address& other) const
        {
            return as_array() == other.as_array();
        }

        bool operator!=(const Address& other) const
        {
            return as_array() != other.as_array();
        }

        bool operator<(const Address& other) const
        {
            return as_array() < other.as_array();
        }

        bool operator>(const Address& other) const
        {
            return as_array() > other.as_array();
        }

        bool operator<=(const Address& other) const
        {
            return as_array() <= other.as_array();
        }

        bool operator>=(const Address& other) const
        {
            return as_array() >= other.as_array();
        }
    };

    // JSON form is the quoted lowercase hex string
    void to_json(nlohmann::json& j, const Address& addr);

    void from_json(const nlohmann::json& j, Address& addr);
}  // namespace swarmkad::kademlia

namespace std
{
    template <>
    struct hash<swarmkad::kademlia::Address> : hash<swarmkad::AlignedBuffer<swarmkad::kademlia::Address::SIZE>>
    {};
}  // namespace std
