#include "metric.hpp"

#include <swarmkad/util/logging.hpp>

#include <algorithm>

namespace swarmkad::kademlia
{
    static auto logcat = log::Cat("kademlia");

    static_assert(sizeof(unsigned int) == 4, "clz below assumes a 32 bit unsigned int");

    // leading zero bits of a non-zero byte
    static inline int clz8(byte_t x)
    {
        return __builtin_clz(x) - 24;
    }

    int proximity(const Address& a, const Address& b)
    {
        for (size_t i = 0; i < Address::SIZE; ++i)
        {
            const byte_t oxo = a[i] ^ b[i];
            if (oxo != 0)
                return static_cast<int>(i) * 8 + clz8(oxo);
        }
        return Address::BITS;
    }

    int ProxCmp(const Address& target, const Address& a, const Address& b)
    {
        for (size_t i = 0; i < Address::SIZE; ++i)
        {
            const byte_t da = a[i] ^ target[i];
            const byte_t db = b[i] ^ target[i];
            if (da > db)
                return 1;
            if (da < db)
                return -1;
        }
        return 0;
    }

    Address random_address_at(const Address& ref, int prox, ByteSource& rng)
    {
        Address addr{ref};
        if (prox >= Address::BITS)
            return addr;

        size_t pos = 0;
        if (prox >= 0)
        {
            pos = prox / 8;
            const int trans = prox % 8;
            const byte_t keep = static_cast<byte_t>(0xff << (7 - trans));
            const byte_t flip = static_cast<byte_t>(0x80 >> trans);
            addr[pos] = static_cast<byte_t>(((addr[pos] & keep) ^ flip) | (rng() & ~keep));
            ++pos;
        }
        for (size_t i = pos; i < Address::SIZE; ++i)
            addr[i] = rng();

        return addr;
    }

    Address random_address_at(const Address& ref, int prox)
    {
        return random_address_at(ref, prox, system_bytes());
    }

    Address random_address(ByteSource& rng)
    {
        return random_address_at(Address{}, -1, rng);
    }

    Address random_address()
    {
        return random_address(system_bytes());
    }

    Address common_bits_addr_f(const Address& ref, const Address& other, ByteSource& fill, int limit)
    {
        limit = std::max(limit, 0);

        int prox = proximity(ref, other);
        const bool diverge = limit > prox;
        if (not diverge)
            prox = limit;

        if (prox >= Address::BITS)
            return ref;

        Address addr{ref};
        const size_t pos = prox / 8;
        const int trans = prox % 8;

        // bits of the boundary byte taken from fill; when diverging bit `trans` is kept and flipped
        byte_t fillmask = diverge ? 0x7f : 0xff;
        fillmask >>= trans;

        byte_t boundary = addr[pos] & static_cast<byte_t>(~fillmask);
        if (diverge)
            boundary ^= static_cast<byte_t>(0x80 >> trans);
        boundary |= fillmask & fill();
        addr[pos] = boundary;

        for (size_t i = pos + 1; i < Address::SIZE; ++i)
            addr[i] = fill();

        return addr;
    }

    Address common_bits_addr(const Address& ref, const Address& other, int limit, ByteSource& rng)
    {
        return common_bits_addr_f(ref, other, rng, limit);
    }

    Address common_bits_addr(const Address& ref, const Address& other, int limit)
    {
        return common_bits_addr_f(ref, other, system_bytes(), limit);
    }

    Address common_bits_addr_byte(const Address& ref, const Address& other, byte_t b, int limit)
    {
        ConstantByteSource fill{b};
        return common_bits_addr_f(ref, other, fill, limit);
    }

    KeyRange key_range(const Address& one, const Address& other, int limit)
    {
        const int prox = std::min(proximity(one, other), std::max(limit, 0));

        KeyRange range{
            common_bits_addr_byte(one, other, 0x00, prox), common_bits_addr_byte(one, other, 0xff, prox), prox};

        log::trace(logcat, "key range of {} at prox {}: [{}, {}]", one.ShortHex(), prox, range.start, range.stop);
        return range;
    }
}  // namespace swarmkad::kademlia
