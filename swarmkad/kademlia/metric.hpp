#pragma once

#include "address.hpp"

#include <swarmkad/crypto/random.hpp>

namespace swarmkad::kademlia
{
    /// Proximity order of the XOR distance between a and b: the index of the first differing bit,
    /// most significant bit of byte 0 first.  0 is farthest, Address::BITS means a == b.
    int proximity(const Address& a, const Address& b);

    /// Compares the distances a->target and b->target byte by byte.  Returns -1 if a is closer to
    /// target, 1 if b is closer and 0 if they are equal.
    int ProxCmp(const Address& target, const Address& a, const Address& b);

    /// strict weak ordering by XOR distance to `us`, for sorting candidates nearest first
    struct XorMetric
    {
        const Address us;

        explicit XorMetric(const Address& ourKey) : us(ourKey)
        {}

        bool operator()(const Address& left, const Address& right) const
        {
            return ProxCmp(us, left, right) < 0;
        }
    };

    /// Random address at proximity order exactly `prox` from `ref`: the first prox bits are
    /// copied, bit prox is flipped and everything after it is drawn from `rng`.  A negative prox
    /// gives a fully random address; prox >= Address::BITS returns `ref` itself.
    Address random_address_at(const Address& ref, int prox, ByteSource& rng);

    Address random_address_at(const Address& ref, int prox);

    Address random_address(ByteSource& rng);

    Address random_address();

    /// Address sharing min(proximity(ref, other), limit) leading bits with ref, remaining bits
    /// taken from `fill` (one call per byte).
    ///
    /// If limit is above the actual proximity the result is forced to diverge from ref at exactly
    /// that bit, like random_address_at.  Otherwise only the first `limit` bits are fixed and the
    /// result may share more bits with ref depending on what `fill` returns.  A negative limit is
    /// treated as 0.
    Address common_bits_addr_f(const Address& ref, const Address& other, ByteSource& fill, int limit);

    Address common_bits_addr(const Address& ref, const Address& other, int limit, ByteSource& rng);

    Address common_bits_addr(const Address& ref, const Address& other, int limit);

    Address common_bits_addr_byte(const Address& ref, const Address& other, byte_t b, int limit);

    /// inclusive range [start, stop] of every address sharing the first `prox` bits with the
    /// reference it was built from
    struct KeyRange
    {
        Address start;
        Address stop;
        int prox;

        bool contains(const Address& addr) const
        {
            return start <= addr and addr <= stop;
        }
    };

    /// Key range of addresses sharing min(proximity(one, other), limit) leading bits with `one`.
    KeyRange key_range(const Address& one, const Address& other, int limit);
}  // namespace swarmkad::kademlia
