#pragma once

#include <swarmkad/util/types.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <random>

namespace swarmkad
{
    struct KademliaConfig;

    /// Source of fill bytes for address generation, one byte per call.  The random sources are
    /// uniform over the full range [0, 255].
    struct ByteSource
    {
        virtual ~ByteSource() = default;

        virtual byte_t operator()() = 0;
    };

    /// libsodium backed; one instance may be shared between threads
    struct SystemByteSource final : public ByteSource
    {
        SystemByteSource();

        byte_t operator()() override;
    };

    /// deterministic sequence for a given seed.  Not thread safe: use one instance per thread.
    struct SeededByteSource final : public ByteSource
    {
        explicit SeededByteSource(uint64_t seed) : _rng{seed}
        {}

        byte_t operator()() override
        {
            return static_cast<byte_t>(_dist(_rng));
        }

       private:
        std::mt19937_64 _rng;
        std::uniform_int_distribution<unsigned> _dist{0, 255};
    };

    struct ConstantByteSource final : public ByteSource
    {
        explicit ConstantByteSource(byte_t value) : _value{value}
        {}

        byte_t operator()() override
        {
            return _value;
        }

       private:
        byte_t _value;
    };

    /// wraps an arbitrary callable, e.g. a scripted sequence in a unit test
    struct CallbackByteSource final : public ByteSource
    {
        explicit CallbackByteSource(std::function<byte_t()> f);

        byte_t operator()() override
        {
            return _f();
        }

       private:
        std::function<byte_t()> _f;
    };

    /// process-wide system source, initialized on first use
    SystemByteSource& system_bytes();

    /// builds the source selected by [kademlia]:random-source
    std::unique_ptr<ByteSource> make_byte_source(const KademliaConfig& conf);
}  // namespace swarmkad
