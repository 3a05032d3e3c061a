#include "random.hpp"

#include <swarmkad/config/config.hpp>
#include <swarmkad/util/logging.hpp>

#include <sodium/core.h>
#include <sodium/randombytes.h>

#include <stdexcept>
#include <utility>

namespace swarmkad
{
    static auto logcat = log::Cat("random");

    SystemByteSource::SystemByteSource()
    {
        // sodium_init() is idempotent and returns 1 when already initialized
        if (sodium_init() == -1)
        {
            log::critical(logcat, "sodium_init() failed, no system random source available");
            throw std::runtime_error{"sodium_init() failed"};
        }
    }

    byte_t SystemByteSource::operator()()
    {
        byte_t b;
        randombytes_buf(&b, sizeof(b));
        return b;
    }

    CallbackByteSource::CallbackByteSource(std::function<byte_t()> f) : _f{std::move(f)}
    {
        if (not _f)
            throw std::invalid_argument{"CallbackByteSource requires a callable"};
    }

    SystemByteSource& system_bytes()
    {
        static SystemByteSource source;
        return source;
    }

    std::unique_ptr<ByteSource> make_byte_source(const KademliaConfig& conf)
    {
        switch (conf.random_source)
        {
            case RandomSource::seeded:
                log::debug(logcat, "Using seeded byte source (seed={})", conf.seed);
                return std::make_unique<SeededByteSource>(conf.seed);
            case RandomSource::system:
                break;
        }
        return std::make_unique<SystemByteSource>();
    }
}  // namespace swarmkad
