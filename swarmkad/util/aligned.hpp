#pragma once

#include "formattable.hpp"
#include "types.hpp"

#include <oxenc/hex.h>

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <cstring>
#include <functional>
#include <string>
#include <string_view>
#include <type_traits>

namespace swarmkad
{
    /// aligned buffer that is sz bytes long and aligns to the nearest Alignment
    template <size_t sz>
    struct alignas(std::max_align_t) AlignedBuffer
    {
        static_assert(alignof(std::max_align_t) <= 16, "insane alignment");
        static_assert(sz >= 4, "AlignedBuffer cannot be used with buffers smaller than 4 bytes");

        static constexpr size_t SIZE = sz;

        AlignedBuffer()
        {
            Zero();
        }

        explicit AlignedBuffer(const byte_t* data)
        {
            *this = data;
        }

        explicit AlignedBuffer(const std::array<byte_t, SIZE>& buf)
        {
            _data = buf;
        }

        AlignedBuffer& operator=(const byte_t* data)
        {
            std::memcpy(_data.data(), data, sz);
            return *this;
        }

        bool operator==(const AlignedBuffer& other) const
        {
            return _data == other._data;
        }

        bool operator!=(const AlignedBuffer& other) const
        {
            return _data != other._data;
        }

        // big-endian unsigned byte order
        bool operator<(const AlignedBuffer& other) const
        {
            return _data < other._data;
        }

        bool operator>(const AlignedBuffer& other) const
        {
            return _data > other._data;
        }

        bool operator<=(const AlignedBuffer& other) const
        {
            return _data <= other._data;
        }

        bool operator>=(const AlignedBuffer& other) const
        {
            return _data >= other._data;
        }

        AlignedBuffer operator^(const AlignedBuffer& other) const
        {
            AlignedBuffer ret;
            std::transform(begin(), end(), other.begin(), ret.begin(), std::bit_xor<>());
            return ret;
        }

        byte_t& operator[](size_t idx)
        {
            assert(idx < SIZE);
            return _data[idx];
        }

        const byte_t& operator[](size_t idx) const
        {
            assert(idx < SIZE);
            return _data[idx];
        }

        static constexpr size_t size()
        {
            return sz;
        }

        void Fill(byte_t f)
        {
            _data.fill(f);
        }

        std::array<byte_t, SIZE>& as_array()
        {
            return _data;
        }

        const std::array<byte_t, SIZE>& as_array() const
        {
            return _data;
        }

        byte_t* data()
        {
            return _data.data();
        }

        const byte_t* data() const
        {
            return _data.data();
        }

        void Zero()
        {
            _data.fill(0);
        }

        typename std::array<byte_t, SIZE>::iterator begin()
        {
            return _data.begin();
        }

        typename std::array<byte_t, SIZE>::iterator end()
        {
            return _data.end();
        }

        typename std::array<byte_t, SIZE>::const_iterator begin() const
        {
            return _data.cbegin();
        }

        typename std::array<byte_t, SIZE>::const_iterator end() const
        {
            return _data.cend();
        }

        std::string ToHex() const
        {
            return oxenc::to_hex(begin(), end());
        }

        std::string ShortHex() const
        {
            return oxenc::to_hex(begin(), begin() + 4);
        }

        bool FromHex(std::string_view str)
        {
            if (str.size() != 2 * size() || !oxenc::is_hex(str))
                return false;
            oxenc::from_hex(str.begin(), str.end(), begin());
            return true;
        }

        /// '0'/'1' rendering of every bit, most significant bit of byte 0 first
        std::string ToBin() const
        {
            std::string ret(sz * 8, '0');
            auto out = ret.begin();
            for (const auto b : _data)
            {
                for (int j = 7; j >= 0; --j, ++out)
                {
                    if ((b >> j) & 0x01)
                        *out = '1';
                }
            }
            return ret;
        }

       private:
        std::array<byte_t, SIZE> _data;
    };

    namespace detail
    {
        template <size_t Sz>
        static std::true_type is_aligned_buffer_impl(AlignedBuffer<Sz>*);

        static std::false_type is_aligned_buffer_impl(...);
    }  // namespace detail
    // True if T is or is derived from AlignedBuffer<N> for any N
    template <typename T>
    constexpr inline bool is_aligned_buffer = decltype(detail::is_aligned_buffer_impl(static_cast<T*>(nullptr)))::value;

}  // namespace swarmkad

namespace fmt
{
    // Any AlignedBuffer<N> (or subclass) gets hex formatted when output:
    template <typename T>
    struct formatter<T, char, std::enable_if_t<swarmkad::is_aligned_buffer<T> && !swarmkad::IsToStringFormattable<T>>>
        : formatter<std::string_view>
    {
        template <typename FormatContext>
        auto format(const T& val, FormatContext& ctx) const
        {
            auto it = oxenc::hex_encoder{val.begin(), val.end()};
            return std::copy(it, it.end(), ctx.out());
        }
    };
}  // namespace fmt

namespace std
{
    template <size_t sz>
    struct hash<swarmkad::AlignedBuffer<sz>>
    {
        std::size_t operator()(const swarmkad::AlignedBuffer<sz>& buf) const noexcept
        {
            std::size_t h = 0;
            std::memcpy(&h, buf.data(), std::min(sizeof(std::size_t), sz));
            return h;
        }
    };
}  // namespace std
