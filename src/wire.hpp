#pragma once

#include "common.hpp"

#include <algorithm>
#include <bit>
#include <limits>
#include <stdexcept>
#include <utility>

namespace apphys
{
    // Explicit byte-order helpers. Every APP field goes through these with
    // std::endian::big; the order parameter exists so a foreign host's memory
    // image can be interpreted as well.
    inline void store_u16(std::uint16_t v, std::byte *out, std::endian order) noexcept
    {
        if (order == std::endian::big)
        {
            out[0] = static_cast<std::byte>((v >> 8) & 0xFFu);
            out[1] = static_cast<std::byte>(v & 0xFFu);
        }
        else
        {
            out[0] = static_cast<std::byte>(v & 0xFFu);
            out[1] = static_cast<std::byte>((v >> 8) & 0xFFu);
        }
    }

    inline void store_u32(std::uint32_t v, std::byte *out, std::endian order) noexcept
    {
        for (int i = 0; i < 4; ++i)
        {
            const int shift = (order == std::endian::big) ? 8 * (3 - i) : 8 * i;
            out[i] = static_cast<std::byte>((v >> shift) & 0xFFu);
        }
    }

    inline std::uint16_t load_u16(const std::byte *in, std::endian order) noexcept
    {
        const auto b0 = static_cast<std::uint16_t>(std::to_integer<std::uint8_t>(in[0]));
        const auto b1 = static_cast<std::uint16_t>(std::to_integer<std::uint8_t>(in[1]));
        return (order == std::endian::big) ? static_cast<std::uint16_t>((b0 << 8) | b1)
                                           : static_cast<std::uint16_t>((b1 << 8) | b0);
    }

    inline std::uint32_t load_u32(const std::byte *in, std::endian order) noexcept
    {
        std::uint32_t out = 0;
        for (int i = 0; i < 4; ++i)
        {
            const int shift = (order == std::endian::big) ? 8 * (3 - i) : 8 * i;
            out |= static_cast<std::uint32_t>(std::to_integer<std::uint8_t>(in[i])) << shift;
        }
        return out;
    }

    inline void store_f32(float v, std::byte *out, std::endian order) noexcept
    {
        static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559, "IEEE-754 binary32 required");
        store_u32(std::bit_cast<std::uint32_t>(v), out, order);
    }

    inline float load_f32(const std::byte *in, std::endian order) noexcept
    {
        return std::bit_cast<float>(load_u32(in, order));
    }

    class WireWriter
    {
    public:
        WireWriter() = default;
        explicit WireWriter(std::size_t reserve) { m_buf.reserve(reserve); }

        void write_u16(std::uint16_t v)
        {
            std::byte *p = grow_(2);
            store_u16(v, p, std::endian::big);
        }

        void write_u32(std::uint32_t v)
        {
            std::byte *p = grow_(4);
            store_u32(v, p, std::endian::big);
        }

        void write_f32(float v)
        {
            std::byte *p = grow_(4);
            store_f32(v, p, std::endian::big);
        }

        // Fixed-width text field: truncated to `width`, no prefix, no terminator, zero filled.
        void write_fixed_string(std::string_view s, std::size_t width)
        {
            std::byte *p = grow_(width);
            const std::size_t n = std::min(s.size(), width);
            if (n > 0)
            {
                std::memcpy(p, s.data(), n);
            }
        }

        void write_zeros(std::size_t n) { (void)grow_(n); }

        // Overwrites an already-written u32 (used to back-fill the header length).
        void patch_u32(std::size_t offset, std::uint32_t v)
        {
            if (offset + 4 > m_buf.size())
            {
                throw std::runtime_error("WireWriter: patch out of range");
            }
            store_u32(v, m_buf.data() + offset, std::endian::big);
        }

        std::size_t size() const noexcept { return m_buf.size(); }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        std::byte *grow_(std::size_t n)
        {
            const std::size_t at = m_buf.size();
            m_buf.resize(at + n, std::byte{0});
            return m_buf.data() + at;
        }

        ByteBuffer m_buf;
    };

    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        bool eof() const noexcept { return m_pos >= m_bytes.size(); }
        std::size_t position() const noexcept { return m_pos; }
        std::size_t remaining() const noexcept { return m_pos >= m_bytes.size() ? 0 : m_bytes.size() - m_pos; }

        std::uint16_t read_u16()
        {
            require_(2);
            const auto v = load_u16(m_bytes.data() + m_pos, std::endian::big);
            m_pos += 2;
            return v;
        }

        std::uint32_t read_u32()
        {
            require_(4);
            const auto v = load_u32(m_bytes.data() + m_pos, std::endian::big);
            m_pos += 4;
            return v;
        }

        float read_f32()
        {
            require_(4);
            const float v = load_f32(m_bytes.data() + m_pos, std::endian::big);
            m_pos += 4;
            return v;
        }

        // Reads `width` bytes; the text ends at the first NUL or at the field end.
        std::string read_fixed_string(std::size_t width)
        {
            require_(width);
            const char *p = reinterpret_cast<const char *>(m_bytes.data() + m_pos);
            std::size_t n = 0;
            while (n < width && p[n] != '\0')
            {
                ++n;
            }
            m_pos += width;
            return std::string(p, n);
        }

        void skip(std::size_t n)
        {
            require_(n);
            m_pos += n;
        }

    private:
        void require_(std::size_t n) const
        {
            if (m_pos + n > m_bytes.size())
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}
