#pragma once

#include "wire.hpp"

#include <stdexcept>

namespace apphys
{
    // Rebuilds discrete messages from a byte stream that is not aligned to
    // message boundaries. Only the header size and the offset of the big-endian
    // u32 total-length field are known; the message catalog is not.
    class FrameAssembler
    {
    public:
        static constexpr std::size_t kDefaultMaxFrameSize = 16u * 1024u * 1024u;

        FrameAssembler() = default;

        FrameAssembler(std::size_t headerSize, std::size_t lengthOffset, std::size_t maxFrameSize = kDefaultMaxFrameSize)
        {
            configure(headerSize, lengthOffset, maxFrameSize);
        }

        void configure(std::size_t headerSize, std::size_t lengthOffset, std::size_t maxFrameSize = kDefaultMaxFrameSize)
        {
            if (headerSize == 0 || lengthOffset + 4 > headerSize)
            {
                throw std::invalid_argument("FrameAssembler: length field must lie inside the header");
            }
            if (maxFrameSize < headerSize)
            {
                throw std::invalid_argument("FrameAssembler: max frame size smaller than header");
            }
            m_headerSize = headerSize;
            m_lengthOffset = lengthOffset;
            m_maxFrameSize = maxFrameSize;
            reset();
        }

        bool configured() const noexcept { return m_headerSize != 0; }

        // Bytes of an incomplete message carried over to the next feed().
        std::size_t buffered() const noexcept { return m_overflow.size(); }

        // Set after a declared length is outside [header size, max frame size].
        // The stream cannot be resynchronized after that.
        bool failed() const noexcept { return m_failed; }

        void reset()
        {
            m_overflow.clear();
            m_failed = false;
        }

        // Appends every message completed by `chunk` to `out`, in stream order.
        // Returns false on a framing error.
        bool feed(std::span<const std::byte> chunk, std::vector<ByteBuffer> &out)
        {
            if (!configured())
            {
                throw std::logic_error("FrameAssembler: feed before configure");
            }
            if (m_failed)
            {
                return false;
            }

            if (!m_overflow.empty())
            {
                // Complete the carried-over header first.
                if (m_overflow.size() < m_headerSize)
                {
                    const std::size_t take = std::min(m_headerSize - m_overflow.size(), chunk.size());
                    append_(m_overflow, chunk.first(take));
                    chunk = chunk.subspan(take);
                    if (m_overflow.size() < m_headerSize)
                    {
                        return true;
                    }
                }

                const auto declared = declared_length_(m_overflow.data());
                if (!declared)
                {
                    return false;
                }

                const std::size_t take = std::min(*declared - m_overflow.size(), chunk.size());
                append_(m_overflow, chunk.first(take));
                chunk = chunk.subspan(take);
                if (m_overflow.size() < *declared)
                {
                    return true;
                }

                out.push_back(std::move(m_overflow));
                m_overflow = ByteBuffer{};
            }

            // Split complete messages straight out of the chunk.
            while (chunk.size() >= m_headerSize)
            {
                const auto declared = declared_length_(chunk.data());
                if (!declared)
                {
                    return false;
                }
                if (chunk.size() < *declared)
                {
                    break;
                }
                out.emplace_back(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*declared));
                chunk = chunk.subspan(*declared);
            }

            append_(m_overflow, chunk);
            return true;
        }

    private:
        std::optional<std::size_t> declared_length_(const std::byte *header)
        {
            const std::size_t n = load_u32(header + m_lengthOffset, std::endian::big);
            if (n < m_headerSize || n > m_maxFrameSize)
            {
                m_failed = true;
                return std::nullopt;
            }
            return n;
        }

        static void append_(ByteBuffer &dst, std::span<const std::byte> src)
        {
            dst.insert(dst.end(), src.begin(), src.end());
        }

        std::size_t m_headerSize = 0;
        std::size_t m_lengthOffset = 0;
        std::size_t m_maxFrameSize = kDefaultMaxFrameSize;
        ByteBuffer m_overflow;
        bool m_failed = false;
    };
}
