#pragma once

#include "common.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <string>

namespace apphys
{
    struct TransportOptions
    {
        std::string remoteAddress = "127.0.0.1";
        std::uint16_t remotePort = 30000;

        // Run a private poll loop instead of relying on update() from the owner.
        bool internalThread = true;
        std::chrono::milliseconds pollInterval{30};
        std::chrono::milliseconds shutdownGrace{500};

        // Zero means wait for the connect indefinitely.
        std::chrono::milliseconds connectTimeout{10000};

        // Packets handed to the socket per update cycle.
        std::size_t maxSendPerUpdate = 50;

        std::size_t readBufferSize = 65536;
        std::size_t maxFrameSize = 16u * 1024u * 1024u;
    };

    // Packet-level channel to the remote engine. A packet is one complete APP
    // message (header + body); the transport never looks past the header.
    class IPacketTransport
    {
    public:
        virtual ~IPacketTransport() = default;

        // Header size and the offset of the u32 total-length field. Must be
        // called before any traffic is processed.
        virtual void initialize_packet_parameters(std::size_t headerSize, std::size_t lengthOffset) = 0;

        // Queues a packet for sending. False when the channel cannot accept it.
        virtual bool send_packet(ByteBuffer packet) = 0;

        virtual bool has_incoming_packet() const = 0;
        virtual std::optional<ByteBuffer> get_incoming_packet() = 0;

        // One cooperative I/O cycle. A no-op for transports running their own thread.
        virtual void update() = 0;

        // True when the transport runs its own poll loop.
        virtual bool self_driven() const = 0;

        virtual bool connected() const = 0;

        virtual void dispose() = 0;
    };

    // Mutex-guarded FIFO of packets.
    class PacketQueue
    {
    public:
        void push(ByteBuffer packet)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_queue.push_back(std::move(packet));
        }

        std::optional<ByteBuffer> pop()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_queue.empty())
            {
                return std::nullopt;
            }
            ByteBuffer out = std::move(m_queue.front());
            m_queue.pop_front();
            return out;
        }

        // Removes up to `maxCount` packets from the front, oldest first.
        std::vector<ByteBuffer> drain(std::size_t maxCount)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            const std::size_t n = std::min(maxCount, m_queue.size());
            std::vector<ByteBuffer> out;
            out.reserve(n);
            for (std::size_t i = 0; i < n; ++i)
            {
                out.push_back(std::move(m_queue.front()));
                m_queue.pop_front();
            }
            return out;
        }

        bool empty() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.empty();
        }

        std::size_t size() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_queue.size();
        }

        void clear()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_queue.clear();
        }

    private:
        mutable std::mutex m_mu;
        std::deque<ByteBuffer> m_queue;
    };

    // In-process transport: sent packets are captured, inbound packets are
    // injected with deliver(). Used to drive a Messenger without sockets.
    class InProcTransport final : public IPacketTransport
    {
    public:
        void initialize_packet_parameters(std::size_t headerSize, std::size_t lengthOffset) override
        {
            m_headerSize = headerSize;
            m_lengthOffset = lengthOffset;
        }

        bool send_packet(ByteBuffer packet) override
        {
            if (!m_connected.load())
            {
                return false;
            }
            m_sent.push(std::move(packet));
            return true;
        }

        bool has_incoming_packet() const override { return !m_inbound.empty(); }

        std::optional<ByteBuffer> get_incoming_packet() override { return m_inbound.pop(); }

        void update() override { m_updates.fetch_add(1); }

        bool self_driven() const override { return false; }

        bool connected() const override { return m_connected.load(); }

        void dispose() override { m_connected.store(false); }

        void deliver(ByteBuffer packet) { m_inbound.push(std::move(packet)); }

        std::optional<ByteBuffer> take_sent() { return m_sent.pop(); }
        std::size_t sent_count() const { return m_sent.size(); }
        std::size_t pending_inbound() const { return m_inbound.size(); }

        std::size_t header_size() const noexcept { return m_headerSize; }
        std::size_t length_offset() const noexcept { return m_lengthOffset; }
        std::uint64_t update_count() const noexcept { return m_updates.load(); }

    private:
        PacketQueue m_sent;
        PacketQueue m_inbound;
        std::size_t m_headerSize = 0;
        std::size_t m_lengthOffset = 0;
        std::atomic<bool> m_connected{true};
        std::atomic<std::uint64_t> m_updates{0};
    };
}
