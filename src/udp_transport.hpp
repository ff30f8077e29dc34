#pragma once

#include "log.hpp"
#include "transport.hpp"

#include <boost/asio.hpp>

#include <future>
#include <stdexcept>
#include <thread>

namespace apphys
{
    // Best-effort channel: one datagram per packet, no reassembly, no delivery
    // or ordering guarantee. Socket errors are logged and the channel keeps
    // going; there is no disconnected state to fall into.
    class UdpTransport final : public IPacketTransport
    {
    public:
        explicit UdpTransport(TransportOptions opts)
            : m_opts(std::move(opts)), m_socket(m_io)
        {
            if (m_opts.maxSendPerUpdate == 0 || m_opts.readBufferSize == 0)
            {
                throw std::invalid_argument("UdpTransport: send cap and read buffer must be non-zero");
            }

            boost::system::error_code ec;
            const auto address = boost::asio::ip::make_address(m_opts.remoteAddress, ec);
            if (ec)
            {
                throw std::invalid_argument("UdpTransport: invalid remote address '" + m_opts.remoteAddress + "'");
            }
            m_remote = boost::asio::ip::udp::endpoint(address, m_opts.remotePort);
            m_readBuffer.resize(m_opts.readBufferSize);

            open_socket_();

            if (m_opts.internalThread)
            {
                m_loopDone = m_loopDonePromise.get_future();
                m_thread = std::thread([this]
                                       {
                    while (!m_stop.load())
                    {
                        pump_();
                        std::this_thread::sleep_for(m_opts.pollInterval);
                    }
                    m_loopDonePromise.set_value(); });
            }
        }

        ~UdpTransport() override { dispose(); }

        UdpTransport(const UdpTransport &) = delete;
        UdpTransport &operator=(const UdpTransport &) = delete;

        void initialize_packet_parameters(std::size_t headerSize, std::size_t lengthOffset) override
        {
            if (headerSize == 0 || lengthOffset + 4 > headerSize)
            {
                throw std::invalid_argument("UdpTransport: length field must lie inside the header");
            }
            m_headerSize.store(headerSize);
        }

        bool send_packet(ByteBuffer packet) override
        {
            if (m_disposed.load())
            {
                return false;
            }
            m_outgoing.push(std::move(packet));
            return true;
        }

        bool has_incoming_packet() const override { return !m_incoming.empty(); }

        std::optional<ByteBuffer> get_incoming_packet() override { return m_incoming.pop(); }

        void update() override
        {
            if (m_opts.internalThread)
            {
                return;
            }
            pump_();
        }

        bool self_driven() const override { return m_opts.internalThread; }

        // Connectionless; "connected" only means the socket is usable.
        bool connected() const override { return !m_disposed.load(); }

        void dispose() override
        {
            if (m_disposed.exchange(true))
            {
                return;
            }

            m_stop.store(true);
            if (m_thread.joinable())
            {
                if (m_loopDone.wait_for(m_opts.shutdownGrace) != std::future_status::ready)
                {
                    Logger::instance().logf(LogLevel::Warn, "udp", "update loop still running after %lld ms grace",
                                            static_cast<long long>(m_opts.shutdownGrace.count()));
                }
                m_thread.join();
            }

            boost::system::error_code ignored;
            m_socket.close(ignored);
        }

        // Local port the engine replies to; zero when the socket is not open.
        std::uint16_t local_port() const
        {
            boost::system::error_code ec;
            const auto ep = m_socket.local_endpoint(ec);
            return ec ? 0 : ep.port();
        }

        std::size_t pending_outgoing() const { return m_outgoing.size(); }

    private:
        bool open_socket_()
        {
            if (m_socket.is_open())
            {
                return true;
            }
            boost::system::error_code ec;
            m_socket.open(m_remote.protocol(), ec);
            if (!ec)
            {
                m_socket.bind(boost::asio::ip::udp::endpoint(m_remote.protocol(), 0), ec);
            }
            if (ec)
            {
                boost::system::error_code ignored;
                m_socket.close(ignored);
                Logger::instance().logf(LogLevel::Error, "udp", "unable to open socket for %s:%u: %s",
                                        m_opts.remoteAddress.c_str(), static_cast<unsigned>(m_opts.remotePort),
                                        ec.message().c_str());
                return false;
            }
            return true;
        }

        void pump_()
        {
            if (m_disposed.load() || !open_socket_())
            {
                return;
            }
            if (!m_sendInFlight)
            {
                m_batch = m_outgoing.drain(m_opts.maxSendPerUpdate);
                m_batchPos = 0;
                send_next_();
            }
            if (!m_receiveInFlight)
            {
                start_receive_();
            }
            m_io.poll();
            m_io.restart();
        }

        // Datagrams of the current batch go out one at a time.
        void send_next_()
        {
            if (m_batchPos >= m_batch.size())
            {
                m_batch.clear();
                m_sendInFlight = false;
                return;
            }
            m_sendInFlight = true;
            const ByteBuffer &p = m_batch[m_batchPos];
            m_socket.async_send_to(boost::asio::buffer(p.data(), p.size()), m_remote,
                                   [this](const boost::system::error_code &ec, std::size_t)
                                   {
                                       if (ec && ec != boost::asio::error::operation_aborted)
                                       {
                                           Logger::instance().logf(LogLevel::Error, "udp", "send to %s:%u failed: %s",
                                                                   m_opts.remoteAddress.c_str(),
                                                                   static_cast<unsigned>(m_opts.remotePort),
                                                                   ec.message().c_str());
                                       }
                                       ++m_batchPos;
                                       send_next_();
                                   });
        }

        void start_receive_()
        {
            m_receiveInFlight = true;
            m_socket.async_receive_from(boost::asio::buffer(m_readBuffer), m_sender,
                                        [this](const boost::system::error_code &ec, std::size_t n)
                                        {
                                            m_receiveInFlight = false;
                                            if (ec)
                                            {
                                                if (ec != boost::asio::error::operation_aborted)
                                                {
                                                    Logger::instance().logf(LogLevel::Error, "udp", "receive failed: %s",
                                                                            ec.message().c_str());
                                                }
                                                return;
                                            }
                                            if (n < m_headerSize.load())
                                            {
                                                Logger::instance().logf(LogLevel::Warn, "udp", "dropping %zu byte datagram shorter than a header", n);
                                                return;
                                            }
                                            m_incoming.push(ByteBuffer(m_readBuffer.begin(), m_readBuffer.begin() + static_cast<std::ptrdiff_t>(n)));
                                        });
        }

        TransportOptions m_opts;

        boost::asio::io_context m_io;
        boost::asio::ip::udp::socket m_socket;
        boost::asio::ip::udp::endpoint m_remote;
        boost::asio::ip::udp::endpoint m_sender;

        std::atomic<std::size_t> m_headerSize{0};

        PacketQueue m_outgoing;
        PacketQueue m_incoming;

        // Touched only by the thread running pump_().
        ByteBuffer m_readBuffer;
        std::vector<ByteBuffer> m_batch;
        std::size_t m_batchPos = 0;
        bool m_sendInFlight = false;
        bool m_receiveInFlight = false;

        std::atomic<bool> m_disposed{false};
        std::atomic<bool> m_stop{false};
        std::promise<void> m_loopDonePromise;
        std::future<void> m_loopDone;
        std::thread m_thread;
    };
}
