#pragma once

#include "frame_assembler.hpp"
#include "log.hpp"
#include "transport.hpp"

#include <boost/asio.hpp>

#include <future>
#include <stdexcept>
#include <thread>

namespace apphys
{
    // Reliable channel: one TCP connection to the engine. Construction blocks
    // until the connect completes, fails or times out. Any socket error leaves
    // the channel permanently disconnected; the owner must build a new one.
    class TcpTransport final : public IPacketTransport
    {
    public:
        enum class State : std::uint8_t
        {
            Disconnected = 0,
            Connecting = 1,
            Connected = 2,
            Closing = 3,
            Closed = 4,
        };

        explicit TcpTransport(TransportOptions opts)
            : m_opts(std::move(opts)), m_socket(m_io)
        {
            if (m_opts.maxSendPerUpdate == 0 || m_opts.readBufferSize == 0)
            {
                throw std::invalid_argument("TcpTransport: send cap and read buffer must be non-zero");
            }
            m_readBuffer.resize(m_opts.readBufferSize);

            connect_();

            if (m_opts.internalThread && m_state.load() == State::Connected)
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

        ~TcpTransport() override { dispose(); }

        TcpTransport(const TcpTransport &) = delete;
        TcpTransport &operator=(const TcpTransport &) = delete;

        State state() const noexcept { return m_state.load(); }

        void initialize_packet_parameters(std::size_t headerSize, std::size_t lengthOffset) override
        {
            std::lock_guard<std::mutex> lk(m_framingMu);
            m_assembler.configure(headerSize, lengthOffset, m_opts.maxFrameSize);
        }

        bool send_packet(ByteBuffer packet) override
        {
            if (m_state.load() != State::Connected)
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

        bool self_driven() const override { return m_thread.joinable(); }

        bool connected() const override { return m_state.load() == State::Connected; }

        void dispose() override
        {
            const State prev = m_state.exchange(State::Closing);
            if (prev == State::Closing || prev == State::Closed)
            {
                m_state.store(prev);
                return;
            }

            m_stop.store(true);
            if (m_thread.joinable())
            {
                if (m_loopDone.wait_for(m_opts.shutdownGrace) != std::future_status::ready)
                {
                    Logger::instance().logf(LogLevel::Warn, "tcp", "update loop still running after %lld ms grace",
                                            static_cast<long long>(m_opts.shutdownGrace.count()));
                }
                m_thread.join();
            }

            // Outstanding reads/writes are abandoned with the socket.
            boost::system::error_code ignored;
            m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
            m_socket.close(ignored);
            m_state.store(State::Closed);
            Logger::instance().logf(LogLevel::Info, "tcp", "closed connection to %s:%u",
                                    m_opts.remoteAddress.c_str(), static_cast<unsigned>(m_opts.remotePort));
        }

        std::size_t pending_outgoing() const { return m_outgoing.size(); }

    private:
        void connect_()
        {
            boost::system::error_code ec;
            const auto address = boost::asio::ip::make_address(m_opts.remoteAddress, ec);
            if (ec)
            {
                throw std::invalid_argument("TcpTransport: invalid remote address '" + m_opts.remoteAddress + "'");
            }
            const boost::asio::ip::tcp::endpoint endpoint(address, m_opts.remotePort);

            m_state.store(State::Connecting);

            std::promise<boost::system::error_code> done;
            auto result = done.get_future();
            m_socket.async_connect(endpoint, [&done](const boost::system::error_code &connectEc)
                                   { done.set_value(connectEc); });

            if (m_opts.connectTimeout.count() > 0)
            {
                m_io.run_for(m_opts.connectTimeout);
            }
            else
            {
                m_io.run();
            }

            if (result.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
            {
                // Timed out; closing aborts the connect so its handler runs before `done` goes away.
                boost::system::error_code ignored;
                m_socket.close(ignored);
                m_io.restart();
                m_io.poll();
                m_io.restart();
                m_state.store(State::Disconnected);
                Logger::instance().logf(LogLevel::Error, "tcp", "connect to %s:%u timed out after %lld ms",
                                        m_opts.remoteAddress.c_str(), static_cast<unsigned>(m_opts.remotePort),
                                        static_cast<long long>(m_opts.connectTimeout.count()));
                return;
            }
            m_io.restart();

            ec = result.get();
            if (ec)
            {
                boost::system::error_code ignored;
                m_socket.close(ignored);
                m_state.store(State::Disconnected);
                Logger::instance().logf(LogLevel::Error, "tcp", "unable to connect to %s:%u: %s",
                                        m_opts.remoteAddress.c_str(), static_cast<unsigned>(m_opts.remotePort),
                                        ec.message().c_str());
                return;
            }

            boost::system::error_code optEc;
            m_socket.set_option(boost::asio::ip::tcp::no_delay(true), optEc);
            m_state.store(State::Connected);
            Logger::instance().logf(LogLevel::Info, "tcp", "connected to %s:%u",
                                    m_opts.remoteAddress.c_str(), static_cast<unsigned>(m_opts.remotePort));
        }

        // One I/O cycle on the calling thread: start a send and a receive if
        // none is in flight, then run whatever handlers are ready.
        void pump_()
        {
            if (m_state.load() != State::Connected)
            {
                return;
            }
            if (!m_sendInFlight)
            {
                start_send_();
            }
            if (!m_receiveInFlight)
            {
                start_receive_();
            }

            m_io.poll();
            m_io.restart();
        }

        void start_send_()
        {
            m_inFlight = m_outgoing.drain(m_opts.maxSendPerUpdate);
            if (m_inFlight.empty())
            {
                return;
            }

            std::vector<boost::asio::const_buffer> buffers;
            buffers.reserve(m_inFlight.size());
            for (const auto &p : m_inFlight)
            {
                buffers.emplace_back(p.data(), p.size());
            }

            m_sendInFlight = true;
            boost::asio::async_write(m_socket, buffers,
                                     [this](const boost::system::error_code &ec, std::size_t)
                                     {
                                         m_sendInFlight = false;
                                         m_inFlight.clear();
                                         if (ec)
                                         {
                                             fail_("send", ec.message().c_str());
                                         }
                                     });
        }

        void start_receive_()
        {
            {
                std::lock_guard<std::mutex> lk(m_framingMu);
                if (!m_assembler.configured())
                {
                    return;
                }
            }

            m_receiveInFlight = true;
            m_socket.async_read_some(boost::asio::buffer(m_readBuffer),
                                     [this](const boost::system::error_code &ec, std::size_t n)
                                     {
                                         m_receiveInFlight = false;
                                         if (ec)
                                         {
                                             fail_("receive", ec == boost::asio::error::eof ? "connection closed by peer" : ec.message().c_str());
                                             return;
                                         }
                                         on_bytes_(std::span<const std::byte>(m_readBuffer.data(), n));
                                     });
        }

        void on_bytes_(std::span<const std::byte> bytes)
        {
            std::vector<ByteBuffer> frames;
            bool ok = false;
            {
                std::lock_guard<std::mutex> lk(m_framingMu);
                ok = m_assembler.feed(bytes, frames);
            }
            for (auto &f : frames)
            {
                m_incoming.push(std::move(f));
            }
            if (!ok)
            {
                fail_("receive", "message length outside the legal range; stream cannot be resynchronized");
            }
        }

        void fail_(const char *op, const char *why)
        {
            State expected = State::Connected;
            if (!m_state.compare_exchange_strong(expected, State::Disconnected))
            {
                return;
            }
            Logger::instance().logf(LogLevel::Error, "tcp", "%s failed, channel to %s:%u is now disconnected: %s",
                                    op, m_opts.remoteAddress.c_str(), static_cast<unsigned>(m_opts.remotePort), why);
            boost::system::error_code ignored;
            m_socket.close(ignored);
        }

        TransportOptions m_opts;

        boost::asio::io_context m_io;
        boost::asio::ip::tcp::socket m_socket;
        std::atomic<State> m_state{State::Disconnected};

        PacketQueue m_outgoing;
        PacketQueue m_incoming;

        std::mutex m_framingMu;
        FrameAssembler m_assembler;

        // Touched only by the thread running pump_().
        ByteBuffer m_readBuffer;
        std::vector<ByteBuffer> m_inFlight;
        bool m_sendInFlight = false;
        bool m_receiveInFlight = false;

        std::atomic<bool> m_stop{false};
        std::promise<void> m_loopDonePromise;
        std::future<void> m_loopDone;
        std::thread m_thread;
    };
}
