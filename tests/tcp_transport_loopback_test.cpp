/*
Purpose: Reliable transport against a real loopback TCP peer.

What this tests: Packets reach the peer in order with no more than the per-cycle
cap handed to the socket per update; replies written back in small fragments are
reassembled into whole messages; the peer closing the connection leaves
the channel disconnected and inert; a refused connect and a connect that
outlives its timeout do the same; the internal-thread mode delivers without
owner updates and shuts down on dispose.
*/

#include "messages.hpp"
#include "tcp_transport.hpp"

#include <boost/asio.hpp>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <thread>
#include <vector>

namespace
{
    using namespace apphys;
    using boost::asio::ip::tcp;
    using Clock = std::chrono::steady_clock;

    // Accepts one connection, reads `expectBytes`, writes them back in
    // `chunk`-sized pieces, then closes.
    void echo_in_fragments(tcp::acceptor &acceptor, std::size_t expectBytes, std::size_t chunk)
    {
        tcp::socket peer = acceptor.accept();
        std::vector<std::byte> data(expectBytes);
        boost::asio::read(peer, boost::asio::buffer(data));
        for (std::size_t pos = 0; pos < data.size(); pos += chunk)
        {
            const std::size_t n = std::min(chunk, data.size() - pos);
            boost::asio::write(peer, boost::asio::buffer(data.data() + pos, n));
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
        boost::system::error_code ignored;
        peer.shutdown(tcp::socket::shutdown_both, ignored);
        peer.close(ignored);
    }

    TransportOptions options_for(std::uint16_t port, bool internalThread)
    {
        TransportOptions o;
        o.remoteAddress = "127.0.0.1";
        o.remotePort = port;
        o.internalThread = internalThread;
        o.pollInterval = std::chrono::milliseconds(2);
        o.connectTimeout = std::chrono::milliseconds(2000);
        return o;
    }
}

int main()
{
    Logger::instance().set_level(LogLevel::Off);

    boost::asio::io_context serverIo;
    tcp::acceptor acceptor(serverIo, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    const std::uint16_t port = acceptor.local_endpoint().port();

    // Cooperative mode: cap, ordering, fragmented replies, peer close.
    {
        const std::uint32_t count = 120;
        std::vector<ByteBuffer> sent;
        std::size_t totalBytes = 0;
        for (std::uint32_t i = 0; i < count; ++i)
        {
            sent.push_back(encode_message(SetStaticActor{ActorID{7, i}, Vector{1, 2, 3}, Quat{}}, i));
            totalBytes += sent.back().size();
        }

        std::thread peer([&]
                         { echo_in_fragments(acceptor, totalBytes, 7); });

        TcpTransport t(options_for(port, false));
        assert(t.connected());
        assert(t.state() == TcpTransport::State::Connected);
        assert(!t.self_driven());
        t.initialize_packet_parameters(kHeaderSize, kPacketLengthOffset);

        for (const auto &p : sent)
        {
            assert(t.send_packet(p));
        }
        assert(t.pending_outgoing() == count);

        t.update();
        assert(t.pending_outgoing() == count - 50);

        std::vector<ByteBuffer> received;
        const auto deadline = Clock::now() + std::chrono::seconds(10);
        while (received.size() < count && Clock::now() < deadline)
        {
            const std::size_t before = t.pending_outgoing();
            t.update();
            assert(before - t.pending_outgoing() <= 50);
            while (auto p = t.get_incoming_packet())
            {
                received.push_back(std::move(*p));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        assert(received == sent);

        // Peer closed after echoing: the channel goes down and stays down.
        const auto closeDeadline = Clock::now() + std::chrono::seconds(5);
        while (t.connected() && Clock::now() < closeDeadline)
        {
            t.update();
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        assert(!t.connected());
        assert(t.state() == TcpTransport::State::Disconnected);
        assert(!t.send_packet(sent.front()));
        t.update();
        assert(!t.has_incoming_packet());

        peer.join();
        t.dispose();
        assert(t.state() == TcpTransport::State::Closed);
        t.dispose();
    }

    // Internal thread: no owner updates needed.
    {
        const ByteBuffer a = encode_message(LogonReady{3}, 0);
        const ByteBuffer b = encode_message(AddConvexMesh{ShapeID{3, 1}, {Vector{1, 2, 3}, Vector{4, 5, 6}}}, 1);
        std::thread peer([&]
                         { echo_in_fragments(acceptor, a.size() + b.size(), 5); });

        TcpTransport t(options_for(port, true));
        assert(t.connected());
        assert(t.self_driven());
        t.initialize_packet_parameters(kHeaderSize, kPacketLengthOffset);
        assert(t.send_packet(a));
        assert(t.send_packet(b));

        std::vector<ByteBuffer> received;
        const auto deadline = Clock::now() + std::chrono::seconds(10);
        while (received.size() < 2 && Clock::now() < deadline)
        {
            while (auto p = t.get_incoming_packet())
            {
                received.push_back(std::move(*p));
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        assert(received.size() == 2);
        assert(received[0] == a && received[1] == b);

        peer.join();
        t.dispose();
        assert(t.state() == TcpTransport::State::Closed);
    }

    // Refused connect: constructed, but disconnected for good.
    {
        std::uint16_t deadPort = 0;
        {
            tcp::acceptor probe(serverIo, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
            deadPort = probe.local_endpoint().port();
        }
        TcpTransport t(options_for(deadPort, true));
        assert(!t.connected());
        assert(t.state() == TcpTransport::State::Disconnected);
        assert(!t.self_driven());
        assert(!t.send_packet(encode_message(LogonReady{1}, 0)));
        t.update();
        assert(!t.has_incoming_packet());
        assert(!t.get_incoming_packet().has_value());
    }

    // Connect that never completes: the listener's accept queue is full, so
    // the kernel drops our SYN and the bounded wait expires.
    {
        tcp::acceptor backlogged(serverIo);
        backlogged.open(tcp::v4());
        backlogged.bind(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        backlogged.listen(0);
        const std::uint16_t stuckPort = backlogged.local_endpoint().port();

        // Non-blocking connects started and never serviced; they fill the queue.
        boost::asio::io_context fillerIo;
        std::vector<tcp::socket> fillers;
        for (int i = 0; i < 8; ++i)
        {
            fillers.emplace_back(fillerIo);
            fillers.back().async_connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), stuckPort),
                                         [](const boost::system::error_code &) {});
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        TransportOptions o = options_for(stuckPort, false);
        o.connectTimeout = std::chrono::milliseconds(200);

        const auto start = Clock::now();
        TcpTransport t(o);
        const auto elapsed = Clock::now() - start;

        assert(elapsed >= std::chrono::milliseconds(150));
        assert(elapsed < std::chrono::seconds(2));
        assert(!t.connected());
        assert(t.state() == TcpTransport::State::Disconnected);
        assert(!t.self_driven());
        t.initialize_packet_parameters(kHeaderSize, kPacketLengthOffset);
        assert(!t.send_packet(encode_message(LogonReady{1}, 0)));
        t.update();
        assert(t.state() == TcpTransport::State::Disconnected);
        assert(t.pending_outgoing() == 0);
        assert(!t.has_incoming_packet());

        t.dispose();
        assert(t.state() == TcpTransport::State::Closed);

        for (auto &f : fillers)
        {
            boost::system::error_code ignored;
            f.close(ignored);
        }
    }

    // Malformed address is a setup error.
    {
        bool threw = false;
        try
        {
            TransportOptions bad = options_for(1, false);
            bad.remoteAddress = "not-an-address";
            TcpTransport t(bad);
        }
        catch (const std::invalid_argument &)
        {
            threw = true;
        }
        assert(threw);
    }

    return 0;
}
