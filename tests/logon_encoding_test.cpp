/*
Purpose: Byte-level layout of the Logon message.

What this tests: Logon(simID=7, "TestSim") produces a 76 byte buffer whose header
carries type 11 and whose body carries simID 7 followed by the ASCII name; a
name longer than 48 bytes is cut to exactly 48 with no terminator.
*/

#include "messages.hpp"

#include <cassert>
#include <cstring>
#include <string>

int main()
{
    using namespace apphys;

    // Scenario: short name.
    {
        const ByteBuffer b = encode_message(Logon{7, "TestSim"}, 0);
        assert(b.size() == 24 + 4 + 48);

        WireReader r(as_span(b));
        const MessageHeader h = read_header(r);
        assert(h.version == 1);
        assert(h.msgType == 11);
        assert(h.length == 76);
        assert(r.read_u32() == 7);
        assert(std::memcmp(b.data() + 28, "TestSim", 7) == 0);

        // Raw offsets: version at 0, type at 2.
        assert(std::to_integer<int>(b[0]) == 0 && std::to_integer<int>(b[1]) == 1);
        assert(std::to_integer<int>(b[2]) == 0 && std::to_integer<int>(b[3]) == 11);
    }

    // Truncation to the field width.
    {
        const std::string longName(70, 'N');
        const ByteBuffer b = encode_message(Logon{3, longName}, 0);
        assert(b.size() == 76);
        for (std::size_t i = 28; i < 76; ++i)
        {
            assert(b[i] == std::byte{'N'});
        }

        auto d = decode_message<Logon>(as_span(b));
        assert(d.has_value());
        assert(d->body.name == std::string(48, 'N'));
        assert(d->body.simID == 3);
    }

    // Exactly 48 characters fill the field with no terminator.
    {
        const std::string name(48, 'x');
        const ByteBuffer b = encode_message(Logon{1, name}, 0);
        assert(b.size() == 76);
        assert(b.back() == std::byte{'x'});
        auto d = decode_message<Logon>(as_span(b));
        assert(d && d->body.name == name);
    }

    return 0;
}
