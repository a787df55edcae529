#include <doctest/doctest.h>
#include "espfleet/telnet.hpp"
#include "rfc2217.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <string>
#include <thread>

#include <sys/socket.h>
#include <termios.h>
#include <unistd.h>

using namespace espfleet;
namespace tn = espfleet::telnet;

using Bytes = std::vector<uint8_t>;

namespace {

// Feed @p wire through a decoder; data bytes into @p data, requests into @p negs.
void decode(const Bytes& wire, Bytes& data, std::vector<tn::negotiation>& negs) {
    tn::decoder dec;
    for (uint8_t b : wire) {
        uint8_t d = 0;
        tn::negotiation n;
        switch (dec.feed(b, d, n)) {
            case tn::event::data:      data.push_back(d); break;
            case tn::event::negotiate: negs.push_back(n); break;
            case tn::event::none:      break;
        }
    }
}

bool contains(const Bytes& hay, const Bytes& needle) {
    return std::search(hay.begin(), hay.end(), needle.begin(), needle.end()) != hay.end();
}

// Minimal ser2net stand-in: accepts one client, sends @p greeting, then
// records everything the client sends until it hangs up. A non-empty
// @p hang_up_on makes the server close first once those bytes arrive.
class FakeSer2net {
public:
    explicit FakeSer2net(Bytes greeting, Bytes hang_up_on = {})
        : greeting_(std::move(greeting)), hang_up_on_(std::move(hang_up_on)) {
        thread_ = std::thread([this] { serve(); });
    }
    ~FakeSer2net() {
        ::shutdown(listener_.fd(), SHUT_RDWR);
        listener_.close();
        if (thread_.joinable()) thread_.join();
    }
    int port() const { return listener_.port(); }

    // Waits for the client to disconnect, then returns what it sent.
    const Bytes& received() {
        if (thread_.joinable()) thread_.join();
        return received_;
    }

private:
    void serve() {
        int fd = ::accept(listener_.fd(), nullptr, nullptr);
        if (fd < 0) return;
        ::send(fd, greeting_.data(), greeting_.size(), MSG_NOSIGNAL);
        uint8_t buf[256];
        ssize_t n;
        while ((n = ::recv(fd, buf, sizeof buf, 0)) > 0) {
            received_.insert(received_.end(), buf, buf + n);
            if (!hang_up_on_.empty() && contains(received_, hang_up_on_)) break;
        }
        ::close(fd);
    }

    espfleet_test::Listener listener_;
    Bytes                   greeting_;
    Bytes                   hang_up_on_;
    Bytes                   received_;
    std::thread             thread_;
};

} // namespace

TEST_CASE("escape doubles IAC and nothing else") {
    const uint8_t in[] = {0x01, 0xFF, 0x41, 0xFF, 0xFF};
    Bytes out;
    tn::escape(in, sizeof in, out);
    CHECK(out == Bytes{0x01, 0xFF, 0xFF, 0x41, 0xFF, 0xFF, 0xFF, 0xFF});
}

TEST_CASE("set_baudrate_command encodes the rate big endian") {
    CHECK(tn::set_baudrate_command(115200) ==
          Bytes{0xFF, 0xFA, 44, 1, 0x00, 0x01, 0xC2, 0x00, 0xFF, 0xF0});
    // 0x0000FFFF: each 0xFF payload byte is doubled.
    CHECK(tn::set_baudrate_command(65535) ==
          Bytes{0xFF, 0xFA, 44, 1, 0x00, 0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xF0});
}

TEST_CASE("decoder separates data, negotiation and subnegotiation") {
    const Bytes wire = {
        'o', 'k',
        0xFF, 0xFF,                                       // literal 0xFF
        0xFF, 0xFD, 44,                                   // DO COM-PORT
        0xFF, 0xFA, 44, 101, 0x00, 0x01, 0xFF, 0xFF, 0xC2, 0x00, 0xFF, 0xF0,  // SB ... SE
        0xFF, 0xF1,                                       // NOP
        '\n',
    };
    Bytes data;
    std::vector<tn::negotiation> negs;
    decode(wire, data, negs);

    CHECK(data == Bytes{'o', 'k', 0xFF, '\n'});
    REQUIRE(negs.size() == 1);
    CHECK(negs[0].verb == tn::DO);
    CHECK(negs[0].option == tn::OPT_COM_PORT);
}

TEST_CASE("decoder keeps state across feeds split mid-command") {
    tn::decoder dec;
    uint8_t d = 0;
    tn::negotiation n;
    CHECK(dec.feed(0xFF, d, n) == tn::event::none);
    CHECK(dec.feed(0xFB, d, n) == tn::event::none);
    CHECK(dec.feed(0x00, d, n) == tn::event::negotiate);
    CHECK(n.verb == tn::WILL);
    CHECK(n.option == tn::OPT_BINARY);
    CHECK(dec.feed('x', d, n) == tn::event::data);
    CHECK(d == 'x');
}

TEST_CASE("negotiator: acks of our own offers are not answered") {
    tn::negotiator neg;
    CHECK(neg.start() == Bytes{0xFF, 0xFB, 44, 0xFF, 0xFB, 0, 0xFF, 0xFD, 0});

    Bytes out;
    neg.respond({tn::DO, tn::OPT_COM_PORT}, out);
    neg.respond({tn::DO, tn::OPT_BINARY}, out);
    neg.respond({tn::WILL, tn::OPT_BINARY}, out);
    CHECK(out.empty());
    CHECK(neg.local_enabled(tn::OPT_COM_PORT));
    CHECK(neg.local_enabled(tn::OPT_BINARY));
    CHECK(neg.remote_enabled(tn::OPT_BINARY));

    // Repeating a request for the current state stays silent.
    neg.respond({tn::DO, tn::OPT_COM_PORT}, out);
    CHECK(out.empty());
}

TEST_CASE("negotiator: unsolicited requests and refusals") {
    tn::negotiator neg;
    Bytes out;

    neg.respond({tn::DO, tn::OPT_BINARY}, out);
    CHECK(out == Bytes{0xFF, tn::WILL, tn::OPT_BINARY});

    out.clear();
    neg.respond({tn::DO, 1 /* ECHO */}, out);
    CHECK(out == Bytes{0xFF, tn::WONT, 1});

    out.clear();
    neg.respond({tn::WILL, tn::OPT_COM_PORT}, out);
    CHECK(out == Bytes{0xFF, tn::DONT, tn::OPT_COM_PORT});
    CHECK_FALSE(neg.remote_enabled(tn::OPT_COM_PORT));

    out.clear();
    neg.respond({tn::DONT, tn::OPT_BINARY}, out);
    CHECK(out == Bytes{0xFF, tn::WONT, tn::OPT_BINARY});
    CHECK_FALSE(neg.local_enabled(tn::OPT_BINARY));

    // Already off: no reply.
    out.clear();
    neg.respond({tn::DONT, tn::OPT_BINARY}, out);
    neg.respond({tn::WONT, 3}, out);
    CHECK(out.empty());
}

TEST_CASE("looks_like_text needs five bytes, mostly printable") {
    CHECK_FALSE(looks_like_text({}));
    CHECK_FALSE(looks_like_text({'a', 'b', 'c', 'd'}));
    CHECK(looks_like_text({'b', 'o', 'o', 't', '\r', '\n'}));
    CHECK_FALSE(looks_like_text({0x00, 0xF8, 0x80, 0x1C, 0xE0, 'a', 'b'}));
    // 7 of 10 printable is not enough; 8 of 10 is.
    CHECK_FALSE(looks_like_text({'a', 'a', 'a', 'a', 'a', 'a', 'a', 0x00, 0x00, 0x00}));
    CHECK(looks_like_text({'a', 'a', 'a', 'a', 'a', 'a', 'a', 'a', 0x00, 0x00}));
}

TEST_CASE("Rfc2217Client negotiates, sets the baud rate and relays data") {
    FakeSer2net server({
        0xFF, tn::DO, tn::OPT_COM_PORT,
        0xFF, tn::DO, tn::OPT_BINARY,
        0xFF, tn::WILL, tn::OPT_BINARY,
        'r', 'e', 'a', 'd', 'y', 0xFF, 0xFF, '\n',
    });

    Rfc2217Client client;
    REQUIRE(client.open(server.port(), 115200, 2000).ok());

    Bytes data;
    REQUIRE(client.read(data, 7, 2000).ok());
    CHECK(data == Bytes{'r', 'e', 'a', 'd', 'y', 0xFF, '\n'});

    const uint8_t keys[] = {'h', 0xFF};
    REQUIRE(client.write(keys, sizeof keys).ok());
    client.close();

    const Bytes& sent = server.received();
    CHECK(contains(sent, {0xFF, tn::WILL, tn::OPT_COM_PORT}));
    CHECK(contains(sent, tn::set_baudrate_command(115200)));
    CHECK(contains(sent, {'h', 0xFF, 0xFF}));
    // Every DO/WILL was an ack of our offers, so no WONT/DONT went out.
    CHECK_FALSE(contains(sent, {0xFF, tn::WONT}));
    CHECK_FALSE(contains(sent, {0xFF, tn::DONT}));
}

TEST_CASE("Rfc2217Client: a server refusing COM-PORT-OPTION is rfc2217_refused") {
    FakeSer2net server({0xFF, tn::DONT, tn::OPT_COM_PORT});

    Rfc2217Client client;
    Status st = client.open(server.port(), 115200, 2000);
    CHECK(st.kind == ErrorKind::ProtocolParse);
    CHECK(st.reason == "rfc2217_refused");
    CHECK_FALSE(client.is_open());
}

TEST_CASE("Rfc2217Client: nothing listening is connect_failed") {
    Rfc2217Client client;
    Status st = client.open(espfleet_test::unused_port(), 115200, 500);
    CHECK(st.kind == ErrorKind::Connection);
    CHECK(st.reason == "connect_failed");

    Bytes data;
    CHECK(client.read_available(data, 0).reason == "not_connected");
    CHECK(client.open(0, 115200, 500).reason == "bad_port");
}

TEST_CASE("detect_baud picks the first rate that produces text") {
    FakeSer2net server({
        0xFF, tn::DO, tn::OPT_COM_PORT,
        'r', 's', 't', ':', '0', 'x', '1', '\r', '\n',
    });
    CHECK(detect_baud(server.port(), 1000) == 115200);
}

TEST_CASE("run_monitor ends on server hang-up and leaves the terminal as it found it") {
    FakeSer2net server({0xFF, tn::DO, tn::OPT_COM_PORT}, tn::set_baudrate_command(115200));

    Rfc2217Client client;
    REQUIRE(client.open(server.port(), 115200, 2000).ok());

    termios before{};
    const bool tty = ::tcgetattr(STDIN_FILENO, &before) == 0;

    Status st = run_monitor(client, true);
    CHECK(st.kind == ErrorKind::Connection);
    CHECK(st.reason == "connection_closed");

    if (tty) {
        termios after{};
        REQUIRE(::tcgetattr(STDIN_FILENO, &after) == 0);
        CHECK(after.c_lflag == before.c_lflag);
        CHECK(after.c_iflag == before.c_iflag);
    }
}
