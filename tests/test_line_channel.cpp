#include "line_channel.hpp"
#include "errors.hpp"
#include "local_peer.hpp"

#include <catch2/catch.hpp>

#include <sys/socket.h>

using namespace mailhealth;
using namespace mailhealth::testing;
using std::chrono::milliseconds;
using std::chrono::steady_clock;

namespace {

ChannelEndpoint loopback(int port) {
    ChannelEndpoint ep;
    ep.host = "127.0.0.1";
    ep.port = port;
    ep.timeout = std::chrono::seconds(30);
    return ep;
}

void send_text(int fd, const std::string& s) {
    ::send(fd, s.data(), s.size(), MSG_NOSIGNAL);
}

} // namespace

TEST_CASE("lines are framed on CRLF and the terminator stripped", "[channel][socket]") {
    LocalPeer peer([](int fd) { send_text(fd, "* OK ready\r\nA001 OK done\r\n{3}\r\nabc"); });
    auto ch = NetLineChannel::open(loopback(peer.port()));

    REQUIRE(ch->readLine() == "* OK ready");
    REQUIRE(ch->readLine() == "A001 OK done");
    REQUIRE(ch->readLine() == "{3}");
    REQUIRE(ch->readExact(3) == "abc");
    REQUIRE_FALSE(ch->isTls());
}

TEST_CASE("peer closing mid-line is a connection error", "[channel][socket]") {
    LocalPeer peer([](int fd) { send_text(fd, "* OK partial"); });
    auto ch = NetLineChannel::open(loopback(peer.port()));
    REQUIRE_THROWS_AS(ch->readLine(), ConnectionError);
}

TEST_CASE("trickling peer cannot hold a session past its deadline", "[channel][socket]") {
    LocalPeer peer([](int fd) {
        send_text(fd, "* OK ready\r\n");
        trickle(fd, "* SEARCH 1 2 3 4 5 6 7 8 9 10 11 12 13 14 15", milliseconds(100));
    });
    ChannelEndpoint ep = loopback(peer.port());
    const auto start = steady_clock::now();
    ep.deadline = start + milliseconds(400);
    auto ch = NetLineChannel::open(ep);

    REQUIRE(ch->readLine() == "* OK ready");
    REQUIRE_THROWS_AS(ch->readLine(), TimeoutError);
    REQUIRE(steady_clock::now() - start < milliseconds(2000));
}

TEST_CASE("deadline already passed fails before connecting", "[channel]") {
    ChannelEndpoint ep = loopback(1);
    ep.deadline = steady_clock::now() - milliseconds(1);
    REQUIRE_THROWS_AS(NetLineChannel::open(ep), TimeoutError);
}
