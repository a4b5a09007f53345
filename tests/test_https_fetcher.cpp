#include "https_fetcher.hpp"
#include "errors.hpp"
#include "local_peer.hpp"

#include <catch2/catch.hpp>

#include <sys/socket.h>

using namespace mailhealth;
using namespace mailhealth::testing;

namespace {

// Drains the request head so the client sees a well-behaved server.
void read_request(int fd) {
    std::string raw;
    char buf[1024];
    while (raw.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return;
        raw.append(buf, static_cast<size_t>(n));
    }
}

} // namespace

TEST_CASE("plain response is split into status, headers and body", "[http][client]") {
    const HttpResponseMessage r = parse_http_response(
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/html; charset=UTF-8\r\n"
        "X-Frame-Options:SAMEORIGIN\r\n"
        "\r\n"
        "<h2>Your lovely total: 8/10</h2>");

    REQUIRE(r.status == 200);
    REQUIRE(r.reason == "OK");
    REQUIRE(r.header("content-type") == "text/html; charset=UTF-8");
    REQUIRE(r.header("Content-Type") == "text/html; charset=UTF-8");
    REQUIRE(r.header("x-frame-options") == "SAMEORIGIN");
    REQUIRE(r.header("location").empty());
    REQUIRE(r.body == "<h2>Your lovely total: 8/10</h2>");
}

TEST_CASE("redirect keeps its location header", "[http][client]") {
    const HttpResponseMessage r = parse_http_response(
        "HTTP/1.1 302 Found\r\nLocation: /en/test-abc\r\nContent-Length: 0\r\n\r\n");
    REQUIRE(r.status == 302);
    REQUIRE(r.reason == "Found");
    REQUIRE(r.header("location") == "/en/test-abc");
    REQUIRE(r.body.empty());
}

TEST_CASE("chunked bodies are reassembled", "[http][client]") {
    REQUIRE(decode_chunked("5\r\nhello\r\n6\r\n world\r\n0\r\n\r\n") == "hello world");
    REQUIRE(decode_chunked("a;ext=1\r\n0123456789\r\n0\r\n\r\n") == "0123456789");
    REQUIRE(decode_chunked("0\r\n\r\n").empty());

    const HttpResponseMessage r = parse_http_response(
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
        "4\r\nYour\r\n8\r\n lovely \r\nD\r\ntotal: 9.5/10\r\n0\r\n\r\n");
    REQUIRE(r.body == "Your lovely total: 9.5/10");
}

TEST_CASE("truncated final chunk keeps what arrived", "[http][client]") {
    REQUIRE(decode_chunked("5\r\nhello\r\n6\r\n wor") == "hello wor");
}

TEST_CASE("malformed responses are protocol errors", "[http][client]") {
    REQUIRE_THROWS_AS(parse_http_response(""), ProtocolError);
    REQUIRE_THROWS_AS(parse_http_response("garbage\r\n\r\n"), ProtocolError);
    REQUIRE_THROWS_AS(parse_http_response("HTTP/1.1 200 OK\r\nContent-Length: 3\r\n"), ProtocolError);
    REQUIRE_THROWS_AS(decode_chunked("zz\r\nhello\r\n"), ProtocolError);
}

TEST_CASE("unsupported URL scheme fails before any I/O", "[http][client]") {
    HttpsScoreFetcher fetcher(std::chrono::milliseconds(1000));
    REQUIRE_THROWS_AS(fetcher.fetch("ftp://www.mail-tester.com/test-abc"), ConnectionError);
}

TEST_CASE("plain HTTP fetch returns the body", "[http][client][socket]") {
    LocalPeer peer([](int fd) {
        read_request(fd);
        const std::string res = "HTTP/1.1 200 OK\r\nContent-Type: text/html\r\n\r\n<h2>total: 9/10</h2>";
        ::send(fd, res.data(), res.size(), MSG_NOSIGNAL);
    });
    HttpsScoreFetcher fetcher(std::chrono::milliseconds(2000));
    REQUIRE(fetcher.fetch("http://127.0.0.1:" + std::to_string(peer.port()) + "/test-abc") ==
            "<h2>total: 9/10</h2>");
}

TEST_CASE("trickling server cannot stretch a fetch past its timeout", "[http][client][socket]") {
    LocalPeer peer([](int fd) {
        read_request(fd);
        trickle(fd, "HTTP/1.1 200 OK\r\nX-Padding: aaaaaaaaaaaaaaaaaaaaaaaaaaaa", std::chrono::milliseconds(100));
    });
    HttpsScoreFetcher fetcher(std::chrono::milliseconds(500));

    const auto start = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(fetcher.fetch("http://127.0.0.1:" + std::to_string(peer.port()) + "/"), TimeoutError);
    REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(2));
}
