#include <catch2/catch_test_macros.hpp>

#include <ghmcp/io/stream.hpp>

#include <array>
#include <sstream>
#include <string>

#include <fcntl.h>
#include <unistd.h>

using namespace ghmcp;

namespace {

// pipe(2) wrapper that closes whatever the test did not.
struct Pipe {
    int fds[2] = {-1, -1};
    Pipe() { REQUIRE(::pipe(fds) == 0); }
    ~Pipe() {
        for (int fd : fds) {
            if (fd >= 0) ::close(fd);
        }
    }
};

} // anonymous namespace

TEST_CASE("IstreamSource: reads then reports end of stream", "[stream]") {
    std::istringstream in("hello");
    IstreamSource source(in);

    std::array<char, 16> buf{};
    auto r = source.Read(buf.data(), buf.size());
    REQUIRE(r.IsOk());
    CHECK(std::string(buf.data(), r.Value()) == "hello");

    auto end = source.Read(buf.data(), buf.size());
    REQUIRE(end.IsErr());
    CHECK(end.Error().category == ErrorCategory::EndOfStream);
}

TEST_CASE("IstreamSource: small buffer reads in pieces", "[stream]") {
    std::istringstream in("abcdef");
    IstreamSource source(in);

    std::array<char, 4> buf{};
    auto first = source.Read(buf.data(), buf.size());
    REQUIRE(first.IsOk());
    CHECK(std::string(buf.data(), first.Value()) == "abcd");
    auto second = source.Read(buf.data(), buf.size());
    REQUIRE(second.IsOk());
    CHECK(std::string(buf.data(), second.Value()) == "ef");
}

TEST_CASE("OstreamSink: writes all bytes", "[stream]") {
    std::ostringstream out;
    OstreamSink sink(out);

    auto r = sink.Write("world", 5);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == 5);
    CHECK(out.str() == "world");
}

TEST_CASE("FdSink/FdSource: round trip through a pipe", "[stream]") {
    Pipe p;
    FdSource source(p.fds[0]);
    FdSink sink(p.fds[1]);

    auto w = sink.Write("ping\n", 5);
    REQUIRE(w.IsOk());
    CHECK(w.Value() == 5);

    std::array<char, 16> buf{};
    auto r = source.Read(buf.data(), buf.size());
    REQUIRE(r.IsOk());
    CHECK(std::string(buf.data(), r.Value()) == "ping\n");

    // Closing the write end makes the reader see end of stream.
    REQUIRE(sink.Close().IsOk());
    p.fds[1] = -1;
    auto end = source.Read(buf.data(), buf.size());
    REQUIRE(end.IsErr());
    CHECK(end.Error().category == ErrorCategory::EndOfStream);

    REQUIRE(source.Close().IsOk());
    p.fds[0] = -1;
}

TEST_CASE("FdSource: Close is idempotent and stops reads", "[stream]") {
    Pipe p;
    FdSource source(p.fds[0]);
    p.fds[0] = -1;

    CHECK(source.Close().IsOk());
    CHECK(source.Close().IsOk());

    std::array<char, 4> buf{};
    auto r = source.Read(buf.data(), buf.size());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::EndOfStream);
}

TEST_CASE("FdSink: write after Close is a closed pipe", "[stream]") {
    Pipe p;
    FdSink sink(p.fds[1]);
    p.fds[1] = -1;

    REQUIRE(sink.Close().IsOk());
    auto r = sink.Write("x", 1);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ClosedPipe);
}

TEST_CASE("FdSource: invalid descriptor reports errno", "[stream]") {
    FdSource source(-1);
    std::array<char, 4> buf{};
    auto r = source.Read(buf.data(), buf.size());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Io);
    REQUIRE(r.Error().sys_errno.has_value());
    CHECK(*r.Error().sys_errno == EBADF);
}

TEST_CASE("FdSource: Close keeps the descriptor number reserved", "[stream]") {
    Pipe p;
    int fd = p.fds[0];
    p.fds[0] = -1;
    {
        FdSource source(fd);
        REQUIRE(source.Close().IsOk());

        // Still open (now on /dev/null), so the number cannot be handed to
        // an unrelated file while another thread might use it.
        CHECK(::fcntl(fd, F_GETFD) != -1);

        std::array<char, 4> buf{};
        auto r = source.Read(buf.data(), buf.size());
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::EndOfStream);
    }
    // The destructor releases it.
    CHECK(::fcntl(fd, F_GETFD) == -1);
}

TEST_CASE("FdSink: Close releases the pipe for the reader", "[stream]") {
    Pipe p;
    FdSink sink(p.fds[1]);
    p.fds[1] = -1;

    REQUIRE(sink.Close().IsOk());
    std::array<char, 4> buf{};
    CHECK(::read(p.fds[0], buf.data(), buf.size()) == 0);
}
