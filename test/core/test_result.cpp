#include <catch2/catch_test_macros.hpp>

#include <ghmcp/core/result.hpp>

#include <cerrno>
#include <string>

using namespace ghmcp;

// ===========================================================================
// Result
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
    CHECK(r.ValueOr(0) == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("failure");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "failure");
    CHECK(r.ValueOr(99) == 99);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error::ClosedPipe("op"));
    REQUIRE(err.IsErr());
    CHECK(err.Error().category == ErrorCategory::ClosedPipe);
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: stream signals", "[result][error]") {
    auto eos = Error::EndOfStream("IoLogger::Read");
    CHECK(eos.Is(ErrorCategory::EndOfStream));
    CHECK(eos.CategoryName() == "end_of_stream");
    CHECK(eos.ExitCode() == 0);

    auto pipe = Error::ClosedPipe("IoLogger::Write");
    CHECK(pipe.Is(ErrorCategory::ClosedPipe));
    CHECK(pipe.CategoryName() == "closed_pipe");
    CHECK(eos != pipe);
}

TEST_CASE("Error: FromErrno keeps errno and message", "[result][error]") {
    auto e = Error::FromErrno("FdSource::Read", EBADF);
    CHECK(e.category == ErrorCategory::Io);
    REQUIRE(e.sys_errno.has_value());
    CHECK(*e.sys_errno == EBADF);
    CHECK_FALSE(e.message.empty());
    CHECK(e.ExitCode() == 2);
}

TEST_CASE("Error: FromHttpStatus extracts API message", "[result][error]") {
    auto e = Error::FromHttpStatus("probe", "https://raw.h/_ping", 404,
                                   R"({"message":"Not Found","documentation_url":"x"})");
    CHECK(e.http_status == 404);
    REQUIRE(e.api_message.has_value());
    CHECK(*e.api_message == "Not Found");
    CHECK(e.ToString() == "probe [https://raw.h/_ping] (HTTP 404): Not found - API: Not Found");
}

TEST_CASE("Error: FromHttpStatus tolerates non-JSON bodies", "[result][error]") {
    auto e = Error::FromHttpStatus("probe", "", 503, "<html>down</html>");
    CHECK_FALSE(e.api_message.has_value());
    CHECK(e.category == ErrorCategory::Connection);

    auto t = Error::FromHttpStatus("probe", "", 429);
    CHECK(t.category == ErrorCategory::Timeout);
    CHECK(t.ExitCode() == 3);

    auto other = Error::FromHttpStatus("probe", "", 418);
    CHECK(other.message == "Unexpected HTTP 418");
}
