#include <catch2/catch.hpp>
#include <pyres/process.hpp>
#include <pyres/cancel.hpp>

#include <cstdlib>
#include <filesystem>

using namespace pyres;
namespace fs = std::filesystem;

TEST_CASE("captures stdout, stderr and exit code", "[process]") {
    auto r = run_command({"sh", "-c", "echo hi; echo oops 1>&2; exit 3"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 3);
    REQUIRE(r.value().stdout_str == "hi\n");
    REQUIRE(r.value().stderr_str == "oops\n");
}

TEST_CASE("large output does not block the child", "[process]") {
    auto r = run_command({"sh", "-c", "i=0; while [ $i -lt 20000 ]; do echo line$i; i=$((i+1)); done"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 0);
    REQUIRE(r.value().stdout_str.size() > 100000);
}

TEST_CASE("extra environment reaches the child", "[process]") {
    CommandOptions opts;
    opts.env["PYRES_TEST_VALUE"] = "from-parent";
    auto r = run_command({"sh", "-c", "printf %s \"$PYRES_TEST_VALUE\""}, opts);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "from-parent");
}

TEST_CASE("overrides replace inherited variables", "[process]") {
    setenv("PYRES_TEST_KEEP", "kept", 1);
    setenv("PYRES_TEST_REPLACED", "old", 1);
    CommandOptions opts;
    opts.env["PYRES_TEST_REPLACED"] = "new";
    auto r = run_command({"sh", "-c",
        "printf '%s %s %s' \"$PYRES_TEST_KEEP\" \"$PYRES_TEST_REPLACED\" "
        "\"$(env | grep -c '^PYRES_TEST_REPLACED=')\""}, opts);
    unsetenv("PYRES_TEST_KEEP");
    unsetenv("PYRES_TEST_REPLACED");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().stdout_str == "kept new 1");
}

TEST_CASE("working directory", "[process]") {
    CommandOptions opts;
    opts.working_dir = fs::temp_directory_path().string();
    auto r = run_command({"sh", "-c", "pwd -P"}, opts);
    REQUIRE(r.is_ok());
    std::string expected = fs::canonical(fs::temp_directory_path()).string() + "\n";
    REQUIRE(r.value().stdout_str == expected);
}

TEST_CASE("missing executable exits 127", "[process]") {
    auto r = run_command({"pyres-no-such-program-here"});
    REQUIRE(r.is_ok());
    REQUIRE(r.value().exit_code == 127);
}

TEST_CASE("empty argument list", "[process]") {
    auto r = run_command({});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::InvalidArg);
}

TEST_CASE("timeout kills the child", "[process]") {
    CommandOptions opts;
    opts.timeout_seconds = 1;
    auto r = run_command({"sleep", "10"}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::IO);
    REQUIRE(r.error().message.find("timed out") != std::string::npos);
}

TEST_CASE("cancellation stops the child", "[process]") {
    CancelToken token;
    token.cancel();
    CommandOptions opts;
    opts.cancel = &token;
    auto r = run_command({"sleep", "10"}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::Cancelled);
}

TEST_CASE("deadline counts as cancellation", "[process]") {
    CancelToken token;
    token.set_deadline(CancelToken::Clock::now());
    CommandOptions opts;
    opts.cancel = &token;
    auto r = run_command({"sleep", "10"}, opts);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::Cancelled);

    token.reset();
    REQUIRE_FALSE(token.is_cancelled());
}
