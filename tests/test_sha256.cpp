#include <catch2/catch.hpp>
#include <pyres/sha256.hpp>
#include <pyres/log.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace pyres;
namespace fs = std::filesystem;

TEST_CASE("SHA256 empty string", "[sha256]") {
    REQUIRE(Sha256::of("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_CASE("SHA256 'abc' (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::of("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("SHA256 448-bit message (NIST vector)", "[sha256]") {
    REQUIRE(Sha256::of("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq") ==
            "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST_CASE("SHA256 one million 'a' (NIST vector)", "[sha256]") {
    Sha256 ctx;
    std::string chunk(1000, 'a');
    for (int i = 0; i < 1000; ++i) ctx.update(chunk);
    REQUIRE(ctx.finish_hex() == "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_CASE("SHA256 incremental update matches one-shot", "[sha256]") {
    // Lengths around the 55/56/64 byte padding boundaries
    for (size_t len : {55u, 56u, 63u, 64u, 65u, 127u, 128u}) {
        std::string data(len, 'x');
        for (size_t i = 0; i < len; ++i) data[i] = static_cast<char>('a' + i % 26);

        Sha256 ctx;
        for (char c : data) ctx.update(&c, 1);
        INFO("length " << len);
        REQUIRE(ctx.finish_hex() == Sha256::of(data));
    }
}

TEST_CASE("SHA256 of_file matches of() on the same content", "[sha256]") {
    fs::path p = fs::temp_directory_path() / ("pyres_sha_" + std::to_string(
        std::chrono::steady_clock::now().time_since_epoch().count()));
    std::string content = "pkg-1.0-py3-none-any.whl contents\n";
    {
        std::ofstream out(p, std::ios::binary);
        out << content;
    }
    auto r = Sha256::of_file(p);
    std::error_code ec;
    fs::remove(p, ec);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == Sha256::of(content));
}

TEST_CASE("SHA256 of_file on a missing file", "[sha256]") {
    auto r = Sha256::of_file("/nonexistent/file.whl");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::IO);
}

TEST_CASE("verify_sha256 against listed hashes", "[sha256]") {
    std::map<std::string, std::string> hashes = {
        {"sha256", "BA7816BF8F01CFEA414140DE5DAE2223B00361A396177A9CB410FF61F20015AD"},
    };
    REQUIRE(verify_sha256("abc", hashes, "abc.whl").is_ok());

    auto bad = verify_sha256("abd", hashes, "abc.whl");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == PyresError::Checksum);
    REQUIRE(bad.error().message.find("abc.whl") != std::string::npos);
}

TEST_CASE("verify_sha256 skips files without a sha256", "[sha256]") {
    log::set_level(log::Off);
    REQUIRE(verify_sha256("anything", {}, "x.tar.gz").is_ok());
    REQUIRE(verify_sha256("anything", {{"md5", "00"}}, "x.tar.gz").is_ok());
    log::set_level(log::Info);
}
