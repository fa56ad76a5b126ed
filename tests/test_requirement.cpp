#include <catch2/catch.hpp>
#include <pyres/requirement.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>

using namespace pyres;
namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// RAII temp directory
// ---------------------------------------------------------------------------

struct TempDir {
    fs::path path;

    TempDir() {
        path = fs::temp_directory_path() / ("pyres_req_test_" + std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    std::string write_file(const std::string& rel, const std::string& content) {
        fs::path full = path / rel;
        fs::create_directories(full.parent_path());
        std::ofstream f(full);
        f << content;
        return full.string();
    }
};

static Requirement req(const std::string& s) {
    auto r = Requirement::parse(s);
    INFO(s);
    REQUIRE(r.is_ok());
    return r.value();
}

// ===== Requirement parsing =====

TEST_CASE("parse name with specifier", "[requirement]") {
    auto r = req("requests>=2.8.1");
    REQUIRE(r.name.normalized() == "requests");
    REQUIRE(r.specifier.specs.size() == 1);
    REQUIRE(r.extras.empty());
    REQUIRE_FALSE(r.marker.has_value());
    REQUIRE_FALSE(r.is_direct());
}

TEST_CASE("parse bare name", "[requirement]") {
    auto r = req("Flask");
    REQUIRE(r.name.raw() == "Flask");
    REQUIRE(r.specifier.empty());
}

TEST_CASE("parse extras, specifiers and marker", "[requirement]") {
    auto r = req("requests[Security, socks] >=2.8.1, <3 ; python_version < '3.8'");
    REQUIRE(r.extras == ExtraSet{"security", "socks"});
    REQUIRE(r.specifier.specs.size() == 2);
    REQUIRE(r.marker.has_value());
    REQUIRE(r.to_string() == "requests[security,socks]<3,>=2.8.1; python_version < \"3.8\"");
}

TEST_CASE("parenthesized specifiers", "[requirement]") {
    auto r = req("pkg (>=1.0,<2)");
    REQUIRE(r.specifier.specs.size() == 2);
    REQUIRE(Requirement::parse("pkg (>=1.0").is_err());
}

TEST_CASE("empty extras brackets are allowed", "[requirement]") {
    auto r = req("pkg[]==1.0");
    REQUIRE(r.extras.empty());
    REQUIRE(r.specifier.is_pinned());
}

TEST_CASE("direct references", "[requirement]") {
    auto r = req("pkg @ https://example.org/pkg-1.0-py3-none-any.whl");
    REQUIRE(r.is_direct());
    REQUIRE(r.url == "https://example.org/pkg-1.0-py3-none-any.whl");
    REQUIRE(r.specifier.empty());

    auto m = req("pkg@https://example.org/pkg-1.0.tar.gz ; os_name == 'nt'");
    REQUIRE(m.url == "https://example.org/pkg-1.0.tar.gz");
    REQUIRE(m.marker.has_value());
    REQUIRE(m.to_string() == "pkg @ https://example.org/pkg-1.0.tar.gz ; os_name == \"nt\"");
}

TEST_CASE("malformed requirements", "[requirement]") {
    for (const char* bad : {"", "-pkg", "pkg[extra", "pkg foo", "pkg >=1.0 junk",
                            "pkg; ", "pkg; python_version >", "pkg @ notaurl",
                            "pkg @ https://x.org/a.whl junk", "pkg[bad!]"}) {
        INFO(bad);
        auto r = Requirement::parse(bad);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == PyresError::MalformedRequirement);
    }
}

TEST_CASE("malformed requirement names the offending text", "[requirement]") {
    auto r = Requirement::parse("pkg >=1.0 junk");
    REQUIRE(r.is_err());
    REQUIRE(r.error().message.find(">=1.0 junk") != std::string::npos);
}

TEST_CASE("unsupported marker variable passes through", "[requirement]") {
    auto r = Requirement::parse("pkg; python_flavor == 'x'");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::UnsupportedMarker);
}

TEST_CASE("markers decide whether a requirement applies", "[requirement]") {
    auto env = Environment::from_python_and_os("3.11", "linux").value();
    REQUIRE(req("pkg").applies_to(env));
    REQUIRE_FALSE(req("pkg; python_version < '3.8'").applies_to(env));
    REQUIRE(req("pkg; sys_platform == 'linux'").applies_to(env));
    REQUIRE_FALSE(req("pkg; extra == 'test'").applies_to(env));
    REQUIRE(req("pkg; extra == 'test'").applies_to(env, {"test"}));
}

TEST_CASE("formatted requirement parses back to itself", "[requirement]") {
    for (const char* s : {"a", "b[x]>=1", "c==1.0; os_name == \"posix\"",
                          "d @ https://x.org/d-1.0.tar.gz"}) {
        auto once = req(s).to_string();
        REQUIRE(req(once).to_string() == once);
    }
}

// ===== Requirements files =====

TEST_CASE("requirements file with options and continuations", "[requirement][file]") {
    auto r = RequirementsFile::parse(
        "# comment\n"
        "requests>=2.0  # trailing comment\n"
        "--pre\n"
        "-i https://mirror.example.org/simple\n"
        "--extra-index-url=https://extra.example.org/simple\n"
        "flask \\\n"
        "   >=2.0\n"
        "--no-binary :all:\n"
        "pkg @ https://example.org/pkg-1.0.tar.gz#sha256=abc\n"
        "\n",
        "reqs.txt", ".");
    REQUIRE(r.is_ok());
    const auto& f = r.value();
    REQUIRE(f.requirements.size() == 3);
    REQUIRE(f.requirements[0].name.normalized() == "requests");
    REQUIRE(f.requirements[0].origin == "reqs.txt:2");
    REQUIRE(f.requirements[1].name.normalized() == "flask");
    REQUIRE(f.requirements[1].specifier.specs.size() == 1);
    REQUIRE(f.requirements[1].origin == "reqs.txt:6");
    REQUIRE(f.requirements[2].url == "https://example.org/pkg-1.0.tar.gz#sha256=abc");
    REQUIRE(f.pre);
    REQUIRE(f.index_urls == std::vector<std::string>{"https://mirror.example.org/simple"});
    REQUIRE(f.extra_index_urls == std::vector<std::string>{"https://extra.example.org/simple"});
    REQUIRE(f.constraints.empty());
}

TEST_CASE("requirements file errors carry the line", "[requirement][file]") {
    auto r = RequirementsFile::parse("good==1.0\nbad req here\n", "reqs.txt", ".");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MalformedRequirement);
    REQUIRE(r.error().file == "reqs.txt");
    REQUIRE(r.error().line == 2);
}

TEST_CASE("includes and constraints files", "[requirement][file]") {
    TempDir td;
    td.write_file("common.txt", "beta==1.0\n-r base.txt\n");
    td.write_file("constraints.txt", "beta<2\n");
    std::string base = td.write_file("base.txt",
        "-r common.txt\n-c constraints.txt\nalpha\n");

    auto r = RequirementsFile::load(base);
    REQUIRE(r.is_ok());
    const auto& f = r.value();
    REQUIRE(f.requirements.size() == 2);
    REQUIRE(f.requirements[0].name.normalized() == "beta");
    REQUIRE(f.requirements[1].name.normalized() == "alpha");
    REQUIRE(f.constraints.size() == 1);
    REQUIRE(f.constraints[0].name.normalized() == "beta");
    REQUIRE(f.requirements[0].origin.find("common.txt:1") != std::string::npos);
}

TEST_CASE("missing include is an IO error", "[requirement][file]") {
    TempDir td;
    std::string base = td.write_file("base.txt", "alpha\n-r nope.txt\n");
    auto r = RequirementsFile::load(base);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::IO);
    REQUIRE(r.error().line == 2);
}

TEST_CASE("missing requirements file", "[requirement][file]") {
    auto r = RequirementsFile::load("/nonexistent/requirements.txt");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::IO);
}
