#include <catch2/catch.hpp>
#include <pyres/distribution.hpp>

using namespace pyres;

// ===== Wheel filenames =====

TEST_CASE("parse wheel filename", "[distribution]") {
    auto r = DistFilename::parse("requests-2.31.0-py3-none-any.whl");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DistKind::Wheel);
    REQUIRE(r.value().project == "requests");
    REQUIRE(r.value().version.to_string() == "2.31.0");
    REQUIRE(r.value().build_tag.empty());
    REQUIRE(r.value().tags.size() == 1);
    REQUIRE(r.value().tags[0] == (WheelTag{"py3", "none", "any"}));
}

TEST_CASE("compressed tag sets expand", "[distribution]") {
    auto r = DistFilename::parse("six-1.16.0-py2.py3-none-any.whl");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().tags.size() == 2);

    auto multi = DistFilename::parse(
        "numpy-1.26.0-cp311-cp311-manylinux_2_17_x86_64.manylinux2014_x86_64.whl");
    REQUIRE(multi.is_ok());
    REQUIRE(multi.value().tags.size() == 2);
    REQUIRE(multi.value().tags[1].platform == "manylinux2014_x86_64");
}

TEST_CASE("wheel build tag", "[distribution]") {
    auto r = DistFilename::parse("pkg-1.0-1b-py3-none-any.whl");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().build_tag == "1b");

    REQUIRE(DistFilename::parse("pkg-1.0-x-py3-none-any.whl").is_err());
}

TEST_CASE("malformed wheel filenames", "[distribution]") {
    REQUIRE(DistFilename::parse("pkg-py3-none-any.whl").is_err());
    REQUIRE(DistFilename::parse("pkg-notaversion-py3-none-any.whl").is_err());
    REQUIRE(DistFilename::parse("pkg-1.0-py3-none-any.whl", "other").is_err());
    REQUIRE(DistFilename::parse("Pkg_Name-1.0-py3-none-any.whl", "pkg-name").is_ok());
}

// ===== Source distributions =====

TEST_CASE("parse sdist filenames", "[distribution]") {
    auto r = DistFilename::parse("Django-4.2.tar.gz");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().kind == DistKind::Sdist);
    REQUIRE(r.value().project == "django");
    REQUIRE(r.value().version.to_string() == "4.2");

    auto z = DistFilename::parse("zope.interface-5.0.zip");
    REQUIRE(z.is_ok());
    REQUIRE(z.value().project == "zope-interface");
}

TEST_CASE("sdist names containing dashes", "[distribution]") {
    auto r = DistFilename::parse("foo-bar-1.0.tar.gz");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().project == "foo-bar");
    REQUIRE(r.value().version.to_string() == "1.0");

    auto hinted = DistFilename::parse("foo-bar-1.0.tar.gz", "foo-bar");
    REQUIRE(hinted.is_ok());
    REQUIRE(hinted.value().version.to_string() == "1.0");

    REQUIRE(DistFilename::parse("foo-bar-1.0.tar.gz", "baz").is_err());
}

TEST_CASE("unknown archive types", "[distribution]") {
    REQUIRE(DistFilename::parse("pkg-1.0.exe").is_err());
    REQUIRE(DistFilename::parse("pkg.tar.gz").is_err());
    REQUIRE(DistFilename::looks_like_distribution("pkg-1.0.tar.bz2"));
    REQUIRE(DistFilename::looks_like_distribution("pkg-1.0-py3-none-any.whl"));
    REQUIRE_FALSE(DistFilename::looks_like_distribution("pkg-1.0.exe"));
}

// ===== URLs =====

TEST_CASE("distribution file URLs", "[distribution]") {
    DistFile f;
    f.url = "https://files.example.org/p/a-1.0-py3-none-any.whl#sha256=abcd";
    REQUIRE(f.url_without_fragment() == "https://files.example.org/p/a-1.0-py3-none-any.whl");
    REQUIRE(f.metadata_url() == "https://files.example.org/p/a-1.0-py3-none-any.whl.metadata");

    REQUIRE(url_filename(f.url) == "a-1.0-py3-none-any.whl");
    REQUIRE(url_filename("https://x.org/a-1.0.tar.gz?download=1") == "a-1.0.tar.gz");
    REQUIRE(url_filename("a-1.0.tar.gz") == "a-1.0.tar.gz");
}
