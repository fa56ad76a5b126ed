#include <catch2/catch.hpp>
#include <pyres/metadata.hpp>
#include <pyres/index.hpp>
#include <pyres/log.hpp>

#include <map>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

using namespace pyres;

// In-memory zip (wheel) or ustar (sdist) built with libarchive
static std::string make_archive(bool zip, const std::map<std::string, std::string>& members) {
    archive* a = archive_write_new();
    if (zip) {
        archive_write_set_format_zip(a);
        archive_write_zip_set_compression_store(a);
    } else {
        archive_write_set_format_ustar(a);
    }
    std::vector<char> buf(1 << 20);
    size_t used = 0;
    archive_write_open_memory(a, buf.data(), buf.size(), &used);
    for (const auto& kv : members) {
        archive_entry* e = archive_entry_new();
        archive_entry_set_pathname(e, kv.first.c_str());
        archive_entry_set_size(e, static_cast<la_int64_t>(kv.second.size()));
        archive_entry_set_filetype(e, AE_IFREG);
        archive_entry_set_perm(e, 0644);
        archive_write_header(a, e);
        archive_write_data(a, kv.second.data(), kv.second.size());
        archive_entry_free(e);
    }
    archive_write_close(a);
    archive_write_free(a);
    return std::string(buf.data(), used);
}

const char* const k_metadata =
    "Metadata-Version: 2.1\n"
    "Name: Demo-Pkg\n"
    "Version: 1.0\n"
    "Requires-Python: >=3.8\n"
    "Requires-Dist: requests>=2.0\n"
    "Requires-Dist: pytest; extra == \"test\"\n"
    "Provides-Extra: Test\n"
    "\n"
    "Requires-Dist: not-a-header-this-is-the-description\n";

// ===== CoreMetadata =====

TEST_CASE("parse core metadata headers", "[metadata]") {
    auto r = CoreMetadata::parse(k_metadata);
    REQUIRE(r.is_ok());
    const auto& m = r.value();
    REQUIRE(m.metadata_version == "2.1");
    REQUIRE(m.name == "Demo-Pkg");
    REQUIRE(m.version == "1.0");
    REQUIRE(m.requires_python == ">=3.8");
    REQUIRE(m.requires_dist.size() == 2);
    REQUIRE(m.provides_extra == std::vector<std::string>{"Test"});
}

TEST_CASE("continuation lines and dynamic fields", "[metadata]") {
    auto r = CoreMetadata::parse(
        "Metadata-Version: 2.2\r\n"
        "Name: pkg\r\n"
        "Summary: first line\r\n"
        "        second line\r\n"
        "Dynamic: requires-dist\r\n");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_dynamic("Requires-Dist"));
    REQUIRE_FALSE(r.value().is_dynamic("Version"));
}

TEST_CASE("metadata without a name", "[metadata]") {
    REQUIRE(CoreMetadata::parse("Version: 1.0\n").is_err());
    REQUIRE(CoreMetadata::parse("").is_err());
    auto bad = CoreMetadata::parse("Name pkg\n");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == PyresError::Parse);
}

TEST_CASE("candidate metadata from core fields", "[metadata]") {
    auto meta = CandidateMetadata::from_core(CoreMetadata::parse(k_metadata).value(), "wheel");
    REQUIRE(meta.is_ok());
    REQUIRE(meta.value().requires_dist.size() == 2);
    REQUIRE(meta.value().requires_dist[1].marker.has_value());
    REQUIRE(meta.value().provides_extra == ExtraSet{"test"});
    REQUIRE(meta.value().source == "wheel");
}

TEST_CASE("malformed Requires-Dist is an error", "[metadata]") {
    auto core = CoreMetadata::parse("Name: pkg\nRequires-Dist: bad req here\n").value();
    auto meta = CandidateMetadata::from_core(core, "wheel");
    REQUIRE(meta.is_err());
    REQUIRE(meta.error().code == PyresError::MalformedRequirement);
}

// ===== Archives =====

TEST_CASE("wheel METADATA", "[metadata][archive]") {
    std::string whl = make_archive(true, {
        {"demo_pkg/__init__.py", ""},
        {"demo_pkg-1.0.dist-info/METADATA", k_metadata},
        {"demo_pkg-1.0.dist-info/RECORD", ""},
    });
    auto r = MetadataExtractor::from_wheel(whl);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().name == "Demo-Pkg");
    REQUIRE(r.value().requires_dist.size() == 2);
}

TEST_CASE("wheel without METADATA", "[metadata][archive]") {
    std::string whl = make_archive(true, {{"demo_pkg/__init__.py", ""}});
    REQUIRE(MetadataExtractor::from_wheel(whl).is_err());
    REQUIRE(MetadataExtractor::from_wheel("not an archive").is_err());
}

TEST_CASE("sdist PKG-INFO 2.2 is authoritative", "[metadata][archive]") {
    std::string sdist = make_archive(false, {
        {"pkg-1.0/PKG-INFO", "Metadata-Version: 2.2\nName: pkg\nVersion: 1.0\n"
                             "Requires-Dist: six\n"},
        {"pkg-1.0/setup.py", "raise SystemExit(1)\n"},
    });
    auto r = MetadataExtractor::from_sdist(sdist);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_value());
    REQUIRE(r.value()->source == "pkg-info");
    REQUIRE(r.value()->requires_dist.size() == 1);
}

TEST_CASE("sdist falls back to static pyproject dependencies", "[metadata][archive]") {
    std::string sdist = make_archive(false, {
        {"pkg-1.0/PKG-INFO", "Metadata-Version: 2.1\nName: pkg\nVersion: 1.0\n"},
        {"pkg-1.0/pyproject.toml", R"(
[project]
name = "pkg"
version = "1.0"
requires-python = ">=3.8"
dependencies = ["attrs>=21", "colorama; os_name == 'nt'"]

[project.optional-dependencies]
Docs = ["sphinx"]
)"},
    });
    auto r = MetadataExtractor::from_sdist(sdist);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().has_value());
    const auto& m = *r.value();
    REQUIRE(m.source == "pyproject");
    REQUIRE(m.requires_dist.size() == 3);
    REQUIRE(m.provides_extra == ExtraSet{"docs"});

    auto env = Environment::from_python_and_os("3.11", "linux").value();
    REQUIRE_FALSE(m.requires_dist[2].applies_to(env));
    REQUIRE(m.requires_dist[2].applies_to(env, {"docs"}));
}

TEST_CASE("dynamic sdist dependencies are not static", "[metadata][archive]") {
    std::string dynamic = make_archive(false, {
        {"pkg-1.0/pyproject.toml",
         "[project]\nname = \"pkg\"\ndynamic = [\"version\", \"dependencies\"]\n"},
    });
    auto r = MetadataExtractor::from_sdist(dynamic);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());

    std::string legacy = make_archive(false, {{"pkg-1.0/setup.py", "print()\n"}});
    auto l = MetadataExtractor::from_sdist(legacy);
    REQUIRE(l.is_ok());
    REQUIRE_FALSE(l.value().has_value());
}

// ===== MetadataExtractor =====

struct FakeTransport : HttpTransport {
    std::map<std::string, std::string> bodies;
    std::map<std::string, long> failing;   // url -> HTTP status
    std::vector<std::string> unreachable;
    std::vector<std::string> requested;

    Result<HttpResponse> get(const HttpRequest& request) override {
        requested.push_back(request.url);
        for (const auto& u : unreachable) {
            if (u == request.url) {
                return PyresError{PyresError::Network, "connection refused"};
            }
        }
        HttpResponse r;
        auto bad = failing.find(request.url);
        if (bad != failing.end()) {
            r.status = bad->second;
            return Result<HttpResponse>::ok(r);
        }
        auto it = bodies.find(request.url);
        if (it == bodies.end()) {
            r.status = 404;
        } else {
            r.status = 200;
            r.body = it->second;
        }
        return Result<HttpResponse>::ok(r);
    }
};

struct ExtractorFixture {
    FakeTransport transport;
    Environment env = Environment::from_python_and_os("3.11", "linux").value();
    IndexClient index;
    MetadataExtractor extractor;

    ExtractorFixture()
        : index(transport, env, settings()), extractor(index, MetadataSettings{}) {
        log::set_level(log::Off);
    }
    ~ExtractorFixture() { log::set_level(log::Info); }

    static IndexSettings settings() {
        IndexSettings s;
        s.retry.max_attempts = 1;
        return s;
    }

    static Candidate candidate(const std::string& filename, const std::string& version) {
        Candidate c;
        c.name = ProjectName::parse("demo-pkg").value();
        c.version = Version::parse(version).value();
        c.kind = filename.size() > 4 && filename.compare(filename.size() - 4, 4, ".whl") == 0
            ? SourceKind::Wheel : SourceKind::Sdist;
        c.file.filename = filename;
        c.file.url = "https://files.example.org/" + filename;
        return c;
    }
};

TEST_CASE("PEP 658 metadata is used before downloading", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");
    c.file.has_metadata = true;
    fx.transport.bodies[c.file.url + ".metadata"] = k_metadata;

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source == "pep658");
    REQUIRE(fx.transport.requested == std::vector<std::string>{c.file.url + ".metadata"});
}

TEST_CASE("wheel is downloaded when no metadata file exists", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");
    c.file.has_metadata = true;
    fx.transport.bodies[c.file.url] = make_archive(true, {
        {"demo_pkg-1.0.dist-info/METADATA", k_metadata}});

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().source == "wheel");
    REQUIRE(fx.transport.requested.size() == 2);
}

TEST_CASE("metadata for a different version is rejected", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-2.0-py3-none-any.whl", "2.0");
    fx.transport.bodies[c.file.url] = make_archive(true, {
        {"demo_pkg-1.0.dist-info/METADATA", k_metadata}});

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
}

TEST_CASE("dynamic sdist without the build hook", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0.tar.gz", "1.0");
    fx.transport.bodies[c.file.url] = make_archive(false, {
        {"demo_pkg-1.0/setup.py", "print()\n"}});

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
    REQUIRE(r.error().hint.find("build time") != std::string::npos);
}

TEST_CASE("missing artifact", "[metadata][extract]") {
    ExtractorFixture fx;
    auto r = fx.extractor.extract(ExtractorFixture::candidate("demo_pkg-1.0.tar.gz", "1.0"));
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
}

TEST_CASE("unreachable artifact stops the run instead of pruning", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");

    SECTION("server error") {
        fx.transport.failing[c.file.url] = 503;
    }
    SECTION("connection failure") {
        fx.transport.unreachable.push_back(c.file.url);
    }

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::IndexUnavailable);
}

TEST_CASE("artifact gone from the index prunes the candidate", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");
    fx.transport.failing[c.file.url] = 410;
    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
}

TEST_CASE("malformed Requires-Dist in a wheel is reported as such", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");
    fx.transport.bodies[c.file.url] = make_archive(true, {
        {"demo_pkg-1.0.dist-info/METADATA",
         "Metadata-Version: 2.1\nName: demo-pkg\nVersion: 1.0\nRequires-Dist: bad req here\n"}});

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MalformedRequirement);
}

TEST_CASE("checksum mismatch is not treated as missing metadata", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");
    c.file.hashes["sha256"] = std::string(64, '0');
    fx.transport.bodies[c.file.url] = make_archive(true, {
        {"demo_pkg-1.0.dist-info/METADATA", k_metadata}});

    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::Checksum);
}

TEST_CASE("corrupt wheel prunes the candidate", "[metadata][extract]") {
    ExtractorFixture fx;
    auto c = ExtractorFixture::candidate("demo_pkg-1.0-py3-none-any.whl", "1.0");
    fx.transport.bodies[c.file.url] = "this is not a zip file";
    auto r = fx.extractor.extract(c);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
}
