#include <catch2/catch.hpp>
#include <pyres/provider.hpp>
#include <pyres/log.hpp>

#include <map>

using namespace pyres;

// ---------------------------------------------------------------------------
// In-memory package universe
// ---------------------------------------------------------------------------

static Requirement req(const std::string& s) {
    auto r = Requirement::parse(s);
    INFO(s);
    REQUIRE(r.is_ok());
    return r.value();
}

static ProjectName pname(const std::string& s) {
    return ProjectName::parse(s).value();
}

struct MemorySupplier : CandidateSupplier {
    std::map<std::string, CandidateList> projects;
    std::vector<std::string> prefetched;

    CandidatePtr add(const std::string& name, const std::string& version, bool yanked = false) {
        auto c = std::make_shared<Candidate>();
        c->name = pname(name);
        c->version = Version::parse(version).value();
        c->kind = SourceKind::Sdist;
        c->file.filename = c->name.normalized() + "-" + version + ".tar.gz";
        c->file.url = "https://files.example.org/" + c->file.filename;
        c->file.yanked = yanked;
        projects[c->name.normalized()].push_back(c);
        return c;
    }

    Result<CandidateSequence> candidates(const ProjectName& name,
                                         const std::vector<const Requirement*>&) override {
        auto it = projects.find(name.normalized());
        if (it == projects.end()) {
            return PyresError{PyresError::ProjectNotFound, "no project " + name.raw()};
        }
        return Result<CandidateSequence>::ok(CandidateSequence(
            std::make_shared<const CandidateList>(it->second)));
    }

    void prefetch(const ProjectName& name) override { prefetched.push_back(name.normalized()); }
};

struct MemoryExpander : RequirementExpander {
    std::map<std::string, std::shared_ptr<const CandidateMetadata>> metadata_by_key;

    void set(const Candidate& c, std::vector<std::string> requires_dist,
             std::string requires_python = "", ExtraSet extras = {}) {
        auto m = std::make_shared<CandidateMetadata>();
        m->name = c.name.raw();
        m->version = c.version.to_string();
        for (const auto& line : requires_dist) m->requires_dist.push_back(req(line));
        m->requires_python = std::move(requires_python);
        m->provides_extra = std::move(extras);
        metadata_by_key[c.to_string()] = std::move(m);
    }

    Result<std::shared_ptr<const CandidateMetadata>> metadata(const Candidate& c) override {
        auto it = metadata_by_key.find(c.to_string());
        if (it == metadata_by_key.end()) {
            return PyresError{PyresError::MetadataUnavailable, "no metadata for " + c.to_string()};
        }
        return Result<std::shared_ptr<const CandidateMetadata>>::ok(it->second);
    }
};

struct ProviderFixture {
    MemorySupplier index;
    DirectUrlSupplier direct;
    MemoryExpander expander;
    Environment env = Environment::from_python_and_os("3.11", "linux").value();

    ProviderFixture() { log::set_level(log::Off); }
    ~ProviderFixture() { log::set_level(log::Info); }

    PackageProvider provider(bool prereleases = false) {
        ProviderOptions opts;
        opts.prereleases = prereleases;
        return PackageProvider(index, direct, expander, env, opts);
    }

    std::vector<std::string> versions(const std::string& project,
                                      const std::vector<Requirement>& reqs,
                                      bool prereleases = false) {
        std::vector<const Requirement*> ptrs;
        for (const auto& r : reqs) ptrs.push_back(&r);
        auto p = provider(prereleases);
        auto matches = p.find_matches(pname(project), ptrs);
        REQUIRE(matches.is_ok());
        std::vector<std::string> out;
        for (const auto& c : matches.value()) out.push_back(c->version.to_string());
        return out;
    }
};

using Versions = std::vector<std::string>;

// ===== find_matches =====

TEST_CASE("matches satisfy every requirement, best first", "[provider]") {
    ProviderFixture fx;
    fx.index.add("pkg", "3.0");
    fx.index.add("pkg", "2.1");
    fx.index.add("pkg", "2.0");
    fx.index.add("pkg", "1.0");

    REQUIRE(fx.versions("pkg", {req("pkg")}) == Versions{"3.0", "2.1", "2.0", "1.0"});
    REQUIRE(fx.versions("pkg", {req("pkg>=2.0"), req("pkg<3")}) == Versions{"2.1", "2.0"});
    REQUIRE(fx.versions("pkg", {req("pkg>=2.0"), req("pkg<2")}).empty());
}

TEST_CASE("unknown project has no matches", "[provider]") {
    ProviderFixture fx;
    REQUIRE(fx.versions("ghost", {req("ghost")}).empty());
}

TEST_CASE("yanked releases only match exact pins", "[provider]") {
    ProviderFixture fx;
    fx.index.add("pkg", "2.0", true);
    fx.index.add("pkg", "1.0");

    REQUIRE(fx.versions("pkg", {req("pkg")}) == Versions{"1.0"});
    REQUIRE(fx.versions("pkg", {req("pkg==2.0")}) == Versions{"2.0"});
}

TEST_CASE("pre-releases", "[provider]") {
    ProviderFixture fx;
    fx.index.add("pkg", "2.0b1");
    fx.index.add("pkg", "1.0");

    SECTION("excluded by default") {
        REQUIRE(fx.versions("pkg", {req("pkg")}) == Versions{"1.0"});
    }
    SECTION("allowed globally") {
        REQUIRE(fx.versions("pkg", {req("pkg")}, true) == Versions{"2.0b1", "1.0"});
    }
    SECTION("allowed when a specifier names one") {
        REQUIRE(fx.versions("pkg", {req("pkg>=2.0a1")}) == Versions{"2.0b1"});
    }
    SECTION("used when no final release fits") {
        REQUIRE(fx.versions("pkg", {req("pkg>=1.5")}) == Versions{"2.0b1"});
    }
}

TEST_CASE("direct references bypass the index", "[provider][direct]") {
    ProviderFixture fx;
    fx.index.add("pkg", "9.0");
    auto direct = req("pkg @ https://example.org/pkg-1.2.tar.gz#sha256=ab");

    auto matches = fx.versions("pkg", {direct});
    REQUIRE(matches == Versions{"1.2"});
    REQUIRE(fx.versions("pkg", {direct, req("pkg>=1.0")}) == Versions{"1.2"});
    REQUIRE(fx.versions("pkg", {direct, req("pkg>=2.0")}).empty());
    REQUIRE(fx.versions("pkg", {direct, req("pkg @ https://example.org/other/pkg-1.2.tar.gz")})
                .empty());
}

TEST_CASE("incompatible direct wheel has no matches", "[provider][direct]") {
    ProviderFixture fx;
    REQUIRE(fx.versions("pkg", {req("pkg @ https://example.org/pkg-1.0-cp311-cp311-win_amd64.whl")})
                .empty());
    REQUIRE(fx.versions("pkg", {req("pkg @ https://example.org/pkg-1.0-py3-none-any.whl")}) ==
            Versions{"1.0"});
}

TEST_CASE("direct reference without a version in the filename", "[provider][direct]") {
    ProviderFixture fx;
    REQUIRE(fx.versions("pkg", {req("pkg @ https://example.org/download?id=3")}).empty());
}

// ===== DirectUrlSupplier =====

TEST_CASE("candidate from a direct reference", "[provider][direct]") {
    auto c = DirectUrlSupplier::candidate_for(
        req("my-pkg @ https://example.org/dist/my_pkg-0.3-py3-none-any.whl#sha256=abcd"));
    REQUIRE(c.is_ok());
    REQUIRE(c.value()->kind == SourceKind::DirectUrl);
    REQUIRE(c.value()->version.to_string() == "0.3");
    REQUIRE(c.value()->file.filename == "my_pkg-0.3-py3-none-any.whl");
    REQUIRE(c.value()->file.hashes.at("sha256") == "abcd");

    auto bad = DirectUrlSupplier::candidate_for(req("pkg @ https://example.org/other-1.0.tar.gz"));
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == PyresError::MetadataUnavailable);
}

TEST_CASE("direct URLs compare without hash fragments", "[provider][direct]") {
    REQUIRE(normalize_direct_url("https://x.org/a.whl#sha256=1") == "https://x.org/a.whl");
    REQUIRE(normalize_direct_url("https://x.org/a.whl") == "https://x.org/a.whl");
}

// ===== is_satisfied_by =====

TEST_CASE("is_satisfied_by", "[provider]") {
    ProviderFixture fx;
    auto pre = fx.index.add("pkg", "2.0rc1");
    auto final_release = fx.index.add("pkg", "1.0");
    auto p = fx.provider();

    REQUIRE(p.is_satisfied_by(req("pkg>=1.0"), *final_release));
    REQUIRE_FALSE(p.is_satisfied_by(req("pkg>1.0"), *final_release));
    REQUIRE_FALSE(p.is_satisfied_by(req("other"), *final_release));
    REQUIRE(p.is_satisfied_by(req("pkg>=1.0"), *pre));
    REQUIRE_FALSE(p.is_satisfied_by(req("pkg @ https://files.example.org/pkg-1.0.tar.gz"),
                                    *final_release));
}

// ===== dependencies =====

TEST_CASE("dependencies filtered by markers and extras", "[provider][deps]") {
    ProviderFixture fx;
    auto c = fx.index.add("pkg", "1.0");
    fx.expander.set(*c, {
        "six",
        "pywin32; sys_platform == 'win32'",
        "importlib-metadata; python_version < '3.8'",
        "pytest; extra == 'test'",
    }, "", {"test"});
    auto p = fx.provider();

    auto plain = p.dependencies(*c, {});
    REQUIRE(plain.is_ok());
    REQUIRE(plain.value().size() == 1);
    REQUIRE(plain.value()[0].name.normalized() == "six");

    auto with_test = p.dependencies(*c, {"test"});
    REQUIRE(with_test.is_ok());
    REQUIRE(with_test.value().size() == 2);
    REQUIRE(with_test.value()[1].name.normalized() == "pytest");

    auto unknown_extra = p.dependencies(*c, {"docs"});
    REQUIRE(unknown_extra.is_ok());
    REQUIRE(unknown_extra.value().size() == 1);
}

TEST_CASE("Requires-Python excludes a candidate", "[provider][deps]") {
    ProviderFixture fx;
    auto c = fx.index.add("pkg", "1.0");
    fx.expander.set(*c, {}, ">=3.12");
    auto r = fx.provider().dependencies(*c, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
}

TEST_CASE("missing metadata propagates", "[provider][deps]") {
    ProviderFixture fx;
    auto c = fx.index.add("pkg", "1.0");
    auto r = fx.provider().dependencies(*c, {});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PyresError::MetadataUnavailable);
}

TEST_CASE("prefetch reaches the index supplier", "[provider]") {
    ProviderFixture fx;
    auto p = fx.provider();
    p.prefetch(pname("Some_Pkg"));
    REQUIRE(fx.index.prefetched == std::vector<std::string>{"some-pkg"});
}
