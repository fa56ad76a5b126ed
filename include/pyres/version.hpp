#pragma once

#include <pyres/result.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace pyres {

// PEP 440 version: [N!]N(.N)*[{a|b|rc}N][.postN][.devN][+local]
struct Version {
    enum class PreTag { Alpha, Beta, Rc };

    uint64_t epoch = 0;
    std::vector<uint64_t> release;
    std::optional<PreTag> pre_tag;
    uint64_t pre_num = 0;
    std::optional<uint64_t> post;
    std::optional<uint64_t> dev;
    std::string local;  // normalized: lowercase, '.'-separated, empty if none

    static Result<Version> parse(const std::string& s);

    // Normalized form, e.g. "1!2.0rc1.post2.dev3+ubuntu.1"
    std::string to_string() const;

    bool is_prerelease() const { return pre_tag.has_value() || dev.has_value(); }
    bool is_postrelease() const { return post.has_value(); }

    // Epoch and release only ("base_version")
    Version base() const;
    Version without_local() const;

    // <0, 0, >0 with PEP 440 ordering
    int compare(const Version& o) const;

    bool operator==(const Version& o) const { return compare(o) == 0; }
    bool operator!=(const Version& o) const { return compare(o) != 0; }
    bool operator<(const Version& o) const { return compare(o) < 0; }
    bool operator<=(const Version& o) const { return compare(o) <= 0; }
    bool operator>(const Version& o) const { return compare(o) > 0; }
    bool operator>=(const Version& o) const { return compare(o) >= 0; }
};

enum class SpecOp {
    Compatible,  // ~=
    Equal,       // ==
    NotEqual,    // !=
    LessEq,      // <=
    GreaterEq,   // >=
    Less,        // <
    Greater,     // >
    Arbitrary,   // ===
};

struct VersionSpecifier {
    SpecOp op = SpecOp::Equal;
    Version version;          // unused for Arbitrary
    std::string text;         // version text as written (after the operator)
    bool wildcard = false;    // "==1.2.*" / "!=1.2.*"

    static Result<VersionSpecifier> parse(const std::string& s);

    // Pure operator semantics; pre-release policy lives in SpecifierSet
    bool contains(const Version& v) const;

    // True when this specifier explicitly names a pre-release
    bool names_prerelease() const;

    std::string to_string() const;
};

// Conjunction of specifiers: ">=1.0, <2.0, !=1.5.*"
struct SpecifierSet {
    std::vector<VersionSpecifier> specs;

    // Empty input is an empty (match-everything) set
    static Result<SpecifierSet> parse(const std::string& s);

    bool empty() const { return specs.empty(); }

    // Pre-releases match only if allowed or named by one of the specifiers
    bool contains(const Version& v, bool prereleases = false) const;

    bool names_prerelease() const;

    // True if any specifier pins an exact version ("==X" or "===X")
    bool is_pinned() const;

    // Conjunction in place; duplicates are kept out
    void merge(const SpecifierSet& other);

    std::string to_string() const;
};

} // namespace pyres
