#pragma once

#include <pyres/result.hpp>
#include <pyres/environment.hpp>
#include <pyres/version.hpp>
#include <map>
#include <string>
#include <vector>

namespace pyres {

enum class DistKind { Wheel, Sdist };

// Parsed distribution filename:
//   wheel: {name}-{version}(-{build})?-{python}-{abi}-{platform}.whl
//   sdist: {name}-{version}.{tar.gz,zip,tar.bz2,tar.xz,tgz}
struct DistFilename {
    DistKind kind = DistKind::Sdist;
    std::string project;          // normalized
    Version version;
    std::string build_tag;        // wheels only
    std::vector<WheelTag> tags;   // wheels only, compressed sets expanded

    // project_hint (normalized) disambiguates sdist names containing '-'
    static Result<DistFilename> parse(const std::string& filename,
                                      const std::string& project_hint = "");

    static bool looks_like_distribution(const std::string& filename);
};

// One file listed by an index for a project
struct DistFile {
    std::string filename;
    std::string url;
    std::string index_url;
    std::map<std::string, std::string> hashes;           // "sha256" -> hex
    std::string requires_python;
    bool yanked = false;
    std::string yanked_reason;
    bool has_metadata = false;                           // PEP 658 / 714
    std::map<std::string, std::string> metadata_hashes;

    // URL of the PEP 658 metadata file ("<url>.metadata", fragment dropped)
    std::string metadata_url() const;

    // URL without any "#sha256=..." fragment
    std::string url_without_fragment() const;
};

// Last path segment of a URL, without query or fragment
std::string url_filename(const std::string& url);

} // namespace pyres
