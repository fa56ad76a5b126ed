#pragma once

#include <pyres/result.hpp>
#include <pyres/environment.hpp>
#include <pyres/marker.hpp>
#include <pyres/name.hpp>
#include <pyres/version.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pyres {

// PEP 508 requirement:
//   name [extras] (specifiers | @ url) [; marker]
struct Requirement {
    ProjectName name;
    ExtraSet extras;                 // normalized
    SpecifierSet specifier;
    std::optional<Marker> marker;
    std::string url;                 // direct reference, empty if none
    std::string origin;              // "file:line" when read from a file

    static Result<Requirement> parse(const std::string& line);

    bool is_direct() const { return !url.empty(); }

    // Marker check; requirements without a marker always apply
    bool applies_to(const Environment& env, const ExtraSet& active_extras = {}) const;

    // Canonical PEP 508 text (origin not included)
    std::string to_string() const;
};

// A pip-style requirements file, with -r includes flattened
struct RequirementsFile {
    std::vector<Requirement> requirements;
    std::vector<Requirement> constraints;    // from -c files
    std::vector<std::string> index_urls;     // -i / --index-url
    std::vector<std::string> extra_index_urls;
    bool pre = false;                        // --pre

    static Result<RequirementsFile> load(const std::string& path);

    // base_dir resolves relative -r / -c paths
    static Result<RequirementsFile> parse(const std::string& content,
                                          const std::string& origin,
                                          const std::string& base_dir);
};

} // namespace pyres
