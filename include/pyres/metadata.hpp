#pragma once

#include <pyres/result.hpp>
#include <pyres/candidate.hpp>
#include <pyres/marker.hpp>
#include <pyres/requirement.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pyres {

class CancelToken;
class IndexClient;

// Raw core metadata fields (METADATA / PKG-INFO, RFC 822 style headers)
struct CoreMetadata {
    std::string metadata_version;
    std::string name;
    std::string version;
    std::vector<std::string> requires_dist;
    std::string requires_python;
    std::vector<std::string> provides_extra;
    std::vector<std::string> dynamic;

    static Result<CoreMetadata> parse(const std::string& text);

    // True when the field is listed under Dynamic (case-insensitive)
    bool is_dynamic(const std::string& field) const;
};

// What the solver needs from one candidate
struct CandidateMetadata {
    std::string name;
    std::string version;
    std::vector<Requirement> requires_dist;
    std::string requires_python;
    ExtraSet provides_extra;
    std::string source;     // "pep658", "wheel", "pkg-info", "pyproject", "build-hook"

    // Parses the Requires-Dist lines of core metadata
    static Result<CandidateMetadata> from_core(const CoreMetadata& core,
                                               const std::string& source);
};

struct MetadataSettings {
    bool allow_build_hook = false;
    std::string python = "python3";
    int build_timeout = 300;   // seconds
};

// Finds a candidate's dependencies from the most specific source available:
// PEP 658 file, wheel METADATA, sdist PKG-INFO or static pyproject.toml,
// then (opt-in) the build backend's prepare_metadata_for_build_wheel hook.
class MetadataExtractor {
public:
    MetadataExtractor(IndexClient& index, MetadataSettings settings,
                      const CancelToken* cancel = nullptr);

    // MetadataUnavailable when no source works; Cancelled passes through
    Result<CandidateMetadata> extract(const Candidate& candidate);

    static Result<CandidateMetadata> from_wheel(const std::string& archive);

    // nullopt when the sdist's dependencies are not declared statically
    static Result<std::optional<CandidateMetadata>> from_sdist(const std::string& archive);

    const MetadataSettings& settings() const { return settings_; }

private:
    Result<CandidateMetadata> extract_any(const Candidate& candidate);
    Result<CandidateMetadata> run_build_hook(const std::string& archive,
                                             const Candidate& candidate);

    IndexClient& index_;
    MetadataSettings settings_;
    const CancelToken* cancel_;
};

} // namespace pyres
