#pragma once

#include <pyres/result.hpp>
#include <pyres/candidate.hpp>
#include <pyres/environment.hpp>
#include <pyres/metadata.hpp>
#include <pyres/requirement.hpp>
#include <memory>
#include <string>
#include <vector>

namespace pyres {

class RunContext;

// Source of candidates for a project. `requirements` are all requirements
// currently naming the project; suppliers may use them to pick a source.
class CandidateSupplier {
public:
    virtual ~CandidateSupplier() = default;

    // Candidates best first. ProjectNotFound when the project does not exist.
    virtual Result<CandidateSequence> candidates(
        const ProjectName& name, const std::vector<const Requirement*>& requirements) = 0;

    // Hint that the project will be needed soon
    virtual void prefetch(const ProjectName&) {}
};

// Source of a candidate's own declared dependencies
class RequirementExpander {
public:
    virtual ~RequirementExpander() = default;

    virtual Result<std::shared_ptr<const CandidateMetadata>> metadata(const Candidate& candidate) = 0;
};

// Index-backed candidates, memoized in the run context
class IndexSupplier : public CandidateSupplier {
public:
    explicit IndexSupplier(RunContext& ctx) : ctx_(ctx) {}

    Result<CandidateSequence> candidates(
        const ProjectName& name, const std::vector<const Requirement*>& requirements) override;
    void prefetch(const ProjectName& name) override;

private:
    RunContext& ctx_;
};

// Single candidate built from the first direct-URL requirement
class DirectUrlSupplier : public CandidateSupplier {
public:
    Result<CandidateSequence> candidates(
        const ProjectName& name, const std::vector<const Requirement*>& requirements) override;

    // Candidate for one "name @ url" requirement; the version comes from
    // the archive filename
    static Result<CandidatePtr> candidate_for(const Requirement& req);
};

// Metadata extraction, memoized in the run context
class MetadataExpander : public RequirementExpander {
public:
    explicit MetadataExpander(RunContext& ctx) : ctx_(ctx) {}

    Result<std::shared_ptr<const CandidateMetadata>> metadata(const Candidate& candidate) override;

private:
    RunContext& ctx_;
};

struct ProviderOptions {
    bool prereleases = false;     // allow pre-releases everywhere
};

// What the resolver talks to: picks the direct-URL or index supplier for a
// project, filters candidates against the requirements, and expands a
// candidate's dependencies for the target environment.
class PackageProvider {
public:
    PackageProvider(CandidateSupplier& index, CandidateSupplier& direct,
                    RequirementExpander& expander, const Environment& env,
                    ProviderOptions options = {});

    // Candidates satisfying every requirement, best first. Empty when none
    // do or the project does not exist.
    Result<CandidateList> find_matches(const ProjectName& name,
                                       const std::vector<const Requirement*>& requirements);

    // True when the candidate satisfies the requirement's specifier or URL
    bool is_satisfied_by(const Requirement& req, const Candidate& candidate) const;

    // Requirements of the candidate that apply to the environment with the
    // given extras requested. MetadataUnavailable when the candidate is
    // unusable.
    Result<std::vector<Requirement>> dependencies(const Candidate& candidate,
                                                  const ExtraSet& extras);

    void prefetch(const ProjectName& name) { index_.prefetch(name); }

    const Environment& environment() const { return env_; }

private:
    CandidateSupplier& index_;
    CandidateSupplier& direct_;
    RequirementExpander& expander_;
    const Environment& env_;
    ProviderOptions options_;
};

// Direct references compare without their hash fragment
std::string normalize_direct_url(const std::string& url);

} // namespace pyres
