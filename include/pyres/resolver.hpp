#pragma once

#include <pyres/result.hpp>
#include <pyres/candidate.hpp>
#include <pyres/provider.hpp>
#include <pyres/requirement.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pyres {

class CancelToken;
class RunContext;

enum class ResolverPhase { Seeding, Expanding, Backtracking, Satisfied, Exhausted };

const char* phase_name(ResolverPhase phase);

// Progress hook. Called on the resolving thread only.
class ResolverObserver {
public:
    virtual ~ResolverObserver() = default;
    virtual void on_phase(ResolverPhase) {}
    virtual void on_pin(const Candidate&, size_t /*depth*/) {}
    virtual void on_reject(const Candidate&, const std::string& /*reason*/) {}
    virtual void on_backtrack(const ProjectName&, size_t /*depth*/) {}
    virtual void on_conflict(const PyresError&) {}
};

struct ResolveOptions {
    bool prereleases = false;
    size_t max_rounds = 200000;             // candidate attempts before giving up
    std::chrono::seconds timeout{0};        // 0 = unlimited
};

// One pinned project in a resolved graph
struct ResolvedNode {
    CandidatePtr candidate;
    ExtraSet extras;
    std::vector<std::string> parents;     // normalized names, sorted
    std::vector<std::string> children;    // normalized names, sorted
    bool is_root = false;                 // named by a root requirement

    // Package URL, e.g. "pkg:pypi/requests@2.31.0"
    std::string package_url() const;
};

// Result of a successful resolution. Keys are normalized project names;
// iteration is name-sorted.
class ResolvedGraph {
public:
    void add_node(const std::string& name, ResolvedNode node);
    void add_edge(const std::string& parent, const std::string& child);

    const ResolvedNode* find(const std::string& name) const;
    const std::map<std::string, ResolvedNode>& nodes() const { return nodes_; }
    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }

    std::vector<std::string> roots() const;
    std::vector<std::string> parents_of(const std::string& name) const;
    std::vector<std::string> children_of(const std::string& name) const;

    // Dependencies before dependents (Kahn). Cycles are broken by releasing
    // the smallest waiting name on a cycle, so the order is always complete.
    std::vector<std::string> install_order() const;

    // Nested view from the roots, one "name==version" per line
    std::string tree() const;

    // "name==version" per line, sorted
    std::string to_requirements() const;

private:
    bool on_cycle(const std::string& name, const std::set<std::string>& emitted) const;
    void tree_impl(const std::string& name, const std::string& prefix, bool is_last,
                   bool top, std::set<std::string>& visited, std::string& out) const;

    std::map<std::string, ResolvedNode> nodes_;
};

// Backtracking dependency solver. Chooses one candidate per project so that
// every requirement naming a project is satisfied by its pin; on a dead end
// it returns to the most recent decision and tries its next candidate.
class Resolver {
public:
    Resolver(PackageProvider& provider, ResolveOptions options = {},
             ResolverObserver* observer = nullptr, CancelToken* cancel = nullptr);

    // Roots are filtered by their markers first. Constraints restrict the
    // versions of projects that appear, without adding projects.
    Result<ResolvedGraph> resolve(const std::vector<Requirement>& roots,
                                  const std::vector<Requirement>& constraints = {});

    size_t rounds() const { return rounds_; }
    size_t backtracks() const { return backtracks_; }

private:
    struct Search;

    PackageProvider& provider_;
    ResolveOptions options_;
    ResolverObserver* observer_;
    CancelToken* cancel_;
    size_t rounds_ = 0;
    size_t backtracks_ = 0;
};

// Resolves against the run context's index, caches and prefetch pool
Result<ResolvedGraph> resolve(RunContext& ctx, const std::vector<Requirement>& roots,
                              const ResolveOptions& options = {},
                              const std::vector<Requirement>& constraints = {},
                              ResolverObserver* observer = nullptr);

} // namespace pyres
