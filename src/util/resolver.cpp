#include <pyres/resolver.hpp>
#include <pyres/cancel.hpp>
#include <pyres/context.hpp>
#include <pyres/log.hpp>

#include <algorithm>
#include <cstddef>
#include <optional>
#include <set>

namespace pyres {

const char* phase_name(ResolverPhase phase) {
    switch (phase) {
    case ResolverPhase::Seeding:      return "seeding";
    case ResolverPhase::Expanding:    return "expanding";
    case ResolverPhase::Backtracking: return "backtracking";
    case ResolverPhase::Satisfied:    return "satisfied";
    case ResolverPhase::Exhausted:    return "exhausted";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// ResolvedGraph
// ---------------------------------------------------------------------------

std::string ResolvedNode::package_url() const {
    if (!candidate) return "";
    return candidate->purl();
}

void ResolvedGraph::add_node(const std::string& name, ResolvedNode node) {
    nodes_[name] = std::move(node);
}

void ResolvedGraph::add_edge(const std::string& parent, const std::string& child) {
    if (parent == child) return;
    auto p = nodes_.find(parent);
    auto c = nodes_.find(child);
    if (p == nodes_.end() || c == nodes_.end()) return;

    auto insert_sorted = [](std::vector<std::string>& v, const std::string& s) {
        auto it = std::lower_bound(v.begin(), v.end(), s);
        if (it == v.end() || *it != s) v.insert(it, s);
    };
    insert_sorted(p->second.children, child);
    insert_sorted(c->second.parents, parent);
}

const ResolvedNode* ResolvedGraph::find(const std::string& name) const {
    auto it = nodes_.find(ProjectName::normalize(name));
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<std::string> ResolvedGraph::roots() const {
    std::vector<std::string> out;
    for (const auto& [name, node] : nodes_) {
        if (node.is_root) out.push_back(name);
    }
    return out;
}

std::vector<std::string> ResolvedGraph::parents_of(const std::string& name) const {
    const ResolvedNode* node = find(name);
    return node ? node->parents : std::vector<std::string>{};
}

std::vector<std::string> ResolvedGraph::children_of(const std::string& name) const {
    const ResolvedNode* node = find(name);
    return node ? node->children : std::vector<std::string>{};
}

bool ResolvedGraph::on_cycle(const std::string& name,
                             const std::set<std::string>& emitted) const {
    std::set<std::string> seen;
    std::vector<std::string> stack(nodes_.at(name).children);
    while (!stack.empty()) {
        std::string cur = stack.back();
        stack.pop_back();
        if (cur == name) return true;
        if (emitted.count(cur) || !seen.insert(cur).second) continue;
        const auto& children = nodes_.at(cur).children;
        stack.insert(stack.end(), children.begin(), children.end());
    }
    return false;
}

std::vector<std::string> ResolvedGraph::install_order() const {
    // Kahn's algorithm over dependency -> dependent edges, with a sorted
    // ready set so ties always break the same way
    std::map<std::string, size_t> pending;
    std::set<std::string> ready;
    for (const auto& [name, node] : nodes_) {
        pending[name] = node.children.size();
        if (node.children.empty()) ready.insert(name);
    }

    std::vector<std::string> order;
    order.reserve(nodes_.size());
    std::set<std::string> emitted;

    while (order.size() < nodes_.size()) {
        if (ready.empty()) {
            // Cycle: release the smallest waiting name that lies on one
            std::string release;
            for (const auto& [name, count] : pending) {
                if (emitted.count(name)) continue;
                if (release.empty()) release = name;
                if (on_cycle(name, emitted)) {
                    release = name;
                    break;
                }
            }
            ready.insert(release);
        }
        std::string next = *ready.begin();
        ready.erase(ready.begin());
        if (!emitted.insert(next).second) continue;
        order.push_back(next);

        for (const auto& parent : nodes_.at(next).parents) {
            if (emitted.count(parent)) continue;
            size_t& count = pending[parent];
            if (count > 0 && --count == 0) ready.insert(parent);
        }
    }
    return order;
}

void ResolvedGraph::tree_impl(const std::string& name, const std::string& prefix, bool is_last,
                              bool top, std::set<std::string>& visited, std::string& out) const {
    const ResolvedNode& node = nodes_.at(name);
    if (!top) out += prefix + (is_last ? "└── " : "├── ");
    out += node.candidate->to_string();

    if (!visited.insert(name).second) {
        out += " (*)\n";
        return;
    }
    out += "\n";

    std::string child_prefix = top ? "" : prefix + (is_last ? "    " : "│   ");
    for (size_t i = 0; i < node.children.size(); ++i) {
        tree_impl(node.children[i], child_prefix, i + 1 == node.children.size(),
                  false, visited, out);
    }
}

std::string ResolvedGraph::tree() const {
    std::string out;
    std::set<std::string> visited;
    auto top = roots();
    // A graph whose roots all sit on a cycle still gets printed
    if (top.empty() && !nodes_.empty()) top.push_back(nodes_.begin()->first);
    for (const auto& root : top) {
        tree_impl(root, "", true, true, visited, out);
    }
    return out;
}

std::string ResolvedGraph::to_requirements() const {
    std::string out;
    for (const auto& [name, node] : nodes_) {
        out += node.candidate->to_string() + "\n";
    }
    return out;
}

// ---------------------------------------------------------------------------
// Search state
// ---------------------------------------------------------------------------

namespace {

struct Edge {
    Requirement requirement;
    std::string parent;   // normalized, empty for a root requirement
};

struct Criterion {
    ProjectName name;
    std::vector<Edge> edges;
    ExtraSet extras;
    size_t discovery = 0;
};

struct State {
    std::map<std::string, CandidatePtr> pins;
    std::map<std::string, Criterion> criteria;
    // Extras whose requirements have been added for the current pin
    std::map<std::string, ExtraSet> expanded;
    size_t next_discovery = 0;
};

struct Decision {
    std::string project;
    CandidateList options;
    size_t next = 0;
    State before;
    // Earlier projects whose pins made one of the options fail
    std::set<std::string> conflicts;
};

struct Failure {
    std::string project;
    std::string detail;
    std::vector<ConflictCause> causes;
};

std::vector<ConflictCause> causes_of(const Criterion& crit) {
    std::vector<ConflictCause> out;
    for (const auto& e : crit.edges) {
        out.push_back({e.requirement.to_string(), e.parent});
    }
    return out;
}

} // anonymous namespace

struct Resolver::Search {
    Resolver& r;
    State state;
    std::vector<Decision> trail;
    std::map<std::string, std::vector<Requirement>> constraints;
    std::optional<CancelToken::Clock::time_point> deadline;

    std::optional<Failure> last_failure;
    std::map<std::string, size_t> failure_counts;
    // Pinned projects that rejected the candidate being tried
    std::set<std::string> blame;

    explicit Search(Resolver& owner) : r(owner) {}

    void set_phase(ResolverPhase phase) {
        log::trace("resolver phase: %s", phase_name(phase));
        if (r.observer_) r.observer_->on_phase(phase);
    }

    void record_failure(const std::string& project, const std::string& detail,
                        std::vector<ConflictCause> causes) {
        ++failure_counts[project];
        last_failure = Failure{project, detail, std::move(causes)};
    }

    PyresError stopped() const {
        if (r.cancel_ && r.cancel_->is_cancelled() && !r.cancel_->deadline_passed() &&
            !(deadline && CancelToken::Clock::now() >= *deadline)) {
            return PyresError{PyresError::Cancelled, "resolution cancelled"};
        }
        return PyresError{PyresError::ResolutionTimedOut,
            "resolution timed out after " + std::to_string(r.options_.timeout.count()) + "s",
            "raise the timeout or narrow the requirements"};
    }

    Status check_budget() const {
        if (r.options_.max_rounds > 0 && r.rounds_ >= r.options_.max_rounds) {
            return PyresError{PyresError::ResolutionTimedOut,
                "resolution gave up after " + std::to_string(r.rounds_) + " rounds",
                "raise max-rounds or pin some requirements"};
        }
        if ((r.cancel_ && r.cancel_->is_cancelled()) ||
            (deadline && CancelToken::Clock::now() >= *deadline)) {
            return stopped();
        }
        return ok_status();
    }

    // Cancellation surfacing from the provider means the budget ran out
    PyresError fatal(PyresError e) const {
        if (e.code == PyresError::Cancelled) return stopped();
        return e;
    }

    static bool prunable(const PyresError& e) {
        return e.code == PyresError::MetadataUnavailable ||
               e.code == PyresError::ProjectNotFound;
    }

    std::vector<const Requirement*> requirements_for(const std::string& key) const {
        std::vector<const Requirement*> out;
        auto crit = state.criteria.find(key);
        if (crit != state.criteria.end()) {
            for (const auto& e : crit->second.edges) out.push_back(&e.requirement);
        }
        auto cons = constraints.find(key);
        if (cons != constraints.end()) {
            for (const auto& c : cons->second) out.push_back(&c);
        }
        return out;
    }

    // Unpinned project to decide next: direct references first, then
    // exact pins, then the order projects were discovered in
    std::optional<std::string> select_next() const {
        std::optional<std::string> best;
        std::pair<int, size_t> best_rank{0, 0};
        for (const auto& [key, crit] : state.criteria) {
            if (state.pins.count(key) || crit.edges.empty()) continue;
            int tier = 2;
            for (const auto& e : crit.edges) {
                if (e.requirement.is_direct()) tier = 0;
                else if (tier > 1 && e.requirement.specifier.is_pinned()) tier = 1;
            }
            std::pair<int, size_t> rank{tier, crit.discovery};
            if (!best || rank < best_rank) {
                best = key;
                best_rank = rank;
            }
        }
        return best;
    }

    // Adds one requirement edge. False when it contradicts an existing pin.
    Result<bool> add_edge(const Requirement& req, const std::string& parent) {
        const std::string& key = req.name.normalized();
        auto [it, inserted] = state.criteria.try_emplace(key);
        Criterion& crit = it->second;
        if (inserted) {
            crit.name = req.name;
            crit.discovery = state.next_discovery++;
            r.provider_.prefetch(req.name);
        }
        crit.edges.push_back({req, parent});

        ExtraSet added;
        for (const auto& e : req.extras) {
            if (crit.extras.insert(e).second) added.insert(e);
        }

        auto pin = state.pins.find(key);
        if (pin == state.pins.end()) return Result<bool>::ok(true);

        if (!r.provider_.is_satisfied_by(req, *pin->second)) {
            std::string by = parent.empty() ? "a root requirement" : parent;
            log::debug("%s (from %s) conflicts with pinned %s", req.to_string().c_str(),
                       by.c_str(), pin->second->to_string().c_str());
            record_failure(key, "'" + req.to_string() + "' from " + by +
                                " excludes the chosen " + pin->second->to_string(),
                           causes_of(crit));
            blame.insert(key);
            return Result<bool>::ok(false);
        }
        if (!added.empty()) {
            auto expanded = expand_extras(pin->second);
            if (expanded.is_ok() && !expanded.value()) blame.insert(key);
            return expanded;
        }
        return Result<bool>::ok(true);
    }

    // Adds the requirements that newly requested extras bring in for a
    // project that is already pinned
    Result<bool> expand_extras(const CandidatePtr& pin) {
        const std::string& key = pin->name.normalized();
        ExtraSet done = state.expanded[key];
        ExtraSet wanted = state.criteria[key].extras;
        if (done == wanted) return Result<bool>::ok(true);
        state.expanded[key] = wanted;

        auto before = r.provider_.dependencies(*pin, done);
        if (before.is_err()) return fatal(std::move(before).error());
        auto after = r.provider_.dependencies(*pin, wanted);
        if (after.is_err()) return fatal(std::move(after).error());

        std::set<std::string> seen;
        for (const auto& req : before.value()) seen.insert(req.to_string());
        for (const auto& req : after.value()) {
            if (seen.count(req.to_string())) continue;
            auto ok = add_edge(req, key);
            if (ok.is_err() || !ok.value()) return ok;
        }
        return Result<bool>::ok(true);
    }

    // Pins a candidate and adds its requirements. False when it is unusable
    // or contradicts an existing pin.
    Result<bool> try_pin(const CandidatePtr& c) {
        const std::string& key = c->name.normalized();
        state.pins[key] = c;
        ExtraSet extras = state.criteria[key].extras;

        auto deps = r.provider_.dependencies(*c, extras);
        if (deps.is_err()) {
            if (!prunable(deps.error())) return fatal(std::move(deps).error());
            log::debug("rejecting %s: %s", c->to_string().c_str(),
                       deps.error().message.c_str());
            if (r.observer_) r.observer_->on_reject(*c, deps.error().message);
            record_failure(key, deps.error().message, causes_of(state.criteria[key]));
            return Result<bool>::ok(false);
        }

        state.expanded[key] = extras;
        for (const auto& dep : deps.value()) {
            auto ok = add_edge(dep, key);
            if (ok.is_err()) return ok;
            if (!ok.value()) {
                if (r.observer_) r.observer_->on_reject(*c, "conflicts with an earlier choice");
                return ok;
            }
        }
        // Extras may have grown while adding its own requirements
        return expand_extras(c);
    }

    // Tries the remaining candidates of the newest decision. When they run
    // out, jumps back to the newest decision implicated in the failure: a
    // parent of one of the project's requirements, or a pin one of its
    // candidates contradicted. Decisions in between are discarded unchanged.
    // Error when no implicated decision is left.
    Status advance() {
        while (!trail.empty()) {
            Decision& d = trail.back();
            while (d.next < d.options.size()) {
                PYRES_TRY(check_budget());
                ++r.rounds_;
                CandidatePtr c = d.options[d.next++];
                state = d.before;
                blame.clear();

                auto pinned = try_pin(c);
                if (pinned.is_err()) return std::move(pinned).error();
                if (pinned.value()) {
                    log::debug("pinned %s (depth %zu)", c->to_string().c_str(), trail.size());
                    if (r.observer_) r.observer_->on_pin(*c, trail.size());
                    return ok_status();
                }
                d.conflicts.insert(blame.begin(), blame.end());
            }

            std::set<std::string> implicated = std::move(d.conflicts);
            ProjectName name;
            auto crit = d.before.criteria.find(d.project);
            if (crit != d.before.criteria.end()) {
                name = crit->second.name;
                for (const auto& e : crit->second.edges) {
                    if (!e.parent.empty()) implicated.insert(e.parent);
                }
            }
            implicated.erase(d.project);

            size_t keep = trail.size() - 1;
            while (keep > 0 && !implicated.count(trail[keep - 1].project)) --keep;
            trail.erase(trail.begin() + static_cast<std::ptrdiff_t>(keep), trail.end());
            if (trail.empty()) break;

            Decision& target = trail.back();
            implicated.erase(target.project);
            target.conflicts.insert(implicated.begin(), implicated.end());
            ++r.backtracks_;
            set_phase(ResolverPhase::Backtracking);
            log::debug("backtracking from %s to %s (depth %zu)", name.normalized().c_str(),
                       target.project.c_str(), trail.size());
            if (r.observer_) r.observer_->on_backtrack(name, trail.size());
        }
        return conflict();
    }

    PyresError conflict() const {
        // Blame the project that failed most often, preferring the latest
        std::string project;
        size_t worst = 0;
        for (const auto& [name, count] : failure_counts) {
            if (count > worst || (count == worst && last_failure && name == last_failure->project)) {
                project = name;
                worst = count;
            }
        }

        PyresError e{PyresError::Conflict, "", "loosen the requirements on '" + project + "'"};
        e.project = project;
        std::string detail;
        if (last_failure && last_failure->project == project) {
            detail = last_failure->detail;
            e.causes = last_failure->causes;
        } else {
            auto crit = state.criteria.find(project);
            if (crit != state.criteria.end()) e.causes = causes_of(crit->second);
        }
        e.message = "cannot find a version of '" + project + "' that satisfies all requirements";
        if (!detail.empty()) e.message += ": " + detail;
        return e;
    }

    ResolvedGraph build_graph() const {
        ResolvedGraph g;
        for (const auto& [key, cand] : state.pins) {
            ResolvedNode node;
            node.candidate = cand;
            auto crit = state.criteria.find(key);
            if (crit != state.criteria.end()) {
                node.extras = crit->second.extras;
                node.is_root = std::any_of(crit->second.edges.begin(), crit->second.edges.end(),
                                           [](const Edge& e) { return e.parent.empty(); });
            }
            g.add_node(key, std::move(node));
        }
        for (const auto& [key, crit] : state.criteria) {
            for (const auto& e : crit.edges) {
                if (!e.parent.empty()) g.add_edge(e.parent, key);
            }
        }
        return g;
    }
};

// ---------------------------------------------------------------------------
// Resolver
// ---------------------------------------------------------------------------

Resolver::Resolver(PackageProvider& provider, ResolveOptions options,
                   ResolverObserver* observer, CancelToken* cancel)
    : provider_(provider), options_(options), observer_(observer), cancel_(cancel) {}

Result<ResolvedGraph> Resolver::resolve(const std::vector<Requirement>& roots,
                                        const std::vector<Requirement>& constraints) {
    rounds_ = 0;
    backtracks_ = 0;
    Search s(*this);
    const Environment& env = provider_.environment();

    if (options_.timeout.count() > 0) {
        s.deadline = CancelToken::Clock::now() + options_.timeout;
        if (cancel_) cancel_->set_deadline(*s.deadline);
    }

    s.set_phase(ResolverPhase::Seeding);
    for (const auto& c : constraints) {
        if (!c.applies_to(env)) continue;
        if (c.is_direct()) {
            log::warn("ignoring direct reference in constraint '%s'", c.to_string().c_str());
            continue;
        }
        s.constraints[c.name.normalized()].push_back(c);
    }
    for (const auto& req : roots) {
        if (!req.applies_to(env)) {
            log::debug("skipping '%s': marker does not match %s", req.to_string().c_str(),
                       env.to_string().c_str());
            continue;
        }
        auto added = s.add_edge(req, "");
        if (added.is_err()) return std::move(added).error();
    }

    s.set_phase(ResolverPhase::Expanding);
    for (;;) {
        PYRES_TRY(s.check_budget());
        auto next = s.select_next();
        if (!next) break;

        auto reqs = s.requirements_for(*next);
        auto matches = provider_.find_matches(s.state.criteria[*next].name, reqs);
        if (matches.is_err()) return s.fatal(std::move(matches).error());
        if (matches.value().empty()) {
            log::debug("no candidates for %s", next->c_str());
            s.record_failure(*next, "no matching version is available",
                             causes_of(s.state.criteria[*next]));
        }

        s.trail.push_back(Decision{*next, std::move(matches).value(), 0, s.state});
        auto advanced = s.advance();
        if (advanced.is_err()) {
            auto e = std::move(advanced).error();
            s.set_phase(ResolverPhase::Exhausted);
            if (observer_) observer_->on_conflict(e);
            return e;
        }
        s.set_phase(ResolverPhase::Expanding);
    }

    s.set_phase(ResolverPhase::Satisfied);
    ResolvedGraph graph = s.build_graph();
    log::info("resolved %zu projects in %zu rounds (%zu backtracks)",
              graph.size(), rounds_, backtracks_);
    return Result<ResolvedGraph>::ok(std::move(graph));
}

Result<ResolvedGraph> resolve(RunContext& ctx, const std::vector<Requirement>& roots,
                              const ResolveOptions& options,
                              const std::vector<Requirement>& constraints,
                              ResolverObserver* observer) {
    ctx.begin_run();

    IndexSupplier index(ctx);
    DirectUrlSupplier direct;
    MetadataExpander expander(ctx);
    ProviderOptions popts;
    popts.prereleases = options.prereleases;
    PackageProvider provider(index, direct, expander, ctx.environment(), popts);

    Resolver resolver(provider, options, observer, &ctx.cancel_token());
    auto result = resolver.resolve(roots, constraints);

    // Outstanding prefetches see the deadline while they wind down
    ctx.end_run();
    ctx.cancel_token().clear_deadline();
    return result;
}

} // namespace pyres
