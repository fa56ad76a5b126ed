#include <pyres/provider.hpp>
#include <pyres/context.hpp>
#include <pyres/log.hpp>

#include <algorithm>

namespace pyres {

std::string normalize_direct_url(const std::string& url) {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

// ---------------------------------------------------------------------------
// Suppliers
// ---------------------------------------------------------------------------

Result<CandidateSequence> IndexSupplier::candidates(
        const ProjectName& name, const std::vector<const Requirement*>&) {
    auto list = ctx_.candidates(name);
    if (list.is_err()) return list.error();
    return Result<CandidateSequence>::ok(CandidateSequence(list.value()));
}

void IndexSupplier::prefetch(const ProjectName& name) {
    ctx_.prefetch(name);
}

Result<CandidatePtr> DirectUrlSupplier::candidate_for(const Requirement& req) {
    std::string url = normalize_direct_url(req.url);
    std::string filename = url_filename(url);
    auto parsed = DistFilename::parse(filename, req.name.normalized());
    if (parsed.is_err()) {
        return PyresError{PyresError::MetadataUnavailable,
            "cannot determine the version of direct reference " + req.url,
            "only wheel and sdist archive URLs are supported"};
    }

    auto c = std::make_shared<Candidate>();
    c->name = req.name;
    c->version = parsed.value().version;
    c->kind = SourceKind::DirectUrl;
    c->file.filename = filename;
    c->file.url = req.url;

    size_t hash = req.url.find('#');
    if (hash != std::string::npos) {
        std::string frag = req.url.substr(hash + 1);
        size_t eq = frag.find('=');
        if (eq != std::string::npos) c->file.hashes.emplace(frag.substr(0, eq), frag.substr(eq + 1));
    }
    return Result<CandidatePtr>::ok(std::move(c));
}

Result<CandidateSequence> DirectUrlSupplier::candidates(
        const ProjectName& name, const std::vector<const Requirement*>& requirements) {
    for (const Requirement* req : requirements) {
        if (!req->is_direct()) continue;
        auto c = candidate_for(*req);
        if (c.is_err()) return std::move(c).error();
        auto list = std::make_shared<const CandidateList>(CandidateList{std::move(c).value()});
        return Result<CandidateSequence>::ok(CandidateSequence(std::move(list)));
    }
    return PyresError{PyresError::InvalidArg,
        "no direct reference among the requirements for '" + name.raw() + "'"};
}

Result<std::shared_ptr<const CandidateMetadata>> MetadataExpander::metadata(const Candidate& candidate) {
    return ctx_.metadata(candidate);
}

// ---------------------------------------------------------------------------
// PackageProvider
// ---------------------------------------------------------------------------

PackageProvider::PackageProvider(CandidateSupplier& index, CandidateSupplier& direct,
                                 RequirementExpander& expander, const Environment& env,
                                 ProviderOptions options)
    : index_(index), direct_(direct), expander_(expander), env_(env), options_(options) {}

bool PackageProvider::is_satisfied_by(const Requirement& req, const Candidate& candidate) const {
    if (req.name != candidate.name) return false;
    if (req.is_direct()) {
        return candidate.kind == SourceKind::DirectUrl &&
               normalize_direct_url(candidate.file.url) == normalize_direct_url(req.url);
    }
    // Once chosen, a pre-release satisfies any specifier that contains it
    return req.specifier.contains(candidate.version, true);
}

Result<CandidateList> PackageProvider::find_matches(
        const ProjectName& name, const std::vector<const Requirement*>& requirements) {
    bool any_direct = std::any_of(requirements.begin(), requirements.end(),
                                  [](const Requirement* r) { return r->is_direct(); });

    if (any_direct) {
        auto seq = direct_.candidates(name, requirements);
        if (seq.is_err()) {
            if (seq.error().code == PyresError::MetadataUnavailable) {
                log::warn("%s", seq.error().message.c_str());
                return Result<CandidateList>::ok({});
            }
            return std::move(seq).error();
        }
        CandidatePtr c = seq.value().items().front();
        for (const Requirement* req : requirements) {
            if (!is_satisfied_by(*req, *c)) return Result<CandidateList>::ok({});
        }
        auto parsed = DistFilename::parse(c->file.filename, name.normalized());
        if (parsed.is_ok() && parsed.value().kind == DistKind::Wheel &&
            !env_.is_compatible(parsed.value().tags)) {
            log::warn("%s is not compatible with %s", c->file.filename.c_str(),
                      env_.to_string().c_str());
            return Result<CandidateList>::ok({});
        }
        return Result<CandidateList>::ok(CandidateList{c});
    }

    auto seq = index_.candidates(name, requirements);
    if (seq.is_err()) {
        if (seq.error().code == PyresError::ProjectNotFound) {
            log::debug("%s", seq.error().message.c_str());
            return Result<CandidateList>::ok({});
        }
        return std::move(seq).error();
    }

    bool allow_pre = options_.prereleases;
    bool pinned = false;
    for (const Requirement* req : requirements) {
        allow_pre = allow_pre || req->specifier.names_prerelease();
        pinned = pinned || req->specifier.is_pinned();
    }

    auto select = [&](bool prereleases) {
        CandidateList out;
        for (const auto& c : seq.value().items()) {
            if (c->is_yanked() && !pinned) continue;
            bool ok = std::all_of(requirements.begin(), requirements.end(),
                [&](const Requirement* r) { return r->specifier.contains(c->version, prereleases); });
            if (ok) out.push_back(c);
        }
        return out;
    };

    CandidateList matches = select(allow_pre);
    // Pre-releases are acceptable when no final release fits
    if (matches.empty() && !allow_pre) matches = select(true);
    return Result<CandidateList>::ok(std::move(matches));
}

Result<std::vector<Requirement>> PackageProvider::dependencies(const Candidate& candidate,
                                                               const ExtraSet& extras) {
    auto meta = expander_.metadata(candidate);
    if (meta.is_err()) return meta.error();
    const CandidateMetadata& m = *meta.value();

    if (!m.requires_python.empty() && !env_.supports_python(m.requires_python)) {
        return PyresError{PyresError::MetadataUnavailable,
            candidate.to_string() + " requires python " + m.requires_python};
    }

    for (const auto& extra : extras) {
        if (!m.provides_extra.empty() && !m.provides_extra.count(extra)) {
            log::warn("%s does not provide the extra '%s'",
                      candidate.to_string().c_str(), extra.c_str());
        }
    }

    std::vector<Requirement> out;
    for (const auto& req : m.requires_dist) {
        if (req.applies_to(env_, extras)) out.push_back(req);
    }
    return Result<std::vector<Requirement>>::ok(std::move(out));
}

} // namespace pyres
