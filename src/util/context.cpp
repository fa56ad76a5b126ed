#include <pyres/context.hpp>
#include <pyres/log.hpp>

namespace pyres {

const char* cache_lifetime_name(CacheLifetime lifetime) {
    return lifetime == CacheLifetime::Context ? "context" : "run";
}

Result<CacheLifetime> cache_lifetime_from_name(const std::string& name) {
    if (name == "run") return Result<CacheLifetime>::ok(CacheLifetime::PerRun);
    if (name == "context") return Result<CacheLifetime>::ok(CacheLifetime::Context);
    return PyresError{PyresError::Config,
        "unknown cache-lifetime '" + name + "'", "expected \"run\" or \"context\""};
}

RunContext::RunContext(Environment env, std::unique_ptr<HttpTransport> transport,
                       ContextSettings settings)
    : env_(std::move(env)),
      settings_(std::move(settings)),
      transport_(std::move(transport)) {
    index_ = std::make_unique<IndexClient>(*transport_, env_, settings_.index, &cancel_);
    extractor_ = std::make_unique<MetadataExtractor>(*index_, settings_.metadata, &cancel_);
    if (settings_.concurrency > 0) {
        pool_ = std::make_unique<PrefetchPool>(settings_.concurrency, &cancel_);
    }
}

RunContext::~RunContext() {
    // Workers reference the clients; stop them first
    pool_.reset();
}

CandidateListResult RunContext::candidates(const ProjectName& name) {
    return candidate_cache_.get_or_compute(name.normalized(), [&] {
        return index_->fetch_candidates(name);
    });
}

MetadataResult RunContext::metadata(const Candidate& candidate) {
    return metadata_cache_.get_or_compute(candidate.key(), [&]() -> MetadataResult {
        auto meta = extractor_->extract(candidate);
        if (meta.is_err()) return std::move(meta).error();
        return MetadataResult::ok(
            std::make_shared<const CandidateMetadata>(std::move(meta).value()));
    });
}

void RunContext::prefetch(const ProjectName& name) {
    if (!pool_ || candidate_cache_.contains(name.normalized())) return;
    pool_->submit([this, name] {
        auto list = candidates(name);
        if (list.is_err() || list.value()->empty()) return;
        CandidatePtr best = list.value()->front();
        auto meta = metadata(*best);
        if (meta.is_err()) {
            log::trace("prefetch of %s: %s", best->to_string().c_str(),
                       meta.error().message.c_str());
        }
    });
}

void RunContext::begin_run() {
    cancel_.reset();
    if (settings_.cache_lifetime == CacheLifetime::PerRun) {
        // Prefetches from an earlier call must not repopulate the new run
        if (pool_) pool_->wait_idle();
        candidate_cache_.clear();
        metadata_cache_.clear();
        return;
    }
    // Long-lived caches keep answers, not interrupted or transient failures
    auto transient = [](const auto& r) {
        return r.is_err() && (r.error().code == PyresError::Cancelled ||
                              r.error().code == PyresError::IndexUnavailable);
    };
    size_t dropped = candidate_cache_.erase_if(transient) + metadata_cache_.erase_if(transient);
    if (dropped > 0) log::debug("dropped %zu cached failures", dropped);
}

void RunContext::end_run() {
    if (!pool_) return;
    pool_->drain();
    pool_->wait_idle();
}

} // namespace pyres
