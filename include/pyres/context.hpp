#pragma once

#include <pyres/result.hpp>
#include <pyres/cache.hpp>
#include <pyres/cancel.hpp>
#include <pyres/candidate.hpp>
#include <pyres/environment.hpp>
#include <pyres/http.hpp>
#include <pyres/index.hpp>
#include <pyres/metadata.hpp>
#include <memory>
#include <string>

namespace pyres {

enum class CacheLifetime {
    PerRun,    // caches are cleared when a resolve call starts
    Context,   // caches live as long as the RunContext
};

const char* cache_lifetime_name(CacheLifetime lifetime);
Result<CacheLifetime> cache_lifetime_from_name(const std::string& name);

struct ContextSettings {
    IndexSettings index;
    MetadataSettings metadata;
    size_t concurrency = 4;        // prefetch workers, 0 disables prefetching
    CacheLifetime cache_lifetime = CacheLifetime::PerRun;
};

using CandidateListResult = Result<std::shared_ptr<const CandidateList>>;
using MetadataResult = Result<std::shared_ptr<const CandidateMetadata>>;

// Everything one or more resolve calls share: the target environment, the
// transport, index and metadata clients, the memo caches, the prefetch pool
// and the cancel token. Passed explicitly; there is no global instance.
class RunContext {
public:
    RunContext(Environment env, std::unique_ptr<HttpTransport> transport,
               ContextSettings settings = {});
    ~RunContext();

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    const Environment& environment() const { return env_; }
    const ContextSettings& settings() const { return settings_; }

    IndexClient& index() { return *index_; }
    MetadataExtractor& extractor() { return *extractor_; }
    CancelToken& cancel_token() { return cancel_; }
    PrefetchPool* prefetch_pool() { return pool_.get(); }

    // Memoized, concurrency-safe lookups
    CandidateListResult candidates(const ProjectName& name);
    MetadataResult metadata(const Candidate& candidate);

    // Queue warm-up of a project's listing and its best candidate's metadata
    void prefetch(const ProjectName& name);

    // Called when a resolve call starts: resets cancellation and, for
    // PerRun lifetime, drops cached listings and metadata
    void begin_run();
    // Called when it ends: stops outstanding prefetch work
    void end_run();

    size_t cached_listings() const { return candidate_cache_.size(); }
    size_t cached_metadata() const { return metadata_cache_.size(); }

private:
    Environment env_;
    ContextSettings settings_;
    std::unique_ptr<HttpTransport> transport_;
    CancelToken cancel_;
    std::unique_ptr<IndexClient> index_;
    std::unique_ptr<MetadataExtractor> extractor_;
    OnceCache<std::string, CandidateListResult> candidate_cache_;
    OnceCache<std::string, MetadataResult> metadata_cache_;
    std::unique_ptr<PrefetchPool> pool_;   // last: workers stop before caches go
};

} // namespace pyres
