#pragma once

#include <pyres/result.hpp>
#include <pyres/candidate.hpp>
#include <pyres/distribution.hpp>
#include <pyres/environment.hpp>
#include <pyres/http.hpp>
#include <pyres/name.hpp>
#include <memory>
#include <string>
#include <vector>

namespace pyres {

class CancelToken;

struct IndexSettings {
    std::vector<std::string> urls = {"https://pypi.org/simple"};
    int request_timeout = 30;      // seconds, per request
    RetryPolicy retry;
    bool prefer_source = false;    // order sdists ahead of wheels of the same version
};

// Files of one project merged across all configured indexes
struct ProjectListing {
    std::string project;           // normalized
    std::vector<DistFile> files;
};

// Client for the simple repository API (PEP 503 HTML, PEP 691 JSON).
// Uncached: the run context memoizes listings.
class IndexClient {
public:
    IndexClient(HttpTransport& transport, const Environment& env,
                IndexSettings settings, const CancelToken* cancel = nullptr);

    // All files for a project. ProjectNotFound when every index answers
    // 404, IndexUnavailable when an index keeps failing.
    Result<ProjectListing> fetch_listing(const ProjectName& name);

    // Compatible candidates for a project, best first. Wheels with no
    // matching tag and files whose Requires-Python excludes the target are
    // dropped; yanked files are kept and flagged.
    Result<std::shared_ptr<const CandidateList>> fetch_candidates(const ProjectName& name);

    Result<CandidateSequence> list_candidates(const ProjectName& name);

    // Artifact bytes, sha256-verified against the listed hashes
    Result<std::string> download(const DistFile& file);

    // PEP 658 metadata file, verified against the listed metadata hashes
    Result<std::string> fetch_metadata_file(const DistFile& file);

    // Ranks listed files into candidates; exposed for tests
    CandidateList build_candidates(const ProjectName& name,
                                   const std::vector<DistFile>& files) const;

    const IndexSettings& settings() const { return settings_; }

    static Result<std::vector<DistFile>> parse_json_listing(const std::string& body,
                                                            const std::string& page_url);
    static Result<std::vector<DistFile>> parse_html_listing(const std::string& body,
                                                            const std::string& page_url);

private:
    Result<HttpResponse> get_with_retry(const std::string& url,
                                        const std::vector<std::string>& headers,
                                        const std::string& what);

    HttpTransport& transport_;
    const Environment& env_;
    TagMatcher tags_;
    IndexSettings settings_;
    const CancelToken* cancel_;
};

// Resolves a possibly relative reference against a page URL
std::string resolve_url(const std::string& base, const std::string& ref);

} // namespace pyres
