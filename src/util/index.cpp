#include <pyres/index.hpp>
#include <pyres/cancel.hpp>
#include <pyres/log.hpp>
#include <pyres/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <set>

#include <nlohmann/json.hpp>

namespace pyres {

namespace {

const char* const k_accept =
    "Accept: application/vnd.pypi.simple.v1+json, "
    "application/vnd.pypi.simple.v1+html;q=0.2, text/html;q=0.01";

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// "#sha256=abc" fragments carry the file hash in PEP 503 listings
void hashes_from_fragment(const std::string& url, std::map<std::string, std::string>& hashes) {
    size_t hash = url.find('#');
    if (hash == std::string::npos) return;
    std::string frag = url.substr(hash + 1);
    size_t eq = frag.find('=');
    if (eq == std::string::npos) return;
    hashes.emplace(lower(frag.substr(0, eq)), lower(frag.substr(eq + 1)));
}

// "sha256=abc" (HTML metadata attribute) or "true"
void metadata_attribute(const std::string& value, DistFile& f) {
    if (value == "false") return;
    f.has_metadata = true;
    size_t eq = value.find('=');
    if (eq != std::string::npos) {
        f.metadata_hashes.emplace(lower(value.substr(0, eq)), lower(value.substr(eq + 1)));
    }
}

std::string html_unescape(const std::string& s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"},
        {"&#x27;", "'"}, {"&amp;", "&"},
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size();) {
        bool replaced = false;
        if (s[i] == '&') {
            for (const auto& e : entities) {
                size_t len = std::char_traits<char>::length(e.first);
                if (s.compare(i, len, e.first) == 0) {
                    out += e.second;
                    i += len;
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += s[i++];
    }
    return out;
}

// Attributes of one start tag, names lowercased, values unescaped
std::map<std::string, std::string> parse_attributes(const std::string& tag) {
    std::map<std::string, std::string> attrs;
    size_t i = 0;
    while (i < tag.size()) {
        while (i < tag.size() && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
        size_t name_start = i;
        while (i < tag.size() && tag[i] != '=' && tag[i] != '/' &&
               !std::isspace(static_cast<unsigned char>(tag[i]))) {
            ++i;
        }
        std::string name = lower(tag.substr(name_start, i - name_start));
        if (name.empty()) {
            ++i;
            continue;
        }
        while (i < tag.size() && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
        std::string value;
        if (i < tag.size() && tag[i] == '=') {
            ++i;
            while (i < tag.size() && std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
            if (i < tag.size() && (tag[i] == '"' || tag[i] == '\'')) {
                char q = tag[i++];
                size_t close = tag.find(q, i);
                if (close == std::string::npos) close = tag.size();
                value = tag.substr(i, close - i);
                i = close + 1;
            } else {
                size_t start = i;
                while (i < tag.size() && !std::isspace(static_cast<unsigned char>(tag[i]))) ++i;
                value = tag.substr(start, i - start);
            }
        }
        attrs[name] = html_unescape(value);
    }
    return attrs;
}

std::string project_page(const std::string& index_url, const ProjectName& name) {
    std::string base = index_url;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return base + "/" + name.normalized() + "/";
}

std::string string_field(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : std::string();
}

int kind_rank(SourceKind kind, bool prefer_source) {
    int rank = kind == SourceKind::Wheel ? 0 : 1;
    return prefer_source ? 1 - rank : rank;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// URL handling
// ---------------------------------------------------------------------------

std::string resolve_url(const std::string& base, const std::string& ref) {
    if (ref.find("://") != std::string::npos) return ref;

    size_t scheme_end = base.find("://");
    if (scheme_end == std::string::npos) return ref;
    if (ref.compare(0, 2, "//") == 0) return base.substr(0, scheme_end + 1) + ref;

    size_t path_start = base.find('/', scheme_end + 3);
    if (path_start == std::string::npos) path_start = base.size();
    std::string origin = base.substr(0, path_start);

    size_t ref_cut = ref.find_first_of("?#");
    std::string ref_path = ref.substr(0, ref_cut);
    std::string ref_tail = ref_cut == std::string::npos ? "" : ref.substr(ref_cut);

    std::string path;
    if (!ref_path.empty() && ref_path.front() == '/') {
        path = ref_path;
    } else {
        std::string base_path = base.substr(path_start);
        size_t cut = base_path.find_first_of("?#");
        if (cut != std::string::npos) base_path.resize(cut);
        size_t slash = base_path.rfind('/');
        base_path = slash == std::string::npos ? "/" : base_path.substr(0, slash + 1);
        path = base_path + ref_path;
    }

    // Collapse "." and ".." segments
    std::vector<std::string> segments;
    size_t start = 1;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        std::string seg = path.substr(start, slash == std::string::npos ? std::string::npos
                                                                       : slash - start);
        if (seg == "..") {
            if (!segments.empty()) segments.pop_back();
        } else if (seg != ".") {
            segments.push_back(seg);
        }
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
    std::string out = origin;
    for (const auto& seg : segments) out += "/" + seg;
    if (segments.empty()) out += "/";
    return out + ref_tail;
}

// ---------------------------------------------------------------------------
// Listing parsers
// ---------------------------------------------------------------------------

Result<std::vector<DistFile>> IndexClient::parse_json_listing(const std::string& body,
                                                              const std::string& page_url) {
    auto doc = nlohmann::json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return PyresError{PyresError::Parse, "malformed JSON index page: " + page_url};
    }
    auto files = doc.find("files");
    if (files == doc.end() || !files->is_array()) {
        return PyresError{PyresError::Parse,
            "JSON index page has no 'files' array: " + page_url};
    }

    std::vector<DistFile> out;
    for (const auto& entry : *files) {
        if (!entry.is_object()) continue;
        DistFile f;
        f.filename = string_field(entry, "filename");
        f.url = resolve_url(page_url, string_field(entry, "url"));
        f.index_url = page_url;
        if (f.filename.empty()) f.filename = url_filename(f.url);

        auto hashes = entry.find("hashes");
        if (hashes != entry.end() && hashes->is_object()) {
            for (auto it = hashes->begin(); it != hashes->end(); ++it) {
                if (it.value().is_string()) {
                    f.hashes.emplace(lower(it.key()), lower(it.value().get<std::string>()));
                }
            }
        }
        if (f.hashes.empty()) hashes_from_fragment(f.url, f.hashes);

        auto rp = entry.find("requires-python");
        if (rp != entry.end() && rp->is_string()) f.requires_python = rp->get<std::string>();

        auto yanked = entry.find("yanked");
        if (yanked != entry.end()) {
            if (yanked->is_boolean()) {
                f.yanked = yanked->get<bool>();
            } else if (yanked->is_string()) {
                f.yanked = true;
                f.yanked_reason = yanked->get<std::string>();
            }
        }

        for (const char* key : {"core-metadata", "dist-info-metadata"}) {
            auto meta = entry.find(key);
            if (meta == entry.end()) continue;
            if (meta->is_boolean()) {
                f.has_metadata = meta->get<bool>();
            } else if (meta->is_object()) {
                f.has_metadata = true;
                for (auto it = meta->begin(); it != meta->end(); ++it) {
                    if (it.value().is_string()) {
                        f.metadata_hashes.emplace(lower(it.key()),
                                                  lower(it.value().get<std::string>()));
                    }
                }
            }
            break;
        }
        out.push_back(std::move(f));
    }
    return Result<std::vector<DistFile>>::ok(std::move(out));
}

Result<std::vector<DistFile>> IndexClient::parse_html_listing(const std::string& body,
                                                              const std::string& page_url) {
    std::vector<DistFile> out;
    std::string lowered = lower(body);

    // <base href> changes what relative links resolve against
    std::string base = page_url;
    size_t base_tag = lowered.find("<base ");
    if (base_tag != std::string::npos) {
        size_t end = lowered.find('>', base_tag);
        if (end != std::string::npos) {
            auto attrs = parse_attributes(body.substr(base_tag + 5, end - base_tag - 5));
            auto href = attrs.find("href");
            if (href != attrs.end() && !href->second.empty()) {
                base = resolve_url(page_url, href->second);
            }
        }
    }

    size_t pos = 0;
    while ((pos = lowered.find("<a", pos)) != std::string::npos) {
        size_t after = pos + 2;
        if (after < lowered.size() && !std::isspace(static_cast<unsigned char>(lowered[after]))) {
            pos = after;
            continue;
        }
        size_t end = lowered.find('>', after);
        if (end == std::string::npos) break;
        auto attrs = parse_attributes(body.substr(after, end - after));
        pos = end + 1;

        auto href = attrs.find("href");
        if (href == attrs.end() || href->second.empty()) continue;

        DistFile f;
        f.url = resolve_url(base, href->second);
        f.index_url = page_url;
        f.filename = url_filename(f.url);
        size_t close = lowered.find("</a>", pos);
        if (close != std::string::npos) {
            std::string text = html_unescape(body.substr(pos, close - pos));
            size_t b = text.find_first_not_of(" \t\r\n");
            size_t e = text.find_last_not_of(" \t\r\n");
            if (b != std::string::npos) text = text.substr(b, e - b + 1);
            if (DistFilename::looks_like_distribution(text)) f.filename = text;
        }
        hashes_from_fragment(f.url, f.hashes);

        auto rp = attrs.find("data-requires-python");
        if (rp != attrs.end()) f.requires_python = rp->second;
        auto yanked = attrs.find("data-yanked");
        if (yanked != attrs.end()) {
            f.yanked = true;
            f.yanked_reason = yanked->second;
        }
        auto meta = attrs.find("data-core-metadata");
        if (meta == attrs.end()) meta = attrs.find("data-dist-info-metadata");
        if (meta != attrs.end()) metadata_attribute(meta->second, f);

        out.push_back(std::move(f));
    }
    return Result<std::vector<DistFile>>::ok(std::move(out));
}

// ---------------------------------------------------------------------------
// IndexClient
// ---------------------------------------------------------------------------

IndexClient::IndexClient(HttpTransport& transport, const Environment& env,
                         IndexSettings settings, const CancelToken* cancel)
    : transport_(transport), env_(env), tags_(env.tag_matcher()),
      settings_(std::move(settings)), cancel_(cancel) {}

Result<HttpResponse> IndexClient::get_with_retry(const std::string& url,
                                                 const std::vector<std::string>& headers,
                                                 const std::string& what) {
    HttpRequest request{url, headers, settings_.request_timeout, cancel_};
    return settings_.retry.run([&] { return transport_.get(request); }, what, cancel_);
}

Result<ProjectListing> IndexClient::fetch_listing(const ProjectName& name) {
    if (settings_.urls.empty()) {
        return PyresError{PyresError::Config, "no package index configured"};
    }

    ProjectListing listing;
    listing.project = name.normalized();
    std::set<std::string> seen;
    bool found = false;

    for (const auto& index_url : settings_.urls) {
        std::string page = project_page(index_url, name);
        auto resp = get_with_retry(page, {k_accept}, "GET " + page);
        if (resp.is_err()) {
            if (resp.error().code == PyresError::Cancelled) return std::move(resp).error();
            return PyresError{PyresError::IndexUnavailable,
                "index " + index_url + " unavailable for '" + name.normalized() + "'",
                resp.error().message};
        }
        const HttpResponse& r = resp.value();
        // Any client error other than rate limiting means this index has
        // nothing for the project; it is not retried.
        if (r.status >= 400 && r.status < 500 && r.status != 429) {
            log::debug("%s: HTTP %ld from %s, treated as not found",
                       name.normalized().c_str(), r.status, index_url.c_str());
            continue;
        }
        if (!r.ok()) {
            return PyresError{PyresError::IndexUnavailable,
                "index " + index_url + " answered HTTP " + std::to_string(r.status) +
                " for '" + name.normalized() + "'"};
        }

        std::string page_url = r.effective_url.empty() ? page : r.effective_url;
        auto files = (lower(r.content_type).find("json") != std::string::npos
            ? parse_json_listing(r.body, page_url)
            : parse_html_listing(r.body, page_url)).map_err([](PyresError e) {
                return PyresError{PyresError::IndexUnavailable, e.message};
            });
        if (files.is_err()) return std::move(files).error();

        found = true;
        for (auto& f : files.value()) {
            if (seen.insert(f.filename).second) listing.files.push_back(std::move(f));
        }
    }

    if (!found) {
        return PyresError{PyresError::ProjectNotFound,
            "project '" + name.raw() + "' not found on any configured index"};
    }
    log::debug("%s: %zu files listed", listing.project.c_str(), listing.files.size());
    return Result<ProjectListing>::ok(std::move(listing));
}

CandidateList IndexClient::build_candidates(const ProjectName& name,
                                            const std::vector<DistFile>& files) const {
    CandidateList all;
    for (const auto& f : files) {
        auto parsed = DistFilename::parse(f.filename, name.normalized());
        if (parsed.is_err()) {
            log::trace("skipping %s: %s", f.filename.c_str(), parsed.error().message.c_str());
            continue;
        }
        if (!env_.supports_python(f.requires_python)) {
            log::trace("skipping %s: requires python %s", f.filename.c_str(),
                       f.requires_python.c_str());
            continue;
        }

        auto c = std::make_shared<Candidate>();
        c->name = name;
        c->version = parsed.value().version;
        c->file = f;
        if (parsed.value().kind == DistKind::Wheel) {
            auto priority = tags_.priority(parsed.value().tags);
            if (!priority) continue;
            c->kind = SourceKind::Wheel;
            c->tag_priority = *priority;
        } else {
            c->kind = SourceKind::Sdist;
        }
        all.push_back(std::move(c));
    }

    bool prefer_source = settings_.prefer_source;
    std::sort(all.begin(), all.end(), [prefer_source](const CandidatePtr& a, const CandidatePtr& b) {
        int cmp = a->version.compare(b->version);
        if (cmp != 0) return cmp > 0;
        int ka = kind_rank(a->kind, prefer_source);
        int kb = kind_rank(b->kind, prefer_source);
        if (ka != kb) return ka < kb;
        if (a->tag_priority != b->tag_priority) return a->tag_priority < b->tag_priority;
        return a->file.filename < b->file.filename;
    });

    // One candidate per version and kind: the best ranked file
    CandidateList out;
    for (auto& c : all) {
        if (!out.empty() && *out.back() == *c) continue;
        bool duplicate = std::any_of(out.begin(), out.end(),
            [&](const CandidatePtr& o) { return *o == *c; });
        if (!duplicate) out.push_back(std::move(c));
    }
    return out;
}

Result<std::shared_ptr<const CandidateList>> IndexClient::fetch_candidates(const ProjectName& name) {
    auto listing = fetch_listing(name);
    if (listing.is_err()) return std::move(listing).error();
    auto list = std::make_shared<const CandidateList>(
        build_candidates(name, listing.value().files));
    return Result<std::shared_ptr<const CandidateList>>::ok(std::move(list));
}

Result<CandidateSequence> IndexClient::list_candidates(const ProjectName& name) {
    auto list = fetch_candidates(name);
    if (list.is_err()) return std::move(list).error();
    return Result<CandidateSequence>::ok(CandidateSequence(std::move(list).value()));
}

Result<std::string> IndexClient::download(const DistFile& file) {
    std::string url = file.url_without_fragment();
    auto resp = get_with_retry(url, {}, "download " + file.filename);
    if (resp.is_err()) {
        if (resp.error().code == PyresError::Cancelled) return std::move(resp).error();
        return PyresError{PyresError::IndexUnavailable,
            "download of " + file.filename + " failed", resp.error().message};
    }
    long status = resp.value().status;
    if (status >= 400 && status < 500 && status != 429) {
        return PyresError{PyresError::MetadataUnavailable,
            "download of " + file.filename + " answered HTTP " + std::to_string(status)};
    }
    if (!resp.value().ok()) {
        return PyresError{PyresError::IndexUnavailable,
            "download of " + file.filename + " failed with HTTP " + std::to_string(status)};
    }
    PYRES_TRY(verify_sha256(resp.value().body, file.hashes, file.filename));
    return Result<std::string>::ok(std::move(resp.value().body));
}

Result<std::string> IndexClient::fetch_metadata_file(const DistFile& file) {
    std::string url = file.metadata_url();
    auto resp = get_with_retry(url, {}, "GET " + url);
    if (resp.is_err()) return std::move(resp).error();
    if (!resp.value().ok()) {
        return PyresError{PyresError::MetadataUnavailable,
            "metadata file for " + file.filename + " answered HTTP " +
            std::to_string(resp.value().status)};
    }
    PYRES_TRY(verify_sha256(resp.value().body, file.metadata_hashes,
                            file.filename + ".metadata"));
    return Result<std::string>::ok(std::move(resp.value().body));
}

} // namespace pyres
