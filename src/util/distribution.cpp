#include <pyres/distribution.hpp>
#include <pyres/name.hpp>
#include <cctype>
#include <sstream>

namespace pyres {

namespace {

const char* const k_sdist_suffixes[] = {
    ".tar.gz", ".tar.bz2", ".tar.xz", ".tgz", ".zip", ".tar"
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split(const std::string& s, char sep) {
    std::vector<std::string> parts;
    std::istringstream stream(s);
    std::string part;
    while (std::getline(stream, part, sep)) parts.push_back(part);
    return parts;
}

PyresError bad_filename(const std::string& filename, const std::string& why) {
    return PyresError{PyresError::Parse,
        "invalid distribution filename '" + filename + "': " + why};
}

Result<DistFilename> parse_wheel(const std::string& filename) {
    std::string stem = filename.substr(0, filename.size() - 4);
    auto parts = split(stem, '-');
    if (parts.size() != 5 && parts.size() != 6) {
        return bad_filename(filename, "expected 5 or 6 dash-separated fields");
    }

    DistFilename d;
    d.kind = DistKind::Wheel;
    d.project = ProjectName::normalize(parts[0]);

    auto v = Version::parse(parts[1]);
    if (v.is_err()) return bad_filename(filename, v.error().message);
    d.version = std::move(v).value();

    size_t tag_start = 2;
    if (parts.size() == 6) {
        d.build_tag = parts[2];
        if (d.build_tag.empty() || !std::isdigit(static_cast<unsigned char>(d.build_tag[0]))) {
            return bad_filename(filename, "build tag must start with a digit");
        }
        tag_start = 3;
    }

    for (const auto& py : split(parts[tag_start], '.')) {
        for (const auto& abi : split(parts[tag_start + 1], '.')) {
            for (const auto& plat : split(parts[tag_start + 2], '.')) {
                d.tags.push_back({py, abi, plat});
            }
        }
    }
    if (d.tags.empty()) return bad_filename(filename, "no compatibility tags");
    return Result<DistFilename>::ok(std::move(d));
}

Result<DistFilename> parse_sdist(const std::string& filename, const std::string& suffix,
                                 const std::string& project_hint) {
    std::string stem = filename.substr(0, filename.size() - suffix.size());

    // With a hint, the name is the prefix whose normalized form matches it;
    // otherwise split at the last dash that leaves a valid version.
    for (size_t dash = stem.rfind('-'); dash != std::string::npos && dash > 0;
         dash = stem.rfind('-', dash - 1)) {
        std::string name = stem.substr(0, dash);
        if (!project_hint.empty() && ProjectName::normalize(name) != project_hint) {
            continue;
        }
        auto v = Version::parse(stem.substr(dash + 1));
        if (v.is_err()) continue;

        DistFilename d;
        d.kind = DistKind::Sdist;
        d.project = ProjectName::normalize(name);
        d.version = std::move(v).value();
        return Result<DistFilename>::ok(std::move(d));
    }
    return bad_filename(filename, "cannot split name and version");
}

} // anonymous namespace

bool DistFilename::looks_like_distribution(const std::string& filename) {
    if (ends_with(filename, ".whl")) return true;
    for (const char* suffix : k_sdist_suffixes) {
        if (ends_with(filename, suffix)) return true;
    }
    return false;
}

Result<DistFilename> DistFilename::parse(const std::string& filename,
                                         const std::string& project_hint) {
    if (ends_with(filename, ".whl")) {
        auto d = parse_wheel(filename);
        if (d.is_ok() && !project_hint.empty() && d.value().project != project_hint) {
            return bad_filename(filename, "belongs to project '" + d.value().project + "'");
        }
        return d;
    }
    for (const char* suffix : k_sdist_suffixes) {
        if (ends_with(filename, suffix)) {
            return parse_sdist(filename, suffix, project_hint);
        }
    }
    return bad_filename(filename, "unknown archive type");
}

std::string DistFile::url_without_fragment() const {
    size_t hash = url.find('#');
    return hash == std::string::npos ? url : url.substr(0, hash);
}

std::string DistFile::metadata_url() const {
    return url_without_fragment() + ".metadata";
}

std::string url_filename(const std::string& url) {
    std::string path = url;
    size_t cut = path.find_first_of("?#");
    if (cut != std::string::npos) path.resize(cut);
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // namespace pyres
