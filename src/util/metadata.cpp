#include <pyres/metadata.hpp>
#include <pyres/cancel.hpp>
#include <pyres/index.hpp>
#include <pyres/log.hpp>
#include <pyres/process.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

#include <archive.h>
#include <archive_entry.h>
#include <toml++/toml.hpp>

namespace fs = std::filesystem;

namespace pyres {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

PyresError unavailable(const Candidate& c, const std::string& why) {
    return PyresError{PyresError::MetadataUnavailable,
        "no usable metadata for " + c.to_string() + " (" + c.file.filename + ")", why};
}

// ---------------------------------------------------------------------------
// Archive access
// ---------------------------------------------------------------------------

struct ArchiveReader {
    archive* a = archive_read_new();
    ~ArchiveReader() {
        if (a) archive_read_free(a);
    }
};

// Reads the members whose path satisfies `want` from an in-memory archive
// (zip, tar, tar.gz, tar.bz2, tar.xz).
Result<std::map<std::string, std::string>> read_members(
        const std::string& bytes, const std::function<bool(const std::string&)>& want) {
    ArchiveReader reader;
    if (!reader.a) return PyresError{PyresError::IO, "cannot create archive reader"};
    archive_read_support_filter_all(reader.a);
    archive_read_support_format_all(reader.a);
    if (archive_read_open_memory(reader.a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return PyresError{PyresError::Parse,
            std::string("cannot open archive: ") + archive_error_string(reader.a)};
    }

    std::map<std::string, std::string> out;
    archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(reader.a, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            return PyresError{PyresError::Parse,
                std::string("corrupt archive: ") + archive_error_string(reader.a)};
        }
        const char* raw_path = archive_entry_pathname(entry);
        std::string path = raw_path ? raw_path : "";
        if (path.compare(0, 2, "./") == 0) path.erase(0, 2);
        if (!want(path)) {
            archive_read_data_skip(reader.a);
            continue;
        }

        std::string data;
        char buf[8192];
        la_ssize_t n;
        while ((n = archive_read_data(reader.a, buf, sizeof(buf))) > 0) {
            data.append(buf, static_cast<size_t>(n));
        }
        if (n < 0) {
            return PyresError{PyresError::Parse,
                "cannot read " + path + ": " + archive_error_string(reader.a)};
        }
        out.emplace(path, std::move(data));
    }
    return Result<std::map<std::string, std::string>>::ok(std::move(out));
}

// Path depth in slashes, ignoring a trailing one
size_t depth(const std::string& path) {
    return static_cast<size_t>(std::count(path.begin(), path.end(), '/'));
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// mkdtemp directory removed on scope exit
struct ScratchDir {
    fs::path path;
    ScratchDir() {
        std::string tmpl = (fs::temp_directory_path() / "pyres-build-XXXXXX").string();
        if (mkdtemp(tmpl.data())) path = tmpl;
    }
    ~ScratchDir() {
        if (!path.empty()) {
            std::error_code ec;
            fs::remove_all(path, ec);
        }
    }
};

Status unpack_to(const std::string& bytes, const fs::path& dest) {
    ArchiveReader reader;
    archive_read_support_filter_all(reader.a);
    archive_read_support_format_all(reader.a);
    if (archive_read_open_memory(reader.a, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        return PyresError{PyresError::IO,
            std::string("cannot open archive: ") + archive_error_string(reader.a)};
    }

    archive* disk = archive_write_disk_new();
    archive_write_disk_set_options(disk, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM |
                                         ARCHIVE_EXTRACT_SECURE_NODOTDOT |
                                         ARCHIVE_EXTRACT_SECURE_SYMLINKS |
                                         ARCHIVE_EXTRACT_SECURE_NOABSOLUTEPATHS);
    Status status = ok_status();
    archive_entry* entry = nullptr;
    for (;;) {
        int r = archive_read_next_header(reader.a, &entry);
        if (r == ARCHIVE_EOF) break;
        if (r < ARCHIVE_WARN) {
            status = PyresError{PyresError::IO, archive_error_string(reader.a)};
            break;
        }
        const char* name = archive_entry_pathname(entry);
        std::string target = (dest / (name ? name : "")).string();
        archive_entry_set_pathname(entry, target.c_str());
        if (archive_write_header(disk, entry) < ARCHIVE_WARN) {
            status = PyresError{PyresError::IO, archive_error_string(disk)};
            break;
        }
        const void* block;
        size_t size;
        la_int64_t offset;
        while ((r = archive_read_data_block(reader.a, &block, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(disk, block, size, offset) < ARCHIVE_WARN) {
                r = ARCHIVE_FATAL;
                break;
            }
        }
        if (r != ARCHIVE_EOF || archive_write_finish_entry(disk) < ARCHIVE_WARN) {
            status = PyresError{PyresError::IO, "cannot unpack " + target};
            break;
        }
    }
    archive_write_free(disk);
    return status;
}

// ---------------------------------------------------------------------------
// pyproject.toml
// ---------------------------------------------------------------------------

std::vector<std::string> string_array(const toml::node_view<const toml::node>& node) {
    std::vector<std::string> out;
    if (auto arr = node.as_array()) {
        for (const auto& elem : *arr) {
            if (auto s = elem.value<std::string>()) out.push_back(*s);
        }
    }
    return out;
}

// [project] metadata when dependencies are declared statically
Result<std::optional<CandidateMetadata>> from_pyproject(const std::string& text) {
    toml::table doc;
    try {
        doc = toml::parse(text);
    } catch (const toml::parse_error& e) {
        return PyresError{PyresError::Parse,
            std::string("pyproject.toml parse error: ") + e.what()};
    }

    const toml::table& cdoc = doc;
    auto project = cdoc["project"];
    if (!project.as_table()) return Result<std::optional<CandidateMetadata>>::ok(std::nullopt);

    auto dynamic = string_array(project["dynamic"]);
    for (const char* field : {"dependencies", "optional-dependencies"}) {
        if (std::find(dynamic.begin(), dynamic.end(), field) != dynamic.end()) {
            return Result<std::optional<CandidateMetadata>>::ok(std::nullopt);
        }
    }

    CandidateMetadata meta;
    meta.source = "pyproject";
    if (auto v = project["name"].value<std::string>()) meta.name = *v;
    if (auto v = project["version"].value<std::string>()) meta.version = *v;
    if (auto v = project["requires-python"].value<std::string>()) meta.requires_python = *v;

    for (const auto& line : string_array(project["dependencies"])) {
        auto req = Requirement::parse(line);
        if (req.is_err()) return std::move(req).error();
        meta.requires_dist.push_back(std::move(req).value());
    }

    if (auto optional = project["optional-dependencies"].as_table()) {
        for (const auto& [key, val] : *optional) {
            std::string extra = normalize_extra(std::string(key.str()));
            meta.provides_extra.insert(extra);
            auto extra_marker = Marker::parse("extra == \"" + extra + "\"");
            if (extra_marker.is_err()) return std::move(extra_marker).error();
            if (auto arr = val.as_array()) {
                for (const auto& elem : *arr) {
                    auto s = elem.value<std::string>();
                    if (!s) continue;
                    auto req = Requirement::parse(*s);
                    if (req.is_err()) return std::move(req).error();
                    Requirement r = std::move(req).value();
                    r.marker = r.marker ? Marker::all({*r.marker, extra_marker.value()})
                                        : extra_marker.value();
                    meta.requires_dist.push_back(std::move(r));
                }
            }
        }
    }
    return Result<std::optional<CandidateMetadata>>::ok(std::move(meta));
}

// Runs the PEP 517 metadata hook and prints the .dist-info directory path
const char* const k_build_hook_script = R"PY(
import importlib, os, sys
backend, backend_path = "setuptools.build_meta:__legacy__", []
if os.path.exists("pyproject.toml"):
    try:
        import tomllib
    except ImportError:
        tomllib = None
    if tomllib is not None:
        with open("pyproject.toml", "rb") as f:
            bs = tomllib.load(f).get("build-system", {})
        backend = bs.get("build-backend", backend)
        backend_path = bs.get("backend-path", [])
for p in backend_path:
    sys.path.insert(0, os.path.abspath(p))
mod, _, attr = backend.partition(":")
obj = importlib.import_module(mod)
for part in filter(None, attr.split(".")):
    obj = getattr(obj, part)
hook = getattr(obj, "prepare_metadata_for_build_wheel", None)
if hook is None:
    sys.exit(3)
out = sys.argv[1]
print(os.path.join(out, hook(out)))
)PY";

} // anonymous namespace

// ---------------------------------------------------------------------------
// CoreMetadata
// ---------------------------------------------------------------------------

Result<CoreMetadata> CoreMetadata::parse(const std::string& text) {
    CoreMetadata m;
    std::istringstream stream(text);
    std::string line;
    std::string key, value;
    bool any = false;

    auto flush = [&] {
        if (key.empty()) return;
        std::string k = lower(key);
        std::string v = trim(value);
        if (k == "metadata-version") m.metadata_version = v;
        else if (k == "name") m.name = v;
        else if (k == "version") m.version = v;
        else if (k == "requires-dist") m.requires_dist.push_back(v);
        else if (k == "requires-python") m.requires_python = v;
        else if (k == "provides-extra") m.provides_extra.push_back(v);
        else if (k == "dynamic") m.dynamic.push_back(v);
        key.clear();
        value.clear();
    };

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;  // headers end, description follows
        if (line[0] == ' ' || line[0] == '\t') {
            if (!key.empty()) value += "\n" + line;
            continue;
        }
        flush();
        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            return PyresError{PyresError::Parse, "malformed metadata header '" + line + "'"};
        }
        key = line.substr(0, colon);
        value = line.substr(colon + 1);
        any = true;
    }
    flush();

    if (!any || m.name.empty()) {
        return PyresError{PyresError::Parse, "metadata has no Name field"};
    }
    return Result<CoreMetadata>::ok(std::move(m));
}

bool CoreMetadata::is_dynamic(const std::string& field) const {
    std::string f = lower(field);
    return std::any_of(dynamic.begin(), dynamic.end(),
                       [&](const std::string& d) { return lower(d) == f; });
}

Result<CandidateMetadata> CandidateMetadata::from_core(const CoreMetadata& core,
                                                       const std::string& source) {
    CandidateMetadata meta;
    meta.name = core.name;
    meta.version = core.version;
    meta.requires_python = core.requires_python;
    meta.source = source;
    for (const auto& e : core.provides_extra) meta.provides_extra.insert(normalize_extra(e));
    for (const auto& line : core.requires_dist) {
        auto req = Requirement::parse(line);
        if (req.is_err()) return std::move(req).error();
        meta.requires_dist.push_back(std::move(req).value());
    }
    return Result<CandidateMetadata>::ok(std::move(meta));
}

// ---------------------------------------------------------------------------
// Archive sources
// ---------------------------------------------------------------------------

Result<CandidateMetadata> MetadataExtractor::from_wheel(const std::string& archive) {
    auto members = read_members(archive, [](const std::string& path) {
        return depth(path) == 1 && ends_with(path, ".dist-info/METADATA");
    });
    if (members.is_err()) return std::move(members).error();
    if (members.value().empty()) {
        return PyresError{PyresError::Parse, "wheel has no .dist-info/METADATA"};
    }
    auto core = CoreMetadata::parse(members.value().begin()->second);
    if (core.is_err()) return std::move(core).error();
    return CandidateMetadata::from_core(core.value(), "wheel");
}

Result<std::optional<CandidateMetadata>> MetadataExtractor::from_sdist(const std::string& archive) {
    auto members = read_members(archive, [](const std::string& path) {
        return depth(path) == 1 &&
               (ends_with(path, "/PKG-INFO") || ends_with(path, "/pyproject.toml"));
    });
    if (members.is_err()) return std::move(members).error();

    std::string pkg_info, pyproject;
    for (const auto& kv : members.value()) {
        if (ends_with(kv.first, "/PKG-INFO")) pkg_info = kv.second;
        else pyproject = kv.second;
    }

    if (!pkg_info.empty()) {
        auto core = CoreMetadata::parse(pkg_info);
        if (core.is_ok()) {
            // Metadata 2.2 makes PKG-INFO authoritative unless marked Dynamic
            auto mv = Version::parse(core.value().metadata_version);
            bool reliable = mv.is_ok() && mv.value() >= Version::parse("2.2").value() &&
                            !core.value().is_dynamic("Requires-Dist");
            if (reliable) {
                auto meta = CandidateMetadata::from_core(core.value(), "pkg-info");
                if (meta.is_err()) return std::move(meta).error();
                return Result<std::optional<CandidateMetadata>>::ok(std::move(meta).value());
            }
        }
    }

    if (!pyproject.empty()) return from_pyproject(pyproject);
    return Result<std::optional<CandidateMetadata>>::ok(std::nullopt);
}

// ---------------------------------------------------------------------------
// MetadataExtractor
// ---------------------------------------------------------------------------

MetadataExtractor::MetadataExtractor(IndexClient& index, MetadataSettings settings,
                                     const CancelToken* cancel)
    : index_(index), settings_(std::move(settings)), cancel_(cancel) {}

Result<CandidateMetadata> MetadataExtractor::run_build_hook(const std::string& archive,
                                                            const Candidate& candidate) {
    ScratchDir scratch;
    if (scratch.path.empty()) return PyresError{PyresError::IO, "cannot create temp directory"};
    fs::path src = scratch.path / "src";
    fs::path out = scratch.path / "out";
    std::error_code ec;
    fs::create_directories(src, ec);
    fs::create_directories(out, ec);
    PYRES_TRY(unpack_to(archive, src));

    // An sdist unpacks into a single top-level directory
    fs::path project_dir = src;
    for (const auto& entry : fs::directory_iterator(src, ec)) {
        if (entry.is_directory()) {
            project_dir = entry.path();
            break;
        }
    }

    log::info("running build backend for %s", candidate.to_string().c_str());
    CommandOptions opts;
    opts.working_dir = project_dir.string();
    opts.timeout_seconds = settings_.build_timeout;
    opts.cancel = cancel_;
    auto run = run_command({settings_.python, "-c", k_build_hook_script, out.string()}, opts);
    if (run.is_err()) return std::move(run).error();
    if (run.value().exit_code != 0) {
        return PyresError{PyresError::MetadataUnavailable,
            "build backend failed with exit code " + std::to_string(run.value().exit_code),
            trim(run.value().stderr_str)};
    }

    std::string out_text = trim(run.value().stdout_str);
    std::string dist_info = out_text.substr(out_text.rfind('\n') == std::string::npos
                                                ? 0 : out_text.rfind('\n') + 1);
    std::ifstream file(fs::path(dist_info) / "METADATA");
    if (!file.is_open()) {
        return PyresError{PyresError::MetadataUnavailable,
            "build backend produced no METADATA in " + dist_info};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto core = CoreMetadata::parse(ss.str());
    if (core.is_err()) return std::move(core).error();
    return CandidateMetadata::from_core(core.value(), "build-hook");
}

Result<CandidateMetadata> MetadataExtractor::extract_any(const Candidate& candidate) {
    const DistFile& file = candidate.file;

    if (file.has_metadata) {
        auto text = index_.fetch_metadata_file(file);
        if (text.is_ok()) {
            auto core = CoreMetadata::parse(text.value());
            if (core.is_ok()) return CandidateMetadata::from_core(core.value(), "pep658");
            log::debug("%s: bad PEP 658 metadata: %s", file.filename.c_str(),
                       core.error().message.c_str());
        } else if (text.error().code == PyresError::Cancelled) {
            return std::move(text).error();
        } else {
            log::debug("%s: %s", file.filename.c_str(), text.error().message.c_str());
        }
    }

    if (!DistFilename::looks_like_distribution(file.filename)) {
        return PyresError{PyresError::MetadataUnavailable,
            "unsupported archive '" + file.filename + "'"};
    }
    auto bytes = index_.download(file);
    if (bytes.is_err()) return std::move(bytes).error();

    if (ends_with(file.filename, ".whl")) return from_wheel(bytes.value());

    auto sdist = from_sdist(bytes.value());
    if (sdist.is_err()) return std::move(sdist).error();
    if (sdist.value()) return Result<CandidateMetadata>::ok(std::move(*sdist.value()));

    if (!settings_.allow_build_hook) {
        return PyresError{PyresError::MetadataUnavailable,
            "dependencies are computed at build time",
            "enable allow-build-hook to run the build backend"};
    }
    return run_build_hook(bytes.value(), candidate).map_err([](PyresError e) {
        if (e.code == PyresError::Cancelled) return e;
        return PyresError{PyresError::MetadataUnavailable,
            "build backend did not produce metadata: " + e.message, e.hint};
    });
}

Result<CandidateMetadata> MetadataExtractor::extract(const Candidate& candidate) {
    // Unreadable or undeclared metadata prunes this candidate; an unreachable
    // index and malformed requirement text stop the run instead.
    auto meta = extract_any(candidate).map_err([&](PyresError e) {
        switch (e.code) {
            case PyresError::Parse:
            case PyresError::MetadataUnavailable: {
                PyresError u = unavailable(candidate, e.message);
                log::debug("%s", u.format().c_str());
                return u;
            }
            case PyresError::Network:
                return PyresError{PyresError::IndexUnavailable,
                    "cannot fetch metadata for " + candidate.to_string(), e.message};
            default:
                return e;
        }
    });
    if (meta.is_err()) return meta;

    CandidateMetadata& m = meta.value();
    if (!m.name.empty() && ProjectName::normalize(m.name) != candidate.name.normalized()) {
        return unavailable(candidate, "metadata names project '" + m.name + "'");
    }
    if (!m.version.empty()) {
        auto v = Version::parse(m.version);
        if (v.is_err() || v.value() != candidate.version) {
            return unavailable(candidate, "metadata declares version '" + m.version + "'");
        }
    }
    log::trace("%s: %zu requirements from %s", candidate.to_string().c_str(),
               m.requires_dist.size(), m.source.c_str());
    return meta;
}

} // namespace pyres
