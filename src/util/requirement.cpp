#include <pyres/requirement.hpp>
#include <pyres/log.hpp>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace pyres {

// ---------------------------------------------------------------------------
// Requirement
// ---------------------------------------------------------------------------

namespace {

PyresError malformed(const std::string& line, const std::string& offending,
                     const std::string& why) {
    return PyresError{PyresError::MalformedRequirement,
        "malformed requirement '" + line + "': " + why + " at '" + offending + "'"};
}

bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '-';
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

Result<Requirement> Requirement::parse(const std::string& raw) {
    std::string line = trim(raw);
    if (line.empty()) {
        return PyresError{PyresError::MalformedRequirement, "empty requirement"};
    }

    Requirement req;
    size_t pos = 0;
    auto skip_ws = [&] {
        while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) ++pos;
    };

    // Name
    while (pos < line.size() && is_name_char(line[pos])) ++pos;
    auto name = ProjectName::parse(line.substr(0, pos));
    if (name.is_err()) {
        return malformed(line, line.substr(0, std::max<size_t>(pos, 1)),
                         "invalid project name");
    }
    req.name = std::move(name).value();
    skip_ws();

    // Extras
    if (pos < line.size() && line[pos] == '[') {
        size_t close = line.find(']', pos);
        if (close == std::string::npos) {
            return malformed(line, line.substr(pos), "unclosed extras bracket");
        }
        std::istringstream extras(line.substr(pos + 1, close - pos - 1));
        std::string extra;
        while (std::getline(extras, extra, ',')) {
            extra = trim(extra);
            if (extra.empty()) {
                if (close == pos + 1) break;  // "[]" is allowed
                return malformed(line, line.substr(pos, close - pos + 1), "empty extra name");
            }
            if (!std::all_of(extra.begin(), extra.end(), is_name_char)) {
                return malformed(line, extra, "invalid extra name");
            }
            req.extras.insert(normalize_extra(extra));
        }
        pos = close + 1;
        skip_ws();
    }

    std::string marker_text;
    if (pos < line.size() && line[pos] == '@') {
        ++pos;
        skip_ws();
        size_t start = pos;
        while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos]))) ++pos;
        req.url = line.substr(start, pos - start);
        if (req.url.empty() || req.url.find(':') == std::string::npos) {
            return malformed(line, line.substr(start), "expected a URL after '@'");
        }
        // A ';' glued to the URL belongs to the URL per PEP 508
        skip_ws();
        if (pos < line.size()) {
            if (line[pos] != ';') {
                return malformed(line, line.substr(pos), "expected ';' before marker");
            }
            marker_text = line.substr(pos + 1);
        }
    } else {
        size_t semi = line.find(';', pos);
        std::string spec_text = trim(line.substr(pos, semi == std::string::npos
                                                      ? std::string::npos : semi - pos));
        if (semi != std::string::npos) marker_text = line.substr(semi + 1);

        if (!spec_text.empty() && spec_text.front() == '(') {
            if (spec_text.back() != ')') {
                return malformed(line, spec_text, "unclosed parenthesis");
            }
            spec_text = trim(spec_text.substr(1, spec_text.size() - 2));
        }
        if (!spec_text.empty()) {
            if (std::string("<>=!~(").find(spec_text.front()) == std::string::npos) {
                return malformed(line, spec_text, "expected version specifier");
            }
            auto spec = SpecifierSet::parse(spec_text);
            if (spec.is_err()) {
                return malformed(line, spec_text, spec.error().message);
            }
            req.specifier = std::move(spec).value();
        }
    }

    if (!trim(marker_text).empty()) {
        auto marker = Marker::parse(trim(marker_text));
        if (marker.is_err()) {
            if (marker.error().code == PyresError::UnsupportedMarker) {
                return std::move(marker).error();
            }
            return malformed(line, trim(marker_text), marker.error().message);
        }
        req.marker = std::move(marker).value();
    } else if (marker_text.find_first_not_of(" \t") == std::string::npos &&
               line.find(';') != std::string::npos && req.url.empty()) {
        return malformed(line, ";", "empty marker");
    }

    return Result<Requirement>::ok(std::move(req));
}

bool Requirement::applies_to(const Environment& env, const ExtraSet& active_extras) const {
    return !marker || env.evaluate(*marker, active_extras);
}

std::string Requirement::to_string() const {
    std::string s = name.raw();
    if (!extras.empty()) {
        s += "[";
        bool first = true;
        for (const auto& e : extras) {
            if (!first) s += ",";
            s += e;
            first = false;
        }
        s += "]";
    }
    if (!url.empty()) {
        s += " @ " + url;
        if (marker) s += " ";
    } else {
        s += specifier.to_string();
    }
    if (marker) s += "; " + marker->to_string();
    return s;
}

// ---------------------------------------------------------------------------
// RequirementsFile
// ---------------------------------------------------------------------------

namespace {

struct LogicalLine {
    std::string text;
    int line_no = 0;
};

// Joins backslash continuations and drops comments
std::vector<LogicalLine> logical_lines(const std::string& content) {
    std::vector<LogicalLine> out;
    std::istringstream stream(content);
    std::string physical;
    std::string pending;
    int line_no = 0;
    int start_line = 0;

    while (std::getline(stream, physical)) {
        ++line_no;
        if (!physical.empty() && physical.back() == '\r') physical.pop_back();
        if (pending.empty()) start_line = line_no;

        // Comments: whole line, or " #" after content
        size_t hash = physical.find('#');
        while (hash != std::string::npos) {
            if (hash == 0 || physical[hash - 1] == ' ' || physical[hash - 1] == '\t') {
                physical.resize(hash);
                break;
            }
            hash = physical.find('#', hash + 1);
        }

        if (!physical.empty() && physical.back() == '\\') {
            physical.pop_back();
            pending += physical;
            continue;
        }
        pending += physical;
        std::string t = trim(pending);
        if (!t.empty()) out.push_back({t, start_line});
        pending.clear();
    }
    if (!trim(pending).empty()) out.push_back({trim(pending), start_line});
    return out;
}

// "-r file", "-rfile", "--requirement=file", "--requirement file"
bool option_value(const std::string& line, const char* short_opt, const char* long_opt,
                  std::string& value) {
    auto take = [&](size_t from) {
        std::string rest = line.substr(from);
        if (!rest.empty() && rest.front() == '=') rest.erase(0, 1);
        value = trim(rest);
        return true;
    };
    std::string l(long_opt);
    if (line.compare(0, l.size(), l) == 0 &&
        (line.size() == l.size() || line[l.size()] == ' ' || line[l.size()] == '=')) {
        return take(l.size());
    }
    if (short_opt) {
        std::string s(short_opt);
        if (line.compare(0, s.size(), s) == 0) return take(s.size());
    }
    return false;
}

Status parse_into(RequirementsFile& out, const std::string& content,
                  const std::string& origin, const fs::path& base_dir,
                  bool as_constraints, std::set<std::string>& visited);

Status include_file(RequirementsFile& out, const std::string& rel, const fs::path& base_dir,
                    bool as_constraints, std::set<std::string>& visited,
                    const std::string& origin, int line_no) {
    fs::path target = fs::path(rel).is_absolute() ? fs::path(rel) : base_dir / rel;
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(target, ec);
    std::string key = ec ? target.string() : canonical.string();
    if (!visited.insert(key).second) {
        log::warn("%s:%d: skipping already included '%s'", origin.c_str(), line_no, rel.c_str());
        return ok_status();
    }

    std::ifstream file(target);
    if (!file.is_open()) {
        return PyresError{PyresError::IO,
            "cannot open included requirements file: " + target.string(), "",
            origin, line_no};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_into(out, ss.str(), target.string(), target.parent_path(),
                      as_constraints, visited);
}

Status parse_into(RequirementsFile& out, const std::string& content,
                  const std::string& origin, const fs::path& base_dir,
                  bool as_constraints, std::set<std::string>& visited) {
    for (const auto& ll : logical_lines(content)) {
        const std::string& line = ll.text;
        std::string value;

        if (option_value(line, "-r", "--requirement", value)) {
            PYRES_TRY(include_file(out, value, base_dir, as_constraints, visited,
                                   origin, ll.line_no));
            continue;
        }
        if (option_value(line, "-c", "--constraint", value)) {
            PYRES_TRY(include_file(out, value, base_dir, true, visited,
                                   origin, ll.line_no));
            continue;
        }
        if (option_value(line, "-i", "--index-url", value)) {
            out.index_urls.push_back(value);
            continue;
        }
        if (option_value(line, nullptr, "--extra-index-url", value)) {
            out.extra_index_urls.push_back(value);
            continue;
        }
        if (line == "--pre") {
            out.pre = true;
            continue;
        }
        if (line.front() == '-') {
            log::warn("%s:%d: ignoring unsupported option '%s'",
                      origin.c_str(), ll.line_no, line.c_str());
            continue;
        }

        auto req = Requirement::parse(line);
        if (req.is_err()) {
            auto e = std::move(req).error();
            e.file = origin;
            e.line = ll.line_no;
            return e;
        }
        Requirement r = std::move(req).value();
        r.origin = origin + ":" + std::to_string(ll.line_no);
        if (as_constraints) {
            out.constraints.push_back(std::move(r));
        } else {
            out.requirements.push_back(std::move(r));
        }
    }
    return ok_status();
}

} // anonymous namespace

Result<RequirementsFile> RequirementsFile::parse(const std::string& content,
                                                 const std::string& origin,
                                                 const std::string& base_dir) {
    RequirementsFile out;
    std::set<std::string> visited;
    auto status = parse_into(out, content, origin, base_dir, false, visited);
    if (status.is_err()) return std::move(status).error();
    return Result<RequirementsFile>::ok(std::move(out));
}

Result<RequirementsFile> RequirementsFile::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PyresError{PyresError::IO, "cannot open requirements file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();

    RequirementsFile out;
    std::set<std::string> visited;
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    visited.insert(ec ? path : canonical.string());

    auto status = parse_into(out, ss.str(), path, fs::path(path).parent_path(),
                             false, visited);
    if (status.is_err()) return std::move(status).error();
    return Result<RequirementsFile>::ok(std::move(out));
}

} // namespace pyres
