#include <pyres/environment.hpp>
#include <pyres/log.hpp>
#include <algorithm>
#include <cctype>

#include <sys/utsname.h>

namespace pyres {

namespace {

struct PythonVersionParts {
    int major = 0;
    int minor = 0;
    std::string full;
};

// Accepts "3.11", "311", "3.11.4", "27"
Result<PythonVersionParts> split_python_version(const std::string& raw) {
    PythonVersionParts p;
    std::string s = raw;
    if (s.empty()) {
        return PyresError{PyresError::InvalidArg, "empty python version"};
    }

    if (s.find('.') == std::string::npos) {
        if (s.size() < 2 || !std::all_of(s.begin(), s.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c));
            })) {
            return PyresError{PyresError::InvalidArg,
                "invalid python version '" + raw + "'",
                "use a form like 3.11 or 311"};
        }
        s = s.substr(0, 1) + "." + s.substr(1);
    }

    auto v = Version::parse(s);
    if (v.is_err() || v.value().release.size() < 2 || v.value().release.size() > 3) {
        return PyresError{PyresError::InvalidArg,
            "invalid python version '" + raw + "'",
            "use a form like 3.11 or 311"};
    }
    p.major = static_cast<int>(v.value().release[0]);
    p.minor = static_cast<int>(v.value().release[1]);
    p.full = v.value().to_string();
    return Result<PythonVersionParts>::ok(std::move(p));
}

std::vector<std::string> linux_platforms(const std::string& arch) {
    std::vector<std::string> out;
    for (int glibc = 39; glibc >= 5; --glibc) {
        out.push_back("manylinux_2_" + std::to_string(glibc) + "_" + arch);
        // Legacy aliases rank alongside the glibc version they stand for
        if (glibc == 17) out.push_back("manylinux2014_" + arch);
        if (glibc == 12) out.push_back("manylinux2010_" + arch);
        if (glibc == 5)  out.push_back("manylinux1_" + arch);
    }
    out.push_back("linux_" + arch);
    return out;
}

// Apple silicon wheels start at macOS 11
std::vector<std::string> mac_platforms() {
    std::vector<std::string> out;
    for (int major = 14; major >= 11; --major) {
        std::string v = std::to_string(major) + "_0";
        for (const char* arch : {"x86_64", "arm64", "universal2", "intel", "universal"}) {
            out.push_back("macosx_" + v + "_" + arch);
        }
    }
    for (int minor = 16; minor >= 9; --minor) {
        std::string v = "10_" + std::to_string(minor);
        for (const char* arch : {"x86_64", "universal2", "intel", "universal"}) {
            out.push_back("macosx_" + v + "_" + arch);
        }
    }
    return out;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

const std::vector<std::string>& Environment::supported_python_versions() {
    static const std::vector<std::string> versions = {
        "2.7", "3.6", "3.7", "3.8", "3.9", "3.10", "3.11", "3.12", "3.13", "3.14"
    };
    return versions;
}

const std::vector<std::string>& Environment::supported_os_names() {
    static const std::vector<std::string> names = {"linux", "mac", "macos", "windows"};
    return names;
}

Result<Environment> Environment::from_python_and_os(const std::string& python_version,
                                                    const std::string& os) {
    auto parts = split_python_version(python_version);
    if (parts.is_err()) return std::move(parts).error();

    std::string short_version = std::to_string(parts.value().major) + "." +
                                std::to_string(parts.value().minor);
    const auto& known = supported_python_versions();
    if (std::find(known.begin(), known.end(), short_version) == known.end()) {
        std::string list;
        for (const auto& k : known) list += (list.empty() ? "" : ", ") + k;
        return PyresError{PyresError::InvalidArg,
            "unsupported python version '" + python_version + "'",
            "must be one of: " + list};
    }

    Environment env;
    env.python_version = short_version;
    env.python_full_version = parts.value().full;

    if (os == "linux") {
        env.os_name = "posix";
        env.sys_platform = "linux";
        env.platform_system = "Linux";
        env.platform_machine = "x86_64";
        env.platforms = linux_platforms("x86_64");
    } else if (os == "mac" || os == "macos") {
        env.os_name = "posix";
        env.sys_platform = "darwin";
        env.platform_system = "Darwin";
        env.platform_machine = "x86_64";
        env.platforms = mac_platforms();
    } else if (os == "windows") {
        env.os_name = "nt";
        env.sys_platform = "win32";
        env.platform_system = "Windows";
        env.platform_machine = "AMD64";
        env.platforms = {"win_amd64"};
    } else {
        return PyresError{PyresError::InvalidArg,
            "unsupported operating system '" + os + "'",
            "must be one of: linux, mac, windows"};
    }

    return Result<Environment>::ok(std::move(env));
}

Result<Environment> Environment::current(const std::string& python_version) {
    struct utsname info;
    if (uname(&info) != 0) {
        return PyresError{PyresError::IO, "uname() failed"};
    }

    std::string sysname = info.sysname;
    std::string os = sysname == "Darwin" ? "mac" : "linux";
    auto env = from_python_and_os(python_version, os);
    if (env.is_err()) return env;

    Environment& e = env.value();
    e.platform_machine = info.machine;
    e.platform_release = info.release;
    e.platform_version = info.version;
    if (os == "linux") {
        e.platforms = linux_platforms(e.platform_machine);
    } else if (e.platform_machine == "arm64") {
        std::vector<std::string> arm;
        for (const auto& p : e.platforms) {
            if (p.size() > 7 && p.compare(p.size() - 7, 7, "_x86_64") == 0) {
                arm.push_back(p.substr(0, p.size() - 7) + "_arm64");
            } else if (p.find("_universal2") != std::string::npos) {
                arm.push_back(p);
            }
        }
        e.platforms = std::move(arm);
    }
    log::debug("host environment: %s", e.to_string().c_str());
    return env;
}

std::string Environment::interpreter_tag() const {
    std::string digits;
    for (char c : python_version) {
        if (c != '.') digits += c;
    }
    return "cp" + digits;
}

std::string Environment::to_string() const {
    std::string s = "python " + python_full_version + " on " + sys_platform +
                    " (" + platform_machine + ")";
    if (!platforms.empty()) s += ", " + std::to_string(platforms.size()) + " platform tags";
    return s;
}

// ---------------------------------------------------------------------------
// Markers
// ---------------------------------------------------------------------------

MarkerValues Environment::marker_values() const {
    return MarkerValues{
        {"python_version", python_version},
        {"python_full_version", python_full_version},
        {"implementation_name", implementation_name},
        {"implementation_version", python_full_version},
        {"platform_python_implementation", platform_python_implementation},
        {"os_name", os_name},
        {"sys_platform", sys_platform},
        {"platform_system", platform_system},
        {"platform_machine", platform_machine},
        {"platform_release", platform_release},
        {"platform_version", platform_version},
    };
}

bool Environment::evaluate(const Marker& marker, const ExtraSet& extras) const {
    return marker.evaluate(marker_values(), extras);
}

Result<bool> Environment::evaluate(const std::string& marker_expression,
                                   const ExtraSet& extras) const {
    auto marker = Marker::parse(marker_expression);
    if (marker.is_err()) return std::move(marker).error();
    return Result<bool>::ok(evaluate(marker.value(), extras));
}

bool Environment::supports_python(const std::string& requires_python) const {
    if (requires_python.empty()) return true;
    auto spec = SpecifierSet::parse(requires_python);
    if (spec.is_err()) {
        log::debug("ignoring invalid Requires-Python '%s'", requires_python.c_str());
        return true;
    }
    return supports_python(spec.value());
}

bool Environment::supports_python(const SpecifierSet& requires_python) const {
    auto v = Version::parse(python_full_version);
    if (v.is_err()) return true;
    return requires_python.contains(v.value(), true);
}

// ---------------------------------------------------------------------------
// Wheel tags
// ---------------------------------------------------------------------------

std::vector<WheelTag> Environment::supported_tags() const {
    std::vector<WheelTag> tags;
    auto parts = split_python_version(python_version);
    if (parts.is_err()) return tags;
    int major = parts.value().major;
    int minor = parts.value().minor;
    std::string interp = interpreter_tag();

    std::vector<std::string> abi_list;
    abi_list.push_back(interp);
    if (major == 2) {
        abi_list.push_back(interp + "mu");
        abi_list.push_back(interp + "m");
    }
    for (const auto& a : abis) abi_list.push_back(a);
    bool has_abi3 = major == 3 && minor >= 2;
    if (has_abi3) abi_list.push_back("abi3");
    abi_list.push_back("none");

    // Interpreter-specific tags
    for (const auto& abi : abi_list) {
        for (const auto& plat : platforms) {
            tags.push_back({interp, abi, plat});
        }
    }
    // Stable ABI wheels built for older 3.x
    if (has_abi3) {
        for (int m = minor - 1; m >= 2; --m) {
            for (const auto& plat : platforms) {
                tags.push_back({"cp" + std::to_string(major) + std::to_string(m), "abi3", plat});
            }
        }
    }

    // Generic python tags: py311, py3, py310, ..., py30
    std::vector<std::string> py_range;
    py_range.push_back("py" + std::to_string(major) + std::to_string(minor));
    py_range.push_back("py" + std::to_string(major));
    for (int m = minor - 1; m >= 0; --m) {
        py_range.push_back("py" + std::to_string(major) + std::to_string(m));
    }
    for (const auto& py : py_range) {
        for (const auto& plat : platforms) {
            tags.push_back({py, "none", plat});
        }
    }
    tags.push_back({interp, "none", "any"});
    for (const auto& py : py_range) {
        tags.push_back({py, "none", "any"});
    }
    return tags;
}

bool Environment::is_compatible(const std::vector<WheelTag>& wheel_tags) const {
    return tag_matcher().matches(wheel_tags);
}

TagMatcher::TagMatcher(const std::vector<WheelTag>& supported) {
    for (size_t i = 0; i < supported.size(); ++i) {
        rank_.emplace(supported[i].to_string(), i);
    }
}

std::optional<size_t> TagMatcher::priority(const std::vector<WheelTag>& wheel_tags) const {
    std::optional<size_t> best;
    for (const auto& t : wheel_tags) {
        auto it = rank_.find(t.to_string());
        if (it != rank_.end() && (!best || it->second < *best)) {
            best = it->second;
        }
    }
    return best;
}

} // namespace pyres
