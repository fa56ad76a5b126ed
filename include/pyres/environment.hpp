#pragma once

#include <pyres/result.hpp>
#include <pyres/marker.hpp>
#include <pyres/version.hpp>
#include <optional>
#include <unordered_map>
#include <string>
#include <vector>

namespace pyres {

// One interpreter-abi-platform triple, e.g. cp311-cp311-manylinux_2_17_x86_64
struct WheelTag {
    std::string interpreter;
    std::string abi;
    std::string platform;

    bool operator==(const WheelTag& o) const {
        return interpreter == o.interpreter && abi == o.abi && platform == o.platform;
    }
    std::string to_string() const { return interpreter + "-" + abi + "-" + platform; }
};

// Priority lookup over an environment's supported tags (lower is better)
class TagMatcher {
public:
    TagMatcher() = default;
    explicit TagMatcher(const std::vector<WheelTag>& supported);

    std::optional<size_t> priority(const std::vector<WheelTag>& wheel_tags) const;
    bool matches(const std::vector<WheelTag>& wheel_tags) const {
        return priority(wheel_tags).has_value();
    }

private:
    std::unordered_map<std::string, size_t> rank_;
};

// Target interpreter and platform a resolution is computed for. Fixed for
// the duration of one run.
struct Environment {
    std::string python_version;          // "3.11"
    std::string python_full_version;     // "3.11" or "3.11.4"
    std::string implementation_name = "cpython";
    std::string platform_python_implementation = "CPython";
    std::string os_name;                 // "posix", "nt"
    std::string sys_platform;            // "linux", "darwin", "win32"
    std::string platform_system;         // "Linux", "Darwin", "Windows"
    std::string platform_machine;        // "x86_64", "AMD64"
    std::string platform_release;
    std::string platform_version;

    // Platform tags, most preferred first
    std::vector<std::string> platforms;
    // Extra ABI tags accepted besides cpXY, abi3 and none
    std::vector<std::string> abis;

    // "3.11"/"311"/"3.11.4" and "linux"/"mac"/"macos"/"windows"
    static Result<Environment> from_python_and_os(const std::string& python_version,
                                                  const std::string& os);

    // Host platform from uname(2), with the given target python version
    static Result<Environment> current(const std::string& python_version);

    static const std::vector<std::string>& supported_python_versions();
    static const std::vector<std::string>& supported_os_names();

    // "cp311"
    std::string interpreter_tag() const;

    MarkerValues marker_values() const;

    bool evaluate(const Marker& marker, const ExtraSet& extras = {}) const;
    Result<bool> evaluate(const std::string& marker_expression,
                          const ExtraSet& extras = {}) const;

    // Compatible tag triples, most preferred first
    std::vector<WheelTag> supported_tags() const;
    TagMatcher tag_matcher() const { return TagMatcher(supported_tags()); }

    // True if at least one of the wheel's triples fits this environment.
    // Builds a matcher per call; hold a TagMatcher for bulk filtering.
    bool is_compatible(const std::vector<WheelTag>& wheel_tags) const;

    // Checks a Requires-Python value; empty or unparsable values pass
    bool supports_python(const std::string& requires_python) const;
    bool supports_python(const SpecifierSet& requires_python) const;

    std::string to_string() const;
};

} // namespace pyres
