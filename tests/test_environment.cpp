#include <catch2/catch.hpp>
#include <pyres/environment.hpp>

#include <algorithm>

using namespace pyres;

static Environment env_for(const std::string& python, const std::string& os) {
    auto r = Environment::from_python_and_os(python, os);
    REQUIRE(r.is_ok());
    return r.value();
}

static std::vector<WheelTag> tags(const std::string& interp, const std::string& abi,
                                  const std::string& plat) {
    return {WheelTag{interp, abi, plat}};
}

// ===== Construction =====

TEST_CASE("linux environment from python and os", "[environment]") {
    auto env = env_for("3.11", "linux");
    REQUIRE(env.python_version == "3.11");
    REQUIRE(env.python_full_version == "3.11");
    REQUIRE(env.os_name == "posix");
    REQUIRE(env.sys_platform == "linux");
    REQUIRE(env.platform_system == "Linux");
    REQUIRE(env.platform_machine == "x86_64");
    REQUIRE(env.interpreter_tag() == "cp311");
    REQUIRE_FALSE(env.platforms.empty());
    REQUIRE(env.platforms.back() == "linux_x86_64");
}

TEST_CASE("python version spellings", "[environment]") {
    REQUIRE(env_for("311", "linux").python_version == "3.11");
    auto full = env_for("3.11.4", "linux");
    REQUIRE(full.python_version == "3.11");
    REQUIRE(full.python_full_version == "3.11.4");
    REQUIRE(env_for("27", "linux").interpreter_tag() == "cp27");
}

TEST_CASE("mac and windows environments", "[environment]") {
    auto mac = env_for("3.12", "macos");
    REQUIRE(mac.sys_platform == "darwin");
    REQUIRE(mac.platform_system == "Darwin");

    auto win = env_for("3.12", "windows");
    REQUIRE(win.os_name == "nt");
    REQUIRE(win.sys_platform == "win32");
    REQUIRE(win.platforms == std::vector<std::string>{"win_amd64"});
}

TEST_CASE("mac target accepts intel and apple silicon wheels", "[environment][tags]") {
    auto mac = env_for("3.12", "mac");
    REQUIRE(mac.is_compatible(tags("cp312", "cp312", "macosx_11_0_arm64")));
    REQUIRE(mac.is_compatible(tags("cp312", "cp312", "macosx_14_0_arm64")));
    REQUIRE(mac.is_compatible(tags("cp312", "cp312", "macosx_10_9_x86_64")));
    REQUIRE(mac.is_compatible(tags("cp312", "cp312", "macosx_10_9_universal2")));
    REQUIRE_FALSE(mac.is_compatible(tags("cp312", "cp312", "macosx_10_16_arm64")));
    REQUIRE_FALSE(mac.is_compatible(tags("cp312", "cp312", "manylinux_2_17_x86_64")));
}

TEST_CASE("unsupported python or os", "[environment]") {
    auto old = Environment::from_python_and_os("3.5", "linux");
    REQUIRE(old.is_err());
    REQUIRE(old.error().code == PyresError::InvalidArg);
    REQUIRE(Environment::from_python_and_os("three", "linux").is_err());
    REQUIRE(Environment::from_python_and_os("3.11", "beos").is_err());
}

TEST_CASE("host environment", "[environment]") {
    auto r = Environment::current("3.10");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().python_version == "3.10");
    REQUIRE_FALSE(r.value().platform_machine.empty());
}

// ===== Markers =====

TEST_CASE("marker values and evaluation", "[environment]") {
    auto env = env_for("3.11", "linux");
    auto values = env.marker_values();
    REQUIRE(values.at("python_version") == "3.11");
    REQUIRE(values.at("sys_platform") == "linux");
    REQUIRE(values.count("extra") == 0);

    auto old = env.evaluate("python_version < '3.8'");
    REQUIRE(old.is_ok());
    REQUIRE_FALSE(old.value());

    auto extra = env.evaluate("extra == 'dev'", {"dev"});
    REQUIRE(extra.is_ok());
    REQUIRE(extra.value());

    REQUIRE(env.evaluate("nonsense ==").is_err());
}

TEST_CASE("requires-python checks", "[environment]") {
    auto env = env_for("3.11", "linux");
    REQUIRE(env.supports_python(">=3.8"));
    REQUIRE_FALSE(env.supports_python("<3.8"));
    REQUIRE(env.supports_python(""));
    REQUIRE(env.supports_python("not a specifier"));
    REQUIRE(env.supports_python(">=3.11.0rc1"));
}

// ===== Wheel tags =====

TEST_CASE("supported tags are ordered most specific first", "[environment]") {
    auto env = env_for("3.11", "linux");
    auto supported = env.supported_tags();
    REQUIRE_FALSE(supported.empty());
    REQUIRE(supported.front() == (WheelTag{"cp311", "cp311", "manylinux_2_39_x86_64"}));
    REQUIRE(supported.back() == (WheelTag{"py30", "none", "any"}));
}

TEST_CASE("wheel compatibility", "[environment]") {
    auto env = env_for("3.11", "linux");
    REQUIRE(env.is_compatible(tags("cp311", "cp311", "manylinux_2_17_x86_64")));
    REQUIRE(env.is_compatible(tags("cp311", "cp311", "manylinux2014_x86_64")));
    REQUIRE(env.is_compatible(tags("cp38", "abi3", "manylinux_2_17_x86_64")));
    REQUIRE(env.is_compatible(tags("py3", "none", "any")));
    REQUIRE_FALSE(env.is_compatible(tags("cp310", "cp310", "manylinux_2_17_x86_64")));
    REQUIRE_FALSE(env.is_compatible(tags("cp311", "cp311", "win_amd64")));
    REQUIRE_FALSE(env.is_compatible(tags("cp311", "cp311", "manylinux_2_17_aarch64")));
}

TEST_CASE("tag priority prefers platform wheels", "[environment]") {
    auto matcher = env_for("3.11", "linux").tag_matcher();
    auto native = matcher.priority(tags("cp311", "cp311", "manylinux_2_17_x86_64"));
    auto pure = matcher.priority(tags("py3", "none", "any"));
    REQUIRE(native.has_value());
    REQUIRE(pure.has_value());
    REQUIRE(*native < *pure);

    // Best of several triples counts
    std::vector<WheelTag> multi = {{"py3", "none", "any"},
                                   {"cp311", "cp311", "manylinux_2_17_x86_64"}};
    REQUIRE(matcher.priority(multi) == native);
    REQUIRE_FALSE(matcher.priority(tags("cp27", "cp27mu", "linux_x86_64")).has_value());
}

TEST_CASE("extra abis are accepted", "[environment]") {
    auto env = env_for("3.11", "linux");
    REQUIRE_FALSE(env.is_compatible(tags("cp311", "cp311d", "linux_x86_64")));
    env.abis = {"cp311d"};
    REQUIRE(env.is_compatible(tags("cp311", "cp311d", "linux_x86_64")));
}
