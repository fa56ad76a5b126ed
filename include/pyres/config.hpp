#pragma once

#include <pyres/result.hpp>
#include <pyres/context.hpp>
#include <pyres/environment.hpp>
#include <pyres/http.hpp>
#include <pyres/log.hpp>
#include <pyres/resolver.hpp>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace pyres {

// Every key is optional so a layer only overrides what it sets

// [target]
struct TargetConfig {
    std::optional<std::string> python_version;
    std::optional<std::string> os;
    std::optional<std::vector<std::string>> platforms;
    std::optional<std::vector<std::string>> abis;
};

// [index]
struct IndexConfig {
    std::optional<std::vector<std::string>> urls;
    std::optional<std::string> netrc;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> token;
    std::optional<int64_t> request_timeout;
    std::optional<int64_t> max_attempts;
    std::optional<int64_t> backoff_ms;
    std::optional<int64_t> backoff_max_ms;
};

// [resolve]
struct ResolveConfig {
    std::optional<bool> prereleases;
    std::optional<bool> prefer_source;
    std::optional<bool> allow_build_hook;
    std::optional<std::string> python;
    std::optional<int64_t> build_timeout;
    std::optional<int64_t> max_rounds;
    std::optional<int64_t> timeout;
    std::optional<int64_t> concurrency;
    std::optional<CacheLifetime> cache_lifetime;
};

// Layered configuration: defaults < global file < project file < environment
struct Config {
    TargetConfig target;
    IndexConfig index;
    ResolveConfig resolve;
    std::optional<log::Level> log_level;   // [log] level

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    using EnvLookup = std::function<const char*(const char*)>;

    // PYRES_INDEX_URL (comma-separated), PYRES_PYTHON_VERSION, PYRES_OS,
    // PYRES_NETRC, PYRES_VERBOSE, PYRES_DEBUG
    static Result<Config> from_env(const EnvLookup& lookup);
    static Result<Config> from_env();

    // Merge another config on top (other's values override this)
    void merge(const Config& other);

    // Build effective config from layers: global -> project -> environment
    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& project,
                            const std::optional<Config>& env);

    // Target environment; python defaults to 3.9 and the OS to the host
    Result<Environment> to_environment() const;
    Result<ContextSettings> to_context_settings() const;
    ResolveOptions to_resolve_options() const;
    Credentials credentials() const;

    log::Level effective_log_level() const { return log_level.value_or(log::Info); }
};

// Discover the global config file path: ~/.pyres/config.toml
std::string global_config_path();

} // namespace pyres
