#include <pyres/config.hpp>
#include <toml++/toml.hpp>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

namespace pyres {

namespace {

PyresError bad_value(const std::string& section, const std::string& key,
                     const std::string& expected) {
    return PyresError{PyresError::Config,
        "config [" + section + "] " + key + ": expected " + expected};
}

template<typename T>
Status read_value(const toml::table& tbl, const std::string& section, const char* key,
                  const char* expected, std::optional<T>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    auto v = node.value<T>();
    if (!v) return bad_value(section, key, expected);
    out = *v;
    return ok_status();
}

Status read_count(const toml::table& tbl, const std::string& section, const char* key,
                  std::optional<int64_t>& out) {
    PYRES_TRY(read_value(tbl, section, key, "an integer", out));
    if (out && *out < 0) return bad_value(section, key, "a non-negative integer");
    return ok_status();
}

Status read_strings(const toml::table& tbl, const std::string& section, const char* key,
                    std::optional<std::vector<std::string>>& out) {
    auto node = tbl[key];
    if (!node) return ok_status();
    const toml::array* arr = node.as_array();
    if (!arr) return bad_value(section, key, "an array of strings");
    std::vector<std::string> values;
    for (const auto& el : *arr) {
        auto s = el.value<std::string>();
        if (!s) return bad_value(section, key, "an array of strings");
        values.push_back(*s);
    }
    out = std::move(values);
    return ok_status();
}

void warn_unknown(const toml::table& tbl, const std::string& section,
                  const std::set<std::string>& known) {
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (!known.count(k)) {
            log::warn("config: ignoring unknown key '%s' in [%s]", k.c_str(), section.c_str());
        }
    }
}

std::vector<std::string> split_list(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream stream(s);
    std::string item;
    while (std::getline(stream, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        size_t end = item.find_last_not_of(" \t");
        out.push_back(item.substr(start, end - start + 1));
    }
    return out;
}

bool truthy(const std::string& v) {
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    const char* home = std::getenv("HOME");
    if (!home) return path;
    return std::string(home) + path.substr(1);
}

} // anonymous namespace

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return PyresError{PyresError::Parse,
            std::string("config TOML parse error: ") + std::string(e.description()), "",
            "", static_cast<int>(e.source().begin.line)};
    }

    Config cfg;

    // [target] section
    if (auto target = doc["target"].as_table()) {
        const std::string s = "target";
        PYRES_TRY(read_value(*target, s, "python-version", "a string", cfg.target.python_version));
        PYRES_TRY(read_value(*target, s, "os", "a string", cfg.target.os));
        PYRES_TRY(read_strings(*target, s, "platforms", cfg.target.platforms));
        PYRES_TRY(read_strings(*target, s, "abis", cfg.target.abis));
        warn_unknown(*target, s, {"python-version", "os", "platforms", "abis"});
    }

    // [index] section
    if (auto index = doc["index"].as_table()) {
        const std::string s = "index";
        PYRES_TRY(read_strings(*index, s, "urls", cfg.index.urls));
        if (cfg.index.urls && cfg.index.urls->empty()) {
            return bad_value(s, "urls", "at least one index URL");
        }
        PYRES_TRY(read_value(*index, s, "netrc", "a string", cfg.index.netrc));
        PYRES_TRY(read_value(*index, s, "username", "a string", cfg.index.username));
        PYRES_TRY(read_value(*index, s, "password", "a string", cfg.index.password));
        PYRES_TRY(read_value(*index, s, "token", "a string", cfg.index.token));
        PYRES_TRY(read_count(*index, s, "request-timeout", cfg.index.request_timeout));
        PYRES_TRY(read_count(*index, s, "max-attempts", cfg.index.max_attempts));
        PYRES_TRY(read_count(*index, s, "backoff-ms", cfg.index.backoff_ms));
        PYRES_TRY(read_count(*index, s, "backoff-max-ms", cfg.index.backoff_max_ms));
        if (cfg.index.max_attempts && *cfg.index.max_attempts == 0) {
            return bad_value(s, "max-attempts", "at least 1");
        }
        warn_unknown(*index, s, {"urls", "netrc", "username", "password", "token",
                                 "request-timeout", "max-attempts", "backoff-ms",
                                 "backoff-max-ms"});
    }

    // [resolve] section
    if (auto resolve = doc["resolve"].as_table()) {
        const std::string s = "resolve";
        PYRES_TRY(read_value(*resolve, s, "prereleases", "a boolean", cfg.resolve.prereleases));
        PYRES_TRY(read_value(*resolve, s, "prefer-source", "a boolean", cfg.resolve.prefer_source));
        PYRES_TRY(read_value(*resolve, s, "allow-build-hook", "a boolean",
                             cfg.resolve.allow_build_hook));
        PYRES_TRY(read_value(*resolve, s, "python", "a string", cfg.resolve.python));
        PYRES_TRY(read_count(*resolve, s, "build-timeout", cfg.resolve.build_timeout));
        PYRES_TRY(read_count(*resolve, s, "max-rounds", cfg.resolve.max_rounds));
        PYRES_TRY(read_count(*resolve, s, "timeout", cfg.resolve.timeout));
        PYRES_TRY(read_count(*resolve, s, "concurrency", cfg.resolve.concurrency));

        std::optional<std::string> lifetime;
        PYRES_TRY(read_value(*resolve, s, "cache-lifetime", "a string", lifetime));
        if (lifetime) {
            auto parsed = cache_lifetime_from_name(*lifetime);
            if (parsed.is_err()) return std::move(parsed).error();
            cfg.resolve.cache_lifetime = parsed.value();
        }
        warn_unknown(*resolve, s, {"prereleases", "prefer-source", "allow-build-hook",
                                   "python", "build-timeout", "max-rounds", "timeout",
                                   "concurrency", "cache-lifetime"});
    }

    // [log] section
    if (auto logt = doc["log"].as_table()) {
        std::optional<std::string> level;
        PYRES_TRY(read_value(*logt, "log", "level", "a string", level));
        if (level) {
            static const std::set<std::string> names = {
                "trace", "debug", "info", "warn", "error", "off"};
            if (!names.count(*level)) {
                return PyresError{PyresError::Config, "unknown log level '" + *level + "'",
                    "expected one of: trace, debug, info, warn, error, off"};
            }
            cfg.log_level = log::level_from_name(*level);
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return PyresError{PyresError::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) cfg.error().file = path;
    return cfg;
}

Result<Config> Config::from_env(const EnvLookup& lookup) {
    Config cfg;
    auto get = [&](const char* name) -> std::optional<std::string> {
        const char* v = lookup(name);
        if (!v || !*v) return std::nullopt;
        return std::string(v);
    };

    if (auto v = get("PYRES_INDEX_URL")) {
        auto urls = split_list(*v);
        if (urls.empty()) {
            return PyresError{PyresError::Config, "PYRES_INDEX_URL names no index URL"};
        }
        cfg.index.urls = std::move(urls);
    }
    if (auto v = get("PYRES_PYTHON_VERSION")) cfg.target.python_version = *v;
    if (auto v = get("PYRES_OS")) cfg.target.os = *v;
    if (auto v = get("PYRES_NETRC")) cfg.index.netrc = *v;

    // debug wins over verbose
    if (auto v = get("PYRES_VERBOSE"); v && truthy(*v)) cfg.log_level = log::Debug;
    if (auto v = get("PYRES_DEBUG"); v && truthy(*v)) cfg.log_level = log::Trace;

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::from_env() {
    return from_env([](const char* name) { return std::getenv(name); });
}

namespace {

template<typename T>
void take(std::optional<T>& into, const std::optional<T>& from) {
    if (from) into = from;
}

} // anonymous namespace

void Config::merge(const Config& other) {
    take(target.python_version, other.target.python_version);
    take(target.os, other.target.os);
    take(target.platforms, other.target.platforms);
    take(target.abis, other.target.abis);

    take(index.urls, other.index.urls);
    take(index.netrc, other.index.netrc);
    take(index.username, other.index.username);
    take(index.password, other.index.password);
    take(index.token, other.index.token);
    take(index.request_timeout, other.index.request_timeout);
    take(index.max_attempts, other.index.max_attempts);
    take(index.backoff_ms, other.index.backoff_ms);
    take(index.backoff_max_ms, other.index.backoff_max_ms);

    take(resolve.prereleases, other.resolve.prereleases);
    take(resolve.prefer_source, other.resolve.prefer_source);
    take(resolve.allow_build_hook, other.resolve.allow_build_hook);
    take(resolve.python, other.resolve.python);
    take(resolve.build_timeout, other.resolve.build_timeout);
    take(resolve.max_rounds, other.resolve.max_rounds);
    take(resolve.timeout, other.resolve.timeout);
    take(resolve.concurrency, other.resolve.concurrency);
    take(resolve.cache_lifetime, other.resolve.cache_lifetime);

    take(log_level, other.log_level);
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& project,
                         const std::optional<Config>& env) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (project.has_value()) result.merge(project.value());
    if (env.has_value()) result.merge(env.value());
    return result;
}

Result<Environment> Config::to_environment() const {
    std::string python = target.python_version.value_or("3.9");
    auto env = target.os ? Environment::from_python_and_os(python, *target.os)
                         : Environment::current(python);
    if (env.is_err()) {
        auto e = std::move(env).error();
        e.code = PyresError::Config;
        return e;
    }
    if (target.platforms) {
        if (target.platforms->empty()) {
            return bad_value("target", "platforms", "at least one platform tag");
        }
        env.value().platforms = *target.platforms;
    }
    if (target.abis) env.value().abis = *target.abis;
    return env;
}

Result<ContextSettings> Config::to_context_settings() const {
    ContextSettings s;
    if (index.urls) s.index.urls = *index.urls;
    if (index.request_timeout) s.index.request_timeout = static_cast<int>(*index.request_timeout);
    if (index.max_attempts) s.index.retry.max_attempts = static_cast<int>(*index.max_attempts);
    if (index.backoff_ms) s.index.retry.backoff = std::chrono::milliseconds(*index.backoff_ms);
    if (index.backoff_max_ms) {
        s.index.retry.max_backoff = std::chrono::milliseconds(*index.backoff_max_ms);
    }
    if (s.index.retry.max_backoff < s.index.retry.backoff) {
        return bad_value("index", "backoff-max-ms", "a value no smaller than backoff-ms");
    }
    s.index.prefer_source = resolve.prefer_source.value_or(false);

    s.metadata.allow_build_hook = resolve.allow_build_hook.value_or(false);
    if (resolve.python) s.metadata.python = *resolve.python;
    if (resolve.build_timeout) s.metadata.build_timeout = static_cast<int>(*resolve.build_timeout);

    if (resolve.concurrency) s.concurrency = static_cast<size_t>(*resolve.concurrency);
    if (resolve.cache_lifetime) s.cache_lifetime = *resolve.cache_lifetime;
    return Result<ContextSettings>::ok(std::move(s));
}

ResolveOptions Config::to_resolve_options() const {
    ResolveOptions o;
    o.prereleases = resolve.prereleases.value_or(false);
    if (resolve.max_rounds) o.max_rounds = static_cast<size_t>(*resolve.max_rounds);
    if (resolve.timeout) o.timeout = std::chrono::seconds(*resolve.timeout);
    return o;
}

Credentials Config::credentials() const {
    Credentials c;
    if (index.netrc) c.netrc_file = expand_home(*index.netrc);
    c.username = index.username.value_or("");
    c.password = index.password.value_or("");
    c.token = index.token.value_or("");
    return c;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.pyres/config.toml";
}

} // namespace pyres
