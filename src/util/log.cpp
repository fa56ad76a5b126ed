#include <pyres/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <unistd.h>

namespace pyres::log {

static std::atomic<int> s_level{Info};
static std::once_flag s_color_once;
static std::atomic<bool> s_color_enabled{false};
static std::mutex s_write_mutex;
static thread_local std::string t_tag;

static void init_color() {
    std::call_once(s_color_once, [] {
        s_color_enabled = isatty(fileno(stderr)) != 0;
    });
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return static_cast<Level>(s_level.load());
}

bool enabled(Level lvl) {
    return lvl != Off && lvl >= s_level.load();
}

void set_color_enabled(bool enabled) {
    std::call_once(s_color_once, [] {});
    s_color_enabled = enabled;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

void set_thread_tag(const std::string& tag) {
    t_tag = tag;
}

namespace {

struct LevelInfo {
    const char* name;
    const char* color;
};

// Indexed by Level
const LevelInfo k_levels[] = {
    {"trace", "\033[90m"},
    {"debug", "\033[36m"},
    {"info",  "\033[32m"},
    {"warn",  "\033[33m"},
    {"error", "\033[31m"},
    {"off",   ""},
};

const char* const k_reset = "\033[0m";

} // namespace

const char* level_name(Level lvl) {
    if (lvl < Trace || lvl > Off) return "unknown";
    return k_levels[lvl].name;
}

Level level_from_name(const std::string& name) {
    for (int i = Trace; i <= Off; ++i) {
        if (name == k_levels[i].name) return static_cast<Level>(i);
    }
    return Info;
}

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (!enabled(lvl)) return;
    init_color();

    // Format first so concurrent workers never interleave partial lines
    char stack_buf[1024];
    va_list copy;
    va_copy(copy, args);
    int n = std::vsnprintf(stack_buf, sizeof(stack_buf), fmt, copy);
    va_end(copy);

    std::string body;
    if (n < 0) {
        body = fmt;
    } else if (static_cast<size_t>(n) < sizeof(stack_buf)) {
        body.assign(stack_buf, static_cast<size_t>(n));
    } else {
        body.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(&body[0], body.size(), fmt, args);
        body.resize(static_cast<size_t>(n));
    }

    std::lock_guard<std::mutex> lock(s_write_mutex);
    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s%s: ", k_levels[lvl].color, level_name(lvl), k_reset);
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }
    if (!t_tag.empty()) {
        std::fprintf(stderr, "[%s] ", t_tag.c_str());
    }
    std::fprintf(stderr, "%s\n", body.c_str());
}

#define PYRES_LOG_EMITTER(fn, lvl)         \
    void fn(const char* fmt, ...) {        \
        va_list args;                      \
        va_start(args, fmt);               \
        log_message(lvl, fmt, args);       \
        va_end(args);                      \
    }

PYRES_LOG_EMITTER(trace, Trace)
PYRES_LOG_EMITTER(debug, Debug)
PYRES_LOG_EMITTER(info, Info)
PYRES_LOG_EMITTER(warn, Warn)
PYRES_LOG_EMITTER(error, Error)

#undef PYRES_LOG_EMITTER

} // namespace pyres::log
