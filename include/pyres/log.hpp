#pragma once

#include <string>
#include <cstdio>

namespace pyres::log {

enum Level { Trace, Debug, Info, Warn, Error, Off };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Prefix every line with a "[tag] " marker, e.g. the worker name.
// Thread-local: each prefetch worker can carry its own tag.
void set_thread_tag(const std::string& tag);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parses "trace", "debug", ... (case-sensitive). Unknown names yield Info.
Level level_from_name(const std::string& name);

} // namespace pyres::log
