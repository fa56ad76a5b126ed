#pragma once

#include <string>
#include <vector>

namespace pyres {

// One requirement that contributed to a resolution conflict, with the
// project that declared it (empty parent means a root requirement).
struct ConflictCause {
    std::string requirement;
    std::string parent;
};

struct PyresError {
    enum Code {
        IO,
        Parse,
        Config,
        Network,
        Checksum,
        InvalidArg,
        Cancelled,
        InvalidVersion,
        MalformedRequirement,
        UnsupportedMarker,
        ProjectNotFound,
        IndexUnavailable,
        MetadataUnavailable,
        Conflict,
        ResolutionTimedOut
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    // Populated for Conflict errors
    std::string project;
    std::vector<ConflictCause> causes;

    PyresError() = default;
    PyresError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PyresError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PyresError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Parse-level errors abort a run; everything else is a solver or
    // network condition.
    bool is_input_error() const;

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace pyres
