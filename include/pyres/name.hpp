#pragma once

#include <pyres/result.hpp>
#include <string>

namespace pyres {

// Project name: [A-Za-z0-9] ([A-Za-z0-9._-]* [A-Za-z0-9])?
// Normalized form (PEP 503): lowercase, runs of '-', '_' and '.' become '-'
class ProjectName {
public:
    ProjectName() = default;

    static Result<ProjectName> parse(const std::string& raw);

    // Normalize without validation (for keys read from trusted listings)
    static std::string normalize(const std::string& raw);

    const std::string& raw() const { return raw_; }
    const std::string& normalized() const { return normalized_; }
    bool empty() const { return normalized_.empty(); }

    bool operator==(const ProjectName& o) const { return normalized_ == o.normalized_; }
    bool operator!=(const ProjectName& o) const { return !(*this == o); }
    bool operator<(const ProjectName& o) const { return normalized_ < o.normalized_; }

private:
    std::string raw_;
    std::string normalized_;
};

// Extras are compared in the same normalized form as project names
inline std::string normalize_extra(const std::string& raw) {
    return ProjectName::normalize(raw);
}

} // namespace pyres
