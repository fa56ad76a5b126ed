#include <pyres/candidate.hpp>

namespace pyres {

const char* source_kind_name(SourceKind kind) {
    switch (kind) {
    case SourceKind::Wheel:     return "wheel";
    case SourceKind::Sdist:     return "sdist";
    case SourceKind::DirectUrl: return "url";
    }
    return "unknown";
}

std::string Candidate::key() const {
    return name.normalized() + "==" + version.to_string() + " " +
           source_kind_name(kind) + " " + file.filename;
}

std::string Candidate::purl() const {
    return "pkg:pypi/" + name.normalized() + "@" + version.to_string();
}

std::string Candidate::to_string() const {
    return name.normalized() + "==" + version.to_string();
}

} // namespace pyres
