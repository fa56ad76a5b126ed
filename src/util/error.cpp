#include <pyres/error.hpp>

namespace pyres {

const char* PyresError::code_name(Code c) {
    switch (c) {
        case IO:                   return "IO";
        case Parse:                return "Parse";
        case Config:               return "Config";
        case Network:              return "Network";
        case Checksum:             return "Checksum";
        case InvalidArg:           return "InvalidArg";
        case Cancelled:            return "Cancelled";
        case InvalidVersion:       return "InvalidVersion";
        case MalformedRequirement: return "MalformedRequirement";
        case UnsupportedMarker:    return "UnsupportedMarker";
        case ProjectNotFound:      return "ProjectNotFound";
        case IndexUnavailable:     return "IndexUnavailable";
        case MetadataUnavailable:  return "MetadataUnavailable";
        case Conflict:             return "Conflict";
        case ResolutionTimedOut:   return "ResolutionTimedOut";
    }
    return "Unknown";
}

bool PyresError::is_input_error() const {
    return code == InvalidVersion || code == MalformedRequirement ||
           code == UnsupportedMarker;
}

std::string PyresError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    for (const auto& cause : causes) {
        result += "\n  required by ";
        result += cause.parent.empty() ? "<root>" : cause.parent;
        result += ": ";
        result += cause.requirement;
    }

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace pyres
