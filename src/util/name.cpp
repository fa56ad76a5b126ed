#include <pyres/name.hpp>
#include <cctype>

namespace pyres {

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '.' || c == '_' || c == '-';
}

std::string ProjectName::normalize(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    bool in_sep = false;
    for (char c : raw) {
        if (c == '-' || c == '_' || c == '.') {
            if (!in_sep) out += '-';
            in_sep = true;
            continue;
        }
        in_sep = false;
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

Result<ProjectName> ProjectName::parse(const std::string& raw) {
    if (raw.empty()) {
        return PyresError{PyresError::InvalidArg, "empty project name"};
    }

    if (!std::isalnum(static_cast<unsigned char>(raw.front())) ||
        !std::isalnum(static_cast<unsigned char>(raw.back()))) {
        return PyresError{PyresError::InvalidArg,
            "invalid project name '" + raw + "'",
            "project names must start and end with a letter or digit"};
    }

    for (char c : raw) {
        if (!is_name_char(c)) {
            return PyresError{PyresError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in project name '" + raw + "'",
                "allowed: [A-Za-z0-9._-]"};
        }
    }

    ProjectName name;
    name.raw_ = raw;
    name.normalized_ = normalize(raw);
    return Result<ProjectName>::ok(std::move(name));
}

} // namespace pyres
