#pragma once

#include <pyres/result.hpp>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace pyres {

// Values of the PEP 508 environment variables, keyed by canonical name
// ("python_version", "sys_platform", ...). "extra" is never stored here.
using MarkerValues = std::map<std::string, std::string>;

// Requested extras, normalized
using ExtraSet = std::set<std::string>;

// A parsed PEP 508 environment marker:
//   python_version >= "3.8" and (sys_platform == "linux" or extra == "test")
class Marker {
public:
    enum Kind { Compare, And, Or };

    struct Operand {
        bool is_variable = false;
        std::string text;   // canonical variable name, or literal string
    };

    static Result<Marker> parse(const std::string& input);

    static Marker all(std::vector<Marker> children);
    static Marker any(std::vector<Marker> children);

    // Short-circuit evaluation. "extra == X" is true when X is requested.
    bool evaluate(const MarkerValues& values, const ExtraSet& extras = {}) const;

    // True if any comparison mentions the "extra" variable
    bool references_extra() const;

    // Names of every variable the expression reads
    std::set<std::string> variables() const;

    std::string to_string() const;

    Kind kind() const { return kind_; }

    static bool is_known_variable(const std::string& name);

private:
    Kind kind_ = Compare;
    Operand lhs_;
    std::string op_;
    Operand rhs_;
    std::vector<Marker> children_;   // for And, Or

    bool eval_compare(const MarkerValues& values, const ExtraSet& extras) const;

    friend struct MarkerParser;
};

} // namespace pyres
