#include <pyres/marker.hpp>
#include <pyres/name.hpp>
#include <pyres/version.hpp>
#include <algorithm>
#include <cctype>

namespace pyres {

namespace {

// Canonical variables plus the legacy dotted aliases still found in the wild
struct VariableAlias {
    const char* spelling;
    const char* canonical;
};

const VariableAlias k_variables[] = {
    {"python_version", "python_version"},
    {"python_full_version", "python_full_version"},
    {"os_name", "os_name"},
    {"sys_platform", "sys_platform"},
    {"platform_release", "platform_release"},
    {"platform_system", "platform_system"},
    {"platform_version", "platform_version"},
    {"platform_machine", "platform_machine"},
    {"platform_python_implementation", "platform_python_implementation"},
    {"implementation_name", "implementation_name"},
    {"implementation_version", "implementation_version"},
    {"extra", "extra"},
    {"os.name", "os_name"},
    {"sys.platform", "sys_platform"},
    {"platform.version", "platform_version"},
    {"platform.machine", "platform_machine"},
    {"platform.python_implementation", "platform_python_implementation"},
    {"python_implementation", "platform_python_implementation"},
};

const char* canonical_variable(const std::string& name) {
    for (const auto& v : k_variables) {
        if (name == v.spelling) return v.canonical;
    }
    return nullptr;
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Recursive descent parser
// ---------------------------------------------------------------------------

struct MarkerParser {
    const std::string& input;
    size_t pos = 0;

    explicit MarkerParser(const std::string& s) : input(s) {}

    void skip_ws() {
        while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
            ++pos;
        }
    }

    bool at_end() const { return pos >= input.size(); }

    PyresError error_at(const std::string& what) const {
        std::string near = at_end() ? "end of input" : "'" + input.substr(pos) + "'";
        return PyresError{PyresError::Parse,
            what + " at position " + std::to_string(pos) + " near " + near,
            "in marker '" + input + "'"};
    }

    // Keyword match that refuses to split an identifier ("android" != "and")
    bool try_keyword(const char* kw) {
        skip_ws();
        size_t len = std::char_traits<char>::length(kw);
        if (input.compare(pos, len, kw) != 0) return false;
        if (pos + len < input.size() && is_ident_char(input[pos + len])) return false;
        pos += len;
        return true;
    }

    Result<Marker> parse_or() {
        auto first = parse_and();
        if (first.is_err()) return first;
        std::vector<Marker> items;
        items.push_back(std::move(first).value());
        while (try_keyword("or")) {
            auto next = parse_and();
            if (next.is_err()) return next;
            items.push_back(std::move(next).value());
        }
        if (items.size() == 1) return Result<Marker>::ok(std::move(items.front()));
        return Result<Marker>::ok(Marker::any(std::move(items)));
    }

    Result<Marker> parse_and() {
        auto first = parse_atom();
        if (first.is_err()) return first;
        std::vector<Marker> items;
        items.push_back(std::move(first).value());
        while (try_keyword("and")) {
            auto next = parse_atom();
            if (next.is_err()) return next;
            items.push_back(std::move(next).value());
        }
        if (items.size() == 1) return Result<Marker>::ok(std::move(items.front()));
        return Result<Marker>::ok(Marker::all(std::move(items)));
    }

    Result<Marker> parse_atom() {
        skip_ws();
        if (at_end()) return error_at("expected marker expression");
        if (input[pos] == '(') {
            ++pos;
            auto inner = parse_or();
            if (inner.is_err()) return inner;
            skip_ws();
            if (at_end() || input[pos] != ')') return error_at("expected ')'");
            ++pos;
            return inner;
        }

        Marker m;
        m.kind_ = Marker::Compare;
        auto lhs = parse_operand();
        if (lhs.is_err()) return std::move(lhs).error();
        m.lhs_ = std::move(lhs).value();

        auto op = parse_op();
        if (op.is_err()) return std::move(op).error();
        m.op_ = std::move(op).value();

        auto rhs = parse_operand();
        if (rhs.is_err()) return std::move(rhs).error();
        m.rhs_ = std::move(rhs).value();

        if (m.lhs_.is_variable == m.rhs_.is_variable && !m.lhs_.is_variable) {
            return PyresError{PyresError::Parse,
                "marker compares two literals",
                "in marker '" + input + "'"};
        }
        return Result<Marker>::ok(std::move(m));
    }

    Result<Marker::Operand> parse_operand() {
        skip_ws();
        if (at_end()) return error_at("expected variable or string");

        char c = input[pos];
        if (c == '"' || c == '\'') {
            size_t close = input.find(c, pos + 1);
            if (close == std::string::npos) return error_at("unterminated string");
            Marker::Operand o;
            o.text = input.substr(pos + 1, close - pos - 1);
            pos = close + 1;
            return Result<Marker::Operand>::ok(std::move(o));
        }

        size_t start = pos;
        while (pos < input.size() && is_ident_char(input[pos])) ++pos;
        if (start == pos) return error_at("expected variable or string");

        std::string name = input.substr(start, pos - start);
        const char* canonical = canonical_variable(name);
        if (!canonical) {
            return PyresError{PyresError::UnsupportedMarker,
                "unsupported marker variable '" + name + "'",
                "in marker '" + input + "'"};
        }
        Marker::Operand o;
        o.is_variable = true;
        o.text = canonical;
        return Result<Marker::Operand>::ok(std::move(o));
    }

    Result<std::string> parse_op() {
        skip_ws();
        static const char* const ops[] = {"===", "==", "!=", "<=", ">=", "~=", "<", ">"};
        for (const char* op : ops) {
            size_t len = std::char_traits<char>::length(op);
            if (input.compare(pos, len, op) == 0) {
                pos += len;
                return Result<std::string>::ok(op);
            }
        }
        if (try_keyword("in")) return Result<std::string>::ok("in");
        size_t saved = pos;
        if (try_keyword("not") && try_keyword("in")) {
            return Result<std::string>::ok("not in");
        }
        pos = saved;
        return error_at("expected marker operator");
    }
};

Result<Marker> Marker::parse(const std::string& input) {
    MarkerParser parser(input);
    parser.skip_ws();
    if (parser.at_end()) {
        return PyresError{PyresError::Parse, "empty marker expression"};
    }
    auto result = parser.parse_or();
    if (result.is_err()) return result;
    parser.skip_ws();
    if (!parser.at_end()) {
        return parser.error_at("unexpected characters after marker");
    }
    return result;
}

Marker Marker::all(std::vector<Marker> children) {
    Marker m;
    m.kind_ = And;
    m.children_ = std::move(children);
    return m;
}

Marker Marker::any(std::vector<Marker> children) {
    Marker m;
    m.kind_ = Or;
    m.children_ = std::move(children);
    return m;
}

bool Marker::is_known_variable(const std::string& name) {
    return canonical_variable(name) != nullptr;
}

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------

namespace {

bool string_compare(const std::string& lhs, const std::string& op, const std::string& rhs) {
    if (op == "==" || op == "===") return lhs == rhs;
    if (op == "!=") return lhs != rhs;
    if (op == "<")  return lhs < rhs;
    if (op == "<=") return lhs <= rhs;
    if (op == ">")  return lhs > rhs;
    if (op == ">=") return lhs >= rhs;
    if (op == "in") return rhs.find(lhs) != std::string::npos;
    if (op == "not in") return rhs.find(lhs) == std::string::npos;
    return false;  // "~=" on non-versions
}

// Version semantics when the right side forms a valid specifier and the
// left side a valid version; plain string semantics otherwise.
bool compare_values(const std::string& lhs, const std::string& op, const std::string& rhs) {
    if (op != "in" && op != "not in") {
        auto spec = VersionSpecifier::parse(op + rhs);
        if (spec.is_ok()) {
            auto v = Version::parse(lhs);
            if (v.is_ok()) return spec.value().contains(v.value());
        }
    }
    return string_compare(lhs, op, rhs);
}

} // anonymous namespace

bool Marker::eval_compare(const MarkerValues& values, const ExtraSet& extras) const {
    bool extra_lhs = lhs_.is_variable && lhs_.text == "extra";
    bool extra_rhs = rhs_.is_variable && rhs_.text == "extra";
    if (extra_lhs || extra_rhs) {
        const Operand& other = extra_lhs ? rhs_ : lhs_;
        std::string wanted = normalize_extra(other.text);
        bool requested = extras.count(wanted) > 0;
        if (op_ == "==" || op_ == "===") return requested;
        if (op_ == "!=") return !requested;
        // Anything else compares against the empty string
        return extra_lhs ? compare_values("", op_, wanted)
                         : compare_values(wanted, op_, "");
    }

    auto resolve = [&](const Operand& o) -> std::string {
        if (!o.is_variable) return o.text;
        auto it = values.find(o.text);
        return it != values.end() ? it->second : std::string();
    };
    return compare_values(resolve(lhs_), op_, resolve(rhs_));
}

bool Marker::evaluate(const MarkerValues& values, const ExtraSet& extras) const {
    switch (kind_) {
    case Compare:
        return eval_compare(values, extras);
    case And:
        return std::all_of(children_.begin(), children_.end(),
            [&](const Marker& c) { return c.evaluate(values, extras); });
    case Or:
        return std::any_of(children_.begin(), children_.end(),
            [&](const Marker& c) { return c.evaluate(values, extras); });
    }
    return false; // unreachable
}

bool Marker::references_extra() const {
    if (kind_ == Compare) {
        return (lhs_.is_variable && lhs_.text == "extra") ||
               (rhs_.is_variable && rhs_.text == "extra");
    }
    return std::any_of(children_.begin(), children_.end(),
        [](const Marker& c) { return c.references_extra(); });
}

std::set<std::string> Marker::variables() const {
    std::set<std::string> out;
    if (kind_ == Compare) {
        if (lhs_.is_variable) out.insert(lhs_.text);
        if (rhs_.is_variable) out.insert(rhs_.text);
        return out;
    }
    for (const auto& c : children_) {
        auto sub = c.variables();
        out.insert(sub.begin(), sub.end());
    }
    return out;
}

// ---------------------------------------------------------------------------
// to_string
// ---------------------------------------------------------------------------

std::string Marker::to_string() const {
    auto operand = [](const Operand& o) {
        if (o.is_variable) return o.text;
        char q = o.text.find('"') == std::string::npos ? '"' : '\'';
        return q + o.text + q;
    };

    if (kind_ == Compare) {
        return operand(lhs_) + " " + op_ + " " + operand(rhs_);
    }

    const char* joiner = kind_ == And ? " and " : " or ";
    std::string s;
    for (size_t i = 0; i < children_.size(); ++i) {
        if (i > 0) s += joiner;
        // "or" inside "and" needs parentheses to keep its meaning
        bool wrap = kind_ == And && children_[i].kind_ == Or;
        s += wrap ? "(" + children_[i].to_string() + ")"
                  : children_[i].to_string();
    }
    return s;
}

} // namespace pyres
