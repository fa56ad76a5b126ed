#include <pyres/version.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

namespace pyres {

// ---------------------------------------------------------------------------
// Version parsing
// ---------------------------------------------------------------------------

namespace {

struct Scanner {
    const std::string& s;
    size_t pos = 0;

    explicit Scanner(const std::string& input) : s(input) {}

    bool at_end() const { return pos >= s.size(); }
    char peek(size_t ahead = 0) const {
        return pos + ahead < s.size() ? s[pos + ahead] : '\0';
    }

    bool digit_at(size_t at) const {
        return at < s.size() && std::isdigit(static_cast<unsigned char>(s[at]));
    }

    static bool is_sep(char c) { return c == '.' || c == '-' || c == '_'; }

    // Reads a run of digits; false if none present or on overflow
    bool number(uint64_t& out) {
        if (!digit_at(pos)) return false;
        uint64_t v = 0;
        while (digit_at(pos)) {
            uint64_t d = static_cast<uint64_t>(s[pos] - '0');
            if (v > (UINT64_MAX - d) / 10) return false;
            v = v * 10 + d;
            ++pos;
        }
        out = v;
        return true;
    }

    bool word_at(size_t at, const char* w) const {
        size_t i = 0;
        for (; w[i] != '\0'; ++i) {
            if (at + i >= s.size() || s[at + i] != w[i]) return false;
        }
        return true;
    }

    // Optional separator followed by one of the given words.
    // On match, consumes both and returns the index of the word.
    int sep_word(const std::vector<const char*>& words) {
        size_t at = pos;
        if (at < s.size() && is_sep(s[at])) ++at;
        for (size_t i = 0; i < words.size(); ++i) {
            if (word_at(at, words[i])) {
                pos = at + std::char_traits<char>::length(words[i]);
                return static_cast<int>(i);
            }
        }
        return -1;
    }

    // Optional separator followed by an optional number (implicit 0)
    uint64_t sep_number() {
        size_t at = pos;
        if (at < s.size() && is_sep(s[at]) && digit_at(at + 1)) ++at;
        if (!digit_at(at)) return 0;
        pos = at;
        uint64_t v = 0;
        number(v);
        return v;
    }
};

std::string lowercase_trimmed(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return out;
}

PyresError invalid_version(const std::string& s, const std::string& why) {
    return PyresError{PyresError::InvalidVersion,
        "invalid version '" + s + "': " + why,
        "expected a PEP 440 version such as 1.2.3, 2.0rc1 or 1.0.post1"};
}

} // anonymous namespace

Result<Version> Version::parse(const std::string& raw) {
    std::string s = lowercase_trimmed(raw);
    if (s.empty()) {
        return PyresError{PyresError::InvalidVersion, "empty version string"};
    }

    Version v;
    Scanner sc(s);
    if (sc.peek() == 'v') ++sc.pos;

    // Epoch or first release segment
    uint64_t n = 0;
    if (!sc.number(n)) {
        return invalid_version(raw, "expected a release number");
    }
    if (sc.peek() == '!') {
        v.epoch = n;
        ++sc.pos;
        if (!sc.number(n)) {
            return invalid_version(raw, "expected a release number after epoch");
        }
    }
    v.release.push_back(n);
    while (sc.peek() == '.' && sc.digit_at(sc.pos + 1)) {
        ++sc.pos;
        if (!sc.number(n)) return invalid_version(raw, "release segment overflow");
        v.release.push_back(n);
    }

    // Pre-release; longer spellings first so "alpha" is not read as "a"
    int pre = sc.sep_word({"alpha", "beta", "preview", "pre", "rc", "a", "b", "c"});
    if (pre >= 0) {
        switch (pre) {
        case 0: case 5: v.pre_tag = PreTag::Alpha; break;
        case 1: case 6: v.pre_tag = PreTag::Beta; break;
        default:        v.pre_tag = PreTag::Rc; break;
        }
        v.pre_num = sc.sep_number();
    }

    // Post-release: "-N" or [sep](post|rev|r)[sep][N]
    if (sc.peek() == '-' && sc.digit_at(sc.pos + 1)) {
        ++sc.pos;
        uint64_t p = 0;
        sc.number(p);
        v.post = p;
    } else if (sc.sep_word({"post", "rev", "r"}) >= 0) {
        v.post = sc.sep_number();
    }

    if (sc.sep_word({"dev"}) >= 0) {
        v.dev = sc.sep_number();
    }

    if (sc.peek() == '+') {
        ++sc.pos;
        std::string local;
        bool expect_alnum = true;
        while (!sc.at_end()) {
            char c = sc.peek();
            if (std::isalnum(static_cast<unsigned char>(c))) {
                local += c;
                expect_alnum = false;
            } else if (Scanner::is_sep(c) && !expect_alnum) {
                local += '.';
                expect_alnum = true;
            } else {
                break;
            }
            ++sc.pos;
        }
        if (local.empty() || expect_alnum) {
            return invalid_version(raw, "malformed local version label");
        }
        v.local = std::move(local);
    }

    if (!sc.at_end()) {
        return invalid_version(raw,
            "unexpected '" + s.substr(sc.pos) + "'");
    }

    return Result<Version>::ok(std::move(v));
}

std::string Version::to_string() const {
    std::string s;
    if (epoch != 0) s += std::to_string(epoch) + "!";
    for (size_t i = 0; i < release.size(); ++i) {
        if (i > 0) s += ".";
        s += std::to_string(release[i]);
    }
    if (pre_tag) {
        switch (*pre_tag) {
        case PreTag::Alpha: s += "a"; break;
        case PreTag::Beta:  s += "b"; break;
        case PreTag::Rc:    s += "rc"; break;
        }
        s += std::to_string(pre_num);
    }
    if (post) s += ".post" + std::to_string(*post);
    if (dev) s += ".dev" + std::to_string(*dev);
    if (!local.empty()) s += "+" + local;
    return s;
}

Version Version::base() const {
    Version b;
    b.epoch = epoch;
    b.release = release;
    return b;
}

Version Version::without_local() const {
    Version b = *this;
    b.local.clear();
    return b;
}

// ---------------------------------------------------------------------------
// Version ordering
// ---------------------------------------------------------------------------

namespace {

template<typename T>
int cmp(const T& a, const T& b) {
    return a < b ? -1 : (b < a ? 1 : 0);
}

// Release segments compare as if padded with zeros
int compare_release(const std::vector<uint64_t>& a, const std::vector<uint64_t>& b) {
    size_t n = std::max(a.size(), b.size());
    for (size_t i = 0; i < n; ++i) {
        uint64_t x = i < a.size() ? a[i] : 0;
        uint64_t y = i < b.size() ? b[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }
    return 0;
}

// Rank of the pre-release slot: a dev-only release sorts before any
// pre-release, a final release after all of them.
int pre_rank(const Version& v, int& tag, uint64_t& num) {
    if (v.pre_tag) {
        tag = static_cast<int>(*v.pre_tag);
        num = v.pre_num;
        return 1;
    }
    if (!v.post && v.dev) return 0;
    return 2;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c));
    });
}

std::vector<std::string> split_local(const std::string& local) {
    std::vector<std::string> parts;
    std::istringstream stream(local);
    std::string part;
    while (std::getline(stream, part, '.')) parts.push_back(part);
    return parts;
}

// Numeric local segments sort after alphanumeric ones
int compare_local(const std::string& a, const std::string& b) {
    if (a.empty() || b.empty()) return cmp(!a.empty(), !b.empty());
    auto pa = split_local(a);
    auto pb = split_local(b);
    size_t n = std::min(pa.size(), pb.size());
    for (size_t i = 0; i < n; ++i) {
        bool na = all_digits(pa[i]);
        bool nb = all_digits(pb[i]);
        if (na && nb) {
            std::string x = pa[i].substr(std::min(pa[i].find_first_not_of('0'), pa[i].size() - 1));
            std::string y = pb[i].substr(std::min(pb[i].find_first_not_of('0'), pb[i].size() - 1));
            if (x.size() != y.size()) return x.size() < y.size() ? -1 : 1;
            int c = x.compare(y);
            if (c != 0) return c < 0 ? -1 : 1;
        } else if (na != nb) {
            return na ? 1 : -1;
        } else {
            int c = pa[i].compare(pb[i]);
            if (c != 0) return c < 0 ? -1 : 1;
        }
    }
    return cmp(pa.size(), pb.size());
}

} // anonymous namespace

int Version::compare(const Version& o) const {
    if (int c = cmp(epoch, o.epoch)) return c;
    if (int c = compare_release(release, o.release)) return c;

    int tag_a = 0, tag_b = 0;
    uint64_t num_a = 0, num_b = 0;
    int rank_a = pre_rank(*this, tag_a, num_a);
    int rank_b = pre_rank(o, tag_b, num_b);
    if (int c = cmp(rank_a, rank_b)) return c;
    if (rank_a == 1) {
        if (int c = cmp(tag_a, tag_b)) return c;
        if (int c = cmp(num_a, num_b)) return c;
    }

    // No post-release sorts before any post-release
    if (int c = cmp(post.has_value(), o.post.has_value())) return c;
    if (post && *post != *o.post) return *post < *o.post ? -1 : 1;

    // No dev-release sorts after any dev-release
    if (int c = cmp(!dev.has_value(), !o.dev.has_value())) return c;
    if (dev && *dev != *o.dev) return *dev < *o.dev ? -1 : 1;

    return compare_local(local, o.local);
}

// ---------------------------------------------------------------------------
// VersionSpecifier
// ---------------------------------------------------------------------------

namespace {

struct OpSpelling {
    const char* text;
    SpecOp op;
};

// Longest spellings first
const OpSpelling k_ops[] = {
    {"===", SpecOp::Arbitrary},
    {"~=", SpecOp::Compatible},
    {"==", SpecOp::Equal},
    {"!=", SpecOp::NotEqual},
    {"<=", SpecOp::LessEq},
    {">=", SpecOp::GreaterEq},
    {"<", SpecOp::Less},
    {">", SpecOp::Greater},
};

const char* op_text(SpecOp op) {
    for (const auto& o : k_ops) {
        if (o.op == op) return o.text;
    }
    return "";
}

// "==1.2.*": epoch and release prefix must match, padding the candidate
bool prefix_match(const Version& prefix, const Version& v) {
    if (prefix.epoch != v.epoch) return false;
    for (size_t i = 0; i < prefix.release.size(); ++i) {
        uint64_t seg = i < v.release.size() ? v.release[i] : 0;
        if (seg != prefix.release[i]) return false;
    }
    if (prefix.pre_tag) {
        if (v.pre_tag != prefix.pre_tag || v.pre_num != prefix.pre_num) return false;
    }
    if (prefix.post && v.post != prefix.post) return false;
    return true;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

} // anonymous namespace

Result<VersionSpecifier> VersionSpecifier::parse(const std::string& raw) {
    std::string s = trim(raw);
    if (s.empty()) {
        return PyresError{PyresError::InvalidVersion, "empty version specifier"};
    }

    VersionSpecifier spec;
    bool found = false;
    for (const auto& o : k_ops) {
        size_t len = std::char_traits<char>::length(o.text);
        if (s.compare(0, len, o.text) == 0) {
            spec.op = o.op;
            spec.text = trim(s.substr(len));
            found = true;
            break;
        }
    }
    if (!found) {
        return PyresError{PyresError::InvalidVersion,
            "invalid version specifier '" + s + "'",
            "specifiers start with one of ~= == != <= >= < > ==="};
    }
    if (spec.text.empty()) {
        return PyresError{PyresError::InvalidVersion,
            "missing version in specifier '" + s + "'"};
    }

    if (spec.op == SpecOp::Arbitrary) {
        return Result<VersionSpecifier>::ok(std::move(spec));
    }

    std::string version_text = spec.text;
    if (version_text.size() > 2 &&
        version_text.compare(version_text.size() - 2, 2, ".*") == 0) {
        if (spec.op != SpecOp::Equal && spec.op != SpecOp::NotEqual) {
            return PyresError{PyresError::InvalidVersion,
                "wildcard not allowed in specifier '" + s + "'",
                "only == and != accept a trailing .*"};
        }
        spec.wildcard = true;
        version_text.resize(version_text.size() - 2);
    }

    auto v = Version::parse(version_text);
    if (v.is_err()) {
        auto e = std::move(v).error();
        e.message += " (in specifier '" + s + "')";
        return e;
    }
    spec.version = std::move(v).value();

    if (spec.wildcard && (spec.version.dev || !spec.version.local.empty())) {
        return PyresError{PyresError::InvalidVersion,
            "invalid wildcard specifier '" + s + "'"};
    }
    if (spec.op == SpecOp::Compatible && spec.version.release.size() < 2) {
        return PyresError{PyresError::InvalidVersion,
            "'~=' needs at least two release segments in '" + s + "'"};
    }
    if (!spec.version.local.empty() &&
        spec.op != SpecOp::Equal && spec.op != SpecOp::NotEqual) {
        return PyresError{PyresError::InvalidVersion,
            "local version label not allowed in specifier '" + s + "'"};
    }

    return Result<VersionSpecifier>::ok(std::move(spec));
}

bool VersionSpecifier::contains(const Version& v) const {
    switch (op) {
    case SpecOp::Arbitrary: {
        std::string a = lowercase_trimmed(text);
        return a == v.to_string();
    }
    case SpecOp::Equal:
    case SpecOp::NotEqual: {
        bool eq;
        if (wildcard) {
            eq = prefix_match(version, v.without_local());
        } else if (version.local.empty()) {
            eq = v.without_local() == version;
        } else {
            eq = v == version;
        }
        return op == SpecOp::Equal ? eq : !eq;
    }
    case SpecOp::Compatible: {
        if (v.without_local() < version) return false;
        Version prefix = version.base();
        prefix.release.pop_back();
        return prefix_match(prefix, v.without_local());
    }
    case SpecOp::LessEq:
        return v.without_local() <= version;
    case SpecOp::GreaterEq:
        return v.without_local() >= version;
    case SpecOp::Less:
        if (!(v < version)) return false;
        // "<3.0" must not admit 3.0rc1
        if (!version.is_prerelease() && v.is_prerelease() &&
            v.base() == version.base()) {
            return false;
        }
        return true;
    case SpecOp::Greater:
        if (!(v > version)) return false;
        // ">3.0" must not admit 3.0.post1 or 3.0+local
        if (!version.is_postrelease() && v.is_postrelease() &&
            v.base() == version.base()) {
            return false;
        }
        if (!v.local.empty() && v.base() == version.base()) return false;
        return true;
    }
    return false;
}

bool VersionSpecifier::names_prerelease() const {
    if (op == SpecOp::NotEqual) return false;
    if (op == SpecOp::Arbitrary) {
        auto v = Version::parse(text);
        return v.is_ok() && v.value().is_prerelease();
    }
    return version.is_prerelease();
}

std::string VersionSpecifier::to_string() const {
    return std::string(op_text(op)) + text;
}

// ---------------------------------------------------------------------------
// SpecifierSet
// ---------------------------------------------------------------------------

Result<SpecifierSet> SpecifierSet::parse(const std::string& s) {
    SpecifierSet set;
    if (trim(s).empty()) {
        return Result<SpecifierSet>::ok(std::move(set));
    }

    std::istringstream stream(s);
    std::string token;
    while (std::getline(stream, token, ',')) {
        if (trim(token).empty()) {
            return PyresError{PyresError::InvalidVersion,
                "empty specifier in '" + s + "'",
                "check for consecutive or trailing commas"};
        }
        auto spec = VersionSpecifier::parse(token);
        if (spec.is_err()) return std::move(spec).error();
        set.specs.push_back(std::move(spec).value());
    }
    return Result<SpecifierSet>::ok(std::move(set));
}

bool SpecifierSet::contains(const Version& v, bool prereleases) const {
    if (v.is_prerelease() && !prereleases && !names_prerelease()) {
        return false;
    }
    return std::all_of(specs.begin(), specs.end(),
        [&](const VersionSpecifier& spec) { return spec.contains(v); });
}

bool SpecifierSet::names_prerelease() const {
    return std::any_of(specs.begin(), specs.end(),
        [](const VersionSpecifier& spec) { return spec.names_prerelease(); });
}

bool SpecifierSet::is_pinned() const {
    return std::any_of(specs.begin(), specs.end(), [](const VersionSpecifier& spec) {
        return (spec.op == SpecOp::Equal && !spec.wildcard) ||
               spec.op == SpecOp::Arbitrary;
    });
}

void SpecifierSet::merge(const SpecifierSet& other) {
    for (const auto& spec : other.specs) {
        std::string text = spec.to_string();
        bool dup = std::any_of(specs.begin(), specs.end(),
            [&](const VersionSpecifier& s) { return s.to_string() == text; });
        if (!dup) specs.push_back(spec);
    }
}

std::string SpecifierSet::to_string() const {
    std::vector<std::string> parts;
    parts.reserve(specs.size());
    for (const auto& spec : specs) parts.push_back(spec.to_string());
    std::sort(parts.begin(), parts.end());
    std::string s;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) s += ",";
        s += parts[i];
    }
    return s;
}

} // namespace pyres
