#pragma once

#include <pyres/distribution.hpp>
#include <pyres/name.hpp>
#include <pyres/version.hpp>
#include <memory>
#include <string>
#include <vector>

namespace pyres {

enum class SourceKind { Wheel, Sdist, DirectUrl };

const char* source_kind_name(SourceKind kind);

// One concrete installable choice for a project. Dependencies are not
// stored here; they are memoized per candidate key in the run context.
struct Candidate {
    ProjectName name;
    Version version;
    SourceKind kind = SourceKind::Wheel;
    DistFile file;
    size_t tag_priority = 0;   // lower is better, wheels only

    // Identity used for caching: "name==version kind filename"
    std::string key() const;

    // "pkg:pypi/<name>@<version>"
    std::string purl() const;

    // "name==version"
    std::string to_string() const;

    bool is_yanked() const { return file.yanked; }

    bool operator==(const Candidate& o) const {
        return name == o.name && version == o.version && kind == o.kind;
    }
    bool operator!=(const Candidate& o) const { return !(*this == o); }
};

using CandidatePtr = std::shared_ptr<const Candidate>;
using CandidateList = std::vector<CandidatePtr>;

// Restartable cursor over a shared, already ordered candidate list.
// Copies share the list but keep their own position.
class CandidateSequence {
public:
    CandidateSequence() : items_(std::make_shared<const CandidateList>()) {}
    explicit CandidateSequence(std::shared_ptr<const CandidateList> items)
        : items_(std::move(items)) {}

    // Next candidate, or nullptr when exhausted
    CandidatePtr next() {
        return pos_ < items_->size() ? (*items_)[pos_++] : nullptr;
    }
    void restart() { pos_ = 0; }

    bool empty() const { return items_->empty(); }
    size_t size() const { return items_->size(); }
    const CandidateList& items() const { return *items_; }

private:
    std::shared_ptr<const CandidateList> items_;
    size_t pos_ = 0;
};

} // namespace pyres
