#pragma once

#include "locator.h"
#include "range.h"

#include <stg/object/commit.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace Stg {

class BranchResolver;
class CommitLookup;
class StackSnapshot;

/**
 * A git revision suffix string.
 *
 * The suffix is recognized but never interpreted here; it is handed over
 * to the revision engine verbatim.
 */
struct GitRevisionSuffix {
    std::string text;

    bool Empty() const noexcept {
        return text.empty();
    }

    bool operator==(const GitRevisionSuffix& other) const = default;
};

/**
 * A regular PatchLocator with an optional git revision suffix.
 *
 * For example, `{base}~^2` is the locator `{base}~` followed by the suffix `^2`.
 */
struct PatchLikeSpec {
    PatchLocator patch_loc;
    GitRevisionSuffix suffix;

    std::string ToString() const {
        return patch_loc.ToString() + suffix.text;
    }

    bool operator==(const PatchLikeSpec& other) const = default;
};

/**
 * Specification of a single StGit revision.
 *
 * A StGit revision specification resolves to a single commit that could be either
 * inside or outside a stack. This differs from a PatchLocator which must resolve
 * to a patch inside a stack.
 *
 * Any StGit offsets in a revision specification, i.e. `~[<n>]` or `+[<n>]`, *may* resolve to
 * commits below the stack. Furthermore, git revision suffixes may be supplied after
 * any patch locator offsets.
 */
class SingleRevisionSpec {
public:
    /// `<branch>:<patch-like>`.
    struct Branch {
        std::string branch;
        PatchLikeSpec patch_like;

        bool operator==(const Branch&) const = default;
    };

    /// Text which is both a valid patch-like spec and possibly a git revision.
    struct PatchAndGitLike {
        PatchLikeSpec patch_like;
        std::string revision;

        bool operator==(const PatchAndGitLike&) const = default;
    };

    /// Git revision passed through verbatim.
    struct GitLike {
        std::string revision;

        bool operator==(const GitLike&) const = default;
    };

    /// Patch locator which can not be a git revision.
    struct PatchLike {
        PatchLikeSpec patch_like;

        bool operator==(const PatchLike&) const = default;
    };

    using Value = std::variant<Branch, PatchAndGitLike, GitLike, PatchLike>;

public:
    SingleRevisionSpec(Value value)
        : value_(std::move(value)) {
    }

    const Value& Get() const noexcept {
        return value_;
    }

    std::string ToString() const;

    bool operator==(const SingleRevisionSpec& other) const = default;

private:
    Value value_;
};

/**
 * Specification for multiple StGit revisions.
 *
 * Patch ranges are allowed, but git revision ranges *are not* allowed. Any
 * specification using the ".." range syntax is a StGit patch range.
 *
 * Similarly, when an optional "branch-name:" prefix is supplied, the remainder of the
 * specification after the ":" must be either a patch range or a single patch locator.
 */
class RangeRevisionSpec {
public:
    struct BranchRange {
        std::string branch;
        PatchRangeBounds bounds;

        bool operator==(const BranchRange&) const = default;
    };

    using Value = std::variant<BranchRange, PatchRangeBounds, SingleRevisionSpec>;

public:
    RangeRevisionSpec(Value value)
        : value_(std::move(value)) {
    }

    const Value& Get() const noexcept {
        return value_;
    }

    std::string ToString() const;

    bool operator==(const RangeRevisionSpec& other) const = default;

private:
    Value value_;
};

/**
 * A resolved StGit revision consisting of an optional patch name and a commit.
 */
struct StGitRevision {
    std::optional<PatchName> patchname;
    std::shared_ptr<const Commit> commit;
};

/**
 * Resolved StGit boundary revisions.
 */
using StGitBoundaryRevisions = std::variant<StGitRevision, std::pair<StGitRevision, StGitRevision>>;

/**
 * Resolves a single revision specification.
 *
 * @param stack stack of the current branch.
 * @param branches provides stacks for branch-qualified specifications.
 * @param commits commit lookup and git revision engine.
 */
StGitRevision ResolveRevision(
    const SingleRevisionSpec& spec,
    const StackSnapshot& stack,
    const BranchResolver& branches,
    const CommitLookup& commits
);

/**
 * Resolves a revision specification which may be a patch range.
 *
 * Patch ranges resolve into the first and the last patches of the range
 * selected under the constraint.
 */
StGitBoundaryRevisions ResolveRevisions(
    const RangeRevisionSpec& spec,
    const StackSnapshot& stack,
    const BranchResolver& branches,
    const CommitLookup& commits,
    const RangeConstraint constraint = RangeConstraint::AllWithAppliedBoundary
);

} // namespace Stg
