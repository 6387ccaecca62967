#pragma once

#include <stg/object/commit.h>
#include <stg/patch/constraint.h>
#include <stg/patch/name.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace Stg {

/**
 * Read-only view of a patch stack taken at one consistent point in time.
 *
 * Patches are ordered as applied, then unapplied, then hidden. Index zero
 * is the bottommost patch; the base commit sits immediately below it.
 */
class StackSnapshot {
public:
    struct Patches {
        std::vector<PatchName> applied;
        std::vector<PatchName> unapplied;
        std::vector<PatchName> hidden;
        /// Commit of each patch.
        std::unordered_map<PatchName, HashId> commits;
    };

public:
    /**
     * @param base commit immediately below the bottommost applied patch.
     * @param top commit of the topmost applied patch or the base.
     *
     * Throws std::invalid_argument if a patch appears twice or has no commit.
     */
    StackSnapshot(Patches patches, const HashId& base, const HashId& top);

public:
    const std::vector<PatchName>& Applied() const noexcept {
        return patches_.applied;
    }

    const std::vector<PatchName>& Unapplied() const noexcept {
        return patches_.unapplied;
    }

    const std::vector<PatchName>& Hidden() const noexcept {
        return patches_.hidden;
    }

    const HashId& Base() const noexcept {
        return base_;
    }

    const HashId& Top() const noexcept {
        return top_;
    }

    /** Total number of patches. */
    size_t Size() const noexcept {
        return order_.size();
    }

    /** Number of applied and unapplied patches. */
    size_t VisibleSize() const noexcept {
        return patches_.applied.size() + patches_.unapplied.size();
    }

    /** Patch at the index in stack order. */
    const PatchName& At(const size_t index) const;

    /** Group of the patch at the index. */
    LocationGroup GroupAt(const size_t index) const;

    /** Index of the named patch in stack order. */
    std::optional<size_t> IndexOf(const std::string_view name) const;

    bool Contains(const std::string_view name) const {
        return IndexOf(name).has_value();
    }

    /** Commit of the named patch. */
    const HashId& PatchCommit(const PatchName& name) const;

    /** All patches in stack order. */
    const std::vector<PatchName>& All() const noexcept {
        return order_;
    }

private:
    Patches patches_;
    HashId base_;
    HashId top_;
    std::vector<PatchName> order_;
    std::unordered_map<std::string, size_t> index_;
};

/**
 * Provides stack snapshots of branches.
 */
class BranchResolver {
public:
    virtual ~BranchResolver() = default;

    /**
     * Returns snapshot of the stack of the given branch.
     *
     * @param branch name of a branch or the current branch if not set.
     * Throws UnknownBranch if there is no such branch or the branch has no stack.
     */
    virtual StackSnapshot GetStack(const std::optional<std::string>& branch) const = 0;
};

/**
 * Lookups commits and interprets git revision syntax.
 */
class CommitLookup {
public:
    virtual ~CommitLookup() = default;

    /** Loads commit by id. Throws UnknownCommit. */
    virtual std::shared_ptr<const Commit> LookupCommit(const HashId& id) const = 0;

    /**
     * Resolves git revision (a reference name, an id or an id prefix with
     * optional suffixes). Throws UnknownCommit or AmbiguousCommitPrefix.
     */
    virtual std::shared_ptr<const Commit> LookupRevision(const std::string_view revision) const = 0;

    /** Applies git revision suffix (e.g. `^2` or `~3`) to the commit. Throws UnknownCommit. */
    virtual std::shared_ptr<const Commit> ApplySuffix(const Commit& commit, const std::string_view suffix) const = 0;
};

} // namespace Stg
