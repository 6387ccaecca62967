#include "revspec.h"

#include <stg/stack/stack.h>

namespace Stg {
namespace {

StGitRevision ResolvePatchLike(const PatchLikeSpec& spec, const StackSnapshot& stack, const CommitLookup& commits) {
    const auto pos = ResolvePosition(spec.patch_loc, stack, true);

    StGitRevision result;

    if (pos >= 0) {
        const auto& name = stack.At(size_t(pos));

        result.patchname = name;
        result.commit = commits.LookupCommit(stack.PatchCommit(name));
    } else {
        result.commit = commits.LookupCommit(stack.Base());
        // Offsets below the stack walk the first-parent history of the base.
        if (pos < BASE_POSITION) {
            result.commit = commits.ApplySuffix(*result.commit, fmt::format("~{}", BASE_POSITION - pos));
        }
    }

    if (!spec.suffix.Empty()) {
        result.commit = commits.ApplySuffix(*result.commit, spec.suffix.text);
        result.patchname.reset();
    }

    return result;
}

StGitRevision ResolveGitLike(const std::string_view revision, const CommitLookup& commits) {
    return StGitRevision{
        .patchname = std::nullopt,
        .commit = commits.LookupRevision(revision),
    };
}

StGitRevision ResolvePatchOrGitLike(
    const SingleRevisionSpec::PatchAndGitLike& spec, const StackSnapshot& stack, const CommitLookup& commits
) {
    // Known patch names are never reinterpreted.
    if (const auto* name = spec.patch_like.patch_loc.Id().Name(); name && stack.Contains(*name)) {
        return ResolvePatchLike(spec.patch_like, stack, commits);
    }

    try {
        return ResolvePatchLike(spec.patch_like, stack, commits);
    } catch (const Error& e) {
        if (e.Kind() != ErrorKind::UnknownPatch && e.Kind() != ErrorKind::OutOfRangeIndex) {
            throw;
        }
    }

    return ResolveGitLike(spec.revision, commits);
}

StGitBoundaryRevisions ResolveBoundaryRange(
    const PatchRangeBounds& bounds,
    const StackSnapshot& stack,
    const CommitLookup& commits,
    const RangeConstraint constraint
) {
    const auto span = ResolveBounds(bounds, stack, constraint);
    if (!span) {
        throw Error(ErrorKind::OutOfRangeIndex, fmt::format("patch range '{}' is empty", bounds.ToString()));
    }

    const auto make_revision = [&](const size_t pos) {
        const auto& name = stack.At(pos);

        return StGitRevision{
            .patchname = name,
            .commit = commits.LookupCommit(stack.PatchCommit(name)),
        };
    };

    auto first = make_revision(span->first);

    if (span->first == span->second) {
        // Both ends share the commit object.
        auto last = first;
        return std::make_pair(std::move(first), std::move(last));
    }
    return std::make_pair(std::move(first), make_revision(span->second));
}

} // namespace

std::string SingleRevisionSpec::ToString() const {
    if (const auto* spec = std::get_if<Branch>(&value_)) {
        return fmt::format("{}:{}", spec->branch, spec->patch_like.ToString());
    }
    if (const auto* spec = std::get_if<PatchAndGitLike>(&value_)) {
        return spec->revision;
    }
    if (const auto* spec = std::get_if<GitLike>(&value_)) {
        return spec->revision;
    }
    return std::get<PatchLike>(value_).patch_like.ToString();
}

std::string RangeRevisionSpec::ToString() const {
    if (const auto* spec = std::get_if<BranchRange>(&value_)) {
        return fmt::format("{}:{}", spec->branch, spec->bounds.ToString());
    }
    if (const auto* bounds = std::get_if<PatchRangeBounds>(&value_)) {
        return bounds->ToString();
    }
    return std::get<SingleRevisionSpec>(value_).ToString();
}

StGitRevision ResolveRevision(
    const SingleRevisionSpec& spec,
    const StackSnapshot& stack,
    const BranchResolver& branches,
    const CommitLookup& commits
) {
    if (const auto* branch = std::get_if<SingleRevisionSpec::Branch>(&spec.Get())) {
        return ResolvePatchLike(branch->patch_like, branches.GetStack(branch->branch), commits);
    }
    if (const auto* both = std::get_if<SingleRevisionSpec::PatchAndGitLike>(&spec.Get())) {
        return ResolvePatchOrGitLike(*both, stack, commits);
    }
    if (const auto* git = std::get_if<SingleRevisionSpec::GitLike>(&spec.Get())) {
        return ResolveGitLike(git->revision, commits);
    }
    return ResolvePatchLike(std::get<SingleRevisionSpec::PatchLike>(spec.Get()).patch_like, stack, commits);
}

StGitBoundaryRevisions ResolveRevisions(
    const RangeRevisionSpec& spec,
    const StackSnapshot& stack,
    const BranchResolver& branches,
    const CommitLookup& commits,
    const RangeConstraint constraint
) {
    if (const auto* range = std::get_if<RangeRevisionSpec::BranchRange>(&spec.Get())) {
        return ResolveBoundaryRange(range->bounds, branches.GetStack(range->branch), commits, constraint);
    }
    if (const auto* bounds = std::get_if<PatchRangeBounds>(&spec.Get())) {
        return ResolveBoundaryRange(*bounds, stack, commits, constraint);
    }
    return ResolveRevision(std::get<SingleRevisionSpec>(spec.Get()), stack, branches, commits);
}

} // namespace Stg
