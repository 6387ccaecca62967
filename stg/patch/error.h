#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace Stg {

/**
 * Kinds of failures reported by parsing and resolution of patch
 * locators, ranges and revision specifications.
 */
enum class ErrorKind {
    /// Candidate string violates the patch naming rules.
    InvalidPatchName,
    /// Locator, range or revision string does not match the grammar.
    MalformedSyntax,
    /// Named anchor is not present in the stack.
    UnknownPatch,
    /// Offsets lead to a position without a patch (e.g. the stack base).
    InvalidOffset,
    /// Position is outside of the stack.
    OutOfRangeIndex,
    /// Patch is not a member of the groups permitted by a constraint.
    ConstraintViolation,
    /// Beginning of a range is located after its end.
    InvertedRange,
    /// Branch does not exist or has no stack.
    UnknownBranch,
    /// Revision does not name any commit.
    UnknownCommit,
    /// Commit id prefix matches several commits.
    AmbiguousCommitPrefix,
};

std::string_view ErrorKindName(const ErrorKind kind) noexcept;

class Error : public std::runtime_error {
public:
    Error(const ErrorKind kind, const std::string& message);

    ErrorKind Kind() const noexcept {
        return kind_;
    }

private:
    ErrorKind kind_;
};

} // namespace Stg
