#pragma once

#include "error.h"
#include "name.h"

#include <string_view>
#include <vector>

namespace Stg {

/**
 * The groups of patches within the stack.
 *
 * The stack consists of all the applied patches, then unapplied, followed by any
 * hidden patches.
 */
enum class LocationGroup {
    Applied,
    Unapplied,
    Hidden,
};

/**
 * A patch specified by the user on the command line may be constrained to a subset of
 * the stack locations.
 */
enum class LocationConstraint {
    /// All patches within the stack are allowed.
    All,
    /// Only visible (non-hidden) patches are allowed.
    Visible,
    /// Only currently applied patches are allowed.
    Applied,
    /// Only currently unapplied patches are allowed.
    Unapplied,
    /// Only currently hidden patches are allowed.
    Hidden,
};

/**
 * Indicates which patches are allowed in user-supplied patch ranges.
 *
 * The AllWithAppliedBoundary and VisibleWithAppliedBoundary variants allow all and
 * visible (applied + unapplied), respectively, but constrain open-ended patch ranges
 * to the last applied patch when the beginning of the open range is an applied patch.
 */
enum class RangeConstraint {
    /// All patches within the stack are allowed in the range.
    All,
    /// All patches within the stack are allowed in the range, but open-ended ranges
    /// stop at the last applied patch.
    AllWithAppliedBoundary,
    /// All visible (non-hidden) patches are allowed in the range.
    Visible,
    /// All visible (non-hidden) patches are allowed in the range, but open-ended ranges
    /// stop at the last applied patch.
    VisibleWithAppliedBoundary,
    /// Only applied patches are allowed in the range.
    Applied,
    /// Only unapplied patches are allowed in the range.
    Unapplied,
    /// Only hidden patches are allowed in the range.
    Hidden,
};

std::string_view LocationGroupName(const LocationGroup group) noexcept;

/** Groups permitted by the constraint in the stack order. */
std::vector<LocationGroup> AllowedGroups(const LocationConstraint constraint);

bool IsAllowed(const LocationConstraint constraint, const LocationGroup group) noexcept;

/** Location constraint applied to every member of a range. */
LocationConstraint ToLocationConstraint(const RangeConstraint constraint) noexcept;

/** Whether open-ended ranges stop at the last applied patch. */
bool HasAppliedBoundary(const RangeConstraint constraint) noexcept;

/**
 * A resolved patch is not a member of the groups permitted by a constraint.
 */
class ConstraintError : public Error {
public:
    ConstraintError(PatchName patch, const LocationGroup group, std::vector<LocationGroup> allowed);

    /** Offending patch. */
    const PatchName& Patch() const noexcept {
        return patch_;
    }

    /** Actual group of the patch. */
    LocationGroup Group() const noexcept {
        return group_;
    }

    /** Permitted groups. */
    const std::vector<LocationGroup>& Allowed() const noexcept {
        return allowed_;
    }

private:
    PatchName patch_;
    LocationGroup group_;
    std::vector<LocationGroup> allowed_;
};

/** Throws ConstraintError if the group is not allowed. */
void CheckConstraint(const PatchName& patch, const LocationGroup group, const LocationConstraint constraint);

} // namespace Stg
