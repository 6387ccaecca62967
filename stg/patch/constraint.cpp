#include "constraint.h"

#include <fmt/ranges.h>

namespace Stg {
namespace {

std::string FormatConstraintMessage(
    const PatchName& patch, const LocationGroup group, const std::vector<LocationGroup>& allowed
) {
    std::vector<std::string_view> names;
    for (const auto g : allowed) {
        names.push_back(LocationGroupName(g));
    }
    return fmt::format(
        "patch '{}' is {}, expected {}", patch, LocationGroupName(group), fmt::join(names, " or ")
    );
}

} // namespace

std::string_view LocationGroupName(const LocationGroup group) noexcept {
    switch (group) {
        case LocationGroup::Applied:
            return "applied";
        case LocationGroup::Unapplied:
            return "unapplied";
        case LocationGroup::Hidden:
            return "hidden";
    }
    return "unknown";
}

std::vector<LocationGroup> AllowedGroups(const LocationConstraint constraint) {
    switch (constraint) {
        case LocationConstraint::All:
            return {LocationGroup::Applied, LocationGroup::Unapplied, LocationGroup::Hidden};
        case LocationConstraint::Visible:
            return {LocationGroup::Applied, LocationGroup::Unapplied};
        case LocationConstraint::Applied:
            return {LocationGroup::Applied};
        case LocationConstraint::Unapplied:
            return {LocationGroup::Unapplied};
        case LocationConstraint::Hidden:
            return {LocationGroup::Hidden};
    }
    return {};
}

bool IsAllowed(const LocationConstraint constraint, const LocationGroup group) noexcept {
    switch (constraint) {
        case LocationConstraint::All:
            return true;
        case LocationConstraint::Visible:
            return group != LocationGroup::Hidden;
        case LocationConstraint::Applied:
            return group == LocationGroup::Applied;
        case LocationConstraint::Unapplied:
            return group == LocationGroup::Unapplied;
        case LocationConstraint::Hidden:
            return group == LocationGroup::Hidden;
    }
    return false;
}

LocationConstraint ToLocationConstraint(const RangeConstraint constraint) noexcept {
    switch (constraint) {
        case RangeConstraint::All:
        case RangeConstraint::AllWithAppliedBoundary:
            return LocationConstraint::All;
        case RangeConstraint::Visible:
        case RangeConstraint::VisibleWithAppliedBoundary:
            return LocationConstraint::Visible;
        case RangeConstraint::Applied:
            return LocationConstraint::Applied;
        case RangeConstraint::Unapplied:
            return LocationConstraint::Unapplied;
        case RangeConstraint::Hidden:
            return LocationConstraint::Hidden;
    }
    return LocationConstraint::All;
}

bool HasAppliedBoundary(const RangeConstraint constraint) noexcept {
    return constraint == RangeConstraint::AllWithAppliedBoundary
        || constraint == RangeConstraint::VisibleWithAppliedBoundary;
}

ConstraintError::ConstraintError(PatchName patch, const LocationGroup group, std::vector<LocationGroup> allowed)
    : Error(ErrorKind::ConstraintViolation, FormatConstraintMessage(patch, group, allowed))
    , patch_(std::move(patch))
    , group_(group)
    , allowed_(std::move(allowed)) {
}

void CheckConstraint(const PatchName& patch, const LocationGroup group, const LocationConstraint constraint) {
    if (!IsAllowed(constraint, group)) {
        throw ConstraintError(patch, group, AllowedGroups(constraint));
    }
}

} // namespace Stg
