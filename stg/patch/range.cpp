#include "range.h"

#include <stg/stack/stack.h>

namespace Stg {
namespace {

/**
 * Positions [first, last) of the patches allowed by the constraint.
 */
std::pair<size_t, size_t> AllowedSpan(const StackSnapshot& stack, const LocationConstraint constraint) {
    const size_t applied = stack.Applied().size();
    const size_t visible = stack.VisibleSize();

    switch (constraint) {
        case LocationConstraint::All:
            return {0, stack.Size()};
        case LocationConstraint::Visible:
            return {0, visible};
        case LocationConstraint::Applied:
            return {0, applied};
        case LocationConstraint::Unapplied:
            return {applied, visible};
        case LocationConstraint::Hidden:
            return {visible, stack.Size()};
    }
    return {0, 0};
}

size_t ResolveBound(const PatchLocator& locator, const StackSnapshot& stack, const LocationConstraint constraint) {
    const auto pos = size_t(ResolvePosition(locator, stack, false));

    CheckConstraint(stack.At(pos), stack.GroupAt(pos), constraint);

    return pos;
}

} // namespace

std::string PatchRangeBounds::ToString() const {
    return fmt::format(
        "{}..{}", begin ? begin->ToString() : std::string(), end ? end->ToString() : std::string()
    );
}

std::string PatchRange::ToString() const {
    if (const auto* single = Single()) {
        return single->ToString();
    }
    return Bounds()->ToString();
}

std::optional<std::pair<size_t, size_t>> ResolveBounds(
    const PatchRangeBounds& bounds, const StackSnapshot& stack, const RangeConstraint constraint
) {
    const auto location = ToLocationConstraint(constraint);
    const auto [lo, hi] = AllowedSpan(stack, location);

    std::optional<size_t> first;
    std::optional<size_t> last;

    if (bounds.begin) {
        first = ResolveBound(*bounds.begin, stack, location);
    } else if (lo < hi) {
        first = lo;
    }

    if (bounds.end) {
        last = ResolveBound(*bounds.end, stack, location);
    } else if (first) {
        // Open-ended ranges stop at the last applied patch if started from an applied one.
        if (HasAppliedBoundary(constraint) && *first < stack.Applied().size()) {
            last = stack.Applied().size() - 1;
        } else if (lo < hi) {
            last = hi - 1;
        }
    }

    // Fully open range without allowed patches.
    if (!first || !last) {
        return std::nullopt;
    }
    if (*first > *last) {
        throw Error(
            ErrorKind::InvertedRange,
            fmt::format(
                "patch range '{}' is inverted: '{}' is above '{}'", bounds.ToString(), stack.At(*first), stack.At(*last)
            )
        );
    }
    return std::make_pair(*first, *last);
}

std::vector<PatchName> ResolveRange(const PatchRange& range, const StackSnapshot& stack, const RangeConstraint constraint) {
    if (const auto* single = range.Single()) {
        return {ResolveLocator(*single, stack, ToLocationConstraint(constraint))};
    }

    std::vector<PatchName> result;

    if (const auto span = ResolveBounds(*range.Bounds(), stack, constraint)) {
        for (size_t i = span->first; i <= span->second; ++i) {
            result.push_back(stack.At(i));
        }
    }

    return result;
}

std::vector<PatchName> ResolveRanges(
    const std::vector<PatchRange>& ranges, const StackSnapshot& stack, const RangeConstraint constraint
) {
    std::vector<PatchName> result;

    for (const auto& range : ranges) {
        auto names = ResolveRange(range, stack, constraint);
        result.insert(result.end(), std::make_move_iterator(names.begin()), std::make_move_iterator(names.end()));
    }

    return result;
}

} // namespace Stg
