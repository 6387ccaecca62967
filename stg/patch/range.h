#pragma once

#include "constraint.h"
#include "locator.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Stg {

class StackSnapshot;

/**
 * Patch locations bounding a range of patches.
 */
struct PatchRangeBounds {
    /// Beginning patch of the range. The bottommost patch if not set.
    std::optional<PatchLocator> begin;
    /// Ending patch of the range. The range includes this patch.
    std::optional<PatchLocator> end;

    /** Textual spelling of the bounds. */
    std::string ToString() const;

    bool operator==(const PatchRangeBounds& other) const = default;
};

/**
 * A range of patches in the stack.
 *
 * A patch range is specified on the command line as `[<locator>]..[<locator>]`, e.g.
 * `p0..p3`. The begin and end locators, typically a patch names, are both optional.
 * The begin and end patch locators are inclusive to the range.
 *
 * Ranges with open beginnings start with the first patch allowed by the constraint,
 * i.e. the bottommost applied patch when applied patches are allowed.
 *
 * The last patch in an open-ended range depends on command-specific policy which is
 * determined by the RangeConstraint used with ResolveRange().
 */
class PatchRange {
public:
    using Value = std::variant<PatchLocator, PatchRangeBounds>;

public:
    PatchRange(Value value)
        : value_(std::move(value)) {
    }

    const Value& Get() const noexcept {
        return value_;
    }

    /** Single patch if the range is not bounded. */
    const PatchLocator* Single() const noexcept {
        return std::get_if<PatchLocator>(&value_);
    }

    /** Bounds of the range. */
    const PatchRangeBounds* Bounds() const noexcept {
        return std::get_if<PatchRangeBounds>(&value_);
    }

    std::string ToString() const;

    bool operator==(const PatchRange& other) const = default;

private:
    Value value_;
};

/**
 * Resolves range bounds into inclusive positions [first, last] in the stack order.
 *
 * @return std::nullopt if the range is fully open and the constraint allows no patches.
 */
std::optional<std::pair<size_t, size_t>> ResolveBounds(
    const PatchRangeBounds& bounds, const StackSnapshot& stack, const RangeConstraint constraint
);

/**
 * Resolves the range into the ordered list of patch names.
 */
std::vector<PatchName> ResolveRange(const PatchRange& range, const StackSnapshot& stack, const RangeConstraint constraint);

/**
 * Resolves multiple ranges and concatenates the results in the order of ranges.
 */
std::vector<PatchName> ResolveRanges(
    const std::vector<PatchRange>& ranges, const StackSnapshot& stack, const RangeConstraint constraint
);

} // namespace Stg
