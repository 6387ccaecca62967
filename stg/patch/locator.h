#pragma once

#include "constraint.h"
#include "name.h"
#include "offset.h"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace Stg {

class StackSnapshot;

/**
 * Identifier for a patch or position within the stack.
 *
 * The canonical patch identifier is its name. Other identifiers may be specified
 * in command line arguments using special syntax.
 *
 * The stack base is spelled `{base}`. Note that a (positive) offset must be supplied
 * in a PatchLocator using Base since the stack's base is outside the stack and not
 * a patch itself.
 *
 * The topmost patch can be explicitly spelled with `@`. The topmost patch is also
 * implicit in locations only containing a relative offset, e.g. `~1` or `+3`.
 *
 * The last visible patch is spelled `^` and may be followed by a signed integer
 * indicating an offset in the direction of previous patches; i.e. `^3` would be three
 * patches *before* the last patch and `^-3` would be three patches *after* the last
 * patch, into the hidden patches.
 *
 * Absolute indexes into the stack and commit id prefixes are also valid identifiers.
 * However, these identifiers are ambiguous with patch names since they cannot be
 * disambiguated syntactically. They are parsed as names and disambiguated in the
 * context of the actual stack: when such identifier matches a patch name in the
 * stack, it is always interpreted as the patch name.
 */
class PatchId {
public:
    /// `{base}`.
    struct Base {
        bool operator==(const Base&) const = default;
    };

    /// `@`.
    struct Top {
        bool operator==(const Top&) const = default;
    };

    /// `^` or `^<n>`. Negative values point into the hidden patches.
    struct BelowLast {
        std::optional<int64_t> offset;

        bool operator==(const BelowLast&) const = default;
    };

    /// Absolute index or, if not set, the implicit top of an offset-only locator.
    struct BelowTop {
        std::optional<size_t> index;

        bool operator==(const BelowTop&) const = default;
    };

    using Value = std::variant<Top, Base, BelowLast, BelowTop, PatchName>;

public:
    PatchId(Value value)
        : value_(std::move(value)) {
    }

    const Value& Get() const noexcept {
        return value_;
    }

    /** Name of the patch if the identifier is a name. */
    const PatchName* Name() const noexcept {
        return std::get_if<PatchName>(&value_);
    }

    /** Textual spelling of the identifier. */
    std::string ToString() const;

    bool operator==(const PatchId& other) const = default;

private:
    Value value_;
};

/**
 * Location of a patch within the stack.
 *
 * A location consists of a patch identifier along with an optional offset.
 */
class PatchLocator {
public:
    PatchLocator(PatchId id, PatchOffsets offsets = PatchOffsets())
        : id_(std::move(id))
        , offsets_(std::move(offsets)) {
    }

    const PatchId& Id() const noexcept {
        return id_;
    }

    const PatchOffsets& Offsets() const noexcept {
        return offsets_;
    }

    /** Textual spelling of the locator. */
    std::string ToString() const;

    bool operator==(const PatchLocator& other) const = default;

private:
    PatchId id_;
    PatchOffsets offsets_;
};

/// Position in the stack order. Zero is the bottommost patch, -1 is the stack base
/// and lesser values are ancestors of the base.
using StackPosition = int64_t;

/// Position of the stack base.
constexpr StackPosition BASE_POSITION = -1;

/**
 * Resolves the locator to a position in the stack.
 *
 * @param allow_below_stack if true, the result may be the base or any position below
 *        it; otherwise the result is always a patch.
 */
StackPosition ResolvePosition(const PatchLocator& locator, const StackSnapshot& stack, const bool allow_below_stack);

/**
 * Resolves the locator to a name of a patch satisfying the constraint.
 */
PatchName ResolveLocator(const PatchLocator& locator, const StackSnapshot& stack, const LocationConstraint constraint);

} // namespace Stg
