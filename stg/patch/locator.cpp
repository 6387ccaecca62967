#include "locator.h"

#include <stg/stack/stack.h>

#include <charconv>
#include <limits>

namespace Stg {
namespace {

/// Upper bound for a single step of an offset chain.
constexpr size_t MAX_OFFSET = std::numeric_limits<int32_t>::max();

bool IsDigits(const std::string_view text) noexcept {
    if (text.empty()) {
        return false;
    }
    for (const char ch : text) {
        if (ch < '0' || ch > '9') {
            return false;
        }
    }
    return true;
}

/**
 * Applies offsets step by step. Intermediate positions may reach the base but
 * never go below it unless @p allow_below_stack is set.
 */
StackPosition ApplyOffsets(
    StackPosition pos,
    const PatchOffsets& offsets,
    const StackSnapshot& stack,
    const bool allow_below_stack,
    const std::string_view spelling
) {
    const auto last = StackPosition(stack.Size()) - 1;

    for (const auto& atom : offsets.Atoms()) {
        if (atom.Magnitude() > MAX_OFFSET) {
            throw Error(ErrorKind::OutOfRangeIndex, fmt::format("offset in '{}' is out of range", spelling));
        }

        if (atom.kind == PatchOffsetAtom::Kind::Plus) {
            pos += StackPosition(atom.Magnitude());
            if (pos > last) {
                throw Error(
                    ErrorKind::OutOfRangeIndex, fmt::format("'{}' is beyond the end of the stack", spelling)
                );
            }
        } else {
            pos -= StackPosition(atom.Magnitude());
            if (pos < BASE_POSITION && !allow_below_stack) {
                throw Error(
                    ErrorKind::OutOfRangeIndex, fmt::format("'{}' is below the stack base", spelling)
                );
            }
        }
    }

    return pos;
}

/**
 * Applies offsets to the base as a single net offset.
 */
StackPosition ApplyBaseOffsets(
    const PatchOffsets& offsets,
    const StackSnapshot& stack,
    const bool allow_below_stack,
    const std::string_view spelling
) {
    StackPosition net = 0;

    for (const auto& atom : offsets.Atoms()) {
        if (atom.Magnitude() > MAX_OFFSET) {
            throw Error(ErrorKind::OutOfRangeIndex, fmt::format("offset in '{}' is out of range", spelling));
        }
        if (atom.kind == PatchOffsetAtom::Kind::Plus) {
            net += StackPosition(atom.Magnitude());
        } else {
            net -= StackPosition(atom.Magnitude());
        }
    }

    if (net <= 0 && !allow_below_stack) {
        throw Error(
            ErrorKind::InvalidOffset,
            fmt::format("'{}' requires a positive net offset from the stack base", spelling)
        );
    }
    if (BASE_POSITION + net > StackPosition(stack.Size()) - 1) {
        throw Error(ErrorKind::OutOfRangeIndex, fmt::format("'{}' is beyond the end of the stack", spelling));
    }
    return BASE_POSITION + net;
}

/**
 * Interprets text which may be a name, an absolute index or a commit id prefix.
 */
std::optional<StackPosition> LookupNameLike(
    const std::string_view text, const StackSnapshot& stack, bool& index_out_of_range
) {
    if (const auto index = stack.IndexOf(text)) {
        return StackPosition(*index);
    }
    if (IsDigits(text)) {
        size_t index = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
        if (ec == std::errc() && index < stack.Size()) {
            return StackPosition(index);
        }
        index_out_of_range = true;
    }
    if (HashId::IsHexPrefix(text)) {
        std::optional<size_t> found;

        for (size_t i = 0; i < stack.Size(); ++i) {
            if (!stack.PatchCommit(stack.At(i)).HasPrefix(text)) {
                continue;
            }
            if (found) {
                throw Error(
                    ErrorKind::AmbiguousCommitPrefix,
                    fmt::format(
                        "commit id prefix '{}' matches patches '{}' and '{}'", text, stack.At(*found), stack.At(i)
                    )
                );
            }
            found = i;
        }
        if (found) {
            return StackPosition(*found);
        }
    }
    return std::nullopt;
}

StackPosition ResolveName(const PatchName& name, const StackSnapshot& stack) {
    if (const auto index = stack.IndexOf(name)) {
        return StackPosition(*index);
    }

    const std::string_view text = name;
    bool index_out_of_range = false;

    if (const auto pos = LookupNameLike(text, stack, index_out_of_range)) {
        return *pos;
    }
    // A trailing offset chain may have been consumed as a part of the name, e.g. `p+1`.
    // The longest matching head wins.
    for (size_t i = text.rfind('+'); i != std::string_view::npos && i > 0; i = text.rfind('+', i - 1)) {
        const auto tail = text.substr(i);

        if (PatchOffsets::Recognize(tail) != tail.size()) {
            continue;
        }
        if (const auto pos = LookupNameLike(text.substr(0, i), stack, index_out_of_range)) {
            return ApplyOffsets(*pos, PatchOffsets::Parse(tail), stack, false, text);
        }
    }

    if (index_out_of_range) {
        throw Error(ErrorKind::OutOfRangeIndex, fmt::format("patch index '{}' is out of range", text));
    }
    throw Error(ErrorKind::UnknownPatch, fmt::format("patch '{}' does not exist", text));
}

StackPosition ResolveAnchor(const PatchId& id, const StackSnapshot& stack) {
    const auto size = StackPosition(stack.Size());
    const auto top = StackPosition(stack.Applied().size()) - 1;

    if (std::holds_alternative<PatchId::Top>(id.Get())) {
        return top;
    }
    if (std::holds_alternative<PatchId::Base>(id.Get())) {
        return BASE_POSITION;
    }
    if (const auto* below = std::get_if<PatchId::BelowLast>(&id.Get())) {
        const auto visible = StackPosition(stack.VisibleSize());
        const auto k = below->offset.value_or(0);
        // The result should be in [0, size).
        if (k > visible - 1 || k < visible - size) {
            throw Error(ErrorKind::OutOfRangeIndex, fmt::format("'{}' is outside of the stack", id.ToString()));
        }
        return visible - 1 - k;
    }
    if (const auto* below = std::get_if<PatchId::BelowTop>(&id.Get())) {
        if (!below->index) {
            return top;
        }
        if (*below->index >= stack.Size()) {
            throw Error(ErrorKind::OutOfRangeIndex, fmt::format("patch index {} is out of range", *below->index));
        }
        return StackPosition(*below->index);
    }
    return ResolveName(std::get<PatchName>(id.Get()), stack);
}

} // namespace

std::string PatchId::ToString() const {
    if (std::holds_alternative<Top>(value_)) {
        return "@";
    }
    if (std::holds_alternative<Base>(value_)) {
        return "{base}";
    }
    if (const auto* below = std::get_if<BelowLast>(&value_)) {
        return below->offset ? fmt::format("^{}", *below->offset) : std::string("^");
    }
    if (const auto* below = std::get_if<BelowTop>(&value_)) {
        return below->index ? std::to_string(*below->index) : std::string();
    }
    return std::get<PatchName>(value_).Str();
}

std::string PatchLocator::ToString() const {
    return id_.ToString() + offsets_.Str();
}

StackPosition ResolvePosition(const PatchLocator& locator, const StackSnapshot& stack, const bool allow_below_stack) {
    const auto spelling = locator.ToString();

    if (std::holds_alternative<PatchId::Base>(locator.Id().Get())) {
        return ApplyBaseOffsets(locator.Offsets(), stack, allow_below_stack, spelling);
    }

    const auto pos =
        ApplyOffsets(ResolveAnchor(locator.Id(), stack), locator.Offsets(), stack, allow_below_stack, spelling);

    if (pos == BASE_POSITION && !allow_below_stack) {
        throw Error(ErrorKind::InvalidOffset, fmt::format("'{}' refers to the stack base, not a patch", spelling));
    }
    return pos;
}

PatchName ResolveLocator(const PatchLocator& locator, const StackSnapshot& stack, const LocationConstraint constraint) {
    const auto pos = ResolvePosition(locator, stack, false);
    const auto& name = stack.At(size_t(pos));

    CheckConstraint(name, stack.GroupAt(size_t(pos)), constraint);

    return name;
}

} // namespace Stg
