#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Stg {

/**
 * An individual offset atom such as `+`, `~`, `~3`, or `+1`.
 */
struct PatchOffsetAtom {
    enum class Kind {
        /// Offset to the n'th next patch in the stack.
        Plus,
        /// Offset to the n'th previous patch in the stack.
        Tilde,
    };

    Kind kind = Kind::Plus;
    /// Number of steps. One step if omitted.
    std::optional<size_t> count;

    /** Number of steps of the atom. */
    size_t Magnitude() const noexcept {
        return count.value_or(1);
    }

    bool operator==(const PatchOffsetAtom& other) const = default;
};

/**
 * Offsets from one patch location to another in the stack.
 *
 * On the command line, these offsets take the form of concatenations of `+[<n>]` or
 * `~[<n>]` where the optional `<n>` is an unsigned integer. The offsets keep
 * their exact spelling.
 */
class PatchOffsets {
public:
    PatchOffsets() = default;

    /** Parses offset chain. Throws MalformedSyntax if the text is not a chain of atoms. */
    static PatchOffsets Parse(const std::string_view text);

    /** Length of the longest prefix of the text which is an offset chain. */
    static size_t Recognize(const std::string_view text) noexcept;

public:
    /** Parsed atoms in order of application. */
    std::vector<PatchOffsetAtom> Atoms() const;

    bool Empty() const noexcept {
        return text_.empty();
    }

    /** Concatenates two chains. */
    PatchOffsets Append(const PatchOffsets& other) const;

    const std::string& Str() const noexcept {
        return text_;
    }

    bool operator==(const PatchOffsets& other) const = default;

private:
    explicit PatchOffsets(std::string text) noexcept
        : text_(std::move(text)) {
    }

private:
    std::string text_;
};

} // namespace Stg
