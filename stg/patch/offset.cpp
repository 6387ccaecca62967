#include "offset.h"
#include "error.h"

#include <fmt/format.h>

#include <charconv>

namespace Stg {
namespace {

constexpr bool IsDigit(const char ch) noexcept {
    return ch >= '0' && ch <= '9';
}

/**
 * Scans one atom at the beginning of the text.
 *
 * @return length of the atom or zero.
 */
size_t ScanAtom(const std::string_view text) noexcept {
    if (text.empty() || (text[0] != '+' && text[0] != '~')) {
        return 0;
    }
    size_t i = 1;
    while (i < text.size() && IsDigit(text[i])) {
        ++i;
    }
    return i;
}

} // namespace

PatchOffsets PatchOffsets::Parse(const std::string_view text) {
    if (const size_t len = Recognize(text); len != text.size()) {
        throw Error(
            ErrorKind::MalformedSyntax,
            fmt::format("invalid offset '{}' in '{}'", text.substr(len), text)
        );
    }

    PatchOffsets offsets{std::string(text)};
    // Ensure all counts are representable.
    offsets.Atoms();
    return offsets;
}

size_t PatchOffsets::Recognize(const std::string_view text) noexcept {
    size_t pos = 0;
    while (const size_t len = ScanAtom(text.substr(pos))) {
        pos += len;
    }
    return pos;
}

std::vector<PatchOffsetAtom> PatchOffsets::Atoms() const {
    std::vector<PatchOffsetAtom> atoms;
    std::string_view text = text_;

    while (const size_t len = ScanAtom(text)) {
        PatchOffsetAtom atom;

        atom.kind = text[0] == '+' ? PatchOffsetAtom::Kind::Plus : PatchOffsetAtom::Kind::Tilde;
        if (len > 1) {
            size_t value = 0;
            const auto [ptr, ec] = std::from_chars(text.data() + 1, text.data() + len, value);
            if (ec != std::errc()) {
                throw Error(
                    ErrorKind::MalformedSyntax,
                    fmt::format("offset '{}' is too large", text.substr(0, len))
                );
            }
            atom.count = value;
        }

        atoms.push_back(atom);
        text.remove_prefix(len);
    }

    return atoms;
}

PatchOffsets PatchOffsets::Append(const PatchOffsets& other) const {
    return PatchOffsets(text_ + other.text_);
}

} // namespace Stg
