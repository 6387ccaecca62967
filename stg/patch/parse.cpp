#include "parse.h"

#include <util/split.h>

#include <algorithm>
#include <charconv>

namespace Stg {
namespace {

struct Anchor {
    PatchId id;
    /// Number of characters consumed.
    size_t length;
};

constexpr bool IsDigit(const char ch) noexcept {
    return ch >= '0' && ch <= '9';
}

/// Symbolic anchors are only recognized when followed by offsets or a suffix.
bool IsAnchorEnd(const std::string_view rest) noexcept {
    return rest.empty() || rest[0] == '~' || rest[0] == '+' || rest[0] == '^' || rest.starts_with("@{");
}

Anchor ParseBelowLast(const std::string_view text) {
    size_t i = 1;
    bool negative = false;

    if (i < text.size() && text[i] == '-') {
        negative = true;
        ++i;
    }

    const size_t digits = i;
    while (i < text.size() && IsDigit(text[i])) {
        ++i;
    }

    if (i == digits) {
        if (negative) {
            throw Error(ErrorKind::MalformedSyntax, fmt::format("missing number after '^-' in '{}'", text));
        }
        return Anchor{PatchId(PatchId::BelowLast{}), 1};
    }

    int64_t value = 0;
    if (const auto [ptr, ec] = std::from_chars(text.data() + digits, text.data() + i, value); ec != std::errc()) {
        throw Error(ErrorKind::MalformedSyntax, fmt::format("number in '{}' is too large", text.substr(0, i)));
    }

    return Anchor{PatchId(PatchId::BelowLast{negative ? -value : value}), i};
}

Anchor ParseAnchor(const std::string_view text) {
    if (text.empty()) {
        throw Error(ErrorKind::MalformedSyntax, "empty patch locator");
    }
    if (text[0] == '@' && IsAnchorEnd(text.substr(1))) {
        return Anchor{PatchId(PatchId::Top{}), 1};
    }
    if (text.starts_with("{base}") && IsAnchorEnd(text.substr(6))) {
        return Anchor{PatchId(PatchId::Base{}), 6};
    }
    if (text[0] == '^') {
        return ParseBelowLast(text);
    }
    if (text[0] == '~' || text[0] == '+') {
        return Anchor{PatchId(PatchId::BelowTop{}), 0};
    }

    // The name extends up to the first character which can not be a part of it.
    const size_t end = std::min(text.find_first_of("~^"), text.find("@{"));
    const auto name = text.substr(0, end);

    return Anchor{PatchId(PatchName::Make(name)), name.size()};
}

std::optional<PatchLikeSpec> TryParsePatchLikeSpec(const std::string_view text) {
    try {
        return ParsePatchLikeSpec(text);
    } catch (const Error& e) {
        if (e.Kind() != ErrorKind::MalformedSyntax && e.Kind() != ErrorKind::InvalidPatchName) {
            throw;
        }
    }
    return std::nullopt;
}

} // namespace

PatchLocator ParseLocator(const std::string_view text) {
    const auto anchor = ParseAnchor(text);

    return PatchLocator(anchor.id, PatchOffsets::Parse(text.substr(anchor.length)));
}

PatchRangeBounds ParseRangeBounds(const std::string_view text) {
    const auto parts = SplitOnce(text, "..");
    if (!parts) {
        throw Error(ErrorKind::MalformedSyntax, fmt::format("'{}' is not a patch range", text));
    }

    const auto [begin, end] = *parts;

    if (end.find("..") != std::string_view::npos) {
        throw Error(ErrorKind::MalformedSyntax, fmt::format("too many '..' in patch range '{}'", text));
    }

    PatchRangeBounds bounds;
    if (!begin.empty()) {
        bounds.begin = ParseLocator(begin);
    }
    if (!end.empty()) {
        bounds.end = ParseLocator(end);
    }
    return bounds;
}

PatchRange ParseRange(const std::string_view text) {
    if (text.find("..") != std::string_view::npos) {
        return PatchRange(ParseRangeBounds(text));
    }
    return PatchRange(ParseLocator(text));
}

PatchLikeSpec ParsePatchLikeSpec(const std::string_view text) {
    const auto anchor = ParseAnchor(text);
    const auto rest = text.substr(anchor.length);
    const size_t length = PatchOffsets::Recognize(rest);
    const auto suffix = rest.substr(length);

    if (!suffix.empty() && suffix[0] != '^' && !suffix.starts_with("@{")) {
        throw Error(ErrorKind::MalformedSyntax, fmt::format("unexpected '{}' in '{}'", suffix, text));
    }

    return PatchLikeSpec{
        .patch_loc = PatchLocator(anchor.id, PatchOffsets::Parse(rest.substr(0, length))),
        .suffix = GitRevisionSuffix{std::string(suffix)},
    };
}

SingleRevisionSpec ParseSingleRevisionSpec(const std::string_view text) {
    if (text.empty()) {
        throw Error(ErrorKind::MalformedSyntax, "empty revision");
    }

    if (const auto parts = SplitOnce(text, ":")) {
        const auto [branch, rest] = *parts;

        if (IsValidBranchName(branch)) {
            if (auto patch_like = TryParsePatchLikeSpec(rest)) {
                return SingleRevisionSpec(SingleRevisionSpec::Branch{std::string(branch), std::move(*patch_like)});
            }
        }
        return SingleRevisionSpec(SingleRevisionSpec::GitLike{std::string(text)});
    }

    if (auto patch_like = TryParsePatchLikeSpec(text)) {
        if (patch_like->patch_loc.Id().Name()) {
            return SingleRevisionSpec(SingleRevisionSpec::PatchAndGitLike{std::move(*patch_like), std::string(text)});
        }
        return SingleRevisionSpec(SingleRevisionSpec::PatchLike{std::move(*patch_like)});
    }

    return SingleRevisionSpec(SingleRevisionSpec::GitLike{std::string(text)});
}

RangeRevisionSpec ParseRevisionSpec(const std::string_view text) {
    const size_t dots = text.find("..");
    if (dots == std::string_view::npos) {
        return RangeRevisionSpec(ParseSingleRevisionSpec(text));
    }

    if (const size_t colon = text.find(':'); colon != std::string_view::npos && colon < dots) {
        const auto branch = text.substr(0, colon);

        if (!IsValidBranchName(branch)) {
            throw Error(ErrorKind::MalformedSyntax, fmt::format("invalid branch name '{}'", branch));
        }
        return RangeRevisionSpec(
            RangeRevisionSpec::BranchRange{std::string(branch), ParseRangeBounds(text.substr(colon + 1))}
        );
    }

    return RangeRevisionSpec(ParseRangeBounds(text));
}

} // namespace Stg
