#include "name.h"
#include "error.h"

#include <util/split.h>

namespace Stg {
namespace {

/// Characters forbidden anywhere in a git reference name.
constexpr std::string_view FORBIDDEN_CHARS = " ~^:?*[\\";

/// Names with special meaning in patch locators.
constexpr std::string_view RESERVED_NAMES[] = {"@", "{base}"};

std::string_view CheckPatchName(const std::string_view raw) noexcept {
    if (raw.find('/') != std::string_view::npos) {
        return "must not contain '/'";
    }
    for (const auto& reserved : RESERVED_NAMES) {
        if (raw == reserved) {
            return "is a reserved name";
        }
    }
    return CheckRefComponent(raw);
}

} // namespace

PatchName PatchName::Make(const std::string_view raw) {
    if (const auto reason = CheckPatchName(raw); !reason.empty()) {
        throw Error(ErrorKind::InvalidPatchName, fmt::format("invalid patch name '{}': {}", raw, reason));
    }
    return PatchName(std::string(raw));
}

std::optional<PatchName> PatchName::TryMake(const std::string_view raw) {
    if (IsValid(raw)) {
        return PatchName(std::string(raw));
    }
    return std::nullopt;
}

bool PatchName::IsValid(const std::string_view raw) noexcept {
    return CheckPatchName(raw).empty();
}

std::string_view CheckRefComponent(const std::string_view name) noexcept {
    if (name.empty()) {
        return "must not be empty";
    }
    if (name.front() == '.') {
        return "must not begin with '.'";
    }
    if (name.back() == '.') {
        return "must not end with '.'";
    }
    if (name.ends_with(".lock")) {
        return "must not end with '.lock'";
    }
    if (name.find("..") != std::string_view::npos) {
        return "must not contain '..'";
    }
    if (name.find("@{") != std::string_view::npos) {
        return "must not contain '@{'";
    }
    if (name == "@") {
        return "must not be '@'";
    }
    for (const char ch : name) {
        const auto c = static_cast<unsigned char>(ch);
        // ASCII control characters and DEL.
        if (c < 0x20 || c == 0x7f) {
            return "must not contain control characters";
        }
        if (FORBIDDEN_CHARS.find(ch) != std::string_view::npos) {
            return "must not contain whitespace or any of '~^:?*[\\'";
        }
    }
    return {};
}

bool IsValidBranchName(const std::string_view name) noexcept {
    if (name.empty() || name.front() == '/' || name.back() == '/' || name.find("//") != std::string_view::npos) {
        return false;
    }
    for (const auto& part : SplitPath(name)) {
        if (!CheckRefComponent(part).empty()) {
            return false;
        }
    }
    return true;
}

} // namespace Stg
