#pragma once

#include <fmt/format.h>

#include <compare>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Stg {

/**
 * A string that follows the patch naming rules.
 *
 * A valid patch name must meet all the rules of a git reference name, plus the
 * additional restriction of not containing '/' as well as not being one of the
 * reserved strings `@` or `{base}`.
 */
class PatchName {
public:
    /** Validates the string and makes a name. Throws InvalidPatchName on violation. */
    static PatchName Make(const std::string_view raw);

    /** Validates the string and makes a name. */
    static std::optional<PatchName> TryMake(const std::string_view raw);

    /** Checks the string against the patch naming rules. */
    static bool IsValid(const std::string_view raw) noexcept;

public:
    const std::string& Str() const noexcept {
        return name_;
    }

    size_t Size() const noexcept {
        return name_.size();
    }

    operator std::string_view() const noexcept {
        return name_;
    }

    auto operator<=>(const PatchName& other) const = default;

    bool operator==(const PatchName& other) const = default;

    friend std::ostream& operator<<(std::ostream& output, const PatchName& name) {
        return output << name.name_;
    }

private:
    explicit PatchName(std::string name) noexcept
        : name_(std::move(name)) {
    }

private:
    std::string name_;
};

/**
 * Checks a single component of a git reference name (no '/' allowed).
 *
 * @return description of the violated rule or empty string.
 */
std::string_view CheckRefComponent(const std::string_view name) noexcept;

/** Checks whether the string is a valid (possibly hierarchical) branch name. */
bool IsValidBranchName(const std::string_view name) noexcept;

} // namespace Stg

template <>
struct fmt::formatter<Stg::PatchName> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const Stg::PatchName& name, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(name.Str(), ctx);
    }
};

template <>
class std::hash<Stg::PatchName> {
public:
    std::size_t operator()(const Stg::PatchName& name) const noexcept {
        return std::hash<std::string>()(name.Str());
    }
};
