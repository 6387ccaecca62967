#include "revparse.h"

#include <limits>

namespace Stg {

static constexpr bool IsDigit(const char ch) noexcept {
    return ch >= '0' && ch <= '9';
}

static std::optional<uint64_t> ParseNumber(
    std::string_view::const_iterator& ci, const std::string_view::const_iterator end
) {
    uint64_t value = 0;

    do {
        const uint64_t digit = *ci - '0';

        if (value > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
        ++ci;
    } while (ci != end && IsDigit(*ci));

    return value;
}

std::optional<HashId> ReferenceResolver::Resolve(const std::string_view ref) const {
    return Walk(std::nullopt, ref);
}

std::optional<HashId> ReferenceResolver::Resolve(const HashId& id, const std::string_view suffix) const {
    return Walk(id, suffix);
}

std::optional<HashId> ReferenceResolver::Walk(std::optional<HashId> result, const std::string_view ref) const {
    // Length of an identifier.
    size_t length = 0;

    const auto ensure_revision_loaded = [&]() {
        if (result) {
            return true;
        }
        if (length == 0) {
            return false;
        }
        if (auto id = DoLookup(ref.substr(0, length))) {
            result = id;
            return true;
        }
        return false;
    };

    const auto extract_how_many_carets = [](auto& ci, const auto end) -> std::optional<uint64_t> {
        ++ci;

        if (ci != end && IsDigit(*ci)) {
            return ParseNumber(ci, end);
        } else {
            return uint64_t(1u);
        }
    };

    const auto extract_how_many_tildes = [](auto& ci, const auto end) -> std::optional<uint64_t> {
        uint64_t count = 0;

        while (ci != end) {
            if (*ci == '~') {
                ++ci;
                ++count;
            } else if (IsDigit(*ci)) {
                const auto n = ParseNumber(ci, end);
                if (!n || *n > std::numeric_limits<uint64_t>::max() - count) {
                    return std::nullopt;
                }
                count = (count + *n) - 1;
            } else {
                break;
            }
        }

        return count;
    };

    for (auto ci = ref.begin(), end = ref.end(); ci != end;) {
        switch (*ci) {
            case '^': {
                const auto count = extract_how_many_carets(ci, end);

                if (!count || !ensure_revision_loaded()) {
                    return {};
                }
                if (auto id = DoGetNthParent(*result, *count)) {
                    result = id;
                } else {
                    return {};
                }

                break;
            }
            case '~': {
                const auto count = extract_how_many_tildes(ci, end);

                if (!count || !ensure_revision_loaded()) {
                    return {};
                }
                if (auto id = DoGetNthAncestor(*result, *count)) {
                    result = id;
                } else {
                    return {};
                }

                break;
            }
            case ':': {
                // Not implemented.
                return {};
            }
            case '@': {
                if (length == 0 && !result) {
                    // @ alone is a shortcut for HEAD.
                    if (auto id = DoLookup("HEAD")) {
                        ++ci;
                        ++length;
                        result = id;
                    } else {
                        return {};
                    }
                    break;
                }
                // Reflog selectors are not implemented.
                return {};
            }
            default:
                if (result) {
                    // Unknown character in the refspec.
                    return {};
                } else {
                    ++ci;
                    ++length;
                }
                break;
        }
    }

    if (result) {
        return result;
    } else if (length != 0) {
        return DoLookup(ref.substr(0, length));
    }

    return {};
}

} // namespace Stg
