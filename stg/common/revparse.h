#pragma once

#include <stg/object/hashid.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace Stg {

/**
 * Interprets git revision syntax on top of an object lookup.
 *
 * Supported forms are `<name>`, `@`, `<rev>^[<n>]` and `<rev>~[<n>]`.
 */
class ReferenceResolver {
public:
    virtual ~ReferenceResolver() = default;

    /**
     * Parses a reference specification.
     *
     * @param ref refspec to parse.
     * @return id of the referenced object or nothing.
     */
    std::optional<HashId> Resolve(const std::string_view ref) const;

    /**
     * Applies a sequence of `^` / `~` operators to the given commit.
     *
     * @param id starting commit.
     * @param suffix revision suffix, e.g. `~2^2`.
     */
    std::optional<HashId> Resolve(const HashId& id, const std::string_view suffix) const;

protected:
    /**
     * Gets nth ancestor of a commit.
     *
     * @param id id of the commit object.
     */
    virtual std::optional<HashId> DoGetNthAncestor(const HashId& id, const uint64_t n) const = 0;

    /**
     * Gets nth parent of a commit.
     *
     * @param id id of the commit object.
     * @param n position of a parent (1-based).
     */
    virtual std::optional<HashId> DoGetNthParent(const HashId& id, const uint64_t n) const = 0;

    /** Lookups object by name. */
    virtual std::optional<HashId> DoLookup(const std::string_view name) const = 0;

private:
    std::optional<HashId> Walk(std::optional<HashId> result, const std::string_view ref) const;
};

} // namespace Stg
