#pragma once

#include "hashid.h"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace Stg {

struct Signature {
    /// Human readable name.
    std::string name;
    /// E-mail of the person.
    std::string email;
    /// Creation timestamp in UTC.
    int64_t when = 0;

    bool Empty() const noexcept {
        return name.empty() && email.empty() && when == 0;
    }
};

struct CommitBuilder {
    /// Author of the commit.
    Signature author;
    /// Commiter.
    Signature committer;
    /// Description of the commit.
    std::string message;

    /// Root tree.
    HashId tree{};
    /// List of parent revisions.
    std::vector<HashId> parents;

    /** Serializes commit in the canonical git format. */
    std::string Serialize() const;
};

/**
 * Immutable commit object.
 *
 * The object owns all its data, so a shared handle to it may outlive the
 * store it was loaded from.
 */
class Commit {
public:
    Commit(const HashId& id, CommitBuilder data);

    /** Builds commit from the data and computes its git object id. */
    static Commit Make(CommitBuilder data);

public:
    const HashId& Id() const noexcept {
        return id_;
    }

    const HashId& Tree() const noexcept {
        return data_.tree;
    }

    const std::vector<HashId>& Parents() const noexcept {
        return data_.parents;
    }

    const Signature& Author() const noexcept {
        return data_.author;
    }

    const Signature& Committer() const noexcept {
        return data_.committer;
    }

    const std::string& Message() const noexcept {
        return data_.message;
    }

private:
    HashId id_;
    CommitBuilder data_;
};

std::vector<std::string_view> MessageLines(const std::string_view msg);

std::string_view MessageTitle(const std::string_view msg) noexcept;

} // namespace Stg
