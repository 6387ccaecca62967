#pragma once

#include <stg/stack/stack.h>
#include <stg/store/memory.h>

#include <string>
#include <vector>

namespace Stg::UT {

using MemoryStore = Store::MemoryStore<Store::NoLock>;

/**
 * Makes a snapshot with synthetic commit ids derived from the patch names.
 */
StackSnapshot MakeSnapshot(
    const std::vector<std::string>& applied,
    const std::vector<std::string>& unapplied = {},
    const std::vector<std::string>& hidden = {}
);

/** Stores a commit with the given message and parents. */
HashId MakeCommit(MemoryStore& store, const std::string& message, const std::vector<HashId>& parents = {});

struct BranchStack {
    /// History below the stack from the oldest commit; the last one is the stack base.
    std::vector<HashId> history;
    StackSnapshot stack;
};

/**
 * Builds a branch with a linear history of @p depth commits and a stack on top of it.
 *
 * Applied patches form a chain on top of the history; unapplied and hidden patch
 * commits are children of the stack base. The branch reference points to the top.
 */
BranchStack MakeBranchStack(
    MemoryStore& store,
    const std::string& branch,
    const std::vector<std::string>& applied,
    const std::vector<std::string>& unapplied = {},
    const std::vector<std::string>& hidden = {},
    const size_t depth = 3
);

} // namespace Stg::UT
