#include "stack.h"

#include <fmt/format.h>

namespace Stg::UT {
namespace {

std::vector<PatchName> MakeNames(const std::vector<std::string>& names) {
    std::vector<PatchName> result;

    for (const auto& name : names) {
        result.push_back(PatchName::Make(name));
    }
    return result;
}

} // namespace

StackSnapshot MakeSnapshot(
    const std::vector<std::string>& applied,
    const std::vector<std::string>& unapplied,
    const std::vector<std::string>& hidden
) {
    StackSnapshot::Patches patches{
        .applied = MakeNames(applied),
        .unapplied = MakeNames(unapplied),
        .hidden = MakeNames(hidden),
        .commits = {},
    };

    for (const auto* group : {&patches.applied, &patches.unapplied, &patches.hidden}) {
        for (const auto& name : *group) {
            patches.commits.emplace(name, HashId::Make(DataType::Blob, name.Str()));
        }
    }

    const auto base = HashId::Make(DataType::Blob, "{base}");
    const auto top = patches.applied.empty() ? base : patches.commits.at(patches.applied.back());

    return StackSnapshot(std::move(patches), base, top);
}

HashId MakeCommit(MemoryStore& store, const std::string& message, const std::vector<HashId>& parents) {
    CommitBuilder commit;

    commit.author.name = "John";
    commit.author.email = "john@example.com";
    commit.author.when = 1700000000;
    commit.message = message;
    commit.tree = HashId::Make(DataType::Tree, "");
    commit.parents = parents;

    return store.Put(std::move(commit));
}

BranchStack MakeBranchStack(
    MemoryStore& store,
    const std::string& branch,
    const std::vector<std::string>& applied,
    const std::vector<std::string>& unapplied,
    const std::vector<std::string>& hidden,
    const size_t depth
) {
    std::vector<HashId> history;

    for (size_t i = 0; i < depth; ++i) {
        history.push_back(MakeCommit(
            store,
            fmt::format("{} history {}\n", branch, i),
            history.empty() ? std::vector<HashId>() : std::vector<HashId>{history.back()}
        ));
    }

    const HashId base = history.empty() ? MakeCommit(store, fmt::format("{} root\n", branch)) : history.back();

    StackSnapshot::Patches patches;
    HashId top = base;

    for (const auto& name : applied) {
        top = MakeCommit(store, fmt::format("{}\n\nOn branch {}.\n", name, branch), {top});
        patches.applied.push_back(PatchName::Make(name));
        patches.commits.emplace(patches.applied.back(), top);
    }
    for (const auto& name : unapplied) {
        patches.unapplied.push_back(PatchName::Make(name));
        patches.commits.emplace(
            patches.unapplied.back(), MakeCommit(store, fmt::format("{}\n\nOn branch {}.\n", name, branch), {base})
        );
    }
    for (const auto& name : hidden) {
        patches.hidden.push_back(PatchName::Make(name));
        patches.commits.emplace(
            patches.hidden.back(), MakeCommit(store, fmt::format("{}\n\nOn branch {}.\n", name, branch), {base})
        );
    }

    StackSnapshot stack(std::move(patches), base, top);

    store.SetReference(fmt::format("refs/heads/{}", branch), top);
    store.SetStack(branch, stack);

    return BranchStack{
        .history = std::move(history),
        .stack = std::move(stack),
    };
}

} // namespace Stg::UT
