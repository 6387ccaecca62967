#pragma once

#include <stg/stack/stack.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace Stg::Git {

/**
 * Git repository with StGit stack metadata.
 *
 * Stacks are read from `refs/stacks/<branch>`, revisions are resolved
 * by libgit2.
 */
class Repository
    : public BranchResolver
    , public CommitLookup {
public:
    /**
     * @param path path inside a working tree or a git directory.
     */
    explicit Repository(const std::filesystem::path& path);

    ~Repository();

    /** Path to the git directory. */
    std::filesystem::path GitDir() const;

    /** Name of the branch HEAD points to. */
    std::optional<std::string> CurrentBranch() const;

public:
    StackSnapshot GetStack(const std::optional<std::string>& branch) const override;

    std::shared_ptr<const Commit> LookupCommit(const HashId& id) const override;

    std::shared_ptr<const Commit> LookupRevision(const std::string_view revision) const override;

    std::shared_ptr<const Commit> ApplySuffix(const Commit& commit, const std::string_view suffix) const override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace Stg::Git
