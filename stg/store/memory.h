#pragma once

#include <stg/common/revparse.h>
#include <stg/object/commit.h>
#include <stg/patch/error.h>
#include <stg/stack/stack.h>

#include <absl/container/flat_hash_map.h>
#include <fmt/format.h>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace Stg::Store {

class NoLock {
public:
    constexpr void lock() noexcept {
    }

    constexpr void unlock() noexcept {
    }

    constexpr bool try_lock() noexcept {
        return true;
    }
};

/**
 * In-memory commit store with references and branch stacks.
 *
 * Serves as the stack and commit provider for tests and for tools which
 * assemble a stack without a repository.
 */
template <typename Mutex = std::mutex>
class MemoryStore
    : public BranchResolver
    , public CommitLookup
    , protected ReferenceResolver {
public:
    template <typename... Args>
    static auto Make(Args&&... args) {
        return std::make_shared<MemoryStore>(std::forward<Args>(args)...);
    }

    /** Number of stored commits. */
    size_t Size() const noexcept {
        std::lock_guard lock(mutex_);

        return commits_.size();
    }

    /** Stores the commit and returns its id. */
    HashId Put(CommitBuilder builder) {
        return Put(Commit::Make(std::move(builder)));
    }

    HashId Put(Commit commit) {
        std::lock_guard lock(mutex_);

        const HashId id = commit.Id();
        commits_.try_emplace(id, std::make_shared<const Commit>(std::move(commit)));
        return id;
    }

    /** Sets full reference name (e.g. `refs/heads/main`) to the commit. */
    void SetReference(const std::string& name, const HashId& id) {
        std::lock_guard lock(mutex_);

        references_[name] = id;
    }

    /** Sets the stack of the branch. */
    void SetStack(const std::string& branch, StackSnapshot stack) {
        std::lock_guard lock(mutex_);

        stacks_.insert_or_assign(branch, std::move(stack));
    }

    /** Makes the branch current, so `HEAD` points to it. */
    void SetCurrentBranch(const std::string& branch) {
        std::lock_guard lock(mutex_);

        current_ = branch;
    }

public:
    StackSnapshot GetStack(const std::optional<std::string>& branch) const override {
        std::lock_guard lock(mutex_);

        if (!branch && !current_) {
            throw Error(ErrorKind::UnknownBranch, "not on a branch");
        }

        const auto& name = branch ? *branch : *current_;

        if (auto si = stacks_.find(name); si != stacks_.end()) {
            return si->second;
        }
        if (references_.contains("refs/heads/" + name)) {
            throw Error(ErrorKind::UnknownBranch, fmt::format("branch '{}' is not initialized", name));
        }
        throw Error(ErrorKind::UnknownBranch, fmt::format("branch '{}' not found", name));
    }

    std::shared_ptr<const Commit> LookupCommit(const HashId& id) const override {
        std::lock_guard lock(mutex_);

        return LoadCommit(id);
    }

    std::shared_ptr<const Commit> LookupRevision(const std::string_view revision) const override {
        std::lock_guard lock(mutex_);

        if (const auto id = Resolve(revision)) {
            return LoadCommit(*id);
        }
        throw Error(ErrorKind::UnknownCommit, fmt::format("revision '{}' not found", revision));
    }

    std::shared_ptr<const Commit> ApplySuffix(const Commit& commit, const std::string_view suffix) const override {
        std::lock_guard lock(mutex_);

        if (const auto id = Resolve(commit.Id(), suffix)) {
            return LoadCommit(*id);
        }
        throw Error(
            ErrorKind::UnknownCommit, fmt::format("revision '{}{}' not found", commit.Id().ToShortHex(7), suffix)
        );
    }

protected:
    std::optional<HashId> DoGetNthAncestor(const HashId& id, uint64_t n) const override {
        HashId result = id;

        for (; n > 0; --n) {
            const auto ci = commits_.find(result);

            if (ci == commits_.end() || ci->second->Parents().empty()) {
                return std::nullopt;
            }
            result = ci->second->Parents().front();
        }

        return result;
    }

    std::optional<HashId> DoGetNthParent(const HashId& id, const uint64_t n) const override {
        if (n == 0) {
            return id;
        }
        if (const auto ci = commits_.find(id); ci != commits_.end() && ci->second->Parents().size() >= n) {
            return ci->second->Parents()[n - 1];
        }
        return std::nullopt;
    }

    std::optional<HashId> DoLookup(const std::string_view name) const override {
        if (name.empty()) {
            return std::nullopt;
        }
        if (name == "HEAD") {
            if (!current_) {
                return std::nullopt;
            }
            return FindReference("refs/heads/" + *current_);
        }
        if (HashId::IsHex(name)) {
            if (const auto id = HashId::FromHex(name); commits_.contains(id)) {
                return id;
            }
        }
        for (const auto prefix : {"", "refs/", "refs/tags/", "refs/heads/"}) {
            if (auto id = FindReference(fmt::format("{}{}", prefix, name))) {
                return id;
            }
        }
        if (HashId::IsHexPrefix(name)) {
            return FindByPrefix(name);
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<const Commit> LoadCommit(const HashId& id) const {
        if (auto ci = commits_.find(id); ci != commits_.end()) {
            return ci->second;
        }
        throw Error(ErrorKind::UnknownCommit, fmt::format("commit '{}' not found", id));
    }

    std::optional<HashId> FindReference(const std::string& name) const {
        if (auto ri = references_.find(name); ri != references_.end()) {
            return ri->second;
        }
        return std::nullopt;
    }

    std::optional<HashId> FindByPrefix(const std::string_view prefix) const {
        std::optional<HashId> result;

        for (const auto& [id, _] : commits_) {
            if (!id.HasPrefix(prefix)) {
                continue;
            }
            if (result) {
                throw Error(ErrorKind::AmbiguousCommitPrefix, fmt::format("short commit id '{}' is ambiguous", prefix));
            }
            result = id;
        }

        return result;
    }

private:
    mutable Mutex mutex_;
    absl::flat_hash_map<HashId, std::shared_ptr<const Commit>> commits_;
    absl::flat_hash_map<std::string, HashId> references_;
    absl::flat_hash_map<std::string, StackSnapshot> stacks_;
    std::optional<std::string> current_;
};

} // namespace Stg::Store
