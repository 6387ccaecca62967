#include "repository.h"

#include <stg/patch/error.h>

#include <fmt/format.h>
#include <git2.h>
#include <nlohmann/json.hpp>

#include <cstring>
#include <functional>
#include <stdexcept>

namespace Stg::Git {
namespace {

/// Version of the stack metadata format.
constexpr int STACK_FORMAT_VERSION = 5;

void CheckError(int error_code, const char* action) {
    if (error_code < 0) {
        const git_error* error = git_error_last();

        throw std::runtime_error(
            fmt::format("{} {} - {}", error_code, action, (error && error->message) ? error->message : "???")
        );
    }
}

git_oid ToOid(const HashId& id) noexcept {
    git_oid oid;

    static_assert(sizeof(oid.id) == sizeof(id.Data()));

    std::memcpy(oid.id, id.Data(), sizeof(oid.id));
    return oid;
}

Signature ToSignature(const git_signature* sig) {
    if (sig == nullptr) {
        return Signature();
    }
    return Signature{
        .name = sig->name ? sig->name : "",
        .email = sig->email ? sig->email : "",
        .when = sig->when.time,
    };
}

} // namespace

class Repository::Impl {
    /// Keeps libgit2 initialized while the repository is alive.
    struct Library {
        Library() {
            ::git_libgit2_init();
        }

        ~Library() {
            ::git_libgit2_shutdown();
        }
    };

public:
    explicit Impl(const std::filesystem::path& path) {
        CheckError(::git_repository_open_ext(&repo_, path.c_str(), 0, nullptr), "opening repository");
    }

    ~Impl() {
        if (repo_) {
            ::git_repository_free(repo_);
        }
    }

    std::filesystem::path GitDir() const {
        return ::git_repository_path(repo_);
    }

    std::optional<std::string> CurrentBranch() const {
        std::unique_ptr<git_reference, std::function<void(git_reference*)>> head(
            [&]() {
                git_reference* r;
                CheckError(::git_reference_lookup(&r, repo_, "HEAD"), "HEAD lookup");
                return r;
            }(),
            [](git_reference* r) { ::git_reference_free(r); }
        );

        // Detached HEAD.
        if (::git_reference_type(head.get()) != GIT_REFERENCE_SYMBOLIC) {
            return std::nullopt;
        }

        const std::string_view target = ::git_reference_symbolic_target(head.get());

        if (target.starts_with("refs/heads/")) {
            return std::string(target.substr(11));
        }
        return std::nullopt;
    }

    StackSnapshot GetStack(const std::optional<std::string>& branch) const {
        const auto name = branch ? branch : CurrentBranch();
        if (!name) {
            throw Error(ErrorKind::UnknownBranch, "not on a branch");
        }

        const auto metadata = ReadStackMetadata(*name);

        try {
            return ParseStackMetadata(nlohmann::json::parse(metadata));
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(fmt::format("invalid stack metadata of branch '{}': {}", *name, e.what()));
        }
    }

    std::shared_ptr<const Commit> LookupCommit(const HashId& id) const {
        const git_oid oid = ToOid(id);
        git_commit* r = nullptr;

        if (const int ret = ::git_commit_lookup(&r, repo_, &oid); ret == GIT_ENOTFOUND) {
            throw Error(ErrorKind::UnknownCommit, fmt::format("commit '{}' not found", id));
        } else {
            CheckError(ret, "looking up commit");
        }

        std::unique_ptr<git_commit, std::function<void(git_commit*)>> commit(r, [](git_commit* c) {
            ::git_commit_free(c);
        });

        CommitBuilder builder;

        builder.author = ToSignature(::git_commit_author(commit.get()));
        builder.committer = ToSignature(::git_commit_committer(commit.get()));
        builder.message = ::git_commit_message(commit.get());
        builder.tree = HashId::FromBytes(::git_commit_tree_id(commit.get())->id);

        for (size_t i = 0, end = ::git_commit_parentcount(commit.get()); i < end; ++i) {
            builder.parents.push_back(HashId::FromBytes(::git_commit_parent_id(commit.get(), i)->id));
        }

        return std::make_shared<const Commit>(id, std::move(builder));
    }

    std::shared_ptr<const Commit> LookupRevision(const std::string& revision) const {
        git_object* r = nullptr;

        switch (const int ret = ::git_revparse_single(&r, repo_, revision.c_str())) {
            case GIT_ENOTFOUND:
            case GIT_EINVALIDSPEC:
                throw Error(ErrorKind::UnknownCommit, fmt::format("revision '{}' not found", revision));
            case GIT_EAMBIGUOUS:
                throw Error(
                    ErrorKind::AmbiguousCommitPrefix, fmt::format("short commit id '{}' is ambiguous", revision)
                );
            default:
                CheckError(ret, "parsing revision");
        }

        std::unique_ptr<git_object, std::function<void(git_object*)>> object(r, [](git_object* o) {
            ::git_object_free(o);
        });

        git_object* peeled = nullptr;
        if (::git_object_peel(&peeled, object.get(), GIT_OBJECT_COMMIT) < 0) {
            throw Error(ErrorKind::UnknownCommit, fmt::format("revision '{}' is not a commit", revision));
        }

        const auto id = HashId::FromBytes(::git_object_id(peeled)->id);
        ::git_object_free(peeled);

        return LookupCommit(id);
    }

private:
    std::string ReadStackMetadata(const std::string& branch) const {
        const auto ref_name = fmt::format("refs/stacks/{}", branch);
        git_oid oid;

        if (const int ret = ::git_reference_name_to_id(&oid, repo_, ref_name.c_str()); ret == GIT_ENOTFOUND) {
            if (BranchExists(branch)) {
                throw Error(ErrorKind::UnknownBranch, fmt::format("branch '{}' is not initialized", branch));
            }
            throw Error(ErrorKind::UnknownBranch, fmt::format("branch '{}' not found", branch));
        } else {
            CheckError(ret, "resolving stack reference");
        }

        std::unique_ptr<git_commit, std::function<void(git_commit*)>> commit(
            [&]() {
                git_commit* r;
                CheckError(::git_commit_lookup(&r, repo_, &oid), "looking up stack commit");
                return r;
            }(),
            [](git_commit* r) { ::git_commit_free(r); }
        );

        std::unique_ptr<git_tree, std::function<void(git_tree*)>> tree(
            [&]() {
                git_tree* r;
                CheckError(::git_commit_tree(&r, commit.get()), "looking up stack tree");
                return r;
            }(),
            [](git_tree* r) { ::git_tree_free(r); }
        );

        const git_tree_entry* entry = ::git_tree_entry_byname(tree.get(), "stack.json");
        if (entry == nullptr) {
            throw std::runtime_error(fmt::format("no stack.json in stack metadata of branch '{}'", branch));
        }

        std::unique_ptr<git_blob, std::function<void(git_blob*)>> blob(
            [&]() {
                git_blob* r;
                CheckError(::git_blob_lookup(&r, repo_, ::git_tree_entry_id(entry)), "looking up stack.json");
                return r;
            }(),
            [](git_blob* r) { ::git_blob_free(r); }
        );

        return std::string(
            static_cast<const char*>(::git_blob_rawcontent(blob.get())), size_t(::git_blob_rawsize(blob.get()))
        );
    }

    StackSnapshot ParseStackMetadata(const nlohmann::json& json) const {
        if (const int version = json.at("version").get<int>(); version != STACK_FORMAT_VERSION) {
            throw std::runtime_error(fmt::format("unsupported stack format version {}", version));
        }

        StackSnapshot::Patches patches;

        const auto read_names = [&](const char* key, std::vector<PatchName>& names) {
            for (const auto& item : json.at(key)) {
                auto name = PatchName::Make(item.get<std::string>());
                const auto& oid = json.at("patches").at(name.Str()).at("oid").get<std::string>();

                patches.commits.emplace(name, HashId::FromHex(oid));
                names.push_back(std::move(name));
            }
        };

        read_names("applied", patches.applied);
        read_names("unapplied", patches.unapplied);
        read_names("hidden", patches.hidden);

        const auto head = HashId::FromHex(json.at("head").get<std::string>());

        if (patches.applied.empty()) {
            return StackSnapshot(std::move(patches), head, head);
        }

        const auto bottom = LookupCommit(patches.commits.at(patches.applied.front()));
        if (bottom->Parents().empty()) {
            throw std::runtime_error(fmt::format("patch '{}' has no parent commit", patches.applied.front()));
        }

        const HashId base = bottom->Parents().front();
        const HashId top = patches.commits.at(patches.applied.back());

        return StackSnapshot(std::move(patches), base, top);
    }

    bool BranchExists(const std::string& branch) const {
        git_reference* r = nullptr;

        if (const int ret = ::git_branch_lookup(&r, repo_, branch.c_str(), GIT_BRANCH_LOCAL); ret == GIT_ENOTFOUND) {
            return false;
        } else {
            CheckError(ret, "looking up branch");
        }

        ::git_reference_free(r);
        return true;
    }

private:
    Library library_;
    git_repository* repo_{nullptr};
};

///////////////////////////////////////////////////////////////////////////////////////////////////////////

Repository::Repository(const std::filesystem::path& path)
    : impl_(std::make_unique<Impl>(path)) {
}

Repository::~Repository() = default;

std::filesystem::path Repository::GitDir() const {
    return impl_->GitDir();
}

std::optional<std::string> Repository::CurrentBranch() const {
    return impl_->CurrentBranch();
}

StackSnapshot Repository::GetStack(const std::optional<std::string>& branch) const {
    return impl_->GetStack(branch);
}

std::shared_ptr<const Commit> Repository::LookupCommit(const HashId& id) const {
    return impl_->LookupCommit(id);
}

std::shared_ptr<const Commit> Repository::LookupRevision(const std::string_view revision) const {
    return impl_->LookupRevision(std::string(revision));
}

std::shared_ptr<const Commit> Repository::ApplySuffix(const Commit& commit, const std::string_view suffix) const {
    return impl_->LookupRevision(fmt::format("{}{}", commit.Id().ToHex(), suffix));
}

} // namespace Stg::Git
