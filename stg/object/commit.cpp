#include "commit.h"

#include <cctype>

namespace Stg {
namespace {

std::string FormatSignature(const std::string_view kind, const Signature& sig) {
    return fmt::format("{} {} <{}> {} +0000\n", kind, sig.name, sig.email, sig.when);
}

} // namespace

std::string CommitBuilder::Serialize() const {
    std::string result;

    result += fmt::format("tree {}\n", tree);
    for (const auto& p : parents) {
        result += fmt::format("parent {}\n", p);
    }
    result += FormatSignature("author", author);
    result += FormatSignature("committer", committer.Empty() ? author : committer);
    result += '\n';
    result += message;

    return result;
}

Commit::Commit(const HashId& id, CommitBuilder data)
    : id_(id)
    , data_(std::move(data)) {
}

Commit Commit::Make(CommitBuilder data) {
    const auto id = HashId::Make(DataType::Commit, data.Serialize());

    return Commit(id, std::move(data));
}

std::vector<std::string_view> MessageLines(const std::string_view msg) {
    std::vector<std::string_view> lines;

    for (size_t i = 0, end = msg.size(); i < end;) {
        while (i < end && std::isspace(static_cast<unsigned char>(msg[i]))) {
            ++i;
        }

        size_t l = i;
        while (i < msg.size() && msg[i] != '\n') {
            ++i;
        }
        size_t r = i - 1;
        while (l <= r && r != std::string_view::npos) {
            if (std::isspace(static_cast<unsigned char>(msg[r]))) {
                --r;
            } else {
                lines.push_back(msg.substr(l, r - l + 1));
                break;
            }
        }
    }

    return lines;
}

std::string_view MessageTitle(const std::string_view msg) noexcept {
    auto pos = msg.find('\n');
    if (pos == std::string_view::npos) {
        return msg;
    } else {
        return msg.substr(0, pos);
    }
}

} // namespace Stg
