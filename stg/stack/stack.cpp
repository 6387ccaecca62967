#include "stack.h"

#include <stdexcept>

namespace Stg {

StackSnapshot::StackSnapshot(Patches patches, const HashId& base, const HashId& top)
    : patches_(std::move(patches))
    , base_(base)
    , top_(top) {
    order_.reserve(patches_.applied.size() + patches_.unapplied.size() + patches_.hidden.size());
    order_.insert(order_.end(), patches_.applied.begin(), patches_.applied.end());
    order_.insert(order_.end(), patches_.unapplied.begin(), patches_.unapplied.end());
    order_.insert(order_.end(), patches_.hidden.begin(), patches_.hidden.end());

    for (size_t i = 0; i < order_.size(); ++i) {
        if (!index_.emplace(order_[i].Str(), i).second) {
            throw std::invalid_argument(fmt::format("patch '{}' appears more than once", order_[i]));
        }
        if (!patches_.commits.contains(order_[i])) {
            throw std::invalid_argument(fmt::format("no commit for patch '{}'", order_[i]));
        }
    }
}

const PatchName& StackSnapshot::At(const size_t index) const {
    return order_.at(index);
}

LocationGroup StackSnapshot::GroupAt(const size_t index) const {
    if (index < patches_.applied.size()) {
        return LocationGroup::Applied;
    }
    if (index < VisibleSize()) {
        return LocationGroup::Unapplied;
    }
    if (index < order_.size()) {
        return LocationGroup::Hidden;
    }
    throw std::out_of_range(fmt::format("no patch at index {}", index));
}

std::optional<size_t> StackSnapshot::IndexOf(const std::string_view name) const {
    if (auto ii = index_.find(std::string(name)); ii != index_.end()) {
        return ii->second;
    }
    return std::nullopt;
}

const HashId& StackSnapshot::PatchCommit(const PatchName& name) const {
    if (auto ci = patches_.commits.find(name); ci != patches_.commits.end()) {
        return ci->second;
    }
    throw std::out_of_range(fmt::format("no commit for patch '{}'", name));
}

} // namespace Stg
