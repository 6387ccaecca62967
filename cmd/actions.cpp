#include "actions.h"

#include <unordered_map>

namespace Stg {

static const std::unordered_map<std::string_view, Action> actions = {
    // Actions.
    {"id", Action::Id},
    {"series", Action::Series},
};

Action ParseAction(const std::string_view name) noexcept {
    if (auto ai = actions.find(name); ai != actions.end()) {
        return ai->second;
    }
    return Action::Unknown;
}

} // namespace Stg
