#pragma once

#include <string_view>

namespace Stg {

enum class Action {
    Unknown = 0,

    /// Print the commit id of a revision.
    Id,
    /// Print the patch series.
    Series,
};

Action ParseAction(const std::string_view name) noexcept;

} // namespace Stg
