#include "color.h"

#include <util/tty.h>

namespace Stg {

bool IsColored(const ColorMode mode, FILE* output) noexcept {
    if (mode == ColorMode::Always) {
        return true;
    }
    if (mode == ColorMode::Auto && IsAtty(output)) {
        return true;
    }
    return false;
}

std::optional<ColorMode> ParseColorMode(const std::string_view value) {
    if (value == "always") {
        return ColorMode::Always;
    }
    if (value == "auto") {
        return ColorMode::Auto;
    }
    if (value == "none" || value == "never") {
        return ColorMode::None;
    }
    return {};
}

} // namespace Stg
