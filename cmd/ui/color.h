#pragma once

#include <cstdio>
#include <optional>
#include <string_view>

namespace Stg {

enum class ColorMode {
    /// No colored output.
    None,
    /// Print colored only if target device is terminal.
    Auto,
    /// Always emit colored output.
    Always,
};

bool IsColored(const ColorMode mode, FILE* output) noexcept;

std::optional<ColorMode> ParseColorMode(const std::string_view value);

} // namespace Stg
