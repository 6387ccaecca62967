#pragma once

#include <cstdint>
#include <string_view>

namespace Stg {

/**
 * Types of git objects.
 */
enum class DataType : uint8_t {
    None = 0,
    /// Content object.
    Blob = 1,
    /// Tree object.
    Tree = 2,
    /// Commit object.
    Commit = 3,
    /// Tag object.
    Tag = 4,
};

/** Name of the type as it appears in object headers. */
constexpr std::string_view DataTypeName(const DataType type) noexcept {
    switch (type) {
        case DataType::Blob:
            return "blob";
        case DataType::Tree:
            return "tree";
        case DataType::Commit:
            return "commit";
        case DataType::Tag:
            return "tag";
        case DataType::None:
            break;
    }
    return "none";
}

} // namespace Stg
