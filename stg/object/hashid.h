#pragma once

#include "data.h"

#include <fmt/format.h>

#include <cstdint>
#include <cstring>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>

namespace Stg {

class HashId {
public:
    /** Copies hash data from the provided location. */
    static HashId FromBytes(const void* data, const size_t len);

    /** Copies hash data from the provided location. */
    static HashId FromBytes(const std::string_view data);

    /** Copies hash data from the provided location. */
    static HashId FromBytes(const unsigned char (&data)[20]) noexcept;

    /** Parse hex representation of the id. */
    static HashId FromHex(const std::string_view hex);

    /** Checks whether the string is a valid representation of an id in bytes format. */
    static bool IsBytes(const std::string_view hex) noexcept;

    /** Checks whether the string is a valid representation of an id in hex format. */
    static bool IsHex(const std::string_view hex) noexcept;

    /**
     * Checks whether the string may be an abbreviated id, i.e. consists
     * of at least @p min_length and at most 40 hex digits.
     */
    static bool IsHexPrefix(const std::string_view hex, const size_t min_length = 4) noexcept;

    /** Makes canonical git object hash. */
    static HashId Make(const DataType type, const std::string_view content);

public:
    constexpr auto Data() const noexcept -> const unsigned char (&)[20] {
        return data_;
    }

    /** Byte size of the data. */
    constexpr size_t Size() const noexcept {
        return sizeof(data_);
    }

    /** Checks whether hex representation of the hash starts with the prefix (case insensitive). */
    bool HasPrefix(const std::string_view hex) const noexcept;

    /** Hex representation of the hash. */
    std::string ToHex() const;

    /** Abbreviated hex representation of the hash. */
    std::string ToShortHex(const size_t length) const;

    /** Raw data of the hash. */
    std::string ToBytes() const;

public:
    explicit operator bool() const noexcept {
        static constexpr unsigned char zeroes[20] = {};
        // Ensure same size.
        static_assert(sizeof(zeroes) == sizeof(data_));
        // Check for non null.
        return std::memcmp(zeroes, data_, sizeof(data_)) != 0;
    }

    bool operator<(const HashId& other) const noexcept {
        return std::memcmp(data_, other.data_, sizeof(data_)) < 0;
    }

    bool operator==(const HashId& other) const noexcept {
        if (this == &other) {
            return true;
        }
        return std::memcmp(data_, other.data_, sizeof(data_)) == 0;
    }

    friend std::ostream& operator<<(std::ostream& output, const HashId& id);

    template <typename H>
    friend H AbslHashValue(H h, const HashId& id) {
        return H::combine_contiguous(std::move(h), id.data_, sizeof(id.data_));
    }

private:
    alignas(alignof(uint32_t)) unsigned char data_[20] = {};
};

/// Ensure the value of HashId is 20 bytes long.
static_assert(sizeof(HashId) == 20);

/// Ensure the value of HashId is memcpy copyable.
static_assert(std::is_trivially_copyable<HashId>::value);

/// Ensure HashId is 32-bit aligned.
static_assert(std::alignment_of<HashId>::value == std::alignment_of<uint32_t>::value);

} // namespace Stg

template <>
struct fmt::formatter<Stg::HashId> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const Stg::HashId& id, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(id.ToHex(), ctx);
    }
};

template <>
class std::hash<Stg::HashId> {
public:
    std::size_t operator()(const Stg::HashId& id) const noexcept {
        std::size_t value;
        // Ensure no buffer overrun.
        static_assert(sizeof(decltype(id.Data())) >= sizeof(value));

        std::memcpy(&value, id.Data(), sizeof(value));
        return value;
    }
};
