#include "hashid.h"

#include <git2.h>

#include <algorithm>
#include <stdexcept>

namespace Stg {
namespace {

constexpr char HEX_DIGITS[16] = {
    '0', '1', '2', '3', '4', '5', '6', '7', '8', '9', 'a', 'b', 'c', 'd', 'e', 'f',
};

template <size_t N, size_t M>
void BytesToHex(const unsigned char (&data)[N], char (&buf)[M]) noexcept {
    static_assert(2 * N == M);

    for (size_t i = 0; i < N; ++i) {
        buf[2 * i] = HEX_DIGITS[(data[i] >> 4) & 0x0F];
        buf[2 * i + 1] = HEX_DIGITS[data[i] & 0x0F];
    }
}

constexpr bool IsHexDigit(const char ch) noexcept {
    return (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f') || (ch >= 'A' && ch <= 'F');
}

uint8_t HexToByte(const char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return 10 + (ch - 'a');
    }
    if (ch >= 'A' && ch <= 'F') {
        return 10 + (ch - 'A');
    }
    throw std::invalid_argument(fmt::format("invalid hex character '{}'", ch));
}

/// Hashing with libgit2 requires the library to be initialized at least once.
void InitializeLibrary() {
    static const int ret = ::git_libgit2_init();

    if (ret < 0) {
        throw std::runtime_error(fmt::format("cannot initialize libgit2: {}", ret));
    }
}

git_object_t ToGitType(const DataType type) {
    switch (type) {
        case DataType::Blob:
            return GIT_OBJECT_BLOB;
        case DataType::Tree:
            return GIT_OBJECT_TREE;
        case DataType::Commit:
            return GIT_OBJECT_COMMIT;
        case DataType::Tag:
            return GIT_OBJECT_TAG;
        case DataType::None:
            break;
    }
    throw std::invalid_argument("cannot hash object without a type");
}

} // namespace

HashId HashId::FromBytes(const void* data, const size_t len) {
    if (len != sizeof(data_)) {
        throw std::invalid_argument(fmt::format("invalid size of bytes '{}'", len));
    }

    HashId id;
    std::memcpy(id.data_, data, len);
    return id;
}

HashId HashId::FromBytes(const std::string_view data) {
    return FromBytes(data.data(), data.size());
}

HashId HashId::FromBytes(const unsigned char (&data)[20]) noexcept {
    HashId id;
    std::memcpy(id.data_, data, sizeof(data));
    return id;
}

HashId HashId::FromHex(const std::string_view hex) {
    if (hex.size() != 2 * sizeof(data_)) {
        throw std::invalid_argument(fmt::format("invalid size of hex string '{}'", hex.size()));
    }

    HashId id;
    for (size_t i = 0; i < sizeof(data_); ++i) {
        id.data_[i] = HexToByte(hex[2 * i]) << 4 | HexToByte(hex[2 * i + 1]);
    }
    return id;
}

bool HashId::IsBytes(const std::string_view data) noexcept {
    return data.size() == sizeof(data_);
}

bool HashId::IsHex(const std::string_view hex) noexcept {
    if (hex.size() != 2 * sizeof(data_)) {
        return false;
    }
    return IsHexPrefix(hex, hex.size());
}

bool HashId::IsHexPrefix(const std::string_view hex, const size_t min_length) noexcept {
    if (hex.size() < min_length || hex.size() > 2 * sizeof(data_) || hex.empty()) {
        return false;
    }
    for (const char ch : hex) {
        if (!IsHexDigit(ch)) {
            return false;
        }
    }
    return true;
}

HashId HashId::Make(const DataType type, const std::string_view content) {
    git_oid oid;

    InitializeLibrary();

    if (const int ret = ::git_odb_hash(&oid, content.data(), content.size(), ToGitType(type)); ret < 0) {
        throw std::runtime_error(fmt::format("cannot hash {} object: {}", DataTypeName(type), ret));
    }
    return FromBytes(oid.id, sizeof(data_));
}

bool HashId::HasPrefix(const std::string_view hex) const noexcept {
    if (hex.size() > 2 * sizeof(data_)) {
        return false;
    }

    char buf[2 * sizeof(data_)];
    BytesToHex(data_, buf);

    for (size_t i = 0; i < hex.size(); ++i) {
        const char ch = (hex[i] >= 'A' && hex[i] <= 'F') ? char(hex[i] - 'A' + 'a') : hex[i];
        if (buf[i] != ch) {
            return false;
        }
    }
    return true;
}

std::string HashId::ToHex() const {
    char hex[2 * sizeof(data_)];
    BytesToHex(data_, hex);
    return std::string(hex, sizeof(hex));
}

std::string HashId::ToShortHex(const size_t length) const {
    return ToHex().substr(0, std::clamp<size_t>(length, 4, 2 * sizeof(data_)));
}

std::string HashId::ToBytes() const {
    return std::string(reinterpret_cast<const char*>(data_), sizeof(data_));
}

std::ostream& operator<<(std::ostream& output, const HashId& id) {
    char hex[2 * sizeof(id.data_)];
    BytesToHex(id.data_, hex);
    output.write(hex, sizeof(hex));
    return output;
}

} // namespace Stg
