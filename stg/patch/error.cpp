#include "error.h"

namespace Stg {

std::string_view ErrorKindName(const ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::InvalidPatchName:
            return "invalid patch name";
        case ErrorKind::MalformedSyntax:
            return "malformed syntax";
        case ErrorKind::UnknownPatch:
            return "unknown patch";
        case ErrorKind::InvalidOffset:
            return "invalid offset";
        case ErrorKind::OutOfRangeIndex:
            return "index out of range";
        case ErrorKind::ConstraintViolation:
            return "constraint violation";
        case ErrorKind::InvertedRange:
            return "inverted range";
        case ErrorKind::UnknownBranch:
            return "unknown branch";
        case ErrorKind::UnknownCommit:
            return "unknown commit";
        case ErrorKind::AmbiguousCommitPrefix:
            return "ambiguous commit prefix";
    }
    return "unknown error";
}

Error::Error(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , kind_(kind) {
}

} // namespace Stg
