#include "errors.hpp"

#include <utility>

namespace zappac {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Lexical:
        return "lexical";
    case ErrorKind::Syntax:
        return "syntax";
    case ErrorKind::UnexpectedEnd:
        return "unexpected-end";
    case ErrorKind::UnknownVariable:
        return "unknown-variable";
    case ErrorKind::InvalidNumber:
        return "invalid-number";
    case ErrorKind::Internal:
        return "internal";
    }
    return "internal";
}

CalcError::CalcError(ErrorKind kind, const std::string& message, std::string text, std::size_t position)
    : std::runtime_error(message), errorKind(kind), offendingText(std::move(text)), offset(position) {}

} // namespace zappac
