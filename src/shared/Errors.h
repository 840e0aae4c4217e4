#pragma once
#include <string>
#include <utility>

namespace Parley {

    enum class ErrorKind {
        None,
        AuthRequired,   // no token supplied
        AuthInvalid,    // unknown or expired token
        NotFound,
        Forbidden,
        Conflict,
        Transient,      // timeout, refused connection, unreadable response
        Malformed
    };

    struct OpResult {
        ErrorKind   kind = ErrorKind::None;
        std::string message;

        bool Ok() const { return kind == ErrorKind::None; }
        explicit operator bool() const { return Ok(); }

        static OpResult Success() { return {}; }
        static OpResult Fail(ErrorKind k, std::string msg) { return { k, std::move(msg) }; }
    };

    // Wire value of the response "code" field; nullptr for kinds that carry none.
    const char* ErrorCode(ErrorKind kind);
    ErrorKind ErrorKindFromCode(const std::string& code);
    const char* ErrorKindName(ErrorKind kind);

} // namespace Parley
