#include "Errors.h"

namespace Parley {

    const char* ErrorCode(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::AuthRequired: return "session_required";
        case ErrorKind::AuthInvalid:  return "session_invalid";
        case ErrorKind::NotFound:     return "not_found";
        case ErrorKind::Forbidden:    return "forbidden";
        case ErrorKind::Conflict:     return "conflict";
        case ErrorKind::Malformed:    return "malformed";
        case ErrorKind::Transient:
        case ErrorKind::None:
            break;
        }
        return nullptr;
    }

    ErrorKind ErrorKindFromCode(const std::string& code) {
        if (code == "session_required") return ErrorKind::AuthRequired;
        if (code == "session_invalid")  return ErrorKind::AuthInvalid;
        if (code == "not_found")        return ErrorKind::NotFound;
        if (code == "forbidden")        return ErrorKind::Forbidden;
        if (code == "conflict")         return ErrorKind::Conflict;
        if (code == "malformed")        return ErrorKind::Malformed;
        return ErrorKind::None;
    }

    const char* ErrorKindName(ErrorKind kind) {
        switch (kind) {
        case ErrorKind::None:         return "none";
        case ErrorKind::AuthRequired: return "auth_required";
        case ErrorKind::AuthInvalid:  return "auth_invalid";
        case ErrorKind::NotFound:     return "not_found";
        case ErrorKind::Forbidden:    return "forbidden";
        case ErrorKind::Conflict:     return "conflict";
        case ErrorKind::Transient:    return "transient";
        case ErrorKind::Malformed:    return "malformed";
        }
        return "unknown";
    }

} // namespace Parley
