#include "auth/auth_error.h"

namespace Nepse::Auth {

auto authErrcName(AuthErrc code) noexcept -> const char* {
    switch (code) {
        case AuthErrc::OK:             return "OK";
        case AuthErrc::MODULE_LOAD:    return "MODULE_LOAD";
        case AuthErrc::EXPORT_MISSING: return "EXPORT_MISSING";
        case AuthErrc::CALL:           return "CALL";
        case AuthErrc::DERIVATION:     return "DERIVATION";
        case AuthErrc::FETCH:          return "FETCH";
        case AuthErrc::EMPTY_TOKEN:    return "EMPTY_TOKEN";
        case AuthErrc::CANCELLED:      return "CANCELLED";
    }
    return "UNKNOWN";
}

auto AuthStatus::toString() const -> std::string {
    std::string out = authErrcName(code);
    if (cause != AuthErrc::OK) {
        out += '(';
        out += authErrcName(cause);
        out += ')';
    }
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace Nepse::Auth
