#include "chanvault/transport/transport.hpp"

namespace chanvault::transport {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None: return "none";
        case ErrorKind::FloodWait: return "flood_wait";
        case ErrorKind::Disconnected: return "disconnected";
        case ErrorKind::Transient: return "transient";
        case ErrorKind::Auth: return "auth";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Fatal: return "fatal";
    }
    return "unknown";
}

std::string identity_label(const Identity& identity) {
    if (const auto* user = std::get_if<UserIdentity>(&identity)) {
        return std::to_string(user->user_id);
    }
    const auto& token = std::get<DelegatedIdentity>(identity).token;
    return token.substr(0, token.find(':'));
}

}  // namespace chanvault::transport
