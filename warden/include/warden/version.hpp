#pragma once

#define WARDEN_VERSION "1.3.0"
#define WARDEN_PROTOCOL_VERSION_MAJOR 1
#define WARDEN_PROTOCOL_VERSION_MINOR 2

namespace warden {
namespace version {

// JSON-RPC tool protocol revision announced in initialize
inline const char* const PROTOCOL_STRING = "2024-11-05";

inline bool protocol_compatible(int major, int minor) {
    // Major must match exactly; the server must be at least the client's minor
    return major == WARDEN_PROTOCOL_VERSION_MAJOR &&
           minor <= WARDEN_PROTOCOL_VERSION_MINOR;
}

} // namespace version
} // namespace warden
