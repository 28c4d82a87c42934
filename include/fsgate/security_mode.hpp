#pragma once

#include <optional>
#include <string>

namespace fsgate {

// ============================================================================
// Security Mode
// ============================================================================

// Fixed for the lifetime of a process; selected at startup from
// security.mode in the configuration document.
enum class SecurityMode {
    Strict,        // current working directory only
    Sandboxed,     // allow-list of directories
    Unrestricted,  // whole filesystem minus the system deny-list
};

const char* security_mode_to_string(SecurityMode mode);

// Case-insensitive. Returns nullopt for unknown modes.
std::optional<SecurityMode> parse_security_mode(const std::string& s);

struct ModeInfo {
    std::string name;         // "STRICT"
    std::string description;
    std::string risk_level;   // "Low" | "Medium" | "High"
};

ModeInfo mode_info(SecurityMode mode);

} // namespace fsgate
