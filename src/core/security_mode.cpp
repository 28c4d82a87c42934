#include "fsgate/security_mode.hpp"

#include <algorithm>
#include <cctype>

namespace fsgate {

const char* security_mode_to_string(SecurityMode mode) {
    switch (mode) {
        case SecurityMode::Strict: return "strict";
        case SecurityMode::Sandboxed: return "sandboxed";
        case SecurityMode::Unrestricted: return "unrestricted";
    }
    return "strict";
}

std::optional<SecurityMode> parse_security_mode(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "strict") return SecurityMode::Strict;
    if (lower == "sandboxed") return SecurityMode::Sandboxed;
    if (lower == "unrestricted") return SecurityMode::Unrestricted;
    return std::nullopt;
}

ModeInfo mode_info(SecurityMode mode) {
    switch (mode) {
        case SecurityMode::Strict:
            return {"STRICT", "Access limited to the current working directory only", "Low"};
        case SecurityMode::Sandboxed:
            return {"SANDBOXED", "Access limited to pre-approved directories", "Medium"};
        case SecurityMode::Unrestricted:
            return {"UNRESTRICTED",
                    "Full filesystem access except protected system directories", "High"};
    }
    return {"STRICT", "Access limited to the current working directory only", "Low"};
}

} // namespace fsgate
