#pragma once

#include "fsgate/allow_list.hpp"
#include "fsgate/config.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace fsgate {

// ============================================================================
// Security Status
// ============================================================================

// "1.5 MB", "100 MB", "512 B"
std::string format_bytes(std::uint64_t bytes);

nlohmann::json security_status(const Config& config, const AllowListStore& store,
                               const std::string& cwd);

std::string status_report(const nlohmann::json& status);

} // namespace fsgate
