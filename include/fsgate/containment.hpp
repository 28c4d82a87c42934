#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fsgate {

// ============================================================================
// Containment Checker
// ============================================================================

// A candidate is contained iff it equals the root exactly, or starts with
// root + '/'. Both arguments must already be absolute and normalized; a
// trailing separator on the root is ignored. "/" contains every absolute path.
//
// Substring containment is wrong here: "/allowed-evil" is not inside
// "/allowed".
bool is_contained(const std::string& candidate, const std::string& root);

// First-match over a root set. Order-independent in outcome.
bool is_contained(const std::string& candidate, const std::vector<std::string>& roots);

// Index of the first root containing candidate.
std::optional<std::size_t> find_containing_root(const std::string& candidate,
                                                const std::vector<std::string>& roots);

// Strip trailing separators (keeping "/") and drop duplicates, preserving order.
std::vector<std::string> dedupe_roots(const std::vector<std::string>& roots);

} // namespace fsgate
