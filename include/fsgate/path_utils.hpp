#pragma once

#include <string>
#include <unordered_map>

namespace fsgate {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

const char* path_error_to_string(PathError error);

struct PathResult {
    bool ok = false;
    std::string path;  // normalized absolute path when ok
    PathError error = PathError::None;
};

// ============================================================================
// Path Normalizer
// ============================================================================

// Expand a leading "~" or "~/" to the home directory. Other uses of '~'
// (e.g. "~user", "a/~") are left untouched.
std::string expand_home(const std::string& input);

// Expand $VAR, ${VAR} and %VAR% tokens. Undefined variables are replaced by
// the empty string, so a failed substitution cannot be detected afterwards.
std::string expand_env_vars(const std::string& input,
                            const std::unordered_map<std::string, std::string>& env);

// Collapse "." / ".." segments and redundant separators of an absolute path.
// ".." at the root stays at the root. Result has no trailing separator
// except for the root itself.
std::string collapse_absolute(const std::string& absolute_path);

// Full normalization, in fixed order:
//   1. reject empty / whitespace-only / NUL-containing input
//   2. expand leading ~
//   3. expand environment variables from the process environment
//   4. collapse "." / ".." and redundant separators
//   5. resolve to an absolute path against base (default: current directory)
// Never touches the filesystem.
PathResult normalize_path(const std::string& input, const std::string& base = "");

// Same, with an explicit environment (for the allow-list store and tests).
PathResult normalize_path(const std::string& input,
                          const std::string& base,
                          const std::unordered_map<std::string, std::string>& env);

// Normalize a path relative to a root without following symlinks (string-based).
// - Rejects NUL bytes
// - Rejects an absolute relative_path
// - Collapses "." and ".." segments
// - Fails if resulting path would escape root
PathResult normalize_under_root(const std::string& root, const std::string& relative_path);

} // namespace fsgate
