#pragma once

#include "fsgate/deny_list.hpp"
#include "fsgate/errors.hpp"
#include "fsgate/limits.hpp"
#include "fsgate/resolver.hpp"
#include "fsgate/security_mode.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fsgate {

class AllowListStore;
struct Config;

// ============================================================================
// Validation Pipeline
// ============================================================================

struct ValidateOptions {
    bool require_exists = false;
    bool check_write = false;
    bool resolve_symlinks = true;
};

struct BaseOptions {
    std::string base_path;                          // relative inputs resolve here
    std::optional<std::vector<std::string>> roots;  // nullopt: no containment layer
    const DenyList* deny_list = nullptr;
    ValidateOptions validate;
    SecurityLimits limits;
};

// The common pipeline. Layers run in this order and each one fails closed:
//   1. type check            (empty, whitespace, NUL)            -> Validation
//   2. normalize / expand / resolve to absolute
//   3. character, length and reserved-name checks                -> Validation
//   4. real-path resolution  (symlinks, nearest existing ancestor)
//   5. containment against roots                                 -> AccessDenied
//   6. deny-list exclusion                                       -> AccessDenied
//   7. existence / permission probe                              -> AccessDenied
// No filesystem probe happens before the path is proven contained, except
// the metadata reads of layer 4 which decide what "contained" means.
Result<std::string> validate_path_base(const std::string& input, const BaseOptions& options);

// Layer 7 on its own. Missing paths pass when require_exists is false and the
// nearest existing ancestor grants the needed access.
bool check_access(const std::string& real_path, const ValidateOptions& options,
                  std::string& reason);

// True for CON, PRN, AUX, NUL, COM1-9, LPT1-9 (case-insensitive), compared
// against the part of the basename before its first '.'.
bool is_reserved_device_name(const std::string& basename);

// ============================================================================
// Mode Validator
// ============================================================================

struct SecurityPolicy {
    SecurityMode mode = SecurityMode::Strict;
    std::string cwd;                                 // strict root, relative base
    const AllowListStore* allow_list = nullptr;      // sandboxed
    std::optional<std::vector<std::string>> allowed_override;  // replaces the store's roots
    DenyList deny_list;                              // unrestricted
    SecurityLimits limits;
    bool audit = false;
};

class PathValidator {
public:
    explicit PathValidator(SecurityPolicy policy);

    SecurityMode mode() const { return policy_.mode; }
    const std::string& cwd() const { return policy_.cwd; }
    const SecurityPolicy& policy() const { return policy_; }

    // Proven-safe real path, or a typed failure.
    Result<std::string> validate(const std::string& path, const ValidateOptions& options = {}) const;

    bool is_path_allowed(const std::string& path) const;

    // nullopt when the path validates
    std::optional<Error> validation_error(const std::string& path) const;

    // Lexical pre-check only: the candidate is never looked up on disk and
    // symlinks are not resolved. Not a substitute for validate().
    bool quick_check(const std::string& path) const;

    // Validate, then open the real path without following a leaf symlink.
    OpenResult open_validated(const std::string& path, OpenMode mode) const;

    // Strict: {cwd}. Sandboxed: normalized allow-list (or the override), a
    // Validation error when empty. Unrestricted: {"/"}.
    Result<std::vector<std::string>> root_set() const;

private:
    SecurityPolicy policy_;
};

// Policy for config.security.mode with effective limits and the configured
// deny-list. store must outlive the validator.
std::unique_ptr<PathValidator> make_validator(const Config& config,
                                              const AllowListStore& store,
                                              const std::string& cwd);

} // namespace fsgate
