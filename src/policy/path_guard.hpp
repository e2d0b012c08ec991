#pragma once

#include <filesystem>
#include <string>
#include "core/errors/gatehouse_errors.hpp"
#include "policy/allowlist_store.hpp"

namespace gatehouse::policy {

enum class PathRejectionKind {
    InvalidPath,
    OutsideAllowedRoots,
    ParentMissing,
    ParentOutsideAllowedRoots,
    SymlinkEscapesRoot
};

struct PathRejection {
    PathRejectionKind kind;
    // The rejected path as the guard saw it (absolute where resolvable).
    std::string path;
    std::string detail;
};

using PathDecision = core::errors::Result<std::filesystem::path, PathRejection>;

std::string to_string(PathRejectionKind kind);

// Stable snake_case code, e.g. "outside_allowed_roots".
std::string rejection_code(PathRejectionKind kind);

// Translates a rejection into the error shape tool handlers return.
core::errors::GatehouseError to_error(const PathRejection& rejection);

// Decides whether a caller-supplied path may be touched. The approved value
// is the canonical path; callers must use it instead of their input.
class PathGuard {
public:
    explicit PathGuard(AllowedRoots roots);

    PathDecision validate(const std::string& requested_path) const;

    const AllowedRoots& roots() const { return roots_; }

private:
    PathDecision resolve_missing_target(const std::filesystem::path& absolute) const;

    AllowedRoots roots_;
};

}  // namespace gatehouse::policy
