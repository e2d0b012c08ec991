#include "policy/path_guard.hpp"

#include <system_error>
#include <utility>

namespace gatehouse::policy {

using core::errors::ErrorCategory;
using core::errors::GatehouseError;

namespace {

PathRejection reject(const PathRejectionKind kind, const std::filesystem::path& path,
                     std::string detail) {
    return PathRejection{kind, path.string(), std::move(detail)};
}

constexpr int kMaxSymlinkHops = 40;

bool is_not_found(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

// Lexically normal absolute form without a trailing separator.
std::filesystem::path normalize(const std::filesystem::path& path) {
    std::filesystem::path normal = path.lexically_normal();
    if (normal.has_relative_path() && normal.filename().empty()) {
        normal = normal.parent_path();
    }
    return normal;
}

}  // namespace

std::string to_string(const PathRejectionKind kind) {
    switch (kind) {
        case PathRejectionKind::InvalidPath:
            return "InvalidPath";
        case PathRejectionKind::OutsideAllowedRoots:
            return "OutsideAllowedRoots";
        case PathRejectionKind::ParentMissing:
            return "ParentMissing";
        case PathRejectionKind::ParentOutsideAllowedRoots:
            return "ParentOutsideAllowedRoots";
        case PathRejectionKind::SymlinkEscapesRoot:
            return "SymlinkEscapesRoot";
        default:
            return "Unknown";
    }
}

std::string rejection_code(const PathRejectionKind kind) {
    switch (kind) {
        case PathRejectionKind::InvalidPath:
            return "invalid_path";
        case PathRejectionKind::OutsideAllowedRoots:
            return "outside_allowed_roots";
        case PathRejectionKind::ParentMissing:
            return "parent_missing";
        case PathRejectionKind::ParentOutsideAllowedRoots:
            return "parent_outside_allowed_roots";
        case PathRejectionKind::SymlinkEscapesRoot:
            return "symlink_escapes_root";
        default:
            return "unknown_path_rejection";
    }
}

GatehouseError to_error(const PathRejection& rejection) {
    std::string message = "Access denied (" + to_string(rejection.kind) + ")";
    if (!rejection.detail.empty()) {
        message += ": " + rejection.detail;
    }
    if (!rejection.path.empty()) {
        message += ": " + rejection.path;
    }

    std::string hint;
    if (rejection.kind == PathRejectionKind::OutsideAllowedRoots ||
        rejection.kind == PathRejectionKind::ParentOutsideAllowedRoots) {
        hint = "Add the directory to filesystem.allowed_dir to permit access.";
    }
    return GatehouseError{ErrorCategory::Policy, std::move(message),
                          rejection_code(rejection.kind), std::move(hint)};
}

PathGuard::PathGuard(AllowedRoots roots) : roots_(std::move(roots)) {}

PathDecision PathGuard::validate(const std::string& requested_path) const {
    if (requested_path.empty()) {
        return reject(PathRejectionKind::InvalidPath, "", "path is empty");
    }
    if (requested_path.find('\0') != std::string::npos) {
        return reject(PathRejectionKind::InvalidPath, "", "path contains a NUL byte");
    }

    // 1. Absolute, lexically normal form against the process working directory.
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(requested_path, ec);
    if (ec) {
        return reject(PathRejectionKind::InvalidPath, requested_path,
                      "cannot resolve against working directory");
    }
    absolute = normalize(absolute);

    // 2. Membership before touching the filesystem.
    if (!roots_.contains(absolute)) {
        return reject(PathRejectionKind::OutsideAllowedRoots, absolute,
                      "path outside allowed directories");
    }

    // 3. Resolve symbolic links and re-check where the path really lands.
    std::filesystem::path real = std::filesystem::canonical(absolute, ec);
    if (ec) {
        if (is_not_found(ec)) {
            return resolve_missing_target(absolute);
        }
        if (ec == std::errc::not_a_directory) {
            return reject(PathRejectionKind::ParentMissing, absolute,
                          "a parent component is not a directory");
        }
        if (ec == std::errc::too_many_symbolic_link_levels) {
            return reject(PathRejectionKind::SymlinkEscapesRoot, absolute,
                          "symlink loop");
        }
        return reject(PathRejectionKind::InvalidPath, absolute, ec.message());
    }

    if (!roots_.contains(real)) {
        return reject(PathRejectionKind::SymlinkEscapesRoot, absolute,
                      "symlink target outside allowed directories");
    }

    // 4. Callers use this, never the original input.
    return real;
}

PathDecision PathGuard::resolve_missing_target(
    const std::filesystem::path& absolute) const {
    std::error_code ec;

    // A dangling link as the final component would redirect a later create
    // outside the roots. Follow the chain by hand; weakly_canonical stops at
    // the first component that does not exist, which is the link itself.
    std::filesystem::path target = absolute;
    for (int hops = 0;; ++hops) {
        const auto link_status = std::filesystem::symlink_status(target, ec);
        if (ec || !std::filesystem::is_symlink(link_status)) {
            break;
        }
        if (hops == kMaxSymlinkHops) {
            return reject(PathRejectionKind::SymlinkEscapesRoot, absolute, "symlink loop");
        }
        std::filesystem::path next = std::filesystem::read_symlink(target, ec);
        if (ec) {
            return reject(PathRejectionKind::InvalidPath, absolute, ec.message());
        }
        if (next.is_relative()) {
            next = target.parent_path() / next;
        }
        target = normalize(std::filesystem::weakly_canonical(next, ec));
        if (ec) {
            return reject(PathRejectionKind::InvalidPath, absolute, ec.message());
        }
        if (!roots_.contains(target)) {
            return reject(PathRejectionKind::SymlinkEscapesRoot, absolute,
                          "dangling symlink target outside allowed directories");
        }
    }

    const std::filesystem::path parent = target.parent_path();

    // Membership first, judged on the deepest existing ancestor, so the
    // answer for a parent reached through a link never depends on what
    // exists outside the roots.
    const std::filesystem::path reachable =
        normalize(std::filesystem::weakly_canonical(parent, ec));
    if (ec) {
        return reject(PathRejectionKind::ParentMissing, parent, ec.message());
    }
    if (!roots_.contains(reachable)) {
        return reject(PathRejectionKind::ParentOutsideAllowedRoots, absolute,
                      "parent directory outside allowed directories");
    }

    const std::filesystem::path real_parent = std::filesystem::canonical(parent, ec);
    if (ec) {
        return reject(PathRejectionKind::ParentMissing, parent,
                      "parent directory does not exist");
    }

    if (!std::filesystem::is_directory(real_parent, ec) || ec) {
        return reject(PathRejectionKind::ParentMissing, parent,
                      "parent is not a directory");
    }

    if (!roots_.contains(real_parent)) {
        return reject(PathRejectionKind::ParentOutsideAllowedRoots, absolute,
                      "parent directory outside allowed directories");
    }

    return real_parent / target.filename();
}

}  // namespace gatehouse::policy
