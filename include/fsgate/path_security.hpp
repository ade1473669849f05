#pragma once
#include "config.hpp"
#include "logging.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fsgate {

/// Decides whether a normalized path may reach a filesystem primitive.
/// A path is allowed when its canonical form (symlinks resolved, missing
/// tail components kept lexically) is one of the allowed directories or lies
/// below one of them segment by segment, it is not itself a symbolic link
/// while symlinks are disallowed, and no segment is a reserved device name.
class PathSecurityPolicy {
public:
    explicit PathSecurityPolicy(const ServerConfig& config);

    [[nodiscard]] bool is_allowed(const std::string& normalized_path) const;

    /// Throws SecurityError naming the path when it is not allowed.
    void check(const std::string& normalized_path, std::string_view action) const;

    /// Throws SecurityError unless writes are enabled.
    void require_write(std::string_view action, const std::string& normalized_path) const;

    /// CON, PRN, AUX, NUL, COM1-9, LPT1-9, any case, bare or with an extension.
    [[nodiscard]] static bool is_reserved_name(std::string_view name);

    /// Segment-wise descendant test; "/a-2" is not inside "/a".
    [[nodiscard]] static bool is_within(const std::filesystem::path& path,
                                        const std::filesystem::path& root);

    [[nodiscard]] const std::vector<std::string>& allowed_directories() const {
        return config_.allowed_directories;
    }
    [[nodiscard]] bool symlinks_allowed() const { return config_.symlinks_allowed; }
    [[nodiscard]] bool write_enabled() const { return config_.write_enabled; }

private:
    const ServerConfig& config_;
    std::vector<std::filesystem::path> roots_;
    mutable AuditLog audit_;
};

} // namespace fsgate
