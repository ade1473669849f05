#pragma once
#include <chrono>
#include <optional>
#include <memory>
#include <string>
#include <string_view>
#include <spdlog/spdlog.h>

namespace fsgate {

/// Install the stderr logger named "fsgate" as the spdlog default, plus an
/// optional file sink. FSGATE_DEBUG in the environment forces debug level.
/// stdout is never written to.
void init_logging(const std::string& level, const std::optional<std::string>& log_file = std::nullopt);

/// Records [AUDIT] lines on the "fsgate.audit" logger, which shares the sinks
/// of the default logger.
class AuditLog {
public:
    AuditLog();

    void file_operation(std::string_view op, std::string_view path, bool success,
                        std::string_view error = {});
    void script_execution(std::string_view working_dir, std::string_view script, bool success,
                          std::chrono::milliseconds duration);
    void security_violation(std::string_view action, std::string_view target, std::string_view reason);

    /// Mask password=, token=, api_key= and secret= values and cap the length.
    [[nodiscard]] static std::string mask_secrets(std::string_view text);

    static constexpr std::size_t MAX_LOGGED_COMMAND = 100;

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace fsgate
