#pragma once
#include "config.hpp"
#include "logging.hpp"
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fsgate {

struct ScriptResult {
    bool success = false;
    std::vector<std::string> output;
    std::optional<std::string> error;
    int exit_code = -1;
    std::string working_dir;
    std::int64_t duration_ms = 0;
};

void to_json(nlohmann::json& j, const ScriptResult& r);

/// Runs a script on behalf of the executeScript tool. The dispatcher only
/// sees this interface.
class IScriptExecutor {
public:
    virtual ~IScriptExecutor() = default;

    [[nodiscard]] virtual bool enabled() const = 0;

    /// Rejected or failing scripts are reported in the result, not thrown.
    virtual ScriptResult execute(const std::string& script, const std::string& working_dir) = 0;
};

/// Runs each command line of a script through /bin/sh -c in the working
/// directory. A line must match no blocked pattern and at least one allowed
/// pattern; execution stops at the first rejected, failing or timed-out line.
class ProcessScriptExecutor : public IScriptExecutor {
public:
    static constexpr std::size_t MAX_SCRIPT_LENGTH = 100000;
    static constexpr std::size_t MAX_COMMAND_LENGTH = 4096;
    static constexpr std::size_t MAX_OUTPUT_BYTES = 1024 * 1024;   // per command; the rest is drained

    explicit ProcessScriptExecutor(const ScriptConfig& config);

    [[nodiscard]] bool enabled() const override { return config_.enabled; }

    ScriptResult execute(const std::string& script, const std::string& working_dir) override;

    /// Returns the reason a script is rejected as a whole, if any.
    [[nodiscard]] std::optional<std::string> validate(const std::string& script) const;

    /// Commands longer than MAX_COMMAND_LENGTH are never allowed.
    [[nodiscard]] bool is_command_allowed(const std::string& command) const;

    /// Trimmed command lines with blanks and # comments removed.
    [[nodiscard]] static std::vector<std::string> command_lines(const std::string& script);

private:
    struct CommandOutcome {
        int exit_code = -1;
        bool timed_out = false;
        bool output_truncated = false;
        std::string output;
    };

    CommandOutcome run_command(const std::string& command, const std::string& working_dir) const;

    ScriptConfig config_;
    std::vector<std::regex> allowed_;
    std::vector<std::regex> blocked_;
    AuditLog audit_;
};

} // namespace fsgate
