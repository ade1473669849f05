#include "fsgate/script_executor.hpp"
#include "fsgate/error.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <sstream>
#include <string_view>
#include <thread>

namespace fsgate {

namespace {

constexpr std::array<std::string_view, 9> DANGEROUS_PATHS = {
    "/etc/passwd", "/etc/shadow", "/etc/sudoers",
    "C:\\Windows\\System32", "C:\\Windows\\SysWOW64",
    "/bin/", "/sbin/", "/usr/bin/", "/usr/sbin/"};

std::string trim(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r");
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(" \t\r");
    return s.substr(first, last - first + 1);
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
    }
    return lines;
}

std::vector<std::regex> compile_all(const std::vector<std::string>& patterns) {
    std::vector<std::regex> out;
    out.reserve(patterns.size());
    for (const auto& p : patterns) out.emplace_back(p, std::regex::ECMAScript);
    return out;
}

InternalError os_error(const char* what) {
    return InternalError(std::string(what) + ": " + std::strerror(errno));
}

void kill_group(pid_t pid) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
}

} // anonymous namespace

void to_json(nlohmann::json& j, const ScriptResult& r) {
    j = nlohmann::json{
        {"success", r.success},
        {"output", r.output},
        {"exitCode", r.exit_code},
        {"workingDir", r.working_dir},
        {"durationMs", r.duration_ms}
    };
    if (r.error) j["error"] = *r.error;
}

ProcessScriptExecutor::ProcessScriptExecutor(const ScriptConfig& config)
    : config_(config),
      allowed_(compile_all(config.allowed_patterns)),
      blocked_(compile_all(config.blocked_patterns)) {}

std::vector<std::string> ProcessScriptExecutor::command_lines(const std::string& script) {
    std::vector<std::string> commands;
    for (const auto& raw : split_lines(script)) {
        std::string line = trim(raw);
        if (line.empty() || line.front() == '#') continue;
        commands.push_back(std::move(line));
    }
    return commands;
}

std::optional<std::string> ProcessScriptExecutor::validate(const std::string& script) const {
    if (script.size() > MAX_SCRIPT_LENGTH) {
        return "Script too large: " + std::to_string(script.size()) + " bytes (max: "
               + std::to_string(MAX_SCRIPT_LENGTH) + ")";
    }
    auto commands = command_lines(script);
    if (commands.empty()) return std::string("Script is empty");
    for (const auto& command : commands) {
        if (command.size() > MAX_COMMAND_LENGTH) {
            return "Command line too long: " + std::to_string(command.size()) + " bytes (max: "
                   + std::to_string(MAX_COMMAND_LENGTH) + ")";
        }
    }
    for (auto path : DANGEROUS_PATHS) {
        if (script.find(path) != std::string::npos) {
            return "Access to system path not allowed: " + std::string(path);
        }
    }
    return std::nullopt;
}

bool ProcessScriptExecutor::is_command_allowed(const std::string& command) const {
    if (command.size() > MAX_COMMAND_LENGTH) return false;
    for (const auto& re : blocked_) {
        if (std::regex_match(command, re)) return false;
    }
    for (const auto& re : allowed_) {
        if (std::regex_match(command, re)) return true;
    }
    return false;
}

ProcessScriptExecutor::CommandOutcome ProcessScriptExecutor::run_command(const std::string& command,
                                                                         const std::string& working_dir) const {
    int fds[2];
    if (::pipe(fds) != 0) throw os_error("pipe");

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        throw os_error("fork");
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        if (::chdir(working_dir.c_str()) != 0) ::_exit(126);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }

    ::close(fds[1]);
    CommandOutcome outcome;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config_.timeout_seconds);
    char buf[4096];

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            outcome.timed_out = true;
            break;
        }
        struct pollfd pfd = {fds[0], POLLIN, 0};
        int ret = ::poll(&pfd, 1, static_cast<int>(remaining));
        if (ret < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ret == 0) continue;

        ssize_t n = ::read(fds[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        std::size_t room = MAX_OUTPUT_BYTES - outcome.output.size();
        std::size_t take = std::min(room, static_cast<std::size_t>(n));
        outcome.output.append(buf, take);
        if (take < static_cast<std::size_t>(n)) outcome.output_truncated = true;
    }
    ::close(fds[0]);

    if (outcome.timed_out) kill_group(pid);

    // The deadline covers the process, not just its output
    int status = 0;
    while (true) {
        pid_t done = ::waitpid(pid, &status, outcome.timed_out ? 0 : WNOHANG);
        if (done == pid) break;
        if (done < 0) {
            if (errno == EINTR) continue;
            throw os_error("waitpid");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            outcome.timed_out = true;
            kill_group(pid);
            continue;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    if (WIFEXITED(status)) {
        outcome.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        outcome.exit_code = 128 + WTERMSIG(status);
    }
    return outcome;
}

ScriptResult ProcessScriptExecutor::execute(const std::string& script, const std::string& working_dir) {
    auto start = std::chrono::steady_clock::now();
    ScriptResult result;
    result.working_dir = working_dir;

    auto finish = [&]() {
        result.success = !result.error.has_value();
        result.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        audit_.script_execution(working_dir, script, result.success,
                                std::chrono::milliseconds(result.duration_ms));
        return result;
    };

    if (!config_.enabled) {
        throw SecurityError("Script execution is disabled on this server");
    }
    if (auto reason = validate(script)) {
        spdlog::warn("Script rejected: {}", *reason);
        result.error = *reason;
        return finish();
    }

    result.exit_code = 0;
    for (const auto& command : command_lines(script)) {
        if (!is_command_allowed(command)) {
            spdlog::warn("Command not whitelisted: {}", AuditLog::mask_secrets(command));
            result.error = "Command not allowed: " + command;
            result.exit_code = -1;
            break;
        }

        spdlog::debug("Running command in {}: {}", working_dir, AuditLog::mask_secrets(command));
        CommandOutcome outcome = run_command(command, working_dir);
        for (auto& line : split_lines(outcome.output)) result.output.push_back(std::move(line));
        if (outcome.output_truncated) {
            result.output.push_back("... (output truncated at " + std::to_string(MAX_OUTPUT_BYTES) + " bytes)");
        }

        if (outcome.timed_out) {
            result.error = "Command timed out after " + std::to_string(config_.timeout_seconds)
                           + " seconds: " + command;
            result.exit_code = -1;
            break;
        }
        result.exit_code = outcome.exit_code;
        if (outcome.exit_code != 0) {
            result.error = "Command failed with exit code " + std::to_string(outcome.exit_code) + ": " + command;
            break;
        }
    }
    return finish();
}

} // namespace fsgate
