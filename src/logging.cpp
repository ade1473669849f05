#include "fsgate/logging.hpp"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <regex>
#include <vector>

namespace fsgate {

namespace {

constexpr const char* LOGGER_NAME = "fsgate";
constexpr const char* AUDIT_LOGGER_NAME = "fsgate.audit";

} // anonymous namespace

void init_logging(const std::string& level, const std::optional<std::string>& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (log_file) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(*log_file));
    }

    spdlog::drop(LOGGER_NAME);
    spdlog::drop(AUDIT_LOGGER_NAME);
    auto logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    auto audit = std::make_shared<spdlog::logger>(AUDIT_LOGGER_NAME, sinks.begin(), sinks.end());

    auto lvl = spdlog::level::from_str(level);
    if (std::getenv("FSGATE_DEBUG") != nullptr) lvl = spdlog::level::debug;
    logger->set_level(lvl);
    audit->set_level(lvl);
    logger->flush_on(spdlog::level::warn);
    audit->flush_on(spdlog::level::info);

    spdlog::register_logger(audit);
    spdlog::set_default_logger(logger);
}

AuditLog::AuditLog() {
    logger_ = spdlog::get(AUDIT_LOGGER_NAME);
    if (!logger_) logger_ = spdlog::default_logger();
}

std::string AuditLog::mask_secrets(std::string_view text) {
    static const std::regex secret(R"((password|token|api_key|secret)\s*=\s*[^\s&;]+)",
                                   std::regex::icase);
    // The regex only ever runs on the logged prefix
    std::string masked = std::regex_replace(std::string(text.substr(0, MAX_LOGGED_COMMAND)), secret, "$1=***");
    if (text.size() > MAX_LOGGED_COMMAND) masked += "...";
    return masked;
}

void AuditLog::file_operation(std::string_view op, std::string_view path, bool success,
                              std::string_view error) {
    if (success) {
        logger_->info("[AUDIT] file_operation op={} path={} status=SUCCESS", op, path);
    } else {
        logger_->warn("[AUDIT] file_operation op={} path={} status=FAILED error={}", op, path, error);
    }
}

void AuditLog::script_execution(std::string_view working_dir, std::string_view script, bool success,
                                std::chrono::milliseconds duration) {
    logger_->info("[AUDIT] script_execution dir={} length={} command={} status={} duration_ms={}",
                  working_dir, script.size(), mask_secrets(script),
                  success ? "SUCCESS" : "FAILED", duration.count());
}

void AuditLog::security_violation(std::string_view action, std::string_view target,
                                  std::string_view reason) {
    logger_->warn("[AUDIT] security_violation action={} target={} reason={}", action, target, reason);
}

} // namespace fsgate
