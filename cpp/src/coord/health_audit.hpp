#pragma once
/**
 * @file health_audit.hpp
 * @brief Context-document and data-directory health checks.
 *
 * The quick audit checks every context document (missing, or longer than the
 * configured line limit). The full audit also checks the key directories and
 * that the message log parses. The score is
 * `max(0, 100 - 20 * critical - 5 * warnings)`.
 */

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "context_registry.hpp"

namespace ctxhub::coord
{

enum class Severity
{
    Critical,
    Warning,
    Info
};

const char *to_string(Severity s) noexcept;

struct AuditIssue
{
    Severity severity{Severity::Info};
    std::string component;
    std::string message;
};

struct HealthReport
{
    int score{100};
    size_t critical{0};
    size_t warnings{0};
    bool quick{true};
    std::string timestamp;
    std::vector<AuditIssue> issues;

    nlohmann::json to_json() const;
    /// "Health Score: 85% | Critical: 0 | Warnings: 3"
    std::string summary() const;
};

struct AuditPaths
{
    std::filesystem::path project_root;
    std::filesystem::path data_dir;
    std::filesystem::path message_log;
};

class HealthAuditor
{
  public:
    HealthAuditor(const ContextRegistry &registry, AuditPaths paths, size_t max_context_lines);

    HealthReport run(bool quick) const;

    static int score(size_t critical, size_t warnings) noexcept;

  private:
    void check_context_files(std::vector<AuditIssue> &issues) const;
    void check_directories(std::vector<AuditIssue> &issues) const;
    void check_message_log(std::vector<AuditIssue> &issues) const;

    const ContextRegistry &m_registry;
    AuditPaths m_paths;
    size_t m_max_context_lines;
};

} // namespace ctxhub::coord
