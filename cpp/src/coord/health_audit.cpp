/**
 * @file health_audit.cpp
 * @brief HealthAuditor checks and report formatting.
 */
#include "health_audit.hpp"

#include "ctxhub_service.hpp"
#include "utils/json_store.hpp"

#include <algorithm>
#include <fstream>

namespace ctxhub::coord
{
namespace fs = std::filesystem;

const char *to_string(Severity s) noexcept
{
    switch (s)
    {
    case Severity::Critical:
        return "critical";
    case Severity::Warning:
        return "warning";
    case Severity::Info:
        return "info";
    }
    return "info";
}

nlohmann::json HealthReport::to_json() const
{
    nlohmann::json issues_json = nlohmann::json::array();
    for (const auto &i : issues)
    {
        issues_json.push_back(
            {{"severity", to_string(i.severity)}, {"component", i.component}, {"message", i.message}});
    }
    return {{"health_score", score},
            {"critical", critical},
            {"warnings", warnings},
            {"quick", quick},
            {"timestamp", timestamp},
            {"summary", summary()},
            {"issues", std::move(issues_json)}};
}

std::string HealthReport::summary() const
{
    return fmt::format("Health Score: {}% | Critical: {} | Warnings: {}", score, critical,
                       warnings);
}

HealthAuditor::HealthAuditor(const ContextRegistry &registry, AuditPaths paths,
                             size_t max_context_lines)
    : m_registry(registry), m_paths(std::move(paths)), m_max_context_lines(max_context_lines)
{
}

int HealthAuditor::score(size_t critical, size_t warnings) noexcept
{
    const long long raw = 100LL - 20LL * static_cast<long long>(critical) -
                          5LL * static_cast<long long>(warnings);
    return static_cast<int>(std::max(0LL, raw));
}

HealthReport HealthAuditor::run(bool quick) const
{
    HealthReport report;
    report.quick = quick;
    report.timestamp = format_tools::iso_timestamp(std::chrono::system_clock::now());

    check_context_files(report.issues);
    if (!quick)
    {
        check_directories(report.issues);
        check_message_log(report.issues);
    }

    for (const auto &i : report.issues)
    {
        if (i.severity == Severity::Critical)
            ++report.critical;
        else if (i.severity == Severity::Warning)
            ++report.warnings;
    }
    report.score = score(report.critical, report.warnings);
    LOGGER_INFO("[audit] {} audit: {}", quick ? "quick" : "full", report.summary());
    return report;
}

void HealthAuditor::check_context_files(std::vector<AuditIssue> &issues) const
{
    for (const auto &ci : m_registry.contexts())
    {
        const fs::path file = m_registry.context_file(m_paths.project_root, ci.id);
        std::ifstream in(file);
        if (!in.is_open())
        {
            issues.push_back({Severity::Warning, ci.id,
                              fmt::format("context file missing: {}", file.string())});
            continue;
        }
        size_t lines = 0;
        std::string line;
        while (std::getline(in, line))
            ++lines;
        if (lines > m_max_context_lines)
        {
            issues.push_back({Severity::Critical, ci.id,
                              fmt::format("{} has {} lines (limit {})", file.filename().string(),
                                          lines, m_max_context_lines)});
        }
    }
}

void HealthAuditor::check_directories(std::vector<AuditIssue> &issues) const
{
    const fs::path context_dir = m_paths.project_root / m_registry.context_path();
    for (const auto &[label, dir] :
         {std::pair<const char *, fs::path>{"context_path", context_dir},
          std::pair<const char *, fs::path>{"data_dir", m_paths.data_dir}})
    {
        std::error_code ec;
        if (!fs::is_directory(dir, ec))
        {
            issues.push_back(
                {Severity::Warning, label, fmt::format("directory missing: {}", dir.string())});
        }
    }
}

void HealthAuditor::check_message_log(std::vector<AuditIssue> &issues) const
{
    std::error_code ec;
    if (!fs::exists(m_paths.message_log, ec))
        return; // no messages yet

    // Same locked read the mailbox uses, so a write in progress is never seen half done.
    const auto doc =
        utils::JsonStore(m_paths.message_log).read_or(nlohmann::json::array(), &ec);
    if (ec == std::errc::illegal_byte_sequence)
    {
        issues.push_back({Severity::Warning, "mailbox",
                          fmt::format("{} does not parse", m_paths.message_log.string())});
    }
    else if (ec)
    {
        issues.push_back({Severity::Warning, "mailbox",
                          fmt::format("cannot read {}: {}", m_paths.message_log.string(),
                                      ec.message())});
    }
    else if (!doc.is_array())
    {
        issues.push_back({Severity::Warning, "mailbox",
                          fmt::format("{} is not a JSON array", m_paths.message_log.string())});
    }
}

} // namespace ctxhub::coord
