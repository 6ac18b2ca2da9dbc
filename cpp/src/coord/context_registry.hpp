#pragma once
/**
 * @file context_registry.hpp
 * @brief The set of known contexts and the handoff-rule table, loaded once.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "context_path": "oracle/docs/context/",
 *   "contexts": [
 *     {"id": "oracle", "file": "ORACLE_CONTEXT.md", "prefix": "O", "is_coordinator": true},
 *     {"id": "dev",    "file": "DEV_CONTEXT.md",    "prefix": "D",
 *      "resume_prompt": "Read @oracle/docs/context/DEV_CONTEXT.md first.",
 *      "watch_dirs": ["app/core/", "scripts/"]}
 *   ],
 *   "handoff_rules": {
 *     "dev":    {"to": ["dash"], "types": ["new_feature_available"]},
 *     "oracle": {"to": ["*"],    "types": ["health_alert"]},
 *     "dash":   [{"to": ["dev"],   "types": ["backend_bug"]},
 *                {"to": ["crank"], "types": ["content_generation_request"]}]
 *   },
 *   "ports": {"normal":   {"backend": 5001, "frontend": 5173},
 *             "fallback": {"backend": 5002, "frontend": 5174}}
 * }
 * @endcode
 *
 * A rule entry is either one `{to, types}` object (every target gets the same
 * types) or an array of them. `"*"` in `to` expands to every other context.
 *
 * The registry is immutable after construction. Components receive it by
 * const reference; nothing caches it globally.
 */

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ctxhub::coord
{

struct ContextInfo
{
    std::string id;
    std::string file;   ///< Context document name, relative to context_path
    std::string prefix; ///< Session-id prefix
    std::optional<std::string> resume_prompt;
    bool is_coordinator{false};
    std::vector<std::string> watch_dirs; ///< Relative to the project root
};

struct PortSet
{
    int backend{5001};
    int frontend{5173};
};

/// from → to → allowed message types
using HandoffRules = std::map<std::string, std::map<std::string, std::vector<std::string>>>;

class ContextRegistry
{
  public:
    /// Built-in oracle/dev/dash/crank/pocket set with the built-in rule table.
    static ContextRegistry defaults();

    /**
     * @brief Builds a registry from a parsed document.
     * @throws std::runtime_error on malformed structure, duplicate ids, rules
     *         naming unknown contexts, or more than one flagged coordinator.
     */
    static ContextRegistry from_json(const nlohmann::json &j);

    /**
     * @brief Loads @p path; a missing file yields defaults().
     * @throws std::runtime_error when the file exists but cannot be read or parsed.
     */
    static ContextRegistry from_json_file(const std::filesystem::path &path);

    [[nodiscard]] bool contains(std::string_view id) const noexcept;
    [[nodiscard]] const ContextInfo *find(std::string_view id) const noexcept;
    const std::vector<ContextInfo> &contexts() const noexcept { return m_contexts; }
    std::vector<std::string> ids() const;

    /// Empty when the registry has no coordinator.
    const std::string &coordinator() const noexcept { return m_coordinator; }
    [[nodiscard]] bool is_coordinator(std::string_view id) const noexcept;

    const HandoffRules &rules() const noexcept { return m_rules; }
    /// Types @p from may send to @p to by explicit rule; empty when none.
    std::vector<std::string> allowed_types(std::string_view from, std::string_view to) const;
    [[nodiscard]] bool rule_allows(std::string_view from, std::string_view to,
                                   std::string_view type) const noexcept;

    const std::string &context_path() const noexcept { return m_context_path; }
    PortSet ports(bool fallback) const noexcept { return fallback ? m_fallback : m_normal; }

    /// `<root>/<context_path>/<file>`; empty path for an unknown id.
    std::filesystem::path context_file(const std::filesystem::path &project_root,
                                       std::string_view id) const;

    /// Absolute watch directories of @p id as declared; the built-in set carries its own.
    std::vector<std::filesystem::path> watch_dirs(const std::filesystem::path &project_root,
                                                  std::string_view id) const;

    nlohmann::json to_json() const;

  private:
    ContextRegistry() = default;

    void resolve_coordinator();

    std::vector<ContextInfo> m_contexts;
    HandoffRules m_rules;
    std::string m_coordinator;
    std::string m_context_path{"oracle/docs/context/"};
    PortSet m_normal{5001, 5173};
    PortSet m_fallback{5002, 5174};
};

} // namespace ctxhub::coord
