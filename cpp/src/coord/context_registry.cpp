/**
 * @file context_registry.cpp
 * @brief ContextRegistry parsing, built-in defaults and rule lookup.
 */
#include "context_registry.hpp"

#include "ctxhub_service.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <stdexcept>

namespace ctxhub::coord
{

namespace
{

struct BuiltinContext
{
    const char *id;
    const char *file;
    const char *prefix;
    std::vector<std::string> watch_dirs;
};

const std::vector<BuiltinContext> &builtin_contexts()
{
    static const std::vector<BuiltinContext> kContexts = {
        {"oracle", "ORACLE_CONTEXT.md", "O", {"oracle/", "maintenance/", "docs/"}},
        {"dev",
         "DEV_CONTEXT.md",
         "D",
         {"app/core/", "app/services/", "app/models/", "scripts/", "config/"}},
        {"dash", "DASHBOARD_CONTEXT.md", "B", {"app/frontend/", "app/api/"}},
        {"crank", "CRANK_CONTEXT.md", "C", {"content/"}},
        {"pocket", "POCKET_CONTEXT.md", "P", {}},
    };
    return kContexts;
}

const HandoffRules &builtin_rules()
{
    static const HandoffRules kRules = {
        {"dash",
         {{"dev", {"custom_preset_request", "api_change_request", "backend_bug"}},
          {"crank", {"content_generation_request"}}}},
        {"crank", {{"dev", {"bug_report"}}, {"dash", {"content_ready"}}}},
        {"dev",
         {{"dash", {"new_feature_available", "preset_added", "api_updated"}},
          {"crank", {"preset_fixed", "new_preset"}}}},
        {"oracle",
         {{"dev", {"health_alert", "task_assignment"}},
          {"dash", {"health_alert", "task_assignment"}},
          {"crank", {"health_alert", "task_assignment"}},
          {"pocket", {"sync_request"}}}},
        {"pocket", {{"oracle", {"sync_complete", "fallback_active"}}}},
    };
    return kRules;
}

std::string upper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> string_list(const nlohmann::json &j, const std::string &what)
{
    if (!j.is_array())
        throw std::runtime_error("Context registry: '" + what + "' must be an array of strings");
    std::vector<std::string> out;
    for (const auto &e : j)
    {
        if (!e.is_string())
            throw std::runtime_error("Context registry: '" + what +
                                     "' must be an array of strings");
        out.push_back(e.get<std::string>());
    }
    return out;
}

ContextInfo parse_context(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::runtime_error("Context registry: every context must be a JSON object");
    if (!j.contains("id") || !j["id"].is_string() || j["id"].get<std::string>().empty())
        throw std::runtime_error("Context registry: context without a string 'id'");

    ContextInfo ci;
    ci.id = j["id"].get<std::string>();
    if (ci.id == "all" || ci.id == "*")
        throw std::runtime_error("Context registry: '" + ci.id + "' is reserved");

    ci.file = j.value("file", upper(ci.id) + "_CONTEXT.md");
    ci.prefix = j.value("prefix", upper(ci.id.substr(0, 1)));
    if (j.contains("resume_prompt") && j["resume_prompt"].is_string())
        ci.resume_prompt = j["resume_prompt"].get<std::string>();
    ci.is_coordinator = j.value("is_coordinator", false);
    if (j.contains("watch_dirs"))
        ci.watch_dirs = string_list(j["watch_dirs"], ci.id + ".watch_dirs");
    return ci;
}

PortSet parse_ports(const nlohmann::json &j, PortSet fallback)
{
    if (!j.is_object())
        return fallback;
    PortSet p;
    p.backend = j.value("backend", fallback.backend);
    p.frontend = j.value("frontend", fallback.frontend);
    return p;
}

} // namespace

ContextRegistry ContextRegistry::defaults()
{
    ContextRegistry reg;
    for (const auto &b : builtin_contexts())
    {
        ContextInfo ci;
        ci.id = b.id;
        ci.file = b.file;
        ci.prefix = b.prefix;
        ci.watch_dirs = b.watch_dirs;
        ci.is_coordinator = (ci.id == "oracle");
        reg.m_contexts.push_back(std::move(ci));
    }
    reg.m_rules = builtin_rules();
    reg.resolve_coordinator();
    return reg;
}

ContextRegistry ContextRegistry::from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::runtime_error("Context registry: top level must be a JSON object");

    ContextRegistry reg;
    reg.m_context_path = j.value("context_path", reg.m_context_path);

    const bool has_contexts =
        j.contains("contexts") && !(j["contexts"].is_array() && j["contexts"].empty());
    if (has_contexts)
    {
        if (!j["contexts"].is_array())
            throw std::runtime_error("Context registry: 'contexts' must be an array");
        for (const auto &cj : j["contexts"])
        {
            ContextInfo ci = parse_context(cj);
            if (reg.contains(ci.id))
                throw std::runtime_error("Context registry: duplicate context '" + ci.id + "'");
            reg.m_contexts.push_back(std::move(ci));
        }
    }
    else
    {
        reg.m_contexts = defaults().m_contexts;
    }

    if (j.contains("handoff_rules"))
    {
        const auto &rj = j["handoff_rules"];
        if (!rj.is_object())
            throw std::runtime_error("Context registry: 'handoff_rules' must be an object");

        for (const auto &[from, entry] : rj.items())
        {
            if (!reg.contains(from))
                throw std::runtime_error("Context registry: handoff rule for unknown context '" +
                                         from + "'");
            std::vector<nlohmann::json> blocks;
            if (entry.is_array())
                blocks.assign(entry.begin(), entry.end());
            else
                blocks.push_back(entry);

            for (const auto &block : blocks)
            {
                if (!block.is_object() || !block.contains("to") || !block.contains("types"))
                    throw std::runtime_error("Context registry: rule for '" + from +
                                             "' needs 'to' and 'types'");
                const auto targets = string_list(block["to"], from + ".to");
                const auto types = string_list(block["types"], from + ".types");

                std::vector<std::string> expanded;
                for (const auto &t : targets)
                {
                    if (t == "*")
                    {
                        for (const auto &ci : reg.m_contexts)
                        {
                            if (ci.id != from)
                                expanded.push_back(ci.id);
                        }
                        continue;
                    }
                    if (!reg.contains(t))
                        throw std::runtime_error("Context registry: rule '" + from +
                                                 "' targets unknown context '" + t + "'");
                    expanded.push_back(t);
                }

                for (const auto &to : expanded)
                {
                    auto &allowed = reg.m_rules[from][to];
                    for (const auto &type : types)
                    {
                        if (std::find(allowed.begin(), allowed.end(), type) == allowed.end())
                            allowed.push_back(type);
                    }
                }
            }
        }
    }
    else
    {
        // Built-in table, restricted to the contexts this registry knows.
        for (const auto &[from, targets] : builtin_rules())
        {
            if (!reg.contains(from))
                continue;
            for (const auto &[to, types] : targets)
            {
                if (reg.contains(to))
                    reg.m_rules[from][to] = types;
            }
        }
    }

    if (j.contains("ports") && j["ports"].is_object())
    {
        reg.m_normal = parse_ports(j["ports"].value("normal", nlohmann::json{}), reg.m_normal);
        reg.m_fallback =
            parse_ports(j["ports"].value("fallback", nlohmann::json{}), reg.m_fallback);
    }

    reg.resolve_coordinator();
    return reg;
}

ContextRegistry ContextRegistry::from_json_file(const std::filesystem::path &path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        LOGGER_INFO("[registry] '{}' not found; using the built-in contexts", path.string());
        return defaults();
    }

    std::ifstream f(path);
    if (!f.is_open())
        throw std::runtime_error("Context registry: cannot open file: " + path.string());

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        throw std::runtime_error("Context registry: JSON parse error in '" + path.string() +
                                 "': " + e.what());
    }

    auto reg = from_json(j);
    LOGGER_INFO("[registry] loaded {} contexts from '{}', coordinator '{}'",
                reg.m_contexts.size(), path.string(), reg.m_coordinator);
    return reg;
}

void ContextRegistry::resolve_coordinator()
{
    m_coordinator.clear();
    for (const auto &ci : m_contexts)
    {
        if (!ci.is_coordinator)
            continue;
        if (!m_coordinator.empty())
            throw std::runtime_error("Context registry: both '" + m_coordinator + "' and '" +
                                     ci.id + "' are flagged as coordinator");
        m_coordinator = ci.id;
    }
    if (m_coordinator.empty() && contains("oracle"))
    {
        m_coordinator = "oracle";
        for (auto &ci : m_contexts)
            ci.is_coordinator = (ci.id == m_coordinator);
    }
}

bool ContextRegistry::contains(std::string_view id) const noexcept
{
    return find(id) != nullptr;
}

const ContextInfo *ContextRegistry::find(std::string_view id) const noexcept
{
    for (const auto &ci : m_contexts)
    {
        if (ci.id == id)
            return &ci;
    }
    return nullptr;
}

std::vector<std::string> ContextRegistry::ids() const
{
    std::vector<std::string> out;
    out.reserve(m_contexts.size());
    for (const auto &ci : m_contexts)
        out.push_back(ci.id);
    return out;
}

bool ContextRegistry::is_coordinator(std::string_view id) const noexcept
{
    return !m_coordinator.empty() && id == m_coordinator;
}

std::vector<std::string> ContextRegistry::allowed_types(std::string_view from,
                                                        std::string_view to) const
{
    auto fit = m_rules.find(std::string(from));
    if (fit == m_rules.end())
        return {};
    auto tit = fit->second.find(std::string(to));
    if (tit == fit->second.end())
        return {};
    return tit->second;
}

bool ContextRegistry::rule_allows(std::string_view from, std::string_view to,
                                  std::string_view type) const noexcept
{
    for (const auto &[src, targets] : m_rules)
    {
        if (src != from)
            continue;
        for (const auto &[dst, types] : targets)
        {
            if (dst != to)
                continue;
            return std::find(types.begin(), types.end(), type) != types.end();
        }
    }
    return false;
}

std::filesystem::path ContextRegistry::context_file(const std::filesystem::path &project_root,
                                                    std::string_view id) const
{
    const ContextInfo *ci = find(id);
    if (ci == nullptr)
        return {};
    return project_root / m_context_path / ci->file;
}

std::vector<std::filesystem::path>
ContextRegistry::watch_dirs(const std::filesystem::path &project_root, std::string_view id) const
{
    std::vector<std::filesystem::path> out;
    const ContextInfo *ci = find(id);
    if (ci == nullptr)
        return out;

    for (const auto &d : ci->watch_dirs)
        out.push_back(project_root / d);
    return out;
}

nlohmann::json ContextRegistry::to_json() const
{
    nlohmann::json j;
    j["context_path"] = m_context_path;
    j["coordinator"] = m_coordinator.empty() ? nlohmann::json(nullptr)
                                             : nlohmann::json(m_coordinator);

    nlohmann::json contexts = nlohmann::json::array();
    for (const auto &ci : m_contexts)
    {
        nlohmann::json c{{"id", ci.id},
                         {"file", ci.file},
                         {"prefix", ci.prefix},
                         {"is_coordinator", ci.is_coordinator}};
        if (ci.resume_prompt)
            c["resume_prompt"] = *ci.resume_prompt;
        if (!ci.watch_dirs.empty())
            c["watch_dirs"] = ci.watch_dirs;
        contexts.push_back(std::move(c));
    }
    j["contexts"] = std::move(contexts);

    nlohmann::json rules = nlohmann::json::object();
    for (const auto &[from, targets] : m_rules)
    {
        nlohmann::json blocks = nlohmann::json::array();
        for (const auto &[to, types] : targets)
            blocks.push_back({{"to", nlohmann::json::array({to})}, {"types", types}});
        rules[from] = std::move(blocks);
    }
    j["handoff_rules"] = std::move(rules);

    j["ports"] = {{"normal", {{"backend", m_normal.backend}, {"frontend", m_normal.frontend}}},
                  {"fallback",
                   {{"backend", m_fallback.backend}, {"frontend", m_fallback.frontend}}}};
    return j;
}

} // namespace ctxhub::coord
