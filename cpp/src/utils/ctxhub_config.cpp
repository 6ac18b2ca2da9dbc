/**
 * @file ctxhub_config.cpp
 * @brief CtxhubConfig lifecycle module implementation.
 */
#include "ctxhub_service.hpp"
#include "utils/ctxhub_config.hpp"

#include <cstdlib>
#include <fstream>
#include <mutex>

namespace ctxhub
{

namespace fs = std::filesystem;

static std::atomic<bool> g_ctxhub_config_initialized{false};

static std::mutex g_config_path_mu;
static fs::path g_project_root_override;
static fs::path g_config_path_override;

namespace
{

constexpr const char *kDefaultConfigFile = "ctxhub.default.json";
constexpr const char *kUserConfigFile = "ctxhub.user.json";

/// Recursively merges `overrides` into `base` (object keys override, arrays replace).
void json_merge(nlohmann::json &base, const nlohmann::json &overrides)
{
    if (!overrides.is_object())
        return;
    for (auto it = overrides.begin(); it != overrides.end(); ++it)
    {
        if (it.value().is_object() && base.contains(it.key()) && base.at(it.key()).is_object())
        {
            json_merge(base[it.key()], it.value());
        }
        else
        {
            base[it.key()] = it.value();
        }
    }
}

/// Reads one configuration layer. A missing file yields null; a malformed one is logged.
/// Config files are read without a FileLock: the config directory may be read-only.
nlohmann::json read_layer(const fs::path &path)
{
    std::ifstream input(path);
    if (!input.is_open())
    {
        return nlohmann::json{};
    }
    try
    {
        auto j = nlohmann::json::parse(input);
        if (j.is_object())
        {
            return j;
        }
        LOGGER_WARN("CtxhubConfig: '{}' is not a JSON object; ignoring it", path.string());
    }
    catch (const nlohmann::json::exception &e)
    {
        LOGGER_ERROR("CtxhubConfig: cannot parse '{}': {}", path.string(), e.what());
    }
    return nlohmann::json{};
}

fs::path resolve_against(const fs::path &root, const std::string &raw)
{
    fs::path p(raw);
    if (p.is_absolute())
        return p.lexically_normal();
    return (root / p).lexically_normal();
}

// Looks up "section.key"; returns nullptr when absent.
const nlohmann::json *find_key(const nlohmann::json &j, const char *section, const char *key)
{
    if (section == nullptr)
    {
        auto it = j.find(key);
        return it == j.end() ? nullptr : &*it;
    }
    auto sit = j.find(section);
    if (sit == j.end() || !sit->is_object())
        return nullptr;
    auto it = sit->find(key);
    return it == sit->end() ? nullptr : &*it;
}

std::string key_name(const char *section, const char *key)
{
    return section == nullptr ? std::string(key) : fmt::format("{}.{}", section, key);
}

template <typename T>
void read_positive(const nlohmann::json &j, const char *section, const char *key, T &target)
{
    const auto *v = find_key(j, section, key);
    if (v == nullptr)
        return;
    if (!v->is_number() || v->get<double>() <= 0)
    {
        LOGGER_WARN("CtxhubConfig: '{}' must be a positive number (got {}); keeping {}",
                    key_name(section, key), v->dump(), target);
        return;
    }
    target = v->get<T>();
}

void read_string(const nlohmann::json &j, const char *section, const char *key,
                 std::string &target)
{
    const auto *v = find_key(j, section, key);
    if (v == nullptr)
        return;
    if (!v->is_string())
    {
        LOGGER_WARN("CtxhubConfig: '{}' must be a string (got {}); keeping '{}'",
                    key_name(section, key), v->dump(), target);
        return;
    }
    target = v->get<std::string>();
}

bool is_known_level(const std::string &level)
{
    return level == "trace" || level == "debug" || level == "info" || level == "warning" ||
           level == "error" || level == "system";
}

} // anonymous namespace

void CtxhubSettings::apply_json(const nlohmann::json &j)
{
    if (!j.is_object())
        return;

    std::string raw;
    read_string(j, nullptr, "data_dir", raw);
    if (!raw.empty())
        data_dir = resolve_against(project_root, raw);

    raw.clear();
    read_string(j, nullptr, "registry_file", raw);
    if (!raw.empty())
        registry_file = resolve_against(project_root, raw);

    std::string level = log_level;
    read_string(j, "log", "level", level);
    if (is_known_level(level))
    {
        log_level = level;
    }
    else
    {
        LOGGER_WARN("CtxhubConfig: unknown log.level '{}'; keeping '{}'", level, log_level);
    }

    raw.clear();
    read_string(j, "log", "file", raw);
    if (!raw.empty())
        log_file = resolve_against(project_root, raw);
    read_positive(j, "log", "max_size_bytes", log_max_size_bytes);
    read_positive(j, "log", "max_backups", log_max_backups);

    int64_t seconds = tick.count();
    read_positive(j, "daemon", "tick_seconds", seconds);
    tick = std::chrono::seconds(seconds);
    seconds = health_interval.count();
    read_positive(j, "daemon", "health_interval_seconds", seconds);
    health_interval = std::chrono::seconds(seconds);
    seconds = cleanup_interval.count();
    read_positive(j, "daemon", "cleanup_interval_seconds", seconds);
    cleanup_interval = std::chrono::seconds(seconds);
    int64_t millis = poll_interval.count();
    read_positive(j, "daemon", "poll_interval_ms", millis);
    poll_interval = std::chrono::milliseconds(millis);

    seconds = activity_window.count();
    read_positive(j, "activity", "window_seconds", seconds);
    activity_window = std::chrono::seconds(seconds);
    read_positive(j, "activity", "buffer_size", activity_buffer_size);

    double debounce_s = debounce.count();
    read_positive(j, "watcher", "debounce_seconds", debounce_s);
    debounce = std::chrono::duration<double>(debounce_s);

    read_positive(j, "mailbox", "max_messages", mailbox_max_messages);
    read_positive(j, "audit", "max_context_lines", audit_max_context_lines);
    read_string(j, "spawn", "editor_command", editor_command);
}

CtxhubSettings CtxhubSettings::load(const fs::path &project_root, const fs::path &override_path)
{
    CtxhubSettings s;
    std::error_code ec;
    s.project_root = fs::absolute(project_root.empty() ? fs::current_path() : project_root, ec)
                         .lexically_normal();
    s.config_dir = s.project_root / "config";
    s.data_dir = s.project_root / "data";
    s.registry_file = s.project_root / "oracle" / "context" / "context_registry.json";

    fs::path explicit_file = override_path;
    if (explicit_file.empty())
    {
        if (const char *env = std::getenv("CTXHUB_CONFIG_FILE"); env != nullptr && *env != '\0')
            explicit_file = env;
    }

    if (!explicit_file.empty())
    {
        nlohmann::json j = read_layer(explicit_file);
        if (!j.is_null())
        {
            LOGGER_DEBUG("CtxhubConfig: loading config file '{}'", explicit_file.string());
            s.apply_json(j);
        }
        else
        {
            LOGGER_WARN("CtxhubConfig: config file '{}' not readable; using defaults",
                        explicit_file.string());
        }
    }
    else
    {
        nlohmann::json merged = nlohmann::json::object();
        const fs::path def_file = s.config_dir / kDefaultConfigFile;
        if (nlohmann::json jdef = read_layer(def_file); !jdef.is_null())
        {
            LOGGER_DEBUG("CtxhubConfig: loading defaults from '{}'", def_file.string());
            json_merge(merged, jdef);
        }
        const fs::path user_file = s.config_dir / kUserConfigFile;
        if (nlohmann::json juser = read_layer(user_file); !juser.is_null())
        {
            LOGGER_DEBUG("CtxhubConfig: merging user overrides from '{}'", user_file.string());
            json_merge(merged, juser);
        }
        s.apply_json(merged);
    }

    if (s.log_file.empty())
        s.log_file = s.data_dir / "ctxhub_daemon.log";

    // Process-level overrides.
    if (const char *env = std::getenv("CTXHUB_LOG_FILE"); env != nullptr && *env != '\0')
        s.log_file = resolve_against(s.project_root, env);
    if (const char *env = std::getenv("CTXHUB_DEBUG"); env != nullptr)
    {
        s.debug = format_tools::is_truthy(env);
        if (s.debug && s.log_level != "trace")
            s.log_level = "debug";
    }
    return s;
}

nlohmann::json CtxhubSettings::to_json() const
{
    return nlohmann::json{
        {"project_root", project_root.string()},
        {"data_dir", data_dir.string()},
        {"registry_file", registry_file.string()},
        {"log",
         {{"level", log_level},
          {"file", log_file.string()},
          {"max_size_bytes", log_max_size_bytes},
          {"max_backups", log_max_backups}}},
        {"daemon",
         {{"tick_seconds", tick.count()},
          {"health_interval_seconds", health_interval.count()},
          {"cleanup_interval_seconds", cleanup_interval.count()},
          {"poll_interval_ms", poll_interval.count()}}},
        {"activity",
         {{"window_seconds", activity_window.count()}, {"buffer_size", activity_buffer_size}}},
        {"watcher", {{"debounce_seconds", debounce.count()}}},
        {"mailbox", {{"max_messages", mailbox_max_messages}}},
        {"audit", {{"max_context_lines", audit_max_context_lines}}},
        {"spawn", {{"editor_command", editor_command}}},
    };
}

// ---------------------------------------------------------------------------
// CtxhubConfig
// ---------------------------------------------------------------------------

struct CtxhubConfig::Impl
{
    CtxhubSettings settings;
};

CtxhubConfig::CtxhubConfig() : pImpl(std::make_unique<Impl>()) {}
CtxhubConfig::~CtxhubConfig() = default;

void CtxhubConfig::set_project_root(const fs::path &root)
{
    std::lock_guard lock(g_config_path_mu);
    g_project_root_override = root;
}

void CtxhubConfig::set_config_path(const fs::path &path)
{
    std::lock_guard lock(g_config_path_mu);
    g_config_path_override = path;
}

CtxhubConfig &CtxhubConfig::get_instance()
{
    static CtxhubConfig instance;
    return instance;
}

const CtxhubSettings &CtxhubConfig::settings() const noexcept
{
    if (!lifecycle_initialized())
    {
        CTXHUB_PANIC("CtxhubConfig used before its module was initialized via LifecycleManager.");
    }
    return pImpl->settings;
}

void CtxhubConfig::load_(const fs::path &project_root, const fs::path &override_path)
{
    pImpl->settings = CtxhubSettings::load(project_root, override_path);
}

void CtxhubConfig::log_summary() const
{
    const auto &s = settings();
    LOGGER_INFO("CtxhubConfig: project_root      = {}", s.project_root.string());
    LOGGER_INFO("CtxhubConfig: data_dir          = {}", s.data_dir.string());
    LOGGER_INFO("CtxhubConfig: registry_file     = {}", s.registry_file.string());
    LOGGER_INFO("CtxhubConfig: log.level         = {}", s.log_level);
    LOGGER_INFO("CtxhubConfig: log.file          = {}", s.log_file.string());
    LOGGER_INFO("CtxhubConfig: daemon.tick       = {}s (health {}s, cleanup {}s)", s.tick.count(),
                s.health_interval.count(), s.cleanup_interval.count());
    LOGGER_INFO("CtxhubConfig: activity.window   = {}s, buffer {}", s.activity_window.count(),
                s.activity_buffer_size);
    LOGGER_INFO("CtxhubConfig: watcher.debounce  = {:.3f}s", s.debounce.count());
    LOGGER_INFO("CtxhubConfig: mailbox.max       = {}", s.mailbox_max_messages);
    LOGGER_INFO("CtxhubConfig: audit.max_lines   = {}", s.audit_max_context_lines);
    LOGGER_INFO("CtxhubConfig: spawn.editor      = '{}'", s.editor_command);
}

bool CtxhubConfig::lifecycle_initialized() noexcept
{
    return g_ctxhub_config_initialized.load(std::memory_order_acquire);
}

void do_ctxhub_config_startup(const char * /*arg*/)
{
    fs::path root;
    fs::path override_path;
    {
        std::lock_guard lock(g_config_path_mu);
        root = g_project_root_override;
        override_path = g_config_path_override;
    }
    CtxhubConfig::get_instance().load_(root, override_path);
    g_ctxhub_config_initialized.store(true, std::memory_order_release);
}

namespace
{
void do_ctxhub_config_shutdown(const char * /*arg*/)
{
    g_ctxhub_config_initialized.store(false, std::memory_order_release);
}
} // namespace

utils::ModuleDef CtxhubConfig::GetLifecycleModule()
{
    utils::ModuleDef module("ctxhub::CtxhubConfig");
    module.add_dependency("ctxhub::utils::Logger");
    module.set_startup(&do_ctxhub_config_startup);
    module.set_shutdown(&do_ctxhub_config_shutdown, std::chrono::milliseconds(500));
    return module;
}

} // namespace ctxhub
