#pragma once
/**
 * @file ctxhub_config.hpp
 * @brief Layered configuration for ctxhub, published as a lifecycle module.
 *
 * Loading order (later layers override earlier ones):
 *  1. built-in defaults (CtxhubSettings member initializers);
 *  2. `<project_root>/config/ctxhub.default.json`;
 *  3. `<project_root>/config/ctxhub.user.json`, merged on top;
 *     or, replacing 2 and 3, the file given by set_config_path() or CTXHUB_CONFIG_FILE;
 *  4. environment: CTXHUB_DEBUG (forces log level "debug"), CTXHUB_LOG_FILE.
 */

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "ctxhub_base.hpp"

namespace ctxhub
{

/** @brief Fully resolved settings. Paths are absolute. */
struct CTXHUB_UTILS_EXPORT CtxhubSettings
{
    std::filesystem::path project_root;
    std::filesystem::path config_dir;
    std::filesystem::path data_dir;
    std::filesystem::path registry_file;

    std::string log_level{"info"};
    std::filesystem::path log_file;
    size_t log_max_size_bytes{5U * 1024U * 1024U};
    size_t log_max_backups{3};
    bool debug{false};

    std::chrono::seconds tick{30};
    std::chrono::seconds health_interval{300};
    std::chrono::seconds cleanup_interval{1800};
    std::chrono::milliseconds poll_interval{100};

    std::chrono::seconds activity_window{300};
    size_t activity_buffer_size{100};
    std::chrono::duration<double> debounce{1.0};

    size_t mailbox_max_messages{500};
    size_t audit_max_context_lines{500};
    std::string editor_command;

    /**
     * @brief Applies one configuration document on top of the current values.
     * @details Unknown keys are ignored. A value of the wrong type or out of range
     *          is logged at WARN and leaves the current value in place.
     */
    void apply_json(const nlohmann::json &j);

    /** @brief Runs the complete layered load rooted at @p project_root. */
    static CtxhubSettings load(const std::filesystem::path &project_root,
                               const std::filesystem::path &override_path);

    nlohmann::json to_json() const;
};

class CTXHUB_UTILS_EXPORT CtxhubConfig
{
  public:
    /** @brief Call before the lifecycle starts; defaults to the current directory. */
    static void set_project_root(const std::filesystem::path &root);
    /** @brief Call before the lifecycle starts to bypass the layered file lookup. */
    static void set_config_path(const std::filesystem::path &path);

    /** @brief Module "ctxhub::CtxhubConfig"; depends on Logger. */
    static utils::ModuleDef GetLifecycleModule();
    static bool lifecycle_initialized() noexcept;

    static CtxhubConfig &get_instance();

    const CtxhubSettings &settings() const noexcept;

    /// Logs every resolved value at INFO. The daemon calls this once its log sink is set.
    void log_summary() const;

    CtxhubConfig(const CtxhubConfig &) = delete;
    CtxhubConfig &operator=(const CtxhubConfig &) = delete;

  private:
    CtxhubConfig();
    ~CtxhubConfig();

    void load_(const std::filesystem::path &project_root,
               const std::filesystem::path &override_path);
    friend void do_ctxhub_config_startup(const char *arg);

    struct Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace ctxhub
