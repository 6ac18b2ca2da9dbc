#pragma once
/**
 * @file lifecycle.hpp
 * @brief Dependency-ordered startup and shutdown of the process-wide utility modules.
 *
 * Logger, FileLock, JsonStore and CtxhubConfig each publish a ModuleDef through a
 * static GetLifecycleModule(); main() hands them to one LifecycleGuard:
 *
 * @code
 * ctxhub::utils::LifecycleGuard app_lifecycle(ctxhub::utils::MakeModDefList(
 *     ctxhub::utils::Logger::GetLifecycleModule(),
 *     ctxhub::utils::FileLock::GetLifecycleModule(),
 *     ctxhub::utils::JsonStore::GetLifecycleModule()));
 * @endcode
 *
 * Startup follows the dependency edges, shutdown runs in reverse with a deadline
 * per module. A duplicate name, an unknown dependency or a cycle aborts startup.
 */
#include "ctxhub_base.hpp"
#include "ctxhub_utils_export.h"

#include <memory>
#include <source_location>
#include <string>
#include <type_traits>
#include <vector>

namespace ctxhub::utils
{

struct LifecycleManagerImpl;

template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList takes ModuleDef values only");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(mods));
    (list.push_back(std::forward<Mods>(mods)), ...);
    return list;
}

class CTXHUB_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /// Registering after initialize() is a programming error and panics.
    void register_module(ModuleDef &&module_def);

    /// Starts every registered module once; later calls do nothing.
    void initialize(std::source_location loc = std::source_location::current());

    /// Stops started modules in reverse order. Only the first call after initialize() acts.
    void finalize(std::source_location loc = std::source_location::current());

    [[nodiscard]] bool is_initialized() const noexcept;

    /**
     * @brief Startup order for @p modules, dependencies first; ties go by name.
     * @throws std::runtime_error on a duplicate name, an undefined dependency or a
     *         cycle ("Circular dependency detected involving: ...").
     */
    [[nodiscard]] static std::vector<std::string>
    resolve_startup_order(const std::vector<ModuleDef> &modules);

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

/**
 * @class LifecycleGuard
 * @brief Owns initialization for the whole process.
 *
 * Only the first guard constructed registers its modules and later finalizes;
 * every other guard is inert and says so on the debug channel.
 */
class LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        bool expected = false;
        m_is_owner = owner_taken().compare_exchange_strong(expected, true);
        if (!m_is_owner)
        {
            CTXHUB_DEBUG("[CTX_LifeCycle] inert LifecycleGuard at {}:{}; the process already "
                         "has an owner.",
                         format_tools::filename_only(loc.file_name()), loc.line());
            return;
        }
        auto &manager = LifecycleManager::instance();
        for (auto &m : modules)
            manager.register_module(std::move(m));
        manager.initialize(loc);
    }

    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
            LifecycleManager::instance().finalize(m_loc);
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;

    [[nodiscard]] bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_taken()
    {
        static std::atomic_bool taken{false};
        return taken;
    }

    std::source_location m_loc;
    bool m_is_owner{false};
};

} // namespace ctxhub::utils
