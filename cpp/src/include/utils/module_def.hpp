#pragma once
/**
 * @file module_def.hpp
 * @brief Builder for one lifecycle module: a name, its dependencies and two callbacks.
 */
#include "ctxhub_utils_export.h"

#include <chrono>
#include <memory>
#include <string_view>

namespace ctxhub::utils
{

struct ModuleDefImpl;
class LifecycleManager;

/// Plain function pointer so callbacks cross the ctxhub_utils shared-library boundary
/// unchanged. `arg` is always nullptr for now.
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 *
 * Move-only; handing it to a LifecycleGuard transfers it.
 *
 * @code
 * ModuleDef module("ctxhub::utils::JsonStore");
 * module.add_dependency("ctxhub::utils::FileLock");
 * module.set_startup(&do_json_store_startup);
 * module.set_shutdown(&do_json_store_shutdown, std::chrono::milliseconds(1000));
 * @endcode
 */
class CTXHUB_UTILS_EXPORT ModuleDef
{
  public:
    /// @throws std::invalid_argument if @p name is empty.
    explicit ModuleDef(std::string_view name);
    ~ModuleDef();

    ModuleDef(ModuleDef &&other) noexcept;
    ModuleDef &operator=(ModuleDef &&other) noexcept;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /// @p dependency_name starts before this module and stops after it. Empty names are ignored.
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);

    /**
     * @param timeout Upper bound on the callback at exit; a zero timeout runs it
     *                inline with no bound.
     */
    void set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout);

  private:
    friend class LifecycleManager;
    std::unique_ptr<ModuleDefImpl> pImpl;
};

} // namespace ctxhub::utils
