/**
 * @file lifecycle.cpp
 * @brief Module graph, startup ordering and bounded shutdown for LifecycleManager.
 */
#include "ctxhub_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/module_def.hpp"

#include <fmt/ranges.h>

#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

namespace ctxhub::utils
{

struct ModuleDefImpl
{
    std::string name;
    std::vector<std::string> dependencies;
    LifecycleCallback startup = nullptr;
    LifecycleCallback shutdown = nullptr;
    std::chrono::milliseconds shutdown_timeout{0};
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    if (name.empty())
        throw std::invalid_argument("Lifecycle: module name must not be empty");
    pImpl->name = std::string(name);
}

ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (pImpl && !dependency_name.empty())
        pImpl->dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (pImpl)
        pImpl->startup = startup_func;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (pImpl)
    {
        pImpl->shutdown = shutdown_func;
        pImpl->shutdown_timeout = timeout;
    }
}

namespace
{

using DefMap = std::map<std::string, ModuleDefImpl>;

DefMap index_by_name(std::vector<ModuleDefImpl> defs)
{
    DefMap by_name;
    for (auto &d : defs)
    {
        if (by_name.contains(d.name))
            throw std::runtime_error("Duplicate module name: " + d.name);
        std::string key = d.name;
        by_name.emplace(std::move(key), std::move(d));
    }
    for (const auto &[name, def] : by_name)
    {
        for (const auto &dep : def.dependencies)
        {
            if (!by_name.contains(dep))
                throw std::runtime_error(
                    fmt::format("Undefined dependency: {} (required by {})", dep, name));
        }
    }
    return by_name;
}

// Kahn's algorithm; the ready set is ordered so independent modules start by name.
std::vector<std::string> startup_order(const DefMap &defs)
{
    std::map<std::string, size_t> pending;
    std::map<std::string, std::vector<std::string>> dependents;
    std::set<std::string> ready;
    for (const auto &[name, def] : defs)
    {
        pending[name] = def.dependencies.size();
        for (const auto &dep : def.dependencies)
            dependents[dep].push_back(name);
        if (def.dependencies.empty())
            ready.insert(name);
    }

    std::vector<std::string> order;
    while (!ready.empty())
    {
        std::string next = *ready.begin();
        ready.erase(ready.begin());
        for (const auto &d : dependents[next])
        {
            if (--pending[d] == 0)
                ready.insert(d);
        }
        order.push_back(std::move(next));
    }

    if (order.size() != defs.size())
    {
        std::vector<std::string> stuck;
        for (const auto &[name, count] : pending)
        {
            if (count > 0)
                stuck.push_back(name);
        }
        throw std::runtime_error(fmt::format("Circular dependency detected involving: {}",
                                             fmt::join(stuck, ", ")));
    }
    return order;
}

enum class StopResult
{
    Done,
    Threw,
    TimedOut
};

// A hung callback is abandoned on a detached thread; this only runs at process exit.
StopResult run_shutdown(LifecycleCallback cb, std::chrono::milliseconds timeout,
                        std::string &detail)
{
    if (cb == nullptr)
        return StopResult::Done;
    if (timeout.count() <= 0)
    {
        try
        {
            cb(nullptr);
            return StopResult::Done;
        }
        catch (const std::exception &e)
        {
            detail = e.what();
            return StopResult::Threw;
        }
    }

    auto finished = std::make_shared<std::promise<std::string>>();
    auto outcome = finished->get_future();
    std::thread(
        [cb, finished]
        {
            try
            {
                cb(nullptr);
                finished->set_value({});
            }
            catch (const std::exception &e)
            {
                finished->set_value(e.what());
            }
        })
        .detach();

    if (outcome.wait_for(timeout) != std::future_status::ready)
        return StopResult::TimedOut;
    detail = outcome.get();
    return detail.empty() ? StopResult::Done : StopResult::Threw;
}

} // namespace

struct LifecycleManagerImpl
{
    std::mutex mutex;
    std::atomic<bool> initialized{false};
    std::atomic<bool> finalized{false};
    std::vector<ModuleDefImpl> registered;
    DefMap modules;
    std::vector<std::string> started; // in startup order

    [[noreturn]] void abort_startup(const std::string &why, const std::string &module_name);
};

void LifecycleManagerImpl::abort_startup(const std::string &why, const std::string &module_name)
{
    fmt::print(stderr, "[CTX_LifeCycle] FATAL during startup: {}\n", why);
    if (!module_name.empty())
        fmt::print(stderr, "[CTX_LifeCycle] failing module: '{}'\n", module_name);
    fmt::print(stderr, "[CTX_LifeCycle] started so far: [{}]\n", fmt::join(started, ", "));
    debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (!module_def.pImpl)
        return;
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    if (pImpl->initialized.load())
    {
        CTXHUB_PANIC("[CTX_LifeCycle] register_module('{}') after initialization",
                     module_def.pImpl->name);
    }
    pImpl->registered.push_back(std::move(*module_def.pImpl));
}

void LifecycleManager::initialize(std::source_location loc)
{
    if (pImpl->initialized.exchange(true))
        return;
    CTXHUB_DEBUG("[CTX_LifeCycle] PID {} initializing from {} ({}:{})", platform::get_pid(),
                 loc.function_name(), format_tools::filename_only(loc.file_name()), loc.line());

    std::vector<std::string> order;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        try
        {
            pImpl->modules = index_by_name(std::move(pImpl->registered));
            pImpl->registered.clear();
            order = startup_order(pImpl->modules);
        }
        catch (const std::runtime_error &e)
        {
            pImpl->abort_startup(e.what(), {});
        }
    }

    for (const auto &name : order)
    {
        const ModuleDefImpl &def = pImpl->modules.at(name);
        try
        {
            if (def.startup != nullptr)
                def.startup(nullptr);
        }
        catch (const std::exception &e)
        {
            pImpl->abort_startup(e.what(), name);
        }
        pImpl->started.push_back(name);
        CTXHUB_DEBUG("[CTX_LifeCycle]   started '{}'", name);
    }
}

void LifecycleManager::finalize(std::source_location loc)
{
    if (!pImpl->initialized.load() || pImpl->finalized.exchange(true))
        return;
    CTXHUB_DEBUG("[CTX_LifeCycle] PID {} finalizing for guard at {}:{}", platform::get_pid(),
                 format_tools::filename_only(loc.file_name()), loc.line());

    for (auto it = pImpl->started.rbegin(); it != pImpl->started.rend(); ++it)
    {
        const ModuleDefImpl &def = pImpl->modules.at(*it);
        std::string detail;
        switch (run_shutdown(def.shutdown, def.shutdown_timeout, detail))
        {
        case StopResult::Done:
            CTXHUB_DEBUG("[CTX_LifeCycle]   stopped '{}'", *it);
            break;
        case StopResult::Threw:
            CTXHUB_DEBUG("[CTX_LifeCycle]   '{}' shutdown failed: {}", *it, detail);
            break;
        case StopResult::TimedOut:
            CTXHUB_DEBUG("[CTX_LifeCycle]   '{}' shutdown timed out after {}ms", *it,
                         def.shutdown_timeout.count());
            break;
        }
    }
    pImpl->started.clear();
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->initialized.load();
}

std::vector<std::string> LifecycleManager::resolve_startup_order(const std::vector<ModuleDef> &modules)
{
    std::vector<ModuleDefImpl> defs;
    defs.reserve(modules.size());
    for (const auto &m : modules)
    {
        if (m.pImpl)
            defs.push_back(*m.pImpl);
    }
    return startup_order(index_by_name(std::move(defs)));
}

} // namespace ctxhub::utils
