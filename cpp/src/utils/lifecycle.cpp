/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Dependency-ordered module startup and reverse-order shutdown.
 ******************************************************************************/
#include "utils/lifecycle.hpp"

#include <fmt/core.h>

#include <atomic>
#include <cstdio>
#include <map>
#include <stdexcept>

namespace zonechat::utils
{

namespace
{
std::atomic<bool> g_app_initialized{false};

enum class Mark
{
    None,
    Visiting,
    Done
};

// Depth-first topological sort; throws on cycles and unknown names.
void visit(const std::string &name, std::map<std::string, ModuleDef *> &by_name,
           std::map<std::string, Mark> &marks, std::vector<ModuleDef *> &order)
{
    auto it = by_name.find(name);
    if (it == by_name.end())
    {
        throw std::runtime_error(
            fmt::format("[ZC_LifeCycle] unknown module dependency '{}'", name));
    }
    Mark &mark = marks[name];
    if (mark == Mark::Done)
        return;
    if (mark == Mark::Visiting)
    {
        throw std::runtime_error(
            fmt::format("[ZC_LifeCycle] dependency cycle detected at module '{}'", name));
    }
    mark = Mark::Visiting;
    for (const auto &dep : it->second->dependencies())
    {
        visit(dep, by_name, marks, order);
    }
    mark = Mark::Done;
    order.push_back(it->second);
}
} // namespace

ModuleDef::ModuleDef(std::string_view name) : m_name(name)
{
    if (name.empty())
        throw std::invalid_argument("ModuleDef: module name must not be empty");
    if (name.size() > MAX_MODULE_NAME_LEN)
        throw std::length_error("ModuleDef: module name exceeds MAX_MODULE_NAME_LEN");
}

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
        return;
    if (dependency_name.size() > MAX_MODULE_NAME_LEN)
        throw std::length_error("ModuleDef: dependency name exceeds MAX_MODULE_NAME_LEN");
    m_dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    m_startup = startup_func;
    m_has_startup_arg = false;
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    m_startup = startup_func;
    m_startup_arg.assign(arg);
    m_has_startup_arg = true;
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func)
{
    m_shutdown = shutdown_func;
}

bool IsAppInitialized() noexcept
{
    return g_app_initialized.load(std::memory_order_acquire);
}

LifecycleGuard::LifecycleGuard(std::vector<ModuleDef> &&modules)
{
    bool expected = false;
    if (!g_app_initialized.compare_exchange_strong(expected, true, std::memory_order_acq_rel))
    {
        fmt::print(stderr,
                   "[ZC_LifeCycle] WARNING: LifecycleGuard constructed but an owner already "
                   "exists. This guard is a no-op.\n");
        return;
    }

    try
    {
        std::map<std::string, ModuleDef *> by_name;
        for (auto &mod : modules)
        {
            if (!by_name.emplace(mod.name(), &mod).second)
            {
                throw std::runtime_error(
                    fmt::format("[ZC_LifeCycle] module '{}' registered twice", mod.name()));
            }
        }
        std::map<std::string, Mark> marks;
        std::vector<ModuleDef *> order;
        for (auto &mod : modules)
        {
            visit(mod.name(), by_name, marks, order);
        }

        m_started.reserve(order.size());
        for (ModuleDef *mod : order)
        {
            if (mod->m_startup != nullptr)
            {
                mod->m_startup(mod->m_has_startup_arg ? mod->m_startup_arg.c_str() : nullptr);
            }
            m_started.push_back(std::move(*mod));
        }
    }
    catch (...)
    {
        // Roll back whatever already started, then let the caller see the error.
        for (auto it = m_started.rbegin(); it != m_started.rend(); ++it)
        {
            if (it->m_shutdown != nullptr)
                it->m_shutdown(nullptr);
        }
        m_started.clear();
        g_app_initialized.store(false, std::memory_order_release);
        throw;
    }
    m_owner = true;
}

LifecycleGuard::~LifecycleGuard() noexcept
{
    if (!m_owner)
        return;
    for (auto it = m_started.rbegin(); it != m_started.rend(); ++it)
    {
        if (it->m_shutdown == nullptr)
            continue;
        try
        {
            it->m_shutdown(nullptr);
        }
        catch (const std::exception &e)
        {
            fmt::print(stderr, "[ZC_LifeCycle] module '{}' shutdown threw: {}\n", it->name(),
                       e.what());
        }
    }
    g_app_initialized.store(false, std::memory_order_release);
}

} // namespace zonechat::utils
