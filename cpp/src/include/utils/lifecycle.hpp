#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * Modules declare their dependencies by name; `LifecycleGuard` orders them
 * topologically, starts them on construction and shuts them down in reverse
 * order on destruction. A cyclic or unknown dependency is reported with
 * `std::runtime_error` before any module is started.
 *
 * Only the first live guard in a process owns the lifecycle. A second guard
 * constructed while one is active logs a warning and does nothing.
 *
 * ```cpp
 * int main() {
 *     zonechat::utils::LifecycleGuard app_lifecycle(zonechat::utils::MakeModDefList(
 *         zonechat::utils::Logger::GetLifecycleModule(),
 *         zonechat::crypto::GetLifecycleModule(),
 *         zonechat::utils::GetZMQContextModule()));
 *     LOGGER_INFO("Application started successfully.");
 *     return 0;
 * }
 * ```
 ******************************************************************************/
#include "zonechat_core_export.h"
#include "utils/module_def.hpp"

#include <type_traits>
#include <utility>
#include <vector>

namespace zonechat::utils
{

// Call-site: MakeModDefList(std::move(a), std::move(b)) or MakeModDefList(MyFactory(), ...)
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    static_assert((std::is_same_v<std::decay_t<Mods>, ModuleDef> && ...),
                  "MakeModDefList: all arguments must be ModuleDef (rvalues or prvalues)");
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(Mods));
    (list.push_back(std::forward<Mods>(mods)), ...);
    return list;
}

/** @brief True while a LifecycleGuard owns the application lifecycle. */
[[nodiscard]] ZONECHAT_CORE_EXPORT bool IsAppInitialized() noexcept;

class ZONECHAT_CORE_EXPORT LifecycleGuard
{
  public:
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules);
    ~LifecycleGuard() noexcept;

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /** @brief True if this guard started the modules (and will shut them down). */
    [[nodiscard]] bool is_owner() const noexcept { return m_owner; }

  private:
    std::vector<ModuleDef> m_started; // startup order
    bool m_owner{false};
};

} // namespace zonechat::utils
