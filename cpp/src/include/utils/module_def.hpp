#pragma once
/**
 * @file module_def.hpp
 * @brief Module definition for LifecycleGuard registration.
 */
#include "zonechat_core_export.h"

#include <string>
#include <string_view>
#include <vector>

namespace zonechat::utils
{

/**
 * @brief A function pointer type for module startup and shutdown callbacks.
 *
 * The `arg` pointer is `nullptr` when no argument was supplied.
 */
using LifecycleCallback = void (*)(const char *arg);

/**
 * @class ModuleDef
 * @brief Builder for a lifecycle module definition.
 *
 * Movable but not copyable: once handed to a `LifecycleGuard`, the guard owns it.
 * Names longer than `MAX_MODULE_NAME_LEN` are rejected with `std::length_error`.
 */
class ZONECHAT_CORE_EXPORT ModuleDef
{
  public:
    static constexpr size_t MAX_MODULE_NAME_LEN = 256;

    /**
     * @param name Unique name for this module (e.g. `"Logger"`).
     * @throws std::invalid_argument if `name` is empty.
     * @throws std::length_error     if `name.size() > MAX_MODULE_NAME_LEN`.
     */
    explicit ModuleDef(std::string_view name);

    ModuleDef(ModuleDef &&other) noexcept = default;
    ModuleDef &operator=(ModuleDef &&other) noexcept = default;
    ModuleDef(const ModuleDef &) = delete;
    ModuleDef &operator=(const ModuleDef &) = delete;

    /**
     * @brief Declares a dependency on another module, started before this one and
     *        shut down after it. An empty name is ignored.
     */
    void add_dependency(std::string_view dependency_name);

    void set_startup(LifecycleCallback startup_func);
    void set_startup(LifecycleCallback startup_func, std::string_view arg);
    void set_shutdown(LifecycleCallback shutdown_func);

    [[nodiscard]] const std::string &name() const noexcept { return m_name; }
    [[nodiscard]] const std::vector<std::string> &dependencies() const noexcept
    {
        return m_dependencies;
    }

  private:
    friend class LifecycleGuard;

    std::string m_name;
    std::vector<std::string> m_dependencies;
    LifecycleCallback m_startup{nullptr};
    LifecycleCallback m_shutdown{nullptr};
    std::string m_startup_arg;
    bool m_has_startup_arg{false};
};

} // namespace zonechat::utils
