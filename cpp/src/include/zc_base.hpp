#pragma once
/**
 * @file zc_base.hpp
 * @brief Layer 1: basic building blocks with no runtime state.
 *
 * Provides format_tools, the Result type and module_def for lifecycle
 * module registration.
 */
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <fmt/chrono.h>

#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"
#include "utils/result.hpp"
