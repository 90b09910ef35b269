#pragma once
/**
 * @file hk_base.hpp
 * @brief Layer 1: Basic modules built on hk_platform.
 *
 * format_tools, debug_info (HK_PANIC / HK_DEBUG), ScopeGuard, Result<T,E>, and module_def for
 * lifecycle registration.
 */
#include "hk_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/result.hpp"
#include "utils/module_def.hpp"
