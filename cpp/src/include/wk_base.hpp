#pragma once
/**
 * @file wk_base.hpp
 * @brief Layer 1: header-only basics on top of wk_platform.
 *
 * String helpers, the WK_DEBUG pre-logger channel, the scope guard, Result<T, E>
 * and the ModuleDef used to describe lifecycle modules.
 */
#include "wk_platform.hpp"

#include "utils/debug_info.hpp"
#include "utils/format_tools.hpp"
#include "utils/module_def.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
