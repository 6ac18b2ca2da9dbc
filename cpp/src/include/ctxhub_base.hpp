#pragma once
/**
 * @file ctxhub_base.hpp
 * @brief Layer 1: Basic utilities with no lifecycle of their own.
 *
 * Pulls in the platform layer plus formatting, debug/panic, scope guard and the
 * module definition type used by the lifecycle layer. Nothing here needs a
 * LifecycleGuard to be usable.
 */

#include "ctxhub_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

// format_tools must precede debug_info (debug::where uses filename_only).
#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/scope_guard.hpp"
#include "utils/module_def.hpp"
