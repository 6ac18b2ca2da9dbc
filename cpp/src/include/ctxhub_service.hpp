#pragma once
/**
 * @file ctxhub_service.hpp
 * @brief Layer 2: Lifecycle-managed services.
 *
 * Every service in this layer publishes a `GetLifecycleModule()` and must be
 * started through a LifecycleGuard before use; calling one early is a panic.
 */

#include "ctxhub_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/file_lock.hpp"
#include "utils/logger.hpp"
#include "utils/json_store.hpp"
