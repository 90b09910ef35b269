#pragma once
/**
 * @file hk_service.hpp
 * @brief Layer 2: Service modules built on hk_base.
 *
 * Application lifecycle (LifecycleManager, LifecycleGuard) and the asynchronous Logger.
 */
#include "hk_base.hpp"

#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
