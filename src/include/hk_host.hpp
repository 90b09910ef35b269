#pragma once
/**
 * @file hk_host.hpp
 * @brief Layer 3: Host session management built on hk_service.
 *
 * Platform binding interface and handles, document registry, access lock, view-state
 * preservation, the session and its leases, the process guardian, configuration and the
 * `HostKeeper` composition root.
 */
#include "hk_service.hpp"

#include "host/access_lock.hpp"
#include "host/binding_thread.hpp"
#include "host/document_lease.hpp"
#include "host/document_registry.hpp"
#include "host/host_binding.hpp"
#include "host/host_config.hpp"
#include "host/host_errors.hpp"
#include "host/host_handle.hpp"
#include "host/host_keeper.hpp"
#include "host/host_session.hpp"
#include "host/process_guardian.hpp"
#include "host/process_table.hpp"
#include "host/view_state.hpp"
