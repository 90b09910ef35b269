// tests/test_layer2_service/workers/lifecycle_workers.cpp
/**
 * @file lifecycle_workers.cpp
 * @brief Worker bodies for the lifecycle tests. The abort scenarios are expected to die.
 */
#include "lifecycle_workers.h"
#include "shared_test_helpers.h"
#include "test_entrypoint.h"
#include "gtest/gtest.h"

#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace hostkeeper::tests::helper;
using namespace hostkeeper::utils;

namespace
{
std::mutex g_events_mutex;
std::vector<std::string> g_events;

void record(std::string_view what, const char *arg)
{
    std::lock_guard<std::mutex> lock(g_events_mutex);
    g_events.push_back(fmt::format("{}:{}", what, arg ? arg : ""));
}

void on_start(const char *arg)
{
    record("start", arg);
}

void on_stop(const char *)
{
    record("stop", "");
}

// Shutdown callbacks get no argument, so the ordering test needs one callback per module.
void stop_logger(const char *)
{
    record("stop", "logger");
}

void stop_guardian(const char *)
{
    record("stop", "guardian");
}

void stop_session(const char *)
{
    record("stop", "session");
}

void throwing_start(const char *)
{
    throw std::runtime_error("binding refused to initialize");
}

ModuleDef make_module(std::string_view name, std::vector<std::string_view> deps = {},
                      LifecycleCallback stop = &on_stop)
{
    ModuleDef m(name);
    for (auto d : deps)
        m.add_dependency(d);
    m.set_startup(&on_start, name);
    m.set_shutdown(stop, std::chrono::milliseconds(1000));
    return m;
}
} // namespace

namespace hostkeeper::tests::worker::lifecycle
{

int startup_and_shutdown_order()
{
    return run_worker_bare(
        []()
        {
            {
                // Registered dependents first to prove the sort does the ordering.
                LifecycleGuard guard(
                    MakeModDefList(make_module("session", {"guardian"}, &stop_session),
                                   make_module("guardian", {"logger"}, &stop_guardian),
                                   make_module("logger", {}, &stop_logger)));
                std::lock_guard<std::mutex> lock(g_events_mutex);
                ASSERT_EQ(g_events.size(), 3u);
                EXPECT_EQ(g_events[0], "start:logger");
                EXPECT_EQ(g_events[1], "start:guardian");
                EXPECT_EQ(g_events[2], "start:session");
            }
            std::lock_guard<std::mutex> lock(g_events_mutex);
            ASSERT_EQ(g_events.size(), 6u);
            EXPECT_EQ(g_events[3], "stop:session");
            EXPECT_EQ(g_events[4], "stop:guardian");
            EXPECT_EQ(g_events[5], "stop:logger");
        },
        "lifecycle::startup_and_shutdown_order");
}

int initialized_and_finalized_flags()
{
    return run_worker_bare(
        []()
        {
            EXPECT_FALSE(LifecycleManager::instance().is_initialized());
            {
                LifecycleGuard guard(make_module("only"));
                EXPECT_TRUE(guard.is_owner());
                EXPECT_TRUE(LifecycleManager::instance().is_initialized());
                EXPECT_FALSE(LifecycleManager::instance().is_finalized());
            }
            EXPECT_TRUE(LifecycleManager::instance().is_finalized());
        },
        "lifecycle::initialized_and_finalized_flags");
}

int second_guard_is_not_owner()
{
    return run_worker_bare(
        []()
        {
            LifecycleGuard first(make_module("first"));
            LifecycleGuard second(make_module("ignored"));
            EXPECT_TRUE(first.is_owner());
            EXPECT_FALSE(second.is_owner());
            std::lock_guard<std::mutex> lock(g_events_mutex);
            ASSERT_EQ(g_events.size(), 1u);
            EXPECT_EQ(g_events[0], "start:first");
        },
        "lifecycle::second_guard_is_not_owner");
}

int init_and_finalize_idempotent()
{
    return run_worker_bare(
        []()
        {
            auto &manager = LifecycleManager::instance();
            manager.register_module(make_module("once"));
            manager.initialize();
            manager.initialize();
            EXPECT_TRUE(LifecycleManager::instance().is_initialized());
            manager.finalize();
            manager.finalize();
            EXPECT_TRUE(LifecycleManager::instance().is_finalized());
            std::lock_guard<std::mutex> lock(g_events_mutex);
            ASSERT_EQ(g_events.size(), 2u);
            EXPECT_EQ(g_events[0], "start:once");
            EXPECT_EQ(g_events[1], "stop:");
        },
        "lifecycle::init_and_finalize_idempotent");
}

int unresolved_dependency_aborts()
{
    LifecycleGuard guard(make_module("session", {"nonexistent"}));
    return 0; // not reached
}

int circular_dependency_aborts()
{
    LifecycleGuard guard(MakeModDefList(make_module("a", {"b"}), make_module("b", {"a"})));
    return 0; // not reached
}

int throwing_startup_aborts()
{
    ModuleDef m("binding");
    m.set_startup(&throwing_start);
    LifecycleGuard guard(std::move(m));
    return 0; // not reached
}

} // namespace hostkeeper::tests::worker::lifecycle

namespace
{
struct LifecycleWorkerRegistrar
{
    LifecycleWorkerRegistrar()
    {
        register_worker_dispatcher(
            [](int argc, char **argv) -> int
            {
                if (argc < 2)
                    return -1;
                std::string_view mode = argv[1];
                auto dot = mode.find('.');
                if (dot == std::string_view::npos || mode.substr(0, dot) != "lifecycle")
                    return -1;
                std::string scenario(mode.substr(dot + 1));
                using namespace hostkeeper::tests::worker::lifecycle;
                if (scenario == "startup_and_shutdown_order")
                    return startup_and_shutdown_order();
                if (scenario == "initialized_and_finalized_flags")
                    return initialized_and_finalized_flags();
                if (scenario == "second_guard_is_not_owner")
                    return second_guard_is_not_owner();
                if (scenario == "init_and_finalize_idempotent")
                    return init_and_finalize_idempotent();
                if (scenario == "unresolved_dependency_aborts")
                    return unresolved_dependency_aborts();
                if (scenario == "circular_dependency_aborts")
                    return circular_dependency_aborts();
                if (scenario == "throwing_startup_aborts")
                    return throwing_startup_aborts();
                fmt::print(stderr, "[WORKER FAILURE] unknown lifecycle scenario '{}'\n", scenario);
                return 1;
            });
    }
};
static LifecycleWorkerRegistrar g_lifecycle_registrar;
} // namespace
