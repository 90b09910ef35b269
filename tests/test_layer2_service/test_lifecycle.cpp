// tests/test_layer2_service/test_lifecycle.cpp
/**
 * @file test_lifecycle.cpp
 * @brief Tests for the module lifecycle (LifecycleManager, LifecycleGuard, ModuleDef).
 *
 * Every scenario runs in a worker: the lifecycle is process-global and the failure scenarios
 * abort the process on purpose.
 */
#include "hk_service.hpp"
#include "shared_test_helpers.h"
#include "test_patterns.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <string>

using namespace hostkeeper::tests::helper;
using ::testing::HasSubstr;

class LifecycleTest : public hostkeeper::tests::IsolatedProcessTest
{
};

TEST_F(LifecycleTest, DependenciesStartFirstAndStopLast)
{
    auto w = SpawnWorker("lifecycle.startup_and_shutdown_order");
    ExpectWorkerOk(w, {"Application initialization complete.",
                       "Application finalization complete."});
}

TEST_F(LifecycleTest, InitializedAndFinalizedFlags)
{
    auto w = SpawnWorker("lifecycle.initialized_and_finalized_flags");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, OnlyFirstGuardOwnsTheLifecycle)
{
    auto w = SpawnWorker("lifecycle.second_guard_is_not_owner");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, InitializeAndFinalizeAreIdempotent)
{
    auto w = SpawnWorker("lifecycle.init_and_finalize_idempotent");
    ExpectWorkerOk(w);
}

TEST_F(LifecycleTest, UnresolvedDependencyAborts)
{
    auto w = SpawnWorker("lifecycle.unresolved_dependency_aborts");
    EXPECT_NE(w.wait_for_exit(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("undefined dependency: 'nonexistent'"));
}

TEST_F(LifecycleTest, CircularDependencyAborts)
{
    auto w = SpawnWorker("lifecycle.circular_dependency_aborts");
    EXPECT_NE(w.wait_for_exit(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("Circular dependency"));
}

TEST_F(LifecycleTest, ThrowingStartupAborts)
{
    auto w = SpawnWorker("lifecycle.throwing_startup_aborts");
    EXPECT_NE(w.wait_for_exit(), 0);
    EXPECT_THAT(w.get_stderr(), HasSubstr("binding refused to initialize"));
}
