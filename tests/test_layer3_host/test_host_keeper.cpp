// tests/test_layer3_host/test_host_keeper.cpp
#include "host_test_fixture.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <chrono>
#include <future>
#include <thread>

using namespace hostkeeper::host;
using hostkeeper::tests::HostTestBase;
using hostkeeper::tests::helper::FakeProcessKiller;
using hostkeeper::tests::helper::FakeProcessLister;
using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

class HostKeeperTest : public HostTestBase
{
  protected:
    void SetUp() override
    {
        HostTestBase::SetUp();
        config.host_image_name = "excel";
        config.install_exit_hook = false;
        config.stop_release_passes = 1;
        config.cleanup_release_passes = 1;
    }

    std::unique_ptr<HostKeeper> MakeKeeper()
    {
        return std::make_unique<HostKeeper>(config, binding,
                                            ProcessListerChain{std::make_shared<FakeProcessLister>(table)},
                                            ProcessKillerChain{std::make_shared<FakeProcessKiller>(table)});
    }

    HostConfig config;
};

TEST_F(HostKeeperTest, WiresConfigThrough)
{
    config.visible = true;
    config.session_stop_wait_ms = 250;
    auto keeper = MakeKeeper();
    EXPECT_EQ(keeper->guardian().image_name(), "excel");
    EXPECT_EQ(keeper->guardian().session_wait(), std::chrono::milliseconds(250));
    EXPECT_TRUE(keeper->session().options().visible);
    EXPECT_EQ(keeper->session().options().release_passes, 1u);
    EXPECT_FALSE(keeper->status().running);
}

TEST_F(HostKeeperTest, EnsureSessionStartsOnce)
{
    auto keeper = MakeKeeper();
    HostSession &first = keeper->ensure_session();
    HostSession &second = keeper->ensure_session();
    EXPECT_EQ(&first, &second);
    EXPECT_TRUE(first.running());
    EXPECT_EQ(binding->calls("create_instance"), 1);
    EXPECT_EQ(keeper->guardian().tracked_count(), 1u);
}

TEST_F(HostKeeperTest, EnsureSessionRestartsDeadHost)
{
    auto keeper = MakeKeeper();
    keeper->ensure_session();
    binding->kill_instance();

    HostSession &session = keeper->ensure_session();
    EXPECT_TRUE(session.running());
    EXPECT_EQ(binding->calls("create_instance"), 2);
    EXPECT_TRUE(binding->instance_running());
}

TEST_F(HostKeeperTest, WithDocumentRunsAndReleases)
{
    auto keeper = MakeKeeper();
    const auto path = File("tool.xlsx");

    auto seen = keeper->with_document(path, {},
                                      [&](const DocumentEntry &entry)
                                      {
                                          EXPECT_TRUE(binding->is_open(path));
                                          return entry.path;
                                      });
    EXPECT_EQ(seen, path);
    EXPECT_FALSE(binding->is_open(path));
    EXPECT_THAT(binding->saved_paths(), IsEmpty());
}

TEST_F(HostKeeperTest, WithDocumentCanSave)
{
    auto keeper = MakeKeeper();
    const auto path = File("tool.xlsx");
    keeper->with_document(path, {}, [](const DocumentEntry &) {}, /*save_on_release=*/true);
    EXPECT_THAT(binding->saved_paths(), ElementsAre(path));
}

TEST_F(HostKeeperTest, WithDocumentReleasesWhenToolThrows)
{
    auto keeper = MakeKeeper();
    const auto path = File("tool.xlsx");
    EXPECT_THROW(keeper->with_document(path, {},
                                       [](const DocumentEntry &) -> int
                                       { throw std::runtime_error("range out of bounds"); }),
                 std::runtime_error);
    EXPECT_FALSE(binding->is_open(path));
    EXPECT_EQ(keeper->session().tracked_count(), 0u);
}

TEST_F(HostKeeperTest, WithDocumentOnMissingFile)
{
    auto keeper = MakeKeeper();
    try
    {
        keeper->with_document(MissingFile("absent.xlsx"), {}, [](const DocumentEntry &) {});
        FAIL() << "expected DocumentNotFound";
    }
    catch (const HostError &e)
    {
        EXPECT_EQ(e.kind(), HostErrorKind::DocumentNotFound);
    }
}

TEST_F(HostKeeperTest, ForcedShutdownCleansUp)
{
    auto keeper = MakeKeeper();
    keeper->ensure_session();
    ASSERT_EQ(table->count_image("excel"), 1u);

    auto result = keeper->shutdown();
    EXPECT_TRUE(result.success);
    EXPECT_TRUE(result.forced);
    EXPECT_THAT(result.errors, IsEmpty());
    EXPECT_FALSE(keeper->status().running);
    EXPECT_EQ(table->count_image("excel"), 0u);

    const auto j = result.to_json();
    EXPECT_EQ(j.at("success"), true);
    EXPECT_TRUE(j.at("errors").is_null());
    EXPECT_EQ(j.at("forced"), true);
}

TEST_F(HostKeeperTest, GentleShutdownSkipsGuardian)
{
    auto keeper = MakeKeeper();
    keeper->ensure_session();
    auto result = keeper->shutdown(false);
    EXPECT_TRUE(result.success);
    EXPECT_FALSE(result.forced);
    EXPECT_FALSE(binding->instance_running());
    // The quit host's process would exit on its own; the fake one stays in the table.
    EXPECT_EQ(keeper->guardian().tracked_count(), 1u);
}

TEST_F(HostKeeperTest, ShutdownReportsFailures)
{
    auto keeper = MakeKeeper();
    keeper->ensure_session();
    binding->fail_on("quit");

    auto result = keeper->shutdown(true);
    binding->clear_failures();
    EXPECT_FALSE(result.success);
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_THAT(result.errors[0], StartsWith("session stop: quit: "));

    const auto j = result.to_json();
    EXPECT_EQ(j.at("success"), false);
    ASSERT_TRUE(j.at("errors").is_array());
    EXPECT_EQ(j.at("errors").size(), 1u);
}

TEST_F(HostKeeperTest, ShutdownGivesUpOnBusySession)
{
    config.session_stop_wait_ms = 50;
    auto keeper = MakeKeeper();
    keeper->ensure_session();

    std::promise<void> held;
    std::promise<void> finish;
    auto finished = finish.get_future();
    std::thread busy(
        [&]()
        {
            std::lock_guard<SingletonAccessLock> lock(keeper->session().access_lock());
            held.set_value();
            finished.wait();
        });
    held.get_future().wait();

    auto result = keeper->shutdown(true);
    finish.set_value();
    busy.join();

    EXPECT_FALSE(result.success);
    EXPECT_THAT(result.errors, Contains(StartsWith("session stop: session busy")));
    EXPECT_THAT(result.errors, Contains(HasSubstr("force cleanup: stop session: session busy")));
    EXPECT_EQ(table->count_image("excel"), 0u);
}

TEST_F(HostKeeperTest, StatusAfterLease)
{
    auto keeper = MakeKeeper();
    const auto path = File("status.xlsx");
    (void)keeper->ensure_session().lease_document(path);
    auto status = keeper->status();
    EXPECT_TRUE(status.running);
    EXPECT_THAT(status.open_paths, ElementsAre(path));
}
