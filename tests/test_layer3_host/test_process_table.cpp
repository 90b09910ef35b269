// tests/test_layer3_host/test_process_table.cpp
/**
 * @file test_process_table.cpp
 * @brief Image-name matching, `ps` line parsing, and the real OS strategies run against a
 *        child process this test forks.
 */
#include "hk_host.hpp"
#include "gtest/gtest.h"

#include <algorithm>
#include <chrono>
#include <thread>

#if defined(HOSTKEEPER_IS_POSIX)
#include <csignal>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

using namespace hostkeeper::host;

TEST(ImageMatchTest, CaseInsensitive)
{
    EXPECT_TRUE(matches_image("EXCEL.EXE", "excel.exe"));
    EXPECT_TRUE(matches_image("excel", "Excel"));
    EXPECT_FALSE(matches_image("excel", "excel.exe"));
    EXPECT_FALSE(matches_image("", "excel"));
    EXPECT_FALSE(matches_image("excel", ""));
}

TEST(ImageMatchTest, AcceptsTruncatedComm)
{
    // Linux keeps the first 15 characters of the executable name.
    EXPECT_TRUE(matches_image("soffice-headles", "soffice-headless-host"));
    EXPECT_FALSE(matches_image("soffice-headle", "soffice-headless-host"));
    // A 15-character name only matches itself.
    EXPECT_FALSE(matches_image("abcdefghijklmno", "abcdefghijklmn"));
}

TEST(PsLineTest, ParsesColumns)
{
    auto info = parse_ps_line("  4242     1 excel");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pid, 4242u);
    EXPECT_EQ(info->parent_pid, 1u);
    EXPECT_EQ(info->image_name, "excel");
}

TEST(PsLineTest, StripsDirectoryAndKeepsSpacesInName)
{
    auto info = parse_ps_line("17 2 /usr/lib/office/soffice.bin");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->image_name, "soffice.bin");

    info = parse_ps_line("18\t2\tWeb Content");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->image_name, "Web Content");
}

TEST(PsLineTest, RejectsMalformedLines)
{
    EXPECT_FALSE(parse_ps_line("").has_value());
    EXPECT_FALSE(parse_ps_line("   ").has_value());
    EXPECT_FALSE(parse_ps_line("42").has_value());
    EXPECT_FALSE(parse_ps_line("42 1").has_value());
    EXPECT_FALSE(parse_ps_line("pid ppid comm").has_value());
    EXPECT_FALSE(parse_ps_line("42 x excel").has_value());
    EXPECT_FALSE(parse_ps_line("-5 1 excel").has_value());
}

TEST(ProcessStrategyTest, DefaultChainsAreNativeFirst)
{
    auto listers = default_process_listers();
    auto killers = default_process_killers();
    ASSERT_EQ(listers.size(), 2u);
    ASSERT_EQ(killers.size(), 2u);
    EXPECT_EQ(listers[0]->name(), "native");
    EXPECT_EQ(listers[1]->name(), "command");
    EXPECT_EQ(killers[0]->name(), "native");
    EXPECT_EQ(killers[1]->name(), "command");
}

#if defined(HOSTKEEPER_IS_POSIX)

namespace
{
// A child that sleeps until killed.
pid_t spawn_sleeper()
{
    const pid_t pid = ::fork();
    if (pid == 0)
    {
        ::execlp("sleep", "sleep", "30", static_cast<char *>(nullptr));
        ::_exit(127);
    }
    return pid;
}

const ProcessInfo *find_pid(const std::vector<ProcessInfo> &table, uint64_t pid)
{
    auto it = std::find_if(table.begin(), table.end(), [pid](const ProcessInfo &p) { return p.pid == pid; });
    return it == table.end() ? nullptr : &*it;
}

// Waits until the child has exec'd, so its image name is "sleep".
bool wait_for_image(ProcessLister &lister, uint64_t pid, const std::string &image)
{
    for (int i = 0; i < 200; ++i)
    {
        if (auto table = lister.list())
        {
            const auto *p = find_pid(*table, pid);
            if (p && p->image_name == image)
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

int reap(pid_t pid)
{
    int status = 0;
    if (::waitpid(pid, &status, 0) != pid)
        return -1;
    return WIFSIGNALED(status) ? WTERMSIG(status) : -1;
}
} // namespace

class OsProcessStrategyTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        child = spawn_sleeper();
        ASSERT_GT(child, 0);
    }

    void TearDown() override
    {
        if (child > 0)
        {
            ::kill(child, SIGKILL);
            ::waitpid(child, nullptr, 0);
        }
    }

    pid_t child = -1;
};

#if defined(HOSTKEEPER_PLATFORM_LINUX)
TEST_F(OsProcessStrategyTest, NativeListerSeesChildWithParent)
{
    NativeProcessLister lister;
    ASSERT_TRUE(wait_for_image(lister, static_cast<uint64_t>(child), "sleep"));
    auto table = lister.list();
    ASSERT_TRUE(table.has_value());
    const auto *p = find_pid(*table, static_cast<uint64_t>(child));
    ASSERT_NE(p, nullptr);
    EXPECT_EQ(p->parent_pid, hostkeeper::platform::get_pid());
    EXPECT_NE(find_pid(*table, hostkeeper::platform::get_pid()), nullptr);
}
#endif

TEST_F(OsProcessStrategyTest, CommandListerSeesChild)
{
    CommandProcessLister lister;
    if (!lister.list())
    {
        GTEST_SKIP() << "'ps' is not available here";
    }
    ASSERT_TRUE(wait_for_image(lister, static_cast<uint64_t>(child), "sleep"));
}

TEST_F(OsProcessStrategyTest, NativeKillerTerminatesChild)
{
    NativeProcessKiller killer;
    EXPECT_TRUE(killer.kill(static_cast<uint64_t>(child)));
    EXPECT_EQ(reap(child), SIGKILL);
    const auto gone = static_cast<uint64_t>(child);
    child = -1;
    // Already gone counts as success.
    EXPECT_TRUE(killer.kill(gone));
}

TEST_F(OsProcessStrategyTest, CommandKillerTerminatesChild)
{
    CommandProcessKiller killer;
    EXPECT_TRUE(killer.kill(static_cast<uint64_t>(child)));
    EXPECT_EQ(reap(child), SIGKILL);
    child = -1;
}

#endif // HOSTKEEPER_IS_POSIX
