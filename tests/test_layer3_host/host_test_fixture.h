// tests/test_layer3_host/host_test_fixture.h
#pragma once

#include "hk_host.hpp"
#include "fake_host_binding.h"
#include "fake_process_table.h"
#include "shared_test_helpers.h"
#include "test_patterns.h"

#include <memory>
#include <string>

/**
 * @file host_test_fixture.h
 * @brief Common setup for host-layer tests: a fake binding, a fake process table whose
 *        "excel" processes appear when the fake creates an instance, and a scratch directory
 *        for document files.
 */
namespace hostkeeper::tests
{

class HostTestBase : public PureApiTest
{
  protected:
    void SetUp() override
    {
        PureApiTest::SetUp();
        dir = std::make_unique<helper::TempDir>("host");
        binding = std::make_shared<helper::FakeHostBinding>();
        table = std::make_shared<helper::FakeProcessTable>();
        // Each fresh instance shows up as a child of the test process, like a COM-launched host.
        binding->on_create_instance([t = table]()
                                    { t->spawn("excel", hostkeeper::platform::get_pid()); });
    }

    std::shared_ptr<hostkeeper::host::ProcessGuardian> MakeGuardian(size_t release_passes = 2)
    {
        return std::make_shared<hostkeeper::host::ProcessGuardian>(
            binding, "excel",
            hostkeeper::host::ProcessListerChain{std::make_shared<helper::FakeProcessLister>(table)},
            hostkeeper::host::ProcessKillerChain{std::make_shared<helper::FakeProcessKiller>(table)},
            release_passes);
    }

    /// @brief An existing, empty file in the scratch directory, as a normalized path.
    std::string File(const std::string &name) const
    {
        return hostkeeper::host::DocumentRegistry::normalize_path(dir->touch(name).string());
    }

    /// @brief A path in the scratch directory that does not exist.
    std::string MissingFile(const std::string &name) const
    {
        return hostkeeper::host::DocumentRegistry::normalize_path((dir->path() / name).string());
    }

    std::unique_ptr<helper::TempDir> dir;
    std::shared_ptr<helper::FakeHostBinding> binding;
    std::shared_ptr<helper::FakeProcessTable> table;
};

} // namespace hostkeeper::tests
