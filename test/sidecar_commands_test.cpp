#include <gtest/gtest.h>
#include <pipali_shell/sidecar_commands.h>
#include <pipali/error_types.h>
#include "test_helpers.h"

using pipali_shell::SidecarCommands;
using pipali_test::FakeInstallation;
namespace fs = std::filesystem;

TEST(SidecarCommands, ReportsConfiguration) {
    FakeInstallation install;
    install.config.port = 7400;
    pipali::SidecarManager manager(install.config);
    SidecarCommands commands(manager);

    EXPECT_EQ(commands.get_port(), 7400);
    EXPECT_EQ(commands.get_host(), "127.0.0.1");
    EXPECT_EQ(commands.get_config(), (pipali::json{{"host", "127.0.0.1"}, {"port", 7400}}));
}

#ifndef _WIN32

TEST(SidecarCommands, LifecycleReturnsOk) {
    FakeInstallation install;
    pipali::SidecarManager manager(install.config);
    manager.set_settle_delay(std::chrono::milliseconds(10));
    SidecarCommands commands(manager);

    pipali::json started = commands.start();
    EXPECT_TRUE(SidecarCommands::is_ok(started)) << started.dump();
    EXPECT_TRUE(manager.is_running());

    EXPECT_TRUE(SidecarCommands::is_ok(commands.restart()));
    EXPECT_TRUE(manager.is_running());

    EXPECT_TRUE(SidecarCommands::is_ok(commands.stop()));
    EXPECT_FALSE(manager.is_running());

    // Stopping again is still fine
    EXPECT_TRUE(SidecarCommands::is_ok(commands.stop()));
}

TEST(SidecarCommands, StartFailureIsReportedAsError) {
    FakeInstallation install;
    fs::remove(fs::path(install.config.resource_dir) / "server" / "index.js");
    pipali::SidecarManager manager(install.config);
    SidecarCommands commands(manager);

    pipali::json result = commands.start();

    EXPECT_FALSE(SidecarCommands::is_ok(result));
    ASSERT_TRUE(result.contains("error"));
    EXPECT_EQ(result["error"]["type"], pipali::ErrorType::INSTALLATION_ERROR);
    EXPECT_NE(result["error"]["message"].get<std::string>().find("index.js"), std::string::npos);
    EXPECT_FALSE(manager.is_running());
}

#endif
