#include <gtest/gtest.h>
#include <pipali/launch_spec.h>
#include <algorithm>
#include <filesystem>

using namespace pipali;
namespace fs = std::filesystem;

namespace {

utils::ServerResources make_resources() {
    utils::ServerResources resources;
    resources.resource_root = "/opt/pipali/resources";
    resources.entry_point = "/opt/pipali/resources/server/index.js";
    return resources;
}

utils::DataDirectory make_data_dir() {
    utils::DataDirectory data_dir;
    data_dir.path = "/home/me/.local/share/ai.pipali.desktop";
    return data_dir;
}

} // namespace

TEST(LaunchSpec, CommandLine) {
    LaunchSpec spec = build_launch_spec("/opt/pipali/bun", make_resources(), make_data_dir(), "127.0.0.1", 6464);

    EXPECT_EQ(spec.executable, "/opt/pipali/bun");
    std::vector<std::string> expected = {
        "run", "/opt/pipali/resources/server/index.js",
        "--port", "6464",
        "--host", "127.0.0.1"
    };
    EXPECT_EQ(spec.args, expected);
}

TEST(LaunchSpec, PlatformUrlIsAppendedWhenSet) {
    LaunchSpec spec = build_launch_spec("/opt/pipali/bun", make_resources(), make_data_dir(),
                                        "127.0.0.1", 6464, "https://platform.example");

    ASSERT_GE(spec.args.size(), 2u);
    EXPECT_EQ(spec.args[spec.args.size() - 2], "--platform-url");
    EXPECT_EQ(spec.args.back(), "https://platform.example");
}

TEST(LaunchSpec, Environment) {
    LaunchSpec spec = build_launch_spec("/opt/pipali/bun", make_resources(), make_data_dir(), "127.0.0.1", 6464);

    EXPECT_EQ(spec.env.at("NODE_USE_SYSTEM_CA"), "1");
    EXPECT_EQ(spec.env.at("NODE_ENV"), "production");
    EXPECT_EQ(spec.env.at("PIPALI_DATA_DIR"), "/home/me/.local/share/ai.pipali.desktop");
    EXPECT_EQ(spec.env.at("POSTGRES_DB"),
              (fs::path("/home/me/.local/share/ai.pipali.desktop") / "pipali.db").string());
    EXPECT_EQ(spec.env.at("PIPALI_BUNDLED_RUNTIMES_DIR"), "/opt/pipali");
    EXPECT_EQ(spec.env.at("PIPALI_SERVER_RESOURCE_DIR"), "/opt/pipali/resources");
}

TEST(LaunchSpec, WorkingDirectoryIsDataDirectory) {
    LaunchSpec spec = build_launch_spec("/opt/pipali/bun", make_resources(), make_data_dir(), "::1", 7000);

    EXPECT_EQ(spec.working_dir, "/home/me/.local/share/ai.pipali.desktop");
    EXPECT_NE(std::find(spec.args.begin(), spec.args.end(), "::1"), spec.args.end());
    EXPECT_NE(std::find(spec.args.begin(), spec.args.end(), "7000"), spec.args.end());
}
