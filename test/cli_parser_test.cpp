#include <gtest/gtest.h>
#include <pipali_shell/cli_parser.h>
#include <vector>

using pipali_shell::CLIParser;

namespace {

int parse(CLIParser& parser, std::vector<std::string> args) {
    args.insert(args.begin(), "pipali-shell");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    return parser.parse(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(CLIParser, DefaultsComeFromEnvironmentConfig) {
    pipali::SidecarConfig defaults;
    defaults.port = 7001;
    defaults.host = "0.0.0.0";

    CLIParser parser(defaults);
    ASSERT_EQ(parse(parser, {}), 0);

    EXPECT_TRUE(parser.should_continue());
    EXPECT_EQ(parser.get_options().command, "run");
    EXPECT_EQ(parser.get_options().sidecar.port, 7001);
    EXPECT_EQ(parser.get_options().sidecar.host, "0.0.0.0");
}

TEST(CLIParser, CommandLineOverridesDefaults) {
    pipali::SidecarConfig defaults;
    defaults.port = 7001;

    CLIParser parser(defaults);
    ASSERT_EQ(parse(parser, {"--port", "7500", "--data-dir", "/tmp/pipali", "--log-level", "debug"}), 0);

    EXPECT_EQ(parser.get_options().sidecar.port, 7500);
    EXPECT_EQ(parser.get_options().sidecar.data_dir, "/tmp/pipali");
    EXPECT_EQ(parser.get_options().sidecar.log_level, "debug");
}

TEST(CLIParser, SubcommandsWithTrailingOptions) {
    CLIParser parser{pipali::SidecarConfig()};
    ASSERT_EQ(parse(parser, {"status", "--port", "7600"}), 0);

    EXPECT_EQ(parser.get_options().command, "status");
    EXPECT_EQ(parser.get_options().sidecar.port, 7600);
}

TEST(CLIParser, RejectsOutOfRangePort) {
    CLIParser parser{pipali::SidecarConfig()};
    EXPECT_NE(parse(parser, {"--port", "70000"}), 0);
    EXPECT_FALSE(parser.should_continue());
}

TEST(CLIParser, RejectsUnknownLogLevel) {
    CLIParser parser{pipali::SidecarConfig()};
    EXPECT_NE(parse(parser, {"--log-level", "verbose"}), 0);
    EXPECT_FALSE(parser.should_continue());
}

TEST(CLIParser, VersionFlag) {
    CLIParser parser{pipali::SidecarConfig()};
    ASSERT_EQ(parse(parser, {"--version"}), 0);
    EXPECT_TRUE(parser.should_continue());
    EXPECT_TRUE(parser.should_show_version());
}
