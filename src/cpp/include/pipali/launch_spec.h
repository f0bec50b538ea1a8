#pragma once

#include "utils/path_utils.h"
#include <string>
#include <vector>
#include <map>

namespace pipali {

// Fully assembled sidecar command line. Built fresh for every launch.
struct LaunchSpec {
    std::string executable;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string working_dir;
};

/**
 * Build the sidecar invocation:
 *   <runtime> run <entry_point> --port <port> --host <host> [--platform-url <url>]
 * with an environment selecting the system CA store, production mode, and
 * absolute paths for the data directory, the bundled runtime directory and
 * the server resource root. The working directory is the data directory.
 */
LaunchSpec build_launch_spec(const std::string& runtime,
                             const utils::ServerResources& resources,
                             const utils::DataDirectory& data_dir,
                             const std::string& host,
                             int port,
                             const std::string& platform_url = "");

} // namespace pipali
