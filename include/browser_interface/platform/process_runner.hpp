#pragma once

#include "browser_interface/core/models.hpp"
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace browser_interface::platform {

struct ProcessRequest {
    std::string program;
    std::vector<std::string> arguments;
    // Written to the child's stdin, which is then closed
    std::optional<std::string> standard_input;
};

// Exit code reported when the program could not be executed
inline constexpr int EXIT_CODE_NOT_EXECUTABLE = 127;

// Spawns a process and blocks until it exits
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Exit code of the process; LaunchFailed if it could not be created
    virtual std::expected<int, core::BrowserError> run(const ProcessRequest& request) = 0;
};

std::unique_ptr<ProcessRunner> create_process_runner();

} // namespace browser_interface::platform
