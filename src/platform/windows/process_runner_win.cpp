#include "browser_interface/platform/process_runner.hpp"
#include "browser_interface/utils/logger.hpp"

#include <windows.h>
#include <cstdio>

namespace browser_interface::platform {

namespace {

std::wstring to_wide(const std::string& text) {
    if (text.empty()) {
        return {};
    }
    int size = MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), nullptr, 0);
    std::wstring wide(static_cast<size_t>(size), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, text.data(), static_cast<int>(text.size()), wide.data(), size);
    return wide;
}

// Quotes one argument following the CommandLineToArgvW rules
std::wstring quote_argument(const std::wstring& argument) {
    if (!argument.empty() && argument.find_first_of(L" \t\"") == std::wstring::npos) {
        return argument;
    }

    std::wstring quoted = L"\"";
    size_t backslashes = 0;
    for (wchar_t c : argument) {
        if (c == L'\\') {
            ++backslashes;
        } else if (c == L'"') {
            quoted.append(backslashes * 2 + 1, L'\\');
            quoted.push_back(c);
            backslashes = 0;
        } else {
            quoted.append(backslashes, L'\\');
            quoted.push_back(c);
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, L'\\');
    quoted.push_back(L'"');
    return quoted;
}

std::wstring build_command_line(const ProcessRequest& request) {
    std::wstring command_line = quote_argument(to_wide(request.program));
    for (const auto& argument : request.arguments) {
        command_line += L' ';
        command_line += quote_argument(to_wide(argument));
    }
    return command_line;
}

class WindowsProcessRunner : public ProcessRunner {
public:
    std::expected<int, core::BrowserError> run(const ProcessRequest& request) override {
        if (request.standard_input) {
            return run_with_input(request);
        }

        std::wstring command_line = build_command_line(request);

        STARTUPINFOW startup_info{};
        startup_info.cb = sizeof(startup_info);
        PROCESS_INFORMATION process_info{};

        if (!CreateProcessW(nullptr, command_line.data(), nullptr, nullptr, FALSE,
                            CREATE_NO_WINDOW, nullptr, nullptr, &startup_info, &process_info)) {
            DWORD error = GetLastError();
            if (error == ERROR_FILE_NOT_FOUND || error == ERROR_PATH_NOT_FOUND) {
                return EXIT_CODE_NOT_EXECUTABLE;
            }
            BI_LOG_ERROR("ProcessRunner", "CreateProcessW failed with error " + std::to_string(error));
            return std::unexpected(core::BrowserError::LaunchFailed);
        }

        WaitForSingleObject(process_info.hProcess, INFINITE);

        DWORD exit_code = 1;
        GetExitCodeProcess(process_info.hProcess, &exit_code);
        CloseHandle(process_info.hThread);
        CloseHandle(process_info.hProcess);

        return static_cast<int>(exit_code);
    }

private:
    // Feeds the text to the child's stdin as if typed at a prompt
    std::expected<int, core::BrowserError> run_with_input(const ProcessRequest& request) {
        std::wstring command_line = build_command_line(request);

        FILE* pipe = _wpopen(command_line.c_str(), L"w");
        if (!pipe) {
            BI_LOG_ERROR("ProcessRunner", "Failed to open pipe to " + request.program);
            return std::unexpected(core::BrowserError::LaunchFailed);
        }

        const auto& input = *request.standard_input;
        if (std::fwrite(input.data(), 1, input.size(), pipe) != input.size()) {
            BI_LOG_WARNING("ProcessRunner", "Failed to write to child stdin");
        }

        return _pclose(pipe);
    }
};

} // namespace

std::unique_ptr<ProcessRunner> create_process_runner() {
    return std::make_unique<WindowsProcessRunner>();
}

} // namespace browser_interface::platform
