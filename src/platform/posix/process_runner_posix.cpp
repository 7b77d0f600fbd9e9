#include "browser_interface/platform/process_runner.hpp"
#include "browser_interface/utils/logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/wait.h>
#include <unistd.h>

namespace browser_interface::platform {

namespace {

class FileDescriptor {
public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : m_fd(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return m_fd; }

    void reset() {
        if (m_fd >= 0) {
            ::close(m_fd);
            m_fd = -1;
        }
    }

private:
    int m_fd = -1;
};

std::string errno_message(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

class PosixProcessRunner : public ProcessRunner {
public:
    std::expected<int, core::BrowserError> run(const ProcessRequest& request) override {
        std::vector<char*> argv;
        argv.reserve(request.arguments.size() + 2);
        argv.push_back(const_cast<char*>(request.program.c_str()));
        for (const auto& argument : request.arguments) {
            argv.push_back(const_cast<char*>(argument.c_str()));
        }
        argv.push_back(nullptr);

        int stdin_pipe[2] = {-1, -1};
        if (request.standard_input && ::pipe(stdin_pipe) == -1) {
            BI_LOG_ERROR("ProcessRunner", errno_message("Failed to create stdin pipe"));
            return std::unexpected(core::BrowserError::LaunchFailed);
        }
        FileDescriptor read_end(stdin_pipe[0]);
        FileDescriptor write_end(stdin_pipe[1]);

        pid_t pid = ::fork();
        if (pid == 0) {
            // Child process
            if (read_end.get() >= 0) {
                ::dup2(read_end.get(), STDIN_FILENO);
                ::close(read_end.get());
                ::close(write_end.get());
            }
            ::execvp(argv[0], argv.data());
            // If execvp returns, it failed
            _exit(EXIT_CODE_NOT_EXECUTABLE);
        } else if (pid < 0) {
            BI_LOG_ERROR("ProcessRunner", errno_message("Failed to fork process"));
            return std::unexpected(core::BrowserError::LaunchFailed);
        }

        // Parent process
        read_end.reset();
        if (request.standard_input) {
            // A shell that exits early must not kill us with SIGPIPE
            auto previous = std::signal(SIGPIPE, SIG_IGN);
            if (!write_all(write_end.get(), *request.standard_input)) {
                BI_LOG_WARNING("ProcessRunner", errno_message("Failed to write to child stdin"));
            }
            std::signal(SIGPIPE, previous);
            write_end.reset();
        }

        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid, &status, 0);
        } while (result == -1 && errno == EINTR);

        if (result == -1) {
            BI_LOG_ERROR("ProcessRunner", errno_message("Failed to wait for " + request.program));
            return std::unexpected(core::BrowserError::LaunchFailed);
        }

        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }
};

} // namespace

std::unique_ptr<ProcessRunner> create_process_runner() {
    return std::make_unique<PosixProcessRunner>();
}

} // namespace browser_interface::platform
