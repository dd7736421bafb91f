/**
 * @file process_utils.cpp
 * @brief fork/execvp process runner with poll-based output capture
 *
 * @date 2025
 */

#include "quantlab/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace quantlab {
namespace utils {

namespace {

// ============================================================================
// INTERNAL HELPERS
// ============================================================================

/// Pipe pair that closes whatever ends are still open
class Pipe {
public:
    Pipe() {
        if (pipe2(fds_, O_CLOEXEC) != 0) {
            throw std::runtime_error(std::string("Failed to create pipe: ") + std::strerror(errno));
        }
    }

    ~Pipe() {
        CloseRead();
        CloseWrite();
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int ReadEnd() const { return fds_[0]; }
    int WriteEnd() const { return fds_[1]; }

    void CloseRead() {
        if (fds_[0] >= 0) {
            close(fds_[0]);
            fds_[0] = -1;
        }
    }

    void CloseWrite() {
        if (fds_[1] >= 0) {
            close(fds_[1]);
            fds_[1] = -1;
        }
    }

private:
    int fds_[2] = {-1, -1};
};

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, []() { std::signal(SIGPIPE, SIG_IGN); });
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

CommandResult RunProcess(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        throw std::invalid_argument("RunProcess requires at least a program name");
    }

    IgnoreSigpipeOnce();

    Pipe stdin_pipe;
    Pipe stdout_pipe;
    Pipe stderr_pipe;
    Pipe exec_status_pipe;  // Child writes errno here if execvp fails

    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        dup2(stdin_pipe.ReadEnd(), STDIN_FILENO);
        dup2(stdout_pipe.WriteEnd(), STDOUT_FILENO);
        dup2(stderr_pipe.WriteEnd(), STDERR_FILENO);

        if (options.working_dir && chdir(options.working_dir->c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(exec_status_pipe.WriteEnd(), &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvp(c_argv[0], c_argv.data());

        int err = errno;
        ssize_t ignored = write(exec_status_pipe.WriteEnd(), &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    stdin_pipe.CloseRead();
    stdout_pipe.CloseWrite();
    stderr_pipe.CloseWrite();
    exec_status_pipe.CloseWrite();

    CommandResult result;

    int exec_errno = 0;
    ssize_t status_bytes = read(exec_status_pipe.ReadEnd(), &exec_errno, sizeof(exec_errno));
    bool exec_failed = status_bytes == static_cast<ssize_t>(sizeof(exec_errno));

    const std::string payload = options.stdin_data.value_or("");
    std::size_t written = 0;
    if (exec_failed || payload.empty()) {
        stdin_pipe.CloseWrite();
    } else {
        fcntl(stdin_pipe.WriteEnd(), F_SETFL, O_NONBLOCK);
    }

    bool stdout_open = true;
    bool stderr_open = true;
    char buffer[8192];

    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (options.timeout) {
        deadline = std::chrono::steady_clock::now() + *options.timeout;
    }

    while (stdout_open || stderr_open) {
        std::vector<pollfd> fds;
        if (stdout_open) fds.push_back({stdout_pipe.ReadEnd(), POLLIN, 0});
        if (stderr_open) fds.push_back({stderr_pipe.ReadEnd(), POLLIN, 0});
        if (stdin_pipe.WriteEnd() >= 0) fds.push_back({stdin_pipe.WriteEnd(), POLLOUT, 0});

        int wait_ms = -1;
        if (deadline) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                *deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                spdlog::warn("{} exceeded {}ms, killing it", argv[0], options.timeout->count());
                kill(pid, SIGKILL);
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(std::min<long long>(remaining, 1000 * 60 * 60));
        }

        int ready = poll(fds.data(), fds.size(), wait_ms);
        if (ready == 0) {
            continue;
        }
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            spdlog::error("poll failed while reading child output: {}", std::strerror(errno));
            break;
        }

        for (const auto& entry : fds) {
            if (entry.revents == 0) {
                continue;
            }

            if (entry.fd == stdin_pipe.WriteEnd()) {
                ssize_t n = write(entry.fd, payload.data() + written, payload.size() - written);
                if (n > 0) {
                    written += static_cast<std::size_t>(n);
                }
                if (n < 0 && errno != EAGAIN && errno != EINTR) {
                    stdin_pipe.CloseWrite();  // Child stopped reading
                } else if (written >= payload.size()) {
                    stdin_pipe.CloseWrite();
                }
                continue;
            }

            ssize_t n = read(entry.fd, buffer, sizeof(buffer));
            if (n > 0) {
                if (entry.fd == stdout_pipe.ReadEnd()) {
                    result.output.append(buffer, static_cast<std::size_t>(n));
                } else {
                    result.error.append(buffer, static_cast<std::size_t>(n));
                }
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                if (entry.fd == stdout_pipe.ReadEnd()) {
                    stdout_open = false;
                } else {
                    stderr_open = false;
                }
            }
        }
    }

    stdin_pipe.CloseWrite();

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }

    if (exec_failed) {
        result.launched = false;
        result.exit_code = 127;
        result.error = "Failed to execute " + argv[0] + ": " + std::strerror(exec_errno);
        spdlog::debug("{}", result.error);
        return result;
    }

    result.launched = true;
    result.exit_code = DecodeWaitStatus(status);
    return result;
}

bool IsExecutableAvailable(const std::string& name) {
    if (name.empty()) {
        return false;
    }

    if (name.find('/') != std::string::npos) {
        return access(name.c_str(), X_OK) == 0;
    }

    const char* path_env = std::getenv("PATH");
    if (path_env == nullptr) {
        return false;
    }

    std::istringstream paths(path_env);
    std::string dir;
    while (std::getline(paths, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + name;
        if (access(candidate.c_str(), X_OK) == 0) {
            return true;
        }
    }

    return false;
}

std::string FormatCommandLine(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        if (argv[i].find_first_of(" \t\"'") != std::string::npos) {
            oss << '\'' << argv[i] << '\'';
        } else {
            oss << argv[i];
        }
    }
    return oss.str();
}

} // namespace utils
} // namespace quantlab
