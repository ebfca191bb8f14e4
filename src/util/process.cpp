#include <pkgindex/process.hpp>

#include <chrono>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pkgindex {

// ---------------------------------------------------------------------------
// Subprocess
// ---------------------------------------------------------------------------

static void drain(int fd, std::string& out) {
    char buf[4096];
    ssize_t n;
    while ((n = read(fd, buf, sizeof(buf))) > 0) {
        out.append(buf, static_cast<size_t>(n));
    }
}

Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir,
                                  int timeout_seconds) {
    if (args.empty()) {
        return IndexError{IndexError::InvalidArg, "run_command: empty args"};
    }

    // Build argv for execvp
    std::vector<const char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];

    if (pipe(stdout_pipe) != 0) {
        return IndexError{IndexError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }
    if (pipe(stderr_pipe) != 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        return IndexError{IndexError::IO,
            std::string("pipe() failed: ") + strerror(errno)};
    }

    pid_t pid = fork();
    if (pid < 0) {
        close(stdout_pipe[0]); close(stdout_pipe[1]);
        close(stderr_pipe[0]); close(stderr_pipe[1]);
        return IndexError{IndexError::IO,
            std::string("fork() failed: ") + strerror(errno)};
    }

    if (pid == 0) {
        // Child process
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);

        if (!working_dir.empty()) {
            if (chdir(working_dir.c_str()) != 0) {
                _exit(127);
            }
        }

        execvp(argv[0], const_cast<char* const*>(argv.data()));
        _exit(127);  // execvp failed
    }

    // Parent process
    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    fcntl(stdout_pipe[0], F_SETFL, O_NONBLOCK);
    fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);

    std::string out_buf, err_buf;
    auto start = std::chrono::steady_clock::now();

    while (true) {
        if (timeout_seconds > 0) {
            auto elapsed = std::chrono::steady_clock::now() - start;
            if (std::chrono::duration_cast<std::chrono::seconds>(elapsed).count()
                    >= timeout_seconds) {
                kill(pid, SIGKILL);
                waitpid(pid, nullptr, 0);
                close(stdout_pipe[0]);
                close(stderr_pipe[0]);
                return IndexError{IndexError::Timeout,
                    "'" + args[0] + "' timed out after " +
                    std::to_string(timeout_seconds) + "s"};
            }
        }

        drain(stdout_pipe[0], out_buf);
        drain(stderr_pipe[0], err_buf);

        int status = 0;
        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            drain(stdout_pipe[0], out_buf);
            drain(stderr_pipe[0], err_buf);
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);

            int exit_code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
            return Result<CommandResult>::ok(
                CommandResult{exit_code, std::move(out_buf), std::move(err_buf)});
        } else if (w < 0) {
            close(stdout_pipe[0]);
            close(stderr_pipe[0]);
            return IndexError{IndexError::IO,
                std::string("waitpid failed: ") + strerror(errno)};
        }

        usleep(1000);  // 1ms
    }
}

Result<CommandResult> SubprocessRunner::run(const std::string& executable,
                                            const std::vector<std::string>& args,
                                            const std::string& working_dir) {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(executable);
    argv.insert(argv.end(), args.begin(), args.end());
    return run_command(argv, working_dir, timeout_seconds_);
}

// ---------------------------------------------------------------------------
// ToolLocator
// ---------------------------------------------------------------------------

ToolLocator ToolLocator::from_environment() {
    const char* path = std::getenv("PATH");
    return ToolLocator(path ? path : "");
}

std::optional<std::string> ToolLocator::find(const std::string& name) const {
    if (name.empty() || name.find('/') != std::string::npos ||
        search_path_.empty()) {
        return std::nullopt;
    }

    size_t pos = 0;
    while (pos <= search_path_.size()) {
        size_t colon = search_path_.find(':', pos);
        std::string dir = search_path_.substr(pos, colon == std::string::npos
                                                       ? std::string::npos
                                                       : colon - pos);
        // An empty entry means the current directory
        if (dir.empty()) dir = ".";

        std::error_code ec;
        fs::path candidate = fs::path(dir) / name;
        if (fs::is_regular_file(candidate, ec) &&
            access(candidate.c_str(), X_OK) == 0) {
            fs::path abs = fs::absolute(candidate, ec);
            if (!ec) return abs.string();
        }

        if (colon == std::string::npos) break;
        pos = colon + 1;
    }
    return std::nullopt;
}

} // namespace pkgindex
