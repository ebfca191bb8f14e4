#pragma once

#include <pkgindex/result.hpp>
#include <optional>
#include <string>
#include <vector>

namespace pkgindex {

// Result of running an external command
struct CommandResult {
    int exit_code;
    std::string stdout_str;
    std::string stderr_str;
};

// Run an external command, capturing stdout and stderr.
// args[0] is looked up on PATH unless it contains a '/'.
// A timeout of 0 disables the deadline.
// Returns error on fork/exec failure (IO) or timeout (Timeout).
Result<CommandResult> run_command(const std::vector<std::string>& args,
                                  const std::string& working_dir = "",
                                  int timeout_seconds = 60);

// Seam for everything that shells out, so tests can record invocations.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    // Run `executable args...` inside working_dir. A non-zero exit is not
    // an error at this level; callers inspect exit_code.
    virtual Result<CommandResult> run(const std::string& executable,
                                      const std::vector<std::string>& args,
                                      const std::string& working_dir) = 0;
};

class SubprocessRunner : public CommandRunner {
public:
    explicit SubprocessRunner(int timeout_seconds = 0)
        : timeout_seconds_(timeout_seconds) {}

    Result<CommandResult> run(const std::string& executable,
                              const std::vector<std::string>& args,
                              const std::string& working_dir) override;

    void set_timeout(int seconds) { timeout_seconds_ = seconds; }
    int timeout() const { return timeout_seconds_; }

private:
    int timeout_seconds_;
};

// Resolves executable names against a colon-separated search path.
class ToolLocator {
public:
    explicit ToolLocator(std::string search_path)
        : search_path_(std::move(search_path)) {}

    // Uses $PATH
    static ToolLocator from_environment();

    // Absolute path of the first executable regular file named `name`
    std::optional<std::string> find(const std::string& name) const;

    const std::string& search_path() const { return search_path_; }

private:
    std::string search_path_;
};

} // namespace pkgindex
