#ifndef CHILDPROCESS_HPP
#define CHILDPROCESS_HPP

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

// Owns a POSIX file descriptor and closes it on destruction
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept;
    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const noexcept { return fd_; }
    bool valid() const noexcept { return fd_ >= 0; }
    int release() noexcept;
    void reset(int fd = -1) noexcept;

private:
    int fd_{-1};
};

/**
 * @brief A spawned child with captured stdout/stderr pipes.
 *
 * stdin is bound to /dev/null. Destroying a ChildProcess whose exit status
 * was never collected kills and reaps the child.
 */
class ChildProcess {
    struct SpawnToken {
        explicit SpawnToken() = default;
    };

public:
    enum class State { Running, Exited };

    /**
     * @brief Starts executable with args as argv (args[0] is the program name).
     * @param environment Complete KEY=VALUE block for the child.
     * @throws ErrorCodes::AppException SPAWN_PIPE_FAILED, SPAWN_FORK_FAILED,
     *         or SPAWN_EXEC_FAILED when execve fails inside the child.
     */
    static std::unique_ptr<ChildProcess> spawn(const std::filesystem::path& executable,
                                               const std::vector<std::string>& args,
                                               const std::vector<std::string>& environment);

    // Only reachable through spawn()
    ChildProcess(SpawnToken, pid_t pid, UniqueFd stdout_fd, UniqueFd stderr_fd);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t pid() const noexcept { return pid_; }
    int stdout_fd() const noexcept { return stdout_.get(); }
    int stderr_fd() const noexcept { return stderr_.get(); }

    State state() const noexcept { return exit_code_ ? State::Exited : State::Running; }
    std::optional<int> exit_code() const noexcept { return exit_code_; }

    /**
     * @brief Blocks until the child exits.
     * @return Exit status, or 128 + signal number when the child was killed.
     * @throws ErrorCodes::AppException PROCESS_WAIT_FAILED
     */
    int wait();

    // SIGKILL and reap; no-op once the exit status is known
    void terminate() noexcept;

    static int decode_wait_status(int status) noexcept;

private:
    pid_t pid_;
    UniqueFd stdout_;
    UniqueFd stderr_;
    std::optional<int> exit_code_;
};

#endif // CHILDPROCESS_HPP
