#include "ChildProcess.hpp"
#include "AppException.hpp"
#include "Logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

using ErrorCodes::Code;

namespace {

struct Pipe {
    UniqueFd read_end;
    UniqueFd write_end;
};

Pipe make_pipe(const char* purpose)
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1) {
        THROW_APP_ERROR(Code::SPAWN_PIPE_FAILED,
                        std::string(purpose) + " pipe: " + std::strerror(errno));
    }
    return Pipe{UniqueFd(fds[0]), UniqueFd(fds[1])};
}

std::vector<char*> to_pointer_array(std::vector<std::string>& storage)
{
    std::vector<char*> pointers;
    pointers.reserve(storage.size() + 1);
    for (auto& item : storage) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

pid_t wait_for(pid_t pid, int& status)
{
    pid_t result;
    do {
        result = waitpid(pid, &status, 0);
    } while (result == -1 && errno == EINTR);
    return result;
}

// Runs in the forked child: only async-signal-safe calls from here on
[[noreturn]] void exec_child(const char* executable,
                             char* const* argv,
                             char* const* envp,
                             int stdout_fd,
                             int stderr_fd,
                             int status_fd)
{
    const int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        if (devnull > STDERR_FILENO) {
            close(devnull);
        }
    }
    dup2(stdout_fd, STDOUT_FILENO);
    dup2(stderr_fd, STDERR_FILENO);

    execve(executable, argv, envp);

    const int exec_errno = errno;
    [[maybe_unused]] const ssize_t written = write(status_fd, &exec_errno, sizeof(exec_errno));
    _exit(127);
}

}


UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept
{
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}


int UniqueFd::release() noexcept
{
    const int fd = fd_;
    fd_ = -1;
    return fd;
}


void UniqueFd::reset(int fd) noexcept
{
    if (fd_ >= 0) {
        close(fd_);
    }
    fd_ = fd;
}


ChildProcess::ChildProcess(SpawnToken, pid_t pid, UniqueFd stdout_fd, UniqueFd stderr_fd)
    : pid_(pid),
      stdout_(std::move(stdout_fd)),
      stderr_(std::move(stderr_fd))
{
}


ChildProcess::~ChildProcess()
{
    terminate();
}


std::unique_ptr<ChildProcess> ChildProcess::spawn(const std::filesystem::path& executable,
                                                  const std::vector<std::string>& args,
                                                  const std::vector<std::string>& environment)
{
    auto logger = Logger::get_logger("process_logger");
    const std::string executable_path = executable.string();

    // Everything that allocates happens before fork()
    std::vector<std::string> arg_storage = args;
    if (arg_storage.empty()) {
        arg_storage.push_back(executable_path);
    }
    std::vector<std::string> env_storage = environment;
    std::vector<char*> argv = to_pointer_array(arg_storage);
    std::vector<char*> envp = to_pointer_array(env_storage);

    Pipe out_pipe = make_pipe("stdout");
    Pipe err_pipe = make_pipe("stderr");
    Pipe status_pipe = make_pipe("exec status");

    const pid_t pid = fork();
    if (pid == -1) {
        THROW_APP_ERROR(Code::SPAWN_FORK_FAILED, executable_path + ": " + std::strerror(errno));
    }
    if (pid == 0) {
        exec_child(executable_path.c_str(), argv.data(), envp.data(),
                   out_pipe.write_end.get(), err_pipe.write_end.get(),
                   status_pipe.write_end.get());
    }

    out_pipe.write_end.reset();
    err_pipe.write_end.reset();
    status_pipe.write_end.reset();

    // EOF means execve succeeded and closed the close-on-exec status pipe
    int exec_errno = 0;
    ssize_t received;
    do {
        received = read(status_pipe.read_end.get(), &exec_errno, sizeof(exec_errno));
    } while (received == -1 && errno == EINTR);

    if (received > 0) {
        int status = 0;
        wait_for(pid, status);
        if (logger) {
            logger->debug("execve failed for '{}': {}", executable_path, std::strerror(exec_errno));
        }
        THROW_APP_ERROR(Code::SPAWN_EXEC_FAILED, executable_path + ": " + std::strerror(exec_errno));
    }

    if (logger) {
        logger->debug("Started '{}' as pid {}", executable_path, pid);
    }
    return std::make_unique<ChildProcess>(SpawnToken{}, pid,
                                          std::move(out_pipe.read_end),
                                          std::move(err_pipe.read_end));
}


int ChildProcess::wait()
{
    if (exit_code_) {
        return *exit_code_;
    }

    int status = 0;
    if (wait_for(pid_, status) == -1) {
        THROW_APP_ERROR(Code::PROCESS_WAIT_FAILED,
                        "pid " + std::to_string(pid_) + ": " + std::strerror(errno));
    }
    exit_code_ = decode_wait_status(status);

    if (auto logger = Logger::get_logger("process_logger")) {
        logger->debug("pid {} exited with code {}", pid_, *exit_code_);
    }
    return *exit_code_;
}


void ChildProcess::terminate() noexcept
{
    if (exit_code_ || pid_ <= 0) {
        return;
    }
    kill(pid_, SIGKILL);
    int status = 0;
    if (wait_for(pid_, status) == pid_) {
        exit_code_ = decode_wait_status(status);
    } else {
        exit_code_ = 128 + SIGKILL;
    }
}


int ChildProcess::decode_wait_status(int status) noexcept
{
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return 1;
}
