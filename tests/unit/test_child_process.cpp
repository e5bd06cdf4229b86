#include <catch2/catch_test_macros.hpp>
#include "AppException.hpp"
#include "ChildProcess.hpp"
#include "LineRelay.hpp"
#include "TestHelpers.hpp"
#include <csignal>
#include <sstream>

namespace {

std::string drain(int fd)
{
    LineReader reader(fd);
    std::ostringstream out;
    relay_lines(reader, out);
    return out.str();
}

}

TEST_CASE("child output is captured on separate pipes") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "talker", "echo out-line\necho err-line 1>&2");

    auto child = ChildProcess::spawn(stub, {"talker"}, {"PATH=/usr/bin:/bin"});
    CHECK(child->state() == ChildProcess::State::Running);

    CHECK(drain(child->stdout_fd()) == "out-line\n");
    CHECK(drain(child->stderr_fd()) == "err-line\n");
    CHECK(child->wait() == 0);
    CHECK(child->state() == ChildProcess::State::Exited);
    CHECK(child->exit_code() == 0);
}

TEST_CASE("child sees exactly the environment it was given") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "env-echo",
                                            "echo \"${MARKER:-unset}\"\necho \"${HOME:-no-home}\"");

    auto child = ChildProcess::spawn(stub, {"env-echo"}, {"MARKER=from-overlay"});
    CHECK(drain(child->stdout_fd()) == "from-overlay\nno-home\n");
    CHECK(child->wait() == 0);
}

TEST_CASE("child arguments are passed through unmodified") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "args",
                                            "for arg in \"$@\"; do echo \"[$arg]\"; done");

    auto child = ChildProcess::spawn(stub, {"args", "model", "run", "phi 3", ""}, {});
    CHECK(drain(child->stdout_fd()) == "[model]\n[run]\n[phi 3]\n[]\n");
    CHECK(child->wait() == 0);
}

TEST_CASE("child stdin is not attached") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "reader", "cat\necho done");

    auto child = ChildProcess::spawn(stub, {"reader"}, {"PATH=/usr/bin:/bin"});
    CHECK(drain(child->stdout_fd()) == "done\n");
    CHECK(child->wait() == 0);
}

TEST_CASE("non-zero exit codes are reported as-is") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "failing", "exit 42");

    auto child = ChildProcess::spawn(stub, {"failing"}, {});
    CHECK(child->wait() == 42);
    CHECK(child->wait() == 42);
}

TEST_CASE("a child killed by a signal reports 128 plus the signal number") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "self-kill", "kill -TERM $$");

    auto child = ChildProcess::spawn(stub, {"self-kill"}, {"PATH=/usr/bin:/bin"});
    CHECK(child->wait() == 128 + SIGTERM);
}

TEST_CASE("exec failures surface as SPAWN_EXEC_FAILED") {
    TempDir dir;
    const auto not_executable = dir.path() / "plain.txt";
    write_text_file(not_executable, "not a program\n");

    try {
        ChildProcess::spawn(not_executable, {"plain.txt"}, {});
        FAIL("expected an AppException");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::SPAWN_EXEC_FAILED);
        CHECK(ex.get_user_message().find("plain.txt") != std::string::npos);
    }
}

TEST_CASE("terminate kills a running child") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "sleeper", "exec sleep 30");

    auto child = ChildProcess::spawn(stub, {"sleeper"}, {"PATH=/usr/bin:/bin"});
    child->terminate();
    CHECK(child->state() == ChildProcess::State::Exited);
    CHECK(child->exit_code() == 128 + SIGKILL);
}

TEST_CASE("decode_wait_status maps exit and signal statuses") {
    CHECK(ChildProcess::decode_wait_status(0) == 0);
    CHECK(ChildProcess::decode_wait_status(3 << 8) == 3);
    CHECK(ChildProcess::decode_wait_status(SIGINT) == 128 + SIGINT);
}
