#include <catch2/catch_test_macros.hpp>
#include "LauncherCli.hpp"
#include "TestHelpers.hpp"
#include <sstream>

TEST_CASE("cli returns the child's exit code on success") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "foundry", "printf 'a\\nb\\n'");
    LauncherConfig config;
    config.executable = stub.string();
    std::ostringstream out;
    std::ostringstream err;

    CHECK(LauncherCli::run({}, config, out, err) == 0);
    CHECK(out.str() == "a\nb\n");
    CHECK(err.str().empty());
}

TEST_CASE("cli reports a missing executable on stderr and exits with 1") {
    LauncherConfig config;
    config.executable = "foundry-cpu-test-no-such-binary";
    std::ostringstream out;
    std::ostringstream err;

    CHECK(LauncherCli::run({"model", "ls"}, config, out, err) == LauncherCli::kLaunchFailureExitCode);
    CHECK(out.str().empty());
    CHECK(err.str().rfind("Error running foundry-cpu-test-no-such-binary: ", 0) == 0);
    CHECK(err.str().find("FOUNDRY_CPU_EXECUTABLE") != std::string::npos);
}

TEST_CASE("cli keeps the child's own failure code distinct from launch failures") {
    TempDir dir;
    const auto stub = write_stub_executable(dir.path(), "foundry", "exit 7");
    LauncherConfig config;
    config.executable = stub.string();
    std::ostringstream out;
    std::ostringstream err;

    CHECK(LauncherCli::run({}, config, out, err) == 7);
    CHECK(err.str().empty());
}

TEST_CASE("collect_arguments skips the program name") {
    char program[] = "foundry-cpu";
    char first[] = "model";
    char second[] = "list";
    char* argv[] = {program, first, second, nullptr};

    CHECK(LauncherCli::collect_arguments(3, argv) == std::vector<std::string>{"model", "list"});
    CHECK(LauncherCli::collect_arguments(1, argv).empty());
}
