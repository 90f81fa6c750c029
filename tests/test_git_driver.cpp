#include <catch2/catch_test_macros.hpp>
#include "gotfiles/git_driver.hpp"
#include "test_support.hpp"

using namespace gotfiles;
using gotfiles::test::read_file;
using gotfiles::test::RecordingRunner;
using gotfiles::test::TempDir;
namespace fs = std::filesystem;

TEST_CASE("publish runs add, commit and push in the repository root", "[git]")
{
    RecordingRunner runner;
    GitDriver git(runner, "/srv/dotfiles-repo");

    REQUIRE(git.publish(kInitCommitMessage) == 0);

    REQUIRE(runner.calls.size() == 3);
    REQUIRE(runner.calls[0].args == std::vector<std::string>{"add", "."});
    REQUIRE(runner.calls[1].args == std::vector<std::string>{"commit", "-m", "Update dotfiles backup"});
    REQUIRE(runner.calls[2].args == std::vector<std::string>{"push"});
    for (const auto &call : runner.calls)
    {
        REQUIRE(call.program == "git");
        REQUIRE(call.working_dir == fs::path("/srv/dotfiles-repo"));
    }
}

TEST_CASE("publish keeps going after a failed step", "[git]")
{
    RecordingRunner runner;
    runner.fail_on = {"add", "commit"};
    GitDriver git(runner, "/repo");

    REQUIRE(git.publish(kSyncCommitMessage) == 2);
    REQUIRE(runner.calls.size() == 3);
    REQUIRE(runner.calls[1].args.back() == "Sync dotfiles changes");
    REQUIRE(runner.calls[2].args.front() == "push");
}

TEST_CASE("GitDriver uses the configured git program", "[git]")
{
    RecordingRunner runner;
    GitDriver git(runner, "/repo", "/opt/git/bin/git");

    REQUIRE(git.push().has_value());
    REQUIRE(runner.calls.at(0).program == "/opt/git/bin/git");
}

TEST_CASE("ProcessRunner maps exit status to a Result", "[git][process]")
{
    ProcessRunner runner;
    TempDir dir;

    REQUIRE(runner.run("true", {}, dir.path()).has_value());

    auto failed = runner.run("false", {}, dir.path());
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code == ErrorCode::ProcessError);

    auto missing = runner.run("gotfiles-no-such-program", {}, dir.path());
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == ErrorCode::ProcessError);
}

TEST_CASE("ProcessRunner runs the child in the working directory", "[git][process]")
{
    ProcessRunner runner;
    TempDir dir;

    REQUIRE(runner.run("sh", {"-c", "pwd > where.txt"}, dir.path()).has_value());
    std::string where = read_file(dir / "where.txt");
    REQUIRE_FALSE(where.empty());
    where.pop_back(); // trailing newline
    REQUIRE(fs::equivalent(where, dir.path()));

    auto bad_dir = runner.run("true", {}, dir / "does-not-exist");
    REQUIRE_FALSE(bad_dir.has_value());
    REQUIRE(bad_dir.error().code == ErrorCode::ProcessError);
}
