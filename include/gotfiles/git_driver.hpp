#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace gotfiles
{

    /**
     * Abstract interface for running an external program to completion.
     */
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;

        /**
         * Run program with args in working_dir and wait for it.
         * @return ProcessError if it could not be started or exited non-zero
         */
        virtual Result<void> run(const std::string &program,
                                 const std::vector<std::string> &args,
                                 const std::filesystem::path &working_dir) = 0;
    };

    /**
     * fork/exec based runner. The child inherits stdout and stderr; the PATH
     * is searched for program.
     */
    class ProcessRunner : public CommandRunner
    {
    public:
        Result<void> run(const std::string &program,
                         const std::vector<std::string> &args,
                         const std::filesystem::path &working_dir) override;
    };

    inline constexpr const char *kInitCommitMessage = "Update dotfiles backup";
    inline constexpr const char *kSyncCommitMessage = "Sync dotfiles changes";

    /**
     * GitDriver stages, commits and pushes the repository root.
     */
    class GitDriver
    {
    public:
        GitDriver(CommandRunner &runner, std::filesystem::path repo_root, std::string git_program = "git");

        Result<void> add_all();
        Result<void> commit(const std::string &message);
        Result<void> push();

        /**
         * add, commit, push in that order. A failing step is logged and the
         * next one still runs.
         * @return number of steps that failed
         */
        int publish(const std::string &message);

    private:
        Result<void> git(const std::vector<std::string> &args);

        CommandRunner &runner_;
        std::filesystem::path repo_root_;
        std::string git_program_;
    };

} // namespace gotfiles
