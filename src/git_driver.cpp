#include "gotfiles/git_driver.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gotfiles
{

    Result<void> ProcessRunner::run(const std::string &program,
                                    const std::vector<std::string> &args,
                                    const std::filesystem::path &working_dir)
    {
        std::vector<std::string> argv_storage;
        argv_storage.reserve(args.size() + 1);
        argv_storage.push_back(program);
        argv_storage.insert(argv_storage.end(), args.begin(), args.end());

        std::vector<char *> argv;
        argv.reserve(argv_storage.size() + 1);
        for (auto &s : argv_storage)
            argv.push_back(s.data());
        argv.push_back(nullptr);

        const std::string dir = working_dir.string();
        pid_t pid = fork();
        if (pid < 0)
        {
            return std::unexpected(GotfilesError::process(std::string("fork failed: ") + std::strerror(errno)));
        }
        if (pid == 0)
        {
            // only async-signal-safe calls until exec
            if (!dir.empty() && chdir(dir.c_str()) != 0)
                _exit(126);
            execvp(argv[0], argv.data());
            _exit(127);
        }

        int status = 0;
        while (waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
                return std::unexpected(GotfilesError::process(std::string("waitpid failed: ") + std::strerror(errno)));
        }

        if (WIFEXITED(status))
        {
            const int code = WEXITSTATUS(status);
            if (code == 0)
                return {};
            if (code == 126)
                return std::unexpected(GotfilesError::process(program + ": unable to enter " + dir + " (exit 126)"));
            if (code == 127)
                return std::unexpected(GotfilesError::process(program + ": command not found (exit 127)"));
            return std::unexpected(GotfilesError::process(program + " exited with status " + std::to_string(code)));
        }
        if (WIFSIGNALED(status))
            return std::unexpected(GotfilesError::process(program + " killed by signal " + std::to_string(WTERMSIG(status))));
        return std::unexpected(GotfilesError::process(program + " terminated abnormally"));
    }

    GitDriver::GitDriver(CommandRunner &runner, std::filesystem::path repo_root, std::string git_program)
        : runner_(runner), repo_root_(std::move(repo_root)), git_program_(std::move(git_program))
    {
    }

    Result<void> GitDriver::git(const std::vector<std::string> &args)
    {
        std::string line = git_program_;
        for (const auto &a : args)
            line += " " + a;
        spdlog::debug("Running '{}' in {}", line, repo_root_.string());
        return runner_.run(git_program_, args, repo_root_);
    }

    Result<void> GitDriver::add_all()
    {
        return git({"add", "."});
    }

    Result<void> GitDriver::commit(const std::string &message)
    {
        return git({"commit", "-m", message});
    }

    Result<void> GitDriver::push()
    {
        return git({"push"});
    }

    int GitDriver::publish(const std::string &message)
    {
        int failures = 0;
        if (auto r = add_all(); !r)
        {
            spdlog::error("Error running git add: {}", r.error().what());
            ++failures;
        }
        if (auto r = commit(message); !r)
        {
            spdlog::error("Error running git commit: {}", r.error().what());
            ++failures;
        }
        if (auto r = push(); !r)
        {
            spdlog::error("Error running git push: {}", r.error().what());
            ++failures;
        }
        return failures;
    }

} // namespace gotfiles
