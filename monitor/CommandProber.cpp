#include "CommandProber.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <iostream>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

extern char **environ;

namespace lan_watch::monitor
{
    CommandProber::CommandProber(std::string program) : m_program(std::move(program)) {}

    std::vector<std::string> CommandProber::BuildArguments(const std::string &program, const std::string &ip,
                                                           std::chrono::milliseconds timeout)
    {
        long timeout_s = std::max<long>(1, static_cast<long>(timeout.count() / 1000));
        return {program, "-c", "1", "-W", std::to_string(timeout_s), ip};
    }

    bool CommandProber::Probe(const std::string &ip, std::chrono::milliseconds timeout)
    {
        std::vector<std::string> args = BuildArguments(m_program, ip, timeout);

        std::vector<char *> argv;
        argv.reserve(args.size() + 1);
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        if (posix_spawn_file_actions_init(&actions) != 0)
            return false;

        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);

        pid_t pid = -1;
        int spawn_ret = posix_spawnp(&pid, m_program.c_str(), &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);

        if (spawn_ret != 0)
        {
            std::cerr << "[CommandProber] Failed to start '" << m_program << "': " << std::strerror(spawn_ret) << "\n";
            return false;
        }

        int status = 0;
        while (waitpid(pid, &status, 0) == -1)
        {
            if (errno != EINTR)
                return false;
        }

        return WIFEXITED(status) && WEXITSTATUS(status) == 0;
    }
}
