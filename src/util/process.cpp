#include "util/process.hpp"

#include <cerrno>
#include <fmt/core.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace kw::util {

namespace {

std::vector<char*> buildArgv(const std::string& executable, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);
    return argv;
}

int waitForExit(const pid_t pid) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error("waitpid failed");
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

}

ProcessResult runAndCapture(const std::string& executable, const std::vector<std::string>& args) {
    int pipefd[2];
    if (pipe(pipefd) == -1) throw std::runtime_error("Failed to create pipe for " + executable);

    auto argv = buildArgv(executable, args);

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        throw std::runtime_error("Failed to fork " + executable);
    }

    if (pid == 0) {
        // Child process: stdout into the pipe
        dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);
        execvp(executable.c_str(), argv.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);

    ProcessResult result;
    char buf[4096];
    for (;;) {
        const ssize_t n = read(pipefd[0], buf, sizeof(buf));
        if (n > 0) {
            result.output.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break;
    }
    close(pipefd[0]);

    result.exitCode = waitForExit(pid);
    return result;
}

int runAndWait(const std::string& executable, const std::vector<std::string>& args) {
    return waitForExit(spawn(executable, args));
}

pid_t spawn(const std::string& executable, const std::vector<std::string>& args) {
    auto argv = buildArgv(executable, args);

    const pid_t pid = fork();
    if (pid < 0) throw std::runtime_error(fmt::format("Failed to fork {}", executable));

    if (pid == 0) {
        execvp(executable.c_str(), argv.data());
        _exit(127);
    }

    return pid;
}

}
