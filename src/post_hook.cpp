#include "post_hook.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

#include "logger.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

namespace multideploy {

namespace {

std::string run_hook(const fs::path& program, const fs::path& checkout) {
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(errno));
    procutil::UniqueFd read_end(fds[0]);
    procutil::UniqueFd write_end(fds[1]);

    pid_t pid = fork();
    if (pid < 0)
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    if (pid == 0) {
        dup2(write_end.get(), STDOUT_FILENO);
        if (chdir(checkout.c_str()) != 0)
            _exit(126);
        execl(program.c_str(), program.c_str(), checkout.c_str(), (char*)nullptr);
        _exit(127);
    }
    write_end.reset();
    std::string output = procutil::read_all(read_end.get());

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR)
            throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }
    if (WIFSIGNALED(status))
        throw std::runtime_error(program.string() + " killed by signal " +
                                 std::to_string(WTERMSIG(status)));
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    if (code == 127)
        throw std::runtime_error("unable to execute " + program.string());
    if (code != 0) {
        std::string msg = program.string() + " exited with status " + std::to_string(code);
        if (!output.empty())
            msg += ": " + output;
        throw std::runtime_error(msg);
    }
    return output;
}

} // namespace

PostDeployHook make_executable_hook(const fs::path& program) {
    return [program](const fs::path& checkout) {
        log_debug("Running post-deploy hook " + program.string(), checkout.string());
        return run_hook(program, checkout);
    };
}

} // namespace multideploy
