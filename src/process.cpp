#include "process.hpp"

#include <iostream>
#include <vector>
#include <string>

// Required Linux/Unix Headers
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid
#include <fcntl.h>     // open
#include <unistd.h>    // fork, execvp, dup2, _exit
#include <errno.h>
#include <cstring>     // strerror
#include <cstdlib>     // setenv, EXIT_FAILURE

namespace Postinstall {
namespace Process {

    // Redirects fd `target` to `path`, opened with `flags`. Child side only.
    static bool redirect(int target, const char* path, int flags) {
        int fd = open(path, flags, 0640);
        if (fd < 0) {
            return false;
        }
        if (fd != target) {
            if (dup2(fd, target) < 0) {
                close(fd);
                return false;
            }
            close(fd);
        }
        return true;
    }

    [[noreturn]] static void execChild(const std::vector<std::string>& args) {
        std::vector<char*> argv;
        for (const auto& arg : args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr); // Null terminator

        setenv("DEBIAN_FRONTEND", "noninteractive", 1);

        execvp(argv[0], argv.data());

        // If execvp returns, an error occurred
        std::cerr << "exec failed for command " << args[0] << ": "
                  << strerror(errno) << std::endl;
        _exit(127);
    }

    static int waitForChild(pid_t pid, const std::string& command) {
        int status = 0;
        pid_t waited = -1;
        do {
            waited = waitpid(pid, &status, 0);
        } while (waited < 0 && errno == EINTR);

        if (waited < 0) {
            std::cerr << "waitpid failed for " << command << ": "
                      << strerror(errno) << std::endl;
            return -1;
        }
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            std::cerr << command << " terminated by signal: " << WTERMSIG(status) << std::endl;
        }
        return -1;
    }

    int run(const std::vector<std::string>& args, const std::string& outputPath) {
        if (args.empty() || args[0].empty()) {
            std::cerr << "Error: Invalid command or arguments for execution." << std::endl;
            return -1;
        }

        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "Fork failed: " << strerror(errno) << std::endl;
            return -1;
        }

        // --- Child Process ---
        if (pid == 0) {
            const char* sink = outputPath.empty() ? "/dev/null" : outputPath.c_str();
            int flags = outputPath.empty() ? O_WRONLY : (O_WRONLY | O_CREAT | O_APPEND);
            if (!redirect(STDIN_FILENO, "/dev/null", O_RDONLY) ||
                !redirect(STDOUT_FILENO, sink, flags) ||
                dup2(STDOUT_FILENO, STDERR_FILENO) < 0) {
                _exit(EXIT_FAILURE);
            }
            execChild(args);
        }

        // Parent Process
        return waitForChild(pid, args[0]);
    }

    int capture(const std::vector<std::string>& args, std::string& output) {
        output.clear();
        if (args.empty() || args[0].empty()) {
            std::cerr << "Error: Invalid command or arguments for execution." << std::endl;
            return -1;
        }

        int fds[2];
        if (pipe(fds) != 0) {
            std::cerr << "pipe failed: " << strerror(errno) << std::endl;
            return -1;
        }

        pid_t pid = fork();
        if (pid < 0) {
            std::cerr << "Fork failed: " << strerror(errno) << std::endl;
            close(fds[0]);
            close(fds[1]);
            return -1;
        }

        if (pid == 0) {
            close(fds[0]);
            if (dup2(fds[1], STDOUT_FILENO) < 0 ||
                !redirect(STDIN_FILENO, "/dev/null", O_RDONLY) ||
                !redirect(STDERR_FILENO, "/dev/null", O_WRONLY)) {
                _exit(EXIT_FAILURE);
            }
            close(fds[1]);
            execChild(args);
        }

        close(fds[1]);
        char buffer[4096];
        while (true) {
            ssize_t n = read(fds[0], buffer, sizeof(buffer));
            if (n > 0) {
                output.append(buffer, static_cast<size_t>(n));
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        close(fds[0]);

        return waitForChild(pid, args[0]);
    }

} // namespace Process
} // namespace Postinstall
