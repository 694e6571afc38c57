#include "pawkit/process.hpp"
#include "pawkit/platform.hpp"

#include <filesystem>

#ifndef _WIN32
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace pawkit {

namespace fs = std::filesystem;

#ifndef _WIN32

ProcessResult run_process(const std::vector<std::string>& argv) {
    ProcessResult result;

    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::vector<char*> c_argv;
    for (const auto& s : argv) {
        c_argv.push_back(const_cast<char*>(s.c_str()));
    }
    c_argv.push_back(nullptr);

    int pipe_fds[2];
    if (pipe(pipe_fds) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        close(pipe_fds[0]);
        close(pipe_fds[1]);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child: stdin from /dev/null, stdout+stderr into the pipe
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(pipe_fds[1], STDOUT_FILENO);
        dup2(pipe_fds[1], STDERR_FILENO);
        close(pipe_fds[0]);
        close(pipe_fds[1]);

        execvp(c_argv[0], c_argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    close(pipe_fds[1]);

    char buffer[4096];
    while (true) {
        ssize_t n = read(pipe_fds[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(pipe_fds[0]);

    int status;
    while (waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    if (result.ok && result.exit_code == 127 && result.output.empty()) {
        result.error = "failed to execute " + argv[0];
    }

    return result;
}

std::optional<std::string> find_executable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        if (access(name.c_str(), X_OK) == 0) {
            return name;
        }
        return std::nullopt;
    }

    auto path_env = get_env("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    size_t start = 0;
    while (start <= path_env->size()) {
        size_t end = path_env->find(':', start);
        if (end == std::string::npos) end = path_env->size();

        std::string dir = path_env->substr(start, end - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            std::error_code ec;
            if (fs::is_regular_file(candidate, ec) && access(candidate.c_str(), X_OK) == 0) {
                return candidate;
            }
        }
        start = end + 1;
    }

    return std::nullopt;
}

#else

ProcessResult run_process(const std::vector<std::string>& argv) {
    ProcessResult result;
    result.error = "subprocess execution is not supported on this platform: " +
                   (argv.empty() ? std::string() : argv[0]);
    return result;
}

std::optional<std::string> find_executable(const std::string&) {
    return std::nullopt;
}

#endif

std::string format_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "\"";
        cmd += argv[i];
        if (needs_quotes) cmd += "\"";
    }
    return cmd;
}

} // namespace pawkit
