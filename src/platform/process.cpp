#include "cork/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <set>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern "C" char** environ;

namespace cork {

namespace {

// Inherited environment with overrides applied
std::vector<std::string> build_environment(const ProcessSpec& spec) {
    std::vector<std::string> env;
    std::set<std::string> overridden;
    for (const auto& [key, value] : spec.environment) {
        overridden.insert(key);
    }

    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        std::string key = eq == std::string::npos ? entry : entry.substr(0, eq);
        if (overridden.count(key) == 0) {
            env.push_back(std::move(entry));
        }
    }

    for (const auto& [key, value] : spec.environment) {
        env.push_back(key + "=" + value);
    }
    return env;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

// Read whatever is available; returns false on EOF or hard error
bool drain(int fd, std::string& sink) {
    char buf[4096];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            sink.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

int decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

} // namespace

ProcessResult run_process(const ProcessSpec& spec) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    auto env_strings = build_environment(spec);

    std::vector<char*> argv;
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    int out_pipe[2];
    int err_pipe[2];
    if (pipe(out_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }
    if (pipe(err_pipe) != 0) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        return result;
    }

    pid_t pid = fork();

    if (pid == -1) {
        result.error = "fork failed: " + std::string(strerror(errno));
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);
        close(out_pipe[0]);
        close(out_pipe[1]);
        close(err_pipe[0]);
        close(err_pipe[1]);

        if (!spec.cwd.empty()) {
            if (chdir(spec.cwd.c_str()) != 0) {
                _exit(127);
            }
        }

        environ = envp.data();
        execvp(argv[0], argv.data());

        // If execvp returns, it failed
        _exit(127);
    }

    // Parent process
    setpgid(pid, pid);
    close(out_pipe[1]);
    close(err_pipe[1]);

    int out_fd = out_pipe[0];
    int err_fd = err_pipe[0];
    fcntl(out_fd, F_SETFL, fcntl(out_fd, F_GETFL) | O_NONBLOCK);
    fcntl(err_fd, F_SETFL, fcntl(err_fd, F_GETFL) | O_NONBLOCK);

    const bool bounded = spec.timeout.count() > 0;
    const auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    bool exited = false;
    int status = 0;

    while (!exited) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (out_fd >= 0) fds[nfds++] = {out_fd, POLLIN, 0};
        if (err_fd >= 0) fds[nfds++] = {err_fd, POLLIN, 0};

        if (nfds > 0) {
            int rc = poll(fds, nfds, 100);
            if (rc > 0) {
                for (nfds_t i = 0; i < nfds; ++i) {
                    if (fds[i].revents == 0) continue;
                    if (fds[i].fd == out_fd) {
                        if (!drain(out_fd, result.output)) close_fd(out_fd);
                    } else {
                        if (!drain(err_fd, result.errors)) close_fd(err_fd);
                    }
                }
            }
        } else {
            usleep(100 * 1000);
        }

        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            exited = true;
            break;
        }
        if (waited == -1 && errno != EINTR) {
            result.error = "waitpid failed: " + std::string(strerror(errno));
            close_fd(out_fd);
            close_fd(err_fd);
            return result;
        }

        if (bounded && std::chrono::steady_clock::now() >= deadline) {
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
            }
            result.timed_out = true;
            exited = true;
        }
    }

    // Pick up output written right before exit
    if (out_fd >= 0) drain(out_fd, result.output);
    if (err_fd >= 0) drain(err_fd, result.errors);
    close_fd(out_fd);
    close_fd(err_fd);

    result.exit_code = decode_status(status);
    result.ok = true;
    return result;
}

std::string format_command(const std::vector<std::string>& argv) {
    std::string cmd;
    for (size_t i = 0; i < argv.size(); i++) {
        if (i > 0) cmd += " ";

        bool needs_quotes = argv[i].empty() ||
                            argv[i].find(' ') != std::string::npos ||
                            argv[i].find('\t') != std::string::npos;

        if (needs_quotes) cmd += "'";
        cmd += argv[i];
        if (needs_quotes) cmd += "'";
    }
    return cmd;
}

} // namespace cork
