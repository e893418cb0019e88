// -----------------------------------------------------------------------------
// Ferryman — External command execution, local and over ssh
// -----------------------------------------------------------------------------
#include "ferryman.hpp"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/wait.h>

#ifndef PATH_MAX
#define PATH_MAX 4096
#endif

namespace ferryman {

// -----------------------------------------------------------------------------
// Ferryman — Reliable I/O with retries
// -----------------------------------------------------------------------------
ssize_t safe_read(int fd, void* buf, size_t count) noexcept {
    ssize_t total = 0;

    while (total < static_cast<ssize_t>(count)) {
        ssize_t res = read(fd, static_cast<char*>(buf) + total, count - total);

        if (res > 0) {
            total += res;
        } else if (res == 0) {
            break;
        } else {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            return -1;
        }
    }

    return total;
}

ssize_t safe_write(int fd, const void* buf, size_t count) noexcept {
    ssize_t total = 0;

    while (total < static_cast<ssize_t>(count)) {
        ssize_t res = write(fd, static_cast<const char*>(buf) + total, count - total);

        if (res > 0) {
            total += res;
        } else if (res < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                std::this_thread::sleep_for(std::chrono::microseconds(100));
                continue;
            }
            return -1;
        } else {
            if (count > 0) {
                errno = EPIPE;
                return -1;
            }
            break;
        }
    }

    return total;
}

int mkdir_p(const std::string& path, mode_t mode) noexcept {
    if (path.empty() || path.size() >= PATH_MAX || path.find('\0') != std::string::npos) {
        errno = EINVAL;
        return -1;
    }

    std::string current;
    for (size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '/' && i > 0) {
            current = path.substr(0, i);
            struct stat st;
            if (stat(current.c_str(), &st) == 0) {
                if (!S_ISDIR(st.st_mode)) {
                    errno = ENOTDIR;
                    return -1;
                }
            } else if (errno == ENOENT) {
                if (mkdir(current.c_str(), mode) != 0 && errno != EEXIST) {
                    return -1;
                }
            } else {
                return -1;
            }
        }
    }

    // Final directory
    if (mkdir(path.c_str(), mode) != 0 && errno != EEXIST) {
        return -1;
    }

    return 0;
}

// -----------------------------------------------------------------------------
// Ferryman — fork/exec/wait
// -----------------------------------------------------------------------------
int PosixCommandRunner::run(const std::vector<std::string>& argv) {
    return spawn_and_wait(argv, nullptr);
}

int PosixCommandRunner::capture(const std::vector<std::string>& argv, std::string& output) {
    output.clear();
    return spawn_and_wait(argv, &output);
}

// Captures are short bookkeeping commands (ps, kill) and always run to
// completion; plain runs carry transfers and give up waiting on interrupt.
int PosixCommandRunner::spawn_and_wait(const std::vector<std::string>& argv, std::string* output) {
    if (argv.empty()) {
        FERRYMAN_LOG_ERROR("exec", "Refusing to run an empty command");
        return constants::STATUS_FORK_FAILED;
    }

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    unique_fd read_end;
    unique_fd write_end;
    if (output) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) {
            FERRYMAN_LOG_ERROR("exec", "pipe failed for %s: %s", argv[0].c_str(), strerror(errno));
            return constants::STATUS_FORK_FAILED;
        }
        read_end.reset(fds[0]);
        write_end.reset(fds[1]);
    }

    pid_t pid = fork();
    if (pid < 0) {
        FERRYMAN_LOG_ERROR("exec", "fork failed for %s: %s", argv[0].c_str(), strerror(errno));
        return constants::STATUS_FORK_FAILED;
    }

    if (pid == 0) {
        // Child: ignored dispositions survive exec, rsync and ssh expect SIGPIPE
        signal(SIGPIPE, SIG_DFL);
        if (output) {
            if (dup2(write_end.get(), STDOUT_FILENO) < 0) _exit(constants::STATUS_LAUNCH_FAILED);
            int null_fd = open("/dev/null", O_WRONLY);
            if (null_fd >= 0 && dup2(null_fd, STDERR_FILENO) < 0) _exit(constants::STATUS_LAUNCH_FAILED);
        }
        execvp(cargv[0], cargv.data());
        _exit(constants::STATUS_LAUNCH_FAILED);
    }

    const bool interruptible = (output == nullptr);

    if (output) {
        write_end.reset();
        char buf[4096];
        for (;;) {
            ssize_t n = safe_read(read_end.get(), buf, sizeof(buf));
            if (n < 0) {
                FERRYMAN_LOG_WARN("exec", "Reading output of %s failed: %s", argv[0].c_str(), strerror(errno));
                break;
            }
            if (n == 0) break;
            if (output->size() < constants::MAX_CAPTURE_BYTES) {
                output->append(buf, static_cast<size_t>(n));
            }
        }
    }

    if (interruptible && interrupt_signal() != 0) {
        FERRYMAN_LOG_WARN("exec", "Interrupted before waiting for %s (PID %d)", argv[0].c_str(), pid);
        return constants::STATUS_INTERRUPTED;
    }

    int status = 0;
    for (;;) {
        pid_t r = waitpid(pid, &status, 0);
        if (r == pid) break;
        if (r < 0 && errno == EINTR) {
            if (interruptible && interrupt_signal() != 0) {
                FERRYMAN_LOG_WARN("exec", "Interrupted while waiting for %s (PID %d)", argv[0].c_str(), pid);
                return constants::STATUS_INTERRUPTED;
            }
            continue;
        }
        FERRYMAN_LOG_ERROR("exec", "waitpid(%d) failed: %s", pid, strerror(errno));
        return constants::STATUS_FORK_FAILED;
    }

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return constants::STATUS_FORK_FAILED;
}

// -----------------------------------------------------------------------------
// Ferryman — ssh plumbing
// -----------------------------------------------------------------------------
std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";

    bool plain = true;
    for (unsigned char c : arg) {
        if (!(isalnum(c) || strchr("_@%+=:,./-", c) != nullptr)) {
            plain = false;
            break;
        }
    }
    if (plain) return arg;

    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') quoted += "'\\''";
        else quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::vector<std::string> ssh_argv(const ReplicationJob& job) {
    return {
        "ssh", "-i", job.private_key,
        "-o", "StrictHostKeyChecking=no",
        "-o", "UserKnownHostsFile=/dev/null",
        "-o", "LogLevel=ERROR",
        "-o", "ConnectTimeout=" + std::to_string(job.rsync_timeout_sec),
    };
}

// rsync -e takes one string and does its own word splitting
std::string ssh_transport_command(const ReplicationJob& job) {
    return "ssh -i \"" + job.private_key + "\" -o StrictHostKeyChecking=no"
           " -o UserKnownHostsFile=/dev/null -o LogLevel=ERROR";
}

std::vector<std::string> SshCommandRunner::wrap(const std::vector<std::string>& argv) const {
    std::vector<std::string> full = ssh_argv(job_);
    full.push_back(job_.dest_host);

    std::string remote;
    for (const auto& arg : argv) {
        if (!remote.empty()) remote += ' ';
        remote += shell_quote(arg);
    }
    full.push_back(remote);
    return full;
}

int SshCommandRunner::run(const std::vector<std::string>& argv) {
    return inner_.run(wrap(argv));
}

int SshCommandRunner::capture(const std::vector<std::string>& argv, std::string& output) {
    return inner_.capture(wrap(argv), output);
}

} // namespace ferryman
