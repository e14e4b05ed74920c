#include "process.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include "../logger.hpp"

extern char** environ;

namespace download {

Process::~Process() {
    if (pid_ > 0 && !reaped_) {
        terminate(std::chrono::milliseconds(500));
    }
    join_reader();
}

bool Process::start(const std::vector<std::string>& argv) {
    if (argv.empty() || argv.front().empty()) {
        last_error_ = "empty command";
        return false;
    }
    join_reader();
    {
        std::lock_guard<std::mutex> lk(m_);
        lines_.clear();
    }

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0) {
        last_error_ = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    // Child: stdin from /dev/null, stdout+stderr into the pipe, own process group.
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, fds[1], STDERR_FILENO);

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    posix_spawnattr_setpgroup(&attr, 0);

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = -1;
    const int rc = posix_spawnp(&pid, cargv[0], &actions, &attr, cargv.data(), environ);

    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);
    close(fds[1]);

    if (rc != 0) {
        close(fds[0]);
        last_error_ = "failed to start " + argv.front() + ": " + std::strerror(rc);
        return false;
    }

    pid_ = pid;
    reaped_ = false;
    exit_code_ = -1;
    last_error_.clear();
    const int read_fd = fds[0];
    reader_ = std::thread([this, read_fd]{ read_loop(read_fd); });
    return true;
}

bool Process::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status = 0;
    const pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r == pid_) {
        record_status(status);
        return false;
    }
    if (errno == EINTR) return true;
    // ECHILD: reaped elsewhere
    reaped_ = true;
    return false;
}

int Process::wait() {
    if (pid_ <= 0 || reaped_) return exit_code_;
    int status = 0;
    for (;;) {
        const pid_t r = waitpid(pid_, &status, 0);
        if (r == pid_) {
            record_status(status);
            break;
        }
        if (r < 0 && errno == EINTR) continue;
        reaped_ = true;
        break;
    }
    return exit_code_;
}

void Process::terminate(std::chrono::milliseconds grace) {
    if (pid_ <= 0 || reaped_) return;
    if (kill(-pid_, SIGTERM) != 0) {
        (void)kill(pid_, SIGTERM);
    }
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (running()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            logger::warn("Process " + std::to_string(pid_) + " ignored SIGTERM, killing");
            if (kill(-pid_, SIGKILL) != 0) {
                (void)kill(pid_, SIGKILL);
            }
            (void)wait();
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

std::vector<std::string> Process::drain_lines() {
    std::lock_guard<std::mutex> lk(m_);
    std::vector<std::string> out(std::make_move_iterator(lines_.begin()),
                                 std::make_move_iterator(lines_.end()));
    lines_.clear();
    return out;
}

void Process::join_reader() {
    if (reader_.joinable()) reader_.join();
}

void Process::record_status(int status) {
    reaped_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

void Process::push_line(std::string line) {
    if (line.empty()) return;
    std::lock_guard<std::mutex> lk(m_);
    lines_.push_back(std::move(line));
}

// Both '\n' and '\r' end a line (progress bars rewrite with '\r').
void Process::read_loop(int fd) {
    char buf[4096];
    std::string partial;
    for (;;) {
        const ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            for (ssize_t i = 0; i < n; ++i) {
                const char c = buf[i];
                if (c == '\n' || c == '\r') {
                    push_line(std::move(partial));
                    partial.clear();
                } else {
                    partial.push_back(c);
                }
            }
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        break; // EOF or error
    }
    push_line(std::move(partial));
    close(fd);
}

} // namespace download
