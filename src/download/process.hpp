#pragma once
// Child process with its combined stdout/stderr drained line by line by a reader thread.
// POSIX implementation (posix_spawnp + pipe), see process.cpp.

#include <string>
#include <vector>
#include <deque>
#include <thread>
#include <mutex>
#include <chrono>

#include <sys/types.h>

namespace download {

class Process {
public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    // argv[0] is looked up on PATH. Returns false (see last_error()) if the spawn failed.
    bool start(const std::vector<std::string>& argv);

    // Non-blocking. False once the child has been reaped.
    bool running();

    // Blocks until exit. Returns the exit code (128 + signal when killed by a signal).
    int wait();

    // SIGTERM to the child's process group, SIGKILL after grace. Reaps the child.
    void terminate(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

    // Lines queued by the reader since the last call.
    std::vector<std::string> drain_lines();

    // Wait for the reader to hit EOF. Call after the child exited.
    void join_reader();

    int exit_code() const { return exit_code_; }
    pid_t pid() const { return pid_; }
    const std::string& last_error() const { return last_error_; }

private:
    void read_loop(int fd);
    void record_status(int status);
    void push_line(std::string line);

    pid_t pid_ = -1;
    bool reaped_ = true;
    int exit_code_ = -1;
    std::string last_error_;

    std::thread reader_;
    std::mutex m_;
    std::deque<std::string> lines_;
};

} // namespace download
