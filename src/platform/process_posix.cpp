#include "minerhub/process_launcher.hpp"
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace minerhub {

namespace {

// Output still arriving after exit comes from grandchildren holding the pipes
constexpr int kPollTimeoutMs = 200;
constexpr auto kDrainAfterExit = std::chrono::milliseconds(500);

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// pipe2 is Linux-only; set close-on-exec by hand so it works on macOS too
bool make_pipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return false;
    }
    for (int i = 0; i < 2; ++i) {
        if (::fcntl(fds[i], F_SETFD, FD_CLOEXEC) != 0) {
            return false;
        }
    }
    return true;
}

class PosixProcessHandle : public ProcessHandle {
public:
    PosixProcessHandle(pid_t pid, int out_fd, int err_fd,
                       OutputCallback on_output, ExitCallback on_exit)
        : pid_(pid)
        , out_fd_(out_fd)
        , err_fd_(err_fd)
        , on_output_(std::move(on_output))
        , on_exit_(std::move(on_exit))
    {
        capture_thread_ = std::thread(&PosixProcessHandle::capture_loop, this);
        wait_thread_ = std::thread(&PosixProcessHandle::wait_loop, this);
    }

    ~PosixProcessHandle() override {
        if (is_alive()) {
            force_kill();
        }
        if (wait_thread_.joinable()) {
            wait_thread_.join();
        }
    }

    int pid() const override { return static_cast<int>(pid_); }

    bool is_alive() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return !exit_status_.has_value();
    }

    bool request_stop() override {
        return send_signal(SIGTERM);
    }

    bool force_kill() override {
        return send_signal(SIGKILL);
    }

    std::optional<ExitStatus> wait_for_exit(std::chrono::milliseconds timeout) override {
        std::unique_lock<std::mutex> lock(mutex_);
        exited_cv_.wait_for(lock, timeout, [this] { return exit_status_.has_value(); });
        return exit_status_;
    }

private:
    bool send_signal(int sig) {
        // Never signal a reaped pid: it may already belong to another process
        std::lock_guard<std::mutex> lock(mutex_);
        if (exit_status_) {
            return false;
        }
        if (::kill(-pid_, sig) == 0) {
            return true;
        }
        return ::kill(pid_, sig) == 0;
    }

    void emit_lines(LogStream stream, std::string& pending, bool flush_partial) {
        size_t start = 0;
        size_t newline;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            std::string line = pending.substr(start, newline - start);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            on_output_(stream, line);
            start = newline + 1;
        }
        pending.erase(0, start);
        if (flush_partial && !pending.empty()) {
            on_output_(stream, pending);
            pending.clear();
        }
    }

    void capture_loop() {
        std::string pending_out;
        std::string pending_err;
        char buffer[4096];
        std::optional<std::chrono::steady_clock::time_point> drain_deadline;

        while (out_fd_ >= 0 || err_fd_ >= 0) {
            if (!drain_deadline && !is_alive()) {
                drain_deadline = std::chrono::steady_clock::now() + kDrainAfterExit;
            }
            if (drain_deadline && std::chrono::steady_clock::now() >= *drain_deadline) {
                break;
            }

            pollfd fds[2];
            nfds_t count = 0;
            if (out_fd_ >= 0) fds[count++] = pollfd{out_fd_, POLLIN, 0};
            if (err_fd_ >= 0) fds[count++] = pollfd{err_fd_, POLLIN, 0};

            int ready = ::poll(fds, count, kPollTimeoutMs);
            if (ready < 0) {
                if (errno == EINTR) continue;
                break;
            }
            if (ready == 0) continue;

            for (nfds_t i = 0; i < count; ++i) {
                if ((fds[i].revents & (POLLIN | POLLHUP | POLLERR)) == 0) continue;

                const bool is_out = fds[i].fd == out_fd_;
                std::string& pending = is_out ? pending_out : pending_err;
                const LogStream stream = is_out ? LogStream::Stdout : LogStream::Stderr;

                ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
                if (n > 0) {
                    pending.append(buffer, static_cast<size_t>(n));
                    emit_lines(stream, pending, false);
                } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                    emit_lines(stream, pending, true);
                    close_fd(is_out ? out_fd_ : err_fd_);
                }
            }
        }

        emit_lines(LogStream::Stdout, pending_out, true);
        emit_lines(LogStream::Stderr, pending_err, true);
        close_fd(out_fd_);
        close_fd(err_fd_);
    }

    void wait_loop() {
        int status = 0;
        pid_t result;
        do {
            result = ::waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        ExitStatus exit;
        if (result < 0) {
            exit.code = -1;
        } else if (WIFSIGNALED(status)) {
            exit.signal = WTERMSIG(status);
        } else if (WIFEXITED(status)) {
            exit.code = WEXITSTATUS(status);
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            exit_status_ = exit;
        }
        exited_cv_.notify_all();

        if (capture_thread_.joinable()) {
            capture_thread_.join();
        }
        if (on_exit_) {
            on_exit_(exit);
        }
    }

    pid_t pid_;
    int out_fd_;
    int err_fd_;
    OutputCallback on_output_;
    ExitCallback on_exit_;

    mutable std::mutex mutex_;
    std::condition_variable exited_cv_;
    std::optional<ExitStatus> exit_status_;

    std::thread capture_thread_;
    std::thread wait_thread_;
};

class PosixProcessLauncher : public ProcessLauncher {
public:
    std::unique_ptr<ProcessHandle> launch(const CommandLine& command,
                                          OutputCallback on_output,
                                          ExitCallback on_exit,
                                          std::string& error_msg) override {
        // Everything the child needs is prepared before fork
        std::vector<std::string> storage;
        storage.push_back(command.executable);
        storage.insert(storage.end(), command.args.begin(), command.args.end());
        std::vector<char*> argv;
        for (auto& arg : storage) {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);
        const char* working_dir = command.working_dir.empty() ? nullptr : command.working_dir.c_str();

        int out_pipe[2] = {-1, -1};
        int err_pipe[2] = {-1, -1};
        int exec_pipe[2] = {-1, -1};
        if (!make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
            error_msg = std::string("pipe failed: ") + std::strerror(errno);
            for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
                close_fd(fds[0]);
                close_fd(fds[1]);
            }
            return nullptr;
        }

        pid_t pid = ::fork();
        if (pid < 0) {
            error_msg = std::string("fork failed: ") + std::strerror(errno);
            for (int* fds : {out_pipe, err_pipe, exec_pipe}) {
                close_fd(fds[0]);
                close_fd(fds[1]);
            }
            return nullptr;
        }

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on
            ::setpgid(0, 0);
            // dup2 clears close-on-exec on the target only
            int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
            if (devnull >= 0) {
                ::dup2(devnull, STDIN_FILENO);
            }
            ::dup2(out_pipe[1], STDOUT_FILENO);
            ::dup2(err_pipe[1], STDERR_FILENO);

            int err = 0;
            if (working_dir != nullptr && ::chdir(working_dir) != 0) {
                err = errno;
            } else {
                ::execvp(argv[0], argv.data());
                err = errno;
            }
            ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        // Parent
        ::setpgid(pid, pid);
        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);
        close_fd(exec_pipe[1]);

        int child_errno = 0;
        ssize_t n;
        do {
            n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
        } while (n < 0 && errno == EINTR);
        close_fd(exec_pipe[0]);

        if (n > 0) {
            // exec (or chdir) failed: reap the child, no handle is created
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            close_fd(out_pipe[0]);
            close_fd(err_pipe[0]);
            error_msg = (working_dir != nullptr && child_errno == ENOENT && ::access(working_dir, F_OK) != 0)
                ? "cannot enter working directory " + command.working_dir + ": " + std::strerror(child_errno)
                : "cannot execute " + command.executable + ": " + std::strerror(child_errno);
            return nullptr;
        }

        return std::make_unique<PosixProcessHandle>(pid, out_pipe[0], err_pipe[0],
                                                    std::move(on_output), std::move(on_exit));
    }
};

} // namespace

std::unique_ptr<ProcessLauncher> create_posix_process_launcher() {
    return std::make_unique<PosixProcessLauncher>();
}

} // namespace minerhub
