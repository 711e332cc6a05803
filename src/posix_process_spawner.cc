#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <coderun/concat_tostr.hh>
#include <coderun/errmsg.hh>
#include <coderun/errors.hh>
#include <coderun/file_contents.hh>
#include <coderun/file_descriptor.hh>
#include <coderun/macros/throw.hh>
#include <coderun/pipe.hh>
#include <coderun/posix_process_spawner.hh>
#include <csignal>
#include <ctime>
#include <deque>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/resource.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace coderun {

namespace {

// Sent by the child through the error pipe if it fails before exec
struct ChildError {
    enum class Stage : int { CHDIR, EXEC } stage;
    int errnum;
};

[[noreturn]] void send_error_and_exit(int fd, ChildError::Stage stage) noexcept {
    ChildError err{.stage = stage, .errnum = errno};
    (void)write_all(fd, &err, sizeof(err));
    _exit(127);
}

// Writes to a pipe without getting killed by SIGPIPE if the reader is gone.
// Returns like write(2), errno == EPIPE if the reader is gone.
ssize_t write_without_sigpipe(int fd, const char* data, size_t len) noexcept {
    sigset_t sigpipe_set;
    sigset_t old_set;
    sigemptyset(&sigpipe_set);
    sigaddset(&sigpipe_set, SIGPIPE);
    (void)pthread_sigmask(SIG_BLOCK, &sigpipe_set, &old_set);

    ssize_t rc = write(fd, data, len);
    int errnum = errno;
    if (rc < 0 and errnum == EPIPE and not sigismember(&old_set, SIGPIPE)) {
        // Consume the pending SIGPIPE generated by the above write
        timespec zero{0, 0};
        while (sigtimedwait(&sigpipe_set, nullptr, &zero) < 0 and errno == EINTR) {
        }
    }

    (void)pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = errnum;
    return rc;
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL);
    if (flags < 0 or fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        THROW("fcntl()", errmsg());
    }
}

int exit_code_from_status(int status) noexcept {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

class PosixProcessHandle final : public ProcessHandle {
    pid_t pid_;
    FileDescriptor stdin_fd_;
    FileDescriptor stdout_fd_;
    FileDescriptor stderr_fd_;
    std::string pending_input_;
    size_t pending_input_pos_ = 0;
    std::deque<ProcessEvent> events_;
    std::optional<int> exit_code_; // set once the process is reaped
    bool exit_delivered_ = false;
    bool killed_ = false;

public:
    PosixProcessHandle(
        pid_t pid, FileDescriptor stdin_fd, FileDescriptor stdout_fd, FileDescriptor stderr_fd
    )
    : pid_{pid}
    , stdin_fd_{std::move(stdin_fd)}
    , stdout_fd_{std::move(stdout_fd)}
    , stderr_fd_{std::move(stderr_fd)} {}

    ~PosixProcessHandle() override {
        if (not exit_code_) {
            kill();
        }
    }

    void write_input(const std::vector<std::string>& lines) override {
        for (const auto& line : lines) {
            back_insert(pending_input_, line, '\n');
        }
        flush_input();
    }

    void close_input() override { stdin_fd_.reset(); }

    std::optional<ProcessEvent> next_event(std::chrono::nanoseconds max_wait) override;

    void kill() noexcept override;

private:
    // Writes as much of the pending input as possible without blocking. Closes
    // stdin once everything is written or the process stopped reading.
    void flush_input();

    // Returns true if the process has terminated
    bool try_reap();

    // Reads one chunk from @p fd into events_, closes @p fd on EOF
    void read_chunk(FileDescriptor& fd, bool is_stdout);

    // Reads everything that is available without blocking and closes the pipes
    void drain_outputs();
};

void PosixProcessHandle::flush_input() {
    if (not stdin_fd_.is_open()) {
        return;
    }
    while (pending_input_pos_ < pending_input_.size()) {
        ssize_t rc = write_without_sigpipe(
            stdin_fd_,
            pending_input_.data() + pending_input_pos_,
            pending_input_.size() - pending_input_pos_
        );
        if (rc >= 0) {
            pending_input_pos_ += rc;
            continue;
        }
        if (errno == EINTR) {
            continue;
        }
        if (errno == EAGAIN or errno == EWOULDBLOCK) {
            return; // The rest will be written once the pipe becomes writable
        }
        if (errno == EPIPE) {
            break; // The process does not read its input anymore
        }
        THROW("write()", errmsg());
    }
    pending_input_.clear();
    pending_input_pos_ = 0;
    stdin_fd_.reset();
}

bool PosixProcessHandle::try_reap() {
    if (exit_code_) {
        return true;
    }
    int status = 0;
    for (;;) {
        pid_t rc = waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            exit_code_ = exit_code_from_status(status);
            return true;
        }
        if (rc == 0) {
            return false;
        }
        if (errno != EINTR) {
            THROW("waitpid()", errmsg());
        }
    }
}

void PosixProcessHandle::read_chunk(FileDescriptor& fd, bool is_stdout) {
    std::array<char, 4096> buff{};
    ssize_t rc = read(fd, buff.data(), buff.size());
    if (rc > 0) {
        auto chunk = std::string(buff.data(), rc);
        if (is_stdout) {
            events_.emplace_back(process_event::Stdout{std::move(chunk)});
        } else {
            events_.emplace_back(process_event::Stderr{std::move(chunk)});
        }
    } else if (rc == 0) {
        fd.reset();
    } else if (errno != EINTR and errno != EAGAIN and errno != EWOULDBLOCK) {
        THROW("read()", errmsg());
    }
}

void PosixProcessHandle::drain_outputs() {
    // One chunk per stream in each round keeps the streams interleaved
    while (stdout_fd_.is_open() or stderr_fd_.is_open()) {
        std::array<pollfd, 2> pfds{};
        size_t nfds = 0;
        for (const auto* fd : {&stdout_fd_, &stderr_fd_}) {
            if (fd->is_open()) {
                pfds[nfds++] = pollfd{.fd = *fd, .events = POLLIN, .revents = 0};
            }
        }
        int rc = poll(pfds.data(), nfds, 0);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }
        if (rc == 0) {
            // Nothing more is available, the writer outlived the process
            stdout_fd_.reset();
            stderr_fd_.reset();
            return;
        }
        for (size_t i = 0; i < nfds; ++i) {
            if (pfds[i].revents == 0) {
                continue;
            }
            if (pfds[i].fd == stdout_fd_) {
                read_chunk(stdout_fd_, true);
            } else if (pfds[i].fd == stderr_fd_) {
                read_chunk(stderr_fd_, false);
            }
        }
    }
}

std::optional<ProcessEvent> PosixProcessHandle::next_event(std::chrono::nanoseconds max_wait) {
    using std::chrono::steady_clock;
    // Interval of checking whether the process exited while some of its
    // descendants still hold the output pipes open
    constexpr auto reap_check_interval = std::chrono::milliseconds{20};

    if (killed_ or exit_delivered_) {
        return std::nullopt;
    }

    auto start = steady_clock::now();
    auto deadline = max_wait >= steady_clock::time_point::max() - start
        ? steady_clock::time_point::max()
        : start + max_wait;
    for (;;) {
        if (not events_.empty()) {
            auto event = std::move(events_.front());
            events_.pop_front();
            return event;
        }

        auto now = steady_clock::now();
        if (not stdout_fd_.is_open() and not stderr_fd_.is_open()) {
            if (try_reap()) {
                exit_delivered_ = true;
                stdin_fd_.reset();
                return process_event::Exited{.code = *exit_code_};
            }
            if (now >= deadline) {
                return std::nullopt;
            }
            std::this_thread::sleep_for(
                std::min<std::chrono::nanoseconds>(deadline - now, std::chrono::milliseconds{1})
            );
            continue;
        }

        if (now >= deadline) {
            return std::nullopt;
        }

        std::array<pollfd, 3> pfds{};
        size_t nfds = 0;
        auto add_pfd = [&](const FileDescriptor& fd, short events) {
            if (fd.is_open()) {
                pfds[nfds++] = pollfd{.fd = fd, .events = events, .revents = 0};
            }
        };
        add_pfd(stdout_fd_, POLLIN);
        add_pfd(stderr_fd_, POLLIN);
        add_pfd(stdin_fd_, POLLOUT);

        auto wait = std::min<std::chrono::nanoseconds>(deadline - now, reap_check_interval);
        auto timeout_ms =
            static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(wait).count());
        int rc = poll(pfds.data(), nfds, timeout_ms);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("poll()", errmsg());
        }

        for (size_t i = 0; i < nfds; ++i) {
            if (pfds[i].revents == 0) {
                continue;
            }
            if (pfds[i].fd == stdout_fd_) {
                read_chunk(stdout_fd_, true);
            } else if (pfds[i].fd == stderr_fd_) {
                read_chunk(stderr_fd_, false);
            } else if (pfds[i].fd == stdin_fd_) {
                if (pfds[i].revents & (POLLERR | POLLHUP)) {
                    stdin_fd_.reset(); // Reader is gone
                } else {
                    flush_input();
                }
            }
        }

        if (rc == 0 and try_reap()) {
            drain_outputs();
        }
    }
}

void PosixProcessHandle::kill() noexcept {
    if (killed_) {
        return;
    }
    killed_ = true;
    if (not exit_code_) {
        (void)::kill(-pid_, SIGKILL);
        int status = 0;
        while (waitpid(pid_, &status, 0) < 0 and errno == EINTR) {
        }
        exit_code_ = exit_code_from_status(status);
    }
    stdin_fd_.reset();
    stdout_fd_.reset();
    stderr_fd_.reset();
    events_.clear();
}

} // namespace

std::unique_ptr<ProcessHandle>
PosixProcessSpawner::spawn(const std::string& command, const Options& options) {
    auto make_pipe = [] {
        auto p = open_pipe(O_CLOEXEC);
        if (not p) {
            throw SpawnError{concat_tostr("pipe2()", errmsg())};
        }
        return std::move(*p);
    };
    Pipe stdin_pipe = make_pipe();
    Pipe stdout_pipe = make_pipe();
    Pipe stderr_pipe = make_pipe();
    Pipe error_pipe = make_pipe();
    // Only the ends kept by the parent
    set_nonblocking(stdin_pipe.writable);
    set_nonblocking(stdout_pipe.readable);
    set_nonblocking(stderr_pipe.readable);

    const auto& wd = options.working_directory;
    bool change_dir = not(wd.empty() or wd == "." or wd == "./");
    // CPU time limit = timeout rounded up to seconds + 1 second
    rlim_t cpu_time_limit =
        std::chrono::ceil<std::chrono::seconds>(options.timeout).count() + 1;

    pid_t pid = fork();
    if (pid == -1) {
        throw SpawnError{concat_tostr("fork()", errmsg())};
    }

    if (pid == 0) {
        // Child process, only async-signal-safe calls below
        (void)setpgid(0, 0);
        if (dup2(stdin_pipe.readable, STDIN_FILENO) < 0 or
            dup2(stdout_pipe.writable, STDOUT_FILENO) < 0 or
            dup2(stderr_pipe.writable, STDERR_FILENO) < 0)
        {
            send_error_and_exit(error_pipe.writable, ChildError::Stage::EXEC);
        }

        if (change_dir and chdir(wd.c_str())) {
            send_error_and_exit(error_pipe.writable, ChildError::Stage::CHDIR);
        }

        if (options.timeout > std::chrono::milliseconds::zero()) {
            rlimit limit{.rlim_cur = cpu_time_limit, .rlim_max = cpu_time_limit};
            (void)setrlimit(RLIMIT_CPU, &limit);
        }

        // Restore default signal mask for the command
        sigset_t empty_set;
        sigemptyset(&empty_set);
        (void)sigprocmask(SIG_SETMASK, &empty_set, nullptr);

        execl(shell_.c_str(), shell_.c_str(), "-c", command.c_str(), nullptr);
        send_error_and_exit(error_pipe.writable, ChildError::Stage::EXEC);
    }

    // Parent process
    (void)setpgid(pid, pid); // Avoid racing with the child
    stdin_pipe.readable.reset();
    stdout_pipe.writable.reset();
    stderr_pipe.writable.reset();
    error_pipe.writable.reset();

    // exec() closes the error pipe, otherwise the child reports the failure
    ChildError child_error{};
    ssize_t rc = 0;
    while ((rc = read(error_pipe.readable, &child_error, sizeof(child_error))) < 0 and
           errno == EINTR)
    {
    }
    if (rc > 0) {
        while (waitpid(pid, nullptr, 0) < 0 and errno == EINTR) {
        }
        switch (child_error.stage) {
        case ChildError::Stage::CHDIR:
            throw SpawnError{concat_tostr("chdir(`", wd, "`) failed", errmsg(child_error.errnum))};
        case ChildError::Stage::EXEC:
            throw SpawnError{concat_tostr(
                "Failed to execute `", shell_, "`", errmsg(child_error.errnum)
            )};
        }
        throw SpawnError{"Child process reported an unknown error"};
    }

    return std::make_unique<PosixProcessHandle>(
        pid,
        std::move(stdin_pipe.writable),
        std::move(stdout_pipe.readable),
        std::move(stderr_pipe.readable)
    );
}

} // namespace coderun
