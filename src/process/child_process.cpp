#include <modelpull/process/child_process.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

extern char** environ;

namespace modelpull::process {

namespace {

// Build "KEY=value" entries: the inherited environment with overrides applied.
std::vector<std::string>
build_environment(const std::unordered_map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry{*e};
        auto eq = entry.find('=');
        auto key = std::string(entry.substr(0, eq));
        if (!overrides.contains(key)) {
            out.emplace_back(entry);
        }
    }
    for (const auto& [key, value] : overrides) {
        out.push_back(key + "=" + value);
    }
    return out;
}

constexpr std::size_t kStderrTailLimit = 4096;

} // anonymous namespace

class ChildProcess::Impl {
public:
    explicit Impl(ChildProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_alive() const noexcept;
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    void terminate(std::chrono::milliseconds timeout);
    [[nodiscard]] int64_t pid() const noexcept { return static_cast<int64_t>(process_id_); }
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& stderr_tail() const noexcept { return stderr_tail_; }

private:
    bool try_reap();
    void drain_stderr();

    ChildProcessConfig config_;
    std::atomic<ProcessState> state_{ProcessState::Unstarted};
    std::optional<int> exit_code_;
    pid_t process_id_{-1};
    int stderr_fd_{-1};
    std::string stderr_tail_;
};

ChildProcess::Impl::Impl(ChildProcessConfig config) : config_{std::move(config)} {
    spdlog::debug("ChildProcess: Spawning process: {}", config_.executable.string());

    // Everything the child needs is prepared before fork(); the parent may be multi-threaded.
    std::string exe_str = config_.executable.string();
    std::vector<char*> argv;
    argv.push_back(exe_str.data());
    for (auto& arg : config_.args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    auto env_strings = build_environment(config_.env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& e : env_strings) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    std::string workdir = config_.workdir ? config_.workdir->string() : std::string{};

    int devnull = -1;
    if (config_.discard_output) {
        devnull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devnull < 0) {
            state_.store(ProcessState::Failed, std::memory_order_release);
            throw std::runtime_error("Failed to open /dev/null: " + std::string(strerror(errno)));
        }
    }

    int stderr_pipe[2] = {-1, -1};
    if (config_.capture_stderr) {
        if (pipe2(stderr_pipe, O_CLOEXEC) < 0) {
            int err = errno;
            if (devnull >= 0)
                close(devnull);
            state_.store(ProcessState::Failed, std::memory_order_release);
            throw std::runtime_error("Failed to create stderr pipe: " + std::string(strerror(err)));
        }
        fcntl(stderr_pipe[0], F_SETFL, O_NONBLOCK);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        if (devnull >= 0)
            close(devnull);
        if (stderr_pipe[0] >= 0) {
            close(stderr_pipe[0]);
            close(stderr_pipe[1]);
        }
        state_.store(ProcessState::Failed, std::memory_order_release);
        throw std::runtime_error("fork() failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        // Child process: own process group so terminate() reaches helper processes
        setpgid(0, 0);

        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        if (stderr_pipe[1] >= 0) {
            dup2(stderr_pipe[1], STDERR_FILENO);
        }

        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            _exit(127);
        }

        execvpe(argv[0], argv.data(), envp.data());

        // If exec fails
        _exit(127);
    }

    // Parent process
    if (devnull >= 0)
        close(devnull);
    if (stderr_pipe[1] >= 0) {
        close(stderr_pipe[1]);
        stderr_fd_ = stderr_pipe[0];
    }
    setpgid(pid, pid);
    process_id_ = pid;
    state_.store(ProcessState::Running, std::memory_order_release);

    spdlog::debug("ChildProcess: Spawned process {} (pid={})", exe_str, process_id_);
}

ChildProcess::Impl::~Impl() {
    if (is_alive()) {
        spdlog::debug("ChildProcess::~Impl(): Process {} still alive, terminating", process_id_);
        terminate(std::chrono::seconds{5});
    }
    if (stderr_fd_ >= 0)
        close(stderr_fd_);
}

void ChildProcess::Impl::drain_stderr() {
    if (stderr_fd_ < 0)
        return;

    char buffer[1024];
    for (;;) {
        ssize_t n = read(stderr_fd_, buffer, sizeof(buffer));
        if (n > 0) {
            stderr_tail_.append(buffer, static_cast<std::size_t>(n));
            if (stderr_tail_.size() > kStderrTailLimit) {
                stderr_tail_.erase(0, stderr_tail_.size() - kStderrTailLimit);
            }
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n == 0) {
            // Writer side closed: every descendant holding stderr has exited
            close(stderr_fd_);
            stderr_fd_ = -1;
        }
        return;
    }
}

bool ChildProcess::Impl::is_alive() const noexcept {
    auto current = state();
    return current == ProcessState::Running || current == ProcessState::ShuttingDown;
}

bool ChildProcess::Impl::try_reap() {
    drain_stderr();
    int status = 0;
    pid_t result = waitpid(process_id_, &status, WNOHANG);
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        state_.store(ProcessState::Exited, std::memory_order_release);
        drain_stderr();
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for
        state_.store(ProcessState::Exited, std::memory_order_release);
        return true;
    }
    return false;
}

bool ChildProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        return true;
    }

    auto start = std::chrono::steady_clock::now();
    while (true) {
        if (try_reap()) {
            return true;
        }
        if (std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

void ChildProcess::Impl::terminate(std::chrono::milliseconds timeout) {
    if (!is_alive()) {
        return;
    }

    if (process_id_ <= 0) {
        spdlog::warn("ChildProcess: Invalid process ID {} during termination", process_id_);
        state_.store(ProcessState::Exited, std::memory_order_release);
        return;
    }

    spdlog::debug("ChildProcess: Terminating process group {}", process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    // Try graceful shutdown (SIGTERM)
    if (kill(-process_id_, SIGTERM) == 0 || kill(process_id_, SIGTERM) == 0) {
        if (wait_for_exit(timeout)) {
            return;
        }
    }

    // Forceful kill (SIGKILL)
    spdlog::warn("ChildProcess: Forcefully killing process {}", process_id_);
    kill(-process_id_, SIGKILL);
    kill(process_id_, SIGKILL);
    if (!wait_for_exit(std::chrono::seconds{1})) {
        spdlog::error("ChildProcess: Process {} did not exit after SIGKILL", process_id_);
    }
}

// ============================================================================
// ChildProcess Public Interface (forwards to Impl)
// ============================================================================

ChildProcess::ChildProcess(ChildProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

ChildProcess::~ChildProcess() = default;

ChildProcess::ChildProcess(ChildProcess&&) noexcept = default;
ChildProcess& ChildProcess::operator=(ChildProcess&&) noexcept = default;

ProcessState ChildProcess::state() const noexcept {
    return impl_->state();
}

bool ChildProcess::is_alive() const noexcept {
    return impl_->is_alive();
}

bool ChildProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_->wait_for_exit(timeout);
}

void ChildProcess::terminate(std::chrono::milliseconds timeout) {
    impl_->terminate(timeout);
}

int64_t ChildProcess::pid() const noexcept {
    return impl_->pid();
}

std::optional<int> ChildProcess::exit_code() const noexcept {
    return impl_->exit_code();
}

std::string ChildProcess::stderr_tail() const {
    return impl_->stderr_tail();
}

} // namespace modelpull::process
