#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace modelpull::process {

/**
 * @brief Lifecycle state of a spawned child process
 */
enum class ProcessState : uint8_t {
    Unstarted,    ///< Process not yet spawned
    Running,      ///< Process spawned and not yet reaped
    ShuttingDown, ///< Termination requested
    Exited,       ///< Process exited and was reaped
    Failed        ///< Spawn failed
};

/**
 * @brief Configuration for spawning a child process
 *
 * Example:
 * @code
 * ChildProcessConfig config{
 *     .executable = "git",
 *     .args = {"clone", url, dest}
 * };
 * config.with_env("GIT_TERMINAL_PROMPT", "0");
 * @endcode
 */
struct ChildProcessConfig {
    std::filesystem::path executable; ///< Executable name or path (resolved through PATH)
    std::vector<std::string> args;    ///< Command-line arguments (argv[1..])
    std::unordered_map<std::string, std::string> env; ///< Extra environment variables
    std::optional<std::filesystem::path> workdir;     ///< Working directory (optional)
    bool discard_output{true};                        ///< Send stdout/stderr to /dev/null
    bool capture_stderr{false};                       ///< Keep the tail of stderr (see stderr_tail)

    /**
     * @brief Add environment variable (builder pattern)
     */
    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    /**
     * @brief Set working directory (builder pattern)
     */
    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief RAII wrapper for a short-lived child process (fork/exec)
 *
 * The child is placed in its own process group so termination reaches any
 * helpers it spawns. The destructor terminates a child that is still running.
 *
 * **Thread Safety:**
 * Intended to be driven by a single owning thread.
 */
class ChildProcess {
public:
    /**
     * @brief Construct and spawn the process
     * @throws std::runtime_error if fork() fails
     */
    explicit ChildProcess(ChildProcessConfig config);
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&&) noexcept;
    ChildProcess& operator=(ChildProcess&&) noexcept;

    [[nodiscard]] ProcessState state() const noexcept;

    /**
     * @brief True until the process has been reaped
     */
    [[nodiscard]] bool is_alive() const noexcept;

    /**
     * @brief Block until the process exits or the timeout elapses
     * @return true if the process exited (exit_code() is then set)
     */
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /**
     * @brief SIGTERM the process group, escalating to SIGKILL after timeout
     */
    void terminate(std::chrono::milliseconds timeout);

    [[nodiscard]] int64_t pid() const noexcept;

    /**
     * @brief Exit status; 128 + signal number when killed by a signal
     */
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    /**
     * @brief Last bytes the child wrote to stderr (capture_stderr only)
     *
     * Drained while waiting; complete once the process has been reaped.
     */
    [[nodiscard]] std::string stderr_tail() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace modelpull::process
