#include <modelpull/config/config_helpers.h>
#include <modelpull/process/child_process.hpp>
#include <modelpull/transfer/git_strategy.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <optional>
#include <system_error>

namespace modelpull::transfer {

namespace fs = std::filesystem;

namespace {

void removePartialDirectory(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return;
    fs::remove_all(path, ec);
    if (ec) {
        spdlog::error("Failed to remove partial git directory {}: {}", path.string(), ec.message());
    } else {
        spdlog::info("Removed partial git directory: {}", path.string());
    }
}

// Last non-empty line of git's stderr, usually the "fatal: ..." reason
std::string lastLine(std::string text) {
    config::rtrim(text);
    auto pos = text.find_last_of('\n');
    std::string line = pos == std::string::npos ? text : text.substr(pos + 1);
    config::trim(line);
    return line;
}

} // namespace

GitTransferStrategy::GitTransferStrategy(GitSettings settings) : settings_(std::move(settings)) {}

Result<TransferStatus> GitTransferStrategy::execute(const TransferJob& job, std::stop_token cancel,
                                                    const ProgressReporter& report) {
    if (!job.descriptor.gitUrl) {
        return Error{ErrorCode::InvalidDescriptor, "git transfer requires a repository URL"};
    }
    const auto& dest = job.destination;

    std::error_code ec;
    if (fs::is_directory(dest, ec)) {
        spdlog::info("Git destination {} already exists, skipping clone", dest.string());
        if (report)
            report(100);
        return TransferStatus::Done;
    }

    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "cannot create directory " +
                                                 dest.parent_path().string() + ": " + ec.message()};
        }
    }

    process::ChildProcessConfig config{.executable = settings_.executable,
                                       .args = {"clone", *job.descriptor.gitUrl, dest.string()}};
    config.with_env("GIT_TERMINAL_PROMPT", "0");
    config.capture_stderr = true;

    std::optional<process::ChildProcess> proc;
    try {
        proc.emplace(std::move(config));
    } catch (const std::exception& e) {
        return Error{ErrorCode::ProcessError,
                     std::string("failed to start git clone: ") + e.what()};
    }
    spdlog::debug("Started {} clone for {} (pid {})", settings_.executable, job.key, proc->pid());

    while (!proc->wait_for_exit(settings_.pollInterval)) {
        if (cancel.stop_requested()) {
            spdlog::info("Clone stopped by user for {}", job.key);
            proc->terminate(settings_.terminateTimeout);
            removePartialDirectory(dest);
            return TransferStatus::Stopped;
        }
    }

    const int code = proc->exit_code().value_or(-1);
    spdlog::debug("git clone for {} exited with code {}", job.key, code);
    if (code != 0) {
        std::string message = "git clone exited with code " + std::to_string(code);
        if (auto detail = lastLine(proc->stderr_tail()); !detail.empty()) {
            message += ": " + detail;
        }
        return Error{ErrorCode::ProcessError, std::move(message)};
    }

    spdlog::info("Clone completed for {}", job.key);
    return TransferStatus::Done;
}

} // namespace modelpull::transfer
