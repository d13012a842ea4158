#include <modelpull/transfer/http_strategy.hpp>
#include <modelpull/transfer/provider_auth.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <optional>
#include <system_error>

namespace modelpull::transfer {

namespace fs = std::filesystem;

namespace {

void removePartialFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return;
    if (fs::remove(path, ec)) {
        spdlog::info("Removed partial file: {}", path.string());
    } else if (ec) {
        spdlog::error("Failed to remove partial file {}: {}", path.string(), ec.message());
    }
}

Error describeFailure(const Error& err) {
    switch (err.code) {
        case ErrorCode::NetworkError:
        case ErrorCode::Timeout:
            return Error{err.code, "HTTP request error: " + err.message};
        default:
            return err;
    }
}

} // namespace

HttpTransferStrategy::HttpTransferStrategy(std::shared_ptr<IHttpAdapter> http, FetchOptions options)
    : http_(std::move(http)), options_(options) {}

Result<TransferStatus> HttpTransferStrategy::execute(const TransferJob& job, std::stop_token cancel,
                                                     const ProgressReporter& report) {
    if (!job.descriptor.remoteUrl) {
        return Error{ErrorCode::InvalidDescriptor, "HTTP transfer requires a remote URL"};
    }
    const auto& dest = job.destination;

    std::error_code ec;
    if (dest.has_parent_path()) {
        fs::create_directories(dest.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IoError, "File I/O error: cannot create directory " +
                                                 dest.parent_path().string() + ": " + ec.message()};
        }
    }

    auto request =
        applyProviderAuth(*job.descriptor.remoteUrl, job.descriptor.headers, job.credentials);
    spdlog::info("Downloading {} to {}", job.key, dest.string());

    std::ofstream out;
    bool opened = false;
    std::optional<Error> openError;
    std::uint64_t total = 0;
    std::uint64_t written = 0;
    int lastLogged = -1;

    auto openOutput = [&] {
        if (opened)
            return;
        opened = true;
        out.open(dest, std::ios::binary | std::ios::trunc);
        if (!out) {
            openError = Error{ErrorCode::IoError, "File I/O error: cannot open " + dest.string()};
        }
    };

    ContentLengthCallback onLength = [&](std::optional<std::uint64_t> length) {
        total = length.value_or(0);
        spdlog::debug("Content length for {}: {} bytes", job.key, total);
        openOutput();
    };

    ChunkSink sink = [&](std::span<const std::byte> chunk) -> Result<void> {
        openOutput();
        if (openError)
            return *openError;

        out.write(reinterpret_cast<const char*>(chunk.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (!out) {
            return Error{ErrorCode::IoError,
                         "File I/O error: write to " + dest.string() + " failed"};
        }
        written += chunk.size();

        int progress = 0;
        if (total > 0) {
            progress = static_cast<int>(std::min<std::uint64_t>(written * 100 / total, 100));
        }
        if (report)
            report(progress);
        if (progress % 10 == 0 && progress != lastLogged) {
            spdlog::info("Download progress for {}: {}% ({}/{} bytes)", job.key, progress,
                         written, total);
            lastLogged = progress;
        }

        if (cancel.stop_requested()) {
            return Error{ErrorCode::OperationCancelled, "Transfer cancelled"};
        }
        return Result<void>{};
    };

    auto fetched = http_->fetch(request.url, request.headers, options_, onLength, sink);
    if (out.is_open())
        out.close();

    if (!fetched) {
        if (fetched.error().code == ErrorCode::OperationCancelled) {
            spdlog::info("Download stopped by user for {}", job.key);
            removePartialFile(dest);
            return TransferStatus::Stopped;
        }
        auto err = describeFailure(fetched.error());
        spdlog::error("Download of {} failed: {}", job.key, err.message);
        return err;
    }

    if (cancel.stop_requested()) {
        spdlog::info("Download was stopped for {}", job.key);
        removePartialFile(dest);
        return TransferStatus::Stopped;
    }

    // Empty bodies never reach the sink
    openOutput();
    if (out.is_open())
        out.close();
    if (openError) {
        spdlog::error("Download of {} failed: {}", job.key, openError->message);
        return *openError;
    }

    spdlog::info("Download completed for {}. Final file size: {} bytes", job.key, written);
    return TransferStatus::Done;
}

} // namespace modelpull::transfer
