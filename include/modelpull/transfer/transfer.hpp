#pragma once

/*
 * modelpull transfer - public types and service interfaces
 *
 * This header defines the data types shared by the transfer subsystem and the
 * abstract seams it is built on (network adapter, transfer strategy). It contains
 * no implementation details.
 *
 * - A transfer is identified by its key (destination path, else git URL).
 * - Records are written by the single worker that owns the key and read by pollers.
 * - Cancellation is cooperative (std::stop_token) and observed per chunk or per poll.
 */

#include <modelpull/core/types.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

namespace modelpull::transfer {

// ================================
// Fundamental enums and constants
// ================================

/**
 * Transfer lifecycle status as seen by pollers.
 */
enum class TransferStatus { Idle, Downloading, Done, Stopped, Error };

constexpr const char* statusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Idle: return "idle";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Done: return "done";
        case TransferStatus::Stopped: return "stopped";
        case TransferStatus::Error: return "error";
    }
    return "idle";
}

constexpr bool isTerminal(TransferStatus status) {
    return status == TransferStatus::Done || status == TransferStatus::Stopped ||
           status == TransferStatus::Error;
}

/// Placeholder substituted with the configured base directory in destination paths.
inline constexpr std::string_view kBaseDirToken = "${BASE_DIR}";

// ===================
// Small data objects
// ===================

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * What the caller wants fetched. Exactly one of remoteUrl/gitUrl must be set.
 */
struct ArtifactDescriptor {
    std::optional<std::string> remoteUrl;
    std::optional<std::string> gitUrl;
    std::optional<std::string> destinationPath; // may contain ${BASE_DIR}
    std::vector<Header> headers;
};

/**
 * Tokens for the recognized model-hosting providers.
 */
struct ProviderCredentials {
    std::optional<std::string> huggingFace;
    std::optional<std::string> civitai;
};

/**
 * Point-in-time view of one artifact's transfer.
 */
struct TransferRecord {
    int progressPercent{0}; // 0..100
    TransferStatus status{TransferStatus::Idle};
    std::optional<std::filesystem::path> destinationPath;
    std::optional<TimePoint> startedAt;
    std::optional<TimePoint> finishedAt;
    std::optional<std::string> errorMessage;
};

struct KeyedRecord {
    std::string key;
    TransferRecord record;
};

/**
 * Per-item outcome of batch submit/delete.
 */
struct BatchItemResult {
    bool ok{false};
    std::optional<std::string> message;
};

/**
 * Network options for a streaming GET.
 */
struct FetchOptions {
    std::chrono::milliseconds connectTimeout{30000};
    std::chrono::milliseconds timeout{0}; // 0 = no overall limit
    std::chrono::seconds readTimeout{30}; // abort when no byte arrives for this long; 0 = off
    bool followRedirects{true};
};

/**
 * Work item handed to a strategy by the orchestrator.
 */
struct TransferJob {
    std::string key;
    ArtifactDescriptor descriptor;
    std::filesystem::path destination; // resolved
    ProviderCredentials credentials;
};

// ===================
// Callback signatures
// ===================

using ChunkSink = std::function<Result<void>(std::span<const std::byte>)>;
using ContentLengthCallback = std::function<void(std::optional<std::uint64_t>)>;
using ProgressReporter = std::function<void(int percent)>;

// ==========================
// Service interface classes
// ==========================

/**
 * HTTP adapter abstraction (libcurl-based implementation satisfies this).
 */
class IHttpAdapter {
public:
    virtual ~IHttpAdapter() = default;

    /**
     * Header-only request for the remote size. nullopt when the server omits it.
     */
    virtual Result<std::optional<std::uint64_t>>
    probeContentLength(std::string_view url, const std::vector<Header>& headers,
                       std::chrono::milliseconds timeout) = 0;

    /**
     * Stream the body of a GET to `sink`, one call per received chunk.
     * `onContentLength` fires once before the first chunk. An error returned by the
     * sink aborts the transfer and is returned unchanged.
     */
    virtual Result<void> fetch(std::string_view url, const std::vector<Header>& headers,
                               const FetchOptions& options,
                               const ContentLengthCallback& onContentLength,
                               const ChunkSink& sink) = 0;
};

/**
 * Executes one transfer. Returns the terminal status (Done or Stopped) or an error.
 * Implementations report progress only through `report` and never touch the registry.
 */
class ITransferStrategy {
public:
    virtual ~ITransferStrategy() = default;

    virtual Result<TransferStatus> execute(const TransferJob& job, std::stop_token cancel,
                                           const ProgressReporter& report) = 0;
};

/**
 * Factory for the default libcurl adapter.
 */
std::unique_ptr<IHttpAdapter> makeCurlHttpAdapter();

} // namespace modelpull::transfer
