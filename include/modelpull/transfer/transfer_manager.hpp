#pragma once

#include <modelpull/transfer/registry.hpp>
#include <modelpull/transfer/transfer.hpp>

#include <chrono>
#include <filesystem>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace modelpull::transfer {

struct TransferManagerConfig {
    std::chrono::seconds retention{30};
    std::chrono::milliseconds probeTimeout{10000};
    FetchOptions fetch{};
    std::string gitExecutable{"git"};
    std::chrono::milliseconds gitPollInterval{500};
};

/**
 * Entry point of the transfer subsystem.
 *
 * Deduplicates submissions by key, runs the preflight size check, and dispatches
 * each accepted artifact to the HTTP or git strategy, inline or on a worker thread
 * owned by the manager. Progress is read back through the registry.
 *
 * Example:
 * @code
 * TransferManager manager{TransferManagerConfig{}};
 * ArtifactDescriptor desc;
 * desc.remoteUrl = "https://huggingface.co/org/model/resolve/main/model.safetensors";
 * desc.destinationPath = "${BASE_DIR}/models/model.safetensors";
 * auto rec = manager.submit(desc, "/srv/comfy", creds, true);
 * @endcode
 */
class TransferManager {
public:
    explicit TransferManager(TransferManagerConfig config,
                             std::shared_ptr<IHttpAdapter> http = nullptr,
                             std::unique_ptr<ITransferStrategy> httpStrategy = nullptr,
                             std::unique_ptr<ITransferStrategy> gitStrategy = nullptr,
                             std::shared_ptr<TransferRegistry> registry = nullptr);

    /**
     * Cancels every in-flight transfer and joins the workers.
     */
    ~TransferManager();

    TransferManager(const TransferManager&) = delete;
    TransferManager& operator=(const TransferManager&) = delete;

    /**
     * Submit one artifact.
     *
     * @param descriptor exactly one of remoteUrl/gitUrl plus destinationPath
     * @param basePath   value substituted for ${BASE_DIR} in the destination
     * @param background run on a worker and return the Downloading/0% snapshot;
     *                   otherwise run inline and return the terminal record
     * @return the record, or InvalidDescriptor before any state is created
     *
     * A submission for a key whose worker is still running blocks until that worker
     * finishes and returns its record.
     */
    Result<TransferRecord> submit(const ArtifactDescriptor& descriptor,
                                  const std::filesystem::path& basePath,
                                  const ProviderCredentials& credentials = {},
                                  bool background = true);

    /**
     * Submit several artifacts in the background, one result per descriptor.
     */
    std::vector<BatchItemResult> submitBatch(const std::vector<ArtifactDescriptor>& descriptors,
                                             const std::filesystem::path& basePath,
                                             const ProviderCredentials& credentials = {});

    /**
     * Remove the files or directories named by the descriptors' destinations.
     */
    std::vector<BatchItemResult> deleteArtifacts(const std::vector<ArtifactDescriptor>& descriptors,
                                                 const std::filesystem::path& basePath);

    /// Record for `key`, Idle/0% when unknown.
    [[nodiscard]] TransferRecord getProgress(const std::string& key) const;

    /**
     * Records in Downloading, Stopped or Error state. Runs the reaper first.
     */
    std::vector<KeyedRecord> listActiveOrRecent();

    /**
     * Signal cancellation to the worker owning `key`.
     * @return false when no worker is pending for the key
     */
    bool cancel(const std::string& key);

    /// Evict finished records older than the configured retention.
    std::size_t reapFinished();

    /// Join every background worker started so far.
    void drain();

    /**
     * Identity key: destinationPath when present, else gitUrl.
     */
    static std::optional<std::string> keyFor(const ArtifactDescriptor& descriptor);

    [[nodiscard]] TransferRegistry& registry() noexcept { return *registry_; }
    [[nodiscard]] const TransferManagerConfig& config() const noexcept { return config_; }

private:
    void runWorker(TransferJob job, PendingTransfer pending);
    void collectFinishedWorkers();

    TransferManagerConfig config_;
    std::shared_ptr<IHttpAdapter> http_;
    std::unique_ptr<ITransferStrategy> httpStrategy_;
    std::unique_ptr<ITransferStrategy> gitStrategy_;
    std::shared_ptr<TransferRegistry> registry_;

    std::mutex workersMutex_;
    std::unordered_map<std::thread::id, std::thread> workers_;
    std::list<std::thread::id> finishedWorkers_;
};

} // namespace modelpull::transfer
