#pragma once

#include <modelpull/transfer/transfer.hpp>

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace modelpull::transfer {

/**
 * One-shot completion signal. notify() fires it once; later calls are no-ops.
 */
class CompletionSignal {
public:
    void notify();
    void wait() const;
    [[nodiscard]] bool waitFor(std::chrono::milliseconds timeout) const;
    [[nodiscard]] bool fired() const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool fired_{false};
};

/**
 * Signals attached to a key while its worker is in flight.
 */
struct PendingTransfer {
    std::shared_ptr<CompletionSignal> completion;
    std::stop_source cancel;
};

/**
 * Store of TransferRecords plus the per-key completion and cancellation signals.
 *
 * Records are only written by the worker owning the key (and by the reaper for
 * finishedAt). The map locks are held for single lookups or copies, never across
 * a transfer, so readers always receive a consistent snapshot.
 */
class TransferRegistry {
public:
    using Clock = std::function<TimePoint()>;

    explicit TransferRegistry(Clock clock = {});

    TransferRegistry(const TransferRegistry&) = delete;
    TransferRegistry& operator=(const TransferRegistry&) = delete;

    // ---- records ----

    void put(const std::string& key, TransferRecord record);

    /**
     * Write `record` only when no worker is pending for `key`.
     * @return false if a worker owns the key
     */
    bool putUnlessPending(const std::string& key, TransferRecord record);

    /**
     * Apply `mutate` to the stored record; no-op when the key is unknown.
     */
    void update(const std::string& key, const std::function<void(TransferRecord&)>& mutate);

    [[nodiscard]] std::optional<TransferRecord> find(const std::string& key) const;

    /**
     * Record for `key`, or Idle/0% when unknown.
     */
    [[nodiscard]] TransferRecord snapshot(const std::string& key) const;

    [[nodiscard]] std::vector<KeyedRecord>
    list(const std::function<bool(const TransferRecord&)>& filter = {}) const;

    [[nodiscard]] std::size_t size() const;

    // ---- pending worker signals ----

    /**
     * Insert-if-absent. Returns the signals for `key` and whether they were created
     * by this call (true) or already belonged to an in-flight worker (false).
     */
    std::pair<PendingTransfer, bool> acquirePending(const std::string& key);

    [[nodiscard]] std::optional<PendingTransfer> pending(const std::string& key) const;

    void releasePending(const std::string& key);

    /**
     * Set the cancellation signal of an in-flight worker.
     * @return false when no worker is pending for `key`
     */
    bool requestCancel(const std::string& key);

    /**
     * Request cancellation of every in-flight worker. Returns how many were signalled.
     */
    std::size_t requestCancelAll();

    // ---- reaper ----

    /**
     * Stamp finishedAt on terminal records that lack it, then evict records whose
     * finishedAt is older than `retention`. Returns the number evicted.
     */
    std::size_t reapFinished(std::chrono::seconds retention);

    [[nodiscard]] TimePoint now() const;

private:
    Clock clock_;

    mutable std::shared_mutex recordsMutex_;
    std::unordered_map<std::string, TransferRecord> records_;

    mutable std::mutex pendingMutex_;
    std::unordered_map<std::string, std::shared_ptr<CompletionSignal>> completions_;
    std::unordered_map<std::string, std::stop_source> cancels_;
};

} // namespace modelpull::transfer
