#include <modelpull/transfer/registry.hpp>

#include <spdlog/spdlog.h>

namespace modelpull::transfer {

// ---------- CompletionSignal ----------

void CompletionSignal::notify() {
    {
        std::lock_guard lock{mutex_};
        if (fired_)
            return;
        fired_ = true;
    }
    cv_.notify_all();
}

void CompletionSignal::wait() const {
    std::unique_lock lock{mutex_};
    cv_.wait(lock, [this] { return fired_; });
}

bool CompletionSignal::waitFor(std::chrono::milliseconds timeout) const {
    std::unique_lock lock{mutex_};
    return cv_.wait_for(lock, timeout, [this] { return fired_; });
}

bool CompletionSignal::fired() const {
    std::lock_guard lock{mutex_};
    return fired_;
}

// ---------- TransferRegistry ----------

TransferRegistry::TransferRegistry(Clock clock) : clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return std::chrono::system_clock::now(); };
    }
}

TimePoint TransferRegistry::now() const {
    return clock_();
}

void TransferRegistry::put(const std::string& key, TransferRecord record) {
    std::unique_lock lock{recordsMutex_};
    records_[key] = std::move(record);
}

bool TransferRegistry::putUnlessPending(const std::string& key, TransferRecord record) {
    std::lock_guard pendingLock{pendingMutex_};
    if (completions_.contains(key)) {
        return false;
    }
    std::unique_lock lock{recordsMutex_};
    records_[key] = std::move(record);
    return true;
}

void TransferRegistry::update(const std::string& key,
                              const std::function<void(TransferRecord&)>& mutate) {
    std::unique_lock lock{recordsMutex_};
    auto it = records_.find(key);
    if (it != records_.end()) {
        mutate(it->second);
    }
}

std::optional<TransferRecord> TransferRegistry::find(const std::string& key) const {
    std::shared_lock lock{recordsMutex_};
    auto it = records_.find(key);
    if (it == records_.end())
        return std::nullopt;
    return it->second;
}

TransferRecord TransferRegistry::snapshot(const std::string& key) const {
    if (auto rec = find(key)) {
        return *rec;
    }
    return TransferRecord{};
}

std::vector<KeyedRecord>
TransferRegistry::list(const std::function<bool(const TransferRecord&)>& filter) const {
    std::vector<KeyedRecord> out;
    std::shared_lock lock{recordsMutex_};
    out.reserve(records_.size());
    for (const auto& [key, record] : records_) {
        if (!filter || filter(record)) {
            out.push_back(KeyedRecord{key, record});
        }
    }
    return out;
}

std::size_t TransferRegistry::size() const {
    std::shared_lock lock{recordsMutex_};
    return records_.size();
}

std::pair<PendingTransfer, bool> TransferRegistry::acquirePending(const std::string& key) {
    std::lock_guard lock{pendingMutex_};
    auto it = completions_.find(key);
    if (it != completions_.end()) {
        return {PendingTransfer{it->second, cancels_.at(key)}, false};
    }
    PendingTransfer created{std::make_shared<CompletionSignal>(), std::stop_source{}};
    completions_.emplace(key, created.completion);
    cancels_.emplace(key, created.cancel);
    return {std::move(created), true};
}

std::optional<PendingTransfer> TransferRegistry::pending(const std::string& key) const {
    std::lock_guard lock{pendingMutex_};
    auto it = completions_.find(key);
    if (it == completions_.end())
        return std::nullopt;
    return PendingTransfer{it->second, cancels_.at(key)};
}

void TransferRegistry::releasePending(const std::string& key) {
    std::lock_guard lock{pendingMutex_};
    completions_.erase(key);
    cancels_.erase(key);
}

bool TransferRegistry::requestCancel(const std::string& key) {
    std::lock_guard lock{pendingMutex_};
    auto it = cancels_.find(key);
    if (it == cancels_.end())
        return false;
    it->second.request_stop();
    return true;
}

std::size_t TransferRegistry::requestCancelAll() {
    std::lock_guard lock{pendingMutex_};
    for (auto& [key, source] : cancels_) {
        source.request_stop();
    }
    return cancels_.size();
}

std::size_t TransferRegistry::reapFinished(std::chrono::seconds retention) {
    const auto current = now();
    std::vector<std::string> toRemove;

    std::unique_lock lock{recordsMutex_};
    for (auto& [key, record] : records_) {
        if (!isTerminal(record.status))
            continue;

        if (!record.finishedAt) {
            record.finishedAt = current;
            spdlog::info("Marked transfer {} as finished", key);
        } else if (current - *record.finishedAt > retention) {
            toRemove.push_back(key);
            spdlog::info("Cleaning up finished transfer entry: {} (status: {})", key,
                         statusToString(record.status));
        }
    }

    for (const auto& key : toRemove) {
        records_.erase(key);
    }
    return toRemove.size();
}

} // namespace modelpull::transfer
