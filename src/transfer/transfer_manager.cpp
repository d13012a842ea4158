#include <modelpull/config/config_helpers.h>
#include <modelpull/transfer/git_strategy.hpp>
#include <modelpull/transfer/http_strategy.hpp>
#include <modelpull/transfer/preflight.hpp>
#include <modelpull/transfer/provider_auth.hpp>
#include <modelpull/transfer/transfer_manager.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <set>
#include <system_error>
#include <utility>

namespace modelpull::transfer {

namespace fs = std::filesystem;

namespace {

bool present(const std::optional<std::string>& value) {
    return value && !value->empty();
}

Result<void> validateDescriptor(const ArtifactDescriptor& descriptor) {
    const bool hasUrl = present(descriptor.remoteUrl);
    const bool hasGit = present(descriptor.gitUrl);
    if (!hasUrl && !hasGit) {
        return Error{ErrorCode::InvalidDescriptor, "Artifact needs a remote URL or a git URL"};
    }
    if (hasUrl && hasGit) {
        return Error{ErrorCode::InvalidDescriptor,
                     "Artifact cannot have both a remote URL and a git URL"};
    }
    if (!present(descriptor.destinationPath)) {
        return Error{ErrorCode::InvalidDescriptor, "Artifact needs a destination path"};
    }
    return Result<void>{};
}

} // namespace

TransferManager::TransferManager(TransferManagerConfig config, std::shared_ptr<IHttpAdapter> http,
                                 std::unique_ptr<ITransferStrategy> httpStrategy,
                                 std::unique_ptr<ITransferStrategy> gitStrategy,
                                 std::shared_ptr<TransferRegistry> registry)
    : config_(std::move(config)), http_(std::move(http)), httpStrategy_(std::move(httpStrategy)),
      gitStrategy_(std::move(gitStrategy)), registry_(std::move(registry)) {
    if (!http_) {
        http_ = makeCurlHttpAdapter();
    }
    if (!httpStrategy_) {
        httpStrategy_ = std::make_unique<HttpTransferStrategy>(http_, config_.fetch);
    }
    if (!gitStrategy_) {
        GitSettings git;
        git.executable = config_.gitExecutable;
        git.pollInterval = config_.gitPollInterval;
        gitStrategy_ = std::make_unique<GitTransferStrategy>(std::move(git));
    }
    if (!registry_) {
        registry_ = std::make_shared<TransferRegistry>();
    }
}

TransferManager::~TransferManager() {
    auto signalled = registry_->requestCancelAll();
    if (signalled > 0) {
        spdlog::info("Stopping {} in-flight transfer(s)", signalled);
    }
    drain();
}

std::optional<std::string> TransferManager::keyFor(const ArtifactDescriptor& descriptor) {
    if (present(descriptor.destinationPath))
        return descriptor.destinationPath;
    if (present(descriptor.gitUrl))
        return descriptor.gitUrl;
    return std::nullopt;
}

Result<TransferRecord> TransferManager::submit(const ArtifactDescriptor& descriptor,
                                               const fs::path& basePath,
                                               const ProviderCredentials& credentials,
                                               bool background) {
    collectFinishedWorkers();

    if (auto valid = validateDescriptor(descriptor); !valid) {
        return valid.error();
    }
    const auto key = *keyFor(descriptor);
    const auto destination = config::resolve_path(*descriptor.destinationPath, basePath);

    if (present(descriptor.remoteUrl)) {
        PreflightChecker checker{*http_, config_.probeTimeout};
        auto preflight =
            checker.check(*descriptor.remoteUrl, descriptor.headers, credentials, destination);
        if (preflight.satisfied) {
            const auto now = registry_->now();
            TransferRecord done;
            done.progressPercent = 100;
            done.status = TransferStatus::Done;
            done.destinationPath = destination;
            done.startedAt = now;
            done.finishedAt = now;
            if (registry_->putUnlessPending(key, done)) {
                spdlog::info("{} already present with matching size ({} bytes), skipping download",
                             destination.string(), preflight.remoteSize);
                return done;
            }
            // A worker claimed the key after the probe; wait for it below.
        }
    }

    auto acquired = registry_->acquirePending(key);
    auto pending = std::move(acquired.first);
    if (!acquired.second) {
        spdlog::info("Transfer for {} already in progress, waiting for it to finish", key);
        pending.completion->wait();
        return registry_->snapshot(key);
    }

    TransferRecord initial;
    initial.status = TransferStatus::Downloading;
    initial.destinationPath = destination;
    initial.startedAt = registry_->now();
    registry_->put(key, initial);
    spdlog::info("Accepted transfer {} -> {}", key, destination.string());

    TransferJob job{key, descriptor, destination, credentials};

    if (!background) {
        runWorker(std::move(job), std::move(pending));
        return registry_->snapshot(key);
    }

    try {
        std::lock_guard lock{workersMutex_};
        std::thread worker([this, job = std::move(job), pending]() mutable {
            runWorker(std::move(job), std::move(pending));
            std::lock_guard done{workersMutex_};
            finishedWorkers_.push_back(std::this_thread::get_id());
        });
        auto id = worker.get_id();
        workers_.emplace(id, std::move(worker));
    } catch (const std::system_error& e) {
        spdlog::error("Failed to start worker for {}: {}", key, e.what());
        registry_->update(key, [&](TransferRecord& rec) {
            rec.status = TransferStatus::Error;
            rec.errorMessage = std::string("failed to start worker: ") + e.what();
            rec.finishedAt = registry_->now();
        });
        registry_->releasePending(key);
        pending.completion->notify();
        return registry_->snapshot(key);
    }

    return initial;
}

void TransferManager::runWorker(TransferJob job, PendingTransfer pending) {
    auto& strategy = present(job.descriptor.gitUrl) ? *gitStrategy_ : *httpStrategy_;

    ProgressReporter report = [this, &key = job.key](int percent) {
        registry_->update(key, [percent](TransferRecord& rec) { rec.progressPercent = percent; });
    };

    Result<TransferStatus> outcome = Error{ErrorCode::Unknown};
    try {
        outcome = strategy.execute(job, pending.cancel.get_token(), report);
    } catch (const std::exception& e) {
        outcome = Error{ErrorCode::Unknown, e.what()};
    } catch (...) {
        outcome = Error{ErrorCode::Unknown, "unknown exception in transfer worker"};
    }

    const auto finishedAt = registry_->now();
    registry_->update(job.key, [&](TransferRecord& rec) {
        rec.finishedAt = finishedAt;
        if (outcome) {
            rec.status = outcome.value();
            if (rec.status == TransferStatus::Done)
                rec.progressPercent = 100;
            rec.errorMessage.reset();
        } else {
            rec.status = TransferStatus::Error;
            rec.errorMessage = outcome.error().message;
        }
    });

    if (outcome) {
        spdlog::info("Transfer {} finished: {}", job.key, statusToString(outcome.value()));
    } else {
        spdlog::error("Transfer {} failed: {}", job.key, outcome.error().message);
    }

    // Release before notifying so a woken waiter that resubmits starts a fresh worker.
    registry_->releasePending(job.key);
    pending.completion->notify();
}

void TransferManager::collectFinishedWorkers() {
    std::lock_guard lock{workersMutex_};
    for (auto id : finishedWorkers_) {
        auto it = workers_.find(id);
        if (it == workers_.end())
            continue;
        if (it->second.joinable())
            it->second.join();
        workers_.erase(it);
    }
    finishedWorkers_.clear();
}

void TransferManager::drain() {
    for (;;) {
        std::unordered_map<std::thread::id, std::thread> running;
        {
            std::lock_guard lock{workersMutex_};
            running.swap(workers_);
            finishedWorkers_.clear();
        }
        if (running.empty())
            return;
        for (auto& [id, worker] : running) {
            if (worker.joinable())
                worker.join();
        }
    }
}

TransferRecord TransferManager::getProgress(const std::string& key) const {
    return registry_->snapshot(key);
}

std::vector<KeyedRecord> TransferManager::listActiveOrRecent() {
    reapFinished();
    return registry_->list([](const TransferRecord& rec) {
        return rec.status == TransferStatus::Downloading || rec.status == TransferStatus::Stopped ||
               rec.status == TransferStatus::Error;
    });
}

bool TransferManager::cancel(const std::string& key) {
    if (!registry_->requestCancel(key)) {
        spdlog::debug("No in-flight transfer for {}", key);
        return false;
    }
    spdlog::info("Stop requested for {}", key);
    return true;
}

std::size_t TransferManager::reapFinished() {
    return registry_->reapFinished(config_.retention);
}

std::vector<BatchItemResult>
TransferManager::submitBatch(const std::vector<ArtifactDescriptor>& descriptors,
                             const fs::path& basePath, const ProviderCredentials& credentials) {
    std::vector<BatchItemResult> results;
    results.reserve(descriptors.size());
    std::set<fs::path> launched;

    for (const auto& descriptor : descriptors) {
        if (auto valid = validateDescriptor(descriptor); !valid) {
            results.push_back({false, valid.error().message});
            continue;
        }

        if (present(descriptor.remoteUrl)) {
            switch (detectProvider(*descriptor.remoteUrl)) {
                case Provider::HuggingFace:
                    if (!present(credentials.huggingFace)) {
                        results.push_back({false, "HuggingFace token required for this download"});
                        continue;
                    }
                    break;
                case Provider::Civitai:
                    if (!present(credentials.civitai)) {
                        results.push_back({false, "CivitAI token required for this download"});
                        continue;
                    }
                    break;
                case Provider::None:
                    break;
            }
        }

        const auto path = config::resolve_path(*descriptor.destinationPath, basePath);
        if (path.has_parent_path()) {
            std::error_code ec;
            fs::create_directories(path.parent_path(), ec);
            if (ec) {
                spdlog::error("Failed to create directory {}: {}", path.parent_path().string(),
                              ec.message());
                results.push_back({false, "Failed to create directory: " + ec.message()});
                continue;
            }
        }

        if (!launched.insert(path).second) {
            spdlog::info("Download already in progress for: {}", path.string());
            results.push_back({true, "Already downloading"});
            continue;
        }

        auto submitted = submit(descriptor, basePath, credentials, true);
        if (!submitted) {
            results.push_back({false, submitted.error().message});
        } else {
            results.push_back({true, std::nullopt});
        }
    }
    return results;
}

std::vector<BatchItemResult>
TransferManager::deleteArtifacts(const std::vector<ArtifactDescriptor>& descriptors,
                                 const fs::path& basePath) {
    std::vector<BatchItemResult> results;
    results.reserve(descriptors.size());
    std::set<fs::path> deleted;

    for (const auto& descriptor : descriptors) {
        if (!present(descriptor.destinationPath)) {
            results.push_back({false, "No destination path provided"});
            continue;
        }
        const auto path = config::resolve_path(*descriptor.destinationPath, basePath);
        if (deleted.contains(path)) {
            results.push_back({true, "Already deleted"});
            continue;
        }

        std::error_code ec;
        if (!fs::exists(path, ec)) {
            results.push_back({false, "File not found: " + path.string()});
            continue;
        }

        if (fs::is_directory(path, ec)) {
            fs::remove_all(path, ec);
        } else {
            fs::remove(path, ec);
        }
        if (ec) {
            spdlog::error("Error deleting {}: {}", path.string(), ec.message());
            results.push_back({false, "Error deleting file: " + ec.message()});
            continue;
        }

        spdlog::info("Deleted {}", path.string());
        deleted.insert(path);
        results.push_back({true, std::nullopt});
    }
    return results;
}

} // namespace modelpull::transfer
