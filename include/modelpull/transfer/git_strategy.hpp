#pragma once

#include <modelpull/transfer/transfer.hpp>

#include <chrono>
#include <string>

namespace modelpull::transfer {

struct GitSettings {
    std::string executable{"git"};
    std::chrono::milliseconds pollInterval{500};
    std::chrono::milliseconds terminateTimeout{2000};
};

/**
 * Clones a repository with a `git clone` subprocess.
 *
 * An existing destination directory counts as already cloned. While the clone runs
 * the process is polled every pollInterval; on cancellation it is terminated and the
 * destination directory removed recursively. A non-zero exit status is an error.
 */
class GitTransferStrategy final : public ITransferStrategy {
public:
    explicit GitTransferStrategy(GitSettings settings = {});

    Result<TransferStatus> execute(const TransferJob& job, std::stop_token cancel,
                                   const ProgressReporter& report) override;

private:
    GitSettings settings_;
};

} // namespace modelpull::transfer
