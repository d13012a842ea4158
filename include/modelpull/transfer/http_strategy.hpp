#pragma once

#include <modelpull/transfer/transfer.hpp>

#include <memory>

namespace modelpull::transfer {

/**
 * Streams a remote file to disk.
 *
 * - Parent directories are created as needed; the output file is opened when the
 *   response body starts, truncating any previous content.
 * - Progress is bytesWritten * 100 / contentLength, or 0 when the length is unknown.
 * - Cancellation is checked after every chunk write. A cancelled transfer removes
 *   the partial file and ends Stopped.
 * - Transport and filesystem errors leave the partial file in place.
 */
class HttpTransferStrategy final : public ITransferStrategy {
public:
    HttpTransferStrategy(std::shared_ptr<IHttpAdapter> http, FetchOptions options = {});

    Result<TransferStatus> execute(const TransferJob& job, std::stop_token cancel,
                                   const ProgressReporter& report) override;

private:
    std::shared_ptr<IHttpAdapter> http_;
    FetchOptions options_;
};

} // namespace modelpull::transfer
