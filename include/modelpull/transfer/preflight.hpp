#pragma once

#include <modelpull/transfer/transfer.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string_view>
#include <vector>

namespace modelpull::transfer {

/**
 * Outcome of comparing a local file with the remote size.
 * remoteSize is 0 when the probe failed or the server did not report a length.
 */
struct PreflightResult {
    bool satisfied{false};
    std::uint64_t remoteSize{0};
    std::optional<std::uint64_t> localSize;
};

/**
 * Decides whether an HTTP artifact is already present locally with the right size.
 * Probe failures are never errors: the size is treated as unknown and the
 * transfer proceeds.
 */
class PreflightChecker {
public:
    PreflightChecker(IHttpAdapter& http, std::chrono::milliseconds timeout)
        : http_(http), timeout_(timeout) {}

    PreflightResult check(std::string_view url, const std::vector<Header>& headers,
                          const ProviderCredentials& credentials,
                          const std::filesystem::path& localPath) const;

private:
    IHttpAdapter& http_;
    std::chrono::milliseconds timeout_;
};

} // namespace modelpull::transfer
