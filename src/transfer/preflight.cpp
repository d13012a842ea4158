#include <modelpull/transfer/preflight.hpp>
#include <modelpull/transfer/provider_auth.hpp>

#include <spdlog/spdlog.h>

#include <system_error>

namespace modelpull::transfer {

PreflightResult PreflightChecker::check(std::string_view url, const std::vector<Header>& headers,
                                        const ProviderCredentials& credentials,
                                        const std::filesystem::path& localPath) const {
    PreflightResult result;

    auto request = applyProviderAuth(url, headers, credentials);
    auto probed = http_.probeContentLength(request.url, request.headers, timeout_);
    if (!probed) {
        spdlog::debug("Size probe for {} failed: {}", localPath.string(), probed.error().message);
    } else if (probed.value()) {
        result.remoteSize = *probed.value();
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(localPath, ec)) {
        return result;
    }
    auto size = std::filesystem::file_size(localPath, ec);
    if (ec) {
        spdlog::debug("Cannot stat {}: {}", localPath.string(), ec.message());
        return result;
    }
    result.localSize = size;

    if (result.remoteSize > 0 && size == result.remoteSize) {
        result.satisfied = true;
        return result;
    }

    if (result.remoteSize > 0) {
        spdlog::warn("Size mismatch for {}: local {} bytes, remote {} bytes; re-downloading",
                     localPath.string(), size, result.remoteSize);
    } else {
        spdlog::debug("Remote size unknown for {} (local {} bytes); downloading",
                      localPath.string(), size);
    }
    return result;
}

} // namespace modelpull::transfer
