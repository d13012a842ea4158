#pragma once

#include <modelpull/transfer/transfer.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace modelpull::transfer {

/**
 * Hosting providers recognized by URL convention.
 */
enum class Provider { None, HuggingFace, Civitai };

/**
 * Substring match on the URL, same rule the download API has always used.
 */
[[nodiscard]] Provider detectProvider(std::string_view url);

/**
 * A URL plus the headers to send with it.
 */
struct AuthorizedRequest {
    std::string url;
    std::vector<Header> headers;
};

/**
 * Inject provider authentication:
 * - HuggingFace: `Authorization: Bearer <token>` (replaces any caller Authorization header)
 * - CivitAI: `token=<token>` query parameter unless the URL already carries one
 * Without a matching credential the request is returned unchanged.
 */
[[nodiscard]] AuthorizedRequest applyProviderAuth(std::string_view url,
                                                  const std::vector<Header>& headers,
                                                  const ProviderCredentials& credentials);

} // namespace modelpull::transfer
