#include <modelpull/transfer/provider_auth.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace modelpull::transfer {

namespace {

constexpr std::string_view kHuggingFaceHost = "huggingface.co";
constexpr std::string_view kCivitaiHost = "civitai.com";

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

Provider detectProvider(std::string_view url) {
    if (url.find(kHuggingFaceHost) != std::string_view::npos)
        return Provider::HuggingFace;
    if (url.find(kCivitaiHost) != std::string_view::npos)
        return Provider::Civitai;
    return Provider::None;
}

AuthorizedRequest applyProviderAuth(std::string_view url, const std::vector<Header>& headers,
                                    const ProviderCredentials& credentials) {
    AuthorizedRequest out{std::string(url), headers};

    if (url.find(kCivitaiHost) != std::string_view::npos && credentials.civitai &&
        !credentials.civitai->empty()) {
        if (out.url.find("token=") == std::string::npos) {
            out.url.push_back(out.url.find('?') == std::string::npos ? '?' : '&');
            out.url.append("token=");
            out.url.append(*credentials.civitai);
            spdlog::debug("Added CivitAI token to URL");
        }
    }

    if (url.find(kHuggingFaceHost) != std::string_view::npos && credentials.huggingFace &&
        !credentials.huggingFace->empty()) {
        std::erase_if(out.headers,
                      [](const Header& h) { return iequals(h.name, "Authorization"); });
        out.headers.push_back({"Authorization", "Bearer " + *credentials.huggingFace});
        spdlog::debug("Added HuggingFace authorization header");
    }

    return out;
}

} // namespace modelpull::transfer
